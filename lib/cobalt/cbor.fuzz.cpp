/* This file is part of Cobalt, derived from Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#include <cobalt/cbor/decoder.hpp>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, const size_t size)
{
    using namespace cobalt;
    try {
        const auto res = cbor::decode(buffer { data, size });
    } catch (const error &err) {
        // ignore the library's exceptions
    }
    return 0;
}
