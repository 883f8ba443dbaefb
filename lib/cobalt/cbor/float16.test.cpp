/* This file is part of Cobalt, derived from Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cobalt/cbor/float16.hpp>
#include <cobalt/common/test.hpp>

using namespace cobalt;
using namespace cobalt::cbor;

suite cbor_float16_suite = [] {
    "cbor::float16"_test = [] {
        "zero"_test = [] {
            test_same(uint32_t { 0x00000000 }, float16_to_float32_bits(0x0000));
            test_same(uint32_t { 0x80000000 }, float16_to_float32_bits(0x8000));
        };
        "normal"_test = [] {
            test_same(uint32_t { 0x3F800000 }, float16_to_float32_bits(0x3C00));
            test_same(uint32_t { 0xC0000000 }, float16_to_float32_bits(0xC000));
            // the largest finite half: 65504
            test_same(uint32_t { 0x477FE000 }, float16_to_float32_bits(0x7BFF));
            // the smallest normal half: 2^-14
            test_same(uint32_t { 0x38800000 }, float16_to_float32_bits(0x0400));
        };
        "subnormal"_test = [] {
            // the smallest subnormal half: 2^-24
            test_same(uint32_t { 0x33800000 }, float16_to_float32_bits(0x0001));
            test_same(uint32_t { 0xB3800000 }, float16_to_float32_bits(0x8001));
            // the largest subnormal half: 1023 * 2^-24
            test_same(uint32_t { 0x387FC000 }, float16_to_float32_bits(0x03FF));
            test_same(uint32_t { 0x38000000 }, float16_to_float32_bits(0x0200));
        };
        "infinity"_test = [] {
            test_same(uint32_t { 0x7F800000 }, float16_to_float32_bits(0x7C00));
            test_same(uint32_t { 0xFF800000 }, float16_to_float32_bits(0xFC00));
        };
        "nan payload"_test = [] {
            test_same(uint32_t { 0x7FC00000 }, float16_to_float32_bits(0x7E00));
            test_same(uint32_t { 0x7F802000 }, float16_to_float32_bits(0x7C01));
            test_same(uint32_t { 0xFFFFE000 }, float16_to_float32_bits(0xFFFF));
        };
    };
};
