/* This file is part of Cobalt, derived from Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cobalt/cbor/error.hpp>

namespace cobalt::cbor {
    std::string decode_error::_make_message(const error_kind kind, const uint64_t detail, const decode_error *cause)
    {
        switch (kind) {
            case error_kind::argument_too_short: return fmt::format("arg len {} greater than remaining buf len", detail);
            case error_kind::invalid_minor_value: return fmt::format("unexpected minor value {}", detail);
            case error_kind::incomplete_float: return fmt::format("incomplete float{} at end of buf", detail);
            case error_kind::content_too_short: return fmt::format("slice len {} greater than remaining buf len", detail);
            case error_kind::expected_break_marker: return "expected break marker";
            case error_kind::unexpected_major_in_indefinite: return fmt::format("unexpected major type {} in indefinite slice", detail);
            case error_kind::nested_indefinite: return "nested indefinite slice";
            case error_kind::unexpected_end_of_payload: return "unexpected end of payload";
            case error_kind::unexpected_major_for_map_key: return fmt::format("unexpected major type {} for map key", detail);
            case error_kind::max_depth_exceeded: return fmt::format("nesting depth exceeds the limit of {}", detail);
            case error_kind::nested:
                if (!cause) [[unlikely]]
                    throw error("a nested decode error requires a cause!");
                return fmt::format("decode subslice: {}", cause->_make_message(cause->_kind, cause->_detail, cause->cause()));
            default:
                throw error(fmt::format("unsupported decode error kind: {}", static_cast<int>(kind)));
        }
    }
}
