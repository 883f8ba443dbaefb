/* This file is part of Cobalt, derived from Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cobalt/cbor/error.hpp>
#include <cobalt/common/test.hpp>

using namespace cobalt;
using namespace cobalt::cbor;

suite cbor_error_suite = [] {
    "cbor::decode_error"_test = [] {
        "messages"_test = [] {
            test_same(std::string { "arg len 8 greater than remaining buf len" }, std::string { decode_error::argument_too_short(8).what() });
            test_same(std::string { "unexpected minor value 31" }, std::string { decode_error::invalid_minor_value(31).what() });
            test_same(std::string { "incomplete float16 at end of buf" }, std::string { decode_error::incomplete_float(16).what() });
            test_same(std::string { "slice len 1 greater than remaining buf len" }, std::string { decode_error::content_too_short(1).what() });
            test_same(std::string { "expected break marker" }, std::string { decode_error::expected_break_marker().what() });
            test_same(std::string { "unexpected major type 3 in indefinite slice" }, std::string { decode_error::unexpected_major_in_indefinite(3).what() });
            test_same(std::string { "nested indefinite slice" }, std::string { decode_error::nested_indefinite().what() });
            test_same(std::string { "unexpected end of payload" }, std::string { decode_error::unexpected_end_of_payload().what() });
            test_same(std::string { "unexpected major type 0 for map key" }, std::string { decode_error::unexpected_major_for_map_key(0).what() });
            test_same(std::string { "nesting depth exceeds the limit of 4" }, std::string { decode_error::max_depth_exceeded(4).what() });
        };
        "kind and detail"_test = [] {
            const auto err = decode_error::argument_too_short(4);
            test_same(error_kind::argument_too_short, err.kind());
            test_same(uint64_t { 4 }, err.detail());
            expect(err.cause() == nullptr);
            expect(&err.root() == &err);
            test_same(std::string { "unexpected_major_for_map_key" }, fmt::format("{}", error_kind::unexpected_major_for_map_key));
        };
        "nested"_test = [] {
            const auto inner = decode_error::content_too_short(1);
            const auto outer = decode_error::nested(inner);
            test_same(error_kind::nested, outer.kind());
            test_same(std::string { "decode subslice: slice len 1 greater than remaining buf len" }, std::string { outer.what() });
            expect(outer.cause() != nullptr);
            test_same(error_kind::content_too_short, outer.root().kind());
            test_same(uint64_t { 1 }, outer.root().detail());
            const auto twice = decode_error::nested(outer);
            test_same(std::string { "decode subslice: decode subslice: slice len 1 greater than remaining buf len" }, std::string { twice.what() });
            test_same(error_kind::content_too_short, twice.root().kind());
        };
        "hierarchy"_test = [] {
            expect(throws<cobalt::error>([] { throw decode_error::expected_break_marker(); }));
            expect(throws<std::exception>([] { throw decode_error::nested_indefinite(); }));
        };
    };
};
