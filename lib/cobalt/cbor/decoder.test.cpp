/* This file is part of Cobalt, derived from Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cobalt/cbor/decoder.hpp>
#include <cobalt/common/test.hpp>

using namespace cobalt;
using namespace cobalt::cbor;

namespace {
    value decode_hex(const std::string_view hex, const decode_options &opts={})
    {
        const auto bytes = uint8_vector::from_hex(hex);
        auto res = decode(bytes, opts);
        test_same(bytes.size(), res.size);
        return std::move(res.val);
    }

    void expect_decode_error(const std::string_view hex, const error_kind kind, const std::string &msg,
        const std::source_location &loc=std::source_location::current())
    {
        const auto bytes = uint8_vector::from_hex(hex);
        std::optional<error_kind> actual {};
        try {
            decode(bytes);
        } catch (const decode_error &ex) {
            actual = ex.kind();
            const std::string what { ex.what() };
            expect(what.find(msg) != what.npos, loc) << fmt::format("{}: '{}' does not contain '{}'", hex, what, msg);
        }
        expect(actual == kind, loc) << fmt::format("{}: expected {} but got {}", hex, kind, actual);
    }

    std::string nested_lists(const size_t depth)
    {
        std::string hex {};
        for (size_t i = 0; i < depth; ++i)
            hex += "81";
        return hex + "00";
    }
}

suite cbor_decoder_suite = [] {
    "cbor::decoder"_test = [] {
        "uint_from_be"_test = [] {
            test_same(uint64_t { 0 }, uint_from_be(buffer {}));
            test_same(uint64_t { 0x01 }, uint_from_be(uint8_vector { 0x01 }));
            test_same(uint64_t { 0x0102 }, uint_from_be(uint8_vector { 0x01, 0x02 }));
            test_same(uint64_t { 0x01020304 }, uint_from_be(uint8_vector { 0x01, 0x02, 0x03, 0x04 }));
            test_same(uint64_t { 0xFFFFFFFFFFFFFFFFULL }, uint_from_be(uint8_vector::from_hex("FFFFFFFFFFFFFFFF")));
            expect(throws<error>([] { uint_from_be(uint8_vector(9)); }));
        };
        "uint"_test = [] {
            test_same(uint64_t { 0 }, decode_hex("00").uint());
            test_same(uint64_t { 23 }, decode_hex("17").uint());
            test_same(uint64_t { 24 }, decode_hex("1818").uint());
            test_same(uint64_t { 256 }, decode_hex("190100").uint());
            test_same(uint64_t { 0xFFFF }, decode_hex("19FFFF").uint());
            test_same(uint64_t { 65536 }, decode_hex("1A00010000").uint());
            test_same(uint64_t { 4294967296 }, decode_hex("1B0000000100000000").uint());
            test_same(uint64_t { 1000000 }, decode_hex("1A000F4240").uint());
            test_same(uint64_t { 1000000000000 }, decode_hex("1B000000E8D4A51000").uint());
            // non-minimal encodings are accepted
            test_same(uint64_t { 1 }, decode_hex("1B0000000000000001").uint());
        };
        "negint"_test = [] {
            test_same(uint64_t { 1 }, decode_hex("20").nint());
            test_same(uint64_t { 0 }, decode_hex("20").nint_raw());
            test_same(uint64_t { 100 }, decode_hex("3863").nint());
            test_same(uint64_t { 1000 }, decode_hex("3903E7").nint());
            test_same(uint64_t { 0xFFFFFFFFFFFFFFFFULL }, decode_hex("3BFFFFFFFFFFFFFFFE").nint());
            // -2^64 is valid on the wire but its magnitude does not fit into uint64_t
            const auto min = decode_hex("3BFFFFFFFFFFFFFFFF");
            test_same(CBOR_NINT, min.type());
            test_same(uint64_t { 0xFFFFFFFFFFFFFFFFULL }, min.nint_raw());
            expect(throws<error>([&] { min.nint(); }));
        };
        "bytes"_test = [] {
            test_same(uint8_vector {}, decode_hex("40").bytes());
            test_same(uint8_vector { 0x66, 0x6F, 0x6F }, decode_hex("43666F6F").bytes());
            test_same(uint8_vector {}, decode_hex("5FFF").bytes());
            test_same(uint8_vector { 0x66, 0x6F, 0x6F, 0x01 }, decode_hex("5F4043666F6F4101FF").bytes());
        };
        "text"_test = [] {
            test_same(std::string_view { "" }, decode_hex("60").text());
            test_same(std::string_view { "IETF" }, decode_hex("6449455446").text());
            test_same(std::string_view { "streaming" }, decode_hex("7F657374726561646D696E67FF").text());
            // text is not validated as UTF-8
            test_same(std::string_view { "\xFF\xFE" }, decode_hex("62FFFE").text());
        };
        "list"_test = [] {
            test_same(size_t { 0 }, decode_hex("80").list().size());
            const auto l = decode_hex("83010203");
            test_same(size_t { 3 }, l.list().size());
            test_same(uint64_t { 3 }, l.at(2).uint());
            const auto nested = decode_hex("8301820203820405");
            test_same(uint64_t { 5 }, nested.at(2).at(1).uint());
            const auto indef = decode_hex("9F018202039F0405FFFF");
            test_same(size_t { 3 }, indef.list().size());
            test_same(uint64_t { 5 }, indef.at(2).at(1).uint());
            test_same(size_t { 0 }, decode_hex("9FFF").list().size());
        };
        "map"_test = [] {
            test_same(size_t { 0 }, decode_hex("A0").map().size());
            const auto m = decode_hex("A26161016162820203");
            test_same(size_t { 2 }, m.map().size());
            test_same(uint64_t { 1 }, m.map().at("a").uint());
            test_same(uint64_t { 3 }, m.map().at("b").at(1).uint());
            const auto indef = decode_hex("BF6346756EF563416D7421FF");
            test_same(true, indef.map().at("Fun").boolean());
            test_same(uint64_t { 2 }, indef.map().at("Amt").nint());
            // chunked keys are accepted
            test_same(uint64_t { 1 }, decode_hex("A17F616B6179FF01").map().at("ky").uint());
        };
        "map duplicate keys"_test = [] {
            const auto m = decode_hex("A2616101616102");
            test_same(size_t { 1 }, m.map().size());
            test_same(uint64_t { 2 }, m.map().at("a").uint());
        };
        "tag"_test = [] {
            const auto t = decode_hex("C11A514B67B0");
            test_same(uint64_t { 1 }, t.tag().id);
            test_same(uint64_t { 1363896240 }, t.tag().val->uint());
            const auto nested = decode_hex("D818C1F6");
            test_same(uint64_t { 24 }, nested.tag().id);
            test_same(uint64_t { 1 }, nested.tag().val->tag().id);
            expect(nested.tag().val->tag().val->is_null());
        };
        "simple"_test = [] {
            test_same(false, decode_hex("F4").boolean());
            test_same(true, decode_hex("F5").boolean());
            expect(decode_hex("F6").is_null());
            expect(decode_hex("F7").is_undefined());
        };
        "float"_test = [] {
            test_same(uint32_t { 0x3F800000 }, decode_hex("F93C00").float32_bits());
            test_same(uint32_t { 0x7F802000 }, decode_hex("F97C01").float32_bits());
            test_same(uint32_t { 0x33800000 }, decode_hex("F90001").float32_bits());
            test_same(uint32_t { 0x47C35000 }, decode_hex("FA47C35000").float32_bits());
            test_same(100000.0f, decode_hex("FA47C35000").float32());
            test_same(uint64_t { 0x3FF199999999999AULL }, decode_hex("FB3FF199999999999A").float64_bits());
            test_same(1.1, decode_hex("FB3FF199999999999A").float64());
        };
        "trailing bytes"_test = [] {
            const auto bytes = uint8_vector::from_hex("0102");
            const auto res = decode(bytes);
            test_same(uint64_t { 1 }, res.val.uint());
            test_same(size_t { 1 }, res.size);
        };
        "repeated decoding"_test = [] {
            // [_ {"a": 1(NaN)}, NaN with payload, (_ h'0102', h'03')]
            static constexpr std::string_view hex { "9FA16161C1F97E00F97C015F4201024103FFFF" };
            const auto bytes = uint8_vector::from_hex(hex);
            const auto res1 = decode(bytes);
            const auto res2 = decode(bytes);
            const auto copy = uint8_vector::from_hex(hex);
            const auto res3 = decode(copy);
            test_same(size_t { 19 }, res1.size);
            test_same(res1.size, res2.size);
            test_same(res1.size, res3.size);
            // floats compare by bits, so NaN values are equal too
            test_same(res1.val, res2.val);
            test_same(res1.val, res3.val);
            test_same(CBOR_FLOAT32, res1.val.at(0).map().at("a").tag().val->type());
            test_same(uint8_vector { 0x01, 0x02, 0x03 }, res1.val.at(2).bytes());
            test_same(stringify(res1.val), stringify(res2.val));
        };
        "decoder"_test = [] {
            const auto bytes = uint8_vector::from_hex("0163666F6F80");
            decoder dec { bytes };
            expect(!dec.eof());
            test_same(uint64_t { 1 }, dec.read().uint());
            test_same(size_t { 1 }, dec.offset());
            value v {};
            dec.read(v);
            test_same(std::string_view { "foo" }, v.text());
            test_same(size_t { 5 }, dec.offset());
            test_same(size_t { 0 }, dec.read().list().size());
            expect(dec.eof());
            expect(throws<decode_error>([&] { dec.read(); }));
        };
        "decode_all"_test = [] {
            const auto items = decode_all(uint8_vector::from_hex("01F6A0"));
            test_same(size_t { 3 }, items.size());
            test_same(uint64_t { 1 }, items.at(0).uint());
            expect(items.at(1).is_null());
            test_same(CBOR_MAP, items.at(2).type());
            test_same(size_t { 0 }, decode_all(buffer {}).size());
            expect(throws<decode_error>([] { decode_all(uint8_vector::from_hex("0118")); }));
        };
        "argument errors"_test = [] {
            expect_decode_error("", error_kind::unexpected_end_of_payload, "unexpected end of payload");
            expect_decode_error("18", error_kind::argument_too_short, "arg len 1 greater than remaining buf len");
            expect_decode_error("3B00000000000000", error_kind::argument_too_short, "arg len 8 greater than remaining buf len");
            expect_decode_error("1F", error_kind::invalid_minor_value, "unexpected minor value 31");
            expect_decode_error("3F", error_kind::invalid_minor_value, "unexpected minor value 31");
            expect_decode_error("DF", error_kind::invalid_minor_value, "unexpected minor value 31");
            expect_decode_error("FF", error_kind::invalid_minor_value, "unexpected minor value 31");
            for (const auto *hex: { "1C", "1D", "1E", "3C", "5C", "7D", "9E", "BC", "DD", "FE" }) {
                const auto bytes = uint8_vector::from_hex(hex);
                expect_decode_error(hex, error_kind::invalid_minor_value, fmt::format("unexpected minor value {}", bytes.at(0) & 0x1F));
            }
        };
        "simple errors"_test = [] {
            expect_decode_error("F900", error_kind::incomplete_float, "incomplete float16 at end of buf");
            expect_decode_error("FA000000", error_kind::incomplete_float, "incomplete float32 at end of buf");
            expect_decode_error("FB00000000000000", error_kind::incomplete_float, "incomplete float64 at end of buf");
            expect_decode_error("E0", error_kind::invalid_minor_value, "unexpected minor value 0");
            expect_decode_error("F3", error_kind::invalid_minor_value, "unexpected minor value 19");
            expect_decode_error("F820", error_kind::invalid_minor_value, "unexpected minor value 24");
        };
        "string errors"_test = [] {
            expect_decode_error("5801", error_kind::content_too_short, "slice len 1 greater than remaining buf len");
            expect_decode_error("5B0000000100000000", error_kind::content_too_short, "slice len 4294967296 greater than remaining buf len");
            expect_decode_error("5F", error_kind::expected_break_marker, "expected break marker");
            expect_decode_error("5F60", error_kind::unexpected_major_in_indefinite, "unexpected major type 3 in indefinite slice");
            expect_decode_error("5F5F", error_kind::nested_indefinite, "nested indefinite slice");
            expect_decode_error("5F5801", error_kind::nested, "decode subslice: slice len 1 greater than remaining buf len");
            expect_decode_error("7F40", error_kind::unexpected_major_in_indefinite, "unexpected major type 2 in indefinite slice");
            expect_decode_error("7F7F", error_kind::nested_indefinite, "nested indefinite slice");
            expect_decode_error("7F7801", error_kind::nested, "decode subslice: slice len 1 greater than remaining buf len");
            expect_decode_error("7F6161", error_kind::expected_break_marker, "expected break marker");
            try {
                decode(uint8_vector::from_hex("5F5801"));
                expect(false);
            } catch (const decode_error &ex) {
                test_same(error_kind::content_too_short, ex.root().kind());
            }
        };
        "list errors"_test = [] {
            expect_decode_error("81", error_kind::unexpected_end_of_payload, "unexpected end of payload");
            expect_decode_error("8118", error_kind::argument_too_short, "arg len 1 greater than remaining buf len");
            expect_decode_error("9F", error_kind::expected_break_marker, "expected break marker");
            expect_decode_error("9F18", error_kind::argument_too_short, "arg len 1 greater than remaining buf len");
            expect_decode_error("9F01", error_kind::expected_break_marker, "expected break marker");
        };
        "list huge count"_test = [] {
            // the declared count must not be trusted for preallocation
            expect_decode_error("9BFFFFFFFFFFFFFFFF00", error_kind::unexpected_end_of_payload, "unexpected end of payload");
            expect_decode_error("BBFFFFFFFFFFFFFFFF", error_kind::unexpected_end_of_payload, "unexpected end of payload");
        };
        "map errors"_test = [] {
            expect_decode_error("A1", error_kind::unexpected_end_of_payload, "unexpected end of payload");
            expect_decode_error("A100", error_kind::unexpected_major_for_map_key, "unexpected major type 0 for map key");
            expect_decode_error("A17801", error_kind::content_too_short, "slice len 1 greater than remaining buf len");
            expect_decode_error("A163666F6F18", error_kind::argument_too_short, "arg len 1 greater than remaining buf len");
            expect_decode_error("A163666F6F", error_kind::unexpected_end_of_payload, "unexpected end of payload");
            expect_decode_error("BF", error_kind::expected_break_marker, "expected break marker");
            expect_decode_error("BF00", error_kind::unexpected_major_for_map_key, "unexpected major type 0 for map key");
            // the key head is checked before its argument is read
            expect_decode_error("BF18", error_kind::unexpected_major_for_map_key, "unexpected major type 0 for map key");
            expect_decode_error("BF7801", error_kind::content_too_short, "slice len 1 greater than remaining buf len");
            expect_decode_error("BF63666F6F18", error_kind::argument_too_short, "arg len 1 greater than remaining buf len");
            expect_decode_error("BF63666F6FFF", error_kind::invalid_minor_value, "unexpected minor value 31");
            expect_decode_error("BF63666F6F", error_kind::unexpected_end_of_payload, "unexpected end of payload");
        };
        "tag errors"_test = [] {
            expect_decode_error("C1", error_kind::unexpected_end_of_payload, "unexpected end of payload");
            expect_decode_error("C118", error_kind::argument_too_short, "arg len 1 greater than remaining buf len");
            expect_decode_error("D8", error_kind::argument_too_short, "arg len 1 greater than remaining buf len");
        };
        "max depth"_test = [] {
            const decode_options opts { 4 };
            expect(nothrow([&] { decode(uint8_vector::from_hex(nested_lists(4)), opts); }));
            expect_throws_msg<decode_error>([&] { decode(uint8_vector::from_hex(nested_lists(5)), opts); }, "nesting depth exceeds the limit of 4");
            // tags and maps add nesting levels too
            expect(nothrow([&] { decode(uint8_vector::from_hex("C1C1C1C100"), opts); }));
            expect(throws<decode_error>([&] { decode(uint8_vector::from_hex("C1C1C1C1C100"), opts); }));
            expect(throws<decode_error>([&] { decode(uint8_vector::from_hex("A1616181A16162C1818000"), opts); }));
            // strings are not containers
            expect(nothrow([&] { decode(uint8_vector::from_hex("8181818143666F6F"), opts); }));
        };
        "default max depth"_test = [] {
            test_same(size_t { 1024 }, decode_options {}.max_depth);
            expect(nothrow([] { decode(uint8_vector::from_hex(nested_lists(1024))); }));
            expect_throws_msg<decode_error>([] { decode(uint8_vector::from_hex(nested_lists(100000))); }, "nesting depth exceeds the limit of 1024");
        };
        "decode_options::from_config"_test = [] {
            test_same(size_t { 1024 }, decode_options::from_config(config_json { json::object {} }).max_depth);
            test_same(size_t { 16 }, decode_options::from_config(config_json { json::object { { "maxDepth", 16 } } }).max_depth);
            test_same(size_t { 1024 }, decode_options::from_config(config_json { json::object { { "unknown", "value" } } }).max_depth);
            expect(throws<error>([] { decode_options::from_config(config_json { json::object { { "maxDepth", 0 } } }); }));
            expect(throws<error>([] { decode_options::from_config(config_json { json::object { { "maxDepth", -1 } } }); }));
            expect(throws<error>([] { decode_options::from_config(config_json { json::object { { "maxDepth", "deep" } } }); }));
        };
    };
};
