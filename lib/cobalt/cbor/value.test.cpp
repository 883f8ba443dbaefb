/* This file is part of Cobalt, derived from Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cmath>
#include <cobalt/cbor/value.hpp>
#include <cobalt/common/test.hpp>

using namespace cobalt;
using namespace cobalt::cbor;

namespace {
    value make_list_of_two()
    {
        cbor::list l {};
        l.emplace_back(unsigned_int { 1 });
        l.emplace_back(text_string { "abc" });
        return value { std::move(l) };
    }
}

suite cbor_value_suite = [] {
    "cbor::value"_test = [] {
        "type"_test = [] {
            test_same(CBOR_UINT, value { unsigned_int { 22 } }.type());
            test_same(CBOR_NINT, value { negative_int { 0 } }.type());
            test_same(CBOR_BYTES, value { byte_string { 0x01, 0x02 } }.type());
            test_same(CBOR_TEXT, value { text_string { "abc" } }.type());
            test_same(CBOR_LIST, value { cbor::list {} }.type());
            test_same(CBOR_MAP, value { cbor::map {} }.type());
            test_same(CBOR_TAG, value { cbor::tag { 1, std::make_unique<value>(unsigned_int { 1 }) } }.type());
            test_same(CBOR_BOOL, value { boolean { true } }.type());
            test_same(CBOR_NULL, value { null {} }.type());
            test_same(CBOR_UNDEFINED, value { undefined {} }.type());
            test_same(CBOR_FLOAT32, value { float32 { 0 } }.type());
            test_same(CBOR_FLOAT64, value { float64 { 0 } }.type());
            test_same(std::string { "negative integer" }, value { negative_int { 0 } }.type_name());
            expect(value { null {} }.is_null());
            expect(!value { null {} }.is_undefined());
            expect(value { undefined {} }.is_undefined());
        };
        "accessors"_test = [] {
            test_same(uint64_t { 22 }, value { unsigned_int { 22 } }.uint());
            test_same(uint64_t { 1 }, value { negative_int { 0 } }.nint());
            test_same(uint64_t { 0 }, value { negative_int { 0 } }.nint_raw());
            test_same(std::string_view { "abc" }, value { text_string { "abc" } }.text());
            test_same(uint8_vector { 0x01, 0x02 }, value { byte_string { 0x01, 0x02 } }.bytes());
            expect(value { boolean { true } }.boolean());
            expect(!value { boolean { false } }.boolean());
            test_same(1.0f, value { float32 { 0x3F800000 } }.float32());
            test_same(uint32_t { 0x3F800000 }, value { float32 { 0x3F800000 } }.float32_bits());
            test_same(-2.0, value { float64 { 0xC000000000000000ULL } }.float64());
            test_same(uint64_t { 0xC000000000000000ULL }, value { float64 { 0xC000000000000000ULL } }.float64_bits());
            const value t { cbor::tag { 24, std::make_unique<value>(text_string { "x" }) } };
            test_same(uint64_t { 24 }, t.tag().id);
            test_same(std::string_view { "x" }, t.tag().val->text());
        };
        "type mismatch"_test = [] {
            expect_throws_msg<error>([] { value { unsigned_int { 1 } }.text(); }, "expecting type text while the present value is unsigned integer");
            expect_throws_msg<error>([] { value { text_string { "a" } }.uint(); }, "expecting type unsigned integer");
            expect_throws_msg<error>([] { value { null {} }.boolean(); }, "the present value is null");
            expect_throws_msg<error>([] { value { float32 { 0 } }.float64(); }, "expecting type float64");
            // the source location of the call is reported
            expect_throws_msg<error>([] { value { null {} }.list(); }, "value.test.cpp");
        };
        "nint of -2^64"_test = [] {
            const value v { negative_int { 0xFFFFFFFFFFFFFFFFULL } };
            test_same(uint64_t { 0xFFFFFFFFFFFFFFFFULL }, v.nint_raw());
            expect(throws<error>([&] { v.nint(); }));
            test_same(std::string { "I -18446744073709551616" }, stringify(v));
        };
        "list access"_test = [] {
            const auto v = make_list_of_two();
            test_same(size_t { 2 }, v.list().size());
            test_same(uint64_t { 1 }, v.at(0).uint());
            test_same(std::string_view { "abc" }, v.at(1).text());
            expect_throws_msg<error>([&] { v.at(2); }, "invalid element index 2 in the list of size 2");
        };
        "map access"_test = [] {
            cbor::map m {};
            m.emplace("foo", value { unsigned_int { 7 } });
            const value v { std::move(m) };
            test_same(uint64_t { 7 }, v.map().at("foo").uint());
            expect_throws_msg<error>([&] { v.map().at("bar"); }, "the map has no key 'bar'");
        };
        "equality"_test = [] {
            expect(value { unsigned_int { 1 } } == value { unsigned_int { 1 } });
            expect(!(value { unsigned_int { 1 } } == value { unsigned_int { 2 } }));
            // same numeric value but different variants
            expect(!(value { unsigned_int { 0 } } == value { negative_int { 0 } }));
            expect(!(value { null {} } == value { undefined {} }));
            expect(make_list_of_two() == make_list_of_two());
            expect(!(make_list_of_two() == value { cbor::list {} }));
            expect(value { cbor::tag { 1, std::make_unique<value>(null {}) } } == value { cbor::tag { 1, std::make_unique<value>(null {}) } });
            expect(!(value { cbor::tag { 1, std::make_unique<value>(null {}) } } == value { cbor::tag { 2, std::make_unique<value>(null {}) } }));
            expect(!(value { cbor::tag { 1, std::make_unique<value>(null {}) } } == value { cbor::tag { 1, std::make_unique<value>(undefined {}) } }));
        };
        "float equality by bits"_test = [] {
            // NaNs with equal payloads compare equal while NaN != NaN for native floats
            const value nan1 { float32 { 0x7FC00000 } };
            const value nan2 { float32 { 0x7FC00000 } };
            const value nan3 { float32 { 0x7F802000 } };
            expect(std::isnan(nan1.float32()));
            expect(nan1 == nan2);
            expect(!(nan1 == nan3));
            // +0.0 == -0.0 for native floats but the bit patterns differ
            expect(!(value { float64 { 0 } } == value { float64 { 0x8000000000000000ULL } }));
        };
        "stringify"_test = [] {
            test_same(std::string { "I 22" }, stringify(value { unsigned_int { 22 } }));
            test_same(std::string { "I -1" }, stringify(value { negative_int { 0 } }));
            test_same(std::string { "T 'abc'" }, stringify(value { text_string { "abc" } }));
            test_same(std::string { "B #666F6F ('foo')" }, stringify(value { byte_string { 0x66, 0x6F, 0x6F } }));
            test_same(std::string { "NULL" }, stringify(value { null {} }));
            test_same(std::string { "UNDEFINED" }, stringify(value { undefined {} }));
            test_same(std::string { "TAG 1 TRUE" }, stringify(value { cbor::tag { 1, std::make_unique<value>(boolean { true }) } }));
            test_same(std::string { "[(items: 2)\n    #0: I 1\n    #1: T 'abc'\n]" }, stringify(make_list_of_two()));
            test_same(std::string { "I 22" }, fmt::format("{}", value { unsigned_int { 22 } }));
            test_same(std::string { "cbor::map" }, fmt::format("{}", CBOR_MAP));
        };
    };
};
