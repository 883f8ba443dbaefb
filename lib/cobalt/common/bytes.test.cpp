/* This file is part of Cobalt, derived from Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cobalt/common/bytes.hpp>
#include <cobalt/common/test.hpp>

using namespace cobalt;

suite common_bytes_suite = [] {
    "common::bytes"_test = [] {
        "from_hex"_test = [] {
            test_same(uint8_vector { 0xDE, 0xAD, 0xBE, 0xEF }, uint8_vector::from_hex("DEADBEEF"));
            test_same(uint8_vector { 0xDE, 0xAD, 0xBE, 0xEF }, uint8_vector::from_hex("deadbeef"));
            test_same(size_t { 0 }, uint8_vector::from_hex("").size());
            expect_throws_msg<error>([] { uint8_vector::from_hex("ABC"); }, "even number of characters");
            expect_throws_msg<error>([] { uint8_vector::from_hex("0G"); }, "unexpected character in a hex number");
        };
        "from_hex non-ascii"_test = [] {
            // bytes above 0x7F are negative when char is signed
            const std::string latin1 { "\xC9\xE9" };
            expect(throws<error>([&] { uint8_vector::from_hex(latin1); }));
            expect(throws<error>([] { uint_from_hex(static_cast<char>(0xFF)); }));
        };
        "lowercase format"_test = [] {
            const uint8_vector data { 0xAB, 0x01 };
            test_same(std::string { "AB01" }, fmt::format("{}", buffer { data }));
            test_same(std::string { "ab01" }, fmt::format("{}", buffer_lowercase { data.data(), data.size() }));
        };
    };
};
