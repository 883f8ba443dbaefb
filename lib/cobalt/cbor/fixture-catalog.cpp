/* This file is part of Cobalt, derived from Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cobalt/cbor/fixture.hpp>

namespace cobalt::cbor::fixture {
    namespace {
        struct item {
            std::string name;
            uint8_vector input;
            json::value expect;
        };

        struct bad_item {
            std::string name;
            uint8_vector input;
            std::string message;
        };

        item make_item(std::string name, std::initializer_list<uint8_t> input, value &&val)
        {
            return { std::move(name), uint8_vector { input }, to_expect(val) };
        }

        std::vector<item> atomic_items()
        {
            std::vector<item> items {};
            items.emplace_back(make_item("uint/0/min", { 0x00 }, value { unsigned_int { 0 } }));
            items.emplace_back(make_item("uint/0/max", { 0x17 }, value { unsigned_int { 23 } }));
            items.emplace_back(make_item("uint/1/min", { 0x18, 0x00 }, value { unsigned_int { 0 } }));
            items.emplace_back(make_item("uint/1/max", { 0x18, 0xFF }, value { unsigned_int { 0xFF } }));
            items.emplace_back(make_item("uint/2/min", { 0x19, 0x00, 0x00 }, value { unsigned_int { 0 } }));
            items.emplace_back(make_item("uint/2/max", { 0x19, 0xFF, 0xFF }, value { unsigned_int { 0xFFFF } }));
            items.emplace_back(make_item("uint/4/min", { 0x1A, 0x00, 0x00, 0x00, 0x00 }, value { unsigned_int { 0 } }));
            items.emplace_back(make_item("uint/4/max", { 0x1A, 0xFF, 0xFF, 0xFF, 0xFF }, value { unsigned_int { 0xFFFFFFFF } }));
            items.emplace_back(make_item("uint/8/min", { 0x1B, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00 }, value { unsigned_int { 0 } }));
            items.emplace_back(make_item("uint/8/max", { 0x1B, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF }, value { unsigned_int { 0xFFFFFFFFFFFFFFFFULL } }));
            items.emplace_back(make_item("negint/0/min", { 0x20 }, value { negative_int { 0 } }));
            items.emplace_back(make_item("negint/0/max", { 0x37 }, value { negative_int { 23 } }));
            items.emplace_back(make_item("negint/1/min", { 0x38, 0x00 }, value { negative_int { 0 } }));
            items.emplace_back(make_item("negint/1/max", { 0x38, 0xFF }, value { negative_int { 0xFF } }));
            items.emplace_back(make_item("negint/2/min", { 0x39, 0x00, 0x00 }, value { negative_int { 0 } }));
            items.emplace_back(make_item("negint/2/max", { 0x39, 0xFF, 0xFF }, value { negative_int { 0xFFFF } }));
            items.emplace_back(make_item("negint/4/min", { 0x3A, 0x00, 0x00, 0x00, 0x00 }, value { negative_int { 0 } }));
            items.emplace_back(make_item("negint/4/max", { 0x3A, 0xFF, 0xFF, 0xFF, 0xFF }, value { negative_int { 0xFFFFFFFF } }));
            items.emplace_back(make_item("negint/8/min", { 0x3B, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00 }, value { negative_int { 0 } }));
            items.emplace_back(make_item("negint/8/max", { 0x3B, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFE }, value { negative_int { 0xFFFFFFFFFFFFFFFEULL } }));
            items.emplace_back(make_item("true", { 0xF5 }, value { boolean { true } }));
            items.emplace_back(make_item("false", { 0xF4 }, value { boolean { false } }));
            items.emplace_back(make_item("null", { 0xF6 }, value { null {} }));
            items.emplace_back(make_item("undefined", { 0xF7 }, value { undefined {} }));
            items.emplace_back(make_item("float16/+Inf", { 0xF9, 0x7C, 0x00 }, value { float32 { 0x7F800000 } }));
            items.emplace_back(make_item("float16/-Inf", { 0xF9, 0xFC, 0x00 }, value { float32 { 0xFF800000 } }));
            items.emplace_back(make_item("float16/NaN/MSB", { 0xF9, 0x7E, 0x00 }, value { float32 { 0x7FC00000 } }));
            items.emplace_back(make_item("float16/NaN/LSB", { 0xF9, 0x7C, 0x01 }, value { float32 { 0x7F802000 } }));
            items.emplace_back(make_item("float32", { 0xFA, 0x7F, 0x80, 0x00, 0x00 }, value { float32 { 0x7F800000 } }));
            items.emplace_back(make_item("float64", { 0xFB, 0x7F, 0xF0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00 }, value { float64 { 0x7FF0000000000000ULL } }));
            return items;
        }

        success_group make_group(std::string name, const std::string_view title, std::vector<item> &&items)
        {
            success_group g { std::move(name) };
            for (auto &it: items)
                g.cases.push_back({ fmt::format("{} - {}", title, it.name), std::move(it.input), std::move(it.expect) });
            return g;
        }

        error_group make_error_group(std::string name, const std::string_view title, std::vector<bad_item> &&items)
        {
            error_group g { std::move(name) };
            for (auto &it: items)
                g.cases.push_back({ fmt::format("{} - {} - {}", title, it.name, it.message), std::move(it.input) });
            return g;
        }

        uint8_vector with_head(const uint8_t head, const uint8_vector &body, const bool add_break)
        {
            uint8_vector res { head };
            res << body;
            if (add_break)
                res.emplace_back(0xFF);
            return res;
        }

        std::vector<item> wrapped_in_lists(const std::vector<item> &atomic)
        {
            std::vector<item> items {};
            for (const auto indefinite: { false, true }) {
                for (const auto &a: atomic) {
                    json::array list_expect {};
                    list_expect.emplace_back(a.expect);
                    json::object expect {};
                    expect.emplace("list", std::move(list_expect));
                    items.push_back({
                        indefinite ? fmt::format("[_ {}]", a.name) : fmt::format("[{}]", a.name),
                        with_head(indefinite ? 0x9F : 0x81, a.input, indefinite),
                        std::move(expect)
                    });
                }
            }
            return items;
        }

        std::vector<item> wrapped_in_maps(const std::vector<item> &atomic)
        {
            static const uint8_vector key_foo { 0x63, 0x66, 0x6F, 0x6F };
            std::vector<item> items {};
            for (const auto indefinite: { false, true }) {
                for (const auto &a: atomic) {
                    uint8_vector body { key_foo };
                    body << a.input;
                    json::object map_expect {};
                    map_expect.emplace("foo", a.expect);
                    json::object expect {};
                    expect.emplace("map", std::move(map_expect));
                    items.push_back({
                        indefinite ? fmt::format("{{_ {}}}", a.name) : fmt::format("{{{}}}", a.name),
                        with_head(indefinite ? 0xBF : 0xA1, body, indefinite),
                        std::move(expect)
                    });
                }
            }
            return items;
        }

        std::vector<item> tag_items()
        {
            const auto tagged_one = [](std::string name, std::initializer_list<uint8_t> input, const uint64_t id) {
                return make_item(std::move(name), input, value { cbor::tag { id, std::make_unique<value>(unsigned_int { 1 }) } });
            };
            std::vector<item> items {};
            items.emplace_back(tagged_one("0/min", { 0xC0, 0x01 }, 0));
            items.emplace_back(tagged_one("0/max", { 0xD7, 0x01 }, 23));
            items.emplace_back(tagged_one("1/min", { 0xD8, 0x00, 0x01 }, 0));
            items.emplace_back(tagged_one("1/max", { 0xD8, 0xFF, 0x01 }, 0xFF));
            items.emplace_back(tagged_one("2/min", { 0xD9, 0x00, 0x00, 0x01 }, 0));
            items.emplace_back(tagged_one("2/max", { 0xD9, 0xFF, 0xFF, 0x01 }, 0xFFFF));
            items.emplace_back(tagged_one("4/min", { 0xDA, 0x00, 0x00, 0x00, 0x00, 0x01 }, 0));
            items.emplace_back(tagged_one("4/max", { 0xDA, 0xFF, 0xFF, 0xFF, 0xFF, 0x01 }, 0xFFFFFFFF));
            items.emplace_back(tagged_one("8/min", { 0xDB, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01 }, 0));
            items.emplace_back(tagged_one("8/max", { 0xDB, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x01 }, 0xFFFFFFFFFFFFFFFFULL));
            return items;
        }

        std::vector<bad_item> invalid_argument_items()
        {
            static constexpr std::array<std::string_view, 6> majors { "uint", "negint", "slice", "string", "list", "map" };
            std::vector<bad_item> items {};
            for (size_t major = 0; major < majors.size() + 1; ++major) {
                const std::string_view name = major < majors.size() ? majors[major] : "tag";
                for (uint8_t minor = 24; minor <= 27; ++minor) {
                    const size_t len = size_t { 1 } << (minor - 24);
                    // one byte short of the argument
                    uint8_vector input(len);
                    input[0] = static_cast<uint8_t>(major << 5 | minor);
                    items.push_back({ fmt::format("{}/{}", name, len), std::move(input), fmt::format("arg len {} greater than remaining buf len", len) });
                }
                // indefinite lengths are not permitted for integers and tags
                if (major == 0 || major == 1 || major == 6)
                    items.push_back({ fmt::format("{}/?", name), uint8_vector { static_cast<uint8_t>(major << 5 | 31) }, "unexpected minor value 31" });
            }
            for (uint8_t minor = 25; minor <= 27; ++minor) {
                const size_t len = size_t { 1 } << (minor - 24);
                uint8_vector input(len);
                input[0] = static_cast<uint8_t>(7 << 5 | minor);
                const auto width = len * 8;
                items.push_back({ fmt::format("major7/float{}", width), std::move(input), fmt::format("incomplete float{} at end of buf", width) });
            }
            items.push_back({ "major7/?", uint8_vector { 0xFF }, "unexpected minor value 31" });
            return items;
        }

        std::vector<bad_item> invalid_slice_items()
        {
            std::vector<bad_item> items {};
            for (const uint8_t major: { 2, 3 }) {
                const std::string_view name = major == 2 ? "slice" : "string";
                const uint8_t other_major = major == 2 ? 3 : 2;
                const uint8_t definite = major << 5;
                const uint8_t indefinite = major << 5 | 31;
                items.push_back({ fmt::format("{}/1, not enough bytes", name), uint8_vector { static_cast<uint8_t>(definite | 24), 0x01 },
                    "slice len 1 greater than remaining buf len" });
                items.push_back({ fmt::format("{}/?, no break", name), uint8_vector { indefinite }, "expected break marker" });
                items.push_back({ fmt::format("{}/?, invalid nested major", name), uint8_vector { indefinite, static_cast<uint8_t>(other_major << 5) },
                    fmt::format("unexpected major type {} in indefinite slice", other_major) });
                items.push_back({ fmt::format("{}/?, nested indefinite", name), uint8_vector { indefinite, indefinite }, "nested indefinite slice" });
                items.push_back({ fmt::format("{}/?, invalid nested definite", name), uint8_vector { indefinite, static_cast<uint8_t>(definite | 24), 0x01 },
                    "decode subslice: slice len 1 greater than remaining buf len" });
            }
            return items;
        }

        std::vector<bad_item> invalid_list_items()
        {
            std::vector<bad_item> items {};
            items.push_back({ "[] / eof after head", uint8_vector { 0x81 }, "unexpected end of payload" });
            items.push_back({ "[] / invalid item", uint8_vector { 0x81, 0x18 }, "arg len 1 greater than remaining buf len" });
            items.push_back({ "[_ ] / no break", uint8_vector { 0x9F }, "expected break marker" });
            items.push_back({ "[_ ] / invalid item", uint8_vector { 0x9F, 0x18 }, "arg len 1 greater than remaining buf len" });
            return items;
        }

        std::vector<bad_item> invalid_map_items()
        {
            std::vector<bad_item> items {};
            items.push_back({ "{} / eof after head", uint8_vector { 0xA1 }, "unexpected end of payload" });
            items.push_back({ "{} / non-string key", uint8_vector { 0xA1, 0x00 }, "unexpected major type 0 for map key" });
            items.push_back({ "{} / invalid key", uint8_vector { 0xA1, 0x78, 0x01 }, "slice len 1 greater than remaining buf len" });
            items.push_back({ "{} / invalid value", uint8_vector { 0xA1, 0x63, 0x66, 0x6F, 0x6F, 0x18 }, "arg len 1 greater than remaining buf len" });
            items.push_back({ "{_ } / no break", uint8_vector { 0xBF }, "expected break marker" });
            items.push_back({ "{_ } / non-string key", uint8_vector { 0xBF, 0x00 }, "unexpected major type 0 for map key" });
            items.push_back({ "{_ } / invalid key", uint8_vector { 0xBF, 0x78, 0x01 }, "slice len 1 greater than remaining buf len" });
            items.push_back({ "{_ } / invalid value", uint8_vector { 0xBF, 0x63, 0x66, 0x6F, 0x6F, 0x18 }, "arg len 1 greater than remaining buf len" });
            return items;
        }

        std::vector<bad_item> invalid_tag_items()
        {
            std::vector<bad_item> items {};
            items.push_back({ "invalid value", uint8_vector { 0xC1, 0x18 }, "arg len 1 greater than remaining buf len" });
            items.push_back({ "eof", uint8_vector { 0xC1 }, "unexpected end of payload" });
            return items;
        }

        catalog make_catalog()
        {
            const auto atomic = atomic_items();
            catalog cat {};
            cat.success.emplace_back(make_group("TestDecode_Atomic", "atomic", atomic_items()));
            cat.success.emplace_back(make_group("TestDecode_DefiniteSlice", "definite slice", {
                { "len = 0", { 0x40 }, to_expect(value { byte_string {} }) },
                { "len > 0", { 0x43, 0x66, 0x6F, 0x6F }, to_expect(value { byte_string { 0x66, 0x6F, 0x6F } }) }
            }));
            cat.success.emplace_back(make_group("TestDecode_IndefiniteSlice", "indefinite slice", {
                { "len = 0", { 0x5F, 0xFF }, to_expect(value { byte_string {} }) },
                { "len = 0, explicit", { 0x5F, 0x40, 0xFF }, to_expect(value { byte_string {} }) },
                { "len = 0, len > 0", { 0x5F, 0x40, 0x43, 0x66, 0x6F, 0x6F, 0xFF }, to_expect(value { byte_string { 0x66, 0x6F, 0x6F } }) },
                { "len > 0, len = 0", { 0x5F, 0x43, 0x66, 0x6F, 0x6F, 0x40, 0xFF }, to_expect(value { byte_string { 0x66, 0x6F, 0x6F } }) },
                { "len > 0, len > 0", { 0x5F, 0x43, 0x66, 0x6F, 0x6F, 0x43, 0x66, 0x6F, 0x6F, 0xFF },
                    to_expect(value { byte_string { 0x66, 0x6F, 0x6F, 0x66, 0x6F, 0x6F } }) }
            }));
            cat.success.emplace_back(make_group("TestDecode_DefiniteString", "definite string", {
                { "len = 0", { 0x60 }, to_expect(value { text_string {} }) },
                { "len > 0", { 0x63, 0x66, 0x6F, 0x6F }, to_expect(value { text_string { "foo" } }) }
            }));
            cat.success.emplace_back(make_group("TestDecode_IndefiniteString", "indefinite string", {
                { "len = 0", { 0x7F, 0xFF }, to_expect(value { text_string {} }) },
                { "len = 0, explicit", { 0x7F, 0x60, 0xFF }, to_expect(value { text_string {} }) },
                { "len = 0, len > 0", { 0x7F, 0x60, 0x63, 0x66, 0x6F, 0x6F, 0xFF }, to_expect(value { text_string { "foo" } }) },
                { "len > 0, len = 0", { 0x7F, 0x63, 0x66, 0x6F, 0x6F, 0x60, 0xFF }, to_expect(value { text_string { "foo" } }) },
                { "len > 0, len > 0", { 0x7F, 0x63, 0x66, 0x6F, 0x6F, 0x63, 0x66, 0x6F, 0x6F, 0xFF }, to_expect(value { text_string { "foofoo" } }) }
            }));
            cat.success.emplace_back(make_group("TestDecode_List", "list", wrapped_in_lists(atomic)));
            cat.success.emplace_back(make_group("TestDecode_Map", "map", wrapped_in_maps(atomic)));
            cat.success.emplace_back(make_group("TestDecode_Tag", "tag", tag_items()));
            cat.errors.emplace_back(make_error_group("TestDecodeError_InvalidArgument", "TestDecode_InvalidArgument", invalid_argument_items()));
            cat.errors.emplace_back(make_error_group("TestDecodeError_InvalidSlice", "TestDecode_InvalidSlice", invalid_slice_items()));
            cat.errors.emplace_back(make_error_group("TestDecodeError_InvalidList", "TestDecode_InvalidList", invalid_list_items()));
            cat.errors.emplace_back(make_error_group("TestDecodeError_InvalidMap", "TestDecode_InvalidMap", invalid_map_items()));
            cat.errors.emplace_back(make_error_group("TestDecodeError_InvalidTag", "TestDecode_InvalidTag", invalid_tag_items()));
            return cat;
        }
    }

    const catalog &builtin_catalog()
    {
        static const catalog cat = make_catalog();
        return cat;
    }
}
