/* This file is part of Cobalt, derived from Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <limits>
#include <cobalt/common/file.hpp>
#include <cobalt/common/test.hpp>
#include <cobalt/config.hpp>

using namespace cobalt;

suite config_suite = [] {
    "config"_test = [] {
        "mock"_test = [] {
            const config_json cfg { json::object {
                { "maxDepth", 64 },
                { "name", "decoder" }
            } };
            test_same(std::string_view { "decoder" }, std::string_view { cfg.at("name").as_string() });
            expect(cfg.find("missing") == nullptr);
            expect(throws([&] { cfg.at("missing"); }));
            test_same(size_t { 2 }, cfg.json().size());
        };
        "get_uint"_test = [] {
            const config_json cfg { json::object {
                { "small", 10 },
                { "big", 18446744073709551615ULL },
                { "negative", -1 },
                { "text", "12" },
                { "fraction", 1.5 }
            } };
            test_same(uint64_t { 10 }, *cfg.get_uint("small"));
            test_same(std::numeric_limits<uint64_t>::max(), *cfg.get_uint("big"));
            expect(!cfg.get_uint("missing"));
            expect_throws_msg<error>([&] { cfg.get_uint("negative"); }, "must be a non-negative integer");
            expect(throws([&] { cfg.get_uint("text"); }));
            expect(throws([&] { cfg.get_uint("fraction"); }));
        };
        "file"_test = [] {
            const std::string path { "tmp/config-test/decoder.json" };
            file::write(path, std::string_view { R"({ "maxDepth": 32 })" });
            const config_file cfg { path };
            test_same(path, cfg.path());
            test_same(uint64_t { 32 }, *cfg.get_uint("maxDepth"));
            expect_throws_msg<error>([&] { cfg.at("other"); }, "does not have the element other");
        };
        "file errors"_test = [] {
            expect(throws([] { config_file { "tmp/config-test/missing.json" }; }));
            const std::string array_path { "tmp/config-test/array.json" };
            file::write(array_path, std::string_view { "[1, 2, 3]" });
            expect_throws_msg<error>([&] { config_file { array_path }; }, "must contain a JSON object");
            const std::string broken_path { "tmp/config-test/broken.json" };
            file::write(broken_path, std::string_view { "{ \"maxDepth\": " });
            expect(throws([&] { config_file { broken_path }; }));
        };
    };
};
