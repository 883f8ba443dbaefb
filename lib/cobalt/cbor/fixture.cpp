/* This file is part of Cobalt, derived from Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <filesystem>
#include <cobalt/cbor/fixture.hpp>
#include <cobalt/logger.hpp>

namespace cobalt::cbor::fixture {
    namespace {
        template<class... Ts>
        struct overloaded: Ts... {
            using Ts::operator()...;
        };

        json::object one_key(const std::string_view key, json::value &&val)
        {
            json::object res {};
            res.emplace(key, std::move(val));
            return res;
        }

        // Fixture writers may omit empty byte strings, lists and maps, leaving {} as the expectation.
        json::value omit_empty(const json::value &exp)
        {
            switch (exp.kind()) {
                case json::kind::array: {
                    json::array res {};
                    res.reserve(exp.get_array().size());
                    for (const auto &item: exp.get_array())
                        res.emplace_back(omit_empty(item));
                    return res;
                }
                case json::kind::object: {
                    json::object res {};
                    for (const auto &[k, v]: exp.get_object()) {
                        if ((k == "bytestring" || k == "list") && v.is_array() && v.get_array().empty())
                            continue;
                        if (k == "map" && v.is_object() && v.get_object().empty())
                            continue;
                        res.emplace(k, omit_empty(v));
                    }
                    return res;
                }
                default:
                    return exp;
            }
        }

        std::string input_hex(const uint8_vector &input)
        {
            return fmt::format("{}", buffer_lowercase { input.data(), input.size() });
        }

        const json::object &record_object(const json::value &rec, const std::string &path)
        {
            if (!rec.is_object())
                throw error(fmt::format("fixture file {} contains a non-object record: {}", path, json::serialize(rec)));
            return rec.get_object();
        }

        std::string record_string(const json::object &rec, const std::string_view key, const std::string &path)
        {
            const auto *v = rec.if_contains(key);
            if (!v || !v->is_string())
                throw error(fmt::format("fixture file {} has a record without a string {}: {}", path, key, json::serialize(rec)));
            return std::string { v->get_string() };
        }

        const json::array &load_array(const json::value &jv, const std::string &path)
        {
            if (!jv.is_array())
                throw error(fmt::format("fixture file {} must contain a JSON array", path));
            return jv.get_array();
        }

        success_case parse_success(const json::object &rec, const std::string &path)
        {
            const auto *exp = rec.if_contains("expect");
            if (!exp || !exp->is_object())
                throw error(fmt::format("fixture file {} has a success record without an expect object: {}", path, json::serialize(rec)));
            return { record_string(rec, "description", path), uint8_vector::from_hex(record_string(rec, "input", path)), *exp };
        }

        error_case parse_error(const json::object &rec, const std::string &path)
        {
            return { record_string(rec, "description", path), uint8_vector::from_hex(record_string(rec, "input", path)) };
        }
    }

    success_list catalog::all_success() const
    {
        success_list res {};
        for (const auto &g: success)
            res.insert(res.end(), g.cases.begin(), g.cases.end());
        return res;
    }

    error_list catalog::all_errors() const
    {
        error_list res {};
        for (const auto &g: errors)
            res.insert(res.end(), g.cases.begin(), g.cases.end());
        return res;
    }

    json::value to_expect(const value &val)
    {
        return std::visit(overloaded {
            [](const unsigned_int &v) {
                return one_key("uint", v.val);
            },
            [](const negative_int &v) {
                return one_key("negint", v.arg);
            },
            [](const byte_string &v) {
                json::array bytes {};
                bytes.reserve(v.size());
                for (const auto b: v)
                    bytes.emplace_back(b);
                return one_key("bytestring", std::move(bytes));
            },
            [](const text_string &v) {
                return one_key("string", json::string { v });
            },
            [](const list &v) {
                json::array items {};
                items.reserve(v.size());
                for (const auto &item: v)
                    items.emplace_back(to_expect(item));
                return one_key("list", std::move(items));
            },
            [](const map &v) {
                json::object items {};
                for (const auto &[k, item]: v)
                    items.emplace(k, to_expect(item));
                return one_key("map", std::move(items));
            },
            [](const tag &v) {
                if (!v.val) [[unlikely]]
                    throw error(fmt::format("a tag {} without a value", v.id));
                json::object t {};
                t.emplace("id", v.id);
                t.emplace("value", to_expect(*v.val));
                return one_key("tag", std::move(t));
            },
            [](const boolean &v) {
                return one_key("bool", v.val);
            },
            [](const null &) {
                return one_key("null", json::object {});
            },
            [](const undefined &) {
                return one_key("undefined", json::object {});
            },
            [](const float32 &v) {
                return one_key("float32", v.bits);
            },
            [](const float64 &v) {
                return one_key("float64", v.bits);
            }
        }, val.content());
    }

    std::optional<std::string> check(const success_case &c, const decode_options &opts)
    {
        try {
            const auto res = decode(c.input, opts);
            if (res.size != c.input.size())
                return fmt::format("{}: decoded {} of {} bytes", c.description, res.size, c.input.size());
            if (const auto act = to_expect(res.val); omit_empty(act) != omit_empty(c.expect))
                return fmt::format("{}: expected {} but got {}", c.description, json::serialize(c.expect), json::serialize(act));
        } catch (const decode_error &ex) {
            return fmt::format("{}: unexpected decode error: {}", c.description, ex.what());
        }
        return {};
    }

    std::optional<std::string> check(const error_case &c, const decode_options &opts)
    {
        try {
            const auto res = decode(c.input, opts);
            return fmt::format("{}: expected a decode error but got {}", c.description, res.val);
        } catch (const decode_error &ex) {
            const std::string_view msg { ex.what() };
            if (const auto exp_msg = c.expected_message(); msg.find(exp_msg) == msg.npos)
                return fmt::format("{}: the error '{}' does not contain '{}'", c.description, msg, exp_msg);
        }
        return {};
    }

    json::array to_json(const success_list &cases)
    {
        json::array res {};
        res.reserve(cases.size());
        for (const auto &c: cases) {
            res.emplace_back(json::object {
                { "description", c.description },
                { "input", input_hex(c.input) },
                { "expect", c.expect }
            });
        }
        return res;
    }

    json::array to_json(const error_list &cases)
    {
        json::array res {};
        res.reserve(cases.size());
        for (const auto &c: cases) {
            res.emplace_back(json::object {
                { "description", c.description },
                { "input", input_hex(c.input) }
            });
        }
        return res;
    }

    void save(const std::string &path, const success_list &cases)
    {
        json::save_pretty(path, to_json(cases));
        logger::debug("saved {} success cases to {}", cases.size(), path);
    }

    void save(const std::string &path, const error_list &cases)
    {
        json::save_pretty(path, to_json(cases));
        logger::debug("saved {} error cases to {}", cases.size(), path);
    }

    success_list load_success(const std::string &path)
    {
        const auto jv = json::load(path);
        success_list res {};
        for (const auto &rec: load_array(jv, path))
            res.emplace_back(parse_success(record_object(rec, path), path));
        return res;
    }

    error_list load_error(const std::string &path)
    {
        const auto jv = json::load(path);
        error_list res {};
        for (const auto &rec: load_array(jv, path))
            res.emplace_back(parse_error(record_object(rec, path), path));
        return res;
    }

    any_list load_any(const std::string &path)
    {
        const auto jv = json::load(path);
        any_list res {};
        for (const auto &rec: load_array(jv, path)) {
            const auto &obj = record_object(rec, path);
            if (obj.contains("expect"))
                res.success.emplace_back(parse_success(obj, path));
            else
                res.errors.emplace_back(parse_error(obj, path));
        }
        return res;
    }

    std::vector<std::string> export_catalog(const std::string &dir, const catalog &cat)
    {
        std::vector<std::string> paths {};
        const auto make_path = [&](const std::string &name) {
            return (std::filesystem::path { dir } / (name + ".json")).string();
        };
        for (const auto &g: cat.success) {
            save(paths.emplace_back(make_path(g.name)), g.cases);
        }
        for (const auto &g: cat.errors) {
            save(paths.emplace_back(make_path(g.name)), g.cases);
        }
        save(paths.emplace_back(make_path("TestDecodeSuccess")), cat.all_success());
        save(paths.emplace_back(make_path("TestDecodeError")), cat.all_errors());
        logger::info("exported {} fixture files to {}", paths.size(), dir);
        return paths;
    }
}
