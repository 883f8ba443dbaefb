/* This file is part of Cobalt, derived from Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef COBALT_CBOR_FIXTURE_HPP
#define COBALT_CBOR_FIXTURE_HPP

#include <optional>
#include <string>
#include <vector>
#include <cobalt/cbor/decoder.hpp>
#include <cobalt/json.hpp>

namespace cobalt::cbor::fixture {
    struct success_case {
        std::string description {};
        uint8_vector input {};
        json::value expect {};
    };

    struct error_case {
        std::string description {};
        uint8_vector input {};

        // the error message suffix of the description: "<group> - <name> - <message>"
        std::string_view expected_message() const noexcept
        {
            const auto pos = description.rfind(" - ");
            if (pos == description.npos)
                return {};
            return std::string_view { description }.substr(pos + 3);
        }
    };

    using success_list = std::vector<success_case>;
    using error_list = std::vector<error_case>;

    struct success_group {
        std::string name {};
        success_list cases {};
    };

    struct error_group {
        std::string name {};
        error_list cases {};
    };

    struct catalog {
        std::vector<success_group> success {};
        std::vector<error_group> errors {};

        success_list all_success() const;
        error_list all_errors() const;
    };

    struct any_list {
        success_list success {};
        error_list errors {};
    };

    extern json::value to_expect(const value &val);

    // Returns a description of the mismatch or std::nullopt when the case passes.
    extern std::optional<std::string> check(const success_case &c, const decode_options &opts={});
    extern std::optional<std::string> check(const error_case &c, const decode_options &opts={});

    extern json::array to_json(const success_list &cases);
    extern json::array to_json(const error_list &cases);
    extern void save(const std::string &path, const success_list &cases);
    extern void save(const std::string &path, const error_list &cases);
    extern success_list load_success(const std::string &path);
    extern error_list load_error(const std::string &path);
    // records with an "expect" element are success cases, all others are error cases
    extern any_list load_any(const std::string &path);

    extern const catalog &builtin_catalog();
    // writes one file per group plus TestDecodeSuccess.json and TestDecodeError.json and returns their paths
    extern std::vector<std::string> export_catalog(const std::string &dir, const catalog &cat=builtin_catalog());
}

#endif // !COBALT_CBOR_FIXTURE_HPP
