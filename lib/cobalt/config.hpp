/* This file is part of Cobalt, derived from Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef COBALT_CONFIG_HPP
#define COBALT_CONFIG_HPP

#include <optional>
#include <cobalt/json.hpp>

namespace cobalt {
    struct config {
        virtual ~config() =default;

        [[nodiscard]] const json::value &at(const std::string_view &name) const
        {
            return _at_impl(name);
        }

        [[nodiscard]] const json::value *find(const std::string_view &name) const
        {
            return json().if_contains(name);
        }

        [[nodiscard]] const json::object &json() const
        {
            return _json_impl();
        }

        [[nodiscard]] std::optional<uint64_t> get_uint(const std::string_view &name) const;
    private:
        virtual const json::value &_at_impl(const std::string_view &name) const;
        virtual const json::object &_json_impl() const =0;
    };

    // Used as a config mock
    struct config_json: config {
        explicit config_json(json::object &&json)
            : _json { std::move(json) }
        {
        }
    private:
        const json::object _json;

        const json::object &_json_impl() const override
        {
            return _json;
        }
    };

    struct config_file: config {
        explicit config_file(const std::string &path);

        const std::string &path() const noexcept
        {
            return _path;
        }
    private:
        std::string _path;
        json::object _parsed;

        const json::value &_at_impl(const std::string_view &name) const override;
        const json::object &_json_impl() const override
        {
            return _parsed;
        }
    };
}

#endif // !COBALT_CONFIG_HPP
