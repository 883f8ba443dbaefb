/* This file is part of Cobalt, derived from Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cobalt/config.hpp>
#include <cobalt/logger.hpp>

namespace cobalt {
    std::optional<uint64_t> config::get_uint(const std::string_view &name) const
    {
        const auto *v = find(name);
        if (!v)
            return {};
        switch (v->kind()) {
            case json::kind::uint64:
                return v->get_uint64();
            case json::kind::int64:
                if (v->get_int64() >= 0)
                    return static_cast<uint64_t>(v->get_int64());
                break;
            default:
                break;
        }
        throw error(fmt::format("config element {} must be a non-negative integer but got {}", name, json::serialize(*v)));
    }

    const json::value &config::_at_impl(const std::string_view &name) const
    {
        const auto *v = find(name);
        if (!v)
            throw error(fmt::format("config does not have the requested {} element!", name));
        return *v;
    }

    static json::object parse_config_object(const std::string &path)
    {
        auto jv = json::load(path);
        if (!jv.is_object())
            throw error(fmt::format("configuration file {} must contain a JSON object", path));
        return std::move(jv.as_object());
    }

    config_file::config_file(const std::string &path)
        : _path { path }, _parsed { parse_config_object(path) }
    {
        logger::debug("loaded configuration file {} with {} elements", _path, _parsed.size());
    }

    const json::value &config_file::_at_impl(const std::string_view &name) const
    {
        const auto it = _parsed.find(name);
        if (it == _parsed.end())
            throw error(fmt::format("configuration file {} does not have the element {}!", _path, name));
        return it->value();
    }
}
