/* This file is part of Cobalt, derived from Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef COBALT_JSON_HPP
#define COBALT_JSON_HPP

#include <iterator>
#include <ostream>
#include <sstream>
#include <boost/json.hpp>
#include <cobalt/common/bytes.hpp>
#include <cobalt/common/file.hpp>

namespace cobalt::json {
    using namespace boost::json;

    inline json::value parse(const buffer &buf, json::storage_ptr sp={})
    {
        return boost::json::parse(static_cast<std::string_view>(buf), sp);
    }

    inline json::value load(const std::string &path, json::storage_ptr sp={})
    {
        return parse(file::read(path), sp);
    }

    inline void save_pretty(std::ostream& os, json::value const &jv, std::string *indent = nullptr)
    {
        static constexpr size_t indent_step = 2;
        std::string indent_ {};
        if(!indent)
            indent = &indent_;
        switch (jv.kind()) {
            case json::kind::object: {
                const auto &obj = jv.get_object();
                if (obj.empty()) {
                    os << "{}";
                    break;
                }
                os << "{\n";
                indent->append(indent_step, ' ');
                for (auto it = obj.begin(), last = std::prev(obj.end()); it != obj.end(); ++it) {
                    os << *indent << json::serialize(it->key()) << ": ";
                    save_pretty(os, it->value(), indent);
                    if (it != last)
                        os << ',';
                    os << '\n';
                }
                indent->resize(indent->size() - indent_step);
                os << *indent << "}";
                break;
            }
            case json::kind::array: {
                const auto &arr = jv.get_array();
                if (arr.empty()) {
                    os << "[]";
                    break;
                }
                os << "[\n";
                indent->append(indent_step, ' ');
                for (auto it = arr.begin(), last = std::prev(arr.end()); it != arr.end(); ++it) {
                    os << *indent;
                    save_pretty(os, *it, indent);
                    if (it != last)
                        os << ',';
                    os << '\n';
                }
                indent->resize(indent->size() - indent_step);
                os << *indent << "]";
                break;
            }
            case json::kind::string:
                os << json::serialize(jv.get_string());
                break;
            case json::kind::uint64:
                os << jv.get_uint64();
                break;
            case json::kind::int64:
                os << jv.get_int64();
                break;
            case json::kind::double_:
                os << json::serialize(jv);
                break;
            case json::kind::bool_:
                if(jv.get_bool())
                    os << "true";
                else
                    os << "false";
                break;
            case json::kind::null:
                os << "null";
                break;
        }
    }

    inline std::string serialize_pretty(const json::value &jv)
    {
        std::ostringstream os {};
        save_pretty(os, jv);
        return os.str();
    }

    inline void save_pretty(const std::string &path, const json::value &jv)
    {
        file::write(path, buffer { serialize_pretty(jv) });
    }
}

#endif // !COBALT_JSON_HPP
