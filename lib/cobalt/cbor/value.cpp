/* This file is part of Cobalt, derived from Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <sstream>
#include <cobalt/cbor/value.hpp>

namespace cobalt::cbor {
    namespace {
        template<class... Ts>
        struct overloaded: Ts... {
            using Ts::operator()...;
        };

        bool is_ascii(const buffer b)
        {
            for (const auto c: b) {
                if (c < 32 || c > 127)
                    return false;
            }
            return true;
        }

        std::string make_shift_str(const size_t shift)
        {
            return std::string(shift, ' ');
        }

        void print_value(std::ostream &os, const value &val, const size_t max_depth, const size_t depth, const size_t max_list_to_expand)
        {
            const auto shift_str = make_shift_str(depth * 4);
            std::visit(overloaded {
                [&](const unsigned_int &v) {
                    os << "I " << v.val;
                },
                [&](const negative_int &v) {
                    // -(arg + 1) may not fit into uint64_t
                    if (v.arg == std::numeric_limits<uint64_t>::max())
                        os << "I -18446744073709551616";
                    else
                        os << "I -" << v.magnitude();
                },
                [&](const byte_string &b) {
                    os << fmt::format("B #{}", b);
                    if (!b.empty() && is_ascii(b))
                        os << " ('" << b.str() << "')";
                },
                [&](const text_string &t) {
                    os << "T '" << t << "'";
                },
                [&](const list &l) {
                    os << fmt::format("[(items: {})", l.size());
                    if (!l.empty() && (max_list_to_expand == 0 || l.size() <= max_list_to_expand) && depth < max_depth) {
                        os << '\n';
                        for (size_t i = 0; i < l.size(); ++i) {
                            os << shift_str << "    #" << i << ": ";
                            print_value(os, l[i], max_depth, depth + 1, max_list_to_expand);
                            os << '\n';
                        }
                        os << shift_str;
                    }
                    os << ']';
                },
                [&](const map &m) {
                    os << fmt::format("{{(items: {})", m.size());
                    if (!m.empty() && (max_list_to_expand == 0 || m.size() <= max_list_to_expand) && depth < max_depth) {
                        os << '\n';
                        for (const auto &[k, v]: m) {
                            os << shift_str << "    T '" << k << "': ";
                            print_value(os, v, max_depth, depth + 1, max_list_to_expand);
                            os << '\n';
                        }
                        os << shift_str;
                    }
                    os << '}';
                },
                [&](const tag &t) {
                    os << "TAG " << t.id << " ";
                    if (t.val)
                        print_value(os, *t.val, max_depth, depth, max_list_to_expand);
                    else
                        os << "EMPTY";
                },
                [&](const boolean &b) {
                    os << (b.val ? "TRUE" : "FALSE");
                },
                [&](const null &) {
                    os << "NULL";
                },
                [&](const undefined &) {
                    os << "UNDEFINED";
                },
                [&](const float32 &f) {
                    os << fmt::format("F32 {} (0x{:08X})", f.get(), f.bits);
                },
                [&](const float64 &f) {
                    os << fmt::format("F64 {} (0x{:016X})", f.get(), f.bits);
                }
            }, val.content());
        }
    }

    bool value::operator==(const value &o) const
    {
        if (_content.index() != o._content.index())
            return false;
        return std::visit(overloaded {
            [&](const cbor::list &l) {
                const auto &ol = std::get<cbor::list>(o._content);
                if (l.size() != ol.size())
                    return false;
                for (size_t i = 0; i < l.size(); ++i) {
                    if (!(l[i] == ol[i]))
                        return false;
                }
                return true;
            },
            [&](const cbor::map &m) {
                const auto &om = std::get<cbor::map>(o._content);
                if (m.size() != om.size())
                    return false;
                for (auto it = m.begin(), oit = om.begin(); it != m.end(); ++it, ++oit) {
                    if (it->first != oit->first || !(it->second == oit->second))
                        return false;
                }
                return true;
            },
            [&](const cbor::tag &t) {
                const auto &ot = std::get<cbor::tag>(o._content);
                if (t.id != ot.id)
                    return false;
                if (!t.val || !ot.val)
                    return !t.val && !ot.val;
                return *t.val == *ot.val;
            },
            [&](const auto &v) {
                return v == std::get<std::decay_t<decltype(v)>>(o._content);
            }
        }, _content);
    }

    std::string stringify(const value &val, const size_t max_depth, const size_t max_list_to_expand)
    {
        std::stringstream ss {};
        print_value(ss, val, max_depth, 0, max_list_to_expand);
        return ss.str();
    }
}
