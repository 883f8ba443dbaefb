/* This file is part of Cobalt, derived from Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef COBALT_CBOR_VALUE_HPP
#define COBALT_CBOR_VALUE_HPP

#include <array>
#include <cstring>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <cobalt/common/bytes.hpp>
#include <cobalt/common/error.hpp>
#include <cobalt/common/format.hpp>

namespace cobalt::cbor {
    typedef cobalt::error error;

    struct value;

    // the order must match the order of alternatives in value_content
    enum value_type {
        CBOR_UINT,
        CBOR_NINT,
        CBOR_BYTES,
        CBOR_TEXT,
        CBOR_LIST,
        CBOR_MAP,
        CBOR_TAG,
        CBOR_BOOL,
        CBOR_NULL,
        CBOR_UNDEFINED,
        CBOR_FLOAT32,
        CBOR_FLOAT64
    };

    struct unsigned_int {
        uint64_t val = 0;

        bool operator==(const unsigned_int &o) const =default;
    };

    // Keeps the encoded argument: the represented integer is -(arg + 1).
    struct negative_int {
        uint64_t arg = 0;

        uint64_t magnitude() const
        {
            if (arg == std::numeric_limits<uint64_t>::max()) [[unlikely]]
                throw error("the magnitude of the negative int -(2^64) does not fit into uint64_t!");
            return arg + 1;
        }

        bool operator==(const negative_int &o) const =default;
    };

    using byte_string = uint8_vector;
    using text_string = std::string;

    struct list: std::vector<value> {
        using std::vector<value>::vector;
        inline const value &at(size_t pos, const std::source_location &loc=std::source_location::current()) const;
    };

    // Duplicate keys are resolved by the decoder: the last occurrence wins.
    struct map: std::map<std::string, value, std::less<>> {
        using std::map<std::string, value, std::less<>>::map;
        inline const value &at(std::string_view key, const std::source_location &loc=std::source_location::current()) const;
    };

    struct tag {
        uint64_t id = 0;
        std::unique_ptr<value> val {};
    };

    struct boolean {
        bool val = false;

        bool operator==(const boolean &o) const =default;
    };

    struct null {
        bool operator==(const null &) const =default;
    };

    struct undefined {
        bool operator==(const undefined &) const =default;
    };

    // Floats are kept as raw bits so that NaN payloads survive unchanged.
    struct float32 {
        uint32_t bits = 0;

        float get() const noexcept
        {
            static_assert(sizeof(float) == sizeof(bits));
            float f;
            memcpy(&f, &bits, sizeof(f));
            return f;
        }

        bool operator==(const float32 &o) const =default;
    };

    struct float64 {
        uint64_t bits = 0;

        double get() const noexcept
        {
            static_assert(sizeof(double) == sizeof(bits));
            double d;
            memcpy(&d, &bits, sizeof(d));
            return d;
        }

        bool operator==(const float64 &o) const =default;
    };

    typedef std::variant<
            unsigned_int,
            negative_int,
            byte_string,
            text_string,
            list,
            map,
            tag,
            boolean,
            null,
            undefined,
            float32,
            float64
        > value_content;

    struct value {
        static const std::string &type_name(const value_type type)
        {
            static std::array<std::string, 12> names {
                "unsigned integer", "negative integer", "bytes", "text",
                "list", "map", "tag", "bool",
                "null", "undefined", "float32", "float64"
            };
            const auto type_idx = static_cast<size_t>(type);
            if (type_idx >= names.size())
                throw error(fmt::format("unsupported CBOR type index: {}", type_idx));
            return names[type_idx];
        }

        value() =default;
        value(value &&) =default;
        value &operator=(value &&) =default;

        explicit value(value_content &&content): _content { std::move(content) }
        {
        }

        value_type type() const noexcept
        {
            return static_cast<value_type>(_content.index());
        }

        const std::string &type_name() const
        {
            return type_name(type());
        }

        const value_content &content() const noexcept
        {
            return _content;
        }

        bool operator==(const value &o) const;

        uint64_t uint(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<unsigned_int>(CBOR_UINT, loc).val;
        }

        // the magnitude M of the represented integer -M
        uint64_t nint(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<negative_int>(CBOR_NINT, loc).magnitude();
        }

        uint64_t nint_raw(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<negative_int>(CBOR_NINT, loc).arg;
        }

        const byte_string &bytes(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<byte_string>(CBOR_BYTES, loc);
        }

        std::string_view text(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<text_string>(CBOR_TEXT, loc);
        }

        const cbor::list &list(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<cbor::list>(CBOR_LIST, loc);
        }

        const cbor::map &map(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<cbor::map>(CBOR_MAP, loc);
        }

        const cbor::tag &tag(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<cbor::tag>(CBOR_TAG, loc);
        }

        bool boolean(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<cbor::boolean>(CBOR_BOOL, loc).val;
        }

        bool is_null() const noexcept
        {
            return type() == CBOR_NULL;
        }

        bool is_undefined() const noexcept
        {
            return type() == CBOR_UNDEFINED;
        }

        float float32(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<cbor::float32>(CBOR_FLOAT32, loc).get();
        }

        uint32_t float32_bits(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<cbor::float32>(CBOR_FLOAT32, loc).bits;
        }

        double float64(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<cbor::float64>(CBOR_FLOAT64, loc).get();
        }

        uint64_t float64_bits(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<cbor::float64>(CBOR_FLOAT64, loc).bits;
        }

        const value &at(const size_t idx, const std::source_location &loc=std::source_location::current()) const;
    private:
        value_content _content {};

        template<typename T>
        const T &_get(const value_type exp_type, const std::source_location &loc) const
        {
            if (const auto *v = std::get_if<T>(&_content); v) [[likely]]
                return *v;
            throw error(fmt::format("invalid cbor value access, expecting type {} while the present value is {} in file {} line {}!",
                type_name(exp_type), type_name(), loc.file_name(), loc.line()));
        }
    };

    inline const value &list::at(const size_t pos, const std::source_location &loc) const
    {
        if (pos < size()) [[likely]]
            return operator[](pos);
        throw error(fmt::format("invalid element index {} in the list of size {} in file {} line {}!",
            pos, size(), loc.file_name(), loc.line()));
    }

    inline const value &map::at(const std::string_view key, const std::source_location &loc) const
    {
        if (const auto it = find(key); it != end()) [[likely]]
            return it->second;
        throw error(fmt::format("the map has no key '{}' in file {} line {}!", key, loc.file_name(), loc.line()));
    }

    inline const value &value::at(const size_t idx, const std::source_location &loc) const
    {
        return list(loc).at(idx, loc);
    }

    extern std::string stringify(const value &val, size_t max_depth=10, size_t max_list_to_expand=100);
}

namespace fmt {
    template<>
    struct formatter<cobalt::cbor::value>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", cobalt::cbor::stringify(v));
        }
    };

    template<>
    struct formatter<cobalt::cbor::value_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using namespace cobalt::cbor;
            switch (v) {
                case CBOR_UINT: return fmt::format_to(ctx.out(), "cbor::uint");
                case CBOR_NINT: return fmt::format_to(ctx.out(), "cbor::nint");
                case CBOR_BYTES: return fmt::format_to(ctx.out(), "cbor::bytes");
                case CBOR_TEXT: return fmt::format_to(ctx.out(), "cbor::text");
                case CBOR_LIST: return fmt::format_to(ctx.out(), "cbor::list");
                case CBOR_MAP: return fmt::format_to(ctx.out(), "cbor::map");
                case CBOR_TAG: return fmt::format_to(ctx.out(), "cbor::tag");
                case CBOR_BOOL: return fmt::format_to(ctx.out(), "cbor::bool");
                case CBOR_NULL: return fmt::format_to(ctx.out(), "cbor::null");
                case CBOR_UNDEFINED: return fmt::format_to(ctx.out(), "cbor::undefined");
                case CBOR_FLOAT32: return fmt::format_to(ctx.out(), "cbor::float32");
                case CBOR_FLOAT64: return fmt::format_to(ctx.out(), "cbor::float64");
                default: return fmt::format_to(ctx.out(), "unsupported cbor type {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !COBALT_CBOR_VALUE_HPP
