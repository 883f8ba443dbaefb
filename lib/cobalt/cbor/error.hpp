/* This file is part of Cobalt, derived from Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef COBALT_CBOR_ERROR_HPP
#define COBALT_CBOR_ERROR_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <cobalt/cbor/value.hpp>

namespace cobalt::cbor {
    enum class error_kind: uint8_t {
        argument_too_short,
        invalid_minor_value,
        incomplete_float,
        content_too_short,
        expected_break_marker,
        unexpected_major_in_indefinite,
        nested_indefinite,
        unexpected_end_of_payload,
        unexpected_major_for_map_key,
        nested,
        max_depth_exceeded
    };

    struct decode_error: error {
        static decode_error argument_too_short(const uint64_t len)
        {
            return { error_kind::argument_too_short, len };
        }

        static decode_error invalid_minor_value(const uint64_t minor)
        {
            return { error_kind::invalid_minor_value, minor };
        }

        static decode_error incomplete_float(const uint64_t width)
        {
            return { error_kind::incomplete_float, width };
        }

        static decode_error content_too_short(const uint64_t len)
        {
            return { error_kind::content_too_short, len };
        }

        static decode_error expected_break_marker()
        {
            return { error_kind::expected_break_marker };
        }

        static decode_error unexpected_major_in_indefinite(const uint64_t major)
        {
            return { error_kind::unexpected_major_in_indefinite, major };
        }

        static decode_error nested_indefinite()
        {
            return { error_kind::nested_indefinite };
        }

        static decode_error unexpected_end_of_payload()
        {
            return { error_kind::unexpected_end_of_payload };
        }

        static decode_error unexpected_major_for_map_key(const uint64_t major)
        {
            return { error_kind::unexpected_major_for_map_key, major };
        }

        static decode_error max_depth_exceeded(const uint64_t limit)
        {
            return { error_kind::max_depth_exceeded, limit };
        }

        static decode_error nested(const decode_error &cause)
        {
            return decode_error { std::make_shared<const decode_error>(cause) };
        }

        error_kind kind() const noexcept
        {
            return _kind;
        }

        // the length, minor value, major type, float width or depth limit depending on the kind
        uint64_t detail() const noexcept
        {
            return _detail;
        }

        const decode_error *cause() const noexcept
        {
            return _cause.get();
        }

        const decode_error &root() const noexcept
        {
            const decode_error *e = this;
            while (e->_cause)
                e = e->_cause.get();
            return *e;
        }
    private:
        error_kind _kind;
        uint64_t _detail = 0;
        std::shared_ptr<const decode_error> _cause {};

        static std::string _make_message(error_kind kind, uint64_t detail, const decode_error *cause);

        decode_error(const error_kind kind, const uint64_t detail=0):
            error { std::string_view { _make_message(kind, detail, nullptr) } },
            _kind { kind }, _detail { detail }
        {
        }

        explicit decode_error(std::shared_ptr<const decode_error> &&cause):
            error { std::string_view { _make_message(error_kind::nested, 0, cause.get()) } },
            _kind { error_kind::nested }, _cause { std::move(cause) }
        {
        }
    };
}

namespace fmt {
    template<>
    struct formatter<cobalt::cbor::error_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using cobalt::cbor::error_kind;
            switch (v) {
                case error_kind::argument_too_short: return fmt::format_to(ctx.out(), "argument_too_short");
                case error_kind::invalid_minor_value: return fmt::format_to(ctx.out(), "invalid_minor_value");
                case error_kind::incomplete_float: return fmt::format_to(ctx.out(), "incomplete_float");
                case error_kind::content_too_short: return fmt::format_to(ctx.out(), "content_too_short");
                case error_kind::expected_break_marker: return fmt::format_to(ctx.out(), "expected_break_marker");
                case error_kind::unexpected_major_in_indefinite: return fmt::format_to(ctx.out(), "unexpected_major_in_indefinite");
                case error_kind::nested_indefinite: return fmt::format_to(ctx.out(), "nested_indefinite");
                case error_kind::unexpected_end_of_payload: return fmt::format_to(ctx.out(), "unexpected_end_of_payload");
                case error_kind::unexpected_major_for_map_key: return fmt::format_to(ctx.out(), "unexpected_major_for_map_key");
                case error_kind::nested: return fmt::format_to(ctx.out(), "nested");
                case error_kind::max_depth_exceeded: return fmt::format_to(ctx.out(), "max_depth_exceeded");
                default: return fmt::format_to(ctx.out(), "unsupported error_kind: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !COBALT_CBOR_ERROR_HPP
