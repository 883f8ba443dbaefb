/* This file is part of Cobalt, derived from Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef COBALT_COMMON_ERROR_HPP
#define COBALT_COMMON_ERROR_HPP

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <fmt/core.h>

namespace cobalt {
    struct base_error: std::exception {
        static constexpr size_t stacktrace_depth = 0x20;

        explicit base_error(std::string_view msg);
        const char *what() const noexcept override;
    private:
        std::string _msg;
        std::array<std::byte, sizeof(void*) * stacktrace_depth> _trace {};
    };

    struct error: base_error {
        explicit error(std::string_view msg);
        explicit error(std::string_view msg, const std::exception &ex);

        template<typename... Args>
        explicit error(fmt::format_string<Args...> fmt, Args&&... a):
            error { std::string_view { fmt::format(fmt, std::forward<Args>(a)...) } }
        {
        }
    };

    struct error_sys: error {
        explicit error_sys(std::string_view msg);
    };
}

#endif // !COBALT_COMMON_ERROR_HPP
