/* This file is part of Cobalt, derived from Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef COBALT_COMMON_TEST_HPP
#define COBALT_COMMON_TEST_HPP

#include <iostream>
#include <optional>
#include <source_location>
#define BOOST_UT_DISABLE_MODULE 1
#include <boost/ut.hpp>
#include "bytes.hpp"
#include "format.hpp"

namespace cobalt {
    using namespace boost::ut;

    struct test_printer: boost::ut::printer {
        template<class T>
        test_printer& operator<<(T &&t) {
            if constexpr (std::is_convertible_v<T, std::span<const uint8_t>>) {
                std::cerr << fmt::format("{}", buffer { t });
            } else {
                std::cerr << std::forward<T>(t);
            }
            return *this;
        }

        test_printer& operator<<(const std::string_view sv) {
            std::cerr << sv;
            return *this;
        }
    };

    template<typename T>
    bool test_same(const T &x, const T &y, const std::source_location &loc=std::source_location::current())
    {
        const auto res = x == y;
        expect(res, loc) << fmt::format("{} != {}", x, y);
        return res;
    }

    template<typename T, typename Y>
    bool test_same(const std::string &name, const T &x, const Y &y, const std::source_location &loc=std::source_location::current())
    {
        const auto res = x == static_cast<T>(y);
        expect(res, loc) << fmt::format("{}: {} != {}", name, x, y);
        return res;
    }

    template<typename E, typename F>
    void expect_throws_msg(const F &f, const std::string &match, const std::source_location &src_loc=std::source_location::current())
    {
        std::optional<std::string> msg {};
        try {
            f();
        } catch (const E &ex) {
            msg = ex.what();
        }
        expect(static_cast<bool>(msg), src_loc) << "no exception has been thrown";
        if (msg)
            expect(msg->find(match) != msg->npos, src_loc) << fmt::format("'{}' does not contain '{}'", *msg, match);
    }
}

template <class... Ts>
inline auto boost::ut::cfg<boost::ut::override, Ts...> = boost::ut::runner<boost::ut::reporter<cobalt::test_printer>> {};

#endif // !COBALT_COMMON_TEST_HPP
