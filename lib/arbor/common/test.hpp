/* This file is part of Arbor project: https://github.com/sierkov/arbor/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/arbor/blob/main/LICENSE */
#ifndef ARBOR_COMMON_TEST_HPP
#define ARBOR_COMMON_TEST_HPP

#include <cmath>
#include <iostream>
#include <optional>
#include <source_location>
#include <utility>
#define BOOST_UT_DISABLE_MODULE 1
#include <boost/ut.hpp>
#include "bytes.hpp"

namespace arbor {
    using namespace boost::ut;

    struct test_printer: boost::ut::printer {
        template<class T>
        test_printer& operator<<(T &&t) {
            if constexpr (std::is_convertible_v<T, std::span<const uint8_t>>) {
                std::cerr << fmt::format("{}", buffer { std::span<const uint8_t> { t } });
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

    template<typename X, typename Y>
        requires (!std::is_same_v<X, Y>)
    bool test_same(const X &x, const Y &y, const std::source_location &loc=std::source_location::current())
    {
        const auto res = x == static_cast<X>(y);
        expect(res, loc) << fmt::format("{} != {}", x, y);
        return res;
    }

    template<typename F>
    void expect_throws_msg(const F &f, const std::string_view match, const std::source_location &loc=std::source_location::current())
    {
        std::optional<std::string> msg {};
        try {
            f();
        } catch (const std::exception &ex) {
            msg.emplace(ex.what());
        }
        expect(static_cast<bool>(msg), loc) << "no exception has been thrown";
        if (msg)
            expect(msg->find(match) != std::string::npos, loc) << fmt::format("'{}' does not contain '{}'", *msg, match);
    }
}

namespace fmt {
    template<typename X, typename Y>
    struct formatter<std::pair<X, Y>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "({}, {})", v.first, v.second);
        }
    };
}

template <class... Ts>
inline auto boost::ut::cfg<boost::ut::override, Ts...> = boost::ut::runner<boost::ut::reporter<arbor::test_printer>> {};

#endif // !ARBOR_COMMON_TEST_HPP
