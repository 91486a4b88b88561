/* This file is part of Arbor project: https://github.com/sierkov/arbor/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/arbor/blob/main/LICENSE */
#ifndef ARBOR_BIG_INT_HPP
#define ARBOR_BIG_INT_HPP

#include <sstream>
#define BOOST_DETAIL_EMPTY_VALUE_BASE
#include <boost/multiprecision/cpp_int.hpp>
#include <fmt/format.h>

namespace arbor {
    using boost::multiprecision::cpp_int;
}

namespace fmt {
    template<typename T>
    struct formatter<boost::multiprecision::number<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            std::ostringstream ss {};
            ss << v;
            return fmt::format_to(ctx.out(), "{}", ss.str());
        }
    };
}

#endif // !ARBOR_BIG_INT_HPP
