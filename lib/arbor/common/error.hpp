/* This file is part of Arbor project: https://github.com/sierkov/arbor/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/arbor/blob/main/LICENSE */
#ifndef ARBOR_COMMON_ERROR_HPP
#define ARBOR_COMMON_ERROR_HPP

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <fmt/format.h>

namespace arbor {
    /*
     * The root of all Arbor exceptions. The call stack at the throw site is captured without
     * allocations and is rendered only on request, so exceptions stay cheap for callers
     * that simply catch and discard them.
     */
    struct base_error: std::exception {
        static constexpr size_t stacktrace_depth = 0x20;

        explicit base_error(std::string_view msg);
        const char *what() const noexcept override;
        std::string stacktrace() const;
    private:
        std::string _msg;
        std::array<std::byte, sizeof(void*) * stacktrace_depth> _trace {};
    };

    struct error: base_error {
        explicit error(std::string_view msg);

        template<typename... Args>
            requires (sizeof...(Args) > 0)
        explicit error(fmt::format_string<Args...> fmt, Args&&... a):
            base_error { fmt::format(fmt, std::forward<Args>(a)...) }
        {
        }
    };
}

#endif // !ARBOR_COMMON_ERROR_HPP
