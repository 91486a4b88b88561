/* This file is part of Arbor project: https://github.com/sierkov/arbor/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/arbor/blob/main/LICENSE */

#include <boost/stacktrace.hpp>
#include "error.hpp"

namespace arbor {
    base_error::base_error(const std::string_view msg):
        _msg { msg }
    {
        // skips the frames of safe_dump_to and of the error constructors
        boost::stacktrace::safe_dump_to(3, _trace.data(), _trace.size());
    }

    const char *base_error::what() const noexcept
    {
        return _msg.c_str();
    }

    std::string base_error::stacktrace() const
    {
        return boost::stacktrace::to_string(boost::stacktrace::stacktrace::from_dump(_trace.data(), _trace.size()));
    }

    error::error(const std::string_view msg):
        base_error { msg }
    {
    }
}
