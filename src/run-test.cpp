/* This file is part of Arbor project: https://github.com/sierkov/arbor/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/arbor/blob/main/LICENSE */

#ifdef ARBOR_BENCHMARK
#   define ANKERL_NANOBENCH_IMPLEMENT
#   include <nanobench.h>
#endif

#include <iostream>
#include <arbor/common/test.hpp>
#include <arbor/logger.hpp>

int main(const int argc, const char **argv)
{
    using namespace arbor;
    if (argc >= 2) {
        std::cerr << "using test-filter mask: " << argv[1] << '\n';
        boost::ut::cfg<boost::ut::override> = { .filter = argv[1] };
    }
    const bool failed = boost::ut::cfg<boost::ut::override>.run();
    logger::info("run-test finished with {}", failed ? "failures" : "success");
    return failed ? 1 : 0;
}
