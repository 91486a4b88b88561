/* This file is part of Arbor project: https://github.com/sierkov/arbor/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/arbor/blob/main/LICENSE */
#ifndef ARBOR_COMMON_BENCHMARK_HPP
#define ARBOR_COMMON_BENCHMARK_HPP

#include <iostream>
#include <nanobench.h>
#include <arbor/common/test.hpp>

#endif // !ARBOR_COMMON_BENCHMARK_HPP
