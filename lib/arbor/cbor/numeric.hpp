/* This file is part of Arbor project: https://github.com/sierkov/arbor/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/arbor/blob/main/LICENSE */
#ifndef ARBOR_CBOR_NUMERIC_HPP
#define ARBOR_CBOR_NUMERIC_HPP

#include <bit>
#include <cmath>
#include <cstdint>
#include <limits>
#include <span>
#include <arbor/cbor/value.hpp>

namespace arbor::cbor::numeric {
    // The largest high 32-bit word of a 64-bit integer that keeps the full value within
    // the 53-bit mantissa of an IEEE-754 double.
    static constexpr uint32_t max_safe_high = 0x1FFFFF;
    static constexpr uint64_t shift32 = 0x1'0000'0000ULL;

    constexpr uint32_t combine32(const uint16_t hi, const uint16_t lo) noexcept
    {
        return (static_cast<uint32_t>(hi) << 16) | lo;
    }

    constexpr uint64_t combine64(const uint16_t f1, const uint16_t f2, const uint16_t g1, const uint16_t g2) noexcept
    {
        return (static_cast<uint64_t>(combine32(f1, f2)) << 32) | combine32(g1, g2);
    }

    inline value build_int64(const uint16_t f1, const uint16_t f2, const uint16_t g1, const uint16_t g2)
    {
        const uint32_t f = combine32(f1, f2);
        const uint32_t g = combine32(g1, g2);
        if (f > max_safe_high) {
            big_int res { f };
            res *= shift32;
            res += g;
            return { std::move(res) };
        }
        return { static_cast<int64_t>(f * shift32 + g) };
    }

    constexpr int64_t build_nint32(const uint16_t hi, const uint16_t lo) noexcept
    {
        return -1 - static_cast<int64_t>(combine32(hi, lo));
    }

    inline value build_nint64(const uint16_t f1, const uint16_t f2, const uint16_t g1, const uint16_t g2)
    {
        const uint32_t f = combine32(f1, f2);
        const uint32_t g = combine32(g1, g2);
        if (f > max_safe_high) {
            big_int mag { f };
            mag *= shift32;
            mag += g;
            big_int res { -1 };
            res -= mag;
            return { std::move(res) };
        }
        return { -1 - static_cast<int64_t>(f * shift32 + g) };
    }

    inline double decode_half(const uint16_t raw) noexcept
    {
        const bool negative = raw & 0x8000;
        const int exp = (raw >> 10) & 0x1F;
        const int mant = raw & 0x3FF;
        double val;
        if (exp == 0) {
            val = std::ldexp(mant, -24);
        } else if (exp != 31) {
            val = std::ldexp(mant + 1024, exp - 25);
        } else if (mant == 0) {
            val = std::numeric_limits<double>::infinity();
        } else {
            val = std::numeric_limits<double>::quiet_NaN();
        }
        return std::copysign(val, negative ? -1.0 : 1.0);
    }

    inline double decode_single(const std::span<const uint8_t, 4> bytes) noexcept
    {
        const uint32_t bits = (static_cast<uint32_t>(bytes[0]) << 24) | (static_cast<uint32_t>(bytes[1]) << 16)
            | (static_cast<uint32_t>(bytes[2]) << 8) | bytes[3];
        // NaN payloads are widened by hand: a float to double conversion may quiet a signaling NaN
        if ((bits & 0x7F800000U) == 0x7F800000U && (bits & 0x007FFFFFU) != 0) {
            const uint64_t wide = (static_cast<uint64_t>(bits & 0x80000000U) << 32) | 0x7FF0000000000000ULL
                | (static_cast<uint64_t>(bits & 0x007FFFFFU) << 29);
            return std::bit_cast<double>(wide);
        }
        return static_cast<double>(std::bit_cast<float>(bits));
    }

    inline double decode_double(const std::span<const uint8_t, 8> bytes) noexcept
    {
        uint64_t bits = 0;
        for (const uint8_t b: bytes)
            bits = (bits << 8) | b;
        return std::bit_cast<double>(bits);
    }
}

#endif // !ARBOR_CBOR_NUMERIC_HPP
