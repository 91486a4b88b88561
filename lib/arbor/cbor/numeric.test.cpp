/* This file is part of Arbor project: https://github.com/sierkov/arbor/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/arbor/blob/main/LICENSE */

#include <bit>
#include <arbor/common/test.hpp>
#include <arbor/cbor/numeric.hpp>

using namespace arbor;
using namespace arbor::cbor;

suite cbor_numeric_suite = [] {
    "cbor::numeric"_test = [] {
        "combine"_test = [] {
            static_assert(numeric::combine32(0x0001, 0x0002) == 0x00010002U);
            static_assert(numeric::combine32(0xFFFF, 0xFFFF) == 0xFFFFFFFFU);
            static_assert(numeric::combine64(0x0102, 0x0304, 0x0506, 0x0708) == 0x0102030405060708ULL);
            static_assert(numeric::build_nint32(0, 0) == -1);
            test_same(numeric::build_nint32(0xFFFF, 0xFFFF), -4294967296LL);
            test_same(numeric::build_nint32(0x0001, 0x0000), -65537LL);
        };
        "int64 safe range"_test = [] {
            test_same(numeric::build_int64(0, 0, 0, 0), value { int64_t { 0 } });
            test_same(numeric::build_int64(0, 1, 0, 0), value { int64_t { 0x100000000LL } });
            // 2^53 - 1 is the largest value that a double represents exactly
            test_same(numeric::build_int64(0x001F, 0xFFFF, 0xFFFF, 0xFFFF), value { int64_t { 9007199254740991LL } });
        };
        "int64 above the safe range"_test = [] {
            const auto v = numeric::build_int64(0x0020, 0x0000, 0x0000, 0x0000);
            test_same(v.type(), value_type::big_integer);
            test_same(v.as_big_int(), big_int { 9007199254740992LL });
            const auto max = numeric::build_int64(0xFFFF, 0xFFFF, 0xFFFF, 0xFFFF);
            test_same(max.as_big_int(), big_int { "18446744073709551615" });
        };
        "nint64"_test = [] {
            test_same(numeric::build_nint64(0, 0, 0, 0), value { int64_t { -1 } });
            test_same(numeric::build_nint64(0x001F, 0xFFFF, 0xFFFF, 0xFFFF), value { int64_t { -9007199254740992LL } });
            const auto big = numeric::build_nint64(0x0020, 0x0000, 0x0000, 0x0000);
            test_same(big.type(), value_type::big_integer);
            test_same(big.as_big_int(), big_int { -9007199254740993LL });
            const auto min = numeric::build_nint64(0xFFFF, 0xFFFF, 0xFFFF, 0xFFFF);
            test_same(min.as_big_int(), big_int { "-18446744073709551616" });
        };
        "half"_test = [] {
            test_same(numeric::decode_half(0x0000), 0.0);
            expect(std::signbit(numeric::decode_half(0x8000)));
            test_same(numeric::decode_half(0x3C00), 1.0);
            test_same(numeric::decode_half(0x3E00), 1.5);
            test_same(numeric::decode_half(0xC400), -4.0);
            test_same(numeric::decode_half(0x7BFF), 65504.0);
            test_same(numeric::decode_half(0x0001), 5.9604644775390625e-8);
            test_same(numeric::decode_half(0x0400), 0.00006103515625);
            expect(std::isinf(numeric::decode_half(0x7C00)) && numeric::decode_half(0x7C00) > 0);
            expect(std::isinf(numeric::decode_half(0xFC00)) && numeric::decode_half(0xFC00) < 0);
            expect(std::isnan(numeric::decode_half(0x7E00)) && !std::signbit(numeric::decode_half(0x7E00)));
            expect(std::isnan(numeric::decode_half(0xFE00)) && std::signbit(numeric::decode_half(0xFE00)));
        };
        "single"_test = [] {
            test_same(numeric::decode_single(std::array<uint8_t, 4> { 0x47, 0xC3, 0x50, 0x00 }), 100000.0);
            test_same(numeric::decode_single(std::array<uint8_t, 4> { 0x7F, 0x7F, 0xFF, 0xFF }), 3.4028234663852886e+38);
            expect(std::isnan(numeric::decode_single(std::array<uint8_t, 4> { 0x7F, 0xC0, 0x00, 0x00 })));
            expect(std::signbit(numeric::decode_single(std::array<uint8_t, 4> { 0xFF, 0xC0, 0x00, 0x00 })));
        };
        "single nan payloads"_test = [] {
            const auto signaling = std::bit_cast<uint64_t>(numeric::decode_single(std::array<uint8_t, 4> { 0x7F, 0x80, 0x00, 0x01 }));
            test_same(signaling, 0x7FF0000020000000ULL);
            const auto quiet_neg = std::bit_cast<uint64_t>(numeric::decode_single(std::array<uint8_t, 4> { 0xFF, 0xC0, 0x12, 0x34 }));
            test_same(quiet_neg, 0xFFF8024680000000ULL);
            const auto inf = std::bit_cast<uint64_t>(numeric::decode_single(std::array<uint8_t, 4> { 0xFF, 0x80, 0x00, 0x00 }));
            test_same(inf, 0xFFF0000000000000ULL);
        };
        "double"_test = [] {
            test_same(numeric::decode_double(std::array<uint8_t, 8> { 0x3F, 0xF1, 0x99, 0x99, 0x99, 0x99, 0x99, 0x9A }), 1.1);
            test_same(numeric::decode_double(std::array<uint8_t, 8> { 0xC0, 0x10, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66 }), -4.1);
            test_same(numeric::decode_double(std::array<uint8_t, 8> { 0x7E, 0x37, 0xE4, 0x3C, 0x88, 0x00, 0x75, 0x9C }), 1.0e+300);
        };
    };
};
