/* This file is part of Arbor project: https://github.com/sierkov/arbor/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/arbor/blob/main/LICENSE */
#ifndef ARBOR_CBOR_EVENT_HPP
#define ARBOR_CBOR_EVENT_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

/*
 * The vocabulary of primitive events produced by cbor::scanner.
 * Arguments that do not fit into 16 bits are delivered as big-endian 16-bit fragments
 * and are reassembled by the consumer with the helpers from numeric.hpp.
 * String events refer to inclusive [start, end] byte offsets within the scanned region,
 * an empty string has end + 1 == start.
 */

namespace arbor::cbor::ev {
    struct int_small {
        int32_t val;
    };

    struct int32 {
        uint16_t hi, lo;
    };

    struct int32_neg {
        uint16_t hi, lo;
    };

    struct int64 {
        uint16_t f1, f2, g1, g2;
    };

    struct int64_neg {
        uint16_t f1, f2, g1, g2;
    };

    // half-precision floats are converted by the scanner
    struct float_val {
        double val;
    };

    struct float_single {
        std::array<uint8_t, 4> bytes;
    };

    struct float_double {
        std::array<uint8_t, 8> bytes;
    };

    struct true_val {};
    struct false_val {};
    struct null_val {};
    struct undefined_val {};
    struct infinity {};
    struct infinity_neg {};
    struct nan {};
    struct nan_neg {};

    struct array_start {
        uint32_t len;
    };

    struct array_start32 {
        uint16_t hi, lo;
    };

    struct array_start64 {
        uint16_t f1, f2, g1, g2;
    };

    struct array_start_indefinite {};

    struct object_start {
        uint32_t len;
    };

    struct object_start32 {
        uint16_t hi, lo;
    };

    struct object_start64 {
        uint16_t f1, f2, g1, g2;
    };

    struct object_start_indefinite {};

    struct tag_start {
        uint32_t id;
    };

    struct tag_start32 {
        uint16_t hi, lo;
    };

    struct tag_start64 {
        uint16_t f1, f2, g1, g2;
    };

    struct range {
        size_t start, end;
    };

    struct byte_string: range {};
    struct utf8_string: range {};

    struct byte_string_chunked {
        std::vector<range> chunks;
    };

    struct utf8_string_chunked {
        std::vector<range> chunks;
    };

    // the end of an indefinite-length array or map
    struct break_mark {};
}

namespace arbor::cbor {
    using event = std::variant<
        ev::int_small, ev::int32, ev::int32_neg, ev::int64, ev::int64_neg,
        ev::float_val, ev::float_single, ev::float_double,
        ev::true_val, ev::false_val, ev::null_val, ev::undefined_val,
        ev::infinity, ev::infinity_neg, ev::nan, ev::nan_neg,
        ev::array_start, ev::array_start32, ev::array_start64, ev::array_start_indefinite,
        ev::object_start, ev::object_start32, ev::object_start64, ev::object_start_indefinite,
        ev::tag_start, ev::tag_start32, ev::tag_start64,
        ev::byte_string, ev::utf8_string, ev::byte_string_chunked, ev::utf8_string_chunked,
        ev::break_mark
    >;
}

#endif // !ARBOR_CBOR_EVENT_HPP
