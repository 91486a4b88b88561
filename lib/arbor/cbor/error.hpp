/* This file is part of Arbor project: https://github.com/sierkov/arbor/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/arbor/blob/main/LICENSE */
#ifndef ARBOR_CBOR_ERROR_HPP
#define ARBOR_CBOR_ERROR_HPP

#include <cstddef>
#include <cstdint>
#include <arbor/common/error.hpp>

namespace arbor::cbor {
    enum class scan_status: uint8_t {
        ok = 0,
        truncated = 1,
        invalid_additional_info = 2,
        invalid_indefinite = 3,
        invalid_chunk = 4,
        invalid_simple = 5
    };
}

namespace fmt {
    template<>
    struct formatter<arbor::cbor::scan_status>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using arbor::cbor::scan_status;
            switch (v) {
                case scan_status::ok: return fmt::format_to(ctx.out(), "ok");
                case scan_status::truncated: return fmt::format_to(ctx.out(), "truncated");
                case scan_status::invalid_additional_info: return fmt::format_to(ctx.out(), "invalid_additional_info");
                case scan_status::invalid_indefinite: return fmt::format_to(ctx.out(), "invalid_indefinite");
                case scan_status::invalid_chunk: return fmt::format_to(ctx.out(), "invalid_chunk");
                case scan_status::invalid_simple: return fmt::format_to(ctx.out(), "invalid_simple");
                default: return fmt::format_to(ctx.out(), "scan_status: {}", static_cast<int>(v));
            }
        }
    };
}

namespace arbor::cbor {
    struct scan_error: error {
        scan_error(const scan_status status, const size_t offset):
            error { "failed to scan cbor data: {} at byte {}", status, offset },
            _status { status }, _offset { offset }
        {
        }

        scan_status status() const noexcept
        {
            return _status;
        }

        size_t offset() const noexcept
        {
            return _offset;
        }
    private:
        scan_status _status;
        size_t _offset;
    };

    struct protocol_error: error {
        using error::error;
    };

    struct truncated_error: error {
        explicit truncated_error(const size_t depth):
            error { "cbor data ended with {} unfinished containers", depth }
        {
        }
    };

    struct capacity_error: error {
        capacity_error(const size_t size, const size_t capacity):
            error { "input of {} bytes exceeds the decoder capacity of {} bytes", size, capacity }
        {
        }
    };

    struct encoding_error: error {
        using error::error;
    };

    struct depth_error: error {
        explicit depth_error(const size_t max_depth):
            error { "the cbor structure has more than {} levels!", max_depth }
        {
        }
    };

    struct collection_too_big_error: error {
        collection_too_big_error(const uint64_t size, const size_t max_size):
            error { "trying to create an array or map of {} items while the limit is {}", size, max_size }
        {
        }
    };
}

#endif // !ARBOR_CBOR_ERROR_HPP
