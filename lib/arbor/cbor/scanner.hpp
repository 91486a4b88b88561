/* This file is part of Arbor project: https://github.com/sierkov/arbor/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/arbor/blob/main/LICENSE */
#ifndef ARBOR_CBOR_SCANNER_HPP
#define ARBOR_CBOR_SCANNER_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
#include <arbor/common/bytes.hpp>
#include <arbor/cbor/error.hpp>
#include <arbor/cbor/event.hpp>

namespace arbor::cbor {
    enum class major_type: uint8_t {
        uint, nint, bytes, text, array, map, tag, simple
    };

    /*
     * Walks a contiguous block of CBOR data item by item and reports each item header as an event.
     * The scanner does not track the nesting of containers: an array header is reported as
     * an array_start event and its elements follow as separate events.
     * Malformed data is reported by throwing scan_error with the offset of the offending item.
     */
    struct scanner {
        explicit scanner(const buffer data) noexcept:
            _data { data }
        {
        }

        // Returns an empty optional once all data has been consumed
        std::optional<event> next();

        size_t offset() const noexcept
        {
            return _offset;
        }

        bool done() const noexcept
        {
            return _offset >= _data.size();
        }
    private:
        struct header {
            major_type major;
            uint8_t info;
            uint64_t arg;
            size_t width;
            bool indefinite;
        };

        buffer _data;
        size_t _offset = 0;

        header _read_header();
        ev::range _read_payload(size_t item_start, uint64_t len);
        std::vector<ev::range> _read_chunks(major_type major, size_t item_start);
        event _simple(const header &h, size_t item_start);
    };
}

#endif // !ARBOR_CBOR_SCANNER_HPP
