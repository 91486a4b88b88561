/* This file is part of Arbor project: https://github.com/sierkov/arbor/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/arbor/blob/main/LICENSE */
#ifndef ARBOR_CBOR_INPUT_REGION_HPP
#define ARBOR_CBOR_INPUT_REGION_HPP

#include <cstddef>
#include <string>
#include <arbor/common/bytes.hpp>

namespace arbor::cbor {
    // A fixed-capacity byte region owned by a single decoder and reused by its every call.
    struct input_region {
        static constexpr size_t min_capacity = 0x10000;

        explicit input_region(size_t capacity=min_capacity);

        // Copies the input at the start of the region and returns the view of the copy.
        buffer load(buffer input);

        // An inclusive byte range [start, end]; an empty range has end + 1 == start.
        buffer slice(size_t start, size_t end) const;
        std::string text(size_t start, size_t end) const;

        buffer data() const noexcept
        {
            return { _heap.data(), _size };
        }

        size_t size() const noexcept
        {
            return _size;
        }

        size_t capacity() const noexcept
        {
            return _heap.size();
        }
    private:
        uint8_vector _heap;
        size_t _size = 0;
    };
}

#endif // !ARBOR_CBOR_INPUT_REGION_HPP
