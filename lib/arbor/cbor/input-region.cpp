/* This file is part of Arbor project: https://github.com/sierkov/arbor/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/arbor/blob/main/LICENSE */

#include <algorithm>
#include <cstring>
#include <arbor/cbor/error.hpp>
#include <arbor/cbor/input-region.hpp>

namespace arbor::cbor {
    input_region::input_region(const size_t capacity):
        _heap(std::max(capacity, min_capacity))
    {
    }

    buffer input_region::load(const buffer input)
    {
        if (input.size() > _heap.size())
            throw capacity_error(input.size(), _heap.size());
        if (!input.empty())
            memcpy(_heap.data(), input.data(), input.size());
        _size = input.size();
        return data();
    }

    buffer input_region::slice(const size_t start, const size_t end) const
    {
        const size_t sz = end + 1 - start;
        if (start > _size || sz > _size - start) [[unlikely]]
            throw error("the byte range [{}, {}] is outside of the loaded data of {} bytes", start, end, _size);
        return { _heap.data() + start, sz };
    }

    std::string input_region::text(const size_t start, const size_t end) const
    {
        const auto bytes = slice(start, end);
        return { reinterpret_cast<const char *>(bytes.data()), bytes.size() };
    }
}
