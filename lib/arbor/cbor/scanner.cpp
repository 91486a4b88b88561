/* This file is part of Arbor project: https://github.com/sierkov/arbor/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/arbor/blob/main/LICENSE */

#include <algorithm>
#include <arbor/cbor/numeric.hpp>
#include <arbor/cbor/scanner.hpp>

namespace arbor::cbor {
    // values of the low five bits of an item's first byte
    namespace info {
        static constexpr uint8_t simple_false = 20;
        static constexpr uint8_t simple_true = 21;
        static constexpr uint8_t simple_null = 22;
        static constexpr uint8_t simple_undefined = 23;
        static constexpr uint8_t arg_1byte = 24;
        static constexpr uint8_t arg_2bytes = 25;
        static constexpr uint8_t arg_4bytes = 26;
        static constexpr uint8_t arg_8bytes = 27;
        static constexpr uint8_t indefinite = 31;
        static constexpr uint8_t break_byte = 0xFF;
    }

    static uint16_t frag16(const uint64_t v, const size_t idx) noexcept
    {
        return static_cast<uint16_t>(v >> (idx * 16));
    }

    std::optional<event> scanner::next()
    {
        if (_offset >= _data.size())
            return {};
        const size_t start = _offset;
        const auto h = _read_header();
        switch (h.major) {
            case major_type::uint:
                if (h.indefinite) [[unlikely]]
                    throw scan_error(scan_status::invalid_indefinite, start);
                switch (h.width) {
                    case 4: return ev::int32 { frag16(h.arg, 1), frag16(h.arg, 0) };
                    case 8: return ev::int64 { frag16(h.arg, 3), frag16(h.arg, 2), frag16(h.arg, 1), frag16(h.arg, 0) };
                    default: return ev::int_small { static_cast<int32_t>(h.arg) };
                }
            case major_type::nint:
                if (h.indefinite) [[unlikely]]
                    throw scan_error(scan_status::invalid_indefinite, start);
                switch (h.width) {
                    case 4: return ev::int32_neg { frag16(h.arg, 1), frag16(h.arg, 0) };
                    case 8: return ev::int64_neg { frag16(h.arg, 3), frag16(h.arg, 2), frag16(h.arg, 1), frag16(h.arg, 0) };
                    default: return ev::int_small { -1 - static_cast<int32_t>(h.arg) };
                }
            case major_type::bytes:
                if (h.indefinite)
                    return ev::byte_string_chunked { _read_chunks(h.major, start) };
                return ev::byte_string { _read_payload(start, h.arg) };
            case major_type::text:
                if (h.indefinite)
                    return ev::utf8_string_chunked { _read_chunks(h.major, start) };
                return ev::utf8_string { _read_payload(start, h.arg) };
            case major_type::array:
                if (h.indefinite)
                    return ev::array_start_indefinite {};
                switch (h.width) {
                    case 4: return ev::array_start32 { frag16(h.arg, 1), frag16(h.arg, 0) };
                    case 8: return ev::array_start64 { frag16(h.arg, 3), frag16(h.arg, 2), frag16(h.arg, 1), frag16(h.arg, 0) };
                    default: return ev::array_start { static_cast<uint32_t>(h.arg) };
                }
            case major_type::map:
                if (h.indefinite)
                    return ev::object_start_indefinite {};
                switch (h.width) {
                    case 4: return ev::object_start32 { frag16(h.arg, 1), frag16(h.arg, 0) };
                    case 8: return ev::object_start64 { frag16(h.arg, 3), frag16(h.arg, 2), frag16(h.arg, 1), frag16(h.arg, 0) };
                    default: return ev::object_start { static_cast<uint32_t>(h.arg) };
                }
            case major_type::tag:
                if (h.indefinite) [[unlikely]]
                    throw scan_error(scan_status::invalid_indefinite, start);
                switch (h.width) {
                    case 4: return ev::tag_start32 { frag16(h.arg, 1), frag16(h.arg, 0) };
                    case 8: return ev::tag_start64 { frag16(h.arg, 3), frag16(h.arg, 2), frag16(h.arg, 1), frag16(h.arg, 0) };
                    default: return ev::tag_start { static_cast<uint32_t>(h.arg) };
                }
            default:
                return _simple(h, start);
        }
    }

    scanner::header scanner::_read_header()
    {
        const size_t start = _offset;
        const uint8_t first = _data[start];
        header h { static_cast<major_type>(first >> 5), static_cast<uint8_t>(first & 0x1F), 0, 0, false };
        if (h.info < info::arg_1byte) {
            h.arg = h.info;
        } else if (h.info <= info::arg_8bytes) {
            h.width = size_t { 1 } << (h.info - info::arg_1byte);
        } else if (h.info == info::indefinite) {
            h.indefinite = true;
        } else [[unlikely]] {
            throw scan_error(scan_status::invalid_additional_info, start);
        }
        if (h.width > _data.size() - start - 1) [[unlikely]]
            throw scan_error(scan_status::truncated, start);
        for (size_t i = 0; i < h.width; ++i)
            h.arg = (h.arg << 8) | _data[start + 1 + i];
        _offset = start + 1 + h.width;
        return h;
    }

    ev::range scanner::_read_payload(const size_t item_start, const uint64_t len)
    {
        if (len > _data.size() - _offset) [[unlikely]]
            throw scan_error(scan_status::truncated, item_start);
        const size_t sz = static_cast<size_t>(len);
        // an empty payload yields end + 1 == start
        const ev::range r { _offset, _offset + sz - 1 };
        _offset += sz;
        return r;
    }

    std::vector<ev::range> scanner::_read_chunks(const major_type major, const size_t item_start)
    {
        std::vector<ev::range> chunks {};
        for (;;) {
            if (_offset >= _data.size()) [[unlikely]]
                throw scan_error(scan_status::truncated, item_start);
            if (_data[_offset] == info::break_byte) {
                ++_offset;
                return chunks;
            }
            const size_t chunk_start = _offset;
            const auto h = _read_header();
            if (h.major != major || h.indefinite) [[unlikely]]
                throw scan_error(scan_status::invalid_chunk, chunk_start);
            chunks.emplace_back(_read_payload(chunk_start, h.arg));
        }
    }

    event scanner::_simple(const header &h, const size_t item_start)
    {
        if (h.indefinite)
            return ev::break_mark {};
        switch (h.info) {
            case info::simple_false: return ev::false_val {};
            case info::simple_true: return ev::true_val {};
            case info::simple_null: return ev::null_val {};
            case info::simple_undefined: return ev::undefined_val {};
            case info::arg_2bytes:
                switch (h.arg) {
                    case 0x7C00: return ev::infinity {};
                    case 0xFC00: return ev::infinity_neg {};
                    case 0x7E00: return ev::nan {};
                    case 0xFE00: return ev::nan_neg {};
                    default: return ev::float_val { numeric::decode_half(static_cast<uint16_t>(h.arg)) };
                }
            case info::arg_4bytes: {
                ev::float_single e {};
                std::copy_n(_data.data() + item_start + 1, e.bytes.size(), e.bytes.begin());
                return e;
            }
            case info::arg_8bytes: {
                ev::float_double e {};
                std::copy_n(_data.data() + item_start + 1, e.bytes.size(), e.bytes.begin());
                return e;
            }
            default:
                throw scan_error(scan_status::invalid_simple, item_start);
        }
    }
}
