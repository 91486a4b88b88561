/* This file is part of Arbor project: https://github.com/sierkov/arbor/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/arbor/blob/main/LICENSE */
#ifndef ARBOR_CBOR_EVENT_ADAPTER_HPP
#define ARBOR_CBOR_EVENT_ADAPTER_HPP

#include <cmath>
#include <limits>
#include <string>
#include <utf8.h>
#include <arbor/cbor/builder.hpp>
#include <arbor/cbor/event.hpp>
#include <arbor/cbor/input-region.hpp>
#include <arbor/cbor/numeric.hpp>

namespace arbor::cbor {
    // A visitor for cbor::event translating each event into a single builder operation
    struct event_adapter {
        event_adapter(builder &b, const input_region &region) noexcept:
            _builder { b }, _region { region }
        {
        }

        void operator()(const ev::int_small &e)
        {
            _builder.push_leaf(value { static_cast<int64_t>(e.val) });
        }

        void operator()(const ev::int32 &e)
        {
            _builder.push_leaf(value { static_cast<int64_t>(numeric::combine32(e.hi, e.lo)) });
        }

        void operator()(const ev::int32_neg &e)
        {
            _builder.push_leaf(value { numeric::build_nint32(e.hi, e.lo) });
        }

        void operator()(const ev::int64 &e)
        {
            _builder.push_leaf(numeric::build_int64(e.f1, e.f2, e.g1, e.g2));
        }

        void operator()(const ev::int64_neg &e)
        {
            _builder.push_leaf(numeric::build_nint64(e.f1, e.f2, e.g1, e.g2));
        }

        void operator()(const ev::float_val &e)
        {
            _builder.push_leaf(value { e.val });
        }

        void operator()(const ev::float_single &e)
        {
            _builder.push_leaf(value { numeric::decode_single(e.bytes) });
        }

        void operator()(const ev::float_double &e)
        {
            _builder.push_leaf(value { numeric::decode_double(e.bytes) });
        }

        void operator()(const ev::true_val &)
        {
            _builder.push_leaf(value { true });
        }

        void operator()(const ev::false_val &)
        {
            _builder.push_leaf(value { false });
        }

        void operator()(const ev::null_val &)
        {
            _builder.push_leaf(value { null });
        }

        void operator()(const ev::undefined_val &)
        {
            _builder.push_leaf(value { undefined });
        }

        void operator()(const ev::infinity &)
        {
            _builder.push_leaf(value { std::numeric_limits<double>::infinity() });
        }

        void operator()(const ev::infinity_neg &)
        {
            _builder.push_leaf(value { -std::numeric_limits<double>::infinity() });
        }

        void operator()(const ev::nan &)
        {
            _builder.push_leaf(value { std::numeric_limits<double>::quiet_NaN() });
        }

        void operator()(const ev::nan_neg &)
        {
            _builder.push_leaf(value { std::copysign(std::numeric_limits<double>::quiet_NaN(), -1.0) });
        }

        void operator()(const ev::array_start &e)
        {
            _builder.open_container(frame_kind::array, e.len);
        }

        void operator()(const ev::array_start32 &e)
        {
            _builder.open_container(frame_kind::array, numeric::combine32(e.hi, e.lo));
        }

        void operator()(const ev::array_start64 &e)
        {
            _builder.open_container(frame_kind::array, numeric::combine64(e.f1, e.f2, e.g1, e.g2));
        }

        void operator()(const ev::array_start_indefinite &)
        {
            _builder.open_container(frame_kind::array, {});
        }

        void operator()(const ev::object_start &e)
        {
            _builder.open_container(frame_kind::object, e.len);
        }

        void operator()(const ev::object_start32 &e)
        {
            _builder.open_container(frame_kind::object, numeric::combine32(e.hi, e.lo));
        }

        void operator()(const ev::object_start64 &e)
        {
            _builder.open_container(frame_kind::object, numeric::combine64(e.f1, e.f2, e.g1, e.g2));
        }

        void operator()(const ev::object_start_indefinite &)
        {
            _builder.open_container(frame_kind::object, {});
        }

        void operator()(const ev::tag_start &e)
        {
            _builder.open_tag(e.id);
        }

        void operator()(const ev::tag_start32 &e)
        {
            _builder.open_tag(numeric::combine32(e.hi, e.lo));
        }

        void operator()(const ev::tag_start64 &e)
        {
            _builder.open_tag(numeric::combine64(e.f1, e.f2, e.g1, e.g2));
        }

        void operator()(const ev::byte_string &e)
        {
            _builder.push_leaf(value { uint8_vector { _region.slice(e.start, e.end) } });
        }

        void operator()(const ev::utf8_string &e)
        {
            _builder.push_leaf(value { _text(e) });
        }

        void operator()(const ev::byte_string_chunked &e)
        {
            uint8_vector res {};
            for (const auto &c: e.chunks)
                res << _region.slice(c.start, c.end);
            _builder.push_leaf(value { std::move(res) });
        }

        // each chunk must be valid UTF-8 on its own
        void operator()(const ev::utf8_string_chunked &e)
        {
            std::string res {};
            for (const auto &c: e.chunks)
                res += _text(c);
            _builder.push_leaf(value { std::move(res) });
        }

        void operator()(const ev::break_mark &)
        {
            _builder.close_indefinite();
        }
    private:
        builder &_builder;
        const input_region &_region;

        std::string _text(const ev::range &r) const
        {
            auto s = _region.text(r.start, r.end);
            if (const auto it = utf8::find_invalid(s.begin(), s.end()); it != s.end()) [[unlikely]]
                throw encoding_error("an invalid utf8 sequence at byte {} of a text string at [{}, {}]", it - s.begin(), r.start, r.end);
            return s;
        }
    };
}

#endif // !ARBOR_CBOR_EVENT_ADAPTER_HPP
