/* This file is part of Arbor project: https://github.com/sierkov/arbor/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/arbor/blob/main/LICENSE */
#ifndef ARBOR_CBOR_BUILDER_HPP
#define ARBOR_CBOR_BUILDER_HPP

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <arbor/config.hpp>
#include <arbor/cbor/error.hpp>
#include <arbor/cbor/value.hpp>

namespace arbor::cbor {
    enum class frame_kind: uint8_t {
        array, object, map, tag
    };

    // An open container awaiting its children.
    // container points to a value owned by the parent container or by the root sequence.
    struct frame {
        static constexpr int64_t indefinite = -1;

        frame_kind kind;
        int64_t remaining;
        value *container;
        std::optional<value> pending_key {};
    };

    /*
     * Reconstructs a value tree from a depth-first sequence of leaves and container headers.
     * A container is first pushed into its parent as a regular value and only then gets
     * a frame of its own, so closing a frame never touches the parent's counter.
     * The root frame is an array of unknown length collecting the top-level items.
     * A moved-from builder is left empty and ready for reuse.
     */
    struct builder {
        explicit builder(const decoder_config &cfg={});
        builder(const builder &) =delete;
        builder(builder &&o);
        builder &operator=(const builder &) =delete;
        builder &operator=(builder &&o);

        // An empty length means an indefinite-length container.
        void open_container(frame_kind kind, std::optional<uint64_t> declared_length);
        void open_tag(uint64_t id);
        void push_leaf(value &&v);
        void close_indefinite();
        array finish();
        void reset();

        size_t depth() const noexcept
        {
            return _frames.size();
        }
    private:
        size_t _max_depth;
        size_t _max_collection_size;
        value _root { array {} };
        std::deque<frame> _frames {};

        value &_push(value &&v);
        void _check_depth() const;
        static void _promote(frame &f);
    };
}

namespace fmt {
    template<>
    struct formatter<arbor::cbor::frame_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using arbor::cbor::frame_kind;
            switch (v) {
                case frame_kind::array: return fmt::format_to(ctx.out(), "array");
                case frame_kind::object: return fmt::format_to(ctx.out(), "object");
                case frame_kind::map: return fmt::format_to(ctx.out(), "map");
                case frame_kind::tag: return fmt::format_to(ctx.out(), "tag");
                default: return fmt::format_to(ctx.out(), "frame_kind: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !ARBOR_CBOR_BUILDER_HPP
