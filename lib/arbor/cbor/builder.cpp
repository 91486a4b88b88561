/* This file is part of Arbor project: https://github.com/sierkov/arbor/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/arbor/blob/main/LICENSE */

#include <algorithm>
#include <limits>
#include <arbor/cbor/builder.hpp>

namespace arbor::cbor {
    builder::builder(const decoder_config &cfg):
        _max_depth { cfg.max_depth },
        // declared lengths are tracked as int64_t with -1 reserved for indefinite-length frames
        _max_collection_size { std::min(cfg.max_collection_size, static_cast<size_t>(std::numeric_limits<int64_t>::max())) }
    {
        reset();
    }

    builder::builder(builder &&o):
        _max_depth { o._max_depth }, _max_collection_size { o._max_collection_size },
        _root { std::move(o._root) }, _frames { std::move(o._frames) }
    {
        // nested frames point into the heap storage of the root array which moves along
        _frames.front().container = &_root;
        o.reset();
    }

    builder &builder::operator=(builder &&o)
    {
        if (this != &o) {
            _max_depth = o._max_depth;
            _max_collection_size = o._max_collection_size;
            _root = std::move(o._root);
            _frames = std::move(o._frames);
            _frames.front().container = &_root;
            o.reset();
        }
        return *this;
    }

    void builder::reset()
    {
        _frames.clear();
        _root = value { array {} };
        _frames.push_back(frame { frame_kind::array, frame::indefinite, &_root });
    }

    void builder::open_container(const frame_kind kind, const std::optional<uint64_t> declared_length)
    {
        if (declared_length && *declared_length > _max_collection_size) [[unlikely]]
            throw collection_too_big_error(*declared_length, _max_collection_size);
        _check_depth();
        value *stored;
        switch (kind) {
            case frame_kind::array: stored = &_push(value { array {} }); break;
            case frame_kind::object: stored = &_push(value { object {} }); break;
            case frame_kind::map: stored = &_push(value { map {} }); break;
            default: throw protocol_error("open_container does not support {} frames", kind);
        }
        // an empty container is complete the moment it is pushed
        if (declared_length && *declared_length == 0)
            return;
        _frames.push_back(frame { kind, declared_length ? static_cast<int64_t>(*declared_length) : frame::indefinite, stored });
    }

    void builder::open_tag(const uint64_t id)
    {
        _check_depth();
        auto &stored = _push(value { tagged { id } });
        _frames.push_back(frame { frame_kind::tag, 1, &stored });
    }

    void builder::push_leaf(value &&v)
    {
        _push(std::move(v));
    }

    void builder::close_indefinite()
    {
        if (_frames.size() <= 1) [[unlikely]]
            throw protocol_error("a break outside of an indefinite-length container");
        const auto &f = _frames.back();
        if (f.remaining != frame::indefinite) [[unlikely]]
            throw protocol_error("a break inside of a {} with {} items remaining", f.kind, f.remaining);
        if (f.pending_key) [[unlikely]]
            throw protocol_error("a break inside of a {} with a key but no value", f.kind);
        _frames.pop_back();
    }

    array builder::finish()
    {
        if (_frames.size() != 1) [[unlikely]]
            throw truncated_error(_frames.size() - 1);
        auto res = std::move(std::get<array>(_root.content()));
        reset();
        return res;
    }

    value &builder::_push(value &&v)
    {
        if (_frames.empty()) [[unlikely]]
            throw protocol_error("a value pushed with no open container");
        auto &f = _frames.back();
        value *stored;
        switch (f.kind) {
            case frame_kind::array:
                stored = &std::get<array>(f.container->content()).emplace_back(std::move(v));
                break;
            case frame_kind::object:
                if (!f.pending_key) {
                    if (!v.is_text()) {
                        _promote(f);
                        return _push(std::move(v));
                    }
                    return f.pending_key.emplace(std::move(v));
                }
                stored = &std::get<object>(f.container->content()).emplace(
                    std::get<std::string>(std::move(f.pending_key->content())), std::move(v));
                f.pending_key.reset();
                break;
            case frame_kind::map:
                if (!f.pending_key)
                    return f.pending_key.emplace(std::move(v));
                stored = &std::get<map>(f.container->content()).insert_or_assign(std::move(*f.pending_key), std::move(v));
                f.pending_key.reset();
                break;
            case frame_kind::tag: {
                auto &t = std::get<tagged>(f.container->content());
                *t.val = std::move(v);
                stored = t.val.get();
                break;
            }
            default:
                throw protocol_error("unsupported frame kind: {}", static_cast<int>(f.kind));
        }
        if (f.remaining != frame::indefinite && --f.remaining == 0)
            _frames.pop_back();
        return *stored;
    }

    // the root frame does not count as a nesting level
    void builder::_check_depth() const
    {
        if (_frames.size() > _max_depth) [[unlikely]]
            throw depth_error(_max_depth);
    }

    void builder::_promote(frame &f)
    {
        auto entries = std::get<object>(f.container->content()).release();
        map m {};
        m.reserve(entries.size());
        for (auto &[k, v]: entries)
            m.emplace_back(value { std::move(k) }, std::move(v));
        f.container->content() = std::move(m);
        f.kind = frame_kind::map;
    }
}
