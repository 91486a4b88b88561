/* This file is part of Arbor project: https://github.com/sierkov/arbor/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/arbor/blob/main/LICENSE */
#ifndef ARBOR_CBOR_VALUE_HPP
#define ARBOR_CBOR_VALUE_HPP

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>
#include <arbor/big-int.hpp>
#include <arbor/common/bytes.hpp>
#include <arbor/common/error.hpp>

namespace arbor::cbor {
    struct value;

    struct null_t {
        bool operator==(const null_t &) const noexcept =default;
    };

    struct undefined_t {
        bool operator==(const undefined_t &) const noexcept =default;
    };

    static constexpr null_t null {};
    static constexpr undefined_t undefined {};

    using big_int = cpp_int;

    struct array: std::vector<value> {
        using std::vector<value>::vector;
        inline const value &at(size_t pos) const;
    };

    // A string-keyed mapping preserving the insertion order of its keys.
    // Inserting an existing key replaces the value but keeps the original position.
    struct object {
        using entry = std::pair<std::string, value>;
        using entry_list = std::vector<entry>;
        using const_iterator = entry_list::const_iterator;

        object() =default;
        object(object &&) =default;
        object &operator=(object &&) =default;

        inline value &emplace(std::string &&key, value &&val);
        inline const value *find(std::string_view key) const;
        inline const value &at(std::string_view key) const;
        inline size_t size() const noexcept;
        inline bool empty() const noexcept;
        inline const_iterator begin() const noexcept;
        inline const_iterator end() const noexcept;
        // leaves the object empty
        inline entry_list release();
    private:
        entry_list _entries {};
        std::unordered_map<std::string, size_t> _index {};
    };

    // A mapping with keys of any type. Entries are kept in the order of their first appearance.
    // Keys are compared with value::operator==.
    struct map: std::vector<std::pair<value, value>> {
        using std::vector<std::pair<value, value>>::vector;
        // replaces the value of an equal key in place
        inline value &insert_or_assign(value &&key, value &&val);
        inline const value &at(const value &key) const;
    };

    struct tagged {
        uint64_t id = 0;
        std::unique_ptr<value> val {};

        inline tagged(uint64_t tag_id);
        inline tagged(uint64_t tag_id, value &&v);
        tagged(tagged &&) =default;
        tagged &operator=(tagged &&) =default;
    };

    enum class value_type: uint8_t {
        null, undefined, boolean, integer, big_integer, floating, bytes, text, array, object, map, tag
    };

    using value_content = std::variant<null_t, undefined_t, bool, int64_t, big_int, double,
        uint8_vector, std::string, array, object, map, tagged>;

    struct value {
        value() =default;
        value(const value &) =delete;
        value(value &&) =default;
        value &operator=(const value &) =delete;
        value &operator=(value &&) =default;

        template<typename T>
            requires (!std::is_same_v<std::decay_t<T>, value> && std::is_constructible_v<value_content, T &&>)
        value(T &&v): _content { std::forward<T>(v) }
        {
        }

        value_type type() const noexcept
        {
            return static_cast<value_type>(_content.index());
        }

        bool is_null() const noexcept { return type() == value_type::null; }
        bool is_undefined() const noexcept { return type() == value_type::undefined; }
        bool is_text() const noexcept { return type() == value_type::text; }
        bool is_integer() const noexcept { return type() == value_type::integer || type() == value_type::big_integer; }

        bool as_bool() const
        {
            return _get<bool>(value_type::boolean);
        }

        int64_t as_int() const
        {
            return _get<int64_t>(value_type::integer);
        }

        // accepts both machine and arbitrary-precision integers
        big_int as_big_int() const;

        double as_float() const
        {
            return _get<double>(value_type::floating);
        }

        const uint8_vector &as_bytes() const
        {
            return _get<uint8_vector>(value_type::bytes);
        }

        std::string_view as_text() const
        {
            return _get<std::string>(value_type::text);
        }

        const cbor::array &as_array() const
        {
            return _get<cbor::array>(value_type::array);
        }

        const cbor::object &as_object() const
        {
            return _get<cbor::object>(value_type::object);
        }

        const cbor::map &as_map() const
        {
            return _get<cbor::map>(value_type::map);
        }

        const tagged &as_tag() const
        {
            return _get<tagged>(value_type::tag);
        }

        const value &at(const size_t idx) const
        {
            return as_array().at(idx);
        }

        value_content &content() noexcept
        {
            return _content;
        }

        const value_content &content() const noexcept
        {
            return _content;
        }

        bool operator==(const value &o) const;
        std::string to_string() const;
        void to_stream(std::ostream &os) const;
    private:
        value_content _content {};

        template<typename T>
        const T &_get(const value_type exp_type) const
        {
            if (const auto *ptr = std::get_if<T>(&_content); ptr) [[likely]]
                return *ptr;
            _throw_type_mismatch(exp_type);
        }

        [[noreturn]] void _throw_type_mismatch(value_type exp_type) const;
    };

    extern std::string_view type_name(value_type type);

    inline const value &array::at(const size_t pos) const
    {
        if (pos < size()) [[likely]]
            return operator[](pos);
        throw error("invalid element index {} in the array of size {}", pos, size());
    }

    inline value &object::emplace(std::string &&key, value &&val)
    {
        if (const auto it = _index.find(key); it != _index.end()) {
            auto &slot = _entries[it->second].second;
            slot = std::move(val);
            return slot;
        }
        _index.emplace(key, _entries.size());
        return _entries.emplace_back(std::move(key), std::move(val)).second;
    }

    inline const value *object::find(const std::string_view key) const
    {
        if (const auto it = _index.find(std::string { key }); it != _index.end())
            return &_entries[it->second].second;
        return nullptr;
    }

    inline const value &object::at(const std::string_view key) const
    {
        if (const auto *v = find(key); v) [[likely]]
            return *v;
        throw error("the object does not contain the key '{}'", key);
    }

    inline size_t object::size() const noexcept
    {
        return _entries.size();
    }

    inline bool object::empty() const noexcept
    {
        return _entries.empty();
    }

    inline object::const_iterator object::begin() const noexcept
    {
        return _entries.begin();
    }

    inline object::const_iterator object::end() const noexcept
    {
        return _entries.end();
    }

    inline object::entry_list object::release()
    {
        _index.clear();
        return std::move(_entries);
    }

    inline value &map::insert_or_assign(value &&key, value &&val)
    {
        for (auto &[k, v]: *this) {
            if (k == key) {
                v = std::move(val);
                return v;
            }
        }
        return emplace_back(std::move(key), std::move(val)).second;
    }

    inline const value &map::at(const value &key) const
    {
        for (const auto &[k, v]: *this) {
            if (k == key)
                return v;
        }
        throw error("the map does not contain the key {}", key.to_string());
    }

    inline tagged::tagged(const uint64_t tag_id):
        id { tag_id }, val { std::make_unique<value>() }
    {
    }

    inline tagged::tagged(const uint64_t tag_id, value &&v):
        id { tag_id }, val { std::make_unique<value>(std::move(v)) }
    {
    }
}

namespace fmt {
    template<>
    struct formatter<arbor::cbor::value_type>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const arbor::cbor::value_type &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", arbor::cbor::type_name(v));
        }
    };

    template<>
    struct formatter<arbor::cbor::value>: formatter<int> {
        template<typename FormatContext>
        auto format(const arbor::cbor::value &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };

    template<>
    struct formatter<arbor::cbor::array>: formatter<int> {
        template<typename FormatContext>
        auto format(const arbor::cbor::array &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            auto out_it = fmt::format_to(ctx.out(), "[");
            for (auto it = v.begin(); it != v.end(); ++it) {
                const std::string_view sep { std::next(it) == v.end() ? "" : ", " };
                out_it = fmt::format_to(out_it, "{}{}", it->to_string(), sep);
            }
            return fmt::format_to(out_it, "]");
        }
    };
}

#endif // !ARBOR_CBOR_VALUE_HPP
