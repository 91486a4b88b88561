/* This file is part of Arbor project: https://github.com/sierkov/arbor/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/arbor/blob/main/LICENSE */
#ifndef ARBOR_CONFIG_HPP
#define ARBOR_CONFIG_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <arbor/common/bytes.hpp>
#include <arbor/json.hpp>

namespace arbor {
    struct config {
        virtual ~config() =default;

        [[nodiscard]] const json::value &at(const std::string_view &name) const
        {
            return _at_impl(name);
        }

        [[nodiscard]] bool contains(const std::string_view &name) const
        {
            return _json_impl().contains(name);
        }
    private:
        virtual const json::value &_at_impl(const std::string_view &name) const =0;
        virtual const json::object &_json_impl() const =0;
    };

    // Used as a config mock
    struct config_json: config {
        explicit config_json(json::object &&json)
            : _json { std::move(json) }
        {
        }
    private:
        const json::object _json;

        const json::value &_at_impl(const std::string_view &name) const override
        {
            const auto it = _json.find(name);
            if (it == _json.end())
                throw error("config does not have the requested {} element!", name);
            return it->value();
        }

        const json::object &_json_impl() const override
        {
            return _json;
        }
    };

    struct config_file: config {
        explicit config_file(const std::string &path);
    private:
        json::object _parsed;

        const json::value &_at_impl(const std::string_view &name) const override;
        const json::object &_json_impl() const override
        {
            return _parsed;
        }
    };

    // Limits of a single cbor::decoder instance
    struct decoder_config {
        static constexpr size_t min_heap_size = 0x10000;

        size_t heap_size = min_heap_size;
        size_t max_depth = 1024;
        size_t max_collection_size = 0x1000000;

        // Recognizes optional heapSize, maxDepth and maxCollectionSize keys
        static decoder_config from(const config &cfg);
        // Uses the file named by ARBOR_CONFIG when set and the defaults otherwise
        static decoder_config from_env();
    };
}

#endif // !ARBOR_CONFIG_HPP
