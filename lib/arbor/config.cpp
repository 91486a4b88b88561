/* This file is part of Arbor project: https://github.com/sierkov/arbor/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/arbor/blob/main/LICENSE */

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <arbor/config.hpp>
#include <arbor/logger.hpp>

namespace arbor {
    static uint8_vector read_file(const std::string &path)
    {
        std::ifstream is { path, std::ios::binary };
        if (!is)
            throw error("unable to open the configuration file: {}", path);
        std::string raw { std::istreambuf_iterator<char> { is }, std::istreambuf_iterator<char> {} };
        if (is.bad())
            throw error("failed to read the configuration file: {}", path);
        return uint8_vector { buffer { raw } };
    }

    config_file::config_file(const std::string &path)
        : _parsed { json::parse(read_file(path)).as_object() }
    {
    }

    const json::value &config_file::_at_impl(const std::string_view &name) const
    {
        const auto it = _parsed.find(name);
        if (it == _parsed.end())
            throw error("configuration file does not have the element {}!", name);
        return it->value();
    }

    static size_t positive_size(const config &cfg, const std::string_view name, const size_t def)
    {
        if (!cfg.contains(name))
            return def;
        const auto &v = cfg.at(name);
        if (!v.is_int64() && !v.is_uint64())
            throw error("configuration element {} must be an integer but got: {}", name, json::serialize(v));
        const auto val = v.to_number<int64_t>();
        if (val <= 0)
            throw error("configuration element {} must be positive but got: {}", name, val);
        return static_cast<size_t>(val);
    }

    decoder_config decoder_config::from(const config &cfg)
    {
        decoder_config res {};
        res.heap_size = std::max(positive_size(cfg, "heapSize", res.heap_size), min_heap_size);
        res.max_depth = positive_size(cfg, "maxDepth", res.max_depth);
        res.max_collection_size = positive_size(cfg, "maxCollectionSize", res.max_collection_size);
        return res;
    }

    decoder_config decoder_config::from_env()
    {
        if (const char *path = std::getenv("ARBOR_CONFIG"); path) {
            logger::debug("loading the decoder configuration from {}", path);
            return from(config_file { path });
        }
        return {};
    }
}
