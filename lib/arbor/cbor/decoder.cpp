/* This file is part of Arbor project: https://github.com/sierkov/arbor/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/arbor/blob/main/LICENSE */

#include <arbor/common/base64.hpp>
#include <arbor/cbor/decoder.hpp>
#include <arbor/cbor/event-adapter.hpp>
#include <arbor/cbor/scanner.hpp>
#include <arbor/logger.hpp>

namespace arbor::cbor {
    uint8_vector decode_input(const std::string_view data, const input_encoding enc)
    {
        switch (enc) {
            case input_encoding::hex: return uint8_vector::from_hex(data);
            case input_encoding::base64: return base64::decode(data);
            case input_encoding::base64url: return base64::decode_url(data);
            case input_encoding::binary: return uint8_vector { buffer { data } };
            default: throw error("unsupported input encoding: {}", static_cast<int>(enc));
        }
    }

    decoder::decoder(const decoder_config &cfg):
        _region { cfg.heap_size }, _builder { cfg }
    {
    }

    array decoder::decode_all(const buffer data)
    {
        try {
            _builder.reset();
            const auto bytes = _region.load(data);
            scanner scan { bytes };
            event_adapter adapter { _builder, _region };
            size_t num_events = 0;
            while (auto e = scan.next()) {
                std::visit(adapter, *e);
                ++num_events;
            }
            auto res = _builder.finish();
            logger::trace("decoded {} bytes: {} events, {} top-level items", bytes.size(), num_events, res.size());
            return res;
        } catch (const error &ex) {
            logger::debug("failed to decode {} bytes of cbor data: {}\n{}", data.size(), ex.what(), ex.stacktrace());
            throw;
        }
    }

    value decoder::decode_first(const buffer data)
    {
        auto items = decode_all(data);
        if (items.empty()) [[unlikely]]
            throw error("no cbor items found in {} bytes of data", data.size());
        return std::move(items.front());
    }
}
