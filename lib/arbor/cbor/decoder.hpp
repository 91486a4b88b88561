/* This file is part of Arbor project: https://github.com/sierkov/arbor/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/arbor/blob/main/LICENSE */
#ifndef ARBOR_CBOR_DECODER_HPP
#define ARBOR_CBOR_DECODER_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <arbor/config.hpp>
#include <arbor/cbor/builder.hpp>
#include <arbor/cbor/input-region.hpp>
#include <arbor/cbor/value.hpp>

namespace arbor::cbor {
    enum class input_encoding: uint8_t {
        hex, base64, base64url, binary
    };

    extern uint8_vector decode_input(std::string_view data, input_encoding enc);

    // Textual inputs: std::string, std::string_view and string literals
    template<typename T>
    concept encoded_string = std::is_convertible_v<const T &, std::string_view>;

    /*
     * Decodes a block of CBOR data into a sequence of top-level values.
     * The input is copied into a region allocated once per decoder, so the maximum input size
     * is fixed at construction. Each call starts from a clean state.
     * A decoder instance must not be used from multiple threads at the same time.
     */
    struct decoder {
        explicit decoder(const decoder_config &cfg={});

        value decode_first(buffer data);
        array decode_all(buffer data);

        template<encoded_string S>
        value decode_first(const S &data, const input_encoding enc=input_encoding::hex)
        {
            return decode_first(static_cast<buffer>(decode_input(data, enc)));
        }

        template<encoded_string S>
        array decode_all(const S &data, const input_encoding enc=input_encoding::hex)
        {
            return decode_all(static_cast<buffer>(decode_input(data, enc)));
        }

        size_t capacity() const noexcept
        {
            return _region.capacity();
        }
    private:
        input_region _region;
        builder _builder;
    };

    // One-shot helpers create a fresh decoder configured from ARBOR_CONFIG on every call
    inline value decode_first(const buffer data)
    {
        return decoder { decoder_config::from_env() }.decode_first(data);
    }

    template<encoded_string S>
    value decode_first(const S &data, const input_encoding enc=input_encoding::hex)
    {
        return decoder { decoder_config::from_env() }.decode_first(data, enc);
    }

    inline array decode_all(const buffer data)
    {
        return decoder { decoder_config::from_env() }.decode_all(data);
    }

    template<encoded_string S>
    array decode_all(const S &data, const input_encoding enc=input_encoding::hex)
    {
        return decoder { decoder_config::from_env() }.decode_all(data, enc);
    }

    inline value decode(const buffer data)
    {
        return decode_first(data);
    }

    template<encoded_string S>
    value decode(const S &data, const input_encoding enc=input_encoding::hex)
    {
        return decode_first(data, enc);
    }
}

namespace fmt {
    template<>
    struct formatter<arbor::cbor::input_encoding>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using arbor::cbor::input_encoding;
            switch (v) {
                case input_encoding::hex: return fmt::format_to(ctx.out(), "hex");
                case input_encoding::base64: return fmt::format_to(ctx.out(), "base64");
                case input_encoding::base64url: return fmt::format_to(ctx.out(), "base64url");
                case input_encoding::binary: return fmt::format_to(ctx.out(), "binary");
                default: return fmt::format_to(ctx.out(), "input_encoding: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !ARBOR_CBOR_DECODER_HPP
