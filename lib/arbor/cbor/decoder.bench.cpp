/* This file is part of Arbor project: https://github.com/sierkov/arbor/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/arbor/blob/main/LICENSE */

#include <arbor/common/benchmark.hpp>
#include <arbor/cbor/decoder.hpp>

namespace {
    using namespace arbor;
    using namespace arbor::cbor;

    // {"id": 74565, "name": "item-12345", "tags": [1, 2, 3], "score": 1.5}
    static constexpr std::string_view sample_item =
        "A4" "626964" "1A00012345" "646E616D65" "6A6974656D2D3132333435"
        "6474616773" "83010203" "6573636F7265" "FB3FF8000000000000";

    uint8_vector sample_array(const uint32_t num_items)
    {
        uint8_vector data {};
        data << uint8_vector::from_hex(fmt::format("9A{:08X}", num_items));
        const auto item = uint8_vector::from_hex(sample_item);
        for (uint32_t i = 0; i < num_items; ++i)
            data << item;
        return data;
    }

    uint8_vector sample_integers(const uint32_t num_items)
    {
        uint8_vector data {};
        data << uint8_vector::from_hex(fmt::format("9A{:08X}", num_items));
        const auto item = uint8_vector::from_hex("1B0123456789ABCDEF");
        for (uint32_t i = 0; i < num_items; ++i)
            data << item;
        return data;
    }
}

suite cbor_decoder_bench_suite = [] {
    "cbor::decoder"_test = [] {
        ankerl::nanobench::Bench b {};
        b.title("cbor::decoder")
            .output(&std::cerr)
            .unit("byte")
            .performanceCounters(true)
            .relative(true);
        decoder dec { decoder_config { .heap_size = 0x1000000 } };
        {
            const auto data = sample_array(100000);
            b.batch(data.size());
            b.run("objects", [&] {
                ankerl::nanobench::doNotOptimizeAway(dec.decode_first(data));
            });
        }
        {
            const auto data = sample_integers(100000);
            b.batch(data.size());
            b.run("big integers", [&] {
                ankerl::nanobench::doNotOptimizeAway(dec.decode_first(data));
            });
        }
    };
};
