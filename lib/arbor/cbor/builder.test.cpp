/* This file is part of Arbor project: https://github.com/sierkov/arbor/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/arbor/blob/main/LICENSE */

#include <limits>
#include <arbor/common/test.hpp>
#include <arbor/cbor/builder.hpp>

using namespace arbor;
using namespace arbor::cbor;

namespace {
    value int_val(const int64_t v)
    {
        return { v };
    }

    value text_val(const std::string_view s)
    {
        return { std::string { s } };
    }
}

suite cbor_builder_suite = [] {
    "cbor::builder"_test = [] {
        "flat array"_test = [] {
            builder b {};
            test_same(b.depth(), 1);
            b.open_container(frame_kind::array, 2);
            test_same(b.depth(), 2);
            b.push_leaf(int_val(1));
            b.push_leaf(int_val(2));
            test_same(b.depth(), 1);
            const auto res = b.finish();
            test_same(res.size(), 1);
            test_same(res.at(0).to_string(), std::string { "[1, 2]" });
        };
        "empty containers open no frame"_test = [] {
            builder b {};
            b.open_container(frame_kind::array, 0);
            test_same(b.depth(), 1);
            b.open_container(frame_kind::object, 0);
            test_same(b.depth(), 1);
            const auto res = b.finish();
            test_same(res.size(), 2);
            test_same(res.at(0).type(), value_type::array);
            test_same(res.at(1).type(), value_type::object);
        };
        "multiple top-level items"_test = [] {
            builder b {};
            b.push_leaf(int_val(1));
            b.push_leaf(text_val("a"));
            const auto res = b.finish();
            test_same(res.size(), 2);
            test_same(res.at(1).as_text(), std::string_view { "a" });
        };
        "object with text keys"_test = [] {
            builder b {};
            b.open_container(frame_kind::object, 2);
            b.push_leaf(text_val("a"));
            test_same(b.depth(), 2);
            b.push_leaf(int_val(1));
            b.push_leaf(text_val("b"));
            b.push_leaf(int_val(2));
            test_same(b.depth(), 1);
            const auto res = b.finish();
            const auto &o = res.at(0).as_object();
            test_same(o.size(), 2);
            test_same(o.at("a").as_int(), 1);
            test_same(o.at("b").as_int(), 2);
        };
        "duplicate keys overwrite"_test = [] {
            builder b {};
            b.open_container(frame_kind::object, 2);
            b.push_leaf(text_val("a"));
            b.push_leaf(int_val(1));
            b.push_leaf(text_val("a"));
            b.push_leaf(int_val(2));
            const auto res = b.finish();
            const auto &o = res.at(0).as_object();
            test_same(o.size(), 1);
            test_same(o.at("a").as_int(), 2);
        };
        "promotion keeps existing entries in order"_test = [] {
            builder b {};
            b.open_container(frame_kind::object, 3);
            b.push_leaf(text_val("a"));
            b.push_leaf(int_val(1));
            b.push_leaf(text_val("b"));
            b.push_leaf(int_val(2));
            b.push_leaf(int_val(3));
            b.push_leaf(text_val("three"));
            test_same(b.depth(), 1);
            const auto res = b.finish();
            const auto &m = res.at(0).as_map();
            test_same(m.size(), 3);
            test_same(m[0].first.as_text(), std::string_view { "a" });
            test_same(m[1].first.as_text(), std::string_view { "b" });
            test_same(m[2].first.as_int(), 3);
            test_same(m.at(int_val(3)).as_text(), std::string_view { "three" });
            test_same(res.at(0).to_string(), std::string { "{\"a\": 1, \"b\": 2, 3: \"three\"}" });
        };
        "promotion on the first key"_test = [] {
            builder b {};
            b.open_container(frame_kind::object, 1);
            b.push_leaf(value { true });
            b.push_leaf(text_val("yes"));
            const auto res = b.finish();
            test_same(res.at(0).type(), value_type::map);
            test_same(res.at(0).to_string(), std::string { "{true: \"yes\"}" });
        };
        "text keys after promotion"_test = [] {
            builder b {};
            b.open_container(frame_kind::object, 2);
            b.push_leaf(int_val(1));
            b.push_leaf(int_val(10));
            b.push_leaf(text_val("k"));
            b.push_leaf(int_val(20));
            const auto res = b.finish();
            const auto &m = res.at(0).as_map();
            test_same(m.size(), 2);
            test_same(m.at(text_val("k")).as_int(), 20);
        };
        "container as a map key"_test = [] {
            builder b {};
            b.open_container(frame_kind::object, 1);
            b.open_container(frame_kind::array, 2);
            test_same(b.depth(), 3);
            b.push_leaf(int_val(1));
            b.push_leaf(int_val(2));
            test_same(b.depth(), 2);
            b.push_leaf(text_val("v"));
            test_same(b.depth(), 1);
            const auto res = b.finish();
            test_same(res.at(0).to_string(), std::string { "{[1, 2]: \"v\"}" });
        };
        "container as a value"_test = [] {
            builder b {};
            b.open_container(frame_kind::object, 2);
            b.push_leaf(text_val("list"));
            b.open_container(frame_kind::array, 1);
            b.push_leaf(int_val(1));
            b.push_leaf(text_val("n"));
            b.push_leaf(value { null });
            const auto res = b.finish();
            test_same(res.at(0).to_string(), std::string { "{\"list\": [1], \"n\": null}" });
        };
        "nesting"_test = [] {
            builder b {};
            b.open_container(frame_kind::array, 2);
            b.open_container(frame_kind::array, 1);
            b.open_container(frame_kind::array, 1);
            test_same(b.depth(), 4);
            b.push_leaf(int_val(1));
            // closing the innermost array must not close its parents
            test_same(b.depth(), 2);
            b.push_leaf(int_val(2));
            test_same(b.depth(), 1);
            const auto res = b.finish();
            test_same(res.at(0).to_string(), std::string { "[[[1]], 2]" });
        };
        "tags"_test = [] {
            builder b {};
            b.open_tag(1);
            test_same(b.depth(), 2);
            b.push_leaf(int_val(5));
            test_same(b.depth(), 1);
            b.open_tag(2);
            b.open_container(frame_kind::array, 2);
            // the tag frame closes as soon as its only child is pushed
            test_same(b.depth(), 2);
            b.push_leaf(int_val(1));
            b.push_leaf(int_val(2));
            b.open_tag(3);
            b.open_tag(4);
            b.push_leaf(value { null });
            test_same(b.depth(), 1);
            const auto res = b.finish();
            test_same(res.size(), 3);
            test_same(res.at(0).as_tag().id, 1);
            test_same(res.at(0).as_tag().val->as_int(), 5);
            test_same(res.at(1).to_string(), std::string { "2([1, 2])" });
            test_same(res.at(2).to_string(), std::string { "3(4(null))" });
        };
        "indefinite containers"_test = [] {
            builder b {};
            b.open_container(frame_kind::array, {});
            b.push_leaf(int_val(1));
            b.open_container(frame_kind::object, {});
            b.push_leaf(text_val("a"));
            b.push_leaf(int_val(2));
            test_same(b.depth(), 3);
            b.close_indefinite();
            b.close_indefinite();
            test_same(b.depth(), 1);
            const auto res = b.finish();
            test_same(res.at(0).to_string(), std::string { "[1, {\"a\": 2}]" });
        };
        "invalid breaks"_test = [] {
            {
                builder b {};
                expect(throws<protocol_error>([&] { b.close_indefinite(); }));
            }
            {
                builder b {};
                b.open_container(frame_kind::array, 2);
                expect(throws<protocol_error>([&] { b.close_indefinite(); }));
            }
            {
                builder b {};
                b.open_container(frame_kind::object, {});
                b.push_leaf(text_val("k"));
                expect(throws<protocol_error>([&] { b.close_indefinite(); }));
            }
        };
        "tag frames are opened with open_tag"_test = [] {
            builder b {};
            expect(throws<protocol_error>([&] { b.open_container(frame_kind::tag, 1); }));
        };
        "incomplete"_test = [] {
            builder b {};
            b.open_container(frame_kind::array, 2);
            b.push_leaf(int_val(1));
            expect(throws<truncated_error>([&] { b.finish(); }));
        };
        "reset"_test = [] {
            builder b {};
            b.open_container(frame_kind::array, 3);
            b.push_leaf(int_val(1));
            b.reset();
            test_same(b.depth(), 1);
            expect(b.finish().empty());
        };
        "finish starts over"_test = [] {
            builder b {};
            b.push_leaf(int_val(1));
            test_same(b.finish().size(), 1);
            test_same(b.depth(), 1);
            expect(b.finish().empty());
        };
        "max depth"_test = [] {
            builder b { decoder_config { .max_depth = 2 } };
            b.open_container(frame_kind::array, 1);
            b.open_container(frame_kind::array, 1);
            expect(throws<depth_error>([&] { b.open_container(frame_kind::array, 1); }));
            expect(throws<depth_error>([&] { b.open_tag(1); }));
        };
        "max collection size"_test = [] {
            builder b { decoder_config { .max_collection_size = 2 } };
            expect(throws<collection_too_big_error>([&] { b.open_container(frame_kind::array, 3); }));
            expect(throws<collection_too_big_error>([&] { b.open_container(frame_kind::object, 0xFFFFFFFFFFFFFFFFULL); }));
            expect(nothrow([&] { b.open_container(frame_kind::array, 2); }));
            expect(nothrow([&] { b.open_container(frame_kind::array, {}); }));
        };
        "unlimited collection size keeps lengths definite"_test = [] {
            builder b { decoder_config { .max_collection_size = std::numeric_limits<size_t>::max() } };
            expect(throws<collection_too_big_error>([&] { b.open_container(frame_kind::array, 0xFFFFFFFFFFFFFFFFULL); }));
            b.open_container(frame_kind::array, 0x7FFFFFFFFFFFFFFFULL);
            b.push_leaf(int_val(1));
            expect(throws<protocol_error>([&] { b.close_indefinite(); }));
        };
        "move construction keeps the items"_test = [] {
            builder b {};
            b.push_leaf(int_val(1));
            b.open_container(frame_kind::array, 2);
            b.push_leaf(int_val(2));
            builder b2 { std::move(b) };
            b2.push_leaf(int_val(3));
            b2.push_leaf(int_val(7));
            const auto res = b2.finish();
            test_same(res.size(), 3);
            test_same(res.at(0).as_int(), 1);
            test_same(res.at(1).to_string(), std::string { "[2, 3]" });
            test_same(res.at(2).as_int(), 7);
            test_same(b.depth(), 1);
            b.push_leaf(int_val(5));
            test_same(b.finish().size(), 1);
        };
        "move assignment keeps the items"_test = [] {
            builder b {};
            b.open_container(frame_kind::object, {});
            b.push_leaf(text_val("a"));
            builder b2 {};
            b2.push_leaf(int_val(9));
            b2 = std::move(b);
            b2.push_leaf(int_val(1));
            b2.close_indefinite();
            const auto res = b2.finish();
            test_same(res.size(), 1);
            test_same(res.at(0).as_object().at("a").as_int(), 1);
        };
    };
};
