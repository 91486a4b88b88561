/* This file is part of Arbor project: https://github.com/sierkov/arbor/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/arbor/blob/main/LICENSE */

#include <arbor/common/test.hpp>
#include <arbor/common/base64.hpp>

using namespace arbor;

suite base64_suite = [] {
    "base64"_test = [] {
        "decode_url"_test = [] {
            static std::vector<std::pair<std::string_view, uint8_vector>> test_vectors {
                { "-0Np4pyTOWF26iXWVIvu6fhz9QupwWRS2hcCaOEYlw0", uint8_vector::from_hex("fb4369e29c93396176ea25d6548beee9f873f50ba9c16452da170268e118970d") },
                { "-0Np4pyTOWF26iXWVIvu6fhz9QupwWRS2hcCaOEYlw0=", uint8_vector::from_hex("fb4369e29c93396176ea25d6548beee9f873f50ba9c16452da170268e118970d") },
                { "2pyVSDztfTSLEb8Cur4AjD9_WHhqgm-nY5_robtNnE4", uint8_vector::from_hex("da9c95483ced7d348b11bf02babe008c3f7f58786a826fa7639feba1bb4d9c4e") }
            };
            for (const auto &[in, exp]: test_vectors) {
                auto out = base64::decode_url(in);
                expect(out.size() == 32) << out.size();
                expect(out == exp) << out;
            }
        };
        "decode"_test = [] {
            test_same(base64::decode("gwECAw=="), uint8_vector::from_hex("83010203"));
            test_same(base64::decode("oWFhAQ=="), uint8_vector::from_hex("A1616101"));
            expect(base64::decode("").empty());
        };
        "invalid characters"_test = [] {
            expect(throws([] { base64::decode("gw*CAw=="); }));
            expect(throws([] { base64::decode("-_"); }));
            expect(throws([] { base64::decode_url("+/"); }));
        };
    };
};
