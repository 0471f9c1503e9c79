/*
 * Part of the HmacSeal (HS) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacSeal contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacSeal (HS). See LICENSE for details.
 */

#include <gtest/gtest.h>

#include "hs/canonical.hpp"
#include "hs/sign.hpp"

namespace {

std::string scenario_canonical() {
    const hs::HeaderMap h = {
        {"content-length", "15"},
        {"date", "Tue, 20 Apr 2016 18:48:24 GMT"},
        {"x-api-key", "12345"},
    };
    return hs::canonicalize("POST", "/items/test",
                            {{"paramA", "valueA"}, {"paramB", "value B"}},
                            h, R"({"test":"1234"})");
}

} // namespace

TEST(Sign, GoldenSha256) {
    EXPECT_EQ(hs::sign(scenario_canonical(), "SECRET", hs::Algorithm::Sha256),
              "1e70e351a128595a0fefe53d65ea38a28ee22b1e205be7832998217f8f4af55d");
}

TEST(Sign, GoldenSha1) {
    EXPECT_EQ(hs::sign(scenario_canonical(), "SECRET", "sha1"),
              "9b4b63a903e06bd2bca320160f987f48edab3d90");
}

TEST(Sign, GoldenSha512) {
    EXPECT_EQ(hs::sign(scenario_canonical(), "SECRET", "sha512"),
              "02b326329f31ec1487b9a14abc37737b30c544b3284084d9cff197e1abf783b1"
              "85bfbb921c1d2ed106ca6d2b429c3456f80148323ae05e0eea54b4ea2780632f");
}

TEST(Sign, DifferentSecretDifferentDigest) {
    const std::string c = scenario_canonical();
    EXPECT_NE(hs::sign(c, "SECRET", hs::Algorithm::Sha256),
              hs::sign(c, "SECRET2", hs::Algorithm::Sha256));
}

TEST(Sign, UnknownAlgorithmThrows) {
    try {
        (void)hs::sign("x", "k", "md5");
        FAIL() << "expected UnsupportedAlgorithm";
    } catch (const hs::UnsupportedAlgorithm& e) {
        EXPECT_EQ(e.name(), "md5");
    }
    EXPECT_THROW((void)hs::sign("x", "k", "SHA256"), std::invalid_argument);
}

TEST(Sign, AlgorithmNamesRoundTrip) {
    for (const auto& n : hs::supported_algorithms()) {
        const auto alg = hs::parse_algorithm(n);
        ASSERT_TRUE(alg.has_value()) << n;
        EXPECT_EQ(n, hs::algorithm_name(*alg));
    }
    EXPECT_FALSE(hs::parse_algorithm("").has_value());
}
