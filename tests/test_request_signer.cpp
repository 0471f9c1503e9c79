/*
 * Part of the HmacSeal (HS) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacSeal contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacSeal (HS). See LICENSE for details.
 */

#include <gtest/gtest.h>

#include "hs/request_signer.hpp"
#include "hs/internal/time.hpp"

#include <cstdlib>
#include <map>
#include <stdexcept>

namespace {

const char* kDate = "Tue, 20 Apr 2016 18:48:24 GMT";

std::map<std::string, std::string> as_map(const hs::SignedRequest& sr) {
    return std::map<std::string, std::string>(sr.headers.begin(), sr.headers.end());
}

} // namespace

TEST(RequestSigner, PostCarriesContentHeaders) {
    hs::RequestSigner signer("12345", "SECRET");
    const hs::SignedRequest sr = signer.sign(
        "post", "/items/test", {{"paramA", "valueA"}, {"paramB", "value B"}},
        R"({"test":"1234"})", "application/json", kDate);

    EXPECT_EQ(sr.method, "POST");
    EXPECT_EQ(sr.query, "paramA=valueA&paramB=value%20B");
    EXPECT_EQ(sr.target(), "/items/test?paramA=valueA&paramB=value%20B");

    const auto h = as_map(sr);
    EXPECT_EQ(h.at("x-api-key"), "12345");
    EXPECT_EQ(h.at("date"), kDate);
    EXPECT_EQ(h.at("content-length"), "15");
    EXPECT_EQ(h.at("content-type"), "application/json");
    EXPECT_EQ(h.at("authorization"),
              "signature sha256 f82afc0e2043d85adf1ec9a803a9687420108b3606b56937a6ce59df2eccaad5");
    EXPECT_EQ(sr.signature,
              "f82afc0e2043d85adf1ec9a803a9687420108b3606b56937a6ce59df2eccaad5");
}

TEST(RequestSigner, GetOmitsContentHeaders) {
    hs::RequestSigner signer("12345", "SECRET");
    const hs::SignedRequest sr = signer.sign(
        "GET", "/items",
        {{"ids", hs::QueryValue::list({1, 2})},
         {"filter", hs::QueryValue::map({{"color", "red"}})}},
        "", "application/json", kDate);

    const auto h = as_map(sr);
    EXPECT_EQ(h.count("content-length"), 0u);
    EXPECT_EQ(h.count("content-type"), 0u);
    EXPECT_EQ(sr.query, "filter%5Bcolor%5D=red&ids%5B0%5D=1&ids%5B1%5D=2");
    EXPECT_EQ(sr.signature,
              "27d0ae1ed502ced716de65049add056801704d4fd8f59b77f2b588ad9bb9f666");
    EXPECT_EQ(sr.headers.back().first, "authorization");
}

TEST(RequestSigner, AlgorithmNameInAuthorization) {
    hs::RequestSigner signer("k", "s", hs::Algorithm::Sha512);
    const hs::SignedRequest sr = signer.sign("GET", "/", {}, "", "application/json", kDate);
    const std::string auth = as_map(sr).at("authorization");
    EXPECT_EQ(auth.rfind("signature sha512 ", 0), 0u);
    EXPECT_EQ(sr.signature.size(), 128u);
    EXPECT_EQ(sr.target(), "/");
}

TEST(RequestSigner, DefaultsToCurrentDate) {
    hs::RequestSigner signer("k", "s");
    const hs::SignedRequest sr = signer.sign("GET", "/", {}, "");
    std::int64_t t = 0;
    ASSERT_TRUE(hs::parse_timestamp(as_map(sr).at("date"), t));
    EXPECT_LE(std::llabs(hs::unix_now_ms() / 1000 - t), 5);
}

TEST(RequestSigner, RequiresCredentials) {
    EXPECT_THROW(hs::RequestSigner("", "s"), std::invalid_argument);
    EXPECT_THROW(hs::RequestSigner("k", ""), std::invalid_argument);
}
