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
#include "hs/internal/utils.hpp"

namespace {

const char* kBody = R"({"test":"1234"})";
const char* kDate = "Tue, 20 Apr 2016 18:48:24 GMT";
const char* kBodySha =
    "500bd7c0407451c193c9335c034144575ab41095ec72ab63510c54559a94540b";
const char* kEmptySha =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

hs::HeaderMap scenario_headers() {
    return {
        {"content-length", "15"},
        {"date", kDate},
        {"x-api-key", "12345"},
    };
}

} // namespace

TEST(Canonicalize, MatchesKnownScenario) {
    const hs::QueryPairs q = {{"paramA", "valueA"}, {"paramB", "value B"}};
    const std::string c = hs::canonicalize("POST", "/items/test", q, scenario_headers(), kBody);
    EXPECT_EQ(c,
              std::string("POST\n/items/test\nparamA=valueA&paramB=value%20B\n"
                          "content-length:15\n"
                          "date:Tue, 20 Apr 2016 18:48:24 GMT\n"
                          "x-api-key:12345\n") + kBodySha);
}

TEST(Canonicalize, BodyDigestIsSha256Hex) {
    EXPECT_EQ(hs::internal::sha256_hex(kBody), kBodySha);
}

TEST(Canonicalize, EmptyBodyEndsWithEmptyDigest) {
    const hs::HeaderMap h = {{"date", kDate}, {"x-api-key", "k"}};
    const std::string c = hs::canonicalize("GET", "/", {}, h, "");
    ASSERT_GE(c.size(), 64u);
    EXPECT_EQ(c.substr(c.size() - 64), kEmptySha);
    EXPECT_EQ(c, std::string("GET\n/\n\ndate:") + kDate + "\nx-api-key:k\n" + kEmptySha);
}

TEST(Canonicalize, MethodIsUpperCased) {
    const std::string a = hs::canonicalize("post", "/x", {}, scenario_headers(), kBody);
    const std::string b = hs::canonicalize("POST", "/x", {}, scenario_headers(), kBody);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.substr(0, 5), "POST\n");
}

TEST(Canonicalize, IndependentOfInputOrder) {
    const hs::QueryPairs q1 = {{"b", "2"}, {"a", "1"}, {"c", "3"}};
    const hs::QueryPairs q2 = {{"c", "3"}, {"a", "1"}, {"b", "2"}};

    hs::HeaderMap h1;
    h1["x-api-key"] = "12345";
    h1["date"] = kDate;
    h1["content-length"] = "15";
    hs::HeaderMap h2;
    h2["content-length"] = "15";
    h2["date"] = kDate;
    h2["x-api-key"] = "12345";

    EXPECT_EQ(hs::canonicalize("POST", "/p", q1, h1, kBody),
              hs::canonicalize("POST", "/p", q2, h2, kBody));
}

TEST(CanonicalHeaders, OnlyWhitelistedHeadersTakePart) {
    hs::HeaderMap h = scenario_headers();
    const std::string before = hs::canonical_headers(h, true);
    h["user-agent"] = "curl/8";
    h["x-forwarded-for"] = "10.0.0.1";
    h["authorization"] = "signature sha256 abc";
    EXPECT_EQ(hs::canonical_headers(h, true), before);
}

TEST(CanonicalHeaders, NamesLowerCasedAndValuesTrimmed) {
    const hs::HeaderMap h = {{"X-Api-Key", "  12345 "}, {"Date", kDate}};
    EXPECT_EQ(hs::canonical_headers(h, false),
              std::string("date:") + kDate + "\nx-api-key:12345");
}

TEST(CanonicalHeaders, CaseVariantsResolveDeterministically) {
    const hs::HeaderMap h = {{"Date", "first"}, {"date", "lower"}, {"DATE", "upper"}};
    EXPECT_EQ(hs::canonical_headers(h, false), "date:lower");

    const hs::HeaderMap g = {{"X-API-KEY", "a"}, {"X-Api-Key", "b"}};
    // "X-API-KEY" < "X-Api-Key"
    EXPECT_EQ(hs::canonical_headers(g, false), "x-api-key:a");
}

TEST(CanonicalHeaders, ContentHeadersOnlyWithBody) {
    const hs::HeaderMap h = {
        {"content-length", "0"},
        {"content-type", "application/json"},
        {"date", kDate},
        {"x-api-key", "k"},
    };
    EXPECT_EQ(hs::canonical_headers(h, false),
              std::string("date:") + kDate + "\nx-api-key:k");
    EXPECT_EQ(hs::canonical_headers(h, true),
              std::string("content-length:0\ncontent-type:application/json\ndate:") +
              kDate + "\nx-api-key:k");
}

TEST(CanonicalQuery, EncodesAndSorts) {
    const hs::QueryPairs q = {
        {"z", "last"}, {"a b", "x&y"}, {"m", "é"}, {"tilde", "~-._"},
    };
    EXPECT_EQ(hs::canonical_query(q), "a%20b=x%26y&m=%C3%A9&tilde=~-._&z=last");
}

TEST(CanonicalQuery, DuplicateKeysSortedByValue) {
    const hs::QueryPairs q = {{"k", "2"}, {"k", "10"}, {"k", "1"}};
    EXPECT_EQ(hs::canonical_query(q), "k=1&k=10&k=2");
}

TEST(CanonicalQuery, EmptyQueryIsEmptyLine) {
    EXPECT_EQ(hs::canonical_query({}), "");
}

TEST(FlattenQuery, ListsAndMapsUseBracketKeys) {
    const hs::QueryParams p = {
        {"ids", hs::QueryValue::list({1, 2})},
        {"filter", hs::QueryValue::map({{"color", "red"}, {"tags", hs::QueryValue::list({"a"})}})},
        {"flag", true},
        {"empty", hs::QueryValue::list({})},
    };
    const hs::QueryPairs flat = hs::flatten_query(p);
    const hs::QueryPairs want = {
        {"ids[0]", "1"}, {"ids[1]", "2"},
        {"filter[color]", "red"}, {"filter[tags][0]", "a"},
        {"flag", "true"},
    };
    EXPECT_EQ(flat, want);
    EXPECT_EQ(hs::canonical_query(flat),
              "filter%5Bcolor%5D=red&filter%5Btags%5D%5B0%5D=a&flag=true&ids%5B0%5D=1&ids%5B1%5D=2");
}

TEST(ParseQuery, DecodesPercentAndPlus) {
    const hs::QueryPairs q = hs::parse_query("paramB=value%20B&paramA=valueA&s=a+b&flag&&x=");
    const hs::QueryPairs want = {
        {"paramB", "value B"}, {"paramA", "valueA"}, {"s", "a b"}, {"flag", ""}, {"x", ""},
    };
    EXPECT_EQ(q, want);
}

TEST(ParseQuery, CanonicalFormSurvivesDecodeAndReencode) {
    const hs::QueryParams p = {
        {"q", "rock & roll"},
        {"filter", hs::QueryValue::map({{"a b", "c/d"}})},
    };
    const std::string wire = hs::canonical_query(hs::flatten_query(p));
    EXPECT_EQ(hs::canonical_query(hs::parse_query(wire)), wire);
}

TEST(UrlCodec, MalformedEscapesPassThrough) {
    EXPECT_EQ(hs::url_decode("100%"), "100%");
    EXPECT_EQ(hs::url_decode("%zz"), "%zz");
    EXPECT_EQ(hs::url_decode("%41%4a"), "AJ");
    EXPECT_EQ(hs::url_encode("a/b?c"), "a%2Fb%3Fc");
}
