/*
 * Part of the HmacSeal (HS) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacSeal contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacSeal (HS). See LICENSE for details.
 */

#include <gtest/gtest.h>

#include "hs/internal/http_parser.hpp"
#include "hs/internal/http_low.hpp"
#include "hs/internal/time.hpp"

TEST(HttpParser, RequestHead) {
    hs::HttpRequest R;
    ASSERT_TRUE(hs::internal::parse_request_head(
        "POST /items/test?paramA=valueA&paramB=value%20B HTTP/1.1\r\n"
        "Host: example.com\r\n"
        "X-API-Key:   12345  \r\n"
        "Content-Length: 15\r\n"
        "x-api-key: second", R));
    EXPECT_EQ(R.method, "POST");
    EXPECT_EQ(R.path, "/items/test");
    EXPECT_EQ(R.query, "paramA=valueA&paramB=value%20B");
    EXPECT_EQ(R.httpver, "HTTP/1.1");
    EXPECT_EQ(R.headers.at("x-api-key"), "12345");
    EXPECT_EQ(R.headers.at("content-length"), "15");
    EXPECT_EQ(R.headers.count("X-API-Key"), 0u);
}

TEST(HttpParser, TargetWithoutQuery) {
    hs::HttpRequest R;
    ASSERT_TRUE(hs::internal::parse_request_line("GET /health HTTP/1.0", R));
    EXPECT_EQ(R.path, "/health");
    EXPECT_TRUE(R.query.empty());
}

TEST(HttpParser, RejectsMalformedInput) {
    hs::HttpRequest R;
    EXPECT_FALSE(hs::internal::parse_request_line("GET /x", R));
    EXPECT_FALSE(hs::internal::parse_request_line("GET x HTTP/1.1", R));
    EXPECT_FALSE(hs::internal::parse_request_line("GET /x FTP/1.0", R));
    EXPECT_FALSE(hs::internal::parse_request_line("GET /x HTTP/1.1 junk", R));
    EXPECT_FALSE(hs::internal::parse_request_head("GET / HTTP/1.1\r\nno colon here", R));
    EXPECT_FALSE(hs::internal::parse_request_head("GET / HTTP/1.1\r\n: empty name", R));
}

TEST(HttpParser, CaseInsensitiveLookup) {
    const std::unordered_map<std::string, std::string> h = {{"Date", "x"}};
    ASSERT_NE(hs::internal::find_header(h, "date"), nullptr);
    EXPECT_EQ(hs::internal::hdr_ci(h, "DATE"), "x");
    EXPECT_EQ(hs::internal::find_header(h, "authorization"), nullptr);
    EXPECT_EQ(hs::internal::hdr_ci(h, "authorization"), "");
}

TEST(HttpResponseParser, StatusAndHeaders) {
    const std::string raw =
        "HTTP/1.1 401 Unauthorized\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: 2\r\n"
        "\r\n"
        "{}";
    std::size_t off = 0;
    int code = 0;
    std::string text;
    std::unordered_map<std::string, std::string> h;
    ASSERT_TRUE(hs::internal::parse_http_response(raw, off, code, text, h));
    EXPECT_EQ(code, 401);
    EXPECT_EQ(text, "Unauthorized");
    EXPECT_EQ(h.at("content-length"), "2");
    EXPECT_EQ(raw.substr(off), "{}");

    EXPECT_FALSE(hs::internal::parse_http_response("HTTP/1.1 200 OK\r\n", off, code, text, h));
    EXPECT_FALSE(hs::internal::parse_http_response("garbage\r\n\r\n", off, code, text, h));
}

TEST(Timestamp, Rfc1123RoundTrip) {
    std::int64_t t = 0;
    ASSERT_TRUE(hs::parse_timestamp("Tue, 20 Apr 2016 18:48:24 GMT", t));
    EXPECT_EQ(t, 1461178104);
    EXPECT_EQ(hs::format_http_date(static_cast<std::time_t>(t)), "Tue, 20 Apr 2016 18:48:24 GMT");
}

TEST(Timestamp, AlternateForms) {
    std::int64_t t = 0;
    ASSERT_TRUE(hs::parse_timestamp("2016-04-20T18:48:24Z", t));
    EXPECT_EQ(t, 1461178104);
    ASSERT_TRUE(hs::parse_timestamp("1461178104", t));
    EXPECT_EQ(t, 1461178104);
}

TEST(Timestamp, RejectsGarbage) {
    std::int64_t t = 0;
    EXPECT_FALSE(hs::parse_timestamp("", t));
    EXPECT_FALSE(hs::parse_timestamp("yesterday", t));
    EXPECT_FALSE(hs::parse_timestamp("Tue, 20 Apr 2016 18:48:24 PST", t));
    EXPECT_FALSE(hs::parse_timestamp("Tue, 20 Foo 2016 18:48:24 GMT", t));
    EXPECT_FALSE(hs::parse_timestamp("2016-04-20 18:48:24", t));
}

TEST(Timestamp, IsoFieldsOutOfRange) {
    std::int64_t t = 0;
    EXPECT_FALSE(hs::parse_timestamp("2016-13-45T99:00:00Z", t));
    EXPECT_FALSE(hs::parse_timestamp("2016-00-20T18:48:24Z", t));
    EXPECT_FALSE(hs::parse_timestamp("2016-04-00T18:48:24Z", t));
    EXPECT_FALSE(hs::parse_timestamp("2016-04-20T24:00:00Z", t));
    EXPECT_FALSE(hs::parse_timestamp("2016-04-20T18:60:00Z", t));
    EXPECT_TRUE(hs::parse_timestamp("2016-12-31T23:59:59Z", t));
}
