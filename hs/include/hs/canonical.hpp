/*
 * Part of the HmacSeal (HS) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacSeal contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacSeal (HS). See LICENSE for details.
 */

#pragma once
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "hs/query_value.hpp"

namespace hs {

// Decoded query parameters, in arrival order. Duplicate keys are kept.
using QueryPairs = std::vector<std::pair<std::string, std::string>>;

// Header name -> value. Names may be in any case; canonicalization lower-cases.
using HeaderMap = std::unordered_map<std::string, std::string>;

// Headers that take part in the signature. Fixed on purpose.
const std::vector<std::string>& signed_header_names();

// Percent-encode everything outside RFC 3986 unreserved, upper-case hex.
std::string url_encode(const std::string& s);

// Inverse of url_encode; also maps '+' to space. Malformed escapes pass through.
std::string url_decode(const std::string& s);

// Raw "a=1&b=value%20B" -> decoded pairs. A token without '=' is a key with
// an empty value; empty tokens are skipped.
QueryPairs parse_query(const std::string& raw);

// Structured parameters -> plain pairs (rules in query_value.hpp).
QueryPairs flatten_query(const QueryParams& params);

// Encoded "k=v" pairs sorted by encoded key (then value), joined with '&'.
std::string canonical_query(const QueryPairs& pairs);

// Sorted "name:value" lines for the signed headers, joined with '\n'.
// content-length / content-type only take part when has_body is true.
// When a name appears in several spellings, the lower-case one is used,
// else the lexicographically smallest spelling.
std::string canonical_headers(const HeaderMap& headers, bool has_body);

/**
 * Canonical form of a request:
 *
 *   METHOD \n PATH \n QUERY \n HEADER_LINES \n hex(SHA-256(body))
 *
 * Pure and deterministic; client and server must produce identical bytes
 * for the same request.
 */
std::string canonicalize(const std::string& method,
                         const std::string& path,
                         const QueryPairs& query,
                         const HeaderMap& headers,
                         const std::string& body);

} // namespace hs
