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
#include <utility>
#include <vector>
#include "hs/query_value.hpp"
#include "hs/sign.hpp"

namespace hs {

// Everything a transport needs to send one signed request.
struct SignedRequest {
    std::string method;     // upper-case
    std::string path;
    std::string query;      // canonical query string, no leading '?'
    std::vector<std::pair<std::string, std::string>> headers; // lower-case names
    std::string canonical;  // the string that was signed
    std::string signature;  // hex digest

    // path, plus "?query" when there is one.
    std::string target() const;
};

/**
 * Client half of the protocol. Builds the signed header set
 * (x-api-key, date, content-length/content-type for a non-empty body,
 * authorization) from the same canonicalizer the server runs.
 */
class RequestSigner {
public:
    // Throws std::invalid_argument for an empty API key or secret.
    RequestSigner(std::string api_key, std::string secret,
                  Algorithm alg = Algorithm::Sha256);

    // `date` defaults to the current time in RFC 1123 form.
    SignedRequest sign(const std::string& method,
                       const std::string& path,
                       const QueryParams& query,
                       const std::string& body,
                       const std::string& content_type = "application/json",
                       const std::string& date = std::string()) const;

    const std::string& api_key() const { return _api_key; }
    Algorithm algorithm() const { return _alg; }

private:
    std::string _api_key;
    std::string _secret;
    Algorithm   _alg;
};

} // namespace hs
