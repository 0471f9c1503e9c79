/*
 * Part of the HmacSeal (HS) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacSeal contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacSeal (HS). See LICENSE for details.
 */

#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace hs {

class AbortSignal;

enum class BodyRead { Ok, TooLarge, Failed };

// Plain HTTP request structure as produced by our parser.
struct HttpRequest {
    std::string method;   // "GET", "POST", ...
    std::string path;     // "/items/test"
    std::string query;    // raw, "a=1&b=value%20B"
    std::string httpver;  // "HTTP/1.1"
    std::unordered_map<std::string, std::string> headers; // lower-cased names
    std::string body;
    bool body_buffered = false;

    // Supplied by the transport when the body is still on the wire.
    // Appends at most `limit` bytes to `out`.
    std::function<BodyRead(std::size_t limit, std::string& out)> read_body;

    // Fired by the transport when the peer goes away mid-request.
    std::shared_ptr<AbortSignal> abort;

    // Filled in by Verifier::authenticate for downstream handlers.
    std::string api_key;
    std::string secret;
    std::string signature;           // as presented in `authorization`
    std::string signature_expected;  // as recomputed by the server
    bool authenticated = false;
};

} // namespace hs
