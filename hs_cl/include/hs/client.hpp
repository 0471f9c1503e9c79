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
#include <memory>
#include "hs/client_config.hpp"
#include "hs/http_response.hpp"
#include "hs/query_value.hpp"

namespace hs {

// HTTP client that signs every request, with keep-alive.
class Client {
public:
    // Throws UnsupportedAlgorithm for an unknown cfg.algorithm and
    // std::invalid_argument for missing credentials.
    explicit Client(const ClientConfig& cfg);
    ~Client();

    // Single-call convenience helpers
    bool get(const std::string& path, const QueryParams& query, HttpResponse& out);
    bool post(const std::string& path, const std::string& body, HttpResponse& out);

    // Generic request:
    //  method: any HTTP method
    //  path:   e.g. "/items/test" (will be prefixed by base_path if set)
    //  query:  structured query parameters, flattened and signed
    //  body:   sent as-is with cfg.content_type when non-empty
    bool request(const std::string& method,
                 const std::string& path,
                 const QueryParams& query,
                 const std::string& body,
                 HttpResponse& out);

private:
    struct Impl;
    std::unique_ptr<Impl> _p;
};

} // namespace hs
