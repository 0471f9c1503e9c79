/*
 * Part of the HmacSeal (HS) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacSeal contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacSeal (HS). See LICENSE for details.
 */

#include "hs/request_signer.hpp"
#include "hs/canonical.hpp"
#include "hs/internal/time.hpp"
#include "hs/internal/utils.hpp"

#include <stdexcept>

namespace hs {

std::string SignedRequest::target() const {
    return query.empty() ? path : path + "?" + query;
}

RequestSigner::RequestSigner(std::string api_key, std::string secret, Algorithm alg)
    : _api_key(std::move(api_key))
    , _secret(std::move(secret))
    , _alg(alg)
{
    if (_api_key.empty()) throw std::invalid_argument("RequestSigner: empty API key");
    if (_secret.empty())  throw std::invalid_argument("RequestSigner: empty secret");
}

SignedRequest RequestSigner::sign(const std::string& method,
                                  const std::string& path,
                                  const QueryParams& query,
                                  const std::string& body,
                                  const std::string& content_type,
                                  const std::string& date) const
{
    SignedRequest out;
    out.method = internal::upper_copy(method);
    out.path   = path;

    const QueryPairs flat = flatten_query(query);
    out.query = canonical_query(flat);

    const std::string when = date.empty() ? http_date_now() : date;

    HeaderMap signed_headers;
    signed_headers["x-api-key"] = _api_key;
    signed_headers["date"]      = when;
    if (!body.empty()) {
        signed_headers["content-length"] = std::to_string(body.size());
        signed_headers["content-type"]   = content_type;
    }

    out.canonical = canonicalize(out.method, out.path, flat, signed_headers, body);
    out.signature = hs::sign(out.canonical, _secret, _alg);

    out.headers.emplace_back("x-api-key", _api_key);
    out.headers.emplace_back("date", when);
    if (!body.empty()) {
        out.headers.emplace_back("content-length", std::to_string(body.size()));
        out.headers.emplace_back("content-type", content_type);
    }
    out.headers.emplace_back("authorization",
                             std::string("signature ") + algorithm_name(_alg) + " " + out.signature);
    return out;
}

} // namespace hs
