/*
 * Part of the HmacSeal (HS) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacSeal contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacSeal (HS). See LICENSE for details.
 */

#pragma once
#include <future>
#include <string>
#include "hs/auth_result.hpp"
#include "hs/http_request.hpp"
#include "hs/secret_delegate.hpp"
#include "hs/verifier_config.hpp"

namespace hs {

// Where authenticate() takes the request body from.
enum class BodySource {
    Buffered,  // R.body already holds the full body
    Drain      // read it through R.read_body unless R.body_buffered
};

/**
 * Server side of the request-signing protocol.
 *
 * authenticate() runs, in order and stopping at the first failure:
 *   body drain (BodySource::Drain only)
 *   API key from `x-api-key`, else the `apiKey` query parameter
 *   secret lookup through the delegate, bounded by the configured timeout
 *   presence of `authorization` and `date`
 *   `date` within the permitted skew of the server clock
 *   `authorization: signature <algorithm> <hex>` parsing
 *   canonical form + HMAC recomputation and constant-effort comparison
 *
 * The request is annotated with api_key, secret, both signatures and the
 * authenticated flag. No state is shared between calls; one Verifier may
 * serve any number of threads.
 */
class Verifier {
public:
    // Throws std::invalid_argument for an empty delegate or a bad config.
    Verifier(const VerifierConfig& cfg, SecretForKey secret_for_key);

    AuthResult authenticate(HttpRequest& R, BodySource src = BodySource::Buffered) const;

    // Same on a dedicated thread. `R` and this verifier must outlive the future.
    std::future<AuthResult> authenticate_async(HttpRequest& R,
                                               BodySource src = BodySource::Buffered) const;

    const VerifierConfig& config() const { return _cfg; }

private:
    VerifierConfig _cfg;
    SecretForKey   _secret_for_key;

    bool drain_body(HttpRequest& R, AuthResult& fail) const;
    bool resolve_secret(HttpRequest& R, const std::string& api_key,
                        std::string& out_secret, AuthResult& fail) const;
    bool check_date(const std::string& date_hdr, AuthResult& fail) const;

    AuthResult finish(const HttpRequest& R, AuthResult r) const;
    void log(const std::string& line) const;
};

} // namespace hs
