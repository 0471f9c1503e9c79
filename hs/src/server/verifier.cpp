/*
 * Part of the HmacSeal (HS) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacSeal contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacSeal (HS). See LICENSE for details.
 */

#include "hs/verifier.hpp"
#include "hs/abort_signal.hpp"
#include "hs/canonical.hpp"
#include "hs/log.hpp"
#include "hs/sign.hpp"
#include "hs/internal/http_parser.hpp"
#include "hs/internal/secret_latch.hpp"
#include "hs/internal/time.hpp"
#include "hs/internal/utils.hpp"

#include <chrono>
#include <cstdlib>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace hs {

namespace {

AuthResult failure(AuthStatus status, const char* code, std::string message,
                   std::string details = {})
{
    AuthResult r;
    r.status  = status;
    r.code    = code;
    r.message = std::move(message);
    r.details = std::move(details);
    return r;
}

AuthResult rejected(const char* code, std::string message, std::string details = {}) {
    return failure(AuthStatus::Rejected, code, std::move(message), std::move(details));
}

AuthResult errored(const char* code, std::string message, std::string details = {}) {
    return failure(AuthStatus::Errored, code, std::move(message), std::move(details));
}

// Split on runs of blanks.
std::vector<std::string> split_ws(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream iss(s);
    for (std::string tok; iss >> tok; ) out.push_back(tok);
    return out;
}

std::string join_quoted(const std::vector<std::string>& v) {
    std::string out;
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (i) out += ", ";
        out += "\"" + v[i] + "\"";
    }
    return out;
}

} // namespace

Verifier::Verifier(const VerifierConfig& cfg, SecretForKey secret_for_key)
    : _cfg(cfg)
    , _secret_for_key(std::move(secret_for_key))
{
    if (!_secret_for_key) {
        throw std::invalid_argument(
            "Verifier: missing secret_for_key delegate; supply a function resolving API keys to secrets");
    }
    if (_cfg.secret_for_key_timeout_ms <= 0) {
        throw std::invalid_argument("Verifier: secret_for_key_timeout_ms must be positive");
    }
    if (_cfg.permitted_timestamp_skew_ms < 0) {
        throw std::invalid_argument("Verifier: permitted_timestamp_skew_ms must not be negative");
    }
}

void Verifier::log(const std::string& line) const {
    if (_cfg.verbose) hs::log_line(line);
}

AuthResult Verifier::finish(const HttpRequest& R, AuthResult r) const {
    if (r.ok()) {
        log("[AUTH] authenticated key=" + r.api_key + " " + R.method + " " + R.path);
    } else {
        log(std::string("[AUTH] ") + auth_status_name(r.status) + " code=" + r.code +
            (R.api_key.empty() ? std::string() : " key=" + R.api_key) +
            " " + R.method + " " + R.path + ": " + r.message);
    }
    return r;
}

bool Verifier::drain_body(HttpRequest& R, AuthResult& fail) const {
    if (R.body_buffered) return true;
    if (!R.read_body) {
        fail = errored("REQUEST_BODY_UNREADABLE",
                       "Request body was not buffered and no body reader is attached");
        return false;
    }
    std::string data;
    switch (R.read_body(_cfg.body_size_limit, data)) {
    case BodyRead::Ok:
        R.body.swap(data);
        R.body_buffered = true;
        return true;
    case BodyRead::TooLarge:
        fail = rejected("REQUEST_BODY_TOO_LARGE",
                        "Request body exceeds the limit of " +
                        std::to_string(_cfg.body_size_limit) + " bytes");
        return false;
    case BodyRead::Failed:
        break;
    }
    fail = errored("REQUEST_BODY_UNREADABLE", "Failed to read the request body");
    return false;
}

bool Verifier::resolve_secret(HttpRequest& R, const std::string& api_key,
                              std::string& out_secret, AuthResult& fail) const
{
    using Outcome = internal::SecretLatch::Outcome;

    auto latch = std::make_shared<internal::SecretLatch>();
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(_cfg.secret_for_key_timeout_ms);

    // Abort only needs a weak link; the reply below keeps the latch alive.
    std::size_t abort_id = 0;
    if (R.abort) {
        std::weak_ptr<internal::SecretLatch> weak = latch;
        abort_id = R.abort->subscribe([weak]() {
            if (auto l = weak.lock()) l->settle(Outcome::Aborted);
        });
    }

    SecretReply reply = [latch](SecretLookup r) {
        latch->settle(Outcome::Replied, std::move(r));
    };

    try {
        _secret_for_key(api_key, reply);
    } catch (const std::exception& e) {
        latch->settle(Outcome::Replied, SecretLookup::failed(e.what()));
    } catch (...) {
        latch->settle(Outcome::Replied, SecretLookup::failed("unknown exception"));
    }

    const Outcome outcome = latch->wait_until(deadline);
    if (R.abort) R.abort->unsubscribe(abort_id);

    const std::string where =
        "Internal failure while attempting to locate secret for API key \"" + api_key + "\"";

    switch (outcome) {
    case Outcome::TimedOut: {
        std::ostringstream os;
        os << where << ": secret lookup timed out after "
           << _cfg.secret_for_key_timeout_ms << " ms";
        fail = errored("INTERNAL_ERROR_SECRET_TIMEOUT", os.str());
        return false;
    }
    case Outcome::Aborted:
        fail = errored("REQUEST_ABORTED", "Request was aborted during secret lookup");
        return false;
    case Outcome::Pending:
    case Outcome::Replied:
        break;
    }

    SecretLookup r = latch->take();
    switch (r.status) {
    case SecretLookup::Status::Found:
        out_secret = std::move(r.secret);
        return true;
    case SecretLookup::Status::NotFound:
        fail = rejected("API_KEY_UNRECOGNIZED", "Unrecognized API key: " + api_key);
        return false;
    case SecretLookup::Status::Failed:
        break;
    }
    log("[AUTH] secret lookup failed for key=" + api_key + ": " + r.error);
    fail = errored("INTERNAL_ERROR_SECRET_DISCOVERY", where, r.error);
    return false;
}

bool Verifier::check_date(const std::string& date_hdr, AuthResult& fail) const {
    const std::int64_t now_ms = unix_now_ms();
    const std::string now_s = format_http_date(static_cast<std::time_t>(now_ms / 1000));

    constexpr std::int64_t kMaxEpochSec = std::numeric_limits<std::int64_t>::max() / 2000;

    std::int64_t ts_epoch = 0;
    if (!parse_timestamp(date_hdr, ts_epoch) || ts_epoch > kMaxEpochSec || ts_epoch < -kMaxEpochSec) {
        fail = rejected("DATE_HEADER_INVALID",
                        "Timestamp is unreadable. Received: \"" + date_hdr +
                        "\" current time: \"" + now_s + "\"");
        fail.time = now_s;
        return false;
    }

    const std::int64_t skew = std::llabs(now_ms - ts_epoch * 1000);
    if (skew > _cfg.permitted_timestamp_skew_ms) {
        fail = rejected("DATE_HEADER_INVALID",
                        "Timestamp is outside the permitted window. Received: \"" + date_hdr +
                        "\" current time: \"" + now_s + "\"");
        fail.time = now_s;
        return false;
    }
    return true;
}

AuthResult Verifier::authenticate(HttpRequest& R, BodySource src) const {
    R.authenticated = false;
    R.api_key.clear();
    R.secret.clear();
    R.signature.clear();
    R.signature_expected.clear();

    AuthResult fail;

    if (src == BodySource::Drain && !drain_body(R, fail)) {
        return finish(R, fail);
    }

    // 1) API key: header first, then ?apiKey=
    std::string api_key;
    if (const std::string* h = internal::find_header(R.headers, "x-api-key")) {
        api_key = internal::trim_copy(*h);
    } else {
        for (const auto& kv : parse_query(R.query)) {
            if (kv.first == "apiKey") { api_key = kv.second; break; }
        }
    }
    if (api_key.empty()) {
        return finish(R, rejected("API_KEY_MISSING", "Missing API Key"));
    }
    R.api_key = api_key;

    // 2) secret
    std::string secret;
    if (!resolve_secret(R, api_key, secret, fail)) {
        return finish(R, fail);
    }
    R.secret = secret;

    // 3) mandatory headers
    const std::string* auth_hdr = internal::find_header(R.headers, "authorization");
    if (!auth_hdr) {
        return finish(R, rejected("AUTHORIZATION_HEADER_MISSING",
            "Missing authorization. Please sign all incoming requests with the 'authorization' header."));
    }
    const std::string* date_hdr = internal::find_header(R.headers, "date");
    if (!date_hdr) {
        return finish(R, rejected("DATE_HEADER_MISSING",
            "Missing timestamp. Please timestamp all incoming requests by including 'date' header."));
    }

    // 4) freshness
    if (!check_date(*date_hdr, fail)) {
        return finish(R, fail);
    }

    // 5) "signature <algorithm> <hex>"
    const std::vector<std::string> parts = split_ws(*auth_hdr);
    if (parts.size() != 3 || parts[0] != "signature") {
        return finish(R, rejected("AUTHORIZATION_HEADER_INVALID",
            "Authorization header is improperly formatted: \"" + *auth_hdr + "\"",
            "It should look like: \"signature sha256 "
            "a42d7b09a929b997aa8e6973bdbd5ca94326cbffc3d06a557d9ed36c6b80d4ff\""));
    }
    const std::string& alg_name  = parts[1];
    const std::string& presented = parts[2];

    const auto alg = parse_algorithm(alg_name);
    if (!alg) {
        return finish(R, rejected("HMAC_ALGORITHM_INVALID",
            "Authorization header sent invalid algorithm: \"" + alg_name +
            "\". The only supported hmac algorithms are: " + join_quoted(supported_algorithms())));
    }

    // 6) recompute
    std::string expected;
    try {
        const std::string canonical =
            canonicalize(R.method, R.path, parse_query(R.query), R.headers, R.body);
        expected = sign(canonical, secret, *alg);
    } catch (const std::exception& e) {
        return finish(R, errored("INTERNAL_ERROR_SIGNATURE", "Failed to compute signature", e.what()));
    }

    R.signature          = presented;
    R.signature_expected = expected;

    // 7) compare
    if (!internal::ct_equal(presented, expected)) {
        return finish(R, rejected("SIGNATURE_INVALID", "Signature is invalid."));
    }

    R.authenticated = true;

    AuthResult ok;
    ok.status    = AuthStatus::Authenticated;
    ok.api_key   = api_key;
    ok.secret    = std::move(secret);
    ok.signature = presented;
    return finish(R, std::move(ok));
}

std::future<AuthResult> Verifier::authenticate_async(HttpRequest& R, BodySource src) const {
    return std::async(std::launch::async, [this, &R, src]() {
        return authenticate(R, src);
    });
}

} // namespace hs
