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

namespace hs {

enum class AuthStatus {
    Authenticated,
    Rejected,   // caller error: bad headers, unknown key, stale date, bad signature
    Errored     // infrastructure error: secret lookup failed or timed out
};

const char* auth_status_name(AuthStatus s);

// Outcome of one Verifier::authenticate call. Never reused across requests.
struct AuthResult {
    AuthStatus  status = AuthStatus::Rejected;

    // Failure description; `code` is stable, `message` is for humans.
    std::string code;
    std::string message;
    std::string details;
    std::string time;       // server time, set for DATE_HEADER_INVALID

    // Success payload.
    std::string api_key;
    std::string secret;
    std::string signature;

    bool ok() const { return status == AuthStatus::Authenticated; }
};

// {"message":..,"code":..[,"details":..][,"time":..]} on failure,
// {"apiKey":..,"signature":..} on success. The secret is never rendered.
std::string to_json(const AuthResult& r);

} // namespace hs
