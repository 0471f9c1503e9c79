/*
 * Part of the HmacSeal (HS) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacSeal contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacSeal (HS). See LICENSE for details.
 */

#pragma once
#include <functional>
#include <optional>
#include <string>

namespace hs {

// Answer from the application for one API key.
struct SecretLookup {
    enum class Status {
        Found,     // `secret` is valid
        NotFound,  // key unknown: caller error
        Failed     // lookup broke: infrastructure error, `error` says why
    };

    Status      status = Status::NotFound;
    std::string secret;
    std::string error;

    static SecretLookup found(std::string secret);
    static SecretLookup not_found();
    static SecretLookup failed(std::string error);
};

// Completion handle passed to the delegate. May be called from any thread;
// only the first call is taken into account.
using SecretReply = std::function<void(SecretLookup)>;

// Application-supplied key -> secret resolver. It may reply before returning,
// later from another thread, or never (the verifier times out).
using SecretForKey = std::function<void(const std::string& api_key, SecretReply reply)>;

// Wraps a blocking lookup that runs inline on the verifying thread.
// std::nullopt means "not found"; a thrown exception means "failed".
SecretForKey make_sync_delegate(std::function<std::optional<std::string>(const std::string&)> lookup);

// Wraps a blocking lookup that runs on a detached worker thread, so the
// verifier timeout still bounds slow back ends. `lookup` is copied into the
// worker and must stay valid on its own (capture shared state by shared_ptr).
SecretForKey make_threaded_delegate(std::function<SecretLookup(const std::string&)> lookup);

} // namespace hs
