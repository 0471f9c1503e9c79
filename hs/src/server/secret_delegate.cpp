/*
 * Part of the HmacSeal (HS) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacSeal contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacSeal (HS). See LICENSE for details.
 */

#include "hs/secret_delegate.hpp"
#include <exception>
#include <stdexcept>
#include <thread>
#include <utility>

namespace hs {

SecretLookup SecretLookup::found(std::string secret) {
    SecretLookup r;
    r.status = Status::Found;
    r.secret = std::move(secret);
    return r;
}

SecretLookup SecretLookup::not_found() {
    return SecretLookup{};
}

SecretLookup SecretLookup::failed(std::string error) {
    SecretLookup r;
    r.status = Status::Failed;
    r.error  = std::move(error);
    return r;
}

SecretForKey make_sync_delegate(std::function<std::optional<std::string>(const std::string&)> lookup) {
    if (!lookup) throw std::invalid_argument("make_sync_delegate: lookup is empty");
    return [lookup = std::move(lookup)](const std::string& api_key, SecretReply reply) {
        std::optional<std::string> secret;
        try {
            secret = lookup(api_key);
        } catch (const std::exception& e) {
            reply(SecretLookup::failed(e.what()));
            return;
        }
        if (!secret) {
            reply(SecretLookup::not_found());
            return;
        }
        reply(SecretLookup::found(std::move(*secret)));
    };
}

SecretForKey make_threaded_delegate(std::function<SecretLookup(const std::string&)> lookup) {
    if (!lookup) throw std::invalid_argument("make_threaded_delegate: lookup is empty");
    return [lookup = std::move(lookup)](const std::string& api_key, SecretReply reply) {
        // The worker owns copies of everything it touches; the verifier may
        // have given up on this lookup by the time it finishes.
        std::thread([lookup, api_key, reply = std::move(reply)]() {
            SecretLookup r;
            try {
                r = lookup(api_key);
            } catch (const std::exception& e) {
                r = SecretLookup::failed(e.what());
            }
            reply(std::move(r));
        }).detach();
    };
}

} // namespace hs
