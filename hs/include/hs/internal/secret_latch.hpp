/*
 * Part of the HmacSeal (HS) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacSeal contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacSeal (HS). See LICENSE for details.
 */

#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>
#include "hs/secret_delegate.hpp"

namespace hs::internal {

/**
 * Settle-once rendezvous between a secret delegate, the lookup deadline and
 * a transport abort. Whoever settles first decides the outcome; every later
 * settle() returns false and is dropped. Shared by pointer so that a
 * delegate replying after the verifier returned still has a valid target.
 */
class SecretLatch {
public:
    enum class Outcome { Pending, Replied, TimedOut, Aborted };

    bool settle(Outcome how, SecretLookup value = {}) {
        {
            std::lock_guard<std::mutex> lk(_mtx);
            if (_outcome != Outcome::Pending) return false;
            _outcome = how;
            _value   = std::move(value);
        }
        _cv.notify_all();
        return true;
    }

    // Waits until settled or the deadline passes. On deadline, settles as
    // TimedOut itself so that a racing reply cannot win afterwards.
    Outcome wait_until(std::chrono::steady_clock::time_point deadline) {
        std::unique_lock<std::mutex> lk(_mtx);
        _cv.wait_until(lk, deadline, [&]{ return _outcome != Outcome::Pending; });
        if (_outcome == Outcome::Pending) {
            _outcome = Outcome::TimedOut;
        }
        return _outcome;
    }

    // Valid once wait_until returned Replied.
    SecretLookup take() {
        std::lock_guard<std::mutex> lk(_mtx);
        return std::move(_value);
    }

private:
    std::mutex _mtx;
    std::condition_variable _cv;
    Outcome _outcome = Outcome::Pending;
    SecretLookup _value;
};

} // namespace hs::internal
