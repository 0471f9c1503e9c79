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
#include <mutex>
#include <utility>
#include <vector>

namespace hs {

// One-shot abort flag with listeners. Thread-safe.
class AbortSignal {
public:
    using Listener = std::function<void()>;

    AbortSignal() = default;
    AbortSignal(const AbortSignal&) = delete;
    AbortSignal& operator=(const AbortSignal&) = delete;

    // Marks the signal and runs every listener once. Later calls are no-ops.
    void abort();
    bool aborted() const;

    // Registers a listener; runs it right away if already aborted.
    // Returns an id for unsubscribe (0 when it ran immediately).
    std::size_t subscribe(Listener fn);
    void unsubscribe(std::size_t id);

private:
    mutable std::mutex _mtx;
    bool _aborted = false;
    std::size_t _next_id = 1;
    std::vector<std::pair<std::size_t, Listener>> _listeners;
};

} // namespace hs
