/*
 * Part of the HmacSeal (HS) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacSeal contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacSeal (HS). See LICENSE for details.
 */

#include "hs/abort_signal.hpp"
#include <algorithm>

namespace hs {

void AbortSignal::abort() {
    std::vector<std::pair<std::size_t, Listener>> fire;
    {
        std::lock_guard<std::mutex> lk(_mtx);
        if (_aborted) return;
        _aborted = true;
        fire.swap(_listeners);
    }
    // Listeners run unlocked so they may call back into the signal.
    for (auto& l : fire) {
        if (l.second) l.second();
    }
}

bool AbortSignal::aborted() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _aborted;
}

std::size_t AbortSignal::subscribe(Listener fn) {
    {
        std::lock_guard<std::mutex> lk(_mtx);
        if (!_aborted) {
            const std::size_t id = _next_id++;
            _listeners.emplace_back(id, std::move(fn));
            return id;
        }
    }
    if (fn) fn();
    return 0;
}

void AbortSignal::unsubscribe(std::size_t id) {
    if (id == 0) return;
    std::lock_guard<std::mutex> lk(_mtx);
    _listeners.erase(std::remove_if(_listeners.begin(), _listeners.end(),
                                    [id](const auto& l){ return l.first == id; }),
                     _listeners.end());
}

} // namespace hs
