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
#include <type_traits>
#include <utility>
#include <vector>

namespace hs {

/**
 * Structured query parameter value on the signing side.
 *
 * Flattening (see flatten_query) turns it into plain pairs:
 *   scalar "v" under key k   ->  k=v
 *   list element i under k   ->  k[i]   (0-based, recursive)
 *   map field f under k      ->  k[f]   (recursive, field order kept)
 *   empty list / empty map   ->  nothing
 * Booleans are "true"/"false", integers their decimal form.
 */
struct QueryValue {
    enum class Kind { Scalar, List, Map };

    Kind kind = Kind::Scalar;
    std::string scalar;
    std::vector<QueryValue> items;                           // Kind::List
    std::vector<std::pair<std::string, QueryValue>> fields;  // Kind::Map

    QueryValue() = default;
    QueryValue(std::string s) : scalar(std::move(s)) {}
    QueryValue(const char* s) : scalar(s ? s : "") {}
    QueryValue(bool b) : scalar(b ? "true" : "false") {}

    template <typename T,
              typename std::enable_if<std::is_integral<T>::value &&
                                      !std::is_same<T, bool>::value, int>::type = 0>
    QueryValue(T v) : scalar(std::to_string(v)) {}

    static QueryValue list(std::vector<QueryValue> v) {
        QueryValue q;
        q.kind = Kind::List;
        q.items = std::move(v);
        return q;
    }

    static QueryValue map(std::vector<std::pair<std::string, QueryValue>> f) {
        QueryValue q;
        q.kind = Kind::Map;
        q.fields = std::move(f);
        return q;
    }
};

// Ordered, possibly structured parameters as handed to the client signer.
using QueryParams = std::vector<std::pair<std::string, QueryValue>>;

} // namespace hs
