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
#include <unordered_map>
#include <vector>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include "hs/secret_delegate.hpp"

// hiredis types live in the global namespace; include the header here
#include <hiredis/hiredis.h>

namespace hs::internal {

/**
 * API key -> secret lookup for the bundled server, backed by a flat file or
 * by Redis. Read-only: keys are provisioned elsewhere.
 * Thread-safe lookups. When Redis is used, secrets are cached in-memory with TTL.
 */
class KeyStore {
public:
    KeyStore();
    ~KeyStore();

    KeyStore(const KeyStore&) = delete;
    KeyStore& operator=(const KeyStore&) = delete;

    // ---- File backend: "<api_key> <secret>" per line, '#' comments ----
    bool init_file(const std::string& path);

    // ---- Redis backend ----
    struct RedisOptions {
        std::string host = "127.0.0.1";
        int         port = 6379;
        int         db   = 0;                 // SELECT db
        std::string password;                 // optional
        std::string key_prefix = "hs:key:";   // key = key_prefix + api_key
        int         pool_size  = 8;           // number of hiredis connections
        int         timeout_ms = 200;         // connect + command timeout
        int         cache_ttl_sec = 60;       // TTL for in-memory cache entries
    };
    bool init_redis(const RedisOptions& opt);

    // Found / NotFound, or Failed when the back end could not answer.
    SecretLookup lookup(const std::string& api_key);

private:
    enum class Backend { None, File, Redis };
    Backend _backend = Backend::None;

    // -------- File map --------
    std::mutex _file_mtx;
    std::unordered_map<std::string, std::string> _file_map; // api_key -> secret

    // -------- Redis pool + cache --------
    struct RedisConn { ::redisContext* ctx = nullptr; bool valid = false; };
    std::vector<RedisConn> _pool;
    std::deque<size_t>     _free;
    std::mutex             _pool_mtx;
    std::condition_variable _pool_cv;

    RedisOptions _opt{};

    struct CacheEntry {
        std::string secret;
        std::chrono::steady_clock::time_point expires;
    };
    std::mutex _cache_mtx;
    std::unordered_map<std::string, CacheEntry> _cache;

    bool redis_connect_one(size_t idx);
    void redis_close_one(size_t idx);
    bool redis_auth_and_select(::redisContext* ctx);
    SecretLookup redis_get_secret(const std::string& api_key);

    // RAII slot guard for pool index
    class Slot {
    public:
        explicit Slot(KeyStore& s) : store(s) {}
        ~Slot() { release(); }
        void acquire();
        void release();
        ::redisContext* ctx();     // ensure connected and return pointer
    private:
        KeyStore& store;
        size_t idx = (size_t)-1;
        bool   have = false;
    };
};

} // namespace hs::internal
