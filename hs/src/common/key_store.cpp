/*
 * Part of the HmacSeal (HS) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacSeal contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacSeal (HS). See LICENSE for details.
 */

#include "hs/internal/key_store.hpp"
#include "hs/internal/utils.hpp"
#include "hs/log.hpp"

#include <fstream>
#include <cctype>
#include <sys/time.h>

namespace hs::internal {

KeyStore::KeyStore() = default;

KeyStore::~KeyStore() {
    for (auto& c : _pool) {
        if (c.ctx) {
            redisFree(c.ctx);
            c.ctx = nullptr;
            c.valid = false;
        }
    }
    std::lock_guard<std::mutex> lk(_file_mtx);
    for (auto& kv : _file_map) secure_wipe(kv.second);
}

/* ---------------- File backend ---------------- */

bool KeyStore::init_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.good()) {
        hs::log_line(std::string("[KEYS] failed to open file: ")+path);
        return false;
    }
    std::unordered_map<std::string,std::string> tmp;
    size_t line_no = 0;
    for (std::string line; std::getline(in, line); ) {
        ++line_no;
        trim_inplace(line);
        if (line.empty() || line[0]=='#') continue;

        size_t sp = 0;
        while (sp < line.size() && !std::isspace((unsigned char)line[sp])) ++sp;
        std::string key = line.substr(0, sp);
        std::string secret = trim_copy(line.substr(sp));
        if (key.empty() || secret.empty()) {
            hs::log_line("[KEYS] bad line "+std::to_string(line_no));
            return false;
        }
        if (!tmp.emplace(key, std::move(secret)).second) {
            hs::log_line("[KEYS] duplicate key at line "+std::to_string(line_no));
            return false;
        }
    }
    {
        std::lock_guard<std::mutex> lk(_file_mtx);
        _file_map.swap(tmp);
        _backend = Backend::File;
    }
    for (auto& kv : tmp) secure_wipe(kv.second);
    hs::log_line("[KEYS] file backend initialized: "+std::to_string(_file_map.size())+" entries");
    return true;
}

/* ---------------- Redis backend ---------------- */

bool KeyStore::init_redis(const RedisOptions& opt) {
    _opt = opt;
    if (_opt.pool_size <= 0) _opt.pool_size = 1;

    _pool.resize(_opt.pool_size);

    // Pre-connect all slots (best effort)
    size_t connected = 0;
    for (size_t i=0; i<_pool.size(); ++i) {
        if (redis_connect_one(i)) ++connected;
    }
    {
        std::lock_guard<std::mutex> lk(_pool_mtx);
        _free.clear();
        for (size_t i=0; i<_pool.size(); ++i) _free.push_back(i);
    }
    {
        std::lock_guard<std::mutex> lk(_cache_mtx);
        _cache.clear();
    }
    _backend = Backend::Redis;
    hs::log_line("[KEYS] redis backend initialized: pool="+std::to_string(_pool.size())+
                 " connected="+std::to_string(connected)+
                 " host="+_opt.host+":"+std::to_string(_opt.port)+
                 " db="+std::to_string(_opt.db)+
                 " prefix="+_opt.key_prefix+
                 " cache_ttl="+std::to_string(_opt.cache_ttl_sec)+"s");
    return true;
}

bool KeyStore::redis_connect_one(size_t idx) {
    if (idx >= _pool.size()) return false;

    timeval tv{};
    tv.tv_sec  = _opt.timeout_ms / 1000;
    tv.tv_usec = (_opt.timeout_ms % 1000) * 1000;

    ::redisContext* ctx = redisConnectWithTimeout(_opt.host.c_str(), _opt.port, tv);
    if (!ctx || ctx->err) {
        if (ctx) {
            hs::log_line(std::string("[KEYS][redis] connect error: ")+ctx->errstr);
            redisFree(ctx);
        } else {
            hs::log_line("[KEYS][redis] connect error: NULL context");
        }
        _pool[idx].ctx = nullptr;
        _pool[idx].valid = false;
        return false;
    }
    // Command timeout as well, so a stalled server cannot hold a slot forever.
    (void)redisSetTimeout(ctx, tv);

    if (!redis_auth_and_select(ctx)) {
        redisFree(ctx);
        _pool[idx].ctx = nullptr;
        _pool[idx].valid = false;
        return false;
    }

    _pool[idx].ctx = ctx;
    _pool[idx].valid = true;
    return true;
}

bool KeyStore::redis_auth_and_select(::redisContext* ctx) {
    if (!_opt.password.empty()) {
        redisReply* r = (redisReply*)redisCommand(ctx, "AUTH %s", _opt.password.c_str());
        if (!r) {
            hs::log_line("[KEYS][redis] AUTH failed: no reply");
            return false;
        }
        bool ok = (r->type != REDIS_REPLY_ERROR);
        if (!ok) {
            hs::log_line(std::string("[KEYS][redis] AUTH error: ")+ (r->str ? r->str : ""));
        }
        freeReplyObject(r);
        if (!ok) return false;
    }
    if (_opt.db != 0) {
        redisReply* r = (redisReply*)redisCommand(ctx, "SELECT %d", _opt.db);
        if (!r) {
            hs::log_line("[KEYS][redis] SELECT failed: no reply");
            return false;
        }
        bool ok = (r->type != REDIS_REPLY_ERROR);
        if (!ok) {
            hs::log_line(std::string("[KEYS][redis] SELECT error: ")+ (r->str ? r->str : ""));
        }
        freeReplyObject(r);
        if (!ok) return false;
    }
    return true;
}

void KeyStore::redis_close_one(size_t idx) {
    if (idx >= _pool.size()) return;
    if (_pool[idx].ctx) {
        redisFree(_pool[idx].ctx);
        _pool[idx].ctx = nullptr;
    }
    _pool[idx].valid = false;
}

void KeyStore::Slot::acquire() {
    if (have) return;
    std::unique_lock<std::mutex> lk(store._pool_mtx);
    store._pool_cv.wait(lk, [&]{ return !store._free.empty(); });
    idx = store._free.front();
    store._free.pop_front();
    have = true;
}

void KeyStore::Slot::release() {
    if (!have) return;
    {
        std::lock_guard<std::mutex> lk(store._pool_mtx);
        store._free.push_back(idx);
    }
    store._pool_cv.notify_one();
    idx = (size_t)-1;
    have = false;
}

::redisContext* KeyStore::Slot::ctx() {
    // The slot is exclusively owned by this thread until release().
    auto& c = store._pool[idx];
    if (!c.valid || !c.ctx || c.ctx->err) {
        store.redis_close_one(idx);
        (void)store.redis_connect_one(idx);
    }
    return store._pool[idx].ctx;
}

SecretLookup KeyStore::redis_get_secret(const std::string& api_key) {
    {
        std::lock_guard<std::mutex> lk(_cache_mtx);
        auto it = _cache.find(api_key);
        if (it != _cache.end()) {
            if (std::chrono::steady_clock::now() < it->second.expires) {
                return SecretLookup::found(it->second.secret);
            }
            _cache.erase(it);
        }
    }

    Slot slot(*this);
    slot.acquire();

    ::redisContext* c = slot.ctx();
    if (!c) return SecretLookup::failed("redis unavailable");

    const std::string rkey = _opt.key_prefix + api_key;
    redisReply* r = (redisReply*)redisCommand(c, "GET %s", rkey.c_str());
    if (!r) {
        // Connection likely broken; next acquire will reconnect
        const std::string why = c->errstr[0] ? c->errstr : "no reply";
        return SecretLookup::failed("redis GET failed: " + why);
    }

    SecretLookup out;
    if (r->type == REDIS_REPLY_NIL) {
        out = SecretLookup::not_found();
    } else if (r->type == REDIS_REPLY_STRING && r->str) {
        out = SecretLookup::found(std::string(r->str, r->len));
    } else if (r->type == REDIS_REPLY_ERROR) {
        const std::string err = r->str ? r->str : "";
        hs::log_line("[KEYS][redis] GET error: " + err);
        out = SecretLookup::failed("redis GET error: " + err);
    } else {
        out = SecretLookup::failed("redis GET returned unexpected reply type " + std::to_string(r->type));
    }
    freeReplyObject(r);

    if (out.status == SecretLookup::Status::Found && _opt.cache_ttl_sec > 0) {
        std::lock_guard<std::mutex> lk(_cache_mtx);
        _cache[api_key] = CacheEntry{
            out.secret,
            std::chrono::steady_clock::now() + std::chrono::seconds(_opt.cache_ttl_sec)
        };
    }
    return out;
}

/* ---------------- Public lookup (dispatch by backend) ---------------- */

SecretLookup KeyStore::lookup(const std::string& api_key) {
    if (_backend == Backend::File) {
        std::lock_guard<std::mutex> lk(_file_mtx);
        auto it = _file_map.find(api_key);
        if (it == _file_map.end()) return SecretLookup::not_found();
        return SecretLookup::found(it->second);
    } else if (_backend == Backend::Redis) {
        return redis_get_secret(api_key);
    }
    return SecretLookup::failed("key store is not initialized");
}

} // namespace hs::internal
