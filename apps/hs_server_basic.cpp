// SPDX-License-Identifier: Apache-2.0
// Part of HmacSeal (HS) project.
// apps/hs_server_basic.cpp

#include "hs/server.hpp"
#include "hs/server_config.hpp"
#include "hs/log.hpp"

#include <iostream>
#include <string>
#include <unistd.h>   // dup2, STDOUT_FILENO, STDERR_FILENO
#include <fcntl.h>    // open

// Silences all console output by redirecting stdout/stderr to /dev/null.
// This is process-wide and affects all library logs printing to stdio.
static void make_process_quiet() {
    int nullfd = ::open("/dev/null", O_WRONLY);
    if (nullfd >= 0) {
        (void)::dup2(nullfd, STDOUT_FILENO);
        (void)::dup2(nullfd, STDERR_FILENO);
        ::close(nullfd);
    }
}

static void usage(const char* argv0) {
    std::cerr <<
      "Usage:\n  " << argv0
      << " --port <n> [--auth_file <path>]\n"
         "  [--timeout_ms 10000]               secret lookup timeout\n"
         "  [--skew_ms 60000]                  permitted date skew\n"
         "  [--body_limit 5mb]                 b | kb | mb | gb\n"
         "  [--verbose 0|1]                    log every authentication outcome\n"
         "  [--redact_errors 0|1]\n"
         "  [--ka_timeout 5] [--ka_max 100]\n"
         "  [--log_file <path>]\n"
         "  [--quiet 0|1]                      (suppress all console logs when 1)\n"
         "  Redis key backend:\n"
         "    --auth_redis 1 "
         "[--redis_host 127.0.0.1] [--redis_port 6379] [--redis_db 0]\n"
         "    [--redis_password ****] [--redis_prefix hs:key:] [--redis_pool 8]\n"
         "    [--redis_timeout_ms 200] [--auth_cache_ttl 60]\n";
}

int main(int argc, char** argv) {
    hs::ServerConfig cfg;
    std::string log_file;
    bool quiet = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--port" && i+1 < argc) cfg.port = (uint16_t)std::stoi(argv[++i]);
            else if (a == "--auth_file" && i+1 < argc) cfg.auth_file = argv[++i];
            else if (a == "--timeout_ms" && i+1 < argc) cfg.verifier.secret_for_key_timeout_ms = std::stoi(argv[++i]);
            else if (a == "--skew_ms" && i+1 < argc) cfg.verifier.permitted_timestamp_skew_ms = std::stoll(argv[++i]);
            else if (a == "--body_limit" && i+1 < argc) {
                const std::string v = argv[++i];
                if (!hs::parse_size(v, cfg.verifier.body_size_limit)) {
                    std::cerr << "Bad --body_limit: " << v << "\n";
                    return 2;
                }
            }
            else if (a == "--verbose" && i+1 < argc) cfg.verifier.verbose = (std::stoi(argv[++i]) != 0);
            else if (a == "--redact_errors" && i+1 < argc) cfg.redact_errors = (std::stoi(argv[++i]) != 0);
            else if (a == "--ka_timeout" && i+1 < argc) cfg.ka_timeout_sec = std::stoi(argv[++i]);
            else if (a == "--ka_max" && i+1 < argc) cfg.ka_max = std::stoi(argv[++i]);
            else if (a == "--log_file" && i+1 < argc) log_file = argv[++i];
            else if (a == "--quiet" && i+1 < argc) quiet = (std::stoi(argv[++i]) != 0);

            // Redis backend flags
            else if (a == "--auth_redis" && i+1 < argc) cfg.auth_use_redis = (std::stoi(argv[++i]) != 0);
            else if (a == "--redis_host" && i+1 < argc) cfg.redis.host = argv[++i];
            else if (a == "--redis_port" && i+1 < argc) cfg.redis.port = std::stoi(argv[++i]);
            else if (a == "--redis_db" && i+1 < argc)   cfg.redis.db = std::stoi(argv[++i]);
            else if (a == "--redis_password" && i+1<argc) cfg.redis.password = argv[++i];
            else if (a == "--redis_prefix" && i+1<argc)   cfg.redis.key_prefix = argv[++i];
            else if (a == "--redis_pool" && i+1<argc)     cfg.redis.pool_size = std::stoi(argv[++i]);
            else if (a == "--redis_timeout_ms" && i+1<argc) cfg.redis.timeout_ms = std::stoi(argv[++i]);
            else if (a == "--auth_cache_ttl" && i+1<argc)   cfg.redis.cache_ttl_sec = std::stoi(argv[++i]);

            else { usage(argv[0]); return 2; }
        }
    } catch (const std::exception&) {
        // std::stoi and friends on a non-numeric value
        usage(argv[0]);
        return 2;
    }

    // Apply quiet mode before any logging can occur.
    if (quiet) {
        make_process_quiet();
    }
    hs::set_log_file(log_file);

    // Key backend requirement
    if (!cfg.auth_use_redis && cfg.auth_file.empty()) {
        std::cerr << "Either --auth_file (file backend) or --auth_redis 1 (Redis backend) must be provided\n";
        return 2;
    }

    try {
        hs::Server srv(cfg);
        srv.run();  // blocking
    } catch (const std::exception& e) {
        // Note: if --quiet 1 is used, this message is suppressed as well.
        std::cerr << "[FATAL] exception: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
