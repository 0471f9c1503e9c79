// SPDX-License-Identifier: Apache-2.0
// Part of HmacSeal (HS) project.
// apps/hs_client_cli.cpp

#include "hs/client.hpp"
#include "hs/http_response.hpp"
#include "hs/request_signer.hpp"
#include "hs/sign.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

static void usage(const char* argv0){
    std::cerr <<
      "Usage:\n"
      "  " << argv0 << " --host 127.0.0.1 --port 8080 --api_key KEY --secret SECRET\n"
      "     [--method POST] [--path /items/test] [--query name=value ...] [--data STRING]\n"
      "     [--algorithm sha1|sha256|sha512] [--content_type application/json]\n"
      "     [--base_path /api] [--verbose 0|1] [--log_file <path>]\n"
      "\n"
      "Timeouts:\n"
      "  --connect_timeout <sec>   TCP connect timeout in seconds (default 2)\n"
      "  --io_timeout <sec>        per-op I/O timeout in seconds (default 2)\n"
      "\n"
      "Offline signing (prints the request instead of sending it):\n"
      "  --print_only 1 [--date \"Tue, 20 Apr 2016 18:48:24 GMT\"]\n";
}

int main(int argc, char** argv){
    hs::ClientConfig cfg;

    // Reasonable defaults to guarantee termination under network stalls:
    cfg.connect_timeout_sec = 2; // seconds
    cfg.io_timeout_sec      = 2; // seconds

    std::string method = "POST";
    std::string path = "/";
    std::string data;
    std::string date;
    bool print_only = false;
    hs::QueryParams query;

    try {
        for(int i=1;i<argc;++i){
            std::string a=argv[i];
            if(a=="--host" && i+1<argc) cfg.host = argv[++i];
            else if(a=="--port" && i+1<argc) cfg.port = (uint16_t)std::stoi(argv[++i]);
            else if(a=="--api_key" && i+1<argc) cfg.api_key = argv[++i];
            else if(a=="--secret" && i+1<argc) cfg.secret = argv[++i];
            else if(a=="--algorithm" && i+1<argc) cfg.algorithm = argv[++i];
            else if(a=="--content_type" && i+1<argc) cfg.content_type = argv[++i];
            else if(a=="--base_path" && i+1<argc) cfg.base_path = argv[++i];
            else if(a=="--method" && i+1<argc) method = argv[++i];
            else if(a=="--path" && i+1<argc) path = argv[++i];
            else if(a=="--data" && i+1<argc) data = argv[++i];
            else if(a=="--query" && i+1<argc) {
                const std::string kv = argv[++i];
                const std::size_t eq = kv.find('=');
                if (eq == std::string::npos) query.emplace_back(kv, "");
                else query.emplace_back(kv.substr(0, eq), kv.substr(eq + 1));
            }
            else if(a=="--date" && i+1<argc) date = argv[++i];
            else if(a=="--print_only" && i+1<argc) print_only = (std::stoi(argv[++i])!=0);
            else if(a=="--verbose" && i+1<argc) cfg.verbose = (std::stoi(argv[++i])!=0);
            else if(a=="--log_file" && i+1<argc) cfg.log_file = argv[++i];
            else if(a=="--connect_timeout" && i+1<argc) cfg.connect_timeout_sec = std::max(1, std::stoi(argv[++i]));
            else if(a=="--io_timeout" && i+1<argc)      cfg.io_timeout_sec      = std::max(1, std::stoi(argv[++i]));
            else { usage(argv[0]); return 2; }
        }
    } catch (const std::exception&) {
        usage(argv[0]);
        return 2;
    }

    if(cfg.api_key.empty() || cfg.secret.empty()){
        std::cerr<<"--api_key and --secret are required\n";
        return 2;
    }
    const auto alg = hs::parse_algorithm(cfg.algorithm);
    if(!alg){
        std::cerr<<"Bad --algorithm: "<<cfg.algorithm<<"\n";
        return 2;
    }

    if (print_only) {
        hs::RequestSigner signer(cfg.api_key, cfg.secret, *alg);
        const hs::SignedRequest sr = signer.sign(method, path, query, data, cfg.content_type, date);
        std::cout<<sr.method<<" "<<sr.target()<<"\n";
        for (const auto& kv: sr.headers){
            std::cout<<kv.first<<": "<<kv.second<<"\n";
        }
        std::cout<<"\n--- canonical ---\n"<<sr.canonical<<"\n";
        return 0;
    }

    try {
        hs::Client cli(cfg);
        hs::HttpResponse resp;
        if(!cli.request(method, path, query, data, resp)){
            std::cerr<<"request() failed\n";
            return 1;
        }
        std::cout<<"HTTP "<<resp.status_code<<" "<<resp.status_text<<"\n";
        for (auto& kv: resp.headers){
            std::cout<<kv.first<<": "<<kv.second<<"\n";
        }
        std::cout<<"\n"<<resp.body<<"\n";
        return resp.status_code == 200 ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr<<"[FATAL] "<<e.what()<<"\n";
        return 1;
    }
}
