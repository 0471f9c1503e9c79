/*
 * Part of the HmacSeal (HS) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacSeal contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacSeal (HS). See LICENSE for details.
 */

#include "hs/sign.hpp"
#include "hs/internal/utils.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace hs {

UnsupportedAlgorithm::UnsupportedAlgorithm(const std::string& name)
    : std::invalid_argument("unsupported HMAC algorithm: \"" + name + "\"")
    , _name(name)
{}

std::optional<Algorithm> parse_algorithm(const std::string& name) {
    if (name == "sha1")   return Algorithm::Sha1;
    if (name == "sha256") return Algorithm::Sha256;
    if (name == "sha512") return Algorithm::Sha512;
    return std::nullopt;
}

const char* algorithm_name(Algorithm alg) {
    switch (alg) {
    case Algorithm::Sha1:   return "sha1";
    case Algorithm::Sha256: return "sha256";
    case Algorithm::Sha512: return "sha512";
    }
    return "";
}

const std::vector<std::string>& supported_algorithms() {
    static const std::vector<std::string> names = {"sha1", "sha256", "sha512"};
    return names;
}

static const EVP_MD* evp_for(Algorithm alg) {
    switch (alg) {
    case Algorithm::Sha1:   return EVP_sha1();
    case Algorithm::Sha256: return EVP_sha256();
    case Algorithm::Sha512: return EVP_sha512();
    }
    return nullptr;
}

std::string sign(const std::string& canonical, const std::string& secret, Algorithm alg) {
    const EVP_MD* md = evp_for(alg);
    if (!md) throw std::runtime_error("HMAC: no digest for algorithm");

    unsigned int mac_len = 0;
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned char* p = HMAC(md,
                            secret.data(), (int)secret.size(),
                            reinterpret_cast<const unsigned char*>(canonical.data()),
                            canonical.size(),
                            mac, &mac_len);
    if (!p || mac_len == 0) {
        throw std::runtime_error(std::string("HMAC failed for ") + algorithm_name(alg));
    }
    return internal::bytes_to_hex(mac, mac_len);
}

std::string sign(const std::string& canonical, const std::string& secret,
                 const std::string& algorithm)
{
    const auto alg = parse_algorithm(algorithm);
    if (!alg) throw UnsupportedAlgorithm(algorithm);
    return sign(canonical, secret, *alg);
}

} // namespace hs
