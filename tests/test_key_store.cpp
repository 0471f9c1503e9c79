/*
 * Part of the HmacSeal (HS) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacSeal contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacSeal (HS). See LICENSE for details.
 */

#include <gtest/gtest.h>

#include "hs/internal/key_store.hpp"

#include <chrono>
#include <cstdio>
#include <fstream>
#include <future>
#include <memory>
#include <string>

namespace {

// Writes `content` to a fresh file under the test temp dir.
class KeyFile {
public:
    KeyFile(const std::string& name, const std::string& content)
        : _path(::testing::TempDir() + name)
    {
        std::ofstream out(_path, std::ios::trunc);
        out << content;
    }
    ~KeyFile() { std::remove(_path.c_str()); }
    const std::string& path() const { return _path; }
private:
    std::string _path;
};

} // namespace

TEST(KeyStore, FileBackendLookups) {
    KeyFile f("hs_keys_ok.txt",
              "# api_key secret\n"
              "\n"
              "12345 SECRET\n"
              "  device-7   s3cr3t with spaces  \n");
    hs::internal::KeyStore ks;
    ASSERT_TRUE(ks.init_file(f.path()));

    hs::SecretLookup r = ks.lookup("12345");
    EXPECT_EQ(r.status, hs::SecretLookup::Status::Found);
    EXPECT_EQ(r.secret, "SECRET");

    r = ks.lookup("device-7");
    EXPECT_EQ(r.status, hs::SecretLookup::Status::Found);
    EXPECT_EQ(r.secret, "s3cr3t with spaces");

    EXPECT_EQ(ks.lookup("nobody").status, hs::SecretLookup::Status::NotFound);
}

TEST(KeyStore, UninitializedLookupFails) {
    hs::internal::KeyStore ks;
    const hs::SecretLookup r = ks.lookup("12345");
    EXPECT_EQ(r.status, hs::SecretLookup::Status::Failed);
    EXPECT_FALSE(r.error.empty());
}

TEST(KeyStore, RejectsMissingFile) {
    hs::internal::KeyStore ks;
    EXPECT_FALSE(ks.init_file(::testing::TempDir() + "hs_keys_does_not_exist.txt"));
}

TEST(KeyStore, RejectsLineWithoutSecret) {
    KeyFile f("hs_keys_bad.txt", "12345 SECRET\nlonely\n");
    hs::internal::KeyStore ks;
    EXPECT_FALSE(ks.init_file(f.path()));
}

TEST(KeyStore, RejectsDuplicateKey) {
    KeyFile f("hs_keys_dup.txt", "12345 a\n12345 b\n");
    hs::internal::KeyStore ks;
    EXPECT_FALSE(ks.init_file(f.path()));
}

TEST(KeyStore, FeedsThreadedDelegate) {
    KeyFile f("hs_keys_delegate.txt", "12345 SECRET\n");
    auto ks = std::make_shared<hs::internal::KeyStore>();
    ASSERT_TRUE(ks->init_file(f.path()));

    hs::SecretForKey d = hs::make_threaded_delegate([ks](const std::string& k) {
        return ks->lookup(k);
    });

    auto p = std::make_shared<std::promise<hs::SecretLookup>>();
    auto fut = p->get_future();
    d("12345", [p](hs::SecretLookup r) { p->set_value(std::move(r)); });
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    const hs::SecretLookup r = fut.get();
    EXPECT_EQ(r.status, hs::SecretLookup::Status::Found);
    EXPECT_EQ(r.secret, "SECRET");
}
