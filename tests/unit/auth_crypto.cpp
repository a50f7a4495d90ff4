// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#include <set>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "auth/crypto.hpp"
#include "auth/exceptions.hpp"

using namespace predacl::auth;
using namespace std::string_literals;

TEST(AuthCrypto, HashAndVerifyEveryAlgorithm) {
  for (const auto algo :
       {PasswordHashAlgorithm::BCRYPT, PasswordHashAlgorithm::SHA256, PasswordHashAlgorithm::SHA256_MULTIPLE}) {
    const auto hash = HashPassword("correct horse", algo);
    EXPECT_EQ(hash.HashAlgo(), algo) << AsString(algo);
    EXPECT_TRUE(hash.VerifyPassword("correct horse")) << AsString(algo);
    EXPECT_FALSE(hash.VerifyPassword("correct horse ")) << AsString(algo);
    EXPECT_FALSE(hash.VerifyPassword("")) << AsString(algo);
  }
}

TEST(AuthCrypto, HashesAreSalted) {
  const auto first = HashPassword("password", PasswordHashAlgorithm::SHA256);
  const auto second = HashPassword("password", PasswordHashAlgorithm::SHA256);
  EXPECT_NE(first, second);
  EXPECT_TRUE(first.VerifyPassword("password"));
  EXPECT_TRUE(second.VerifyPassword("password"));
}

TEST(AuthCrypto, HashSurvivesJson) {
  const auto hash = HashPassword("password", PasswordHashAlgorithm::SHA256_MULTIPLE);
  const nlohmann::json data = hash;
  const auto loaded = data.get<HashedPassword>();
  EXPECT_EQ(loaded, hash);
  EXPECT_TRUE(loaded.VerifyPassword("password"));
}

TEST(AuthCrypto, SetHashAlgorithm) {
  const auto previous = CurrentHashAlgorithm();
  SetHashAlgorithm("sha256");
  EXPECT_EQ(CurrentHashAlgorithm(), PasswordHashAlgorithm::SHA256);
  EXPECT_EQ(HashPassword("x").HashAlgo(), PasswordHashAlgorithm::SHA256);
  SetHashAlgorithm(AsString(previous));
  EXPECT_EQ(CurrentHashAlgorithm(), previous);
}

TEST(AuthCrypto, HmacSha256KnownAnswer) {
  // RFC 4231, test case 2.
  EXPECT_EQ(ToHex(HmacSha256("Jefe", "what do ya want for nothing?")),
            "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(AuthCrypto, SecureEquals) {
  EXPECT_TRUE(SecureEquals("signature", "signature"));
  EXPECT_FALSE(SecureEquals("signature", "signaturf"));
  EXPECT_FALSE(SecureEquals("signature", "signatur"));
  EXPECT_TRUE(SecureEquals("", ""));
}

TEST(AuthCrypto, RandomBytes) {
  EXPECT_EQ(RandomBytes(32).size(), 32);
  std::set<std::string> seen;
  for (int i = 0; i < 16; ++i) seen.insert(RandomBytes(16));
  EXPECT_EQ(seen.size(), 16);
}

TEST(AuthCrypto, Base64Url) {
  EXPECT_EQ(Base64UrlEncode(""), "");
  EXPECT_EQ(Base64UrlEncode("hello"), "aGVsbG8");
  EXPECT_EQ(Base64UrlEncode("\xfb\xff"s), "-_8");
  EXPECT_EQ(Base64UrlEncode(R"({"alg":"HS256","typ":"JWT"})"), "eyJhbGciOiJIUzI1NiIsInR5cCI6IkpXVCJ9");

  EXPECT_EQ(Base64UrlDecode("aGVsbG8").value(), "hello");
  EXPECT_EQ(Base64UrlDecode("-_8").value(), "\xfb\xff"s);
  EXPECT_EQ(Base64UrlDecode("").value(), "");

  const auto binary = RandomBytes(33);
  EXPECT_EQ(Base64UrlDecode(Base64UrlEncode(binary)).value(), binary);
}

TEST(AuthCrypto, Base64UrlRejectsGarbage) {
  EXPECT_FALSE(Base64UrlDecode("aGVsbG8="));
  EXPECT_FALSE(Base64UrlDecode("aGV+bG8"));
  EXPECT_FALSE(Base64UrlDecode("a.b"));
  EXPECT_FALSE(Base64UrlDecode("aGVsb"));
}

TEST(AuthCrypto, ToHex) {
  EXPECT_EQ(ToHex(""), "");
  EXPECT_EQ(ToHex("\x01\xab\xff"s), "01abff");
}
