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

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

namespace predacl::auth {
/// Need to be stable, auth durability depends on this
enum class PasswordHashAlgorithm : uint8_t { BCRYPT = 0, SHA256 = 1, SHA256_MULTIPLE = 2 };

void SetHashAlgorithm(std::string_view algo);

auto CurrentHashAlgorithm() -> PasswordHashAlgorithm;

auto AsString(PasswordHashAlgorithm hash_algo) -> std::string_view;

struct HashedPassword {
  HashedPassword() = default;
  HashedPassword(PasswordHashAlgorithm hash_algo, std::string password_hash)
      : hash_algo{hash_algo}, password_hash{std::move(password_hash)} {}

  friend bool operator==(HashedPassword const &, HashedPassword const &) = default;

  bool VerifyPassword(const std::string &password) const;

  auto HashAlgo() const -> PasswordHashAlgorithm { return hash_algo; }

  friend void to_json(nlohmann::json &j, const HashedPassword &p);
  friend void from_json(const nlohmann::json &j, HashedPassword &p);

 private:
  PasswordHashAlgorithm hash_algo{PasswordHashAlgorithm::BCRYPT};
  std::string password_hash{};
};

/// @throw AuthException if unable to hash the password.
HashedPassword HashPassword(const std::string &password, std::optional<PasswordHashAlgorithm> override_algo = {});

// Primitives used by the token manager.

/// Raw (binary) HMAC-SHA256 of `message` keyed by `key`.
/// @throw AuthException if OpenSSL fails.
std::string HmacSha256(std::string_view key, std::string_view message);

/// Constant time comparison, used for signatures.
bool SecureEquals(std::string_view lhs, std::string_view rhs);

/// @throw AuthException if the system random generator fails.
std::string RandomBytes(size_t size);

/// URL-safe base64 without padding (RFC 4648 section 5), as used by JWT.
std::string Base64UrlEncode(std::string_view data);

/// Returns nullopt for input that isn't valid unpadded URL-safe base64.
std::optional<std::string> Base64UrlDecode(std::string_view data);

std::string ToHex(std::string_view data);
}  // namespace predacl::auth
