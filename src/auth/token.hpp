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

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>

#include <nlohmann/json_fwd.hpp>

#include "auth/auth.hpp"
#include "utils/synchronized.hpp"

namespace predacl::auth {

struct TokenPair {
  std::string access_token;
  std::string refresh_token;
  std::chrono::system_clock::time_point access_expiry;
  std::chrono::system_clock::time_point refresh_expiry;
};

/// Identity carried by a verified access token. `groups` is the membership at
/// issue time.
struct AccessClaims {
  std::string identity;
  std::set<std::string> groups;
  std::chrono::system_clock::time_point issued_at;
  std::chrono::system_clock::time_point expiry;
};

/**
 * Issues and verifies access/refresh token pairs.
 *
 * Access tokens are HS256 signed JWTs that embed the user name and the user's
 * groups. Refresh tokens are opaque random strings, redeemable once. Refresh
 * records live in memory only, so a restart forces everyone to log in again.
 *
 * Thread safe.
 */
class TokenManager final {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;
  /// Current groups of a user, nullopt if the user doesn't exist.
  using GroupLookup = std::function<std::optional<std::set<std::string>>(const std::string &)>;

  struct Config {
    /// HMAC key, at least kMinSigningKeySize bytes.
    std::string signing_key;
    std::chrono::seconds access_ttl{std::chrono::hours(6)};
    std::chrono::seconds refresh_ttl{std::chrono::hours(24 * 30)};
    /// Injectable for tests.
    Clock clock{[] { return std::chrono::system_clock::now(); }};
    /// Where Refresh reads the memberships from. Reads the auth store directly when empty.
    GroupLookup user_groups{};
  };

  static constexpr size_t kMinSigningKeySize = 32;

  /// @throw AuthException if the configuration is invalid.
  TokenManager(SynchedAuth *auth, Config config);

  /// @throw InvalidCredentials on unknown user or wrong password.
  TokenPair Authenticate(const std::string &username, const std::string &password);

  /// @throw TokenExpired if the token is past its expiry.
  /// @throw TokenInvalid if the token is malformed or the signature doesn't match.
  AccessClaims VerifyAccess(std::string_view access_token) const;

  /**
   * Consumes the refresh token and issues a new pair with the user's current
   * groups.
   *
   * @throw RefreshExpired if the refresh token is past its expiry.
   * @throw RefreshInvalid if the refresh token is unknown, already used or the
   *        user no longer exists.
   */
  TokenPair Refresh(std::string_view refresh_token);

  /// Drops expired refresh records. Returns the number dropped.
  size_t PurgeExpired();

  size_t OutstandingRefreshTokens() const;

 private:
  struct RefreshRecord {
    std::string identity;
    std::chrono::system_clock::time_point expiry;
  };

  TokenPair Issue(const std::string &identity, const std::set<std::string> &groups);

  std::string Sign(const nlohmann::json &payload) const;

  SynchedAuth *auth_;
  Config config_;
  mutable utils::Synchronized<std::unordered_map<std::string, RefreshRecord>, std::mutex> refresh_records_;
};

}  // namespace predacl::auth
