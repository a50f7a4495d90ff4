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

#include "auth/token.hpp"

#include <optional>

#include <nlohmann/json.hpp>

#include "auth/crypto.hpp"
#include "auth/exceptions.hpp"
#include "utils/logging.hpp"
#include "utils/string.hpp"

namespace predacl::auth {
namespace {
constexpr auto kSubject = "sub";
constexpr auto kGroups = "groups";
constexpr auto kIssuedAt = "iat";
constexpr auto kExpiry = "exp";
constexpr auto kKind = "kind";
constexpr auto kAccessKind = "access";

constexpr size_t kRefreshTokenBytes = 32;

using std::chrono::system_clock;

int64_t ToEpochSeconds(system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

system_clock::time_point FromEpochSeconds(int64_t seconds) {
  return system_clock::time_point{std::chrono::seconds(seconds)};
}

const std::string &Header() {
  static const std::string header = Base64UrlEncode(nlohmann::json{{"alg", "HS256"}, {"typ", "JWT"}}.dump());
  return header;
}
}  // namespace

TokenManager::TokenManager(SynchedAuth *auth, Config config) : auth_(auth), config_(std::move(config)) {
  PA_ASSERT(auth_, "Token manager needs an auth store");
  if (config_.signing_key.size() < kMinSigningKeySize) {
    throw AuthException("The token signing key must be at least {} bytes long!", kMinSigningKeySize);
  }
  if (config_.access_ttl <= std::chrono::seconds::zero() || config_.refresh_ttl <= std::chrono::seconds::zero()) {
    throw AuthException("Token TTLs must be positive!");
  }
  if (config_.refresh_ttl < config_.access_ttl) {
    spdlog::warn("Refresh token TTL ({}s) is shorter than the access token TTL ({}s).", config_.refresh_ttl.count(),
                 config_.access_ttl.count());
  }
}

TokenPair TokenManager::Authenticate(const std::string &username, const std::string &password) {
  auto user = auth_->ReadLock()->Authenticate(username, password);
  if (!user) throw InvalidCredentials();
  spdlog::debug("User '{}' logged in.", user->name());
  return Issue(user->name(), user->groups());
}

std::string TokenManager::Sign(const nlohmann::json &payload) const {
  auto message = Header() + "." + Base64UrlEncode(payload.dump());
  auto signature = Base64UrlEncode(HmacSha256(config_.signing_key, message));
  return message + "." + signature;
}

TokenPair TokenManager::Issue(const std::string &identity, const std::set<std::string> &groups) {
  const auto now = std::chrono::floor<std::chrono::seconds>(config_.clock());
  TokenPair pair;
  pair.access_expiry = now + config_.access_ttl;
  pair.refresh_expiry = now + config_.refresh_ttl;

  nlohmann::json payload = {{kSubject, identity},
                            {kGroups, groups},
                            {kIssuedAt, ToEpochSeconds(now)},
                            {kExpiry, ToEpochSeconds(pair.access_expiry)},
                            {kKind, kAccessKind}};
  pair.access_token = Sign(payload);
  pair.refresh_token = Base64UrlEncode(RandomBytes(kRefreshTokenBytes));

  refresh_records_->emplace(pair.refresh_token, RefreshRecord{identity, pair.refresh_expiry});
  return pair;
}

AccessClaims TokenManager::VerifyAccess(std::string_view access_token) const {
  const auto parts = utils::Split(access_token, ".");
  if (parts.size() != 3) throw TokenInvalid("malformed token");
  if (parts[0] != Header()) throw TokenInvalid("unsupported token header");

  const auto expected = HmacSha256(config_.signing_key, parts[0] + "." + parts[1]);
  const auto signature = Base64UrlDecode(parts[2]);
  if (!signature || !SecureEquals(*signature, expected)) throw TokenInvalid("signature mismatch");

  const auto body = Base64UrlDecode(parts[1]);
  if (!body) throw TokenInvalid("malformed token");

  AccessClaims claims;
  try {
    const auto payload = nlohmann::json::parse(*body);
    if (payload.at(kKind).get<std::string>() != kAccessKind) throw TokenInvalid("not an access token");
    claims.identity = payload.at(kSubject).get<std::string>();
    claims.groups = payload.at(kGroups).get<std::set<std::string>>();
    claims.issued_at = FromEpochSeconds(payload.at(kIssuedAt).get<int64_t>());
    claims.expiry = FromEpochSeconds(payload.at(kExpiry).get<int64_t>());
  } catch (const nlohmann::json::exception &e) {
    throw TokenInvalid(fmt::format("malformed claims ({})", e.what()));
  }
  if (claims.identity.empty()) throw TokenInvalid("missing subject");

  if (config_.clock() >= claims.expiry) throw TokenExpired();
  return claims;
}

TokenPair TokenManager::Refresh(std::string_view refresh_token) {
  // Taking the record out first makes the token single use even under races.
  auto record = refresh_records_.WithLock([&](auto &records) -> std::optional<RefreshRecord> {
    auto it = records.find(std::string(refresh_token));
    if (it == records.end()) return std::nullopt;
    auto record = std::move(it->second);
    records.erase(it);
    return record;
  });
  if (!record) throw RefreshInvalid("unknown or already used refresh token");
  if (config_.clock() >= record->expiry) throw RefreshExpired();

  auto groups = config_.user_groups ? config_.user_groups(record->identity)
                                    : auth_->ReadLock()->UserGroups(record->identity);
  if (!groups) throw RefreshInvalid(fmt::format("user '{}' no longer exists", record->identity));
  spdlog::debug("Refreshed the tokens of user '{}'.", record->identity);
  return Issue(record->identity, *groups);
}

size_t TokenManager::PurgeExpired() {
  const auto now = config_.clock();
  return refresh_records_.WithLock([&](auto &records) {
    return std::erase_if(records, [&](const auto &item) { return now >= item.second.expiry; });
  });
}

size_t TokenManager::OutstandingRefreshTokens() const { return refresh_records_->size(); }

}  // namespace predacl::auth
