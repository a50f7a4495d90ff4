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
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "auth/crypto.hpp"

namespace predacl::auth {
// These permissions must have values that are applicable for usage in a
// bitmask.
// clang-format off
enum class Permission : uint8_t {
  MODIFY = 1,
  WRITE  = 1U << 1U,
  READ   = 1U << 2U,
};
// clang-format on

/// Combination of Permission bits as stored in a rule.
using PermissionMask = uint8_t;

inline constexpr PermissionMask kNoPermission = 0;
inline constexpr PermissionMask kAllPermissions = 7;

constexpr bool HasPermission(PermissionMask mask, Permission permission) {
  return (mask & static_cast<PermissionMask>(permission)) != 0;
}

// Function that converts a permission to its string representation.
std::string PermissionToString(Permission permission);

// Comma separated names of the set bits, "NONE" for an empty mask.
std::string PermissionMaskToString(PermissionMask mask);

/// @throw AuthException if the value is not in [0, 7].
PermissionMask ToPermissionMask(int64_t value);

struct Rule {
  std::string predicate;
  PermissionMask permission{kNoPermission};

  friend bool operator==(const Rule &, const Rule &) = default;
};

class Group final {
 public:
  Group() = default;

  explicit Group(const std::string &name);
  Group(const std::string &name, std::map<std::string, PermissionMask> rules);

  const std::string &name() const { return name_; }

  /// At most one rule per predicate: a later grant replaces the earlier one.
  void SetRule(const std::string &predicate, PermissionMask permission);

  /// @return false if there was no rule for the predicate.
  bool RemoveRule(const std::string &predicate);

  PermissionMask GetPermission(const std::string &predicate) const;

  std::vector<Rule> GetRules() const;

  nlohmann::json Serialize() const;

  /// @throw AuthException if unable to deserialize.
  static Group Deserialize(const nlohmann::json &data);

  friend bool operator==(const Group &first, const Group &second);

 private:
  std::string name_;
  std::map<std::string, PermissionMask> rules_;
};

bool operator==(const Group &first, const Group &second);

class User final {
 public:
  User() = default;

  explicit User(const std::string &name);
  User(const std::string &name, std::optional<HashedPassword> password_hash);

  /// A user without a password only accepts an empty one.
  /// @throw AuthException if unable to verify the password.
  bool CheckPassword(const std::string &password) const;

  /// @throw AuthException if unable to hash the password.
  void UpdatePassword(const std::optional<std::string> &password = {},
                      std::optional<PasswordHashAlgorithm> algo_override = std::nullopt);

  void UpdateHash(HashedPassword hashed_password);

  const std::string &name() const { return name_; }
  const std::optional<HashedPassword> &password_hash() const { return password_hash_; }

  // Groups are stored as links, they are not part of the serialized user.
  const std::set<std::string> &groups() const { return groups_; }
  void AddGroup(const std::string &group) { groups_.insert(group); }
  bool HasGroup(const std::string &group) const { return groups_.contains(group); }

  nlohmann::json Serialize() const;

  /// @throw AuthException if unable to deserialize.
  static User Deserialize(const nlohmann::json &data);

  friend bool operator==(const User &first, const User &second);

 private:
  std::string name_;
  std::optional<HashedPassword> password_hash_;
  std::set<std::string> groups_;
};

bool operator==(const User &first, const User &second);
}  // namespace predacl::auth
