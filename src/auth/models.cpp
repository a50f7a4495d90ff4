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

#include "auth/models.hpp"

#include <utility>

#include <nlohmann/json.hpp>

#include "auth/exceptions.hpp"
#include "utils/string.hpp"

namespace predacl::auth {
namespace {

constexpr auto kName = "name";
constexpr auto kRules = "rules";
constexpr auto kPredicate = "predicate";
constexpr auto kPermission = "permission";
constexpr auto kPasswordHash = "password_hash";

// Constant list of all available permissions, in the order they are printed.
const std::vector<Permission> kPermissionsAll = {Permission::READ, Permission::WRITE, Permission::MODIFY};

}  // namespace

std::string PermissionToString(Permission permission) {
  switch (permission) {
    case Permission::READ:
      return "READ";
    case Permission::WRITE:
      return "WRITE";
    case Permission::MODIFY:
      return "MODIFY";
  }
  return "UNKNOWN";
}

std::string PermissionMaskToString(PermissionMask mask) {
  std::vector<std::string> names;
  for (const auto permission : kPermissionsAll) {
    if (HasPermission(mask, permission)) names.push_back(PermissionToString(permission));
  }
  if (names.empty()) return "NONE";
  return utils::Join(names, ", ");
}

PermissionMask ToPermissionMask(int64_t value) {
  if (value < kNoPermission || value > kAllPermissions) {
    throw AuthException("Invalid permission {}, expected a value in [{}, {}]!", value, kNoPermission,
                        kAllPermissions);
  }
  return static_cast<PermissionMask>(value);
}

Group::Group(const std::string &name) : name_(utils::ToLowerCase(name)) {}

Group::Group(const std::string &name, std::map<std::string, PermissionMask> rules)
    : name_(utils::ToLowerCase(name)), rules_(std::move(rules)) {}

void Group::SetRule(const std::string &predicate, PermissionMask permission) { rules_[predicate] = permission; }

bool Group::RemoveRule(const std::string &predicate) { return rules_.erase(predicate) > 0; }

PermissionMask Group::GetPermission(const std::string &predicate) const {
  auto it = rules_.find(predicate);
  if (it == rules_.end()) return kNoPermission;
  return it->second;
}

std::vector<Rule> Group::GetRules() const {
  std::vector<Rule> rules;
  rules.reserve(rules_.size());
  for (const auto &[predicate, permission] : rules_) {
    rules.push_back({predicate, permission});
  }
  return rules;
}

nlohmann::json Group::Serialize() const {
  nlohmann::json data = nlohmann::json::object();
  data[kName] = name_;
  auto rules = nlohmann::json::array();
  for (const auto &[predicate, permission] : rules_) {
    rules.push_back({{kPredicate, predicate}, {kPermission, permission}});
  }
  data[kRules] = std::move(rules);
  return data;
}

Group Group::Deserialize(const nlohmann::json &data) {
  if (!data.is_object()) {
    throw AuthException("Couldn't load group data!");
  }
  auto name_it = data.find(kName);
  auto rules_it = data.find(kRules);
  if (name_it == data.end() || rules_it == data.end() || !name_it->is_string() || !rules_it->is_array()) {
    throw AuthException("Couldn't load group data!");
  }
  std::map<std::string, PermissionMask> rules;
  for (const auto &rule : *rules_it) {
    auto predicate_it = rule.find(kPredicate);
    auto permission_it = rule.find(kPermission);
    if (predicate_it == rule.end() || permission_it == rule.end() || !predicate_it->is_string() ||
        !permission_it->is_number_integer()) {
      throw AuthException("Couldn't load rule data of group {}!", name_it->get<std::string>());
    }
    rules[predicate_it->get<std::string>()] = ToPermissionMask(permission_it->get<int64_t>());
  }
  return {name_it->get<std::string>(), std::move(rules)};
}

bool operator==(const Group &first, const Group &second) {
  return first.name_ == second.name_ && first.rules_ == second.rules_;
}

User::User(const std::string &name) : name_(utils::ToLowerCase(name)) {}

User::User(const std::string &name, std::optional<HashedPassword> password_hash)
    : name_(utils::ToLowerCase(name)), password_hash_(std::move(password_hash)) {}

bool User::CheckPassword(const std::string &password) const {
  return password_hash_ ? password_hash_->VerifyPassword(password) : password.empty();
}

void User::UpdatePassword(const std::optional<std::string> &password,
                          std::optional<PasswordHashAlgorithm> algo_override) {
  if (!password) {
    password_hash_.reset();
    return;
  }
  password_hash_ = HashPassword(*password, algo_override);
}

void User::UpdateHash(HashedPassword hashed_password) { password_hash_ = std::move(hashed_password); }

nlohmann::json User::Serialize() const {
  // NOTE: Groups are stored as links to the group list.
  nlohmann::json data = nlohmann::json::object();
  data[kName] = name_;
  if (password_hash_.has_value()) {
    data[kPasswordHash] = *password_hash_;
  } else {
    data[kPasswordHash] = nullptr;
  }
  return data;
}

User User::Deserialize(const nlohmann::json &data) {
  if (!data.is_object()) {
    throw AuthException("Couldn't load user data!");
  }
  auto name_it = data.find(kName);
  auto hash_it = data.find(kPasswordHash);
  if (name_it == data.end() || hash_it == data.end()) {
    throw AuthException("Couldn't load user data!");
  }
  if (!name_it->is_string() || !(hash_it->is_object() || hash_it->is_null())) {
    throw AuthException("Couldn't load user data!");
  }
  std::optional<HashedPassword> password_hash{};
  if (hash_it->is_object()) {
    try {
      password_hash = hash_it->get<HashedPassword>();
    } catch (const nlohmann::json::exception & /* unused */) {
      throw AuthException("Failed to read user's password hash.");
    }
  }
  return {name_it->get<std::string>(), std::move(password_hash)};
}

bool operator==(const User &first, const User &second) {
  return first.name_ == second.name_ && first.password_hash_ == second.password_hash_ &&
         first.groups_ == second.groups_;
}
}  // namespace predacl::auth
