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

#include "auth/auth.hpp"

#include <utility>

#include <nlohmann/json.hpp>

#include "utils/logging.hpp"
#include "utils/string.hpp"

namespace predacl::auth {
namespace {
const std::string kUserPrefix = "user:";
const std::string kGroupPrefix = "group:";
const std::string kLinkPrefix = "link:";

auto ParseJson(std::string_view str) {
  nlohmann::json data;
  try {
    data = nlohmann::json::parse(str);
  } catch (const nlohmann::json::parse_error &e) {
    throw AuthException("Couldn't load auth data: {}", e.what());
  }
  return data;
}

nlohmann::json GroupsToJson(const std::set<std::string> &groups) {
  nlohmann::json data = nlohmann::json::array();
  for (const auto &group : groups) data.push_back(group);
  return data;
}
}  // namespace

Auth::Auth(std::filesystem::path storage_directory, Config config)
    : storage_(std::move(storage_directory)), config_{std::move(config)} {}

void Auth::Bootstrap(const std::string &groot_password) {
  const std::string guardians{kGuardiansGroup};
  const std::string groot{kGrootUser};
  if (AddGroup(guardians)) {
    spdlog::info("Created the {} group.", guardians);
  }
  auto user = GetUser(groot);
  if (!user) {
    user = User(groot);
    UpdatePassword(*user, groot_password);
    SaveUser(*user);
    spdlog::info("Created the {} user.", groot);
  }
  if (!user->HasGroup(guardians)) {
    user->AddGroup(guardians);
    SaveUser(*user);
    spdlog::info("Added {} to the {} group.", groot, guardians);
  }
}

std::optional<User> Auth::Authenticate(const std::string &username, const std::string &password) const {
  auto user = GetUser(username);
  if (!user) {
    spdlog::warn("Couldn't authenticate user '{}' because the user doesn't exist.", username);
    return std::nullopt;
  }
  if (!user->CheckPassword(password)) {
    spdlog::warn("Couldn't authenticate user '{}' because the password is not correct.", username);
    return std::nullopt;
  }
  return user;
}

void Auth::LinkUser(User &user) const {
  auto link = storage_.Get(kLinkPrefix + user.name());
  if (!link) return;
  auto data = ParseJson(*link);
  if (!data.is_array()) {
    throw AuthException("Couldn't load groups of user '{}'!", user.name());
  }
  for (const auto &groupname : data) {
    if (!groupname.is_string()) {
      throw AuthException("Couldn't load groups of user '{}'!", user.name());
    }
    // Links outlive groups only if a write failed halfway; skip those.
    if (!storage_.Get(kGroupPrefix + groupname.get<std::string>())) {
      spdlog::warn("Group '{}' doesn't exist for user '{}'", groupname.get<std::string>(), user.name());
      continue;
    }
    user.AddGroup(groupname.get<std::string>());
  }
}

std::optional<User> Auth::GetUser(const std::string &username_orig) const {
  auto username = utils::ToLowerCase(username_orig);
  auto existing_user = storage_.Get(kUserPrefix + username);
  if (!existing_user) return std::nullopt;

  auto user = User::Deserialize(ParseJson(*existing_user));
  LinkUser(user);
  return user;
}

void Auth::SaveUser(const User &user) {
  std::map<std::string, std::string> puts;
  std::vector<std::string> deletes;

  puts.emplace(kUserPrefix + user.name(), user.Serialize().dump());
  if (!user.groups().empty()) {
    puts.emplace(kLinkPrefix + user.name(), GroupsToJson(user.groups()).dump());
  } else {
    deletes.push_back(kLinkPrefix + user.name());
  }

  if (!storage_.PutAndDeleteMultiple(puts, deletes)) {
    throw AuthException("Couldn't save user '{}'!", user.name());
  }
}

void Auth::UpdatePassword(User &user, const std::optional<std::string> &password) {
  if (!password) {
    if (!config_.password_permit_null) {
      throw AuthException("Null passwords aren't permitted!");
    }
  } else if (!std::regex_match(*password, config_.password_regex)) {
    throw AuthException("The user password doesn't conform to the required strength! Regex: \"{}\"",
                        config_.password_regex_str);
  }
  user.UpdatePassword(password);
}

std::optional<User> Auth::AddUser(const std::string &username, const std::optional<std::string> &password) {
  if (!NameRegexMatch(username)) {
    throw AuthException("Invalid user name.");
  }
  if (GetUser(username)) return std::nullopt;
  auto new_user = User(username);
  UpdatePassword(new_user, password);
  SaveUser(new_user);
  return new_user;
}

bool Auth::RemoveUser(const std::string &username_orig) {
  auto username = utils::ToLowerCase(username_orig);
  if (username == kGrootUser) {
    throw AuthException("User '{}' can't be removed!", username);
  }
  if (!storage_.Get(kUserPrefix + username)) return false;
  if (!storage_.DeleteMultiple({kLinkPrefix + username, kUserPrefix + username})) {
    throw AuthException("Couldn't remove user '{}'!", username);
  }
  return true;
}

std::vector<User> Auth::AllUsers() const {
  std::vector<User> ret;
  for (auto it = storage_.begin(kUserPrefix); it != storage_.end(kUserPrefix); ++it) {
    auto user = User::Deserialize(ParseJson(it->second));  // Will throw on failure
    LinkUser(user);
    ret.push_back(std::move(user));
  }
  return ret;
}

bool Auth::HasUsers() const { return storage_.begin(kUserPrefix) != storage_.end(kUserPrefix); }

std::optional<Group> Auth::GetGroup(const std::string &groupname_orig) const {
  auto groupname = utils::ToLowerCase(groupname_orig);
  auto existing_group = storage_.Get(kGroupPrefix + groupname);
  if (!existing_group) return std::nullopt;
  return Group::Deserialize(ParseJson(*existing_group));
}

void Auth::SaveGroup(const Group &group) {
  if (!storage_.Put(kGroupPrefix + group.name(), group.Serialize().dump())) {
    throw AuthException("Couldn't save group '{}'!", group.name());
  }
}

std::optional<Group> Auth::AddGroup(const std::string &groupname) {
  if (!NameRegexMatch(groupname)) {
    throw AuthException("Invalid group name.");
  }
  if (GetGroup(groupname)) return std::nullopt;
  auto new_group = Group(groupname);
  SaveGroup(new_group);
  return new_group;
}

bool Auth::RemoveGroup(const std::string &groupname_orig) {
  auto groupname = utils::ToLowerCase(groupname_orig);
  if (groupname == kGuardiansGroup) {
    throw AuthException("Group '{}' can't be removed!", groupname);
  }
  if (!storage_.Get(kGroupPrefix + groupname)) return false;

  // Unlink all members in the same batch as the group itself.
  std::map<std::string, std::string> puts;
  std::vector<std::string> deletes{kGroupPrefix + groupname};
  for (auto it = storage_.begin(kLinkPrefix); it != storage_.end(kLinkPrefix); ++it) {
    auto data = ParseJson(it->second);
    if (!data.is_array()) continue;
    std::set<std::string> groups;
    bool member = false;
    for (const auto &group : data) {
      if (!group.is_string()) continue;
      if (group.get<std::string>() == groupname) {
        member = true;
      } else {
        groups.insert(group.get<std::string>());
      }
    }
    if (!member) continue;
    if (groups.empty()) {
      deletes.push_back(it->first);
    } else {
      puts.emplace(it->first, GroupsToJson(groups).dump());
    }
  }
  if (!storage_.PutAndDeleteMultiple(puts, deletes)) {
    throw AuthException("Couldn't remove group '{}'!", groupname);
  }
  return true;
}

std::vector<Group> Auth::AllGroups() const {
  std::vector<Group> ret;
  for (auto it = storage_.begin(kGroupPrefix); it != storage_.end(kGroupPrefix); ++it) {
    ret.push_back(Group::Deserialize(ParseJson(it->second)));
  }
  return ret;
}

bool Auth::AddUserToGroup(const std::string &username, const std::string &groupname) {
  auto user = GetUser(username);
  if (!user) throw AuthException("User '{}' doesn't exist!", username);
  auto group = GetGroup(groupname);
  if (!group) throw AuthException("Group '{}' doesn't exist!", groupname);
  if (user->HasGroup(group->name())) return false;
  user->AddGroup(group->name());
  SaveUser(*user);
  return true;
}

bool Auth::RemoveUserFromGroup(const std::string &username, const std::string &groupname) {
  auto user = GetUser(username);
  if (!user) throw AuthException("User '{}' doesn't exist!", username);
  auto group = GetGroup(groupname);
  if (!group) throw AuthException("Group '{}' doesn't exist!", groupname);
  if (user->name() == kGrootUser && group->name() == kGuardiansGroup) {
    throw AuthException("User '{}' can't leave the '{}' group!", user->name(), group->name());
  }
  if (!user->HasGroup(group->name())) return false;

  auto groups = user->groups();
  groups.erase(group->name());
  auto updated = User(user->name(), user->password_hash());
  for (const auto &g : groups) updated.AddGroup(g);
  SaveUser(updated);
  return true;
}

void Auth::SetRule(const std::string &groupname, const std::string &predicate, int64_t permission) {
  auto group = GetGroup(groupname);
  if (!group) throw AuthException("Group '{}' doesn't exist!", groupname);
  if (predicate.empty()) throw AuthException("Rule predicate can't be empty!");
  group->SetRule(predicate, ToPermissionMask(permission));
  SaveGroup(*group);
}

bool Auth::RemoveRule(const std::string &groupname, const std::string &predicate) {
  auto group = GetGroup(groupname);
  if (!group) throw AuthException("Group '{}' doesn't exist!", groupname);
  if (!group->RemoveRule(predicate)) return false;
  SaveGroup(*group);
  return true;
}

std::optional<std::set<std::string>> Auth::UserGroups(const std::string &username) const {
  auto user = GetUser(username);
  if (!user) return std::nullopt;
  return user->groups();
}

std::map<std::string, std::set<std::string>> Auth::AllMemberships() const {
  std::map<std::string, std::set<std::string>> ret;
  for (const auto &user : AllUsers()) {
    ret.emplace(user.name(), user.groups());
  }
  return ret;
}

bool Auth::NameRegexMatch(const std::string &user_or_group) const {
  return std::regex_match(user_or_group, config_.name_regex);
}

}  // namespace predacl::auth
