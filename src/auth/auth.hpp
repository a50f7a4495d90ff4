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

#include <filesystem>
#include <map>
#include <optional>
#include <regex>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "auth/exceptions.hpp"
#include "auth/models.hpp"
#include "kvstore/kvstore.hpp"
#include "utils/synchronized.hpp"

namespace predacl::auth {

class Auth;
using SynchedAuth = utils::Synchronized<Auth, std::shared_mutex>;

/// Bootstrap superuser, always present.
inline constexpr std::string_view kGrootUser = "groot";
/// Members of this group bypass all predicate level checks.
inline constexpr std::string_view kGuardiansGroup = "guardians";

inline constexpr std::string_view kDefaultUserGroupRegex = "[a-zA-Z0-9_.+-@]+";
inline constexpr std::string_view kDefaultPasswordRegex = ".+";

/**
 * This class serves as the persistent ACL store. It provides functions for
 * managing Users, Groups, their memberships and the predicate Rules of each
 * Group.
 * NOTE: The non-const functions in this class aren't thread safe, use
 * SynchedAuth when sharing an instance.
 */
class Auth final {
 public:
  struct Config {
    Config() {}
    Config(std::string name_regex, std::string password_regex, bool password_permit_null)
        : name_regex_str{std::move(name_regex)},
          password_regex_str{std::move(password_regex)},
          password_permit_null{password_permit_null},
          name_regex{name_regex_str},
          password_regex{password_regex_str} {}

    std::string name_regex_str{kDefaultUserGroupRegex};
    std::string password_regex_str{kDefaultPasswordRegex};
    bool password_permit_null{true};

   private:
    friend class Auth;
    std::regex name_regex{name_regex_str};
    std::regex password_regex{password_regex_str};
  };

  /// @throw kvstore::KVStoreError if the storage can't be opened.
  explicit Auth(std::filesystem::path storage_directory, Config config = {});

  void SetConfig(Config config) { config_ = std::move(config); }

  Config GetConfig() const { return config_; }

  /**
   * Creates the `guardians` group and the `groot` user, when missing, and makes
   * sure `groot` is a member of `guardians`. Safe to call on every startup.
   *
   * @throw AuthException if the store can't be written.
   */
  void Bootstrap(const std::string &groot_password);

  /**
   * Authenticates a user using its name and password.
   *
   * @return a user when the name and password match, nullopt otherwise
   * @throw AuthException if unable to authenticate for whatever reason.
   */
  std::optional<User> Authenticate(const std::string &username, const std::string &password) const;

  /**
   * Gets a user from the storage, with its group memberships.
   *
   * @return a user when the user exists, nullopt otherwise
   * @throw AuthException if unable to load user data.
   */
  std::optional<User> GetUser(const std::string &username) const;

  /// @throw AuthException if unable to save the user.
  void SaveUser(const User &user);

  /**
   * Validates the password against the configured strength regex and updates it.
   *
   * @throw AuthException if the password is not acceptable.
   */
  void UpdatePassword(User &user, const std::optional<std::string> &password);

  /**
   * Creates a user if the user doesn't exist.
   *
   * @return a user when the user is created, nullopt if the user exists
   * @throw AuthException if unable to save the user.
   */
  std::optional<User> AddUser(const std::string &username, const std::optional<std::string> &password = std::nullopt);

  /**
   * Removes a user together with its memberships.
   *
   * @return true if the user existed and is removed, false otherwise
   * @throw AuthException if unable to remove the user (or it is `groot`).
   */
  bool RemoveUser(const std::string &username);

  std::vector<User> AllUsers() const;

  bool HasUsers() const;

  std::optional<Group> GetGroup(const std::string &groupname) const;

  /// @throw AuthException if unable to save the group.
  void SaveGroup(const Group &group);

  /**
   * @return a group when the group is created, nullopt if the group exists
   * @throw AuthException if unable to save the group.
   */
  std::optional<Group> AddGroup(const std::string &groupname);

  /**
   * Removes a group together with all memberships in it.
   *
   * @throw AuthException if unable to remove the group (or it is `guardians`).
   */
  bool RemoveGroup(const std::string &groupname);

  std::vector<Group> AllGroups() const;

  /**
   * @return false if the user was already a member
   * @throw AuthException if the user or the group doesn't exist.
   */
  bool AddUserToGroup(const std::string &username, const std::string &groupname);

  /**
   * @return false if the user wasn't a member
   * @throw AuthException if the user or the group doesn't exist.
   */
  bool RemoveUserFromGroup(const std::string &username, const std::string &groupname);

  /**
   * Grants `permission` on `predicate` to the group, replacing any earlier rule
   * for the same predicate.
   *
   * @throw AuthException if the group doesn't exist or the mask is invalid.
   */
  void SetRule(const std::string &groupname, const std::string &predicate, int64_t permission);

  /// @throw AuthException if the group doesn't exist.
  bool RemoveRule(const std::string &groupname, const std::string &predicate);

  /// Current memberships of the user, nullopt if the user doesn't exist.
  std::optional<std::set<std::string>> UserGroups(const std::string &username) const;

  /// user -> groups, for every membership link.
  std::map<std::string, std::set<std::string>> AllMemberships() const;

 private:
  bool NameRegexMatch(const std::string &user_or_group) const;

  void LinkUser(User &user) const;

  mutable kvstore::KVStore storage_;
  Config config_;
};
}  // namespace predacl::auth
