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

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "auth/auth.hpp"
#include "auth/models.hpp"

namespace predacl::acl {

struct GroupRule {
  std::string group;
  std::string predicate;
  auth::PermissionMask permission{auth::kNoPermission};
};

/// Everything the permission cache needs from one read of the ACL store.
struct AclGraph {
  std::vector<GroupRule> rules;
  std::map<std::string, std::set<std::string>> user_groups;
};

/// Read-only view of the persisted user/group/rule graph. Implementations do
/// no caching and no retries; failures are reported by throwing.
class RuleStoreAccessor {
 public:
  virtual ~RuleStoreAccessor() = default;

  virtual AclGraph LoadAll() const = 0;

  /// nullopt if the user doesn't exist.
  virtual std::optional<std::set<std::string>> LoadUserGroups(const std::string &identity) const = 0;
};

class AuthRuleStore final : public RuleStoreAccessor {
 public:
  explicit AuthRuleStore(auth::SynchedAuth *auth) : auth_(auth) {}

  /// Reads groups and memberships under one shared lock so they are mutually
  /// consistent.
  AclGraph LoadAll() const override;

  std::optional<std::set<std::string>> LoadUserGroups(const std::string &identity) const override;

 private:
  auth::SynchedAuth *auth_;
};

}  // namespace predacl::acl
