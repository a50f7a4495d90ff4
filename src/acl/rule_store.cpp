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

#include "acl/rule_store.hpp"

namespace predacl::acl {

AclGraph AuthRuleStore::LoadAll() const {
  return auth_->WithReadLock([](const auth::Auth &auth) {
    AclGraph graph;
    for (const auto &group : auth.AllGroups()) {
      for (auto &rule : group.GetRules()) {
        graph.rules.push_back({group.name(), std::move(rule.predicate), rule.permission});
      }
    }
    graph.user_groups = auth.AllMemberships();
    return graph;
  });
}

std::optional<std::set<std::string>> AuthRuleStore::LoadUserGroups(const std::string &identity) const {
  return auth_->ReadLock()->UserGroups(identity);
}

}  // namespace predacl::acl
