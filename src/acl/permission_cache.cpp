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

#include "acl/permission_cache.hpp"

#include <exception>

#include "auth/auth.hpp"
#include "utils/logging.hpp"

namespace predacl::acl {

PermissionSnapshot::PermissionSnapshot(const AclGraph &graph, uint64_t generation)
    : generation_(generation) {
  // Rules arrive ordered; a later rule for the same pair wins.
  for (const auto &rule : graph.rules) {
    rules_[rule.group][rule.predicate] = rule.permission;
  }
  for (const auto &[user, groups] : graph.user_groups) {
    if (groups.contains(std::string(auth::kGuardiansGroup))) guardians_.insert(user);
  }
}

auth::PermissionMask PermissionSnapshot::Lookup(const std::string &group, const std::string &predicate) const {
  auto group_it = rules_.find(group);
  if (group_it == rules_.end()) return auth::kNoPermission;
  auto rule_it = group_it->second.find(predicate);
  if (rule_it == group_it->second.end()) return auth::kNoPermission;
  return rule_it->second;
}

auth::PermissionMask PermissionSnapshot::LookupEffective(const std::set<std::string> &groups,
                                                         const std::string &predicate) const {
  auth::PermissionMask mask = auth::kNoPermission;
  for (const auto &group : groups) {
    mask |= Lookup(group, predicate);
    if (mask == auth::kAllPermissions) break;
  }
  return mask;
}

PermissionCache::PermissionCache(const RuleStoreAccessor *store)
    : store_(store), snapshot_(std::make_shared<const PermissionSnapshot>()) {
  PA_ASSERT(store_, "Permission cache needs a rule store");
}

void PermissionCache::Start(std::chrono::milliseconds interval) {
  if (!Refresh()) {
    spdlog::warn("Initial ACL cache load failed, starting with generation {}.", Generation());
  }
  scheduler_.SetInterval(interval);
  scheduler_.Run("ACL cache", [this] { Refresh(); });
  spdlog::info("ACL cache refreshes every {} ms.", interval.count());
}

void PermissionCache::Stop() { scheduler_.Stop(); }

bool PermissionCache::Refresh() {
  std::lock_guard guard(refresh_lock_);
  const auto generation = snapshot_.load()->Generation() + 1;
  std::shared_ptr<const PermissionSnapshot> fresh;
  try {
    fresh = std::make_shared<const PermissionSnapshot>(store_->LoadAll(), generation);
  } catch (const std::exception &e) {
    spdlog::error("Couldn't refresh the ACL cache, keeping generation {}: {}", generation - 1, e.what());
    return false;
  }
  snapshot_.store(std::move(fresh));
  spdlog::trace("ACL cache refreshed to generation {}.", generation);
  return true;
}

}  // namespace predacl::acl
