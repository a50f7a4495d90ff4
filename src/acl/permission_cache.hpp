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

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "acl/rule_store.hpp"
#include "auth/models.hpp"
#include "utils/scheduler.hpp"

namespace predacl::acl {

/// Immutable view of all rules. Published whole; never modified afterwards.
class PermissionSnapshot final {
 public:
  PermissionSnapshot() = default;
  PermissionSnapshot(const AclGraph &graph, uint64_t generation);

  /// 0 when the group has no rule for the predicate.
  auth::PermissionMask Lookup(const std::string &group, const std::string &predicate) const;

  /// Union of the masks of all the groups.
  auth::PermissionMask LookupEffective(const std::set<std::string> &groups, const std::string &predicate) const;

  /// Whether the identity is a member of the guardians group.
  bool IsGuardian(const std::string &identity) const { return guardians_.contains(identity); }

  uint64_t Generation() const { return generation_; }

 private:
  std::unordered_map<std::string, std::unordered_map<std::string, auth::PermissionMask>> rules_;
  std::unordered_set<std::string> guardians_;
  uint64_t generation_{0};
};

/**
 * In memory copy of the ACL rules, rebuilt periodically from a
 * RuleStoreAccessor on a background thread.
 *
 * Readers load the current snapshot without taking any lock. A refresh builds
 * a complete new snapshot and swaps it in; on failure the old snapshot stays.
 * Refreshes never run concurrently.
 *
 * Each instance has its own schedule; nothing here is global.
 */
class PermissionCache final {
 public:
  explicit PermissionCache(const RuleStoreAccessor *store);

  PermissionCache(const PermissionCache &) = delete;
  PermissionCache &operator=(const PermissionCache &) = delete;
  PermissionCache(PermissionCache &&) = delete;
  PermissionCache &operator=(PermissionCache &&) = delete;

  ~PermissionCache() { Stop(); }

  /// Refreshes once synchronously, then every `interval` in the background.
  void Start(std::chrono::milliseconds interval);

  void Stop();

  /// @return false if loading failed and the previous snapshot was kept.
  bool Refresh();

  /// Snapshot to use for all the checks of a single request.
  std::shared_ptr<const PermissionSnapshot> Current() const { return snapshot_.load(); }

  auth::PermissionMask Lookup(const std::string &group, const std::string &predicate) const {
    return Current()->Lookup(group, predicate);
  }

  auth::PermissionMask LookupEffective(const std::set<std::string> &groups, const std::string &predicate) const {
    return Current()->LookupEffective(groups, predicate);
  }

  bool IsGuardian(const std::string &identity) const { return Current()->IsGuardian(identity); }

  /// Number of snapshots published so far.
  uint64_t Generation() const { return Current()->Generation(); }

 private:
  const RuleStoreAccessor *store_;
  std::atomic<std::shared_ptr<const PermissionSnapshot>> snapshot_;
  std::mutex refresh_lock_;
  utils::Scheduler scheduler_;
};

}  // namespace predacl::acl
