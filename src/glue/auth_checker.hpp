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

#include <memory>
#include <set>
#include <string>

#include "acl/permission_cache.hpp"
#include "auth/models.hpp"
#include "query/auth_checker.hpp"

namespace predacl::glue {

/**
 * Checker bound to one snapshot and one caller, so every decision of a request
 * sees the same rules.
 *
 * Guardians may do anything. ACL predicates are guardian only. Other reserved
 * predicates are readable by everyone; writing or altering them follows the
 * rules like any other predicate.
 */
class SnapshotAuthChecker final : public query::PredicateAuthChecker {
 public:
  SnapshotAuthChecker(std::shared_ptr<const acl::PermissionSnapshot> snapshot, std::set<std::string> groups,
                      bool guardian);

  bool CanRead(const std::string &predicate) const override;

  bool CanWrite(const std::string &predicate) const override;

  bool CanModify(const std::string &predicate) const override;

  bool IsGuardian() const override { return guardian_; }

 private:
  bool Has(const std::string &predicate, auth::Permission permission) const;

  std::shared_ptr<const acl::PermissionSnapshot> snapshot_;
  std::set<std::string> groups_;
  bool guardian_;
};

}  // namespace predacl::glue
