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

#include "glue/auth_checker.hpp"

#include "acl/reserved.hpp"
#include "utils/logging.hpp"

namespace predacl::glue {

SnapshotAuthChecker::SnapshotAuthChecker(std::shared_ptr<const acl::PermissionSnapshot> snapshot,
                                         std::set<std::string> groups, bool guardian)
    : snapshot_(std::move(snapshot)), groups_(std::move(groups)), guardian_(guardian) {
  PA_ASSERT(snapshot_, "Auth checker needs a permission snapshot!");
}

bool SnapshotAuthChecker::Has(const std::string &predicate, auth::Permission permission) const {
  if (guardian_) return true;
  if (acl::IsAclPredicate(predicate)) return false;
  return auth::HasPermission(snapshot_->LookupEffective(groups_, predicate), permission);
}

bool SnapshotAuthChecker::CanRead(const std::string &predicate) const {
  if (!guardian_ && acl::IsReserved(predicate) && !acl::IsAclPredicate(predicate)) return true;
  return Has(predicate, auth::Permission::READ);
}

bool SnapshotAuthChecker::CanWrite(const std::string &predicate) const {
  return Has(predicate, auth::Permission::WRITE);
}

bool SnapshotAuthChecker::CanModify(const std::string &predicate) const {
  return Has(predicate, auth::Permission::MODIFY);
}

}  // namespace predacl::glue
