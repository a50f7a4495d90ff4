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

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace predacl::acl {

/// Case-insensitive prefix of the system namespace.
inline constexpr std::string_view kReservedPrefix = "dgraph.";

struct AlterDecision {
  bool allowed{true};
  std::string reason;
};

/// Predicate name with its initial schema, declared through the bootstrap path.
using ReservedSchema = std::pair<std::string_view, std::string_view>;

/// Schemas of the reserved predicates at first startup.
const std::vector<ReservedSchema> &InitialReservedSchemas();

bool IsReserved(std::string_view predicate);

/// Predicates that hold the ACL data itself; only guardians may touch them.
bool IsAclPredicate(std::string_view predicate);

/// Collapses whitespace runs so that formatting differences don't count as changes.
std::string NormalizeSchema(std::string_view schema);

/**
 * Decides whether an alter of `predicate` may go ahead, regardless of who
 * asks.
 *
 * @param proposed the new schema, nullopt for a drop
 * @param current the existing schema, nullopt if the predicate has none
 */
AlterDecision CheckAlter(std::string_view predicate, const std::optional<std::string> &proposed,
                         const std::optional<std::string> &current);

}  // namespace predacl::acl
