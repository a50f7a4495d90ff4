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

#include "acl/reserved.hpp"

#include <algorithm>
#include <array>

#include <fmt/format.h>

#include "utils/string.hpp"

namespace predacl::acl {
namespace {
using namespace std::literals;

constexpr std::array kAclPredicates{"dgraph.xid"sv,      "dgraph.password"sv,       "dgraph.user.group"sv,
                                    "dgraph.acl.rule"sv, "dgraph.rule.predicate"sv, "dgraph.rule.permission"sv};
}  // namespace

const std::vector<ReservedSchema> &InitialReservedSchemas() {
  static const std::vector<ReservedSchema> schemas{
      {"dgraph.xid", "string @index(exact) @upsert ."},
      {"dgraph.password", "password ."},
      {"dgraph.user.group", "[uid] @reverse ."},
      {"dgraph.acl.rule", "[uid] ."},
      {"dgraph.rule.predicate", "string @index(exact) @upsert ."},
      {"dgraph.rule.permission", "int ."},
      {"dgraph.type", "[string] @index(exact) ."},
      {"dgraph.graphql.schema", "string ."},
      {"dgraph.graphql.xid", "string @index(exact) @upsert ."},
  };
  return schemas;
}

bool IsReserved(std::string_view predicate) { return utils::IStartsWith(predicate, kReservedPrefix); }

bool IsAclPredicate(std::string_view predicate) {
  return std::any_of(kAclPredicates.begin(), kAclPredicates.end(),
                     [&](const auto acl_predicate) { return utils::IEquals(predicate, acl_predicate); });
}

std::string NormalizeSchema(std::string_view schema) { return utils::Join(utils::Split(schema), " "); }

AlterDecision CheckAlter(std::string_view predicate, const std::optional<std::string> &proposed,
                         const std::optional<std::string> &current) {
  if (!IsReserved(predicate)) return {};
  if (!proposed) {
    return {false, fmt::format("predicate {} is reserved and is not allowed to be dropped", predicate)};
  }
  if (!current || NormalizeSchema(*proposed) != NormalizeSchema(*current)) {
    return {false, fmt::format("predicate {} is reserved and is not allowed to be modified", predicate)};
  }
  return {};
}

}  // namespace predacl::acl
