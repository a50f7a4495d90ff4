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

#include <nlohmann/json.hpp>

#include "query/request.hpp"

namespace predacl::query {

/// Who a request runs as, after authentication.
struct RequestContext {
  /// Empty for anonymous requests.
  std::string identity;
  std::set<std::string> groups;
  bool guardian{false};
};

/**
 * The execution engine behind the interceptor. Requests handed to it are
 * already authorized (and, for queries, already stripped of unreadable
 * predicates); the engine never makes ACL decisions.
 */
class Engine {
 public:
  virtual ~Engine() = default;

  /// @return JSON object keyed by block name.
  virtual nlohmann::json Query(const QueryRequest &request, const RequestContext &context) = 0;

  virtual nlohmann::json Mutate(const MutationRequest &request, const RequestContext &context) = 0;

  /// @return JSON object describing the requested predicates.
  virtual nlohmann::json Introspect(const SchemaRequest &request, const RequestContext &context) = 0;

  /// Current schema of the predicate, nullopt if it has none.
  virtual std::optional<std::string> GetSchema(const std::string &predicate) const = 0;

  virtual void ApplySchemaAlter(const std::string &predicate, const std::string &schema) = 0;

  virtual void DropPredicate(const std::string &predicate) = 0;

  /// Drops all data and every non reserved predicate.
  virtual void DropAll() = 0;
};

}  // namespace predacl::query
