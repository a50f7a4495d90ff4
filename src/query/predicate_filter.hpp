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

#include <cstddef>
#include <string>
#include <vector>

#include "query/auth_checker.hpp"
#include "query/request.hpp"

namespace predacl::query {

struct FilteredQuery {
  /// What may be sent to the engine.
  QueryRequest request;
  /// Blocks removed because their root predicate isn't readable; they
  /// evaluate to an empty result.
  std::vector<std::string> empty_blocks;
  /// Number of fields, order, group by and filter clauses removed.
  size_t elided{0};
};

/**
 * Strips every predicate reference the caller can't read, so that the engine
 * sees the request as if those parts were never asked for:
 *
 *  - an unreadable root function predicate removes the whole block,
 *  - unreadable fields are removed, recursively,
 *  - unreadable order clauses are removed one by one,
 *  - a group by naming any unreadable predicate is removed,
 *  - unreadable filter leaves are removed; connectives left without operands
 *    are removed with them.
 *
 * The `uid` pseudo predicate is always readable. A function other than `uid`
 * with no predicate counts as unreadable.
 */
FilteredQuery FilterUnauthorizedPredicates(const QueryRequest &request, const PredicateAuthChecker &checker);

}  // namespace predacl::query
