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

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace predacl::query {

/// Pseudo predicate naming the node id; never subject to ACL checks.
inline constexpr std::string_view kUidPredicate = "uid";
/// Wildcard predicate of a delete triple (`<s> * * .`).
inline constexpr std::string_view kWildcardPredicate = "*";
/// Selects nodes by id. The only function that may be used without a predicate.
inline constexpr std::string_view kUidFunction = "uid";

/// Whether a root or filter function must name the predicate it reads.
inline bool NamesPredicate(std::string_view function) { return function != kUidFunction; }

// Parsed representation of the requests that reach the interceptor. The
// interceptor only needs to know which predicates a request references and
// where, so only that much structure is kept.

struct Field {
  std::string predicate;
  std::string alias;
  bool count{false};
  std::vector<Field> children;

  friend bool operator==(const Field &, const Field &) = default;
};

struct FilterNode {
  enum class Op : uint8_t { AND, OR, NOT, LEAF };

  Op op{Op::LEAF};
  // LEAF only
  std::string function;
  std::string predicate;
  std::vector<std::string> args;
  // AND, OR, NOT
  std::vector<FilterNode> children;

  friend bool operator==(const FilterNode &, const FilterNode &) = default;
};

struct OrderClause {
  std::string predicate;
  bool descending{false};

  friend bool operator==(const OrderClause &, const OrderClause &) = default;
};

/// Root selection function, e.g. `has(name)`, `eq(name, "Alice")`, `uid(0x1)`.
/// `predicate` may only be empty for `uid`, see NamesPredicate.
struct RootFunction {
  std::string name;
  std::string predicate;
  std::vector<std::string> args;

  friend bool operator==(const RootFunction &, const RootFunction &) = default;
};

struct QueryBlock {
  std::string name;
  RootFunction root;
  std::optional<FilterNode> filter;
  std::vector<OrderClause> order;
  std::vector<std::string> group_by;
  std::vector<Field> fields;

  friend bool operator==(const QueryBlock &, const QueryBlock &) = default;
};

struct QueryRequest {
  std::vector<QueryBlock> blocks;

  friend bool operator==(const QueryRequest &, const QueryRequest &) = default;
};

struct NQuad {
  std::string subject;
  std::string predicate;
  std::string object;

  friend bool operator==(const NQuad &, const NQuad &) = default;
};

struct MutationRequest {
  std::vector<NQuad> set;
  std::vector<NQuad> del;
  bool commit_now{true};

  /// Every predicate of every triple, wildcard included.
  std::set<std::string> Predicates() const;

  friend bool operator==(const MutationRequest &, const MutationRequest &) = default;
};

struct AlterOperation {
  std::string predicate;
  /// New schema, nullopt for a drop.
  std::optional<std::string> schema;

  friend bool operator==(const AlterOperation &, const AlterOperation &) = default;
};

struct AlterRequest {
  std::vector<AlterOperation> operations;
  bool drop_all{false};

  friend bool operator==(const AlterRequest &, const AlterRequest &) = default;
};

/// Schema introspection; empty `predicates` asks for everything.
struct SchemaRequest {
  std::vector<std::string> predicates;

  friend bool operator==(const SchemaRequest &, const SchemaRequest &) = default;
};

/**
 * Parses one N-Quad line: `<subject> <predicate> object .`. Subjects may be
 * blank nodes (`_:a`) or `uid(v)`, the predicate may be the `*` wildcard.
 *
 * @throw SyntaxException on malformed input.
 */
NQuad ParseNQuad(std::string_view line);

/// Parses newline separated N-Quads, skipping blank lines and `#` comments.
std::vector<NQuad> ParseNQuads(std::string_view text);

/**
 * Parses a schema text of `predicate: definition .` lines into alter
 * operations. Type definitions are not supported.
 *
 * @throw SyntaxException on malformed input.
 */
std::vector<AlterOperation> ParseSchema(std::string_view text);

/**
 * JSON wire format:
 *
 *  query:  {"blocks": [{"name", "func": {"name", "predicate", "args"},
 *           "filter", "order": [{"predicate", "desc"}], "group_by": [...],
 *           "fields": [{"predicate", "alias", "count", "fields"}]}]}
 *  filter: {"and"|"or": [...]}, {"not": {...}} or {"func", "predicate", "args"}
 *  mutate: {"set": [...], "delete": [...], "set_nquads": "...",
 *           "del_nquads": "...", "commit_now"} where triples are
 *           {"subject", "predicate", "object"}
 *  alter:  {"schema": "...", "drop_attr": "...", "drop_all": bool}
 *  schema: {"predicates": [...]}
 *
 * @throw SyntaxException if the JSON doesn't describe a request of that kind.
 */
QueryRequest ParseQueryRequest(const nlohmann::json &data);
MutationRequest ParseMutationRequest(const nlohmann::json &data);
AlterRequest ParseAlterRequest(const nlohmann::json &data);
SchemaRequest ParseSchemaRequest(const nlohmann::json &data);

nlohmann::json ToJson(const QueryRequest &request);
nlohmann::json ToJson(const MutationRequest &request);
nlohmann::json ToJson(const AlterRequest &request);
nlohmann::json ToJson(const SchemaRequest &request);

}  // namespace predacl::query
