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

#include "query/predicate_filter.hpp"

#include <algorithm>
#include <iterator>
#include <optional>

namespace predacl::query {
namespace {

class Pruner {
 public:
  explicit Pruner(const PredicateAuthChecker &checker) : checker_(checker) {}

  bool Readable(const std::string &predicate) const {
    return !predicate.empty() && (predicate == kUidPredicate || checker_.CanRead(predicate));
  }

  // Only `uid` reads no predicate; anything else with an empty one is unreadable.
  bool Readable(const std::string &function, const std::string &predicate) const {
    if (predicate.empty()) return !NamesPredicate(function);
    return Readable(predicate);
  }

  std::vector<Field> PruneFields(const std::vector<Field> &fields) {
    std::vector<Field> result;
    result.reserve(fields.size());
    for (const auto &field : fields) {
      if (!Readable(field.predicate)) {
        ++elided_;
        continue;
      }
      auto &kept = result.emplace_back(field);
      kept.children = PruneFields(field.children);
    }
    return result;
  }

  std::optional<FilterNode> PruneFilter(const FilterNode &node) {
    if (node.op == FilterNode::Op::LEAF) {
      if (Readable(node.function, node.predicate)) return node;
      ++elided_;
      return std::nullopt;
    }
    FilterNode pruned{.op = node.op};
    for (const auto &child : node.children) {
      if (auto kept = PruneFilter(child)) pruned.children.push_back(std::move(*kept));
    }
    if (pruned.children.empty()) return std::nullopt;
    // A connective with a single operand left is just that operand.
    if (pruned.op != FilterNode::Op::NOT && pruned.children.size() == 1) return std::move(pruned.children.front());
    return pruned;
  }

  std::vector<OrderClause> PruneOrder(const std::vector<OrderClause> &order) {
    std::vector<OrderClause> result;
    std::copy_if(order.begin(), order.end(), std::back_inserter(result),
                 [this](const auto &clause) { return Readable(clause.predicate); });
    elided_ += order.size() - result.size();
    return result;
  }

  std::vector<std::string> PruneGroupBy(const std::vector<std::string> &group_by) {
    if (std::all_of(group_by.begin(), group_by.end(), [this](const auto &p) { return Readable(p); })) {
      return group_by;
    }
    ++elided_;
    return {};
  }

  size_t elided() const { return elided_; }

 private:
  const PredicateAuthChecker &checker_;
  size_t elided_{0};
};

}  // namespace

FilteredQuery FilterUnauthorizedPredicates(const QueryRequest &request, const PredicateAuthChecker &checker) {
  Pruner pruner(checker);
  FilteredQuery result;
  for (const auto &block : request.blocks) {
    if (!pruner.Readable(block.root.name, block.root.predicate)) {
      result.empty_blocks.push_back(block.name);
      continue;
    }
    QueryBlock pruned;
    pruned.name = block.name;
    pruned.root = block.root;
    if (block.filter) pruned.filter = pruner.PruneFilter(*block.filter);
    pruned.order = pruner.PruneOrder(block.order);
    pruned.group_by = pruner.PruneGroupBy(block.group_by);
    pruned.fields = pruner.PruneFields(block.fields);
    result.request.blocks.push_back(std::move(pruned));
  }
  result.elided = pruner.elided();
  return result;
}

}  // namespace predacl::query
