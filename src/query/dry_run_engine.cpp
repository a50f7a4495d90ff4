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

#include "query/dry_run_engine.hpp"

#include <vector>

#include "acl/reserved.hpp"
#include "query/exceptions.hpp"
#include "utils/logging.hpp"

namespace predacl::query {
namespace {
const std::string kSchemaPrefix = "schema:";
}  // namespace

DryRunEngine::DryRunEngine(std::filesystem::path storage_directory) : storage_(std::move(storage_directory)) {}

void DryRunEngine::Record(std::string kind, nlohmann::json request, const RequestContext &context) {
  spdlog::debug("Dispatching {} of '{}': {}", kind, context.identity, request.dump());
  *last_dispatched_.Lock() = {{"kind", std::move(kind)}, {"identity", context.identity}, {"request", std::move(request)}};
}

nlohmann::json DryRunEngine::Query(const QueryRequest &request, const RequestContext &context) {
  Record("query", ToJson(request), context);
  auto result = nlohmann::json::object();
  for (const auto &block : request.blocks) result[block.name] = nlohmann::json::array();
  return result;
}

nlohmann::json DryRunEngine::Mutate(const MutationRequest &request, const RequestContext &context) {
  Record("mutate", ToJson(request), context);
  return {{"code", "Success"}, {"message", "Done"}, {"uids", nlohmann::json::object()}};
}

nlohmann::json DryRunEngine::Introspect(const SchemaRequest &request, const RequestContext &context) {
  Record("schema", ToJson(request), context);
  auto schema = nlohmann::json::array();
  if (request.predicates.empty()) {
    for (auto it = storage_.begin(kSchemaPrefix); it != storage_.end(kSchemaPrefix); ++it) {
      schema.push_back({{"predicate", it->first.substr(kSchemaPrefix.size())}, {"schema", it->second}});
    }
  } else {
    for (const auto &predicate : request.predicates) {
      if (auto current = GetSchema(predicate)) schema.push_back({{"predicate", predicate}, {"schema", *current}});
    }
  }
  return {{"schema", std::move(schema)}};
}

std::optional<std::string> DryRunEngine::GetSchema(const std::string &predicate) const {
  return storage_.Get(kSchemaPrefix + predicate);
}

void DryRunEngine::ApplySchemaAlter(const std::string &predicate, const std::string &schema) {
  if (!storage_.Put(kSchemaPrefix + predicate, acl::NormalizeSchema(schema))) {
    throw QueryException("Couldn't store the schema of predicate {}!", predicate);
  }
  spdlog::info("Schema of predicate {} set to '{}'.", predicate, schema);
}

void DryRunEngine::DropPredicate(const std::string &predicate) {
  if (!storage_.Delete(kSchemaPrefix + predicate)) {
    throw QueryException("Couldn't drop predicate {}!", predicate);
  }
  spdlog::info("Predicate {} dropped.", predicate);
}

void DryRunEngine::DropAll() {
  std::vector<std::string> keys;
  for (auto it = storage_.begin(kSchemaPrefix); it != storage_.end(kSchemaPrefix); ++it) {
    if (!acl::IsReserved(it->first.substr(kSchemaPrefix.size()))) keys.push_back(it->first);
  }
  if (!storage_.DeleteMultiple(keys)) {
    throw QueryException("Couldn't drop all predicates!");
  }
  spdlog::info("Dropped {} predicates.", keys.size());
}

nlohmann::json DryRunEngine::LastDispatched() const { return *last_dispatched_.Lock(); }

}  // namespace predacl::query
