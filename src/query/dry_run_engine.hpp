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

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "kvstore/kvstore.hpp"
#include "query/engine.hpp"
#include "utils/synchronized.hpp"

namespace predacl::query {

/**
 * Engine that keeps predicate schemas durably but stores no graph data.
 * Queries return an empty list per block and mutations succeed without
 * effect; every request it receives is remembered, so operators and tests can
 * see exactly what got past the interceptor.
 */
class DryRunEngine final : public Engine {
 public:
  /// @throw kvstore::KVStoreError if the storage can't be opened.
  explicit DryRunEngine(std::filesystem::path storage_directory);

  nlohmann::json Query(const QueryRequest &request, const RequestContext &context) override;

  nlohmann::json Mutate(const MutationRequest &request, const RequestContext &context) override;

  nlohmann::json Introspect(const SchemaRequest &request, const RequestContext &context) override;

  std::optional<std::string> GetSchema(const std::string &predicate) const override;

  /// @throw QueryException if the schema can't be stored.
  void ApplySchemaAlter(const std::string &predicate, const std::string &schema) override;

  /// @throw QueryException if the schema can't be removed.
  void DropPredicate(const std::string &predicate) override;

  /// @throw QueryException if the schemas can't be removed.
  void DropAll() override;

  /// Last request dispatched to the engine, as JSON; null before the first one.
  nlohmann::json LastDispatched() const;

 private:
  void Record(std::string kind, nlohmann::json request, const RequestContext &context);

  kvstore::KVStore storage_;
  mutable utils::Synchronized<nlohmann::json, std::mutex> last_dispatched_;
};

}  // namespace predacl::query
