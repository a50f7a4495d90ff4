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

#include <string>

namespace predacl::query {

/// Answers per predicate permission questions for one caller. Implementations
/// must give the same answers for the whole lifetime of a request.
class PredicateAuthChecker {
 public:
  virtual ~PredicateAuthChecker() = default;

  [[nodiscard]] virtual bool CanRead(const std::string &predicate) const = 0;

  [[nodiscard]] virtual bool CanWrite(const std::string &predicate) const = 0;

  [[nodiscard]] virtual bool CanModify(const std::string &predicate) const = 0;

  /// Guardians, and operations only they may perform (drop all, wildcard deletes).
  [[nodiscard]] virtual bool IsGuardian() const = 0;
};

class AllowEverythingPredicateChecker final : public PredicateAuthChecker {
 public:
  bool CanRead(const std::string & /*predicate*/) const override { return true; }

  bool CanWrite(const std::string & /*predicate*/) const override { return true; }

  bool CanModify(const std::string & /*predicate*/) const override { return true; }

  bool IsGuardian() const override { return true; }
};

}  // namespace predacl::query
