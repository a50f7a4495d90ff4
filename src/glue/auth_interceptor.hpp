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

#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>

#include <nlohmann/json.hpp>

#include "acl/permission_cache.hpp"
#include "auth/token.hpp"
#include "glue/auth_checker.hpp"
#include "query/engine.hpp"
#include "query/request.hpp"

namespace predacl::glue {

/// Tokens supplied with a request. Both may be missing (anonymous caller).
struct Credentials {
  std::optional<std::string> access_token;
  std::optional<std::string> refresh_token;
};

struct Response {
  /// Engine result, unmodified.
  nlohmann::json data;
  /// Set when the access token had expired and was refreshed on the way in;
  /// the caller must use these from now on.
  std::optional<auth::TokenPair> refreshed_tokens;
};

/**
 * Sits between the callers and the engine and enforces the predicate ACL on
 * every request.
 *
 * Queries are never rejected for lack of permissions; unreadable parts are
 * removed before the engine sees them. Mutations and alters are all or
 * nothing: either every predicate is permitted or nothing is dispatched.
 *
 * Each request is checked against a single cache snapshot.
 */
class AuthInterceptor final {
 public:
  struct Config {
    /// Reject anonymous requests of every kind.
    bool require_login{false};
  };

  AuthInterceptor(auth::TokenManager *tokens, const acl::PermissionCache *cache, query::Engine *engine,
                  Config config);

  /// @throw Unauthenticated, TokenInvalid, RefreshExpired, RefreshInvalid
  /// @throw query::RequestCancelled
  Response Query(const Credentials &credentials, const query::QueryRequest &request,
                 std::stop_token stop_token = {});

  /// @throw PermissionDenied if any predicate lacks WRITE.
  Response Mutate(const Credentials &credentials, const query::MutationRequest &request,
                  std::stop_token stop_token = {});

  /// @throw ReservedPredicateViolation if a reserved predicate would change.
  /// @throw PermissionDenied if any predicate lacks MODIFY.
  Response Alter(const Credentials &credentials, const query::AlterRequest &request, std::stop_token stop_token = {});

  /// Requires a valid token; the result is not filtered.
  Response Schema(const Credentials &credentials, const query::SchemaRequest &request,
                  std::stop_token stop_token = {});

  /// Caller of an operation outside the four request kinds.
  struct Caller {
    query::RequestContext context;
    std::optional<auth::TokenPair> refreshed_tokens;
  };

  /// @throw Unauthenticated if the caller has no valid token.
  Caller Authenticate(const Credentials &credentials);

  /// Administrative operations on users, groups and rules are for guardians only.
  /// @throw PermissionDenied if the caller isn't a guardian.
  Caller AuthenticateGuardian(const Credentials &credentials);

  /// Declares the schemas of the reserved predicates that don't have one yet.
  /// This is the only way a reserved predicate's schema comes into existence.
  void BootstrapReservedSchema();

 private:
  struct Identified {
    query::RequestContext context;
    std::shared_ptr<const acl::PermissionSnapshot> snapshot;
    std::optional<auth::TokenPair> refreshed_tokens;
  };

  Identified Resolve(const Credentials &credentials, bool login_required);

  static SnapshotAuthChecker MakeChecker(const Identified &identified);

  auth::TokenManager *tokens_;
  const acl::PermissionCache *cache_;
  query::Engine *engine_;
  Config config_;
  // Alters are checked against the current schema and then applied; this
  // keeps another alter from slipping in between.
  std::mutex alter_lock_;
};

}  // namespace predacl::glue
