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

#include "glue/auth_interceptor.hpp"

#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "acl/reserved.hpp"
#include "auth/auth.hpp"
#include "auth/exceptions.hpp"
#include "query/exceptions.hpp"
#include "query/predicate_filter.hpp"
#include "utils/logging.hpp"
#include "utils/string.hpp"

namespace predacl::glue {
namespace {

void ThrowIfCancelled(const std::stop_token &stop_token) {
  if (stop_token.stop_requested()) throw query::RequestCancelled();
}

std::string_view DisplayName(const query::RequestContext &context) {
  return context.identity.empty() ? std::string_view{"<anonymous>"} : std::string_view{context.identity};
}

}  // namespace

AuthInterceptor::AuthInterceptor(auth::TokenManager *tokens, const acl::PermissionCache *cache, query::Engine *engine,
                                 Config config)
    : tokens_(tokens), cache_(cache), engine_(engine), config_(config) {
  PA_ASSERT(tokens_ && cache_ && engine_, "Auth interceptor is missing a collaborator!");
}

AuthInterceptor::Identified AuthInterceptor::Resolve(const Credentials &credentials, bool login_required) {
  Identified result;
  result.snapshot = cache_->Current();

  std::optional<auth::AccessClaims> claims;
  if (credentials.access_token) {
    try {
      claims = tokens_->VerifyAccess(*credentials.access_token);
    } catch (const auth::TokenExpired &) {
      if (!credentials.refresh_token) {
        throw auth::Unauthenticated("the access token has expired and no refresh token was supplied");
      }
      spdlog::debug("Access token expired, refreshing it.");
      result.refreshed_tokens = tokens_->Refresh(*credentials.refresh_token);
      claims = tokens_->VerifyAccess(result.refreshed_tokens->access_token);
    }
  } else if (credentials.refresh_token) {
    result.refreshed_tokens = tokens_->Refresh(*credentials.refresh_token);
    claims = tokens_->VerifyAccess(result.refreshed_tokens->access_token);
  }

  if (!claims) {
    if (login_required || config_.require_login) {
      throw auth::Unauthenticated("a valid access token is required");
    }
    return result;
  }

  result.context.identity = std::move(claims->identity);
  result.context.groups = std::move(claims->groups);
  // Membership of guardians always comes from the latest rules, never from
  // the token.
  result.context.groups.erase(std::string{auth::kGuardiansGroup});
  result.context.guardian =
      result.context.identity == auth::kGrootUser || result.snapshot->IsGuardian(result.context.identity);
  if (result.context.guardian) result.context.groups.insert(std::string{auth::kGuardiansGroup});
  return result;
}

SnapshotAuthChecker AuthInterceptor::MakeChecker(const Identified &identified) {
  return SnapshotAuthChecker(identified.snapshot, identified.context.groups, identified.context.guardian);
}

Response AuthInterceptor::Query(const Credentials &credentials, const query::QueryRequest &request,
                                std::stop_token stop_token) {
  ThrowIfCancelled(stop_token);
  auto identified = Resolve(credentials, false);
  const auto checker = MakeChecker(identified);

  auto filtered = query::FilterUnauthorizedPredicates(request, checker);
  if (!filtered.empty_blocks.empty() || filtered.elided > 0) {
    spdlog::debug("Query of {}: {} blocks emptied, {} clauses removed.", DisplayName(identified.context),
                  filtered.empty_blocks.size(), filtered.elided);
  }

  ThrowIfCancelled(stop_token);
  Response response{.refreshed_tokens = std::move(identified.refreshed_tokens)};
  if (filtered.request.blocks.empty()) {
    response.data = nlohmann::json::object();
  } else {
    response.data = engine_->Query(filtered.request, identified.context);
  }
  return response;
}

Response AuthInterceptor::Mutate(const Credentials &credentials, const query::MutationRequest &request,
                                 std::stop_token stop_token) {
  ThrowIfCancelled(stop_token);
  auto identified = Resolve(credentials, false);
  const auto checker = MakeChecker(identified);

  if (!checker.IsGuardian()) {
    std::vector<std::string> denied;
    for (const auto &predicate : request.Predicates()) {
      if (predicate == query::kWildcardPredicate) {
        throw auth::PermissionDenied("only guardians are allowed to delete all predicates of a node");
      }
      if (!checker.CanWrite(predicate)) denied.push_back(predicate);
    }
    if (!denied.empty()) {
      spdlog::info("Mutation of {} denied on {}.", DisplayName(identified.context), utils::Join(denied, ", "));
      throw auth::PermissionDenied(fmt::format("unauthorized to mutate the predicate: {}", utils::Join(denied, ", ")));
    }
  }

  ThrowIfCancelled(stop_token);
  return Response{.data = engine_->Mutate(request, identified.context),
                  .refreshed_tokens = std::move(identified.refreshed_tokens)};
}

Response AuthInterceptor::Alter(const Credentials &credentials, const query::AlterRequest &request,
                                std::stop_token stop_token) {
  ThrowIfCancelled(stop_token);
  auto identified = Resolve(credentials, false);
  const auto checker = MakeChecker(identified);

  std::lock_guard guard(alter_lock_);

  for (const auto &operation : request.operations) {
    const auto decision = acl::CheckAlter(operation.predicate, operation.schema, engine_->GetSchema(operation.predicate));
    if (!decision.allowed) {
      spdlog::warn("Alter of {} rejected: {}", DisplayName(identified.context), decision.reason);
      throw auth::ReservedPredicateViolation(decision.reason);
    }
  }

  if (!checker.IsGuardian()) {
    if (request.drop_all) throw auth::PermissionDenied("only guardians are allowed to drop all data");
    std::vector<std::string> denied;
    for (const auto &operation : request.operations) {
      if (!checker.CanModify(operation.predicate)) denied.push_back(operation.predicate);
    }
    if (!denied.empty()) {
      spdlog::info("Alter of {} denied on {}.", DisplayName(identified.context), utils::Join(denied, ", "));
      throw auth::PermissionDenied(fmt::format("unauthorized to alter the predicate: {}", utils::Join(denied, ", ")));
    }
  }

  ThrowIfCancelled(stop_token);
  if (request.drop_all) engine_->DropAll();
  for (const auto &operation : request.operations) {
    if (operation.schema) {
      engine_->ApplySchemaAlter(operation.predicate, *operation.schema);
    } else {
      engine_->DropPredicate(operation.predicate);
    }
  }
  return Response{.data = {{"code", "Success"}, {"message", "Done"}},
                  .refreshed_tokens = std::move(identified.refreshed_tokens)};
}

Response AuthInterceptor::Schema(const Credentials &credentials, const query::SchemaRequest &request,
                                 std::stop_token stop_token) {
  ThrowIfCancelled(stop_token);
  auto identified = Resolve(credentials, true);
  ThrowIfCancelled(stop_token);
  return Response{.data = engine_->Introspect(request, identified.context),
                  .refreshed_tokens = std::move(identified.refreshed_tokens)};
}

AuthInterceptor::Caller AuthInterceptor::Authenticate(const Credentials &credentials) {
  auto identified = Resolve(credentials, true);
  return Caller{.context = std::move(identified.context), .refreshed_tokens = std::move(identified.refreshed_tokens)};
}

AuthInterceptor::Caller AuthInterceptor::AuthenticateGuardian(const Credentials &credentials) {
  auto caller = Authenticate(credentials);
  if (!caller.context.guardian) {
    spdlog::info("Administrative operation by {} denied.", caller.context.identity);
    throw auth::PermissionDenied("only guardians are allowed to administer users, groups and rules");
  }
  return caller;
}

void AuthInterceptor::BootstrapReservedSchema() {
  std::lock_guard guard(alter_lock_);
  for (const auto &[predicate, schema] : acl::InitialReservedSchemas()) {
    const std::string name{predicate};
    if (engine_->GetSchema(name)) continue;
    engine_->ApplySchemaAlter(name, std::string{schema});
    spdlog::info("Declared reserved predicate {}.", name);
  }
}

}  // namespace predacl::glue
