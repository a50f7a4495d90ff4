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

#include <stop_token>

#include <nlohmann/json.hpp>

#include "auth/auth.hpp"
#include "auth/token.hpp"
#include "glue/auth_interceptor.hpp"

namespace predacl::glue {

/**
 * Wire protocol of the predacl binary: one JSON object per request, one per
 * response.
 *
 * Every request names its operation in "op". Token carrying requests put
 * them in "access_token" and "refresh_token". A response holds either "data"
 * (plus "tokens" when a new pair was issued) or "error" and "kind", the message
 * and the name of the exception that rejected the request.
 *
 * Operations: login, refresh, query, mutate, alter, schema, change_password,
 * and the guardian only create_user, drop_user, create_group, drop_group,
 * add_to_group, remove_from_group, set_rule, remove_rule, list_users,
 * list_groups.
 */
class RequestHandler final {
 public:
  RequestHandler(auth::SynchedAuth *auth, auth::TokenManager *tokens, AuthInterceptor *interceptor);

  /// Never throws for a bad request; the error is reported in the response.
  nlohmann::json Handle(const nlohmann::json &request, std::stop_token stop_token = {});

 private:
  nlohmann::json Dispatch(const nlohmann::json &request, const std::stop_token &stop_token);

  nlohmann::json Administer(const std::string &op, const nlohmann::json &request);

  auth::SynchedAuth *auth_;
  auth::TokenManager *tokens_;
  AuthInterceptor *interceptor_;
};

nlohmann::json ToJson(const auth::TokenPair &tokens);

}  // namespace predacl::glue
