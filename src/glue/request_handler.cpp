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

#include "glue/request_handler.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "auth/exceptions.hpp"
#include "query/exceptions.hpp"
#include "query/request.hpp"
#include "utils/logging.hpp"

namespace predacl::glue {
namespace {

constexpr std::array<std::string_view, 10> kAdminOperations{
    "create_user", "drop_user",   "create_group", "drop_group", "add_to_group", "remove_from_group",
    "set_rule",    "remove_rule", "list_users",   "list_groups"};

int64_t ToEpochSeconds(std::chrono::system_clock::time_point time) {
  return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
}

std::optional<std::string> OptionalString(const nlohmann::json &request, const char *key) {
  if (!request.contains(key) || request.at(key).is_null()) return std::nullopt;
  return request.at(key).get<std::string>();
}

std::string RequiredString(const nlohmann::json &request, const char *key) {
  auto value = OptionalString(request, key);
  if (!value) throw query::SyntaxException("missing \"{}\"", key);
  return std::move(*value);
}

Credentials CredentialsOf(const nlohmann::json &request) {
  return Credentials{.access_token = OptionalString(request, "access_token"),
                     .refresh_token = OptionalString(request, "refresh_token")};
}

const nlohmann::json &Body(const nlohmann::json &request) {
  if (!request.contains("request")) throw query::SyntaxException("missing \"request\"");
  return request.at("request");
}

nlohmann::json Reply(nlohmann::json data, const std::optional<auth::TokenPair> &tokens) {
  nlohmann::json reply{{"data", std::move(data)}};
  if (tokens) reply["tokens"] = ToJson(*tokens);
  return reply;
}

nlohmann::json Reply(Response response) { return Reply(std::move(response.data), response.refreshed_tokens); }

nlohmann::json Success() { return {{"code", "Success"}}; }

}  // namespace

nlohmann::json ToJson(const auth::TokenPair &tokens) {
  return {{"access_token", tokens.access_token},
          {"refresh_token", tokens.refresh_token},
          {"access_expiry", ToEpochSeconds(tokens.access_expiry)},
          {"refresh_expiry", ToEpochSeconds(tokens.refresh_expiry)}};
}

RequestHandler::RequestHandler(auth::SynchedAuth *auth, auth::TokenManager *tokens, AuthInterceptor *interceptor)
    : auth_(auth), tokens_(tokens), interceptor_(interceptor) {
  PA_ASSERT(auth_ && tokens_ && interceptor_, "Request handler is missing a collaborator!");
}

nlohmann::json RequestHandler::Handle(const nlohmann::json &request, std::stop_token stop_token) {
  try {
    if (!request.is_object()) throw query::SyntaxException("a request must be a JSON object");
    return Dispatch(request, stop_token);
  } catch (const utils::BasicException &e) {
    spdlog::debug("Request failed: {}", e.what());
    return {{"error", e.what()}, {"kind", e.name()}};
  } catch (const nlohmann::json::exception &e) {
    return {{"error", e.what()}, {"kind", "SyntaxException"}};
  }
}

nlohmann::json RequestHandler::Dispatch(const nlohmann::json &request, const std::stop_token &stop_token) {
  const auto op = RequiredString(request, "op");

  if (op == "login") {
    return Reply(nlohmann::json::object(),
                 tokens_->Authenticate(RequiredString(request, "user"), RequiredString(request, "password")));
  }
  if (op == "refresh") {
    return Reply(nlohmann::json::object(), tokens_->Refresh(RequiredString(request, "refresh_token")));
  }
  if (op == "query") {
    return Reply(interceptor_->Query(CredentialsOf(request), query::ParseQueryRequest(Body(request)), stop_token));
  }
  if (op == "mutate") {
    return Reply(interceptor_->Mutate(CredentialsOf(request), query::ParseMutationRequest(Body(request)), stop_token));
  }
  if (op == "alter") {
    return Reply(interceptor_->Alter(CredentialsOf(request), query::ParseAlterRequest(Body(request)), stop_token));
  }
  if (op == "schema") {
    const auto body = request.contains("request") ? request.at("request") : nlohmann::json::object();
    return Reply(interceptor_->Schema(CredentialsOf(request), query::ParseSchemaRequest(body), stop_token));
  }
  if (op == "change_password") {
    auto caller = interceptor_->Authenticate(CredentialsOf(request));
    auto username = OptionalString(request, "user").value_or(caller.context.identity);
    if (username != caller.context.identity && !caller.context.guardian) {
      throw auth::PermissionDenied("only guardians are allowed to change the password of another user");
    }
    {
      auto locked_auth = auth_->Lock();
      auto user = locked_auth->GetUser(username);
      if (!user) throw auth::AuthException("User '{}' doesn't exist.", username);
      locked_auth->UpdatePassword(*user, OptionalString(request, "password"));
      locked_auth->SaveUser(*user);
    }
    return Reply(Success(), caller.refreshed_tokens);
  }

  if (std::find(kAdminOperations.begin(), kAdminOperations.end(), op) == kAdminOperations.end()) {
    throw query::SyntaxException("unknown operation \"{}\"", op);
  }
  auto caller = interceptor_->AuthenticateGuardian(CredentialsOf(request));
  spdlog::info("{} performs {}.", caller.context.identity, op);
  return Reply(Administer(op, request), caller.refreshed_tokens);
}

nlohmann::json RequestHandler::Administer(const std::string &op, const nlohmann::json &request) {
  if (op == "create_user") {
    const auto username = RequiredString(request, "user");
    if (!auth_->Lock()->AddUser(username, OptionalString(request, "password"))) {
      throw auth::AuthException("User '{}' already exists.", username);
    }
    return Success();
  }
  if (op == "drop_user") {
    const auto username = RequiredString(request, "user");
    if (!auth_->Lock()->RemoveUser(username)) throw auth::AuthException("User '{}' doesn't exist.", username);
    return Success();
  }
  if (op == "create_group") {
    const auto groupname = RequiredString(request, "group");
    if (!auth_->Lock()->AddGroup(groupname)) throw auth::AuthException("Group '{}' already exists.", groupname);
    return Success();
  }
  if (op == "drop_group") {
    const auto groupname = RequiredString(request, "group");
    if (!auth_->Lock()->RemoveGroup(groupname)) throw auth::AuthException("Group '{}' doesn't exist.", groupname);
    return Success();
  }
  if (op == "add_to_group") {
    auth_->Lock()->AddUserToGroup(RequiredString(request, "user"), RequiredString(request, "group"));
    return Success();
  }
  if (op == "remove_from_group") {
    auth_->Lock()->RemoveUserFromGroup(RequiredString(request, "user"), RequiredString(request, "group"));
    return Success();
  }
  if (op == "set_rule") {
    if (!request.contains("permission")) throw query::SyntaxException("missing \"permission\"");
    auth_->Lock()->SetRule(RequiredString(request, "group"), RequiredString(request, "predicate"),
                           request.at("permission").get<int64_t>());
    return Success();
  }
  if (op == "remove_rule") {
    const auto groupname = RequiredString(request, "group");
    const auto predicate = RequiredString(request, "predicate");
    if (!auth_->Lock()->RemoveRule(groupname, predicate)) {
      throw auth::AuthException("Group '{}' has no rule for predicate {}.", groupname, predicate);
    }
    return Success();
  }
  if (op == "list_users") {
    auto users = nlohmann::json::array();
    for (const auto &user : auth_->ReadLock()->AllUsers()) {
      users.push_back({{"user", user.name()}, {"groups", user.groups()}});
    }
    return users;
  }
  if (op == "list_groups") {
    auto groups = nlohmann::json::array();
    for (const auto &group : auth_->ReadLock()->AllGroups()) {
      auto rules = nlohmann::json::array();
      for (const auto &rule : group.GetRules()) {
        rules.push_back({{"predicate", rule.predicate},
                         {"permission", rule.permission},
                         {"granted", auth::PermissionMaskToString(rule.permission)}});
      }
      groups.push_back({{"group", group.name()}, {"rules", std::move(rules)}});
    }
    return groups;
  }
  LOG_FATAL("Unhandled administrative operation {}!", op);
}

}  // namespace predacl::glue
