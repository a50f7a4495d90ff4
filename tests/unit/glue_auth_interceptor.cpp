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

#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <set>
#include <stop_token>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "acl/permission_cache.hpp"
#include "acl/rule_store.hpp"
#include "auth/auth.hpp"
#include "auth/exceptions.hpp"
#include "auth/token.hpp"
#include "glue/auth_interceptor.hpp"
#include "query/dry_run_engine.hpp"
#include "query/exceptions.hpp"
#include "query/request.hpp"
#include "utils/file.hpp"

using namespace predacl;
using namespace std::chrono_literals;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {
constexpr int64_t kRead = 4;
constexpr int64_t kWrite = 2;
constexpr int64_t kModify = 1;

query::QueryRequest Query(const char *text) { return query::ParseQueryRequest(json::parse(text)); }

query::MutationRequest SetNQuads(const std::string &nquads) {
  return query::ParseMutationRequest(json{{"set_nquads", nquads}});
}

query::AlterRequest Schema(const std::string &schema) { return query::ParseAlterRequest(json{{"schema", schema}}); }
}  // namespace

class AuthInterceptorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    utils::EnsureDir(test_folder);
    auth = std::make_unique<auth::SynchedAuth>(test_folder / "auth", auth::Auth::Config{});
    {
      auto locked_auth = auth->Lock();
      locked_auth->Bootstrap("groot password");
      locked_auth->AddUser("alice", "alice password");
      locked_auth->AddUser("bob", "bob password");
      locked_auth->AddGroup("dev");
      locked_auth->AddUserToGroup("alice", "dev");
    }
    store = std::make_unique<acl::AuthRuleStore>(auth.get());
    tokens = std::make_unique<auth::TokenManager>(
        auth.get(), auth::TokenManager::Config{
                        .signing_key = "0123456789abcdef0123456789abcdef",
                        .access_ttl = 60s,
                        .refresh_ttl = 600s,
                        .clock = [this] { return now; },
                        .user_groups = [this](const std::string &identity) { return store->LoadUserGroups(identity); }});
    cache = std::make_unique<acl::PermissionCache>(store.get());
    ASSERT_TRUE(cache->Refresh());
    engine = std::make_unique<query::DryRunEngine>(test_folder / "schema");
    interceptor = std::make_unique<glue::AuthInterceptor>(tokens.get(), cache.get(), engine.get(),
                                                          glue::AuthInterceptor::Config{});
    interceptor->BootstrapReservedSchema();
  }

  void TearDown() override {
    interceptor.reset();
    engine.reset();
    cache.reset();
    tokens.reset();
    store.reset();
    auth.reset();
    fs::remove_all(test_folder);
  }

  glue::Credentials Login(const std::string &user, const std::string &password) {
    auto pair = tokens->Authenticate(user, password);
    return {pair.access_token, pair.refresh_token};
  }

  glue::Credentials Alice() { return Login("alice", "alice password"); }
  glue::Credentials Groot() { return Login("groot", "groot password"); }

  void Grant(const std::string &group, const std::string &predicate, int64_t permission) {
    auth->Lock()->SetRule(group, predicate, permission);
    ASSERT_TRUE(cache->Refresh());
  }

  query::QueryRequest Dispatched() const {
    auto last = engine->LastDispatched();
    EXPECT_EQ(last["kind"], "query");
    return query::ParseQueryRequest(last["request"]);
  }

  fs::path test_folder{fs::temp_directory_path() /
                       ("predacl_tests_unit_glue_auth_interceptor_" + std::to_string(static_cast<int>(getpid())))};
  std::chrono::system_clock::time_point now{std::chrono::sys_days{std::chrono::year{2024} / 5 / 1}};
  std::unique_ptr<auth::SynchedAuth> auth;
  std::unique_ptr<auth::TokenManager> tokens;
  std::unique_ptr<acl::AuthRuleStore> store;
  std::unique_ptr<acl::PermissionCache> cache;
  std::unique_ptr<query::DryRunEngine> engine;
  std::unique_ptr<glue::AuthInterceptor> interceptor;
};

TEST_F(AuthInterceptorTest, NoRulesMeansNothingReadable) {
  const auto response = interceptor->Query(Alice(), Query(R"({"blocks": [{"name": "me",
    "func": {"name": "has", "predicate": "name"}, "fields": [{"predicate": "name"}]}]})"));
  EXPECT_EQ(response.data, json::object());
  EXPECT_FALSE(response.refreshed_tokens);
  // Nothing was left to ask the engine.
  EXPECT_TRUE(engine->LastDispatched().is_null());
}

TEST_F(AuthInterceptorTest, NoRulesMeansNothingWritable) {
  try {
    interceptor->Mutate(Alice(), SetNQuads("_:a <name> \"Alice\" .\n_:a <age> \"31\" ."));
    FAIL() << "mutation should have been denied";
  } catch (const auth::PermissionDenied &e) {
    EXPECT_STREQ(e.what(), "PermissionDenied: unauthorized to mutate the predicate: age, name");
  }
  EXPECT_THROW(interceptor->Alter(Alice(), Schema("name: string .")), auth::PermissionDenied);
  EXPECT_TRUE(engine->LastDispatched().is_null());
  EXPECT_FALSE(engine->GetSchema("name"));
}

TEST_F(AuthInterceptorTest, UnreadableFieldsNeverReachTheEngine) {
  Grant("dev", "name", kRead);
  const auto response = interceptor->Query(Alice(), Query(R"({"blocks": [{"name": "me",
    "func": {"name": "has", "predicate": "name"},
    "fields": [{"predicate": "name"}, {"predicate": "age"}]}]})"));
  EXPECT_EQ(response.data, (json{{"me", json::array()}}));

  const auto expected = Query(R"({"blocks": [{"name": "me",
    "func": {"name": "has", "predicate": "name"}, "fields": [{"predicate": "name"}]}]})");
  EXPECT_EQ(Dispatched(), expected);
  EXPECT_EQ(engine->LastDispatched()["identity"], "alice");
}

TEST_F(AuthInterceptorTest, UnreadableRootEmptiesOnlyItsBlock) {
  Grant("dev", "name", kRead);
  const auto response = interceptor->Query(Alice(), Query(R"({"blocks": [
    {"name": "a", "func": {"name": "has", "predicate": "age"}, "fields": [{"predicate": "name"}]},
    {"name": "b", "func": {"name": "has", "predicate": "name"}, "fields": [{"predicate": "name"}]}]})"));
  EXPECT_EQ(response.data, (json{{"b", json::array()}}));
  ASSERT_EQ(Dispatched().blocks.size(), 1);
}

TEST_F(AuthInterceptorTest, FunctionWithoutPredicateReadsNothing) {
  Grant("dev", "name", kRead);
  query::QueryRequest request;
  request.blocks.push_back({.name = "a", .root = {.name = "has", .args = {"age"}}});
  request.blocks.push_back(
      {.name = "b",
       .root = {.name = "has", .predicate = "name"},
       .filter = query::FilterNode{.op = query::FilterNode::Op::LEAF, .function = "eq", .args = {"nickname", "RG"}},
       .fields = {{.predicate = "name"}}});

  const auto response = interceptor->Query(Alice(), request);
  EXPECT_EQ(response.data, (json{{"b", json::array()}}));
  const auto dispatched = Dispatched();
  ASSERT_EQ(dispatched.blocks.size(), 1);
  EXPECT_EQ(dispatched.blocks[0].name, "b");
  EXPECT_FALSE(dispatched.blocks[0].filter);
}

TEST_F(AuthInterceptorTest, WriteAndModifyAreSeparatePermissions) {
  Grant("dev", "name", kRead);
  EXPECT_THROW(interceptor->Mutate(Alice(), SetNQuads("_:a <name> \"Alice\" .")), auth::PermissionDenied);

  Grant("dev", "name", kRead | kWrite);
  const auto response = interceptor->Mutate(Alice(), SetNQuads("_:a <name> \"Alice\" ."));
  EXPECT_EQ(response.data["code"], "Success");
  EXPECT_EQ(engine->LastDispatched()["kind"], "mutate");
  EXPECT_THROW(interceptor->Alter(Alice(), Schema("name: string @index(exact) .")), auth::PermissionDenied);

  Grant("dev", "name", kModify);
  interceptor->Alter(Alice(), Schema("name: string @index(exact) ."));
  EXPECT_EQ(engine->GetSchema("name"), "string @index(exact) .");
  // The last rule replaced the earlier one.
  EXPECT_THROW(interceptor->Mutate(Alice(), SetNQuads("_:a <name> \"Alice\" .")), auth::PermissionDenied);
}

TEST_F(AuthInterceptorTest, MutationIsAllOrNothing) {
  Grant("dev", "name", kWrite);
  try {
    interceptor->Mutate(Alice(), SetNQuads("_:a <name> \"Alice\" .\n_:a <age> \"31\" ."));
    FAIL() << "mutation should have been denied";
  } catch (const auth::PermissionDenied &e) {
    EXPECT_STREQ(e.what(), "PermissionDenied: unauthorized to mutate the predicate: age");
  }
  EXPECT_TRUE(engine->LastDispatched().is_null());
}

TEST_F(AuthInterceptorTest, RuleChangesApplyAfterCacheRefresh) {
  Grant("dev", "name", kRead);
  const auto credentials = Alice();
  const auto query = Query(R"({"blocks": [{"name": "me",
    "func": {"name": "has", "predicate": "name"}, "fields": [{"predicate": "name"}]}]})");
  EXPECT_EQ(interceptor->Query(credentials, query).data, (json{{"me", json::array()}}));

  ASSERT_TRUE(auth->Lock()->RemoveRule("dev", "name"));
  EXPECT_EQ(interceptor->Query(credentials, query).data, (json{{"me", json::array()}}));

  ASSERT_TRUE(cache->Refresh());
  EXPECT_EQ(interceptor->Query(credentials, query).data, json::object());
}

TEST_F(AuthInterceptorTest, GrootBypassesRules) {
  const auto groot = Groot();
  interceptor->Mutate(groot, SetNQuads("_:a <name> \"Alice\" ."));
  interceptor->Mutate(groot, query::ParseMutationRequest(json{{"del_nquads", "<0x1> * * ."}}));
  interceptor->Alter(groot, Schema("name: string ."));
  interceptor->Alter(groot, query::ParseAlterRequest(json{{"drop_all", true}}));
  EXPECT_FALSE(engine->GetSchema("name"));
  // Reserved predicates survive a drop all.
  EXPECT_TRUE(engine->GetSchema("dgraph.xid"));
}

TEST_F(AuthInterceptorTest, GuardianMembershipComesFromTheCache) {
  auth->Lock()->AddUserToGroup("bob", "guardians");
  ASSERT_TRUE(cache->Refresh());
  const auto bob = Login("bob", "bob password");
  interceptor->Mutate(bob, SetNQuads("_:a <name> \"Bob\" ."));

  // The token still names guardians, but bob isn't one anymore.
  auth->Lock()->RemoveUserFromGroup("bob", "guardians");
  ASSERT_TRUE(cache->Refresh());
  EXPECT_THROW(interceptor->Mutate(bob, SetNQuads("_:a <name> \"Bob\" .")), auth::PermissionDenied);
  EXPECT_THROW(interceptor->AuthenticateGuardian(bob), auth::PermissionDenied);
}

TEST_F(AuthInterceptorTest, GuardiansBypassRules) {
  auth->Lock()->AddUserToGroup("bob", "guardians");
  ASSERT_TRUE(cache->Refresh());
  const auto bob = Login("bob", "bob password");

  interceptor->Alter(bob, Schema("name: string @index(exact) ."));
  EXPECT_EQ(engine->GetSchema("name"), "string @index(exact) .");

  // No group of bob's holds a rule on age.
  const auto query = Query(R"({"blocks": [{"name": "me", "func": {"name": "has", "predicate": "age"},
    "fields": [{"predicate": "age"}, {"predicate": "dgraph.password"}]}]})");
  EXPECT_EQ(interceptor->Query(bob, query).data, (json{{"me", json::array()}}));
  EXPECT_EQ(Dispatched(), query);
  EXPECT_EQ(engine->LastDispatched()["identity"], "bob");
}

TEST_F(AuthInterceptorTest, GuardianOnlyOperations) {
  Grant("dev", "name", auth::kAllPermissions);
  EXPECT_THROW(interceptor->Mutate(Alice(), query::ParseMutationRequest(json{{"del_nquads", "<0x1> * * ."}})),
               auth::PermissionDenied);
  EXPECT_THROW(interceptor->Alter(Alice(), query::ParseAlterRequest(json{{"drop_all", true}})),
               auth::PermissionDenied);
  EXPECT_THROW(interceptor->AuthenticateGuardian(Alice()), auth::PermissionDenied);
  EXPECT_EQ(interceptor->AuthenticateGuardian(Groot()).context.identity, "groot");
}

TEST_F(AuthInterceptorTest, ReservedSchemaCanOnlyBeRestated) {
  const auto groot = Groot();
  try {
    interceptor->Alter(groot, Schema("dgraph.xid: int ."));
    FAIL() << "alter should have been rejected";
  } catch (const auth::ReservedPredicateViolation &e) {
    EXPECT_NE(std::string(e.what()).find("reserved"), std::string::npos);
  }
  interceptor->Alter(groot, Schema("dgraph.xid:   string @index(exact)  @upsert ."));
  EXPECT_EQ(engine->GetSchema("dgraph.xid"), "string @index(exact) @upsert .");

  EXPECT_THROW(interceptor->Alter(groot, query::ParseAlterRequest(json{{"drop_attr", "dgraph.xid"}})),
               auth::ReservedPredicateViolation);
  EXPECT_THROW(interceptor->Alter(groot, Schema("DGRAPH.Xid: int .")), auth::ReservedPredicateViolation);
  // A reserved predicate that was never declared can't be created either.
  EXPECT_THROW(interceptor->Alter(groot, Schema("dgraph.custom: string .")), auth::ReservedPredicateViolation);
}

TEST_F(AuthInterceptorTest, ReservedViolationTakesPrecedence) {
  // Alice may not alter anything, but the reserved check comes first.
  EXPECT_THROW(interceptor->Alter(Alice(), Schema("name: string .\ndgraph.xid: int .")),
               auth::ReservedPredicateViolation);
  EXPECT_FALSE(engine->GetSchema("name"));
}

TEST_F(AuthInterceptorTest, AclPredicatesAreHiddenFromEveryoneButGuardians) {
  Grant("dev", "dgraph.password", kRead | kWrite);
  Grant("dev", "name", kRead);
  const auto query = Query(R"({"blocks": [{"name": "me", "func": {"name": "has", "predicate": "name"},
    "fields": [{"predicate": "name"}, {"predicate": "dgraph.password"}, {"predicate": "dgraph.type"}]}]})");

  interceptor->Query(Alice(), query);
  const auto dispatched = Dispatched();
  const auto &fields = dispatched.blocks.at(0).fields;
  ASSERT_EQ(fields.size(), 2);
  EXPECT_EQ(fields[0].predicate, "name");
  EXPECT_EQ(fields[1].predicate, "dgraph.type");
  EXPECT_THROW(interceptor->Mutate(Alice(), SetNQuads("<0x1> <dgraph.password> \"x\" .")), auth::PermissionDenied);

  interceptor->Query(Groot(), query);
  EXPECT_EQ(Dispatched(), query);
}

TEST_F(AuthInterceptorTest, ExpiredAccessTokenIsRefreshed) {
  Grant("dev", "name", kRead);
  const auto credentials = Alice();
  now += 61s;
  const auto query = Query(R"({"blocks": [{"name": "me",
    "func": {"name": "has", "predicate": "name"}, "fields": [{"predicate": "name"}]}]})");

  const auto response = interceptor->Query(credentials, query);
  ASSERT_TRUE(response.refreshed_tokens);
  EXPECT_EQ(response.data, (json{{"me", json::array()}}));
  EXPECT_EQ(tokens->VerifyAccess(response.refreshed_tokens->access_token).identity, "alice");
  // Refresh tokens are single use.
  EXPECT_THROW(interceptor->Query(credentials, query), auth::RefreshInvalid);
}

TEST_F(AuthInterceptorTest, ExpiredAccessTokenWithoutRefreshToken) {
  auto credentials = Alice();
  credentials.refresh_token.reset();
  now += 61s;
  EXPECT_THROW(interceptor->Query(credentials, Query(R"({"blocks": [{"name": "me",
    "func": {"name": "has", "predicate": "name"}}]})")),
               auth::Unauthenticated);
}

TEST_F(AuthInterceptorTest, RefreshTokenAlone) {
  auto credentials = Alice();
  credentials.access_token.reset();
  const auto caller = interceptor->Authenticate(credentials);
  EXPECT_EQ(caller.context.identity, "alice");
  EXPECT_EQ(caller.context.groups, (std::set<std::string>{"dev"}));
  EXPECT_TRUE(caller.refreshed_tokens);
}

TEST_F(AuthInterceptorTest, InvalidTokenIsRejected) {
  glue::Credentials credentials{.access_token = "not.a.token"};
  EXPECT_THROW(interceptor->Query(credentials, Query(R"({"blocks": [{"name": "me",
    "func": {"name": "has", "predicate": "name"}}]})")),
               auth::TokenInvalid);
}

TEST_F(AuthInterceptorTest, AnonymousCallers) {
  const glue::Credentials anonymous;
  const auto query = Query(R"({"blocks": [{"name": "q", "func": {"name": "uid", "args": ["0x1"]},
    "fields": [{"predicate": "name"}, {"predicate": "dgraph.type"}]}]})");
  interceptor->Query(anonymous, query);
  EXPECT_EQ(Dispatched().blocks.at(0).fields.size(), 1);
  EXPECT_EQ(engine->LastDispatched()["identity"], "");

  EXPECT_THROW(interceptor->Mutate(anonymous, SetNQuads("_:a <name> \"x\" .")), auth::PermissionDenied);
  EXPECT_THROW(interceptor->Schema(anonymous, {}), auth::Unauthenticated);
  EXPECT_THROW(interceptor->Authenticate(anonymous), auth::Unauthenticated);

  glue::AuthInterceptor strict(tokens.get(), cache.get(), engine.get(), {.require_login = true});
  EXPECT_THROW(strict.Query(anonymous, query), auth::Unauthenticated);
}

TEST_F(AuthInterceptorTest, SchemaIsNotFiltered) {
  const auto response = interceptor->Schema(Alice(), query::SchemaRequest{{"dgraph.xid"}});
  ASSERT_EQ(response.data["schema"].size(), 1);
  EXPECT_EQ(response.data["schema"][0]["schema"], "string @index(exact) @upsert .");
}

TEST_F(AuthInterceptorTest, CancelledRequestsAreNotDispatched) {
  std::stop_source source;
  source.request_stop();
  EXPECT_THROW(interceptor->Query(Groot(),
                                  Query(R"({"blocks": [{"name": "me", "func": {"name": "has", "predicate": "name"}}]})"),
                                  source.get_token()),
               query::RequestCancelled);
  EXPECT_THROW(interceptor->Mutate(Groot(), SetNQuads("_:a <name> \"x\" ."), source.get_token()),
               query::RequestCancelled);
  EXPECT_TRUE(engine->LastDispatched().is_null());
}
