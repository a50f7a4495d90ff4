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

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "acl/permission_cache.hpp"
#include "acl/rule_store.hpp"
#include "auth/auth.hpp"
#include "utils/file.hpp"

using namespace predacl;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

class FakeRuleStore final : public acl::RuleStoreAccessor {
 public:
  acl::AclGraph LoadAll() const override {
    ++loads;
    if (fail) throw std::runtime_error("store unavailable");
    std::lock_guard guard(lock);
    return graph;
  }

  std::optional<std::set<std::string>> LoadUserGroups(const std::string &identity) const override {
    std::lock_guard guard(lock);
    auto it = graph.user_groups.find(identity);
    if (it == graph.user_groups.end()) return std::nullopt;
    return it->second;
  }

  void SetRules(std::vector<acl::GroupRule> rules) {
    std::lock_guard guard(lock);
    graph.rules = std::move(rules);
  }

  void SetMembers(std::map<std::string, std::set<std::string>> user_groups) {
    std::lock_guard guard(lock);
    graph.user_groups = std::move(user_groups);
  }

  mutable std::atomic<int> loads{0};
  std::atomic<bool> fail{false};

 private:
  mutable std::mutex lock;
  acl::AclGraph graph;
};

bool WaitFor(const std::function<bool()> &done, std::chrono::milliseconds deadline) {
  const auto until = std::chrono::steady_clock::now() + deadline;
  while (!done()) {
    if (std::chrono::steady_clock::now() > until) return false;
    std::this_thread::sleep_for(5ms);
  }
  return true;
}

}  // namespace

TEST(PermissionCache, EmptyBeforeFirstRefresh) {
  FakeRuleStore store;
  store.SetRules({{"dev", "name", 4}});
  acl::PermissionCache cache(&store);

  EXPECT_EQ(cache.Generation(), 0);
  EXPECT_EQ(cache.Lookup("dev", "name"), auth::kNoPermission);
  EXPECT_EQ(store.loads, 0);
}

TEST(PermissionCache, RefreshPublishesRules) {
  FakeRuleStore store;
  store.SetRules({{"dev", "name", 4}, {"dev", "age", 6}, {"ops", "name", 2}});
  acl::PermissionCache cache(&store);

  ASSERT_TRUE(cache.Refresh());
  EXPECT_EQ(cache.Generation(), 1);
  EXPECT_EQ(cache.Lookup("dev", "name"), 4);
  EXPECT_EQ(cache.Lookup("dev", "age"), 6);
  EXPECT_EQ(cache.Lookup("ops", "name"), 2);
  EXPECT_EQ(cache.Lookup("ops", "age"), auth::kNoPermission);
  EXPECT_EQ(cache.Lookup("qa", "name"), auth::kNoPermission);

  ASSERT_TRUE(cache.Refresh());
  EXPECT_EQ(cache.Generation(), 2);
}

TEST(PermissionCache, LaterRuleWins) {
  FakeRuleStore store;
  store.SetRules({{"dev", "name", 7}, {"dev", "name", 4}});
  acl::PermissionCache cache(&store);
  ASSERT_TRUE(cache.Refresh());
  EXPECT_EQ(cache.Lookup("dev", "name"), 4);
}

TEST(PermissionCache, EffectivePermissionIsTheUnionOfGroups) {
  FakeRuleStore store;
  store.SetRules({{"dev", "name", 4}, {"ops", "name", 2}, {"ops", "age", 1}, {"qa", "email", 4}});
  acl::PermissionCache cache(&store);
  ASSERT_TRUE(cache.Refresh());

  const std::vector<std::string> groups{"dev", "ops", "qa", "nobody"};
  for (const auto &predicate : {"name", "age", "email", "missing"}) {
    for (const auto &first : groups) {
      for (const auto &second : groups) {
        EXPECT_EQ(cache.LookupEffective({first, second}, predicate),
                  cache.LookupEffective({first}, predicate) | cache.LookupEffective({second}, predicate))
            << first << ", " << second << " on " << predicate;
      }
    }
  }
  EXPECT_EQ(cache.LookupEffective({"dev", "ops"}, "name"), 6);
  EXPECT_EQ(cache.LookupEffective({}, "name"), auth::kNoPermission);
}

TEST(PermissionCache, FailedRefreshKeepsSnapshot) {
  FakeRuleStore store;
  store.SetRules({{"dev", "name", 4}});
  acl::PermissionCache cache(&store);
  ASSERT_TRUE(cache.Refresh());

  store.SetRules({});
  store.fail = true;
  EXPECT_FALSE(cache.Refresh());
  EXPECT_EQ(cache.Generation(), 1);
  EXPECT_EQ(cache.Lookup("dev", "name"), 4);

  store.fail = false;
  EXPECT_TRUE(cache.Refresh());
  EXPECT_EQ(cache.Generation(), 2);
  EXPECT_EQ(cache.Lookup("dev", "name"), auth::kNoPermission);
}

TEST(PermissionCache, SnapshotsAreImmutable) {
  FakeRuleStore store;
  store.SetRules({{"dev", "name", 4}});
  acl::PermissionCache cache(&store);
  ASSERT_TRUE(cache.Refresh());

  const auto held = cache.Current();
  store.SetRules({{"dev", "name", 0}});
  ASSERT_TRUE(cache.Refresh());

  EXPECT_EQ(held->Lookup("dev", "name"), 4);
  EXPECT_EQ(held->Generation(), 1);
  EXPECT_EQ(cache.Lookup("dev", "name"), 0);
}

TEST(PermissionCache, Guardians) {
  FakeRuleStore store;
  store.SetMembers({{"groot", {"guardians"}}, {"alice", {"dev"}}, {"bob", {"dev", "guardians"}}});
  acl::PermissionCache cache(&store);
  EXPECT_FALSE(cache.IsGuardian("groot"));

  ASSERT_TRUE(cache.Refresh());
  EXPECT_TRUE(cache.IsGuardian("groot"));
  EXPECT_TRUE(cache.IsGuardian("bob"));
  EXPECT_FALSE(cache.IsGuardian("alice"));
  EXPECT_FALSE(cache.IsGuardian("carol"));

  store.SetMembers({{"groot", {"guardians"}}, {"bob", {"dev"}}});
  ASSERT_TRUE(cache.Refresh());
  EXPECT_FALSE(cache.IsGuardian("bob"));
}

TEST(PermissionCache, StartRefreshesImmediatelyThenPeriodically) {
  FakeRuleStore store;
  store.SetRules({{"dev", "name", 4}});
  acl::PermissionCache cache(&store);

  cache.Start(50ms);
  EXPECT_GE(cache.Generation(), 1);
  EXPECT_EQ(cache.Lookup("dev", "name"), 4);

  store.SetRules({{"dev", "name", 6}});
  EXPECT_TRUE(WaitFor([&] { return cache.Lookup("dev", "name") == 6; }, 2s));

  cache.Stop();
  const auto generation = cache.Generation();
  store.SetRules({{"dev", "name", 0}});
  std::this_thread::sleep_for(200ms);
  EXPECT_EQ(cache.Generation(), generation);
  EXPECT_EQ(cache.Lookup("dev", "name"), 6);
}

TEST(PermissionCache, NotVisibleBeforeRefresh) {
  FakeRuleStore store;
  acl::PermissionCache cache(&store);
  cache.Start(1h);

  store.SetRules({{"dev", "name", 4}});
  std::this_thread::sleep_for(100ms);
  EXPECT_EQ(cache.Lookup("dev", "name"), auth::kNoPermission);

  ASSERT_TRUE(cache.Refresh());
  EXPECT_EQ(cache.Lookup("dev", "name"), 4);
}

TEST(PermissionCache, InstancesAreIndependent) {
  FakeRuleStore first_store;
  FakeRuleStore second_store;
  first_store.SetRules({{"dev", "name", 4}});
  second_store.SetRules({{"dev", "name", 2}});
  acl::PermissionCache first(&first_store);
  acl::PermissionCache second(&second_store);

  first.Start(20ms);
  second.Start(20ms);
  EXPECT_EQ(first.Lookup("dev", "name"), 4);
  EXPECT_EQ(second.Lookup("dev", "name"), 2);

  second.Stop();
  first_store.SetRules({{"dev", "name", 1}});
  EXPECT_TRUE(WaitFor([&] { return first.Lookup("dev", "name") == 1; }, 2s));
  EXPECT_EQ(second.Lookup("dev", "name"), 2);
}

TEST(PermissionCache, ConcurrentReadersDuringRefreshes) {
  FakeRuleStore store;
  store.SetRules({{"dev", "name", 4}, {"dev", "age", 4}});
  acl::PermissionCache cache(&store);
  cache.Start(1ms);

  // Every published snapshot grants both predicates the same mask.
  std::atomic<bool> stop{false};
  std::atomic<int> inconsistent{0};
  std::vector<std::jthread> readers;
  for (int i = 0; i < 4; ++i) {
    readers.emplace_back([&] {
      while (!stop) {
        const auto snapshot = cache.Current();
        if (snapshot->Lookup("dev", "name") != snapshot->Lookup("dev", "age")) ++inconsistent;
      }
    });
  }
  for (auth::PermissionMask mask = 0; mask <= auth::kAllPermissions; ++mask) {
    store.SetRules({{"dev", "name", mask}, {"dev", "age", mask}});
    std::this_thread::sleep_for(5ms);
  }
  stop = true;
  readers.clear();
  cache.Stop();
  EXPECT_EQ(inconsistent, 0);
}

class AuthRuleStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    predacl::utils::EnsureDir(test_folder);
    auth = std::make_unique<auth::SynchedAuth>(test_folder / "auth", auth::Auth::Config{});
  }

  void TearDown() override {
    auth.reset();
    fs::remove_all(test_folder);
  }

  fs::path test_folder{fs::temp_directory_path() /
                       ("predacl_tests_unit_acl_rule_store_" + std::to_string(static_cast<int>(getpid())))};
  std::unique_ptr<auth::SynchedAuth> auth;
};

TEST_F(AuthRuleStoreTest, LoadsRulesAndMemberships) {
  {
    auto locked_auth = auth->Lock();
    locked_auth->Bootstrap("password");
    locked_auth->AddUser("alice");
    locked_auth->AddGroup("dev");
    locked_auth->AddUserToGroup("alice", "dev");
    locked_auth->SetRule("dev", "name", 4);
    locked_auth->SetRule("dev", "age", 6);
  }
  acl::AuthRuleStore store(auth.get());

  const auto graph = store.LoadAll();
  EXPECT_EQ(graph.rules.size(), 2);
  EXPECT_EQ(graph.user_groups.at("alice"), (std::set<std::string>{"dev"}));
  EXPECT_EQ(graph.user_groups.at("groot"), (std::set<std::string>{"guardians"}));

  EXPECT_EQ(store.LoadUserGroups("alice").value(), (std::set<std::string>{"dev"}));
  EXPECT_FALSE(store.LoadUserGroups("bob"));

  acl::PermissionCache cache(&store);
  ASSERT_TRUE(cache.Refresh());
  EXPECT_EQ(cache.LookupEffective({"dev"}, "age"), 6);
  EXPECT_TRUE(cache.IsGuardian("groot"));
  EXPECT_FALSE(cache.IsGuardian("alice"));
}
