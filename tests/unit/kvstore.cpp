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

#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "kvstore/kvstore.hpp"
#include "utils/file.hpp"

namespace fs = std::filesystem;

namespace {
bool PutAll(predacl::kvstore::KVStore &kvstore, const std::map<std::string, std::string> &items) {
  return kvstore.PutAndDeleteMultiple(items, {});
}

size_t Count(const predacl::kvstore::KVStore &kvstore, const std::string &prefix = "") {
  size_t count = 0;
  for (auto it = kvstore.begin(prefix); it != kvstore.end(prefix); ++it) ++count;
  return count;
}
}  // namespace

class KVStore : public ::testing::Test {
 protected:
  void SetUp() override { predacl::utils::EnsureDir(test_folder_); }

  void TearDown() override { fs::remove_all(test_folder_); }

  fs::path test_folder_{fs::temp_directory_path() /
                        ("predacl_unit_kvstore_test_" + std::to_string(static_cast<int>(getpid())))};
};

TEST_F(KVStore, PutGet) {
  predacl::kvstore::KVStore kvstore(test_folder_ / "PutGet");
  ASSERT_TRUE(kvstore.Put("user:alice", R"({"name":"alice"})"));
  ASSERT_EQ(kvstore.Get("user:alice").value(), R"({"name":"alice"})");
  ASSERT_FALSE(kvstore.Get("user:bob"));
}

TEST_F(KVStore, PutOverwrites) {
  predacl::kvstore::KVStore kvstore(test_folder_ / "PutOverwrites");
  ASSERT_TRUE(kvstore.Put("schema:name", "string ."));
  ASSERT_TRUE(kvstore.Put("schema:name", "string @index(exact) ."));
  ASSERT_EQ(kvstore.Get("schema:name").value(), "string @index(exact) .");
  ASSERT_EQ(Count(kvstore), 1);
}

TEST_F(KVStore, DeleteMultipleIgnoresMissingKeys) {
  predacl::kvstore::KVStore kvstore(test_folder_ / "DeleteMultiple");
  ASSERT_TRUE(PutAll(kvstore, {{"group:dev", "{}"}, {"group:ops", "{}"}}));
  ASSERT_TRUE(kvstore.DeleteMultiple({"group:dev", "group:ops", "group:qa"}));
  ASSERT_FALSE(kvstore.Get("group:dev"));
  ASSERT_FALSE(kvstore.Get("group:ops"));
  ASSERT_EQ(Count(kvstore), 0);
}

TEST_F(KVStore, PutAndDeleteMultipleIsOneBatch) {
  predacl::kvstore::KVStore kvstore(test_folder_ / "PutAndDeleteMultiple");
  ASSERT_TRUE(PutAll(kvstore, {{"link:alice", R"(["dev"])"}, {"link:bob", R"(["dev"])"}}));
  ASSERT_TRUE(kvstore.PutAndDeleteMultiple({{"link:carol", R"(["ops"])"}}, {"link:alice", "link:bob"}));
  ASSERT_FALSE(kvstore.Get("link:alice"));
  ASSERT_FALSE(kvstore.Get("link:bob"));
  ASSERT_EQ(kvstore.Get("link:carol").value(), R"(["ops"])");
}

TEST_F(KVStore, Durability) {
  {
    predacl::kvstore::KVStore kvstore(test_folder_ / "Durability");
    ASSERT_TRUE(kvstore.Put("user:groot", "{}"));
  }
  {
    predacl::kvstore::KVStore kvstore(test_folder_ / "Durability");
    ASSERT_EQ(kvstore.Get("user:groot").value(), "{}");
  }
}

TEST_F(KVStore, CountByPrefix) {
  predacl::kvstore::KVStore kvstore(test_folder_ / "CountByPrefix");
  ASSERT_TRUE(PutAll(kvstore, {{"user:alice", "a"}, {"user:bob", "b"}, {"group:dev", "d"}, {"link:alice", "l"}}));

  EXPECT_EQ(Count(kvstore), 4);
  EXPECT_EQ(Count(kvstore, "user:"), 2);
  EXPECT_EQ(Count(kvstore, "group:"), 1);
  EXPECT_EQ(Count(kvstore, "user:a"), 1);
  EXPECT_EQ(Count(kvstore, "schema:"), 0);
}

TEST_F(KVStore, IterateOverPrefix) {
  predacl::kvstore::KVStore kvstore(test_folder_ / "IterateOverPrefix");
  ASSERT_TRUE(PutAll(kvstore, {{"group:dev", "1"}, {"group:ops", "2"}, {"user:alice", "3"}}));

  std::vector<std::string> keys;
  for (auto it = kvstore.begin("group:"); it != kvstore.end("group:"); ++it) {
    keys.push_back(it->first);
  }
  EXPECT_EQ(keys, (std::vector<std::string>{"group:dev", "group:ops"}));

  EXPECT_EQ(Count(kvstore), 3);
}

TEST_F(KVStore, OpenFailureThrows) {
  const auto blocker = test_folder_ / "not_a_directory";
  {
    std::ofstream file(blocker);
    file << "x";
  }
  EXPECT_THROW(predacl::kvstore::KVStore(blocker / "store"), predacl::kvstore::KVStoreError);
}
