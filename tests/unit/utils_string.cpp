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

#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "utils/string.hpp"

using vec = std::vector<std::string>;

using namespace predacl::utils;

TEST(String, LTrim) {
  EXPECT_EQ(LTrim(" \t\n\r name: string ."), "name: string .");
  EXPECT_EQ(LTrim(" \t\n\r"), "");
  EXPECT_EQ(LTrim("dgraph.xid "), "dgraph.xid ");
  EXPECT_EQ(LTrim(""), "");
}

TEST(String, RTrim) {
  EXPECT_EQ(RTrim("name: string . \r\n"), "name: string .");
  EXPECT_EQ(RTrim(" \t\n\r"), "");
  EXPECT_EQ(RTrim(" dgraph.xid"), " dgraph.xid");
  EXPECT_EQ(RTrim(""), "");
}

TEST(String, Trim) {
  EXPECT_EQ(Trim(" \t <_:a> <name> \"x\" . \n"), "<_:a> <name> \"x\" .");
  EXPECT_EQ(Trim(" \t\n\r"), "");
  EXPECT_EQ(Trim(""), "");
}

TEST(String, ToLowerCase) {
  EXPECT_EQ(ToLowerCase("Dgraph.XID"), "dgraph.xid");
  EXPECT_EQ(ToLowerCase(" Alice_01 "), " alice_01 ");
}

TEST(String, Join) {
  EXPECT_EQ(Join({}, ", "), "");
  EXPECT_EQ(Join({"name"}, ", "), "name");
  EXPECT_EQ(Join({"name", "age", "email"}, ", "), "name, age, email");
  EXPECT_EQ(Join({"", "a", ""}, "."), ".a.");
}

TEST(String, SplitByDelimiter) {
  EXPECT_EQ(Split("", "."), vec{});
  EXPECT_EQ(Split("header.payload.signature", "."), (vec{"header", "payload", "signature"}));
  EXPECT_EQ(Split("a..b", "."), (vec{"a", "", "b"}));
  EXPECT_EQ(Split("name: string @index(exact) .", ":", 1), (vec{"name", " string @index(exact) ."}));
  EXPECT_EQ(Split("no delimiter", ";"), vec{"no delimiter"});
}

TEST(String, SplitByWhitespace) {
  EXPECT_EQ(Split("  string   @index(exact) \t @upsert .\n"), (vec{"string", "@index(exact)", "@upsert", "."}));
  EXPECT_EQ(Split(" \t\n"), vec{});
  EXPECT_EQ(Split(""), vec{});
}

TEST(String, StartsWith) {
  EXPECT_TRUE(StartsWith("user:alice", "user:"));
  EXPECT_TRUE(StartsWith("user:", "user:"));
  EXPECT_TRUE(StartsWith("anything", ""));
  EXPECT_FALSE(StartsWith("User:alice", "user:"));
  EXPECT_FALSE(StartsWith("user", "user:"));
}

TEST(String, IEquals) {
  EXPECT_TRUE(IEquals("Guardians", "guardians"));
  EXPECT_TRUE(IEquals("", ""));
  EXPECT_FALSE(IEquals("guardian", "guardians"));
}

TEST(String, IStartsWith) {
  EXPECT_TRUE(IStartsWith("dgraph.xid", "dgraph."));
  EXPECT_TRUE(IStartsWith("DGraph.Type", "dgraph."));
  EXPECT_FALSE(IStartsWith("dgraphxid", "dgraph."));
  EXPECT_FALSE(IStartsWith("dg", "dgraph."));
}
