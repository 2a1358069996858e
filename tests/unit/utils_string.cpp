// Copyright 2026 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <string>
#include <vector>

#include "utils/string.hpp"

using vec = std::vector<std::string>;

using namespace netrel::utils;

TEST(String, ToLowerCase) {
  EXPECT_EQ(ToLowerCase("NetRel"), "netrel");
  EXPECT_EQ(ToLowerCase(" ( Net Rel ) "), " ( net rel ) ");
  // Bytes outside ASCII pass through unchanged.
  EXPECT_EQ(ToLowerCase("\u0160Kola"), "\u0160kola");
}

TEST(String, Join) {
  EXPECT_EQ(Join(vec{}, " "), "");
  EXPECT_EQ(Join(vec{"con", "tac", "ts"}, ""), "contacts");
  EXPECT_EQ(Join(vec{"helene", "mary", "sarah"}, ", "), "helene, mary, sarah");
}

TEST(String, EndsWith) {
  EXPECT_TRUE(EndsWith("connections_out", "_out"));
  EXPECT_TRUE(EndsWith("out", "out"));
  EXPECT_TRUE(EndsWith("out", ""));
  EXPECT_FALSE(EndsWith("connections_in", "_out"));
  EXPECT_FALSE(EndsWith("in", "_in"));
}
