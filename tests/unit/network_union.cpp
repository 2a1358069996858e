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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "network/exceptions.hpp"
#include "network/union.hpp"
#include "network/union_view.hpp"
#include "storage/exceptions.hpp"
#include "storage/storage.hpp"
#include "social_graph.hpp"

using netrel::network::ConfigError;
using netrel::network::DeclareUnion;
using netrel::storage::Gid;
using testing::ElementsAre;

class UnionAccessor : public SocialGraph {};

TEST_F(UnionAccessor, FreshViewOnEveryCall) {
  const auto first = discovery_->Relation("pay_shows");
  const auto second = discovery_->Relation("pay_shows");
  EXPECT_NE(first, second);
  EXPECT_EQ(first->Size(), second->Size());
}

TEST_F(UnionAccessor, ReflectsCurrentState) {
  auto pay_shows = Union(*abc_, "pay_shows");
  EXPECT_TRUE(pay_shows->Empty());

  auto show = storage_.Create("shows", {{"name", "Lost"}, {"package", "mega"}});
  Association(*abc_, "shows")->Push(show);

  EXPECT_EQ(Union(*abc_, "pay_shows")->Size(), 1);
  EXPECT_EQ(Union(*abc_, "pay_shows")->Find(show.gid()), show);
  EXPECT_EQ(storage_.Find("shows", show.gid()).GetProperty("channel_id"), abc_->gid());
}

TEST_F(UnionAccessor, SourceOrderDecidesDuplicates) {
  auto &channel = storage_.GetEntityType("Channel");
  DeclareUnion(channel, "all_shows", {"shows", "premium_shows"});
  DeclareUnion(channel, "premium_first", {"premium_shows", "shows"});
  EXPECT_EQ(Union(*discovery_, "all_shows")->Size(), 4);
  EXPECT_EQ(Union(*discovery_, "premium_first")->Size(), 4);
  EXPECT_EQ(Union(*discovery_, "all_shows")->ToVector().front().gid(), Gid::FromInt(0));
  EXPECT_EQ(Union(*discovery_, "premium_first")->ToVector()[1].gid(), Gid::FromInt(2));
}

TEST_F(UnionAccessor, UnionOfUnions) {
  auto &channel = storage_.GetEntityType("Channel");
  DeclareUnion(channel, "basic_shows_only", {"shows"});
  DeclareUnion(channel, "everything", {"pay_shows", "basic_shows_only"});
  EXPECT_EQ(Union(*discovery_, "everything")->Size(), 4);
  EXPECT_EQ(Union(*usa_, "everything")->Size(), 2);
  EXPECT_EQ(Union(*abc_, "everything")->Size(), 0);
  EXPECT_THAT(Names(Union(*amc_, "everything")->ToVector()), ElementsAre("Mad Men"));
}

TEST_F(UnionAccessor, EmptySourceList) {
  auto &channel = storage_.GetEntityType("Channel");
  DeclareUnion(channel, "nothing", {});
  EXPECT_EQ(Union(*discovery_, "nothing")->Size(), 0);
  EXPECT_THROW(Union(*discovery_, "nothing")->Find(Gid::FromInt(0)), netrel::storage::RecordNotFound);
}

TEST_F(UnionAccessor, RejectsBadDeclarations) {
  auto &channel = storage_.GetEntityType("Channel");
  EXPECT_THROW(DeclareUnion(channel, "", {"shows"}), ConfigError);
  EXPECT_THROW(DeclareUnion(channel, "pay_shows", {"shows"}), ConfigError);
  EXPECT_THROW(DeclareUnion(channel, "reruns", {"shows", "old_shows"}), ConfigError);
  EXPECT_FALSE(channel.HasAccessor("reruns"));
}

TEST_F(UnionAccessor, UnknownRelation) {
  EXPECT_THROW(discovery_->Relation("reruns"), netrel::storage::SchemaException);
}

TEST_F(UnionAccessor, WrongCollectionType) {
  EXPECT_THROW(Union(*discovery_, "shows"), netrel::storage::SchemaException);
  EXPECT_NE(Association(*discovery_, "shows"), nullptr);
}
