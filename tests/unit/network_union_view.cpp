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

#include <memory>
#include <string>
#include <vector>

#include "network/union_view.hpp"
#include "storage/collection.hpp"
#include "storage/exceptions.hpp"
#include "storage/record.hpp"
#include "storage/storage.hpp"
#include "social_graph.hpp"

using netrel::network::UnionView;
using netrel::storage::Gid;
using netrel::storage::Record;
using netrel::storage::RecordList;
using netrel::storage::RecordNotFound;
using testing::_;
using testing::ElementsAre;
using testing::Return;
using testing::Throw;

namespace {

class MockCollection : public netrel::storage::Collection {
 public:
  MOCK_METHOD(std::vector<Record>, Load, (), (const, override));
  MOCK_METHOD(std::vector<Record>, WhereIdIn, (const std::vector<Gid> &ids), (const, override));
  MOCK_METHOD(size_t, Size, (), (const, override));
  MOCK_METHOD(bool, Empty, (), (const, override));
};

Record Row(int64_t id, std::string name = "") { return {"rows", Gid::FromInt(id), {{"name", std::move(name)}}}; }

std::shared_ptr<RecordList> Rows(std::vector<int64_t> ids) {
  std::vector<Record> records;
  for (const auto id : ids) records.push_back(Row(id));
  return std::make_shared<RecordList>(std::move(records));
}

std::vector<int64_t> Ids(const std::vector<Record> &records) {
  std::vector<int64_t> ids;
  for (const auto &record : records) ids.push_back(record.gid().AsInt());
  return ids;
}

}  // namespace

TEST(UnionView, EmptyUnions) {
  const std::shared_ptr<RecordList> null;
  for (const auto &view : {UnionView{}, UnionView{nullptr, nullptr}, UnionView{null},
                           UnionView{Rows({}), Rows({})}}) {
    EXPECT_EQ(view.Size(), 0);
    EXPECT_TRUE(view.Empty());
    EXPECT_TRUE(view.ToVector().empty());
    EXPECT_EQ(view.begin(), view.end());
    EXPECT_THROW(view.Find(Gid::FromInt(1)), RecordNotFound);
  }
}

TEST(UnionView, DropsNullSources) {
  UnionView view{nullptr, Rows({1, 2}), nullptr, Rows({3})};
  EXPECT_EQ(view.Sources().size(), 2);
  EXPECT_EQ(view.Size(), 3);
  EXPECT_THAT(Ids(view.ToVector()), ElementsAre(1, 2, 3));
}

TEST(UnionView, MixedSources) {
  UnionView view{Rows({4, 5}), std::make_shared<RecordList>(), nullptr};
  EXPECT_EQ(view.Size(), 2);
  EXPECT_FALSE(view.Empty());
  EXPECT_EQ(view.Find(Gid::FromInt(5)).gid(), Gid::FromInt(5));
}

TEST(UnionView, SameSourceTwice) {
  const auto rows = Rows({1, 2, 3});
  UnionView once{rows};
  UnionView twice{rows, rows};
  EXPECT_EQ(once.Size(), twice.Size());
  EXPECT_EQ(once.ToVector(), twice.ToVector());
}

TEST(UnionView, FirstSourceWinsOnDuplicates) {
  auto first = std::make_shared<RecordList>(std::vector{Row(1, "first"), Row(2, "first")});
  auto second = std::make_shared<RecordList>(std::vector{Row(2, "second"), Row(3, "second")});
  UnionView view{first, second};
  EXPECT_THAT(view.Map([](const Record &record) { return record.GetProperty("name").ValueString(); }),
              ElementsAre("first", "first", "second"));
  EXPECT_EQ(view.Find(Gid::FromInt(2)).GetProperty("name").ValueString(), "first");

  UnionView reversed{second, first};
  EXPECT_EQ(reversed.Find(Gid::FromInt(2)).GetProperty("name").ValueString(), "second");
  EXPECT_THAT(Ids(reversed.ToVector()), ElementsAre(2, 3, 1));
}

TEST(UnionView, SingleIdReturnsRecord) {
  UnionView view{Rows({0, 1}), Rows({1, 2})};
  const Record record = view.Find(Gid::FromInt(0));
  EXPECT_EQ(record.gid(), Gid::FromInt(0));
}

TEST(UnionView, RepeatedIdsCollapse) {
  UnionView view{Rows({0, 1}), Rows({0, 2})};
  const auto records = view.Find(Gid::FromInt(0), Gid::FromInt(0));
  ASSERT_EQ(records.size(), 1);
  EXPECT_EQ(records[0].gid(), Gid::FromInt(0));
  EXPECT_THAT(Ids(view.Find({Gid::FromInt(2), Gid::FromInt(0), Gid::FromInt(2)})), ElementsAre(0, 2));
}

TEST(UnionView, FindIsAllOrNothing) {
  UnionView view{Rows({0, 1}), Rows({2, 3})};
  EXPECT_THAT(Ids(view.Find(Gid::FromInt(3), Gid::FromInt(0))), ElementsAre(0, 3));
  EXPECT_THROW(view.Find(Gid::FromInt(1), Gid::FromInt(4)), RecordNotFound);
  EXPECT_TRUE(view.Find(std::vector<Gid>{}).empty());
  EXPECT_TRUE(view.WhereIdIn({Gid::FromInt(4)}).empty());
  EXPECT_THAT(Ids(view.WhereIdIn({Gid::FromInt(1), Gid::FromInt(4)})), ElementsAre(1));
}

TEST(UnionView, RecordsOfDifferentTablesStayApart) {
  auto people = std::make_shared<RecordList>(std::vector<Record>{{"people", Gid::FromInt(1)}});
  auto shows = std::make_shared<RecordList>(std::vector<Record>{{"shows", Gid::FromInt(1)}});
  UnionView view{people, shows};
  EXPECT_EQ(view.Size(), 2);
  EXPECT_TRUE(view.Includes(Record{"shows", Gid::FromInt(1)}));
  EXPECT_TRUE(view.Includes(Record{"people", Gid::FromInt(1)}));
  EXPECT_EQ(view.Find(std::vector{Gid::FromInt(1)}).size(), 2);

  UnionView fresh{people, shows};
  EXPECT_TRUE(fresh.Includes(Record{"shows", Gid::FromInt(1)}));
  EXPECT_FALSE(fresh.IsMaterialized());
}

TEST(UnionView, NotFoundCarriesRequestedIds) {
  UnionView view{Rows({0})};
  try {
    view.Find(Gid::FromInt(0), Gid::FromInt(7), Gid::FromInt(7));
    FAIL() << "Expected RecordNotFound";
  } catch (const RecordNotFound &e) {
    EXPECT_THAT(e.Ids(), ElementsAre(Gid::FromInt(0), Gid::FromInt(7), Gid::FromInt(7)));
    EXPECT_STREQ(e.what(), "Couldn't find all records with IDs (0, 7, 7)");
  }
}

TEST(UnionView, FindDoesNotLoad) {
  auto source = std::make_shared<MockCollection>();
  EXPECT_CALL(*source, Load()).Times(0);
  EXPECT_CALL(*source, Size()).Times(0);
  EXPECT_CALL(*source, Empty()).WillRepeatedly(Return(false));
  EXPECT_CALL(*source, WhereIdIn(ElementsAre(Gid::FromInt(1), Gid::FromInt(2))))
      .WillOnce(Return(std::vector{Row(2), Row(1)}));

  UnionView view{source};
  EXPECT_THAT(Ids(view.Find(Gid::FromInt(1), Gid::FromInt(2), Gid::FromInt(1))), ElementsAre(2, 1));
  EXPECT_FALSE(view.IsMaterialized());
}

TEST(UnionView, FindSkipsEmptySources) {
  auto empty = std::make_shared<MockCollection>();
  EXPECT_CALL(*empty, Empty()).WillRepeatedly(Return(true));
  EXPECT_CALL(*empty, WhereIdIn(_)).Times(0);
  EXPECT_CALL(*empty, Load()).Times(0);

  UnionView view{empty, Rows({1})};
  EXPECT_EQ(view.Find(Gid::FromInt(1)).gid(), Gid::FromInt(1));
}

TEST(UnionView, MaterializesOnce) {
  auto source = std::make_shared<MockCollection>();
  EXPECT_CALL(*source, Load()).WillOnce(Return(std::vector{Row(1), Row(2), Row(1)}));

  UnionView view{source};
  EXPECT_FALSE(view.IsMaterialized());
  EXPECT_EQ(view.Size(), 2);
  EXPECT_TRUE(view.IsMaterialized());
  int visited = 0;
  for (const auto &record : view) {
    EXPECT_EQ(record.table(), "rows");
    ++visited;
  }
  EXPECT_EQ(visited, 2);
  EXPECT_THAT(Ids(view.Filter([](const Record &record) { return record.gid() == Gid::FromInt(2); })),
              ElementsAre(2));
  EXPECT_THAT(view.Map([](const Record &record) { return record.gid().AsInt() * 10; }), ElementsAre(10, 20));
  EXPECT_EQ(view.Load().size(), 2);
}

TEST(UnionView, EmptyDoesNotLoad) {
  auto source = std::make_shared<MockCollection>();
  EXPECT_CALL(*source, Load()).Times(0);
  EXPECT_CALL(*source, Empty()).WillOnce(Return(true));
  UnionView view{source, Rows({})};
  EXPECT_TRUE(view.Empty());
  EXPECT_FALSE(view.IsMaterialized());
}

TEST(UnionView, IncludesUsesLookup) {
  auto source = std::make_shared<MockCollection>();
  EXPECT_CALL(*source, Load()).Times(0);
  EXPECT_CALL(*source, Empty()).WillRepeatedly(Return(false));
  EXPECT_CALL(*source, WhereIdIn(ElementsAre(Gid::FromInt(3)))).WillOnce(Return(std::vector{Row(3)}));
  EXPECT_CALL(*source, WhereIdIn(ElementsAre(Gid::FromInt(4)))).WillOnce(Return(std::vector<Record>{}));

  UnionView view{source};
  EXPECT_TRUE(view.Includes(Row(3)));
  EXPECT_FALSE(view.Includes(Row(4)));
}

TEST(UnionView, StoreErrorsPropagateUnchanged) {
  auto source = std::make_shared<MockCollection>();
  EXPECT_CALL(*source, Empty()).WillRepeatedly(Return(false));
  EXPECT_CALL(*source, WhereIdIn(_))
      .WillRepeatedly(Throw(netrel::storage::StorageException("connection to the store was lost")));
  EXPECT_CALL(*source, Load()).WillOnce(Throw(netrel::storage::SchemaException("table was dropped")));

  UnionView view{Rows({1}), source};
  try {
    view.Find(Gid::FromInt(1));
    FAIL() << "Expected StorageException";
  } catch (const RecordNotFound &) {
    FAIL() << "Store errors must not turn into RecordNotFound";
  } catch (const netrel::storage::StorageException &e) {
    EXPECT_STREQ(e.what(), "connection to the store was lost");
  }
  EXPECT_THROW(view.Size(), netrel::storage::SchemaException);
  EXPECT_FALSE(view.IsMaterialized());
}

TEST(UnionView, NestedViews) {
  auto inner = std::make_shared<UnionView>(std::vector<UnionView::Source>{Rows({1, 2}), Rows({2, 3})});
  UnionView outer{inner, Rows({3, 4})};
  EXPECT_THAT(Ids(outer.Find(Gid::FromInt(4), Gid::FromInt(1))), ElementsAre(1, 4));
  EXPECT_FALSE(inner->IsMaterialized());
  EXPECT_EQ(outer.Size(), 4);
  EXPECT_THAT(Ids(outer.ToVector()), ElementsAre(1, 2, 3, 4));
}

class UnionViewOverStorage : public SocialGraph {};

TEST_F(UnionViewOverStorage, ShowsOfAllChannels) {
  UnionView shows{discovery_->Relation("shows"), usa_->Relation("shows"), amc_->Relation("shows"),
                  abc_->Relation("shows")};
  EXPECT_EQ(shows.Size(), 7);
  const auto all = shows.Find({Gid::FromInt(0), Gid::FromInt(1), Gid::FromInt(2), Gid::FromInt(3), Gid::FromInt(4),
                               Gid::FromInt(5), Gid::FromInt(6)});
  EXPECT_EQ(all.size(), 7);
  EXPECT_THROW(shows.Find(Gid::FromInt(2), Gid::FromInt(3), Gid::FromInt(4), Gid::FromInt(900)), RecordNotFound);
  EXPECT_EQ(shows.Find(Gid::FromInt(0)).GetProperty("name").ValueString(), "Dirty Jobs");
}

TEST_F(UnionViewOverStorage, FindLeavesCacheEmpty) {
  UnionView shows{discovery_->Relation("shows"), usa_->Relation("shows")};
  shows.Find(Gid::FromInt(0), Gid::FromInt(4));
  EXPECT_FALSE(shows.IsMaterialized());
  shows.Map([](const Record &record) { return record.gid(); });
  EXPECT_TRUE(shows.IsMaterialized());
}

TEST_F(UnionViewOverStorage, PayShows) {
  EXPECT_EQ(Union(*discovery_, "pay_shows")->Size(), 3);
  EXPECT_THAT(Names(Union(*discovery_, "pay_shows")->ToVector()),
              ElementsAre("Deadliest Catch", "Dirty Jobs", "Mythbusters"));
  EXPECT_EQ(Union(*usa_, "pay_shows")->Size(), 1);
  EXPECT_EQ(Union(*abc_, "pay_shows")->Size(), 0);
  EXPECT_TRUE(Union(*abc_, "pay_shows")->Empty());
  EXPECT_THROW(Union(*discovery_, "pay_shows")->Find(Gid::FromInt(3)), RecordNotFound);
}

TEST_F(UnionViewOverStorage, AdHocQueries) {
  UnionView people{storage_.Where("people", Filter::Where("name", "Helene")),
                   storage_.Where("people", Filter::Where("name", Filter::Operator::GREATER_EQUAL, "S")), nullptr};
  EXPECT_THAT(Names(people.ToVector()), ElementsAre("Helene", "Stephen", "Vincent"));
  EXPECT_EQ(people.Find(helene_->gid(), vincent_->gid()).size(), 2);
  EXPECT_THROW(people.Find(mary_->gid()), RecordNotFound);
}

TEST_F(UnionViewOverStorage, UnionOverTwoTables) {
  UnionView everything{storage_.All("people"), storage_.All("shows")};
  EXPECT_EQ(everything.Size(), 12);
  const auto mythbusters = storage_.Find("shows", Gid::FromInt(1));
  EXPECT_TRUE(everything.Includes(mythbusters));
  EXPECT_TRUE(everything.Includes(*helene_));
  EXPECT_EQ(everything.Find(helene_->gid(), Gid::FromInt(6)).size(), 3);
  EXPECT_THROW(everything.Find(Gid::FromInt(0), Gid::FromInt(9)), RecordNotFound);
}

TEST_F(UnionViewOverStorage, DeletedRecordsDisappear) {
  auto shows = Union(*discovery_, "pay_shows");
  ASSERT_TRUE(storage_.Delete(storage_.Find("shows", Gid::FromInt(0))));
  EXPECT_THROW(shows->Find(Gid::FromInt(0)), RecordNotFound);
  EXPECT_EQ(shows->Size(), 2);
}
