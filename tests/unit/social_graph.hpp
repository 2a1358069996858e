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

#pragma once

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "network/network.hpp"
#include "network/union.hpp"
#include "network/union_view.hpp"
#include "storage/associations.hpp"
#include "storage/storage.hpp"

/// People connected through a join table (`connections`, `friends`) and
/// through invites (`contacts`, `colleagues`, `acquaintances`), plus TV
/// channels with their shows.
///
/// Connections: helene -> stephen, helene -> vincent, mary -> helene,
/// stephen -> vincent, carmen -> stephen.
///
/// Invites: helene -> vincent (accepted), carmen -> helene (accepted),
/// helene -> stephen, mary -> stephen, stephen -> vincent.
class SocialGraph : public ::testing::Test {
 protected:
  using Gid = netrel::storage::Gid;
  using Record = netrel::storage::Record;
  using Filter = netrel::storage::Filter;

  void SetUp() override {
    SetupPeople();
    SetupChannels();
  }

  void SetupPeople() {
    person_ = &storage_.CreateEntityType("Person", {"name"});
    storage_.CreateEntityType("Invite", {"person_id", "person_id_target", "message", "is_accepted"});
    storage_.CreateJoinTable("people_people", "person_id", "person_id_target");
    storage_.CreateJoinTable("friends", "person_id", "person_id_friend");

    netrel::network::DeclareNetwork(*person_, "connections");
    netrel::network::DeclareNetwork(*person_, "friends",
                                    {.join_table = "friends", .association_foreign_key = "person_id_friend"});
    netrel::network::DeclareNetwork(*person_, "contacts", {.through = "invites"});
    netrel::network::DeclareNetwork(*person_, "colleagues",
                                    {.through = "invites", .conditions = Filter::Where("is_accepted", true)});
    netrel::network::DeclareNetwork(*person_, "acquaintances",
                                    {.through = "invites", .conditions = Filter::Where("is_accepted", true)});

    helene_ = storage_.Create("people", Gid::FromInt(1), {{"name", "Helene"}});
    mary_ = storage_.Create("people", Gid::FromInt(2), {{"name", "Mary"}});
    stephen_ = storage_.Create("people", Gid::FromInt(3), {{"name", "Stephen"}});
    vincent_ = storage_.Create("people", Gid::FromInt(4), {{"name", "Vincent"}});
    carmen_ = storage_.Create("people", Gid::FromInt(5), {{"name", "Carmen"}});

    Connect(*helene_, *stephen_);
    Connect(*helene_, *vincent_);
    Connect(*mary_, *helene_);
    Connect(*stephen_, *vincent_);
    Connect(*carmen_, *stephen_);

    Invite(*helene_, *vincent_, true);
    Invite(*carmen_, *helene_, true);
    Invite(*helene_, *stephen_, false);
    Invite(*mary_, *stephen_, false);
    Invite(*stephen_, *vincent_, false);
  }

  void SetupChannels() {
    auto &channel = storage_.CreateEntityType("Channel", {"name"});
    storage_.CreateEntityType("Show", {"name", "package", "channel_id"});
    channel.HasMany("shows", {.class_name = "Show", .foreign_key = {}, .conditions = {}});
    channel.HasMany("premium_shows",
                    {.class_name = "Show", .foreign_key = {}, .conditions = Filter::Where("package", "premium")});
    channel.HasMany("mega_shows",
                    {.class_name = "Show", .foreign_key = {}, .conditions = Filter::Where("package", "mega")});
    netrel::network::DeclareUnion(channel, "pay_shows", {"premium_shows", "mega_shows"});

    discovery_ = storage_.Create("channels", Gid::FromInt(1), {{"name", "Discovery"}});
    usa_ = storage_.Create("channels", Gid::FromInt(2), {{"name", "USA"}});
    amc_ = storage_.Create("channels", Gid::FromInt(3), {{"name", "AMC"}});
    abc_ = storage_.Create("channels", Gid::FromInt(4), {{"name", "ABC"}});

    Show(0, "Dirty Jobs", "premium", *discovery_);
    Show(1, "Mythbusters", "mega", *discovery_);
    Show(2, "Deadliest Catch", "premium", *discovery_);
    Show(3, "Shark Week", "basic", *discovery_);
    Show(4, "Monk", "premium", *usa_);
    Show(5, "Psych", "basic", *usa_);
    Show(6, "Mad Men", "premium", *amc_);
  }

  void Connect(const Record &from, const Record &to) {
    storage_.GetJoinTable("people_people").Insert("person_id", from.gid(), "person_id_target", to.gid());
  }

  Record Invite(const Record &from, const Record &to, bool accepted) {
    return storage_.Create("invites", {{"person_id", from.gid()},
                                       {"person_id_target", to.gid()},
                                       {"message", "Hi " + to.GetProperty("name").ValueString()},
                                       {"is_accepted", accepted}});
  }

  void Show(int64_t gid, const char *name, const char *package, const Record &channel) {
    storage_.Create("shows", Gid::FromInt(gid),
                    {{"name", name}, {"package", package}, {"channel_id", channel.gid()}});
  }

  static std::shared_ptr<netrel::network::UnionView> Union(const Record &record, const std::string &name) {
    return record.RelationAs<netrel::network::UnionView>(name);
  }

  static std::shared_ptr<netrel::storage::Association> Association(const Record &record, const std::string &name) {
    return record.RelationAs<netrel::storage::Association>(name);
  }

  static std::vector<std::string> Names(const std::vector<Record> &records) {
    std::vector<std::string> names;
    for (const auto &record : records) names.push_back(record.GetProperty("name").ValueString());
    std::sort(names.begin(), names.end());
    return names;
  }

  netrel::storage::Storage storage_;
  netrel::storage::EntityType *person_{nullptr};
  std::optional<Record> helene_, mary_, stephen_, vincent_, carmen_;
  std::optional<Record> discovery_, usa_, amc_, abc_;
};
