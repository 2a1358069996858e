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

#include "gtest/gtest.h"

#include "utils/inflector.hpp"

using namespace netrel::utils;

TEST(Inflector, Underscore) {
  EXPECT_EQ(Underscore("Person"), "person");
  EXPECT_EQ(Underscore("PaymentPlan"), "payment_plan");
  EXPECT_EQ(Underscore("HTTPServer"), "http_server");
  EXPECT_EQ(Underscore("Shard2Shard"), "shard2_shard");
  EXPECT_EQ(Underscore("friend-request list"), "friend_request_list");
  EXPECT_EQ(Underscore("already_underscored"), "already_underscored");
  EXPECT_EQ(Underscore(""), "");
  EXPECT_EQ(Underscore("\u00c9coleNormale"), "\u00c9cole_normale");
}

TEST(Inflector, Camelize) {
  EXPECT_EQ(Camelize("person"), "Person");
  EXPECT_EQ(Camelize("payment_plan"), "PaymentPlan");
  EXPECT_EQ(Camelize("Invite"), "Invite");
  EXPECT_EQ(Camelize(""), "");
}

TEST(Inflector, Pluralize) {
  EXPECT_EQ(Pluralize("invite"), "invites");
  EXPECT_EQ(Pluralize("person"), "people");
  EXPECT_EQ(Pluralize("Person"), "People");
  EXPECT_EQ(Pluralize("people"), "people");
  EXPECT_EQ(Pluralize("category"), "categories");
  EXPECT_EQ(Pluralize("day"), "days");
  EXPECT_EQ(Pluralize("box"), "boxes");
  EXPECT_EQ(Pluralize("address"), "addresses");
  EXPECT_EQ(Pluralize("match"), "matches");
  EXPECT_EQ(Pluralize("sheep"), "sheep");
  EXPECT_EQ(Pluralize("friend_request"), "friend_requests");
  EXPECT_EQ(Pluralize("sales_person"), "sales_people");
}

TEST(Inflector, Singularize) {
  EXPECT_EQ(Singularize("invites"), "invite");
  EXPECT_EQ(Singularize("people"), "person");
  EXPECT_EQ(Singularize("categories"), "category");
  EXPECT_EQ(Singularize("boxes"), "box");
  EXPECT_EQ(Singularize("addresses"), "address");
  EXPECT_EQ(Singularize("status"), "status");
  EXPECT_EQ(Singularize("news"), "news");
  EXPECT_EQ(Singularize("friend_requests"), "friend_request");
  EXPECT_EQ(Singularize("invite"), "invite");
}

TEST(Inflector, TableAndClassNames) {
  EXPECT_EQ(Tableize("Person"), "people");
  EXPECT_EQ(Tableize("Invite"), "invites");
  EXPECT_EQ(Tableize("PaymentPlan"), "payment_plans");
  EXPECT_EQ(Tableize("\u0160kola"), "\u0160kolas");
  EXPECT_EQ(Classify("people"), "Person");
  EXPECT_EQ(Classify("invites"), "Invite");
  EXPECT_EQ(Classify("payment_plans"), "PaymentPlan");
  EXPECT_EQ(Classify("invite"), "Invite");
}

TEST(Inflector, ForeignKey) {
  EXPECT_EQ(ForeignKey("Person"), "person_id");
  EXPECT_EQ(ForeignKey("PaymentPlan"), "payment_plan_id");
}
