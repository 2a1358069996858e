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

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "gflags/gflags.h"

#include "flags/log_level.hpp"
#include "flags/storage.hpp"
#include "network/exceptions.hpp"
#include "network/network.hpp"
#include "network/union.hpp"
#include "network/union_view.hpp"
#include "storage/associations.hpp"
#include "storage/exceptions.hpp"
#include "storage/storage.hpp"
#include "utils/flag_validation.hpp"
#include "utils/string.hpp"

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_string(network, "contacts",
                        "Network to print. One of: friends, contacts, colleagues, acquaintances, associates.",
                        FLAG_NOT_EMPTY);
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(person, "", "Print only the person with this name. Prints everyone when empty.");

namespace {

using netrel::storage::Filter;
using netrel::storage::Gid;
using netrel::storage::Record;

void SetupSchema(netrel::storage::Storage &storage) {
  auto &person = storage.CreateEntityType("Person", {"name"});
  storage.CreateEntityType("Invite", {"person_id", "person_id_target", "message", "is_accepted"});
  storage.CreateJoinTable("people_people", "person_id", "person_id_target");
  storage.CreateJoinTable("friends", "person_id", "person_id_friend");

  netrel::network::DeclareNetwork(person, "connections");
  netrel::network::DeclareNetwork(person, "friends",
                                  {.join_table = "friends", .association_foreign_key = "person_id_friend"});
  netrel::network::DeclareNetwork(person, "contacts", {.through = "invites"});
  netrel::network::DeclareNetwork(person, "colleagues",
                                  {.through = "invites", .conditions = Filter::Where("is_accepted", true)});
  netrel::network::DeclareNetwork(person, "acquaintances",
                                  {.through = "invites", .conditions = Filter::Where("is_accepted", true)});
  netrel::network::DeclareUnion(person, "associates", {"friends", "colleagues"});
}

void SeedSampleGraph(netrel::storage::Storage &storage) {
  std::vector<Record> people;
  for (const auto *name : {"Helene", "Mary", "Stephen", "Vincent", "Carmen"}) {
    people.push_back(storage.Create("people", {{"name", name}}));
  }
  const auto &helene = people[0];
  const auto &mary = people[1];
  const auto &stephen = people[2];
  const auto &vincent = people[3];
  const auto &carmen = people[4];

  auto &connections = storage.GetJoinTable("people_people");
  for (const auto &[from, to] : {std::pair{&helene, &stephen}, std::pair{&helene, &vincent}, std::pair{&mary, &helene},
                                 std::pair{&stephen, &vincent}, std::pair{&carmen, &stephen}}) {
    connections.Insert("person_id", from->gid(), "person_id_target", to->gid());
  }

  auto invite = [&storage](const Record &from, const Record &to, bool accepted) {
    storage.Create("invites", {{"person_id", from.gid()},
                               {"person_id_target", to.gid()},
                               {"message", fmt::format("Hi {}", to.GetProperty("name").ValueString())},
                               {"is_accepted", accepted}});
  };
  invite(helene, vincent, true);
  invite(carmen, helene, true);
  invite(helene, stephen, false);
  invite(mary, stephen, false);
  invite(stephen, vincent, false);

  helene.RelationAs<netrel::storage::Association>("friends_out")->Push(mary);
  vincent.RelationAs<netrel::storage::Association>("friends_in")->Push(stephen);
}

std::string Names(const std::vector<Record> &records) {
  std::vector<std::string> names;
  names.reserve(records.size());
  for (const auto &record : records) names.push_back(record.GetProperty("name").ValueString());
  return fmt::format("[{}]", netrel::utils::Join(names, ", "));
}

void PrintNetwork(netrel::storage::Storage &storage, const std::string &network) {
  const auto &person = storage.GetEntityType("people");
  if (!person.HasAccessor(network)) {
    throw netrel::network::ConfigError("Unknown network '{}'", network);
  }
  const auto has_directions = person.HasAccessor(network + "_out");
  for (const auto &record : storage.Scan("people")) {
    const auto name = record.GetProperty("name").ValueString();
    if (!FLAGS_person.empty() && name != FLAGS_person) continue;
    auto members = record.RelationAs<netrel::network::UnionView>(network);
    std::cout << name << " " << network << ": " << Names(members->ToVector()) << std::endl;
    if (has_directions) {
      std::cout << "  out: " << Names(record.Relation(network + "_out")->Load()) << std::endl;
      std::cout << "  in: " << Names(record.Relation(network + "_in")->Load()) << std::endl;
    }
  }
}

}  // namespace

int main(int argc, char **argv) {
  gflags::SetUsageMessage("Prints the members of a network in a sample social graph");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  netrel::flags::InitializeLogger();

  try {
    netrel::storage::Storage storage{netrel::flags::StorageConfig()};
    SetupSchema(storage);
    SeedSampleGraph(storage);
    PrintNetwork(storage, FLAGS_network);
  } catch (const netrel::network::ConfigError &e) {
    spdlog::critical("{}: {}", e.name(), e.what());
    return EXIT_FAILURE;
  } catch (const netrel::storage::StorageException &e) {
    spdlog::critical("{}: {}", e.name(), e.what());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
