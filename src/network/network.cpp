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

#include "network/network.hpp"

#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "network/exceptions.hpp"
#include "network/union.hpp"
#include "storage/exceptions.hpp"
#include "storage/storage.hpp"
#include "utils/inflector.hpp"

namespace netrel::network {

namespace {

void CheckFree(const storage::EntityType &type, const std::string &network, const std::string &accessor) {
  if (type.HasAccessor(accessor)) {
    throw ConfigError("Can't declare network '{}': {} already has a relation named '{}'", network, type.ClassName(),
                      accessor);
  }
}

void CheckColumn(const std::string &network, const std::string &table, bool has_column, const std::string &column) {
  if (!has_column) {
    throw ConfigError("Can't declare network '{}': '{}' has no column named '{}'", network, table, column);
  }
}

void CheckConditions(const std::string &network, const storage::EntityType &filtered,
                     const std::optional<storage::Filter> &conditions) {
  if (!conditions) return;
  for (const auto &property : conditions->Properties()) {
    CheckColumn(network, filtered.Table(), filtered.HasColumn(property), property);
  }
}

/// Returns false if the edge accessor still has to be declared, true if an
/// identical one exists.
bool ReuseEdges(const storage::EntityType &type, const std::string &network, const std::string &accessor,
                const storage::EntityType &edge, const std::string &foreign_key) {
  if (!type.HasAccessor(accessor)) return false;
  const auto *edges = type.FindHasMany(accessor);
  if (!edges || edges->class_name != edge.ClassName() || edges->foreign_key != foreign_key || edges->conditions) {
    throw ConfigError("Can't declare network '{}': relation '{}' of {} is not the {} edges keyed by '{}'", network,
                      accessor, type.ClassName(), edge.ClassName(), foreign_key);
  }
  return true;
}

/// Same as @ref ReuseEdges for the union of the edge accessors.
bool ReuseUnion(const storage::EntityType &type, const std::string &network, const std::string &accessor,
                const std::vector<std::string> &sources) {
  const auto *existing = type.FindAccessor(accessor);
  if (!existing) return false;
  if (existing->kind != storage::RelationKind::UNION || existing->sources != sources) {
    throw ConfigError("Can't declare network '{}': relation '{}' of {} is not the union of its edges", network,
                      accessor, type.ClassName());
  }
  return true;
}

const storage::EntityType &ResolveEdgeType(const storage::EntityType &type, const std::string &network,
                                           const std::string &through) {
  const auto &storage = type.GetStorage();
  if (const auto *edge = storage.FindEntityType(through)) return *edge;
  if (const auto *edge = storage.FindEntityType(utils::Classify(through))) return *edge;
  throw ConfigError("Can't declare network '{}': no entity type for edges '{}'", network, through);
}

void DeclareJoinTableNetwork(storage::EntityType &type, const std::string &name, const NetworkConfig &config) {
  const auto out = name + "_out";
  const auto in = name + "_in";
  CheckFree(type, name, out);
  CheckFree(type, name, in);
  const auto *join_table = type.GetStorage().FindJoinTable(config.join_table);
  if (!join_table) {
    throw ConfigError("Can't declare network '{}': join table '{}' doesn't exist", name, config.join_table);
  }
  CheckColumn(name, join_table->name(), join_table->HasColumn(config.foreign_key), config.foreign_key);
  CheckColumn(name, join_table->name(), join_table->HasColumn(config.association_foreign_key),
              config.association_foreign_key);
  CheckConditions(name, type, config.conditions);

  spdlog::debug("{}: declaring network '{}' over join table '{}' ({} -> {})", type.ClassName(), name,
                config.join_table, config.foreign_key, config.association_foreign_key);
  type.HasAndBelongsToMany(out, {.class_name = type.ClassName(),
                                 .join_table = config.join_table,
                                 .foreign_key = config.foreign_key,
                                 .association_foreign_key = config.association_foreign_key,
                                 .conditions = config.conditions});
  type.HasAndBelongsToMany(in, {.class_name = type.ClassName(),
                                .join_table = config.join_table,
                                .foreign_key = config.association_foreign_key,
                                .association_foreign_key = config.foreign_key,
                                .conditions = config.conditions});
}

void DeclareThroughNetwork(storage::EntityType &type, const std::string &name, const NetworkConfig &config) {
  const auto out = name + "_out";
  const auto in = name + "_in";
  const auto edges_out = config.through + "_out";
  const auto edges_in = config.through + "_in";
  CheckFree(type, name, out);
  CheckFree(type, name, in);
  for (const auto &accessor : {name, out, in}) {
    for (const auto &edge_accessor : {config.through, edges_out, edges_in}) {
      if (accessor == edge_accessor) {
        throw ConfigError("Can't declare network '{}': relation '{}' would hold both nodes and '{}' edges",
                          name, accessor, config.through);
      }
    }
  }
  const auto &edge = ResolveEdgeType(type, name, config.through);
  CheckColumn(name, edge.Table(), edge.HasColumn(config.foreign_key), config.foreign_key);
  CheckColumn(name, edge.Table(), edge.HasColumn(config.association_foreign_key), config.association_foreign_key);
  CheckConditions(name, edge, config.conditions);
  const auto reuse_out = ReuseEdges(type, name, edges_out, edge, config.foreign_key);
  const auto reuse_in = ReuseEdges(type, name, edges_in, edge, config.association_foreign_key);
  const auto reuse_union = ReuseUnion(type, name, config.through, {edges_out, edges_in});

  spdlog::debug("{}: declaring network '{}' through {} ({} -> {})", type.ClassName(), name, edge.ClassName(),
                config.foreign_key, config.association_foreign_key);
  if (!reuse_out) {
    type.HasMany(edges_out, {.class_name = edge.ClassName(), .foreign_key = config.foreign_key, .conditions = {}});
  }
  if (!reuse_in) {
    type.HasMany(edges_in,
                 {.class_name = edge.ClassName(), .foreign_key = config.association_foreign_key, .conditions = {}});
  }
  type.HasManyThrough(out, {.through = edges_out,
                            .source_key = config.association_foreign_key,
                            .class_name = type.ClassName(),
                            .conditions = config.conditions});
  type.HasManyThrough(in, {.through = edges_in,
                           .source_key = config.foreign_key,
                           .class_name = type.ClassName(),
                           .conditions = config.conditions});
  if (!reuse_union) DeclareUnion(type, config.through, {edges_out, edges_in});
}

}  // namespace

NetworkConfig NormalizeNetworkConfig(const storage::EntityType &type, NetworkConfig config) {
  if (config.foreign_key.empty()) config.foreign_key = type.ForeignKey();
  if (config.association_foreign_key.empty()) config.association_foreign_key = config.foreign_key + "_target";
  if (config.through.empty() && config.join_table.empty()) {
    config.join_table = fmt::format("{}_{}", type.Table(), type.Table());
  }
  return config;
}

void DeclareNetwork(storage::EntityType &type, std::string name, NetworkConfig config) {
  if (name.empty()) throw ConfigError("Network on {} needs a name", type.ClassName());
  CheckFree(type, name, name);
  config = NormalizeNetworkConfig(type, std::move(config));
  if (config.foreign_key == config.association_foreign_key) {
    throw ConfigError("Can't declare network '{}': both ends use column '{}'", name, config.foreign_key);
  }

  try {
    if (config.through.empty()) {
      DeclareJoinTableNetwork(type, name, config);
    } else {
      DeclareThroughNetwork(type, name, config);
    }
    DeclareUnion(type, name, {name + "_out", name + "_in"});
  } catch (const storage::SchemaException &e) {
    throw ConfigError("Can't declare network '{}': {}", name, e.what());
  }
}

}  // namespace netrel::network
