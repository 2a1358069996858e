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

#include "network/union.hpp"

#include <memory>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "network/exceptions.hpp"
#include "network/union_view.hpp"
#include "storage/exceptions.hpp"
#include "storage/record.hpp"

namespace netrel::network {

void DeclareUnion(storage::EntityType &type, std::string name, std::vector<std::string> sources) {
  if (name.empty()) throw ConfigError("Union on {} needs a name", type.ClassName());
  if (type.HasAccessor(name)) {
    throw ConfigError("Can't declare union '{}': {} already has a relation with that name", name, type.ClassName());
  }
  for (const auto &source : sources) {
    if (!type.HasAccessor(source)) {
      throw ConfigError("Can't declare union '{}': {} has no relation named '{}'", name, type.ClassName(), source);
    }
  }

  spdlog::debug("{}: declaring union '{}' of ({})", type.ClassName(), name, fmt::join(sources, ", "));
  auto factory = [sources](const storage::Record &owner) -> std::shared_ptr<storage::Collection> {
    std::vector<UnionView::Source> collections;
    collections.reserve(sources.size());
    for (const auto &source : sources) collections.push_back(owner.Relation(source));
    return std::make_shared<UnionView>(std::move(collections));
  };
  try {
    type.DefineAccessor(std::move(name), storage::RelationKind::UNION, std::move(factory), std::move(sources));
  } catch (const storage::SchemaException &e) {
    throw ConfigError(e.what());
  }
}

}  // namespace netrel::network
