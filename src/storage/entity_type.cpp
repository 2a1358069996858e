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

#include "storage/entity_type.hpp"

#include <algorithm>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <spdlog/spdlog.h>

#include "storage/associations.hpp"
#include "storage/exceptions.hpp"
#include "storage/storage.hpp"
#include "utils/inflector.hpp"

namespace netrel::storage {

std::ostream &operator<<(std::ostream &os, RelationKind kind) {
  switch (kind) {
    case RelationKind::HAS_MANY:
      return os << "has_many";
    case RelationKind::HAS_AND_BELONGS_TO_MANY:
      return os << "has_and_belongs_to_many";
    case RelationKind::HAS_MANY_THROUGH:
      return os << "has_many_through";
    case RelationKind::UNION:
      return os << "union";
  }
  return os;
}

EntityType::EntityType(Storage *storage, std::string class_name, std::string table, std::vector<std::string> columns)
    : storage_(storage), class_name_(std::move(class_name)), table_(std::move(table)), columns_(std::move(columns)) {}

bool EntityType::HasColumn(std::string_view column) const {
  return std::find(columns_.begin(), columns_.end(), column) != columns_.end();
}

std::string EntityType::ForeignKey() const { return utils::ForeignKey(class_name_); }

void EntityType::DefineAccessor(std::string name, RelationKind kind, AccessorFactory factory,
                                std::vector<std::string> sources) {
  if (name.empty()) throw SchemaException("{} can't declare a relation without a name", class_name_);
  if (HasAccessor(name)) throw SchemaException("{} already has a relation named '{}'", class_name_, name);
  if (!factory) throw SchemaException("Relation '{}' of {} has no collection factory", name, class_name_);
  spdlog::trace("{}: defining {} relation '{}'", class_name_, fmt::streamed(kind), name);
  accessors_.push_back({std::move(name), kind, std::move(factory), std::move(sources)});
}

const Accessor *EntityType::FindAccessor(std::string_view name) const {
  auto it = std::find_if(accessors_.begin(), accessors_.end(),
                         [name](const auto &accessor) { return accessor.name == name; });
  if (it == accessors_.end()) return nullptr;
  return &*it;
}

std::vector<std::string> EntityType::AccessorNames() const {
  std::vector<std::string> names;
  names.reserve(accessors_.size());
  for (const auto &accessor : accessors_) names.push_back(accessor.name);
  return names;
}

const HasManyOptions *EntityType::FindHasMany(std::string_view name) const {
  auto it = has_many_.find(name);
  if (it == has_many_.end()) return nullptr;
  return &it->second;
}

void EntityType::CheckColumns(const EntityType &type, const std::optional<Filter> &conditions) const {
  if (!conditions) return;
  for (const auto &property : conditions->Properties()) {
    if (!type.HasColumn(property)) {
      throw SchemaException("Conditions of a relation of {} use '{}', which is not a column of {}", class_name_,
                            property, type.ClassName());
    }
  }
}

void EntityType::HasMany(std::string name, HasManyOptions options) {
  const auto &target = storage_->GetEntityType(options.class_name);
  if (options.foreign_key.empty()) options.foreign_key = ForeignKey();
  if (!target.HasColumn(options.foreign_key)) {
    throw SchemaException("{} has no column '{}' referencing {}", target.ClassName(), options.foreign_key, class_name_);
  }
  CheckColumns(target, options.conditions);
  options.class_name = target.ClassName();

  DefineAccessor(name, RelationKind::HAS_MANY,
                 [table = target.Table(), foreign_key = options.foreign_key,
                  conditions = options.conditions](const Record &owner) -> std::shared_ptr<Collection> {
                   return std::make_shared<HasManyAssociation>(owner, table, foreign_key, conditions);
                 });
  has_many_.emplace(std::move(name), std::move(options));
}

void EntityType::HasAndBelongsToMany(std::string name, HasAndBelongsToManyOptions options) {
  const auto &target = storage_->GetEntityType(options.class_name);
  if (options.join_table.empty()) {
    options.join_table = fmt::format("{}_{}", std::min(table_, target.Table()), std::max(table_, target.Table()));
  }
  auto &join_table = storage_->GetJoinTable(options.join_table);
  if (options.foreign_key.empty()) options.foreign_key = ForeignKey();
  if (options.association_foreign_key.empty()) options.association_foreign_key = target.ForeignKey();
  for (const auto *key : {&options.foreign_key, &options.association_foreign_key}) {
    if (!join_table.HasColumn(*key)) {
      throw SchemaException("Join table '{}' has no column '{}'", join_table.name(), *key);
    }
  }
  if (options.foreign_key == options.association_foreign_key) {
    throw SchemaException("Relation '{}' of {} uses column '{}' for both sides of join table '{}'", name, class_name_,
                          options.foreign_key, join_table.name());
  }
  CheckColumns(target, options.conditions);

  DefineAccessor(std::move(name), RelationKind::HAS_AND_BELONGS_TO_MANY,
                 [join_table = &join_table, foreign_key = options.foreign_key,
                  association_foreign_key = options.association_foreign_key, table = target.Table(),
                  conditions = options.conditions](const Record &owner) -> std::shared_ptr<Collection> {
                   return std::make_shared<HasAndBelongsToManyAssociation>(owner, join_table, foreign_key,
                                                                           association_foreign_key, table, conditions);
                 });
}

void EntityType::HasManyThrough(std::string name, HasManyThroughOptions options) {
  const auto *through = FindHasMany(options.through);
  if (!through) {
    throw SchemaException("{} has no has-many relation named '{}' to go through", class_name_, options.through);
  }
  const auto &edge = storage_->GetEntityType(through->class_name);
  if (options.source_key.empty() || !edge.HasColumn(options.source_key)) {
    throw SchemaException("{} has no source column '{}'", edge.ClassName(), options.source_key);
  }
  const auto &target = storage_->GetEntityType(options.class_name);
  CheckColumns(edge, options.conditions);

  DefineAccessor(std::move(name), RelationKind::HAS_MANY_THROUGH,
                 [edge_table = edge.Table(), through = *through, source_key = options.source_key,
                  table = target.Table(),
                  conditions = options.conditions](const Record &owner) -> std::shared_ptr<Collection> {
                   return std::make_shared<HasManyThroughAssociation>(owner, edge_table, through, source_key, table,
                                                                      conditions);
                 });
}

}  // namespace netrel::storage
