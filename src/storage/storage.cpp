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

#include "storage/storage.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

#include "storage/exceptions.hpp"
#include "utils/inflector.hpp"
#include "utils/logging.hpp"

namespace netrel::storage {

Storage::Storage(Config config) : config_(config) {}

Storage::~Storage() = default;

EntityType &Storage::CreateEntityType(std::string class_name, std::vector<std::string> columns) {
  auto table = utils::Tableize(class_name);
  return CreateEntityType(std::move(class_name), std::move(table), std::move(columns));
}

EntityType &Storage::CreateEntityType(std::string class_name, std::string table, std::vector<std::string> columns) {
  if (class_name.empty() || table.empty()) {
    throw SchemaException("Entity type needs a class name and a table name");
  }
  if (class_names_.contains(class_name)) {
    throw SchemaException("Entity type {} already exists", class_name);
  }
  if (tables_.contains(table) || join_tables_.contains(table)) {
    throw SchemaException("Table '{}' already exists", table);
  }
  for (auto it = columns.begin(); it != columns.end(); ++it) {
    if (it->empty()) throw SchemaException("Entity type {} has a column without a name", class_name);
    if (std::find(columns.begin(), it, *it) != it) {
      throw SchemaException("Entity type {} declares column '{}' twice", class_name, *it);
    }
  }

  spdlog::debug("Creating entity type {} in table '{}'", class_name, table);
  auto type = std::make_unique<EntityType>(this, class_name, table, std::move(columns));
  auto *type_ptr = type.get();
  class_names_.emplace(std::move(class_name), table);
  tables_.emplace(std::move(table), Table{std::move(type), {}, Gid::FromInt(config_.ids.first_gid)});
  return *type_ptr;
}

EntityType *Storage::FindEntityType(std::string_view name) const {
  auto table_it = tables_.find(name);
  if (table_it != tables_.end()) return table_it->second.type.get();
  auto class_it = class_names_.find(name);
  if (class_it == class_names_.end()) return nullptr;
  auto it = tables_.find(class_it->second);
  NR_ASSERT(it != tables_.end(), "Entity type {} has no table", name);
  return it->second.type.get();
}

EntityType &Storage::GetEntityType(std::string_view name) const {
  auto *type = FindEntityType(name);
  if (!type) throw SchemaException("Unknown entity type '{}'", name);
  return *type;
}

JoinTable &Storage::CreateJoinTable(std::string name, std::string first_key, std::string second_key) {
  if (name.empty()) throw SchemaException("Join table needs a name");
  if (join_tables_.contains(name) || tables_.contains(name)) {
    throw SchemaException("Table '{}' already exists", name);
  }
  spdlog::debug("Creating join table '{}' ({}, {})", name, first_key, second_key);
  auto join_table = std::make_unique<JoinTable>(name, std::move(first_key), std::move(second_key));
  auto it = join_tables_.emplace(std::move(name), std::move(join_table)).first;
  return *it->second;
}

JoinTable *Storage::FindJoinTable(std::string_view name) const {
  auto it = join_tables_.find(name);
  if (it == join_tables_.end()) return nullptr;
  return it->second.get();
}

JoinTable &Storage::GetJoinTable(std::string_view name) const {
  auto *join_table = FindJoinTable(name);
  if (!join_table) throw SchemaException("Unknown join table '{}'", name);
  return *join_table;
}

Storage::Table &Storage::GetTable(std::string_view table) {
  return const_cast<Table &>(std::as_const(*this).GetTable(table));
}

const Storage::Table &Storage::GetTable(std::string_view table) const {
  auto it = tables_.find(table);
  if (it == tables_.end()) throw SchemaException("Unknown table '{}'", table);
  return it->second;
}

void Storage::CheckColumns(const Table &table, const PropertyMap &properties) const {
  if (!config_.items.strict_columns) return;
  for (const auto &[property, value] : properties) {
    if (!table.type->HasColumn(property)) {
      throw SchemaException("{} has no column named '{}'", table.type->ClassName(), property);
    }
  }
}

Record Storage::Create(std::string_view table, PropertyMap properties) {
  auto &entity_table = GetTable(table);
  return Create(table, entity_table.next_gid, std::move(properties));
}

Record Storage::Create(std::string_view table, Gid gid, PropertyMap properties) {
  auto &entity_table = GetTable(table);
  CheckColumns(entity_table, properties);
  if (entity_table.rows.contains(gid)) {
    throw StorageException("{} with ID {} already exists", entity_table.type->ClassName(), gid);
  }
  entity_table.rows.emplace(gid, properties);
  if (entity_table.next_gid <= gid) entity_table.next_gid = Gid::FromInt(gid.AsInt() + 1);
  return {this, entity_table.type->Table(), gid, std::move(properties)};
}

void Storage::Save(const Record &record) {
  auto &entity_table = GetTable(record.table());
  CheckColumns(entity_table, record.Properties());
  auto it = entity_table.rows.find(record.gid());
  if (it == entity_table.rows.end()) throw RecordNotFound(record.table(), {record.gid()});
  it->second = record.Properties();
}

bool Storage::Delete(const Record &record) { return GetTable(record.table()).rows.erase(record.gid()) > 0; }

Record Storage::Find(std::string_view table, Gid gid) {
  auto record = FindRecord(table, gid);
  if (!record) throw RecordNotFound(table, {gid});
  return std::move(*record);
}

std::optional<Record> Storage::FindRecord(std::string_view table, Gid gid) {
  const auto &entity_table = GetTable(table);
  auto it = entity_table.rows.find(gid);
  if (it == entity_table.rows.end()) return std::nullopt;
  return Record{this, entity_table.type->Table(), gid, it->second};
}

std::vector<Record> Storage::Scan(std::string_view table, const Filter &filter) {
  const auto &entity_table = GetTable(table);
  std::vector<Record> res;
  for (const auto &[gid, properties] : entity_table.rows) {
    if (filter.Matches(properties)) res.emplace_back(this, entity_table.type->Table(), gid, properties);
  }
  return res;
}

size_t Storage::Count(std::string_view table, const Filter &filter) const {
  const auto &rows = GetTable(table).rows;
  return std::count_if(rows.begin(), rows.end(), [&filter](const auto &row) { return filter.Matches(row.second); });
}

std::shared_ptr<QueryCollection> Storage::All(std::string_view table) { return Where(table, {}); }

std::shared_ptr<QueryCollection> Storage::Where(std::string_view table, Filter filter) {
  const auto &entity_table = GetTable(table);
  return std::make_shared<QueryCollection>(this, entity_table.type->Table(), std::move(filter));
}

}  // namespace netrel::storage
