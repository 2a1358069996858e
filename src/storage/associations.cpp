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

#include "storage/associations.hpp"

#include <algorithm>
#include <unordered_set>

#include <fmt/ostream.h>

#include "storage/exceptions.hpp"
#include "storage/join_table.hpp"
#include "storage/storage.hpp"

namespace netrel::storage {

namespace {

void CheckTable(const Record &record, const std::string &table) {
  if (record.table() != table) {
    throw SchemaException("Expected a record of table '{}', got {}", table, fmt::streamed(record));
  }
}

}  // namespace

Storage &Association::GetStorage() const {
  if (!owner_.storage()) {
    throw StorageException("Record {} of {} is not attached to a storage", owner_.gid(), owner_.table());
  }
  return *owner_.storage();
}

HasManyAssociation::HasManyAssociation(Record owner, std::string table, std::string foreign_key,
                                       std::optional<Filter> conditions)
    : Association(std::move(owner)),
      table_(std::move(table)),
      foreign_key_(std::move(foreign_key)),
      conditions_(std::move(conditions)) {}

Filter HasManyAssociation::Scope() const {
  auto scope = Filter::Where(foreign_key_, owner().gid());
  if (conditions_) scope.And(*conditions_);
  return scope;
}

std::vector<Record> HasManyAssociation::Load() const { return GetStorage().Scan(table_, Scope()); }

std::vector<Record> HasManyAssociation::WhereIdIn(const std::vector<Gid> &ids) const {
  auto &storage = GetStorage();
  const auto scope = Scope();
  std::vector<Record> res;
  for (const auto &id : DistinctIds(ids)) {
    auto record = storage.FindRecord(table_, id);
    if (record && scope.Matches(record->Properties())) res.push_back(std::move(*record));
  }
  std::sort(res.begin(), res.end(), [](const auto &a, const auto &b) { return a.gid() < b.gid(); });
  return res;
}

size_t HasManyAssociation::Size() const { return GetStorage().Count(table_, Scope()); }

void HasManyAssociation::Push(const Record &record) {
  CheckTable(record, table_);
  auto related = record;
  related.SetProperty(foreign_key_, owner().gid());
  GetStorage().Save(related);
}

HasAndBelongsToManyAssociation::HasAndBelongsToManyAssociation(Record owner, JoinTable *join_table,
                                                               std::string foreign_key,
                                                               std::string association_foreign_key, std::string table,
                                                               std::optional<Filter> conditions)
    : Association(std::move(owner)),
      join_table_(join_table),
      foreign_key_(std::move(foreign_key)),
      association_foreign_key_(std::move(association_foreign_key)),
      table_(std::move(table)),
      conditions_(std::move(conditions)) {}

std::vector<Record> HasAndBelongsToManyAssociation::Resolve(const std::vector<Gid> &ids) const {
  auto &storage = GetStorage();
  std::vector<Record> res;
  for (const auto &id : ids) {
    // Rows of deleted records are left behind in the join table.
    auto record = storage.FindRecord(table_, id);
    if (!record) continue;
    if (conditions_ && !conditions_->Matches(record->Properties())) continue;
    res.push_back(std::move(*record));
  }
  return res;
}

std::vector<Record> HasAndBelongsToManyAssociation::Load() const {
  return Resolve(DistinctIds(join_table_->Lookup(foreign_key_, owner().gid(), association_foreign_key_)));
}

std::vector<Record> HasAndBelongsToManyAssociation::WhereIdIn(const std::vector<Gid> &ids) const {
  const std::unordered_set<Gid> requested(ids.begin(), ids.end());
  auto related = DistinctIds(join_table_->Lookup(foreign_key_, owner().gid(), association_foreign_key_));
  std::erase_if(related, [&requested](const auto &id) { return !requested.contains(id); });
  return Resolve(related);
}

void HasAndBelongsToManyAssociation::Push(const Record &record) {
  CheckTable(record, table_);
  join_table_->Insert(foreign_key_, owner().gid(), association_foreign_key_, record.gid());
}

HasManyThroughAssociation::HasManyThroughAssociation(Record owner, std::string edge_table,
                                                     const HasManyOptions &through, std::string source_key,
                                                     std::string table, const std::optional<Filter> &conditions)
    : Association(std::move(owner)),
      edge_table_(std::move(edge_table)),
      edge_scope_(Filter::Where(through.foreign_key, this->owner().gid())),
      source_key_(std::move(source_key)),
      table_(std::move(table)) {
  if (through.conditions) edge_scope_.And(*through.conditions);
  if (conditions) edge_scope_.And(*conditions);
}

std::vector<Gid> HasManyThroughAssociation::TargetIds() const {
  std::vector<Gid> ids;
  for (const auto &edge : GetStorage().Scan(edge_table_, edge_scope_)) {
    const auto &target = edge.GetProperty(source_key_);
    if (target.IsInt()) ids.push_back(target.ValueGid());
  }
  return DistinctIds(ids);
}

std::vector<Record> HasManyThroughAssociation::Load() const {
  auto &storage = GetStorage();
  std::vector<Record> res;
  for (const auto &id : TargetIds()) {
    auto record = storage.FindRecord(table_, id);
    if (record) res.push_back(std::move(*record));
  }
  return res;
}

std::vector<Record> HasManyThroughAssociation::WhereIdIn(const std::vector<Gid> &ids) const {
  auto &storage = GetStorage();
  const std::unordered_set<Gid> requested(ids.begin(), ids.end());
  std::vector<Record> res;
  for (const auto &id : TargetIds()) {
    if (!requested.contains(id)) continue;
    auto record = storage.FindRecord(table_, id);
    if (record) res.push_back(std::move(*record));
  }
  return res;
}

void HasManyThroughAssociation::Push(const Record &record) {
  throw ReadOnlyAssociation("Can't add {} through the '{}' edges of {}, create the edge instead",
                            fmt::streamed(record), edge_table_, fmt::streamed(owner()));
}

}  // namespace netrel::storage
