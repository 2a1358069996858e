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

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "storage/collection.hpp"
#include "storage/config.hpp"
#include "storage/entity_type.hpp"
#include "storage/filter.hpp"
#include "storage/id_types.hpp"
#include "storage/join_table.hpp"
#include "storage/property_value.hpp"
#include "storage/record.hpp"

namespace netrel::storage {

/**
 * Single-process, in-memory record store.
 *
 * The storage owns the entity types, their rows and the join tables. Records
 * and collections handed out by the storage keep a raw pointer to it, so the
 * storage must outlive them.
 *
 * Entity types and join tables can be looked up by name; entity types accept
 * either their table name (`people`) or their class name (`Person`).
 */
class Storage final {
 public:
  explicit Storage(Config config = Config());

  Storage(const Storage &) = delete;
  Storage &operator=(const Storage &) = delete;
  Storage(Storage &&) = delete;
  Storage &operator=(Storage &&) = delete;
  ~Storage();

  /// Creates an entity type stored in table `Tableize(class_name)`.
  /// @throw SchemaException if the class or table name is taken.
  EntityType &CreateEntityType(std::string class_name, std::vector<std::string> columns);
  EntityType &CreateEntityType(std::string class_name, std::string table, std::vector<std::string> columns);

  EntityType *FindEntityType(std::string_view name) const;
  /// @throw SchemaException if there is no such entity type.
  EntityType &GetEntityType(std::string_view name) const;

  /// @throw SchemaException if the name is taken by another join table or by
  /// an entity table.
  JoinTable &CreateJoinTable(std::string name, std::string first_key, std::string second_key);

  JoinTable *FindJoinTable(std::string_view name) const;
  /// @throw SchemaException if there is no such join table.
  JoinTable &GetJoinTable(std::string_view name) const;

  /// Inserts a row with the next free gid of the table.
  Record Create(std::string_view table, PropertyMap properties = {});

  /// Inserts a row with the given gid.
  /// @throw StorageException if the gid is taken.
  Record Create(std::string_view table, Gid gid, PropertyMap properties = {});

  /// Replaces the stored properties of `record` with the ones it carries.
  /// @throw RecordNotFound if the record was deleted.
  void Save(const Record &record);

  /// Removes the row of `record`. Join rows referencing it stay in place and
  /// are skipped by associations that resolve them.
  /// @return false if the record did not exist.
  bool Delete(const Record &record);

  /// @throw RecordNotFound if there is no such row.
  Record Find(std::string_view table, Gid gid);

  std::optional<Record> FindRecord(std::string_view table, Gid gid);

  /// Rows of `table` that match `filter`, in gid order.
  std::vector<Record> Scan(std::string_view table, const Filter &filter = {});

  size_t Count(std::string_view table, const Filter &filter = {}) const;

  std::shared_ptr<QueryCollection> All(std::string_view table);
  std::shared_ptr<QueryCollection> Where(std::string_view table, Filter filter);

  const Config &config() const { return config_; }

 private:
  struct Table {
    std::unique_ptr<EntityType> type;
    std::map<Gid, PropertyMap> rows;
    Gid next_gid;
  };

  Table &GetTable(std::string_view table);
  const Table &GetTable(std::string_view table) const;
  void CheckColumns(const Table &table, const PropertyMap &properties) const;

  Config config_;
  std::map<std::string, Table, std::less<>> tables_;
  // class name -> table name
  std::map<std::string, std::string, std::less<>> class_names_;
  std::map<std::string, std::unique_ptr<JoinTable>, std::less<>> join_tables_;
};

}  // namespace netrel::storage
