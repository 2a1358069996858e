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

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "storage/filter.hpp"

namespace netrel::storage {

class Collection;
class Record;
class Storage;

enum class RelationKind : uint8_t { HAS_MANY, HAS_AND_BELONGS_TO_MANY, HAS_MANY_THROUGH, UNION };

std::ostream &operator<<(std::ostream &os, RelationKind kind);

/// Produces a fresh collection for the given owner record on every call.
using AccessorFactory = std::function<std::shared_ptr<Collection>(const Record &owner)>;

/// A named relation of an entity type, bound once at type setup.
struct Accessor {
  std::string name;
  RelationKind kind;
  AccessorFactory factory;
  /// Names of the accessors merged by a UNION accessor; empty otherwise.
  std::vector<std::string> sources;
};

/// One-to-many: records of `class_name` whose `foreign_key` column holds the
/// owner's gid.
struct HasManyOptions {
  std::string class_name;
  std::string foreign_key;
  std::optional<Filter> conditions;
};

/// Many-to-many through a join table: rows whose `foreign_key` equals the
/// owner's gid, resolved through `association_foreign_key` to records of
/// `class_name`. `conditions` filter the resolved records.
struct HasAndBelongsToManyOptions {
  std::string class_name;
  std::string join_table;
  std::string foreign_key;
  std::string association_foreign_key;
  std::optional<Filter> conditions;
};

/// Many-to-many through an edge entity: the edges of the HAS_MANY accessor
/// `through`, resolved through their `source_key` column to records of
/// `class_name`. `conditions` filter the edges, not the resolved records.
struct HasManyThroughOptions {
  std::string through;
  std::string source_key;
  std::string class_name;
  std::optional<Filter> conditions;
};

/**
 * Schema of one entity table plus the named relations declared on it.
 *
 * Relations are declared once during type setup, before records are queried,
 * and are never removed. Each declaration validates its arguments against the
 * storage and throws SchemaException on the first problem.
 */
class EntityType final {
 public:
  EntityType(Storage *storage, std::string class_name, std::string table, std::vector<std::string> columns);

  EntityType(const EntityType &) = delete;
  EntityType &operator=(const EntityType &) = delete;
  EntityType(EntityType &&) = delete;
  EntityType &operator=(EntityType &&) = delete;
  ~EntityType() = default;

  const std::string &ClassName() const { return class_name_; }
  const std::string &Table() const { return table_; }
  const std::vector<std::string> &Columns() const { return columns_; }
  bool HasColumn(std::string_view column) const;

  /// Foreign key column name that other tables use to reference this type,
  /// e.g. `person_id` for `Person`.
  std::string ForeignKey() const;

  Storage &GetStorage() const { return *storage_; }

  /// @throw SchemaException if an accessor with the same name exists.
  void DefineAccessor(std::string name, RelationKind kind, AccessorFactory factory,
                      std::vector<std::string> sources = {});

  bool HasAccessor(std::string_view name) const { return FindAccessor(name) != nullptr; }
  const Accessor *FindAccessor(std::string_view name) const;
  /// Accessor names in declaration order.
  std::vector<std::string> AccessorNames() const;

  /// Options a HAS_MANY accessor was declared with, nullptr for any other
  /// accessor.
  const HasManyOptions *FindHasMany(std::string_view name) const;

  void HasMany(std::string name, HasManyOptions options);
  void HasAndBelongsToMany(std::string name, HasAndBelongsToManyOptions options);
  void HasManyThrough(std::string name, HasManyThroughOptions options);

 private:
  void CheckColumns(const EntityType &type, const std::optional<Filter> &conditions) const;

  Storage *storage_;
  std::string class_name_;
  std::string table_;
  std::vector<std::string> columns_;
  std::vector<Accessor> accessors_;
  std::map<std::string, HasManyOptions, std::less<>> has_many_;
};

}  // namespace netrel::storage
