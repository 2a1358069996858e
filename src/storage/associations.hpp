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

#include <optional>
#include <string>
#include <vector>

#include "storage/collection.hpp"
#include "storage/entity_type.hpp"
#include "storage/filter.hpp"
#include "storage/record.hpp"

namespace netrel::storage {

class JoinTable;

/// The records related to one owner record through a declared relation.
class Association : public Collection {
 public:
  explicit Association(Record owner) : owner_(std::move(owner)) {}

  const Record &owner() const { return owner_; }

  /// Relates `record` to the owner and persists the change.
  virtual void Push(const Record &record) = 0;

  Association &operator<<(const Record &record) {
    Push(record);
    return *this;
  }

 protected:
  Storage &GetStorage() const;

 private:
  Record owner_;
};

/// Records of `table` whose `foreign_key` column equals the owner's gid and
/// that match `conditions`.
class HasManyAssociation final : public Association {
 public:
  HasManyAssociation(Record owner, std::string table, std::string foreign_key, std::optional<Filter> conditions);

  std::vector<Record> Load() const override;
  std::vector<Record> WhereIdIn(const std::vector<Gid> &ids) const override;
  size_t Size() const override;

  /// Points the foreign key of `record` at the owner and saves it.
  void Push(const Record &record) override;

  /// The full filter of the association, foreign key included.
  Filter Scope() const;

 private:
  std::string table_;
  std::string foreign_key_;
  std::optional<Filter> conditions_;
};

/// Records of `table` referenced by the `association_foreign_key` column of
/// the join rows whose `foreign_key` column equals the owner's gid.
class HasAndBelongsToManyAssociation final : public Association {
 public:
  HasAndBelongsToManyAssociation(Record owner, JoinTable *join_table, std::string foreign_key,
                                 std::string association_foreign_key, std::string table,
                                 std::optional<Filter> conditions);

  std::vector<Record> Load() const override;
  std::vector<Record> WhereIdIn(const std::vector<Gid> &ids) const override;

  /// Inserts the join row (owner, `record`).
  void Push(const Record &record) override;

 private:
  std::vector<Record> Resolve(const std::vector<Gid> &ids) const;

  JoinTable *join_table_;
  std::string foreign_key_;
  std::string association_foreign_key_;
  std::string table_;
  std::optional<Filter> conditions_;
};

/**
 * Records of `table` reached by following the edges of a has-many relation of
 * the owner through their `source_key` column. `conditions` are evaluated on
 * the edges.
 *
 * The association is read-only: relating two records means creating an edge,
 * which carries attributes of its own.
 */
class HasManyThroughAssociation final : public Association {
 public:
  HasManyThroughAssociation(Record owner, std::string edge_table, const HasManyOptions &through,
                            std::string source_key, std::string table, const std::optional<Filter> &conditions);

  std::vector<Record> Load() const override;
  std::vector<Record> WhereIdIn(const std::vector<Gid> &ids) const override;

  /// @throw ReadOnlyAssociation always.
  void Push(const Record &record) override;

 private:
  std::vector<Gid> TargetIds() const;

  std::string edge_table_;
  Filter edge_scope_;
  std::string source_key_;
  std::string table_;
};

}  // namespace netrel::storage
