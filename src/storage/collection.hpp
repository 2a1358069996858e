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
#include <string>
#include <vector>

#include "storage/filter.hpp"
#include "storage/id_types.hpp"
#include "storage/record.hpp"

namespace netrel::storage {

class Storage;

/**
 * A queryable set of records. Every call goes to the storage, so a collection
 * always reflects the current state of the data.
 *
 * Implementations must make @ref WhereIdIn cheap compared to @ref Load: it is
 * used for id lookups across collections that may be too large to load.
 */
class Collection {
 public:
  Collection() = default;
  Collection(const Collection &) = default;
  Collection &operator=(const Collection &) = default;
  Collection(Collection &&) = default;
  Collection &operator=(Collection &&) = default;
  virtual ~Collection() = default;

  /// Loads every record of the collection, in collection order.
  virtual std::vector<Record> Load() const = 0;

  /// Loads the records of the collection whose gid is in `ids`, in collection
  /// order. Ids that are not part of the collection are ignored.
  virtual std::vector<Record> WhereIdIn(const std::vector<Gid> &ids) const = 0;

  virtual size_t Size() const { return Load().size(); }

  virtual bool Empty() const { return Size() == 0; }

  /// Checks membership by id lookup; does not load the whole collection.
  virtual bool Includes(const Record &record) const;
};

/// A fixed list of records, e.g. the result of an earlier query.
class RecordList final : public Collection {
 public:
  RecordList() = default;
  explicit RecordList(std::vector<Record> records) : records_(std::move(records)) {}

  std::vector<Record> Load() const override { return records_; }
  std::vector<Record> WhereIdIn(const std::vector<Gid> &ids) const override;
  size_t Size() const override { return records_.size(); }
  bool Empty() const override { return records_.empty(); }

 private:
  std::vector<Record> records_;
};

/// All records of one table that match a filter.
class QueryCollection final : public Collection {
 public:
  QueryCollection(Storage *storage, std::string table, Filter filter = {})
      : storage_(storage), table_(std::move(table)), filter_(std::move(filter)) {}

  std::vector<Record> Load() const override;
  std::vector<Record> WhereIdIn(const std::vector<Gid> &ids) const override;
  size_t Size() const override;

  const std::string &table() const { return table_; }
  const Filter &filter() const { return filter_; }

 private:
  Storage *storage_;
  std::string table_;
  Filter filter_;
};

/// Returns `ids` without repetitions, keeping the first occurrence of each.
std::vector<Gid> DistinctIds(const std::vector<Gid> &ids);

}  // namespace netrel::storage
