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
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <type_traits>
#include <vector>

#include "storage/collection.hpp"
#include "storage/id_types.hpp"
#include "storage/record.hpp"

namespace netrel::network {

/**
 * A deduplicating union of record collections.
 *
 * Members are identified by table and gid, like records. When several sources
 * hold the same record the copy of the earliest source is kept, so the order
 * of the sources decides which copy is visible.
 *
 * The view is lazy. Id lookups (@ref Find, @ref WhereIdIn) ask every source
 * for the requested ids only and never load a source as a whole. Operations
 * over the whole union (@ref Size, iteration, @ref Map, @ref Filter,
 * @ref ToVector) load every source once, deduplicate and cache the result for
 * the rest of the lifetime of the view. A fresh view is needed to observe
 * changes made to the sources after the cache was filled.
 *
 * A view may itself be a source of another view.
 *
 * @code
 * network::UnionView contacts{person.Relation("contacts_out"), person.Relation("contacts_in")};
 * auto someone = contacts.Find(storage::Gid::FromInt(2));
 * for (const auto &contact : contacts) { ... }
 * @endcode
 */
class UnionView final : public storage::Collection {
 public:
  using Source = std::shared_ptr<const storage::Collection>;
  using const_iterator = std::vector<storage::Record>::const_iterator;

  UnionView() = default;

  /// Null sources are dropped; the rest keep their order.
  UnionView(std::initializer_list<Source> sources);
  explicit UnionView(std::vector<Source> sources);

  /// Number of distinct records over all sources. Fills the cache.
  size_t Size() const override;

  /// True when every source is empty. Does not fill the cache.
  bool Empty() const override;

  /// Same as @ref ToVector.
  std::vector<storage::Record> Load() const override { return ToVector(); }

  /// Records of the union whose gid is in `ids`, in source order and without
  /// duplicates. Unknown ids are ignored.
  std::vector<storage::Record> WhereIdIn(const std::vector<storage::Gid> &ids) const override;

  /// @throw storage::RecordNotFound if no source has the record.
  storage::Record Find(storage::Gid id) const;

  /**
   * Looks up every id in `ids` across the union. The lookup succeeds only if
   * every distinct requested id is resolved; repeated ids in the request
   * resolve to a single record.
   *
   * @return the resolved records, in source order, without duplicates. An
   * empty request resolves to an empty vector.
   * @throw storage::RecordNotFound carrying the whole `ids` list if any id is
   * missing.
   */
  std::vector<storage::Record> Find(const std::vector<storage::Gid> &ids) const;

  template <class... TIds>
  std::vector<storage::Record> Find(storage::Gid first, storage::Gid second, TIds... rest) const {
    return Find(std::vector<storage::Gid>{first, second, rest...});
  }

  const_iterator begin() const { return Materialize().begin(); }
  const_iterator end() const { return Materialize().end(); }

  std::vector<storage::Record> ToVector() const { return Materialize(); }

  template <class TFunc>
  auto Map(TFunc &&func) const {
    std::vector<std::decay_t<std::invoke_result_t<TFunc &, const storage::Record &>>> res;
    const auto &records = Materialize();
    res.reserve(records.size());
    for (const auto &record : records) res.push_back(std::invoke(func, record));
    return res;
  }

  template <class TPredicate>
  std::vector<storage::Record> Filter(TPredicate &&predicate) const {
    std::vector<storage::Record> res;
    for (const auto &record : Materialize()) {
      if (std::invoke(predicate, record)) res.push_back(record);
    }
    return res;
  }

  bool IsMaterialized() const { return cache_.has_value(); }

  const std::vector<Source> &Sources() const { return sources_; }

 private:
  const std::vector<storage::Record> &Materialize() const;

  std::vector<Source> sources_;
  mutable std::optional<std::vector<storage::Record>> cache_;
};

}  // namespace netrel::network
