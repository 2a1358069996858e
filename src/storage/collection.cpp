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

#include "storage/collection.hpp"

#include <algorithm>
#include <unordered_set>

#include "storage/storage.hpp"

namespace netrel::storage {

bool Collection::Includes(const Record &record) const {
  const auto found = WhereIdIn({record.gid()});
  return std::find(found.begin(), found.end(), record) != found.end();
}

std::vector<Record> RecordList::WhereIdIn(const std::vector<Gid> &ids) const {
  const std::unordered_set<Gid> requested(ids.begin(), ids.end());
  std::vector<Record> res;
  for (const auto &record : records_) {
    if (requested.contains(record.gid())) res.push_back(record);
  }
  return res;
}

std::vector<Record> QueryCollection::Load() const { return storage_->Scan(table_, filter_); }

std::vector<Record> QueryCollection::WhereIdIn(const std::vector<Gid> &ids) const {
  auto distinct = DistinctIds(ids);
  std::sort(distinct.begin(), distinct.end());
  std::vector<Record> res;
  for (const auto &id : distinct) {
    auto record = storage_->FindRecord(table_, id);
    if (record && filter_.Matches(record->Properties())) res.push_back(std::move(*record));
  }
  return res;
}

size_t QueryCollection::Size() const { return storage_->Count(table_, filter_); }

std::vector<Gid> DistinctIds(const std::vector<Gid> &ids) {
  std::unordered_set<Gid> seen;
  std::vector<Gid> res;
  res.reserve(ids.size());
  for (const auto &id : ids) {
    if (seen.insert(id).second) res.push_back(id);
  }
  return res;
}

}  // namespace netrel::storage
