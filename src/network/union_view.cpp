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

#include "network/union_view.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <unordered_set>
#include <utility>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "storage/exceptions.hpp"

namespace netrel::network {

namespace {

std::vector<UnionView::Source> DropNull(std::vector<UnionView::Source> sources) {
  std::erase(sources, nullptr);
  return sources;
}

/// Keeps the first record of every table and gid pair. Gids are unique per
/// table only, so records of different tables never collapse.
void Deduplicate(std::vector<storage::Record> *records) {
  std::set<std::pair<std::string, storage::Gid>> seen;
  std::erase_if(*records,
                [&seen](const auto &record) { return !seen.emplace(record.table(), record.gid()).second; });
}

size_t CountDistinctGids(const std::vector<storage::Record> &records) {
  std::unordered_set<storage::Gid> gids;
  for (const auto &record : records) gids.insert(record.gid());
  return gids.size();
}

}  // namespace

UnionView::UnionView(std::initializer_list<Source> sources) : UnionView(std::vector<Source>(sources)) {}

UnionView::UnionView(std::vector<Source> sources) : sources_(DropNull(std::move(sources))) {}

size_t UnionView::Size() const { return Materialize().size(); }

bool UnionView::Empty() const {
  if (cache_) return cache_->empty();
  return std::all_of(sources_.begin(), sources_.end(), [](const auto &source) { return source->Empty(); });
}

std::vector<storage::Record> UnionView::WhereIdIn(const std::vector<storage::Gid> &ids) const {
  std::vector<storage::Record> res;
  const auto requested = storage::DistinctIds(ids);
  if (requested.empty()) return res;
  for (const auto &source : sources_) {
    if (source->Empty()) continue;
    auto found = source->WhereIdIn(requested);
    res.insert(res.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
  }
  Deduplicate(&res);
  return res;
}

storage::Record UnionView::Find(storage::Gid id) const { return std::move(Find(std::vector{id}).front()); }

std::vector<storage::Record> UnionView::Find(const std::vector<storage::Gid> &ids) const {
  auto res = WhereIdIn(ids);
  if (CountDistinctGids(res) != storage::DistinctIds(ids).size()) {
    spdlog::trace("Union of {} sources resolved {} of the ids ({})", sources_.size(), res.size(),
                  fmt::join(ids, ", "));
    throw storage::RecordNotFound(ids);
  }
  return res;
}

const std::vector<storage::Record> &UnionView::Materialize() const {
  if (cache_) return *cache_;
  spdlog::trace("Materializing union of {} sources", sources_.size());
  std::vector<storage::Record> records;
  for (const auto &source : sources_) {
    auto loaded = source->Load();
    records.insert(records.end(), std::make_move_iterator(loaded.begin()), std::make_move_iterator(loaded.end()));
  }
  Deduplicate(&records);
  cache_.emplace(std::move(records));
  return *cache_;
}

}  // namespace netrel::network
