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

#include "storage/join_table.hpp"

#include <algorithm>

#include "storage/exceptions.hpp"

namespace netrel::storage {

JoinTable::JoinTable(std::string name, std::string first_key, std::string second_key)
    : name_(std::move(name)), keys_{std::move(first_key), std::move(second_key)} {
  if (keys_[0].empty() || keys_[1].empty() || keys_[0] == keys_[1]) {
    throw SchemaException("Join table '{}' needs two distinct key columns, got '{}' and '{}'", name_, keys_[0],
                          keys_[1]);
  }
}

std::array<size_t, 2> JoinTable::Columns(std::string_view key, std::string_view other_key) const {
  if (key == keys_[0] && other_key == keys_[1]) return {0, 1};
  if (key == keys_[1] && other_key == keys_[0]) return {1, 0};
  throw SchemaException("Join table '{}' has columns ({}, {}), not ({}, {})", name_, keys_[0], keys_[1], key,
                        other_key);
}

void JoinTable::Insert(std::string_view key, Gid value, std::string_view other_key, Gid other_value) {
  const auto [column, other_column] = Columns(key, other_key);
  std::array<Gid, 2> row;
  row[column] = value;
  row[other_column] = other_value;
  rows_.push_back(row);
}

size_t JoinTable::Remove(std::string_view key, Gid value, std::string_view other_key, Gid other_value) {
  const auto [column, other_column] = Columns(key, other_key);
  const auto removed = std::erase_if(rows_, [&, column = column, other_column = other_column](const auto &row) {
    return row[column] == value && row[other_column] == other_value;
  });
  return removed;
}

std::vector<Gid> JoinTable::Lookup(std::string_view key, Gid value, std::string_view other_key) const {
  const auto [column, other_column] = Columns(key, other_key);
  std::vector<Gid> res;
  for (const auto &row : rows_) {
    if (row[column] == value) res.push_back(row[other_column]);
  }
  return res;
}

}  // namespace netrel::storage
