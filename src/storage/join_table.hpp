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

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "storage/id_types.hpp"

namespace netrel::storage {

/**
 * An attribute-less table with exactly two key columns, each holding the gid
 * of a referenced record. Rows keep insertion order and may repeat.
 */
class JoinTable final {
 public:
  JoinTable(std::string name, std::string first_key, std::string second_key);

  const std::string &name() const { return name_; }
  const std::string &first_key() const { return keys_[0]; }
  const std::string &second_key() const { return keys_[1]; }

  bool HasColumn(std::string_view column) const { return column == keys_[0] || column == keys_[1]; }

  /// Adds the row (`key` = `value`, `other_key` = `other_value`).
  /// @throw SchemaException if the two names are not the two key columns.
  void Insert(std::string_view key, Gid value, std::string_view other_key, Gid other_value);

  /// Removes every row equal to (`key` = `value`, `other_key` = `other_value`).
  /// @return number of removed rows.
  size_t Remove(std::string_view key, Gid value, std::string_view other_key, Gid other_value);

  /// Values of `other_key` in the rows whose `key` column equals `value`, in
  /// row order.
  std::vector<Gid> Lookup(std::string_view key, Gid value, std::string_view other_key) const;

  size_t Size() const { return rows_.size(); }

 private:
  /// Returns the column positions of (`key`, `other_key`).
  std::array<size_t, 2> Columns(std::string_view key, std::string_view other_key) const;

  std::string name_;
  std::array<std::string, 2> keys_;
  std::vector<std::array<Gid, 2>> rows_;
};

}  // namespace netrel::storage
