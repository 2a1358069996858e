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

#include <bit>
#include <compare>
#include <cstdint>
#include <functional>
#include <ostream>
#include <type_traits>

#include <fmt/format.h>

namespace netrel::storage {

#define STORAGE_DEFINE_ID_TYPE(name)                                                          \
  class name final {                                                                          \
   private:                                                                                   \
    explicit constexpr name(int64_t id) : id_(id) {}                                          \
                                                                                              \
   public:                                                                                    \
    /* Default constructor to allow serialization or preallocation. */                       \
    constexpr name() = default;                                                               \
                                                                                              \
    static constexpr name FromUint(uint64_t id) { return name{std::bit_cast<int64_t>(id)}; } \
    static constexpr name FromInt(int64_t id) { return name{id}; }                            \
    constexpr uint64_t AsUint() const { return std::bit_cast<uint64_t>(id_); }                \
    constexpr int64_t AsInt() const { return id_; }                                           \
                                                                                              \
    friend constexpr auto operator<=>(const name &, const name &) = default;                  \
                                                                                              \
   private:                                                                                   \
    int64_t id_{0};                                                                           \
  };                                                                                          \
  static_assert(std::is_trivially_copyable_v<name>, "storage::" #name " must be trivially copyable!");

/// Primary key of a record. Ids are unique within a table; records of
/// different tables may share a gid.
STORAGE_DEFINE_ID_TYPE(Gid);

#undef STORAGE_DEFINE_ID_TYPE

inline std::ostream &operator<<(std::ostream &os, const Gid &gid) { return os << gid.AsInt(); }

}  // namespace netrel::storage

namespace std {

template <>
struct hash<netrel::storage::Gid> {
  size_t operator()(const netrel::storage::Gid &id) const noexcept { return std::hash<uint64_t>{}(id.AsUint()); }
};

}  // namespace std

template <>
struct fmt::formatter<netrel::storage::Gid> : fmt::formatter<int64_t> {
  template <typename FormatContext>
  auto format(const netrel::storage::Gid &gid, FormatContext &ctx) const {
    return fmt::formatter<int64_t>::format(gid.AsInt(), ctx);
  }
};
