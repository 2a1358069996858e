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

/** @file */
#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>

namespace netrel::utils {

/**
 * Lowercase all characters of a string.
 * Transformation is locale independent.
 */
inline std::string ToLowerCase(const std::string_view s) {
  std::string res(s.size(), '\0');
  std::transform(s.begin(), s.end(), res.begin(), [](unsigned char c) { return static_cast<char>(tolower(c)); });
  return res;
}

/**
 * Join the `strings` collection separated by a given separator.
 */
template <class TCollection>
std::string Join(const TCollection &strings, const std::string_view separator) {
  std::string res;
  if (strings.empty()) return res;
  int64_t total_size = 0;
  for (const auto &x : strings) {
    total_size += x.size();
  }
  total_size += separator.size() * (static_cast<int64_t>(strings.size()) - 1);
  res.reserve(total_size);
  auto it = strings.begin();
  res += *it;
  for (++it; it != strings.end(); ++it) {
    res += separator;
    res += *it;
  }
  return res;
}

/** Check if the given string `s` ends with the given `suffix`. */
inline bool EndsWith(const std::string_view s, const std::string_view suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), std::string::npos, suffix) == 0;
}

}  // namespace netrel::utils
