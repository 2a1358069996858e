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

#include "storage/filter.hpp"

#include <algorithm>

namespace netrel::storage {

namespace {
const PropertyValue kNull{};

bool Holds(const Filter::Condition &condition, const PropertyValue &value) {
  using Operator = Filter::Operator;
  switch (condition.op) {
    case Operator::EQUAL:
      return value == condition.value;
    case Operator::NOT_EQUAL:
      return !(value == condition.value);
    case Operator::LESS:
    case Operator::LESS_EQUAL:
    case Operator::GREATER:
    case Operator::GREATER_EQUAL:
      break;
  }

  const auto ordering = Compare(value, condition.value);
  if (!ordering) return false;
  switch (condition.op) {
    case Operator::LESS:
      return *ordering < 0;
    case Operator::LESS_EQUAL:
      return *ordering <= 0;
    case Operator::GREATER:
      return *ordering > 0;
    case Operator::GREATER_EQUAL:
      return *ordering >= 0;
    default:
      return false;
  }
}
}  // namespace

bool Filter::Matches(const PropertyMap &properties) const {
  return std::all_of(conditions_.begin(), conditions_.end(), [&properties](const Condition &condition) {
    auto it = properties.find(condition.property);
    return Holds(condition, it != properties.end() ? it->second : kNull);
  });
}

std::vector<std::string> Filter::Properties() const {
  std::vector<std::string> properties;
  properties.reserve(conditions_.size());
  for (const auto &condition : conditions_) {
    if (std::find(properties.begin(), properties.end(), condition.property) == properties.end()) {
      properties.push_back(condition.property);
    }
  }
  return properties;
}

std::ostream &operator<<(std::ostream &os, const Filter::Operator op) {
  switch (op) {
    case Filter::Operator::EQUAL:
      return os << "=";
    case Filter::Operator::NOT_EQUAL:
      return os << "<>";
    case Filter::Operator::LESS:
      return os << "<";
    case Filter::Operator::LESS_EQUAL:
      return os << "<=";
    case Filter::Operator::GREATER:
      return os << ">";
    case Filter::Operator::GREATER_EQUAL:
      return os << ">=";
  }
  return os;
}

std::ostream &operator<<(std::ostream &os, const Filter &filter) {
  if (filter.Empty()) return os << "TRUE";
  bool first = true;
  for (const auto &condition : filter.Conditions()) {
    if (!first) os << " AND ";
    first = false;
    os << condition.property << " " << condition.op << " ";
    if (condition.value.IsString()) {
      os << "'" << condition.value << "'";
    } else {
      os << condition.value;
    }
  }
  return os;
}

}  // namespace netrel::storage
