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

#include <ostream>
#include <string>
#include <vector>

#include "storage/property_value.hpp"

namespace netrel::storage {

/**
 * A predicate over the columns of a single record, evaluated by the storage
 * when a collection is queried. A filter is a conjunction of conditions; an
 * empty filter matches everything.
 *
 * @code
 * auto accepted = Filter::Where("is_accepted", true);
 * auto premium = Filter::Where("package", "premium").And("rating", Filter::Operator::GREATER_EQUAL, 4);
 * @endcode
 */
class Filter final {
 public:
  enum class Operator : uint8_t { EQUAL, NOT_EQUAL, LESS, LESS_EQUAL, GREATER, GREATER_EQUAL };

  struct Condition {
    std::string property;
    Operator op;
    PropertyValue value;
  };

  Filter() = default;

  static Filter Where(std::string property, PropertyValue value) {
    return Filter{}.And(std::move(property), Operator::EQUAL, std::move(value));
  }

  static Filter Where(std::string property, Operator op, PropertyValue value) {
    return Filter{}.And(std::move(property), op, std::move(value));
  }

  Filter &And(std::string property, PropertyValue value) & {
    return And(std::move(property), Operator::EQUAL, std::move(value));
  }

  Filter &And(std::string property, Operator op, PropertyValue value) & {
    conditions_.push_back({std::move(property), op, std::move(value)});
    return *this;
  }

  Filter &&And(std::string property, PropertyValue value) && {
    return std::move(And(std::move(property), Operator::EQUAL, std::move(value)));
  }

  Filter &&And(std::string property, Operator op, PropertyValue value) && {
    conditions_.push_back({std::move(property), op, std::move(value)});
    return std::move(*this);
  }

  /// Appends every condition of `other`.
  Filter &And(const Filter &other) & {
    conditions_.insert(conditions_.end(), other.conditions_.begin(), other.conditions_.end());
    return *this;
  }

  /// Returns true if every condition holds for the given columns. A missing
  /// column reads as Null; ordering operators never hold for Null.
  bool Matches(const PropertyMap &properties) const;

  bool Empty() const { return conditions_.empty(); }

  const std::vector<Condition> &Conditions() const { return conditions_; }

  /// Names of all columns the filter reads, in declaration order.
  std::vector<std::string> Properties() const;

 private:
  std::vector<Condition> conditions_;
};

std::ostream &operator<<(std::ostream &os, Filter::Operator op);
std::ostream &operator<<(std::ostream &os, const Filter &filter);

}  // namespace netrel::storage
