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

#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>

#include "storage/id_types.hpp"

namespace netrel::storage {

/**
 * Encapsulation of a value and its type in a class that has no compile-time
 * info about that type.
 *
 * Values can be of a number of predefined types that are enumerated in
 * PropertyValue::Type. Each such type corresponds to exactly one C++ type.
 */
class PropertyValue {
 public:
  /** A value type. Each type corresponds to exactly one C++ type */
  enum class Type : uint8_t { Null, Bool, Int, Double, String };

  /** Makes a Null value. */
  PropertyValue() = default;

  // constructors for primitive types
  PropertyValue(bool value) : value_(value) {}
  PropertyValue(int value) : value_(static_cast<int64_t>(value)) {}
  PropertyValue(int64_t value) : value_(value) {}
  PropertyValue(double value) : value_(value) {}
  /// Foreign key columns hold the referenced record's gid as an integer.
  PropertyValue(Gid value) : value_(value.AsInt()) {}

  // constructors for non-primitive types
  PropertyValue(const std::string &value) : value_(value) {}
  PropertyValue(std::string &&value) noexcept : value_(std::move(value)) {}
  PropertyValue(const char *value) : value_(std::string{value}) {}
  PropertyValue(std::string_view value) : value_(std::string{value}) {}

  Type type() const { return static_cast<Type>(value_.index()); }

  bool IsNull() const { return type() == Type::Null; }
  bool IsBool() const { return type() == Type::Bool; }
  bool IsInt() const { return type() == Type::Int; }
  bool IsDouble() const { return type() == Type::Double; }
  bool IsString() const { return type() == Type::String; }
  bool IsNumeric() const { return IsInt() || IsDouble(); }

  /// @throw PropertyValueException if the value is not a Bool.
  bool ValueBool() const;
  /// @throw PropertyValueException if the value is not an Int.
  int64_t ValueInt() const;
  /// @throw PropertyValueException if the value is not a Double.
  double ValueDouble() const;
  /// @throw PropertyValueException if the value is not a String.
  const std::string &ValueString() const;

  /// Reads an Int value as a record id.
  /// @throw PropertyValueException if the value is not an Int.
  Gid ValueGid() const { return Gid::FromInt(ValueInt()); }

  /**
   * Orders two values of compatible types (numbers with numbers, strings with
   * strings, bools with bools). Returns std::nullopt for incompatible types
   * and whenever one of the values is Null.
   */
  friend std::optional<std::partial_ordering> Compare(const PropertyValue &first, const PropertyValue &second);

  /// Structural equality. Int and Double compare by numeric value, Null
  /// equals only Null.
  friend bool operator==(const PropertyValue &first, const PropertyValue &second);

  friend std::ostream &operator<<(std::ostream &os, const PropertyValue &value);

 private:
  std::variant<std::monostate, bool, int64_t, double, std::string> value_;
};

std::ostream &operator<<(std::ostream &os, PropertyValue::Type type);

/// Column name to value. Columns that are absent read as Null.
using PropertyMap = std::map<std::string, PropertyValue, std::less<>>;

}  // namespace netrel::storage
