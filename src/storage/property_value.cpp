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

#include "storage/property_value.hpp"

#include "storage/exceptions.hpp"

namespace netrel::storage {

namespace {
double NumericValue(const PropertyValue &value) {
  return value.IsInt() ? static_cast<double>(value.ValueInt()) : value.ValueDouble();
}
}  // namespace

bool PropertyValue::ValueBool() const {
  if (!IsBool()) throw PropertyValueException("Incompatible template param and type");
  return std::get<bool>(value_);
}

int64_t PropertyValue::ValueInt() const {
  if (!IsInt()) throw PropertyValueException("Incompatible template param and type");
  return std::get<int64_t>(value_);
}

double PropertyValue::ValueDouble() const {
  if (!IsDouble()) throw PropertyValueException("Incompatible template param and type");
  return std::get<double>(value_);
}

const std::string &PropertyValue::ValueString() const {
  if (!IsString()) throw PropertyValueException("Incompatible template param and type");
  return std::get<std::string>(value_);
}

std::optional<std::partial_ordering> Compare(const PropertyValue &first, const PropertyValue &second) {
  if (first.IsNull() || second.IsNull()) return std::nullopt;
  if (first.IsInt() && second.IsInt()) return first.ValueInt() <=> second.ValueInt();
  if (first.IsNumeric() && second.IsNumeric()) return NumericValue(first) <=> NumericValue(second);
  if (first.IsString() && second.IsString()) return first.ValueString() <=> second.ValueString();
  if (first.IsBool() && second.IsBool()) return first.ValueBool() <=> second.ValueBool();
  return std::nullopt;
}

bool operator==(const PropertyValue &first, const PropertyValue &second) {
  if (first.IsNull() || second.IsNull()) return first.IsNull() && second.IsNull();
  const auto ordering = Compare(first, second);
  return ordering && *ordering == std::partial_ordering::equivalent;
}

std::ostream &operator<<(std::ostream &os, const PropertyValue::Type type) {
  switch (type) {
    case PropertyValue::Type::Null:
      return os << "null";
    case PropertyValue::Type::Bool:
      return os << "bool";
    case PropertyValue::Type::Int:
      return os << "int";
    case PropertyValue::Type::Double:
      return os << "double";
    case PropertyValue::Type::String:
      return os << "string";
  }
  return os;
}

std::ostream &operator<<(std::ostream &os, const PropertyValue &value) {
  switch (value.type()) {
    case PropertyValue::Type::Null:
      return os << "Null";
    case PropertyValue::Type::Bool:
      return os << (value.ValueBool() ? "true" : "false");
    case PropertyValue::Type::Int:
      return os << value.ValueInt();
    case PropertyValue::Type::Double:
      return os << value.ValueDouble();
    case PropertyValue::Type::String:
      return os << value.ValueString();
  }
  return os;
}

}  // namespace netrel::storage
