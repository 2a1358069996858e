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

#include "storage/record.hpp"

#include "storage/collection.hpp"
#include "storage/entity_type.hpp"
#include "storage/storage.hpp"

namespace netrel::storage {

namespace {
const PropertyValue kNull{};
}  // namespace

const PropertyValue &Record::GetProperty(std::string_view property) const {
  auto it = properties_.find(property);
  if (it == properties_.end()) return kNull;
  return it->second;
}

void Record::SetProperty(std::string_view property, PropertyValue value) {
  auto it = properties_.find(property);
  if (it == properties_.end()) {
    properties_.emplace(std::string{property}, std::move(value));
  } else {
    it->second = std::move(value);
  }
}

void Record::Save() const { AttachedStorage().Save(*this); }

void Record::Reload() { properties_ = AttachedStorage().Find(table_, gid_).Properties(); }

std::shared_ptr<Collection> Record::Relation(std::string_view name) const {
  const auto &type = AttachedStorage().GetEntityType(table_);
  const auto *accessor = type.FindAccessor(name);
  if (!accessor) {
    throw SchemaException("{} has no relation named '{}'", type.ClassName(), name);
  }
  return accessor->factory(*this);
}

Storage &Record::AttachedStorage() const {
  if (!storage_) {
    throw StorageException("Record {} of {} is not attached to a storage", gid_, table_);
  }
  return *storage_;
}

std::ostream &operator<<(std::ostream &os, const Record &record) {
  return os << record.table() << "#" << record.gid().AsInt();
}

}  // namespace netrel::storage
