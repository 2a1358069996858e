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

#include <memory>
#include <ostream>
#include <string>
#include <string_view>

#include "storage/exceptions.hpp"
#include "storage/id_types.hpp"
#include "storage/property_value.hpp"

namespace netrel::storage {

class Collection;
class Storage;

/**
 * A snapshot of one row of an entity table together with the storage it was
 * read from.
 *
 * Records are plain values: changing a property only changes this copy until
 * @ref Save is called, and a record does not see changes made through other
 * copies until @ref Reload is called. Relations reached through @ref Relation
 * are always evaluated against the current contents of the storage.
 *
 * Two records are equal when they belong to the same table and have the same
 * gid, regardless of their properties.
 */
class Record final {
 public:
  Record(Storage *storage, std::string table, Gid gid, PropertyMap properties)
      : storage_(storage), table_(std::move(table)), gid_(gid), properties_(std::move(properties)) {}

  /// A record that is not attached to any storage. Relations and persistence
  /// calls on it throw StorageException.
  Record(std::string table, Gid gid, PropertyMap properties = {})
      : Record(nullptr, std::move(table), gid, std::move(properties)) {}

  Gid gid() const { return gid_; }

  /// Name of the table the record belongs to.
  const std::string &table() const { return table_; }

  Storage *storage() const { return storage_; }

  /// Returns Null for columns that are not set.
  const PropertyValue &GetProperty(std::string_view property) const;

  void SetProperty(std::string_view property, PropertyValue value);

  const PropertyMap &Properties() const { return properties_; }

  /// Writes the properties of this copy back to the storage.
  void Save() const;

  /// Replaces the properties of this copy with the ones in storage.
  /// @throw RecordNotFound if the record was deleted.
  void Reload();

  /**
   * Evaluates the named accessor of this record's entity type and returns a
   * fresh collection. The accessor may legitimately return nullptr.
   *
   * @throw SchemaException if the entity type has no such accessor.
   */
  std::shared_ptr<Collection> Relation(std::string_view name) const;

  /**
   * Same as @ref Relation, with the collection cast to the concrete type
   * that the accessor is known to produce, e.g. network::UnionView for a
   * union accessor.
   *
   * @throw SchemaException if the accessor produced a different type.
   */
  template <class TCollection>
  std::shared_ptr<TCollection> RelationAs(std::string_view name) const {
    auto collection = Relation(name);
    if (!collection) return nullptr;
    auto typed = std::dynamic_pointer_cast<TCollection>(std::move(collection));
    if (!typed) {
      throw SchemaException("Relation '{}' of {} has an unexpected collection type", name, table_);
    }
    return typed;
  }

  friend bool operator==(const Record &first, const Record &second) {
    return first.gid_ == second.gid_ && first.table_ == second.table_;
  }

 private:
  Storage &AttachedStorage() const;

  Storage *storage_;
  std::string table_;
  Gid gid_;
  PropertyMap properties_;
};

std::ostream &operator<<(std::ostream &os, const Record &record);

}  // namespace netrel::storage
