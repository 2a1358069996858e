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

#include <string>
#include <vector>

#include "storage/id_types.hpp"
#include "utils/exceptions.hpp"

namespace netrel::storage {

/**
 * Base class of every error raised by the record store. Errors of this kind
 * are propagated unchanged through collections and union views.
 */
class StorageException : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(StorageException)
};

/**
 * Raised by id lookups that could not resolve every requested id. Carries the
 * full list of requested ids, not only the missing ones.
 */
class RecordNotFound : public StorageException {
 public:
  explicit RecordNotFound(std::vector<Gid> ids);
  RecordNotFound(std::string_view table, std::vector<Gid> ids);

  const std::vector<Gid> &Ids() const { return ids_; }

  SPECIALIZE_GET_EXCEPTION_NAME(RecordNotFound)

 private:
  std::vector<Gid> ids_;
};

/**
 * Misuse of the schema: unknown entity types, tables or accessors, writes to
 * undeclared columns and duplicate declarations.
 */
class SchemaException : public StorageException {
 public:
  using StorageException::StorageException;
  SPECIALIZE_GET_EXCEPTION_NAME(SchemaException)
};

/// Raised when pushing a record into an association that cannot create rows.
class ReadOnlyAssociation : public StorageException {
 public:
  using StorageException::StorageException;
  SPECIALIZE_GET_EXCEPTION_NAME(ReadOnlyAssociation)
};

/**
 * An exception raised by the PropertyValue system. Typically when trying to
 * read a value as a type it does not hold.
 */
class PropertyValueException : public StorageException {
 public:
  using StorageException::StorageException;
  SPECIALIZE_GET_EXCEPTION_NAME(PropertyValueException)
};

}  // namespace netrel::storage
