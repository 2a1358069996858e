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

#include "storage/exceptions.hpp"

#include <fmt/ranges.h>

namespace netrel::storage {

RecordNotFound::RecordNotFound(std::vector<Gid> ids)
    : StorageException("Couldn't find all records with IDs ({})", fmt::join(ids, ", ")), ids_(std::move(ids)) {}

RecordNotFound::RecordNotFound(std::string_view table, std::vector<Gid> ids)
    : StorageException("Couldn't find all {} with IDs ({})", table, fmt::join(ids, ", ")), ids_(std::move(ids)) {}

}  // namespace netrel::storage
