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

#include "flags/storage.hpp"

#include <cstdint>
#include <limits>

#include "utils/flag_validation.hpp"

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_bool(storage_strict_columns, netrel::storage::Config::Items().strict_columns,
            "Reject records with properties that are not columns of their entity type.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_int64(storage_first_gid, netrel::storage::Config::Ids().first_gid,
                       "First id given to records created without an explicit id.",
                       FLAG_IN_RANGE(0, std::numeric_limits<int64_t>::max()));

netrel::storage::Config netrel::flags::StorageConfig() {
  return {.items = {.strict_columns = FLAGS_storage_strict_columns}, .ids = {.first_gid = FLAGS_storage_first_gid}};
}
