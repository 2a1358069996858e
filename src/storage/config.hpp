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

#include <cstdint>

namespace netrel::storage {

/// Pass this class to the @ref Storage constructor to change the behavior of
/// the storage. This class also defines the default behavior.
struct Config {
  struct Items {
    /// Reject writes of properties that are not declared as columns of the
    /// entity type.
    bool strict_columns{true};
  } items;

  struct Ids {
    /// First gid handed out by @ref Storage::Create when no explicit gid is
    /// given.
    int64_t first_gid{1};
  } ids;
};

}  // namespace netrel::storage
