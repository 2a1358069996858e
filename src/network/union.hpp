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

#include "storage/entity_type.hpp"

namespace netrel::network {

/**
 * Declares the accessor `name` on `type`. Every call of the accessor
 * evaluates the accessors listed in `sources` on the calling record and
 * returns a fresh UnionView over their results, so the view always reflects
 * the current state of the storage. Sources may be union accessors too.
 *
 * @throw ConfigError if `name` is empty or taken, or if a source is not an
 * accessor of `type`.
 */
void DeclareUnion(storage::EntityType &type, std::string name, std::vector<std::string> sources);

}  // namespace netrel::network
