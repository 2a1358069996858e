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

#include <optional>
#include <string>

#include "storage/entity_type.hpp"
#include "storage/filter.hpp"

namespace netrel::network {

/// Declaration of one named network. Empty strings select the defaults.
struct NetworkConfig {
  /// Name of the edge entity (`invites` or `Invite`). Empty for a network
  /// stored in a join table.
  std::string through;
  /// Join table of the network, `<table>_<table>` by default. Not used when
  /// `through` is set.
  std::string join_table;
  /// Column referencing the origin node, the node type's foreign key by
  /// default (`person_id`).
  std::string foreign_key;
  /// Column referencing the target node, `<foreign_key>_target` by default.
  std::string association_foreign_key;
  /// Evaluated on the target nodes of a join table network and on the edges
  /// of a network with an edge entity.
  std::optional<storage::Filter> conditions;
};

/// Returns `config` with every default filled in for node type `type`.
NetworkConfig NormalizeNetworkConfig(const storage::EntityType &type, NetworkConfig config);

/**
 * Declares network `name` on node type `type`.
 *
 * A join table network gets the accessors `<name>_out` and `<name>_in`. A
 * network with an edge entity `<through>` gets the raw edge accessors
 * `<through>_out` and `<through>_in`, their union `<through>` and the node
 * accessors `<name>_out` and `<name>_in`. The raw edge accessors may be shared
 * with other networks over the same edge entity and keys. Both kinds get the
 * union `<name>` of `<name>_out` and `<name>_in`.
 *
 * @code
 * network::DeclareNetwork(person, "friends", {.join_table = "friends", .association_foreign_key = "person_id_friend"});
 * network::DeclareNetwork(person, "colleagues",
 *                         {.through = "invites", .conditions = storage::Filter::Where("is_accepted", true)});
 * @endcode
 *
 * @throw ConfigError if the configuration can't be resolved against the
 * storage of `type`. Nothing is checked later, on use.
 */
void DeclareNetwork(storage::EntityType &type, std::string name, NetworkConfig config = {});

}  // namespace netrel::network
