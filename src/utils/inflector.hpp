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

/// @file
///
/// English inflection helpers used to derive table and key names from entity
/// class names, e.g. `Person` -> `people` (table) and `person_id` (foreign
/// key). Only the last word of an underscored name is inflected, so
/// `InviteRequest` tableizes to `invite_requests`.
#pragma once

#include <string>
#include <string_view>

namespace netrel::utils {

/** `InviteRequest` -> `invite_request`. Already underscored input is returned lowercased. */
std::string Underscore(std::string_view word);

/** `invite_request` -> `InviteRequest`. */
std::string Camelize(std::string_view word);

/** `person` -> `people`, `invite` -> `invites`, `category` -> `categories`. */
std::string Pluralize(std::string_view word);

/** Inverse of @c Pluralize. */
std::string Singularize(std::string_view word);

/** Class name to table name: `Person` -> `people`. */
inline std::string Tableize(std::string_view class_name) { return Pluralize(Underscore(class_name)); }

/** Table name to class name: `invites` -> `Invite`. */
inline std::string Classify(std::string_view table_name) { return Camelize(Singularize(table_name)); }

/** Class name to foreign key column: `Person` -> `person_id`. */
inline std::string ForeignKey(std::string_view class_name) { return Underscore(class_name) + "_id"; }

}  // namespace netrel::utils
