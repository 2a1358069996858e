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

/// @file
///
/// Convenience macros which define a command line flag together with its
/// validation function. They can only be used in tandem with gflags.
///
/// @code
/// DEFINE_VALIDATED_int64(storage_first_gid, 1, "First generated record id",
///                        FLAG_IN_RANGE(0, std::numeric_limits<int64_t>::max()));
/// @endcode
///
/// The `value` is implicitly bound to the new value of the flag and the name
/// of the flag is implicitly bound to the `flagname` variable.

#include <cstdint>
#include <iostream>
#include <string>

#include "gflags/gflags.h"

/// Defines a flag of given type and registers a validator function generated
/// from `validation_body`. `cpp_type` is the type of the implicitly bound
/// `value`.
#define DEFINE_VALIDATED_FLAG(flag_type, flag_name, default_value, description, cpp_type, validation_body) \
  DEFINE_##flag_type(flag_name, default_value, description);                                               \
  namespace {                                                                                              \
  bool validate_##flag_name(const char *flagname, cpp_type value) validation_body                          \
  }                                                                                                        \
  DEFINE_validator(flag_name, &validate_##flag_name)

#define DEFINE_VALIDATED_int64(flag_name, default_value, description, validation_body) \
  DEFINE_VALIDATED_FLAG(int64, flag_name, default_value, description, std::int64_t, validation_body)

#define DEFINE_VALIDATED_string(flag_name, default_value, description, validation_body) \
  DEFINE_VALIDATED_FLAG(string, flag_name, default_value, description, const std::string &, validation_body)

/// Validation body checking that the value is in [lower_bound, upper_bound].
/// Only for use with the DEFINE_VALIDATED_* macros.
#define FLAG_IN_RANGE(lower_bound, upper_bound)                                                                \
  {                                                                                                            \
    if (value >= lower_bound && value <= upper_bound) return true;                                             \
    std::cout << "Expected --" << flagname << " to be in range [" << lower_bound << ", " << upper_bound << "]" \
              << std::endl;                                                                                    \
    return false;                                                                                              \
  }

/// Validation body rejecting empty strings.
#define FLAG_NOT_EMPTY                                                       \
  {                                                                          \
    if (!value.empty()) return true;                                         \
    std::cout << "Expected --" << flagname << " not to be empty" << std::endl; \
    return false;                                                            \
  }
