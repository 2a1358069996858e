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

/**
 * @file
 * @brief Base exception shared by the storage and network modules.
 */
#pragma once

#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace netrel::utils {

/// Overrides @ref BasicException::name with the class name, for log lines
/// such as `ConfigError: ...`.
#define SPECIALIZE_GET_EXCEPTION_NAME(exep) \
  std::string name() const override { return #exep; }

/**
 * Base class of every netrel exception. The message is fixed at construction,
 * either verbatim or through an fmt format string checked at compile time:
 *
 * @code
 * throw SchemaException("{} has no column named '{}'", class_name, column);
 * @endcode
 */
class BasicException : public std::exception {
 public:
  explicit BasicException(std::string_view message) noexcept : msg_(message) {}
  explicit BasicException(const char *message) noexcept : msg_(message) {}
  explicit BasicException(std::string message) noexcept : msg_(std::move(message)) {}

  template <class... Args>
  explicit BasicException(fmt::format_string<Args...> fmt, Args &&...args) noexcept
      : msg_(fmt::format(fmt, std::forward<Args>(args)...)) {}

  ~BasicException() override = default;

  const char *what() const noexcept override { return msg_.c_str(); }

  virtual std::string name() const { return "BasicException"; }

 protected:
  std::string msg_;
};

}  // namespace netrel::utils
