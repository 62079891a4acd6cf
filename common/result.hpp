/* File: result.hpp
Copyright (C) Basealt LLC,  2024
Author: Oleg Proskurin, <proskurinov@basealt.ru>

This program is free software; you can redistribute it and/or
modify it under the terms of the GNU Lesser General Public
License as published by the Free Software Foundation; either
version 3 of the License, or (at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
Lesser General Public License for more details.

You should have received a copy of the GNU Lesser General Public License
along with this program; if not, write to the Free Software Foundation,
Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.
*/

#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace pdfjpg {

enum class ErrorKind : int {
  kInvalidInput,
  kFetchFailed,
  kDecodeFailed,
  kRenderFailed,
  kArchiveFailed,
  kInternal
};

constexpr const char *ErrorKindName(ErrorKind kind) noexcept {
  switch (kind) {
  case ErrorKind::kInvalidInput:
    return "InvalidInput";
  case ErrorKind::kFetchFailed:
    return "FetchFailed";
  case ErrorKind::kDecodeFailed:
    return "DecodeFailed";
  case ErrorKind::kRenderFailed:
    return "RenderFailed";
  case ErrorKind::kArchiveFailed:
    return "ArchiveFailed";
  case ErrorKind::kInternal:
    return "Internal";
  }
  return "Unknown";
}

struct Failure {
  ErrorKind kind = ErrorKind::kInternal;
  std::string message;
};

/**
 * @brief Value of type T or a Failure
 * @tparam T value type, must not be Failure
 */
template <typename T> class Result {
public:
  // NOLINTNEXTLINE(google-explicit-constructor,hicpp-explicit-conversions)
  Result(T value) : data_(std::move(value)) {}
  // NOLINTNEXTLINE(google-explicit-constructor,hicpp-explicit-conversions)
  Result(Failure failure) : data_(std::move(failure)) {}

  [[nodiscard]] bool Ok() const noexcept {
    return std::holds_alternative<T>(data_);
  }
  explicit operator bool() const noexcept { return Ok(); }

  /**
   * @brief Access the value
   * @throws std::logic_error if the result holds a failure
   */
  [[nodiscard]] T &Value() {
    if (!Ok()) {
      throw std::logic_error("[Result] value access on failure: " +
                             Error().message);
    }
    return std::get<T>(data_);
  }

  [[nodiscard]] const T &Value() const {
    if (!Ok()) {
      throw std::logic_error("[Result] value access on failure: " +
                             Error().message);
    }
    return std::get<T>(data_);
  }

  /**
   * @brief Access the failure
   * @throws std::logic_error if the result holds a value
   */
  [[nodiscard]] const Failure &Error() const {
    if (Ok()) {
      throw std::logic_error("[Result] failure access on value");
    }
    return std::get<Failure>(data_);
  }

private:
  std::variant<T, Failure> data_;
};

/// success marker for operations without a value
struct Done {};

inline Failure MakeFailure(ErrorKind kind, std::string message) {
  return Failure{kind, std::move(message)};
}

} // namespace pdfjpg
