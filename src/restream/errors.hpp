// Copyright (c) Lawrence Livermore National Security, LLC and
// other Restream Project Developers. See the top-level LICENSE file for
// details.
//
// SPDX-License-Identifier: (BSD-3-Clause)

/**
 * @file errors.hpp
 * @brief Recoverable error types reported by buffers and sources.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace restream {

/// @brief A requested range reaches outside the retained window.
class OutOfWindowError : public std::out_of_range {
 public:
  OutOfWindowError(size_t from, size_t to, size_t windowBegin, size_t windowEnd)
      : std::out_of_range("range [" + std::to_string(from) + ", " + std::to_string(to) +
                          ") is outside the retained window [" + std::to_string(windowBegin) + ", " +
                          std::to_string(windowEnd) + ")"),
        from_(from),
        to_(to)
  {
  }

  size_t from() const { return from_; }
  size_t to() const { return to_; }

 private:
  size_t from_;
  size_t to_;
};

/// @brief Retained text could not be converted to the requested value type.
class ParseError : public std::runtime_error {
 public:
  ParseError(const std::string& text, const std::string& typeName)
      : std::runtime_error("cannot parse \"" + text + "\" as " + typeName), text_(text)
  {
  }

  /// @brief The text that failed to parse.
  const std::string& text() const { return text_; }

 private:
  std::string text_;
};

/// @brief The underlying source failed for a reason other than end-of-stream.
class SourceError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace restream
