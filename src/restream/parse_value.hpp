// Copyright (c) Lawrence Livermore National Security, LLC and
// other Restream Project Developers. See the top-level LICENSE file for
// details.
//
// SPDX-License-Identifier: (BSD-3-Clause)

/**
 * @file parse_value.hpp
 * @brief Conversions from retained text to values.
 *
 * Every overload requires the whole text to be consumed; "12ab" is not an
 * integer. Each returns false and leaves out unspecified on failure.
 */

#pragma once

#include <charconv>
#include <string>
#include <string_view>
#include <type_traits>

namespace restream {

bool parse_value(std::string_view text, std::string& out);

/// @brief Accepts exactly "true" or "false".
bool parse_value(std::string_view text, bool& out);

/// @brief Accepts exactly one character.
bool parse_value(std::string_view text, char& out);

bool parse_value(std::string_view text, float& out);
bool parse_value(std::string_view text, double& out);
bool parse_value(std::string_view text, long double& out);

/// @brief Decimal integers with an optional leading sign.
template <typename T>
std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool> && !std::is_same_v<T, char>, bool> parse_value(
    std::string_view text, T& out)
{
  if (text.size() > 1 && text.front() == '+' && text[1] != '-') {
    text.remove_prefix(1);
  }
  if (text.empty()) {
    return false;
  }
  const char* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, out);
  return ec == std::errc() && ptr == end;
}

/// @brief Human-readable type name used in ParseError messages.
template <typename T>
std::string value_type_name()
{
  if constexpr (std::is_same_v<T, std::string>) {
    return "string";
  } else if constexpr (std::is_same_v<T, bool>) {
    return "bool";
  } else if constexpr (std::is_same_v<T, char>) {
    return "char";
  } else if constexpr (std::is_floating_point_v<T>) {
    return "floating point (" + std::to_string(sizeof(T) * 8) + " bit)";
  } else if constexpr (std::is_signed_v<T>) {
    return "signed integer (" + std::to_string(sizeof(T) * 8) + " bit)";
  } else {
    return "unsigned integer (" + std::to_string(sizeof(T) * 8) + " bit)";
  }
}

}  // namespace restream
