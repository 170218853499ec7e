// Copyright (c) Lawrence Livermore National Security, LLC and
// other Restream Project Developers. See the top-level LICENSE file for
// details.
//
// SPDX-License-Identifier: (BSD-3-Clause)

#include "parse_value.hpp"
#include <charconv>
#include <system_error>

namespace restream {

namespace {

/// @brief Locale-independent decimal parse. Rejects hex, "nan(...)" payloads and leading whitespace.
template <typename T>
bool parse_floating(std::string_view text, T& out)
{
  if (text.size() > 1 && text.front() == '+' && text[1] != '-' && text[1] != '+') {
    text.remove_prefix(1);
  }
  if (text.empty() || text.find('(') != std::string_view::npos) {
    return false;
  }
  const char* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, out, std::chars_format::general);
  return ec == std::errc() && ptr == end;
}

}  // namespace

bool parse_value(std::string_view text, std::string& out)
{
  out.assign(text.begin(), text.end());
  return true;
}

bool parse_value(std::string_view text, bool& out)
{
  if (text == "true") {
    out = true;
    return true;
  }
  if (text == "false") {
    out = false;
    return true;
  }
  return false;
}

bool parse_value(std::string_view text, char& out)
{
  if (text.size() != 1) {
    return false;
  }
  out = text.front();
  return true;
}

bool parse_value(std::string_view text, float& out) { return parse_floating(text, out); }

bool parse_value(std::string_view text, double& out) { return parse_floating(text, out); }

bool parse_value(std::string_view text, long double& out) { return parse_floating(text, out); }

}  // namespace restream
