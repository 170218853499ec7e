// Copyright (c) Lawrence Livermore National Security, LLC and
// other Restream Project Developers. See the top-level LICENSE file for
// details.
//
// SPDX-License-Identifier: (BSD-3-Clause)

/**
 * @file token_stream.hpp
 * @brief Abstract cursor-addressed token source that parsers are written against.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "checkpoint.hpp"

namespace restream {

/// @brief Cursor-addressed, rewindable view of a sequence of items.
///
/// Exposes only what a parser needs: read forward, remember a position,
/// go back to it, and copy out a range between two remembered positions.
template <typename Item>
class TokenStream {
 public:
  using item_type = Item;

  virtual ~TokenStream() = default;

  /// @brief Return the item at the cursor and advance, or std::nullopt at end-of-stream.
  virtual std::optional<Item> read_next() = 0;

  /// @brief Pin the current cursor. Items from here on stay replayable while the handle lives.
  virtual Checkpoint checkpoint() = 0;

  /// @brief Move the cursor back (or forward) to a live checkpoint.
  virtual void rewind(const Checkpoint& to) = 0;

  /// @brief True if the cursor equals the checkpoint's cursor.
  virtual bool is_at(const Checkpoint& location) const = 0;

  /// @brief Copy of the items in [from, to).
  virtual std::vector<Item> slice(const Checkpoint& from, const Checkpoint& to) const = 0;

  /// @brief Current logical position.
  virtual size_t cursor() const = 0;
};

/// @brief Run body with a checkpoint held at the current position.
///
/// body receives the stream and returns a std::optional. If it returns an
/// empty optional, or throws, the cursor is put back where it was before the
/// call. The checkpoint is released on every exit path.
template <typename Item, typename Body>
auto attempt(TokenStream<Item>& tokens, Body&& body) -> decltype(body(tokens))
{
  Checkpoint start = tokens.checkpoint();
  try {
    auto result = body(tokens);
    if (!result) {
      tokens.rewind(start);
    }
    return result;
  } catch (...) {
    tokens.rewind(start);
    throw;
  }
}

}  // namespace restream
