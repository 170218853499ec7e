// Copyright (c) Lawrence Livermore National Security, LLC and
// other Restream Project Developers. See the top-level LICENSE file for
// details.
//
// SPDX-License-Identifier: (BSD-3-Clause)

/**
 * @file window.hpp
 * @brief Storage policies for the retained window of a StreamBuffer.
 *
 * A window policy stores the items between the oldest live checkpoint and
 * the live edge. It must provide drain_front(n), push(item), get(idx) and
 * size(). Index 0 is the oldest retained item.
 */

#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <string_view>

namespace restream {

/// @brief Generic window over a double-ended queue of items.
template <typename Item>
class DequeWindow {
 public:
  using item_type = Item;

  /// @brief Remove n items from the front, or everything if fewer remain.
  void drain_front(size_t n)
  {
    if (n >= items_.size()) {
      items_.clear();
    } else {
      items_.erase(items_.begin(), items_.begin() + static_cast<std::ptrdiff_t>(n));
    }
  }

  void push(const Item& item) { items_.push_back(item); }

  std::optional<Item> get(size_t idx) const
  {
    if (idx >= items_.size()) {
      return std::nullopt;
    }
    return items_[idx];
  }

  size_t size() const { return items_.size(); }

 private:
  std::deque<Item> items_;
};

/// @brief Character window stored as one contiguous string.
///
/// Any retained range can be viewed as text without copying.
class TextWindow {
 public:
  using item_type = char;

  void drain_front(size_t n)
  {
    if (n >= text_.size()) {
      text_.clear();
    } else {
      text_.erase(0, n);
    }
  }

  void push(char c) { text_.push_back(c); }

  std::optional<char> get(size_t idx) const
  {
    if (idx >= text_.size()) {
      return std::nullopt;
    }
    return text_[idx];
  }

  size_t size() const { return text_.size(); }

  /// @brief View of the retained characters in [begin, end). Offsets are window-relative.
  std::string_view view(size_t begin, size_t end) const
  {
    return std::string_view(text_).substr(begin, end - begin);
  }

 private:
  std::string text_;
};

}  // namespace restream
