// Copyright (c) Lawrence Livermore National Security, LLC and
// other Restream Project Developers. See the top-level LICENSE file for
// details.
//
// SPDX-License-Identifier: (BSD-3-Clause)

/**
 * @file text_buffer.hpp
 * @brief Rewindable character buffer that parses values straight out of its window.
 *
 * Same cursor, checkpoint and eviction behaviour as StreamBuffer<char>, but
 * retained characters live in one contiguous string. A parsed range is
 * handed to parse_value as a std::string_view, so no intermediate string is
 * built from individual characters.
 */

#pragma once

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "checkpoint.hpp"
#include "errors.hpp"
#include "parse_value.hpp"
#include "source.hpp"
#include "stream_buffer.hpp"
#include "token_stream.hpp"
#include "window.hpp"

namespace restream {

class TextBuffer final : public TokenStream<char> {
 public:
  explicit TextBuffer(std::unique_ptr<Source<char>> source);

  std::optional<char> read_next() override;
  Checkpoint checkpoint() override;
  void rewind(const Checkpoint& to) override;
  bool is_at(const Checkpoint& location) const override;
  std::vector<char> slice(const Checkpoint& from, const Checkpoint& to) const override;
  size_t cursor() const override;

  /// @brief Retained text in [from, to). Invalidated by the next read.
  /// @throws OutOfWindowError if the range is not fully retained.
  std::string_view text(const Checkpoint& from, const Checkpoint& to) const;

  /// @brief Read the rest of the source and parse everything from the cursor to the end.
  /// @throws ParseError on failure, with the cursor restored.
  template <typename T>
  T parse_remaining()
  {
    Checkpoint from = checkpoint();
    consume_remaining();
    return parse_consumed<T>(from);
  }

  /// @brief Consume up to count characters and parse them.
  /// @throws ParseError on failure, with the cursor restored.
  template <typename T>
  T parse_prefix(size_t count)
  {
    Checkpoint from = checkpoint();
    for (size_t i = 0; i < count && buffer_.read_next(); ++i) {
    }
    return parse_consumed<T>(from);
  }

  /// @brief Consume characters while pred holds and parse them.
  /// The first character rejected by pred is left unread.
  /// @throws ParseError on failure, or whatever pred throws, with the cursor restored.
  template <typename T, typename Predicate,
            typename = std::enable_if_t<std::is_invocable_r_v<bool, Predicate&, char>>>
  T parse_prefix(Predicate pred)
  {
    Checkpoint from = checkpoint();
    try {
      while (true) {
        Checkpoint before = checkpoint();
        std::optional<char> c = buffer_.read_next();
        if (!c) {
          break;
        }
        if (!pred(*c)) {
          buffer_.rewind(before);
          break;
        }
      }
    } catch (...) {
      buffer_.rewind(from);
      throw;
    }
    return parse_consumed<T>(from);
  }

  /// @brief Parse a retained range without moving the cursor.
  /// @throws OutOfWindowError or ParseError.
  template <typename T>
  T parse_slice(const Checkpoint& from, const Checkpoint& to) const
  {
    std::string_view range = text(from, to);
    T value{};
    if (!parse_value(range, value)) {
      throw ParseError(std::string(range), value_type_name<T>());
    }
    return value;
  }

  size_t window_begin() const { return buffer_.window_begin(); }
  size_t window_size() const { return buffer_.window_size(); }
  size_t live_checkpoints() const { return buffer_.live_checkpoints(); }
  bool exhausted() const { return buffer_.exhausted(); }
  BufferMetrics metrics() const { return buffer_.metrics(); }
  void reset_metrics() { buffer_.reset_metrics(); }

  void print(std::ostream& os) const;

 private:
  /// @brief Pull from the source until end-of-stream.
  void consume_remaining();

  /// @brief Parse [from, cursor); on failure rewind to from and throw.
  template <typename T>
  T parse_consumed(const Checkpoint& from)
  {
    std::pair<size_t, size_t> range = buffer_.window_offsets(from.cursor(), buffer_.cursor());
    std::string_view consumed = buffer_.window().view(range.first, range.second);
    T value{};
    if (!parse_value(consumed, value)) {
      std::string failed(consumed);
      buffer_.rewind(from);
      throw ParseError(failed, value_type_name<T>());
    }
    return value;
  }

  StreamBuffer<char, TextWindow> buffer_;
};

/// @brief ostream operator for TextBuffer
inline std::ostream& operator<<(std::ostream& os, const TextBuffer& b)
{
  b.print(os);
  return os;
}

}  // namespace restream
