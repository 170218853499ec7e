// Copyright (c) Lawrence Livermore National Security, LLC and
// other Restream Project Developers. See the top-level LICENSE file for
// details.
//
// SPDX-License-Identifier: (BSD-3-Clause)

/**
 * @file stream_buffer.hpp
 * @brief Rewindable cursor buffer over a one-shot source.
 *
 * Only the items between the oldest live checkpoint and the live edge are
 * kept. Memory for items that no checkpoint can reach any more is reclaimed
 * lazily, the next time a read has to pull from the source.
 */

#pragma once

#include <algorithm>
#include <memory>
#include <ostream>
#include <utility>

#include "checkpoint.hpp"
#include "checkpoint_registry.hpp"
#include "errors.hpp"
#include "source.hpp"
#include "token_stream.hpp"
#include "window.hpp"

namespace restream {

/// @brief Performance counters for a StreamBuffer.
struct BufferMetrics {
  size_t pulls = 0;       ///< Calls made to the source (including the one that saw end-of-stream)
  size_t replays = 0;     ///< Items served from the window after a rewind
  size_t retained = 0;    ///< Items appended to the window
  size_t evicted = 0;     ///< Items dropped from the window
  size_t peakWindow = 0;  ///< Largest window size observed
};

/// @brief Presents a one-shot Source as a rewindable TokenStream.
/// @tparam Item type of each item; must be copyable
/// @tparam Window storage policy for retained items (see window.hpp)
template <typename Item, typename Window = DequeWindow<Item>>
class StreamBuffer final : public TokenStream<Item> {
 public:
  using window_type = Window;

  /// @brief Take ownership of source. The caller must not pull from it afterwards.
  explicit StreamBuffer(std::unique_ptr<Source<Item>> source)
      : source_(std::move(source)), registry_(std::make_shared<CheckpointRegistry>())
  {
    restream_assert_msg(source_, "stream buffer requires a source");
  }

  std::optional<Item> read_next() override
  {
    size_t offset = cursor_ - windowBegin_;
    if (offset < window_.size()) {
      ++cursor_;
      metrics_.replays++;
      return window_.get(offset);
    }

    evict();

    if (exhausted_) {
      return std::nullopt;
    }
    metrics_.pulls++;
    std::optional<Item> item = source_->next();
    if (!item) {
      exhausted_ = true;
      return std::nullopt;
    }
    ++cursor_;

    // nothing can rewind to this item unless a checkpoint is live
    if (registry_->empty()) {
      windowBegin_ = cursor_;
    } else {
      window_.push(*item);
      metrics_.retained++;
      metrics_.peakWindow = std::max(metrics_.peakWindow, window_.size());
    }
    return item;
  }

  Checkpoint checkpoint() override { return Checkpoint(registry_, cursor_); }

  void rewind(const Checkpoint& to) override
  {
    check_owned(to);
    restream_assert_msg(to.cursor() >= windowBegin_, "checkpoint cursor precedes the retained window");
    cursor_ = to.cursor();
  }

  bool is_at(const Checkpoint& location) const override { return cursor_ == location.cursor(); }

  std::vector<Item> slice(const Checkpoint& from, const Checkpoint& to) const override
  {
    std::pair<size_t, size_t> range = window_offsets(from.cursor(), to.cursor());
    std::vector<Item> items;
    items.reserve(range.second - range.first);
    for (size_t i = range.first; i < range.second; ++i) {
      items.push_back(*window_.get(i));
    }
    return items;
  }

  size_t cursor() const override { return cursor_; }

  /// @brief Cursor of the oldest retained item.
  size_t window_begin() const { return windowBegin_; }

  size_t window_size() const { return window_.size(); }

  /// @brief Number of checkpoints currently pinning this buffer.
  size_t live_checkpoints() const { return registry_->size(); }

  /// @brief True once the source has reported end-of-stream.
  bool exhausted() const { return exhausted_; }

  const Window& window() const { return window_; }

  /// @brief Translate the logical range [from, to) to window offsets.
  /// @throws OutOfWindowError if the range is reversed or not fully retained.
  std::pair<size_t, size_t> window_offsets(size_t from, size_t to) const
  {
    size_t windowEnd = windowBegin_ + window_.size();
    if (from > to || from < windowBegin_ || to > windowEnd) {
      throw OutOfWindowError(from, to, windowBegin_, windowEnd);
    }
    return {from - windowBegin_, to - windowBegin_};
  }

  BufferMetrics metrics() const { return metrics_; }

  RegistryMetrics registry_metrics() const { return registry_->metrics(); }

  void reset_metrics()
  {
    metrics_ = {};
    registry_->reset_metrics();
  }

  void print(std::ostream& os) const
  {
    os << "STREAM BUFFER: cursor = " << cursor_ << ", window = [" << windowBegin_ << ", "
       << windowBegin_ + window_.size() << ")" << (exhausted_ ? " (exhausted)" : "") << std::endl;
    registry_->print(os);
  }

 private:
  /// @brief Drop everything before the oldest live checkpoint (or the cursor if none).
  void evict()
  {
    size_t floor = std::min(registry_->first_or(cursor_), cursor_);
    if (floor <= windowBegin_) {
      return;
    }
    size_t dropped = std::min(floor - windowBegin_, window_.size());
    window_.drain_front(floor - windowBegin_);
    metrics_.evicted += dropped;
    windowBegin_ = floor;
  }

  void check_owned(const Checkpoint& cp) const
  {
    restream_assert_msg(cp.live(), "checkpoint was released or moved from");
    restream_assert_msg(cp.issued_by(*registry_), "checkpoint was issued by a different buffer");
  }

  std::unique_ptr<Source<Item>> source_;
  std::shared_ptr<CheckpointRegistry> registry_;
  Window window_;
  size_t windowBegin_ = 0;
  size_t cursor_ = 0;
  bool exhausted_ = false;
  BufferMetrics metrics_;
};

/// @brief ostream operator for StreamBuffer
template <typename Item, typename Window>
std::ostream& operator<<(std::ostream& os, const StreamBuffer<Item, Window>& b)
{
  b.print(os);
  return os;
}

/// @brief Convenience constructor deducing Item from the source.
template <typename Item>
StreamBuffer<Item> make_stream_buffer(std::unique_ptr<Source<Item>> source)
{
  return StreamBuffer<Item>(std::move(source));
}

}  // namespace restream
