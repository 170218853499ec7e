// Copyright (c) Lawrence Livermore National Security, LLC and
// other Restream Project Developers. See the top-level LICENSE file for
// details.
//
// SPDX-License-Identifier: (BSD-3-Clause)

/**
 * @file checkpoint_registry.hpp
 * @brief Ordered multiset of the cursors pinned by live checkpoints.
 */

#pragma once

#include <cstddef>
#include <ostream>
#include <set>

namespace restream {

/// @brief Counters for the checkpoint lifecycle.
struct RegistryMetrics {
  size_t registrations = 0;  ///< Number of cursor registrations (issue + copy)
  size_t releases = 0;       ///< Number of cursor releases
  size_t peakLive = 0;       ///< Largest number of simultaneously live entries
};

/// @brief Ascending multiset of cursor values, one entry per live checkpoint.
///
/// Shared between a buffer and every checkpoint handle it issued. The buffer
/// reads the smallest entry to decide how much of its window can be evicted;
/// the handles add and remove their own entries.
class CheckpointRegistry {
 public:
  CheckpointRegistry() = default;

  CheckpointRegistry(const CheckpointRegistry&) = delete;
  CheckpointRegistry& operator=(const CheckpointRegistry&) = delete;

  /// @brief Add one entry for the given cursor. Duplicates are allowed.
  void register_cursor(size_t cursor);

  /// @brief Remove exactly one entry equal to cursor.
  /// An absent entry means a handle was released twice and is fatal.
  void unregister_cursor(size_t cursor);

  /// @brief Return the smallest live cursor, or fallback when none is live.
  size_t first_or(size_t fallback) const;

  bool empty() const { return cursors_.empty(); }

  size_t size() const { return cursors_.size(); }

  /// @brief Number of live checkpoints at exactly this cursor.
  size_t count(size_t cursor) const { return cursors_.count(cursor); }

  RegistryMetrics metrics() const { return metrics_; }

  void reset_metrics() { metrics_ = {}; }

  /// @brief Print live cursors to the output stream.
  void print(std::ostream& os) const;

 private:
  std::multiset<size_t> cursors_;
  RegistryMetrics metrics_;
};

/// @brief ostream operator for CheckpointRegistry
inline std::ostream& operator<<(std::ostream& os, const CheckpointRegistry& r)
{
  r.print(os);
  return os;
}

}  // namespace restream
