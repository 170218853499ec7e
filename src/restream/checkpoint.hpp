// Copyright (c) Lawrence Livermore National Security, LLC and
// other Restream Project Developers. See the top-level LICENSE file for
// details.
//
// SPDX-License-Identifier: (BSD-3-Clause)

/**
 * @file checkpoint.hpp
 */

#pragma once

#include <cassert>
#include <memory>
#include <stdexcept>
#include <string>

#include "checkpoint_registry.hpp"

/// @brief restream_assert that prints line and file info before throwing in release and halting in debug
#define restream_assert(x)                                                                                       \
  if (!(x))                                                                                                      \
    throw std::runtime_error{"Error on line " + std::to_string(__LINE__) + " in file " + std::string(__FILE__)}; \
  assert(x);

/// @brief restream_assert_msg that prints message, line and file info before throwing in release and halting in debug
#define restream_assert_msg(x, msg_name_)                                                                        \
  if (!(x))                                                                                                      \
    throw std::runtime_error{"Error on line " + std::to_string(__LINE__) + " in file " + std::string(__FILE__) + \
                             std::string(", ") + std::string(msg_name_)};                                        \
  assert(x);

namespace restream {

/// @brief Handle pinning one cursor position of a buffer.
///
/// While a handle is live, the buffer that issued it keeps every item from
/// its cursor onwards so that a rewind to it can replay them. Copying a
/// handle registers the cursor again; destroying or releasing it removes one
/// registration. Handles compare equal when their cursors are equal.
class Checkpoint {
 public:
  /// @brief Construct a detached handle that pins nothing.
  Checkpoint() = default;

  /// @brief Register cursor with the registry and hold that registration.
  Checkpoint(std::shared_ptr<CheckpointRegistry> registry, size_t cursor);

  Checkpoint(const Checkpoint& other);
  Checkpoint(Checkpoint&& other) noexcept;
  Checkpoint& operator=(const Checkpoint& other);
  Checkpoint& operator=(Checkpoint&& other) noexcept;
  ~Checkpoint();

  /// @brief Logical position captured by this handle.
  size_t cursor() const { return cursor_; }

  /// @brief True while the handle holds a registration.
  bool live() const { return registry_ != nullptr; }

  /// @brief True if this handle was issued against the given registry.
  bool issued_by(const CheckpointRegistry& registry) const { return registry_.get() == &registry; }

  /// @brief Drop the registration early. The handle becomes detached.
  void release();

 private:
  size_t cursor_ = 0;
  std::shared_ptr<CheckpointRegistry> registry_;
};

inline bool operator==(const Checkpoint& a, const Checkpoint& b) { return a.cursor() == b.cursor(); }

inline bool operator!=(const Checkpoint& a, const Checkpoint& b) { return !(a == b); }

}  // namespace restream
