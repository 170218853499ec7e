// Copyright (c) Lawrence Livermore National Security, LLC and
// other Restream Project Developers. See the top-level LICENSE file for
// details.
//
// SPDX-License-Identifier: (BSD-3-Clause)

#include "checkpoint.hpp"
#include <utility>

namespace restream {

Checkpoint::Checkpoint(std::shared_ptr<CheckpointRegistry> registry, size_t cursor)
    : cursor_(cursor), registry_(std::move(registry))
{
  restream_assert_msg(registry_, "checkpoint requires a registry");
  registry_->register_cursor(cursor_);
}

Checkpoint::Checkpoint(const Checkpoint& other) : cursor_(other.cursor_), registry_(other.registry_)
{
  if (registry_) {
    registry_->register_cursor(cursor_);
  }
}

Checkpoint::Checkpoint(Checkpoint&& other) noexcept : cursor_(other.cursor_), registry_(std::move(other.registry_))
{
  other.registry_.reset();
}

Checkpoint& Checkpoint::operator=(const Checkpoint& other)
{
  if (this != &other) {
    // register first so self-aliasing cursors never drop to zero
    if (other.registry_) {
      other.registry_->register_cursor(other.cursor_);
    }
    release();
    cursor_ = other.cursor_;
    registry_ = other.registry_;
  }
  return *this;
}

Checkpoint& Checkpoint::operator=(Checkpoint&& other) noexcept
{
  if (this != &other) {
    release();
    cursor_ = other.cursor_;
    registry_ = std::move(other.registry_);
    other.registry_.reset();
  }
  return *this;
}

Checkpoint::~Checkpoint() { release(); }

void Checkpoint::release()
{
  if (registry_) {
    std::shared_ptr<CheckpointRegistry> registry = std::move(registry_);
    registry_.reset();
    registry->unregister_cursor(cursor_);
  }
}

}  // namespace restream
