// Copyright (c) Lawrence Livermore National Security, LLC and
// other Restream Project Developers. See the top-level LICENSE file for
// details.
//
// SPDX-License-Identifier: (BSD-3-Clause)

#include "checkpoint_registry.hpp"
#include "checkpoint.hpp"
#include <algorithm>

namespace restream {

void CheckpointRegistry::register_cursor(size_t cursor)
{
  cursors_.insert(cursor);
  metrics_.registrations++;
  metrics_.peakLive = std::max(metrics_.peakLive, cursors_.size());
}

void CheckpointRegistry::unregister_cursor(size_t cursor)
{
  auto it = cursors_.find(cursor);
  restream_assert_msg(it != cursors_.end(), "missing registry entry for checkpoint at cursor " + std::to_string(cursor));
  cursors_.erase(it);
  metrics_.releases++;
}

size_t CheckpointRegistry::first_or(size_t fallback) const
{
  if (cursors_.empty()) {
    return fallback;
  }
  return *cursors_.begin();
}

void CheckpointRegistry::print(std::ostream& os) const
{
  os << "CHECKPOINTS: live = " << cursors_.size() << std::endl;
  for (auto it = cursors_.begin(); it != cursors_.end(); it = cursors_.upper_bound(*it)) {
    size_t n = cursors_.count(*it);
    os << "   cursor=" << *it;
    if (n > 1) {
      os << " (x" << n << ")";
    }
    os << "\n";
  }
}

}  // namespace restream
