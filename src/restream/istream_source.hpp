// Copyright (c) Lawrence Livermore National Security, LLC and
// other Restream Project Developers. See the top-level LICENSE file for
// details.
//
// SPDX-License-Identifier: (BSD-3-Clause)

/**
 * @file istream_source.hpp
 * @brief Character source reading unbuffered from a std::istream.
 */

#pragma once

#include <istream>
#include <memory>

#include "source.hpp"

namespace restream {

/// @brief Yields characters from a std::istream one at a time.
///
/// The stream is borrowed and must outlive the source. End-of-file ends the
/// sequence; any other stream failure throws SourceError.
class IstreamSource final : public Source<char> {
 public:
  explicit IstreamSource(std::istream& in) : in_(in) {}

  std::optional<char> next() override;

 private:
  std::istream& in_;
};

/// @brief Create a character source over a borrowed stream.
std::unique_ptr<Source<char>> make_istream_source(std::istream& in);

}  // namespace restream
