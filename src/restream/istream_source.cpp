// Copyright (c) Lawrence Livermore National Security, LLC and
// other Restream Project Developers. See the top-level LICENSE file for
// details.
//
// SPDX-License-Identifier: (BSD-3-Clause)

#include "istream_source.hpp"
#include "errors.hpp"

namespace restream {

std::optional<char> IstreamSource::next()
{
  std::istream::int_type c = in_.get();
  if (c == std::istream::traits_type::eof()) {
    if (in_.bad() || !in_.eof()) {
      throw SourceError("input stream failed before end-of-file");
    }
    return std::nullopt;
  }
  return std::istream::traits_type::to_char_type(c);
}

std::unique_ptr<Source<char>> make_istream_source(std::istream& in) { return std::make_unique<IstreamSource>(in); }

}  // namespace restream
