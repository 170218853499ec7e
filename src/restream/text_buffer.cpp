// Copyright (c) Lawrence Livermore National Security, LLC and
// other Restream Project Developers. See the top-level LICENSE file for
// details.
//
// SPDX-License-Identifier: (BSD-3-Clause)

#include "text_buffer.hpp"
#include <utility>

namespace restream {

TextBuffer::TextBuffer(std::unique_ptr<Source<char>> source) : buffer_(std::move(source)) {}

std::optional<char> TextBuffer::read_next() { return buffer_.read_next(); }

Checkpoint TextBuffer::checkpoint() { return buffer_.checkpoint(); }

void TextBuffer::rewind(const Checkpoint& to) { buffer_.rewind(to); }

bool TextBuffer::is_at(const Checkpoint& location) const { return buffer_.is_at(location); }

std::vector<char> TextBuffer::slice(const Checkpoint& from, const Checkpoint& to) const
{
  std::string_view range = text(from, to);
  return std::vector<char>(range.begin(), range.end());
}

size_t TextBuffer::cursor() const { return buffer_.cursor(); }

std::string_view TextBuffer::text(const Checkpoint& from, const Checkpoint& to) const
{
  std::pair<size_t, size_t> range = buffer_.window_offsets(from.cursor(), to.cursor());
  return buffer_.window().view(range.first, range.second);
}

void TextBuffer::consume_remaining()
{
  while (buffer_.read_next()) {
  }
}

void TextBuffer::print(std::ostream& os) const
{
  buffer_.print(os);
  os << "   text=\"" << buffer_.window().view(0, buffer_.window_size()) << "\"\n";
}

}  // namespace restream
