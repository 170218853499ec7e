// Copyright (c) Lawrence Livermore National Security, LLC and
// other Restream Project Developers. See the top-level LICENSE file for
// details.
//
// SPDX-License-Identifier: (BSD-3-Clause)

/// @file test_restream_text_buffer.cpp
/// @brief Bulk value parsing out of the contiguous text window.

#include <cctype>
#include <cmath>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "gtest/gtest.h"
#include "restream/istream_source.hpp"
#include "restream/parse_value.hpp"
#include "restream/text_buffer.hpp"
#include "restream/test_utils.hpp"

using restream::Checkpoint;
using restream::ParseError;
using restream::TextBuffer;
using restream_test::counting_chars;
using restream_test::read_string;

namespace {

bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

}  // namespace

TEST(TextBuffer, ParseRemainingOnlyOnce)
{
  size_t pulls = 0;
  TextBuffer tokens(counting_chars("123", &pulls));
  EXPECT_EQ(tokens.parse_remaining<int>(), 123);
  EXPECT_TRUE(tokens.exhausted());
  EXPECT_THROW(tokens.parse_remaining<int>(), ParseError);
  EXPECT_EQ(pulls, 4u);
}

TEST(TextBuffer, ParseRemainingFailureRestoresCursor)
{
  size_t pulls = 0;
  TextBuffer tokens(counting_chars("ab12x", &pulls));
  EXPECT_EQ(read_string(tokens, 2), "ab");

  try {
    tokens.parse_remaining<unsigned>();
    FAIL() << "expected ParseError";
  } catch (const ParseError& e) {
    EXPECT_EQ(e.text(), "12x");
  }
  EXPECT_EQ(tokens.cursor(), 2u);
  EXPECT_EQ(tokens.parse_remaining<std::string>(), "12x");
}

TEST(TextBuffer, ParsePrefixByCount)
{
  size_t pulls = 0;
  TextBuffer tokens(counting_chars("123abc", &pulls));
  EXPECT_EQ(tokens.parse_prefix<uint16_t>(3), 123);
  EXPECT_EQ(read_string(tokens), "abc");
}

TEST(TextBuffer, ParsePrefixByCountPastEnd)
{
  size_t pulls = 0;
  TextBuffer tokens(counting_chars("42", &pulls));
  EXPECT_EQ(tokens.parse_prefix<int>(10), 42);
  EXPECT_EQ(tokens.read_next(), std::nullopt);
}

TEST(TextBuffer, ParsePrefixWhile)
{
  size_t pulls = 0;
  TextBuffer tokens(counting_chars("123abc", &pulls));
  EXPECT_EQ(tokens.parse_prefix<uint16_t>(is_digit), 123);
  EXPECT_EQ(tokens.cursor(), 3u);
  EXPECT_EQ(read_string(tokens), "abc");
}

TEST(TextBuffer, ParsePrefixWhileFailureRestoresCursor)
{
  size_t pulls = 0;
  TextBuffer tokens(counting_chars("300,7", &pulls));
  EXPECT_THROW(tokens.parse_prefix<uint8_t>(is_digit), ParseError);
  EXPECT_EQ(tokens.cursor(), 0u);

  // a wider type succeeds on the same characters
  EXPECT_EQ(tokens.parse_prefix<uint16_t>(is_digit), 300);
  EXPECT_EQ(tokens.read_next(), ',');
  EXPECT_EQ(tokens.parse_prefix<int>([](char c) { return c != ','; }), 7);
}

TEST(TextBuffer, ParsePrefixWhileThrowingPredicateRestoresCursor)
{
  size_t pulls = 0;
  TextBuffer tokens(counting_chars("12?4", &pulls));
  tokens.read_next();
  auto strict_digit = [](char c) {
    if (c == '?') throw std::invalid_argument("unexpected character");
    return is_digit(c);
  };
  EXPECT_THROW(tokens.parse_prefix<int>(strict_digit), std::invalid_argument);
  EXPECT_EQ(tokens.cursor(), 1u);
  EXPECT_EQ(tokens.live_checkpoints(), 0u);
  EXPECT_EQ(read_string(tokens), "2?4");
}

TEST(TextBuffer, ParseSliceLeavesCursor)
{
  size_t pulls = 0;
  TextBuffer tokens(counting_chars("x=2.5;", &pulls));
  tokens.read_next();
  tokens.read_next();
  Checkpoint from = tokens.checkpoint();
  while (tokens.read_next() != ';') {
  }
  tokens.rewind(from);
  tokens.read_next();
  tokens.read_next();
  tokens.read_next();
  Checkpoint to = tokens.checkpoint();

  EXPECT_EQ(tokens.text(from, to), "2.5");
  EXPECT_DOUBLE_EQ(tokens.parse_slice<double>(from, to), 2.5);
  EXPECT_THROW(tokens.parse_slice<int>(from, to), ParseError);
  EXPECT_EQ(tokens.cursor(), 5u);
  EXPECT_EQ(tokens.read_next(), ';');
}

TEST(TextBuffer, TextOutsideWindowFails)
{
  size_t pulls = 0;
  TextBuffer tokens(counting_chars("abcdef", &pulls));
  Checkpoint stale = tokens.checkpoint();
  Checkpoint staleView = stale;
  staleView.release();
  read_string(tokens, 2);
  stale.release();
  Checkpoint mid = tokens.checkpoint();
  read_string(tokens, 2);
  Checkpoint end = tokens.checkpoint();

  EXPECT_EQ(tokens.text(mid, end), "cd");
  EXPECT_THROW(tokens.text(staleView, end), restream::OutOfWindowError);
  EXPECT_THROW(tokens.slice(end, mid), restream::OutOfWindowError);
  EXPECT_EQ(tokens.slice(mid, end), (std::vector<char>{'c', 'd'}));
}

TEST(TextBuffer, WindowMatchesGenericBuffer)
{
  size_t pulls = 0;
  TextBuffer tokens(counting_chars("abcdef", &pulls));
  std::optional<Checkpoint> l0 = tokens.checkpoint();
  read_string(tokens, 2);
  Checkpoint l1 = tokens.checkpoint();
  tokens.read_next();
  l0.reset();
  tokens.read_next();
  EXPECT_EQ(tokens.window_begin(), 2u);
  EXPECT_EQ(tokens.window_size(), 2u);

  tokens.rewind(l1);
  EXPECT_EQ(read_string(tokens), "cdef");
  EXPECT_EQ(tokens.read_next(), std::nullopt);
  EXPECT_EQ(pulls, 7u);
}

TEST(TextBuffer, LineSeparatedNumbersFromStream)
{
  std::istringstream in("15\r\n9\n10\nfizz\n");
  TextBuffer tokens(restream::make_istream_source(in));
  Checkpoint start = tokens.checkpoint();

  auto line_ending = [&tokens]() {
    return restream::attempt(tokens, [](restream::TokenStream<char>& t) -> std::optional<std::string> {
             std::optional<char> c = t.read_next();
             if (c == '\n') return std::string("\n");
             if (c == '\r' && t.read_next() == '\n') return std::string("\r\n");
             return std::nullopt;
           })
        .has_value();
  };

  std::vector<unsigned> numbers;
  while (true) {
    try {
      numbers.push_back(tokens.parse_prefix<unsigned>(is_digit));
    } catch (const ParseError&) {
      break;
    }
    if (!line_ending()) break;
  }

  EXPECT_EQ(numbers, (std::vector<unsigned>{15, 9, 10}));
  EXPECT_EQ(read_string(tokens, 4), "fizz");
  EXPECT_EQ(tokens.text(start, tokens.checkpoint()), "15\r\n9\n10\nfizz");
}

TEST(TextBuffer, Print)
{
  size_t pulls = 0;
  TextBuffer tokens(counting_chars("hey", &pulls));
  Checkpoint cp = tokens.checkpoint();
  read_string(tokens, 2);

  std::ostringstream os;
  os << tokens;
  EXPECT_NE(os.str().find("text=\"he\""), std::string::npos);
}

TEST(ParseValue, Integers)
{
  int i = 0;
  EXPECT_TRUE(restream::parse_value("-17", i));
  EXPECT_EQ(i, -17);
  EXPECT_TRUE(restream::parse_value("+8", i));
  EXPECT_EQ(i, 8);
  EXPECT_FALSE(restream::parse_value("", i));
  EXPECT_FALSE(restream::parse_value("+", i));
  EXPECT_FALSE(restream::parse_value("+-1", i));
  EXPECT_FALSE(restream::parse_value("12ab", i));
  EXPECT_FALSE(restream::parse_value(" 12", i));

  uint8_t u = 0;
  EXPECT_TRUE(restream::parse_value("255", u));
  EXPECT_EQ(u, 255);
  EXPECT_FALSE(restream::parse_value("256", u));
  EXPECT_FALSE(restream::parse_value("-1", u));
}

TEST(ParseValue, FloatingPoint)
{
  double d = 0.0;
  EXPECT_TRUE(restream::parse_value("-1.25e2", d));
  EXPECT_DOUBLE_EQ(d, -125.0);
  EXPECT_FALSE(restream::parse_value("1.5x", d));
  EXPECT_FALSE(restream::parse_value(" 1.5", d));
  EXPECT_FALSE(restream::parse_value("", d));

  EXPECT_TRUE(restream::parse_value("+1.5", d));
  EXPECT_DOUBLE_EQ(d, 1.5);
  EXPECT_TRUE(restream::parse_value("inf", d));
  EXPECT_TRUE(std::isinf(d));
  EXPECT_TRUE(restream::parse_value("-inf", d));
  EXPECT_LT(d, 0.0);
  EXPECT_TRUE(restream::parse_value("nan", d));
  EXPECT_TRUE(std::isnan(d));

  // decimal only: no hex forms or nan payloads
  EXPECT_FALSE(restream::parse_value("0x10", d));
  EXPECT_FALSE(restream::parse_value("0x1p3", d));
  EXPECT_FALSE(restream::parse_value("nan(x)", d));
  EXPECT_FALSE(restream::parse_value("+-1.5", d));
  EXPECT_FALSE(restream::parse_value("1,5", d));

  float f = 0.0f;
  EXPECT_TRUE(restream::parse_value("0.5", f));
  EXPECT_FLOAT_EQ(f, 0.5f);

  long double ld = 0.0L;
  EXPECT_TRUE(restream::parse_value("2.25", ld));
  EXPECT_EQ(ld, 2.25L);
}

TEST(TextBuffer, HexFloatIsNotANumber)
{
  size_t pulls = 0;
  TextBuffer tokens(counting_chars("0x10", &pulls));
  EXPECT_THROW(tokens.parse_remaining<double>(), ParseError);
  EXPECT_EQ(tokens.cursor(), 0u);
  EXPECT_EQ(tokens.parse_remaining<std::string>(), "0x10");
}

TEST(ParseValue, BoolCharString)
{
  bool b = false;
  EXPECT_TRUE(restream::parse_value("true", b));
  EXPECT_TRUE(b);
  EXPECT_TRUE(restream::parse_value("false", b));
  EXPECT_FALSE(b);
  EXPECT_FALSE(restream::parse_value("1", b));

  char c = 0;
  EXPECT_TRUE(restream::parse_value("q", c));
  EXPECT_EQ(c, 'q');
  EXPECT_FALSE(restream::parse_value("qq", c));

  std::string s;
  EXPECT_TRUE(restream::parse_value("", s));
  EXPECT_TRUE(s.empty());
}
