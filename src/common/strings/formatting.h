/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   definitions for string formatting functions
*/

#pragma once

#include "common/common_pch.h"

#include "common/strings/editing.h"

namespace stk::string {

constexpr auto DEFAULT_WRAP_COLUMN = 79;

// Wraps at blanks. The first line starts with 'indent_first_line'
// padded to 'indent_column'; following lines start with
// 'indent_following_lines' or 'indent_column' blanks.
std::string format_paragraph(std::string const &text_to_wrap,
                             int indent_column                         = 0,
                             std::string const &indent_first_line      = {},
                             std::string const &indent_following_lines = {},
                             int wrap_column                           = DEFAULT_WRAP_COLUMN);

template<typename RangeT, typename SeparatorT>
std::string
join(RangeT const &range,
     SeparatorT const &separator) {
  return fmt::format("{}", fmt::join(range, separator));
}

template<typename IteratorT, typename SeparatorT>
std::string
join(IteratorT first,
     IteratorT last,
     SeparatorT const &separator) {
  return fmt::format("{}", fmt::join(first, last, separator));
}

// Leaves all non-ASCII bytes alone.
std::string to_lower_ascii(std::string const &src);

std::string normalize_fmt_double_output_str(std::string const &formatted_value);

template<typename T>
std::string
normalize_fmt_double_output(T value) {
  return normalize_fmt_double_output_str(fmt::format("{}", value));
}

template<> inline
std::string
normalize_fmt_double_output(double value) {
  return normalize_fmt_double_output_str(fmt::format("{0:f}", value));
}

} // stk::string
