/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   definitions for string parsing functions
*/

#pragma once

#include "common/common_pch.h"

namespace stk::string {

bool parse_number_as_rational(std::string const &string, stk_rational_t &value);

template<typename StrT, typename ValueT>
bool
parse_number(StrT const &string,
             ValueT &value) {
  if constexpr (std::is_unsigned_v<ValueT>)
    if (!string.empty() && (string[0] == '-'))
      return false;

  std::istringstream in{string};

  in >> std::noskipws >> value;

  return !in.fail() && in.eof();
}

template<typename StrT>
bool
parse_number(StrT const &string,
             stk_rational_t &value) {
  return parse_number_as_rational(string, value);
}

template<typename StrT>
bool
parse_number(StrT const &string,
             double &value) {
  stk_rational_t rational_value;
  if (!parse_number(string, rational_value))
    return false;

  value = boost::rational_cast<double>(rational_value);

  return true;
}

bool parse_floating_point_number_as_rational(std::string const &string, stk_rational_t &value);
bool parse_frame_rate(std::string const &string, double &value);

// Accepts a number with one of the units h, m/min, s and ms/msec;
// returns milliseconds.
bool parse_duration_number_with_unit(std::string const &string, int64_t &value);

// Parses either a number with a unit or HH:MM:SS.nnn (hours and
// fraction optional). On failure the reason is stored in
// timestamp_parser_error.
extern std::string timestamp_parser_error;
bool parse_timestamp(std::string const &string, int64_t &timestamp, bool allow_negative = false);

uint64_t from_hex(std::string const &data);

} // stk::string
