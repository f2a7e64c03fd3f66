/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   string parsing helper functions
*/

#include "common/common_pch.h"

#include <QRegularExpression>

#include "common/container.h"
#include "common/qt.h"
#include "common/strings/parsing.h"

namespace stk::string {

std::string timestamp_parser_error;

inline bool
set_tcp_error(const std::string &error) {
  timestamp_parser_error = error;
  return false;
}

static QRegularExpression s_floating_point_number_re{"^(-?)([0-9]+)?(?:\\.([0-9]+))?$"};

bool
parse_floating_point_number_as_rational(std::string const &string,
                                        stk_rational_t &value) {
  if (string.empty())
    return false;

  auto matches = s_floating_point_number_re.match(Q(string));
  if (!matches.hasMatch())
    return false;

  int64_t numerator{}, sign{1};
  if (matches.capturedLength(2) && !parse_number(to_utf8(matches.captured(2)), numerator))
    return false;

  if (matches.capturedLength(1))
    sign = -1;

  if (!matches.capturedLength(3)) {
    value = stk_rational_t{sign * numerator};
    return true;
  }

  int64_t fractional{};
  if (!parse_number(to_utf8(matches.captured(3)), fractional))
    return false;

  int64_t shift{1};
  for (auto idx = 0u; idx < to_utf8(matches.captured(3)).length(); ++idx)
    shift *= 10;

  value = stk_rational_t{sign * (numerator * shift + fractional), shift};
  return true;
}

bool
parse_number_as_rational(std::string const &string,
                         stk_rational_t &value) {
  auto parts = split(string, ".", 2);

  while (parts.size() < 2)
    parts.emplace_back("");

  int64_t num{0};
  if (!parts[0].length() || !parse_number(parts[0], num))
    return false;

  auto p1        = stk_rational_t{num},
    p2           = stk_rational_t{};
  auto const len = parts[1].length();

  if (len > 0) {
    num = 0;
    if (!parse_number(parts[1], num))
      return false;

    auto den = int64_t{1};
    for (auto idx = 0u; idx < len; ++idx)
      den *= 10;

    p2 = stk_rational_t{num, den};
  }

  value = p1 + p2;

  return true;
}

/** \brief Parse a frame rate

   Accepted are plain numbers ("25", "23.976"), fractions
   ("24000/1001") and both optionally followed by "fps". The well-known
   NTSC approximations are mapped to their exact fractional values.
*/
bool
parse_frame_rate(std::string const &string,
                 double &value) {
  static std::optional<QRegularExpression> s_re;

  if (!s_re)
    s_re = QRegularExpression{"^(\\d+(?:\\.\\d+)?)(?:/(\\d+))?(?:fps)?$", QRegularExpression::CaseInsensitiveOption};

  auto matches = s_re->match(Q(strip_copy(string)));
  if (!matches.hasMatch())
    return false;

  stk_rational_t rate;
  if (!parse_floating_point_number_as_rational(to_utf8(matches.captured(1)), rate))
    return false;

  if (matches.capturedLength(2)) {
    int64_t denominator{};
    if (!parse_number(to_utf8(matches.captured(2)), denominator) || !denominator)
      return false;
    rate /= denominator;
  }

  if (rate <= 0)
    return false;

  if (stk_rational_t{2397, 100} == rate)
    rate = stk_rational_t{24000, 1001};

  else if (stk_rational_t{23976, 1000} == rate)
    rate = stk_rational_t{24000, 1001};

  else if (stk_rational_t{2997, 100} == rate)
    rate = stk_rational_t{30000, 1001};

  else if (stk_rational_t{5994, 100} == rate)
    rate = stk_rational_t{60000, 1001};

  value = boost::rational_cast<double>(rate);

  return true;
}

/** \brief Parse a timestamp or duration

   Recognized formats:
   1. XXXXXXXu   with XXXXXX being a number followed
      by one of the units 'h', 'm', 's' or 'ms'
   2. HH:MM:SS.nnn  with up to three digits 'n' for millisecond
      precision; HH: is optional.

   The result is a number of milliseconds.
*/
bool
parse_timestamp(const std::string &src,
                int64_t &timestamp,
                bool allow_negative) {
  int64_t negative = 1;
  size_t offset    = 0;

  if (src.empty())
    return set_tcp_error(Y("Invalid format: the string is empty."));

  if ('-' == src[0]) {
    if (!allow_negative)
      return set_tcp_error(Y("Invalid format: negative values are not allowed."));
    negative = -1;
    offset   = 1;
  }

  int64_t value = 0;
  if (parse_duration_number_with_unit(src.substr(offset), value)) {
    timestamp = value * negative;
    return true;
  }

  int64_t values[4]{};
  int num_values = 1, num_digits = 0, num_colons = 0;
  auto decimal_point_found = false;

  for (auto i = offset; src.length() > i; ++i) {
    if (isdigit(src[i])) {
      if (decimal_point_found && (3 == num_digits))
        return set_tcp_error(Y("Invalid format: More than three millisecond digits"));
      values[num_values - 1] = values[num_values - 1] * 10 + src[i] - '0';
      ++num_digits;

    } else if ('.' == src[i]) {
      if (decimal_point_found)
        return set_tcp_error(Y("Invalid format: Second decimal point after first decimal point"));
      if (0 == num_digits)
        return set_tcp_error(Y("Invalid format: No digits before decimal point"));
      ++num_values;
      num_digits          = 0;
      decimal_point_found = true;

    } else if (':' == src[i]) {
      if (decimal_point_found)
        return set_tcp_error(Y("Invalid format: Colon inside millisecond part"));
      if (2 == num_colons)
        return set_tcp_error(Y("Invalid format: More than two colons"));
      if (0 == num_digits)
        return set_tcp_error(Y("Invalid format: No digits before colon"));
      ++num_colons;
      ++num_values;
      num_digits = 0;

    } else
      return set_tcp_error(fmt::format(FY("Invalid format: unknown character '{0}' found"), src[i]));
  }

  if (1 > num_colons)
    return set_tcp_error(Y("Invalid format: At least minutes and seconds have to be given, but no colon was found"));

  if ((':' == src[src.length() - 1]) || ('.' == src[src.length() - 1]))
    return set_tcp_error(Y("Invalid format: The last character is a colon or a decimal point instead of a digit"));

  int64_t h = 0, m = 0, s = 0, ms = 0;
  auto scale_fraction = [&num_digits](int64_t fraction) {
    for (auto digits = num_digits; 3 > digits; ++digits)
      fraction *= 10;
    return fraction;
  };

  if (4 == num_values) {
    h  = values[0];
    m  = values[1];
    s  = values[2];
    ms = scale_fraction(values[3]);

  } else if (2 == num_values) {
    m = values[0];
    s = values[1];

  } else if (decimal_point_found) {
    m  = values[0];
    s  = values[1];
    ms = scale_fraction(values[2]);

  } else {
    h = values[0];
    m = values[1];
    s = values[2];
  }

  if (m > 59)
    return set_tcp_error(fmt::format(FY("Invalid number of minutes: {0} > 59"), m));
  if (s > 59)
    return set_tcp_error(fmt::format(FY("Invalid number of seconds: {0} > 59"), s));

  timestamp              = ((h * 60 * 60 + m * 60 + s) * 1000 + ms) * negative;
  timestamp_parser_error = Y("no error");

  return true;
}

/** \brief Parse a number postfixed with a time-based unit

   This function parsers a number that is postfixed with one of the
   units 'h', 'm', 'min', 's', 'ms' or 'msec'. Numbers without a unit
   are seconds. Fractions such as "1001/24000s" are accepted, too.

   It returns a number of milliseconds, rounded to the nearest one.
*/
bool
parse_duration_number_with_unit(const std::string &s,
                                int64_t &value) {
  static std::optional<QRegularExpression> re1, re2;

  if (!re1) {
    re1 = QRegularExpression{"^(-?\\d+\\.?\\d*)(h|m|min|s|ms|msec)?$",  QRegularExpression::CaseInsensitiveOption};
    re2 = QRegularExpression{"^(-?\\d+)/(-?\\d+)(h|m|min|s|ms|msec)?$", QRegularExpression::CaseInsensitiveOption};
  }

  std::string unit;
  stk_rational_t r{0, 1};
  auto qs = Q(s);

  if (auto matches = re1->match(qs); matches.hasMatch()) {
    auto number = to_utf8(matches.captured(1));
    if (balg::ends_with(number, "."))
      number.pop_back();
    if (!parse_floating_point_number_as_rational(number, r))
      return false;

    if (matches.capturedLength(2))
      unit = to_utf8(matches.captured(2));

  } else if (matches = re2->match(qs); matches.hasMatch()) {
    int64_t n, d;
    if (!parse_number(to_utf8(matches.captured(1)), n) || !parse_number(to_utf8(matches.captured(2)), d) || !d)
      return false;

    r = stk_rational_t{n, d};

    if (matches.capturedLength(3))
      unit = to_utf8(matches.captured(3));

  } else
    return false;

  balg::to_lower(unit);

  int64_t multiplier = 1000; // default: 1s

  if (unit == "h")
    multiplier = 3600ll * 1000;
  else if (stk::included_in(unit, "m", "min"))
    multiplier = 60ll * 1000;
  else if (stk::included_in(unit, "ms", "msec"))
    multiplier = 1;
  else if (!unit.empty() && (unit != "s"))
    return false;

  auto exact = stk_rational_t{multiplier} * r;
  auto half  = stk_rational_t{exact < 0 ? -1 : 1, 2};
  value      = boost::rational_cast<int64_t>(exact + half);

  return true;
}

uint64_t
from_hex(const std::string &data) {
  const char *s = data.c_str();
  if (*s == 0)
    throw invalid_parameter_x{Y("empty hexadecimal number")};

  uint64_t value = 0;

  while (*s) {
    unsigned int digit = isdigit(*s)                  ? *s - '0'
                       : (('a' <= *s) && ('f' >= *s)) ? *s - 'a' + 10
                       : (('A' <= *s) && ('F' >= *s)) ? *s - 'A' + 10
                       :                                16;
    if (16 == digit)
      throw invalid_parameter_x{fmt::format(FY("'{0}' is not a hexadecimal number"), data)};

    value = (value << 4) + digit;
    ++s;
  }

  return value;
}

} // stk::string
