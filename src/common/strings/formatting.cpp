/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   string formatting functions
*/

#include "common/common_pch.h"

#include "common/qt.h"
#include "common/strings/formatting.h"

namespace stk::string {

std::string
format_paragraph(std::string const &text_to_wrap,
                 int indent_column,
                 std::string const &indent_first_line,
                 std::string const &indent_following_lines,
                 int wrap_column) {
  auto result = Q(indent_first_line);

  if ((0 != indent_column) && (result.length() >= indent_column))
    result += QString{"\n"} + QString(indent_column, QChar{' '});
  else
    result += QString(indent_column - result.length(), QChar{' '});

  auto following   = indent_following_lines.empty() ? QString(indent_column, QChar{' '}) : Q(indent_following_lines);
  auto column      = static_cast<int>(indent_column);
  auto line_filled = false;

  for (auto const &word : Q(text_to_wrap).split(QChar{' '}, Qt::SkipEmptyParts)) {
    if (line_filled && ((column + 1 + word.length()) >= wrap_column)) {
      result      += QString{"\n"} + following;
      column       = following.length();
      line_filled  = false;
    }

    if (line_filled) {
      result += QChar{' '};
      ++column;
    }

    result      += word;
    column      += word.length();
    line_filled  = true;
  }

  result += QChar{'\n'};

  return to_utf8(result);
}

std::string
to_lower_ascii(std::string const &src) {
  auto dst = src;

  for (auto &c : dst)
    if ((c >= 'A') && (c <= 'Z'))
      c += 'a' - 'A';

  return dst;
}

std::string
normalize_fmt_double_output_str(std::string const &formatted_value) {
  // Depending on the fmt version "20.0" or "20" is output. Always
  // strip the zero decimals.
  if (formatted_value.find('.') == std::string::npos)
    return formatted_value;

  auto result = formatted_value;
  balg::trim_right_if(result, balg::is_any_of("0"));
  if (!result.empty() && (result.back() == '.'))
    result.pop_back();

  return result;
}

} // stk::string
