/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   string helper functions
*/

#pragma once

#include "common/common_pch.h"

#include <QRegularExpression>

namespace stk::string {

constexpr auto is_blank_or_tab(char c) { return (c == ' ')   || (c == '\t'); }
constexpr auto is_newline(char c)      { return (c == '\n')  || (c == '\r'); }

enum class line_ending_style_e {
  cr_lf,
  lf,
};

// Converts CR LF and lone CR to LF first, then to the requested style.
std::string normalize_line_endings(std::string const &str, line_ending_style_e line_ending_style = line_ending_style_e::lf);

// Splitting an empty text yields one empty element. At most 'max'
// elements are returned; the last one holds the unsplit rest.
std::vector<std::string> split(std::string const &text, std::string const &separator = ",", std::size_t max = std::numeric_limits<std::size_t>::max());

// Removes blanks, tabs and NUL bytes, and line breaks if 'newlines' is set.
void strip(std::string &s, bool newlines = false);
void strip(std::vector<std::string> &v, bool newlines = false);
void strip_back(std::string &s, bool newlines = false);
std::string strip_copy(std::string const &s, bool newlines = false);

QString replace(QString const &original, QRegularExpression const &regex, std::function<QString(QRegularExpressionMatch const &)> replacement);
std::string replace(std::string const &original, QRegularExpression const &regex, std::function<QString(QRegularExpressionMatch const &)> replacement);

} // stk::string
