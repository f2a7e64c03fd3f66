/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   string helper functions
*/

#include "common/common_pch.h"

#include <QRegularExpression>

#include "common/qt.h"
#include "common/strings/editing.h"

namespace stk::string {

namespace {

bool
is_strippable(char c,
              bool newlines) {
  return !c || is_blank_or_tab(c) || (newlines && is_newline(c));
}

}

std::vector<std::string>
split(std::string const &text,
      std::string const &separator,
      std::size_t max) {
  if (separator.empty() || (max <= 1))
    return { text };

  std::vector<std::string> results;
  std::size_t start = 0;

  while ((results.size() + 1) < max) {
    auto pos = text.find(separator, start);
    if (pos == std::string::npos)
      break;

    results.emplace_back(text, start, pos - start);
    start = pos + separator.size();
  }

  results.emplace_back(text, start, std::string::npos);

  return results;
}

void
strip_back(std::string &s,
           bool newlines) {
  auto end = s.size();
  while ((end > 0) && is_strippable(s[end - 1], newlines))
    --end;

  s.erase(end);
}

void
strip(std::string &s,
      bool newlines) {
  strip_back(s, newlines);

  std::size_t start = 0;
  while ((start < s.size()) && is_strippable(s[start], newlines))
    ++start;

  s.erase(0, start);
}

void
strip(std::vector<std::string> &v,
      bool newlines) {
  for (auto &s : v)
    strip(s, newlines);
}

std::string
strip_copy(std::string const &s,
           bool newlines) {
  auto copy = s;
  strip(copy, newlines);
  return copy;
}

std::string
normalize_line_endings(std::string const &str,
                       line_ending_style_e line_ending_style) {
  auto const line_ending = line_ending_style_e::cr_lf == line_ending_style ? "\r\n"s : "\n"s;

  std::string result;
  result.reserve(str.size());

  for (std::size_t idx = 0, size = str.size(); idx < size; ++idx) {
    auto c = str[idx];

    if (c == '\r') {
      if (((idx + 1) < size) && (str[idx + 1] == '\n'))
        ++idx;
      result += line_ending;

    } else if (c == '\n')
      result += line_ending;

    else
      result += c;
  }

  return result;
}

QString
replace(QString const &original,
        QRegularExpression const &regex,
        std::function<QString(QRegularExpressionMatch const &)> replacement) {
  QString result;
  qsizetype copied_up_to = 0;

  result.reserve(original.size());

  auto itr = regex.globalMatch(original);

  while (itr.hasNext()) {
    auto match = itr.next();

    result       += original.mid(copied_up_to, match.capturedStart(0) - copied_up_to);
    result       += replacement(match);
    copied_up_to  = match.capturedEnd(0);
  }

  result += original.mid(copied_up_to);

  return result;
}

std::string
replace(std::string const &original,
        QRegularExpression const &regex,
        std::function<QString(QRegularExpressionMatch const &)> replacement) {
  return to_utf8(replace(Q(original), regex, replacement));
}

} // stk::string
