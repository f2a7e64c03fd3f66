/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   HTML-like markup found in SubRip and WebVTT text
*/

#include "common/common_pch.h"

#include <QRegularExpression>

#include "common/qt.h"
#include "common/strings/editing.h"
#include "common/strings/parsing.h"
#include "common/subtitles/html_markup.h"

namespace stk::subtitles::html {

namespace {

std::unordered_map<std::string, std::string> const s_named_entities{
  { "amp",  "&"            },
  { "lt",   "<"            },
  { "gt",   ">"            },
  { "quot", "\""           },
  { "apos", "'"            },
  { "nbsp", "\xc2\xa0"     },
  { "lrm",  "\xe2\x80\x8e" },
  { "rlm",  "\xe2\x80\x8f" },
};

QString
decode_entity(QRegularExpressionMatch const &match) {
  auto name = to_utf8(match.captured(1));

  if (name[0] == '#') {
    auto hex    = (name.size() > 1) && ((name[1] == 'x') || (name[1] == 'X'));
    auto digits = name.substr(hex ? 2 : 1);
    uint64_t code_point{};

    if (hex)
      code_point = stk::string::from_hex(digits);
    else if (!stk::string::parse_number(digits, code_point))
      return match.captured(0);

    if (!code_point || (code_point > 0x10ffff))
      return match.captured(0);

    auto ucs4 = static_cast<char32_t>(code_point);
    return QString::fromUcs4(&ucs4, 1);
  }

  auto itr = s_named_entities.find(name);
  return itr != s_named_entities.end() ? Q(itr->second) : match.captured(0);
}

} // anonymous namespace

std::string
decode_entities(std::string const &text) {
  static std::optional<QRegularExpression> s_entity_re;

  if (!s_entity_re)
    s_entity_re = QRegularExpression{"&(#[0-9]{1,7}|#[xX][0-9a-fA-F]{1,6}|[a-zA-Z]+);"};

  return stk::string::replace(text, *s_entity_re, decode_entity);
}

std::string
encode_entities(std::string const &text) {
  auto result = text;

  balg::replace_all(result, "&", "&amp;");
  balg::replace_all(result, "<", "&lt;");
  balg::replace_all(result, ">", "&gt;");

  return result;
}

std::string
remove_unknown_tags(std::string const &text) {
  static QRegularExpression s_tag_re{"<[^<>]*>"};

  return to_utf8(Q(text).replace(s_tag_re, QString{}));
}

std::string
strip_tags(std::string const &text) {
  return decode_entities(remove_unknown_tags(text));
}

std::string
emphasis_tags_to_override_tags(std::string const &text) {
  static std::optional<QRegularExpression> s_emphasis_re;

  if (!s_emphasis_re)
    s_emphasis_re = QRegularExpression{"<\\s*(/?)\\s*([bius])\\s*>", QRegularExpression::CaseInsensitiveOption};

  return stk::string::replace(text, *s_emphasis_re, [](QRegularExpressionMatch const &match) {
    return Q(fmt::format("{{\\{0}{1}}}", to_utf8(match.captured(2).toLower()), match.capturedLength(1) ? 0 : 1));
  });
}

std::string
format_styled_lines(std::vector<styled_line_t> const &lines,
                    tag_support_t const &support,
                    bool encode) {
  std::vector<std::string> formatted_lines;

  for (auto const &line : lines) {
    std::string formatted;

    for (auto const &segment : line) {
      auto text = encode ? encode_entities(segment.text) : segment.text;

      if (support.strikeout && segment.style.m_strikeout)
        text = "<s>" + text + "</s>";
      if (support.underline && segment.style.m_underline)
        text = "<u>" + text + "</u>";
      if (support.italic && segment.style.m_italic)
        text = "<i>" + text + "</i>";
      if (support.bold && segment.style.m_bold)
        text = "<b>" + text + "</b>";

      formatted += text;
    }

    formatted_lines.emplace_back(std::move(formatted));
  }

  return boost::join(formatted_lines, "\n");
}

}
