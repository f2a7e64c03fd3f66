/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   MPL2 subtitles
*/

#include "common/common_pch.h"

#include <QRegularExpression>

#include "common/qt.h"
#include "common/strings/editing.h"
#include "common/strings/formatting.h"
#include "common/subtitles/mpl2_codec.h"
#include "common/subtitles/subtitles_x.h"

namespace stk::subtitles {

mpl2_codec_c::mpl2_codec_c()
  : codec_c{format_e::mpl2, "mpl2_codec"}
{
}

bool
mpl2_codec_c::probe(std::string const &text)
  const {
  static QRegularExpression s_probe_re{"^\\[\\d+\\]\\[\\d*\\]"};

  for (auto const &line : split_lines(text)) {
    auto stripped = stk::string::strip_copy(line);
    if (!stripped.empty())
      return Q(stripped).contains(s_probe_re);
  }

  return false;
}

void
mpl2_codec_c::parse(std::vector<std::string> const &lines,
                    codec_options_t const &options,
                    read_result_t &result)
  const {
  static std::optional<QRegularExpression> s_line_re;

  if (!s_line_re)
    s_line_re = QRegularExpression{"^\\[(\\d+)\\]\\[(\\d+)\\](.*)$"};

  auto line_number = 0u;

  for (auto const &line : lines) {
    ++line_number;

    auto stripped = stk::string::strip_copy(line);
    if (stripped.empty())
      continue;

    auto matches = s_line_re->match(Q(stripped));
    if (!matches.hasMatch()) {
      skip_or_throw(result, options, line_number, Y("Expected a '[start][end]text' line."));
      continue;
    }

    std::vector<std::string> text_lines;

    // A leading slash marks a line as italic.
    for (auto text_line : stk::string::split(to_utf8(matches.captured(3)), "|")) {
      if (balg::starts_with(text_line, "/"))
        text_line = "{\\i1}" + text_line.substr(1) + "{\\i0}";
      text_lines.emplace_back(std::move(text_line));
    }

    try {
      event_c event{parse_time(to_utf8(matches.captured(1)), time_format_e::mpl2), parse_time(to_utf8(matches.captured(2)), time_format_e::mpl2)};
      event.set_text(stk::string::join(text_lines, "\n"));
      result.document.add_event(std::move(event));

    } catch (stk::exception const &ex) {
      skip_or_throw(result, options, line_number, ex.what());
    }
  }
}

std::string
mpl2_codec_c::format_document(document_c const &document,
                              codec_options_t const &,
                              conversion_policy_c &policy,
                              warnings_t &warnings)
  const {
  auto support = policy.get_emphasis_support();
  std::string out;

  for (auto idx = 0u; idx < document.num_events(); ++idx) {
    auto const &event = document.get_event(idx);

    if (!policy.check_event(idx, event, document))
      continue;

    std::vector<std::string> formatted_lines;

    for (auto const &line : split_styled_lines(event, document, &warnings)) {
      std::string text;

      for (auto const &segment : line)
        text += segment.text;

      if (support.italic && !line.empty() && line.front().style.m_italic)
        text = "/" + text;

      formatted_lines.emplace_back(std::move(text));
    }

    out += fmt::format("[{0}][{1}]{2}\n",
                       format_time(event.get_start(), time_format_e::mpl2),
                       format_time(event.get_end(),   time_format_e::mpl2),
                       stk::string::join(formatted_lines, "|"));
  }

  return out;
}

}
