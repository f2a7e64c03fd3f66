/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   TMPlayer plain text subtitles
*/

#include "common/common_pch.h"

#include <QRegularExpression>

#include "common/qt.h"
#include "common/strings/editing.h"
#include "common/strings/formatting.h"
#include "common/strings/utf8.h"
#include "common/subtitles/subtitles_x.h"
#include "common/subtitles/tmp_codec.h"

namespace stk::subtitles {

tmp_codec_c::tmp_codec_c()
  : codec_c{format_e::tmp, "tmp_codec"}
{
}

bool
tmp_codec_c::probe(std::string const &text)
  const {
  static QRegularExpression s_probe_re{"^\\d{1,2}:\\d{2}:\\d{2}[:=]"};

  for (auto const &line : split_lines(text)) {
    auto stripped = stk::string::strip_copy(line);
    if (!stripped.empty())
      return Q(stripped).contains(s_probe_re);
  }

  return false;
}

/** \brief Compute the end time for a subtitle without one

   The subtitle is shown for a base duration plus a fixed amount per
   character, but not beyond the start of the next subtitle.
*/
timestamp_c
tmp_codec_c::infer_end(timestamp_c const &start,
                       std::string const &text,
                       std::optional<timestamp_c> const &next_start) {
  auto end = start.shifted(MIN_DURATION_MS + DURATION_PER_CHAR_MS * static_cast<int64_t>(stk::utf8::num_code_points(text)));

  if (next_start && (*next_start > start) && (*next_start < end))
    end = *next_start;

  return end;
}

void
tmp_codec_c::parse(std::vector<std::string> const &lines,
                   codec_options_t const &options,
                   read_result_t &result)
  const {
  static std::optional<QRegularExpression> s_line_re;

  if (!s_line_re)
    s_line_re = QRegularExpression{"^(\\d{1,2}:\\d{2}:\\d{2})[:=](.*)$"};

  std::vector<std::pair<timestamp_c, std::string>> entries;
  auto line_number = 0u;

  for (auto const &line : lines) {
    ++line_number;

    auto stripped = stk::string::strip_copy(line);
    if (stripped.empty())
      continue;

    auto matches = s_line_re->match(Q(stripped));
    if (!matches.hasMatch()) {
      skip_or_throw(result, options, line_number, Y("Expected a 'HH:MM:SS:text' line."));
      continue;
    }

    try {
      auto start = parse_time(to_utf8(matches.captured(1)), time_format_e::tmp);
      auto text  = to_utf8(matches.captured(2));
      balg::replace_all(text, "|", "\n");

      entries.emplace_back(start, text);

    } catch (malformed_timestamp_x const &ex) {
      skip_or_throw(result, options, line_number, ex.what());
    }
  }

  for (auto idx = 0u; idx < entries.size(); ++idx) {
    auto const &[start, text] = entries[idx];
    auto next_start           = (idx + 1) < entries.size() ? std::optional<timestamp_c>{entries[idx + 1].first} : std::optional<timestamp_c>{};

    event_c event{start, start};
    event.set_text(text);
    event.set_end(infer_end(start, event.plaintext(), next_start));

    result.document.add_event(std::move(event));
  }
}

std::string
tmp_codec_c::format_document(document_c const &document,
                             codec_options_t const &,
                             conversion_policy_c &policy,
                             warnings_t &warnings)
  const {
  std::vector<std::size_t> visible;

  for (auto idx = 0u; idx < document.num_events(); ++idx)
    if (policy.check_event(idx, document.get_event(idx), document))
      visible.emplace_back(idx);

  std::string out;

  for (auto pos = 0u; pos < visible.size(); ++pos) {
    auto const &event = document.get_event(visible[pos]);
    std::vector<std::string> formatted_lines;

    for (auto const &line : split_styled_lines(event, document, &warnings)) {
      std::string text;
      for (auto const &segment : line)
        text += segment.text;
      formatted_lines.emplace_back(std::move(text));
    }

    auto text       = stk::string::join(formatted_lines, "|");
    auto next_start = (pos + 1) < visible.size() ? std::optional<timestamp_c>{document.get_event(visible[pos + 1]).get_start()} : std::optional<timestamp_c>{};
    auto start      = quantize_time(event.get_start(), time_format_e::tmp);
    auto next       = next_start ? std::optional<timestamp_c>{quantize_time(*next_start, time_format_e::tmp)} : std::optional<timestamp_c>{};

    if (infer_end(start, event.plaintext(), next) != event.get_end())
      policy.apply(feature_e::end_time, visible[pos], fmt::format(FY("end time {0} not stored"), event.get_end()));

    out += fmt::format("{0}:{1}\n", format_time(event.get_start(), time_format_e::tmp), text);
  }

  return out;
}

}
