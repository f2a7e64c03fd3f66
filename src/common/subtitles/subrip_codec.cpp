/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   SubRip (.srt) subtitles
*/

#include "common/common_pch.h"

#include <QRegularExpression>

#include "common/qt.h"
#include "common/strings/editing.h"
#include "common/strings/parsing.h"
#include "common/subtitles/html_markup.h"
#include "common/subtitles/subrip_codec.h"
#include "common/subtitles/subtitles_x.h"

#define SRT_RE_VALUE          "\\s*(-?)\\s*(\\d+)"
#define SRT_RE_TIMESTAMP      SRT_RE_VALUE ":" SRT_RE_VALUE ":" SRT_RE_VALUE "(?:[,\\.:]" SRT_RE_VALUE ")?"
#define SRT_RE_TIMESTAMP_LINE "^" SRT_RE_TIMESTAMP "\\s*[\\-\\s]+>\\s*" SRT_RE_TIMESTAMP "\\s*"
#define SRT_RE_COORDINATES    "([XY]\\d+:\\d+\\s*){4}\\s*$"

namespace stk::subtitles {

namespace {

QRegularExpression const &
timestamp_line_re() {
  static std::optional<QRegularExpression> s_re;

  if (!s_re)
    s_re = QRegularExpression{SRT_RE_TIMESTAMP_LINE};

  return *s_re;
}

bool
is_number_line(std::string const &line) {
  static QRegularExpression s_number_re{"^\\s*\\d+\\s*$"};

  return Q(line).contains(s_number_re);
}

//      1       2         3       4         5       6              7       8
// "\\s*(-?)\\s*(\\d+):\\s*(-?)\\s*(\\d+):\\s*(-?)\\s*(\\d+)(?:[,\\.:]\\s*(-?)\\s*(\\d+))?"
int64_t
timestamp_from_match(QRegularExpressionMatch const &matches,
                     int first_idx) {
  int64_t hours = 0, minutes = 0, seconds = 0, milliseconds = 0;

  for (auto idx = 0; idx < 4; ++idx)
    if (matches.captured(first_idx + idx * 2) == Q("-"))
      throw stk::invalid_parameter_x{Y("Negative timestamps are not supported.")};

  stk::string::parse_number(to_utf8(matches.captured(first_idx + 1)), hours);
  stk::string::parse_number(to_utf8(matches.captured(first_idx + 3)), minutes);
  stk::string::parse_number(to_utf8(matches.captured(first_idx + 5)), seconds);

  auto fraction = to_utf8(matches.captured(first_idx + 7));
  while (fraction.length() < 3)
    fraction += "0";
  if (fraction.length() > 3)
    fraction.erase(3);

  stk::string::parse_number(fraction, milliseconds);

  if ((minutes > 59) || (seconds > 59))
    throw stk::invalid_parameter_x{fmt::format(FY("The timestamp {0}:{1}:{2} has minutes or seconds outside of 0-59."), hours, minutes, seconds)};

  return ((hours * 60 + minutes) * 60 + seconds) * 1000 + milliseconds;
}

} // anonymous namespace

subrip_codec_c::subrip_codec_c()
  : codec_c{format_e::srt, "subrip_codec"}
{
}

bool
subrip_codec_c::probe(std::string const &text)
  const {
  static std::optional<QRegularExpression> s_substation_re;

  if (!s_substation_re)
    s_substation_re = QRegularExpression{"\\[Script Info\\]|\\[V4\\+ Styles\\]"};

  auto qtext = Q(text);
  if (qtext.contains(*s_substation_re))
    return false;

  auto lines = split_lines(text);

  for (auto const &line : lines) {
    auto stripped = stk::string::strip_copy(line);
    if (stripped.empty())
      continue;
    if (balg::starts_with(stripped, "WEBVTT"))
      return false;
    break;
  }

  return std::any_of(lines.begin(), lines.end(), [](std::string const &line) { return Q(line).contains(timestamp_line_re()); });
}

std::string
subrip_codec_c::convert_markup(std::string const &text,
                               codec_options_t const &options)
  const {
  if (options.keep_html_tags)
    return text;

  auto converted = html::emphasis_tags_to_override_tags(text);

  return options.keep_unknown_html_tags ? converted : strip_markup(converted, options);
}

void
subrip_codec_c::parse(std::vector<std::string> const &lines,
                      codec_options_t const &options,
                      read_result_t &result)
  const {
  static std::optional<QRegularExpression> s_coordinates_re;

  if (!s_coordinates_re)
    s_coordinates_re = QRegularExpression{SRT_RE_COORDINATES};

  auto state                    = STATE_INITIAL;
  auto line_number              = 0u;
  auto entry_line_number        = 0u;
  auto coordinates_warning_shown = false;
  std::optional<int64_t> start, end;
  std::string subtitles;

  auto add_entry = [&]() {
    if (!start)
      return;

    auto text = subtitles;
    stk::string::strip_back(text, true);

    if (*end < *start)
      skip_or_throw(result, options, entry_line_number, fmt::format(FY("The end timestamp {1} is smaller than the start timestamp {0}."), timestamp_c::ms(*start), timestamp_c::ms(*end)));

    else {
      event_c event{timestamp_c::ms(*start), timestamp_c::ms(*end)};
      event.set_text(convert_markup(text, options));
      result.document.add_event(std::move(event));
    }

    start.reset();
    subtitles.clear();
  };

  auto start_entry = [&](std::string const &s) -> bool {
    auto matches = timestamp_line_re().match(Q(s));
    if (!matches.hasMatch())
      return false;

    add_entry();

    try {
      auto new_start = timestamp_from_match(matches, 1);
      auto new_end   = timestamp_from_match(matches, 9);
      start          = new_start;
      end            = new_end;

    } catch (stk::invalid_parameter_x const &ex) {
      skip_or_throw(result, options, line_number, ex.what());
      state = STATE_SKIP;
      return true;
    }

    if (Q(s).contains(*s_coordinates_re) && !coordinates_warning_shown) {
      result.warnings.push_back({ warning_type_e::unsupported_feature_dropped, line_number,
                                  Y("This file contains coordinates in the timestamp lines. Such coordinates are not supported and will be removed.") });
      coordinates_warning_shown = true;
    }

    entry_line_number = line_number;
    state             = STATE_SUBS;

    return true;
  };

  for (auto idx = 0u; idx < lines.size(); ++idx) {
    auto unstripped_line = lines[idx];
    auto s               = unstripped_line;
    stk::string::strip_back(s);

    line_number++;

    mxdebug_if(m_debug, fmt::format("line {0} state {1} content »{2}«\n", line_number,
                                    state == STATE_INITIAL ? "initial" : state == STATE_TIME ? "time" : state == STATE_SUBS ? "subs" : state == STATE_SKIP ? "skip" : "subs-or-number", s));

    if (s.empty()) {
      if ((STATE_INITIAL == state) || (STATE_TIME == state))
        continue;

      if (STATE_SKIP == state) {
        state = STATE_INITIAL;
        continue;
      }

      state = STATE_SUBS_OR_NUMBER;

      if (!subtitles.empty())
        subtitles += "\n";

      continue;
    }

    if (STATE_SKIP == state)
      continue;

    if (STATE_INITIAL == state) {
      if (is_number_line(s))
        state = STATE_TIME;

      else if (!start_entry(s)) {
        skip_or_throw(result, options, line_number, Y("Expected a subtitle number but found some text."));
        state = STATE_SKIP;
      }

    } else if (STATE_TIME == state) {
      if (!start_entry(s)) {
        add_entry();
        skip_or_throw(result, options, line_number, Y("Expected a SubRip timestamp line but found something else."));
        state = STATE_SKIP;
      }

    } else if (STATE_SUBS == state) {
      if (!subtitles.empty())
        subtitles += "\n";
      subtitles += unstripped_line;

    } else if (   is_number_line(s)
               && ((idx + 1) < lines.size())
               && Q(lines[idx + 1]).contains(timestamp_line_re()))
      state = STATE_TIME;

    else if (!start_entry(s)) {
      if (!subtitles.empty())
        subtitles += "\n";
      subtitles += unstripped_line;
    }
  }

  add_entry();
}

std::string
subrip_codec_c::format_text(event_c const &event,
                            document_c const &document,
                            codec_options_t const &options,
                            conversion_policy_c const &policy,
                            warnings_t &warnings)
  const {
  static std::optional<QRegularExpression> s_multiple_newlines_re;

  if (!s_multiple_newlines_re)
    s_multiple_newlines_re = QRegularExpression{"\n+"};

  std::string text;

  if (options.keep_ssa_tags) {
    document.resolve_style(event.m_style, &warnings);

    text = event.get_text();
    balg::replace_all(text, "\\h", " ");
    balg::replace_all(text, "\\n", "\n");
    balg::replace_all(text, "\\N", "\n");

  } else {
    auto support = policy.get_emphasis_support();
    text         = html::format_styled_lines(split_styled_lines(event, document, &warnings), { support.bold, support.italic, support.underline, support.strikeout });
  }

  return to_utf8(Q(stk::string::strip_copy(text, true)).replace(*s_multiple_newlines_re, "\n"));
}

std::string
subrip_codec_c::format_document(document_c const &document,
                                codec_options_t const &options,
                                conversion_policy_c &policy,
                                warnings_t &warnings)
  const {
  std::string out;
  auto number = 1u;

  for (auto idx = 0u; idx < document.num_events(); ++idx) {
    auto const &event = document.get_event(idx);

    if (!policy.check_event(idx, event, document))
      continue;

    out += fmt::format("{0}\n{1} --> {2}\n{3}\n\n",
                       number++,
                       format_time(event.get_start(), time_format_e::subrip),
                       format_time(event.get_end(),   time_format_e::subrip),
                       format_text(event, document, options, policy, warnings));
  }

  return out;
}

}
