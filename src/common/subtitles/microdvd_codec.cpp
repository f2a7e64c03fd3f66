/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   MicroDVD (.sub) subtitles
*/

#include "common/common_pch.h"

#include <QRegularExpression>

#include "common/qt.h"
#include "common/strings/editing.h"
#include "common/strings/formatting.h"
#include "common/strings/parsing.h"
#include "common/subtitles/microdvd_codec.h"
#include "common/subtitles/subtitles_x.h"

namespace stk::subtitles {

namespace {

QRegularExpression const &
line_re() {
  static std::optional<QRegularExpression> s_re;

  if (!s_re)
    s_re = QRegularExpression{"^\\{(\\d+)\\}\\{(\\d+)\\}(.*)$"};

  return *s_re;
}

// Control codes in lower case apply to a single line, in upper case to
// the whole subtitle.
std::string
convert_control_code(char code,
                     std::string const &value,
                     std::string &closing) {
  auto lower = std::tolower(static_cast<unsigned char>(code));
  std::string opening;

  if (lower == 'y') {
    for (auto flag : stk::string::to_lower_ascii(value))
      if (stk::included_in(flag, 'b', 'i', 'u', 's')) {
        opening += fmt::format("\\{0}1", flag);
        closing += fmt::format("\\{0}0", flag);
      }

  } else if (lower == 'c') {
    auto bgr = stk::string::strip_copy(value);
    if (balg::starts_with(bgr, "$"))
      bgr.erase(0, 1);

    if (auto color = color_c::from_override(bgr); color) {
      opening += "\\c" + color->to_override();
      closing += "\\c";
    }

  } else if (lower == 'f') {
    opening += "\\fn" + value;
    closing += "\\fn";

  } else if (lower == 's') {
    opening += "\\fs" + value;
    closing += "\\fs";
  }

  if (!std::islower(static_cast<unsigned char>(code)))
    closing.clear();

  return opening;
}

} // anonymous namespace

microdvd_codec_c::microdvd_codec_c()
  : codec_c{format_e::microdvd, "microdvd_codec"}
{
}

bool
microdvd_codec_c::probe(std::string const &text)
  const {
  static QRegularExpression s_probe_re{"^\\{\\d+\\}\\{\\d*\\}"};

  for (auto const &line : split_lines(text)) {
    auto stripped = stk::string::strip_copy(line);
    if (!stripped.empty())
      return Q(stripped).contains(s_probe_re);
  }

  return false;
}

std::string
microdvd_codec_c::control_codes_to_override_tags(std::string const &text) {
  static std::optional<QRegularExpression> s_code_re;

  if (!s_code_re)
    s_code_re = QRegularExpression{"\\{([yYcCfFsSpPhH]):([^}]*)\\}"};

  std::vector<std::string> converted_lines;

  for (auto const &line : stk::string::split(text, "|")) {
    std::string converted, closing;
    int position = 0;
    auto qline   = Q(line);
    auto itr     = s_code_re->globalMatch(qline);

    while (itr.hasNext()) {
      auto match   = itr.next();
      converted   += to_utf8(qline.mid(position, match.capturedStart(0) - position));
      auto opening = convert_control_code(match.captured(1).at(0).toLatin1(), to_utf8(match.captured(2)), closing);
      position     = match.capturedEnd(0);

      if (!opening.empty())
        converted += "{" + opening + "}";
    }

    converted += to_utf8(qline.mid(position));

    if (!closing.empty())
      converted += "{" + closing + "}";

    converted_lines.emplace_back(std::move(converted));
  }

  return stk::string::join(converted_lines, "\n");
}

void
microdvd_codec_c::parse(std::vector<std::string> const &lines,
                        codec_options_t const &options,
                        read_result_t &result)
  const {
  auto frame_rate  = options.frame_rate;
  auto line_number = 0u;

  for (auto const &line : lines) {
    ++line_number;

    auto stripped = stk::string::strip_copy(line);
    if (stripped.empty())
      continue;

    auto matches = line_re().match(Q(stripped));
    if (!matches.hasMatch()) {
      skip_or_throw(result, options, line_number, Y("Expected a '{start}{end}text' line."));
      continue;
    }

    auto start_text = to_utf8(matches.captured(1));
    auto end_text   = to_utf8(matches.captured(2));
    auto text       = to_utf8(matches.captured(3));

    // "{1}{1}23.976" declares the frame rate.
    int64_t start_frame{}, end_frame{};
    double declared_frame_rate{};
    if (   result.document.num_events() == 0
        && stk::string::parse_number(start_text, start_frame)
        && stk::string::parse_number(end_text,   end_frame)
        && (start_frame <= 1)
        && (end_frame   <= 1)
        && stk::string::parse_number(stk::string::strip_copy(text), declared_frame_rate)
        && (declared_frame_rate > 0)) {
      mxdebug_if(m_debug, fmt::format("line {0}: frame rate declaration {1}{2}\n", line_number, declared_frame_rate, frame_rate ? " (overridden by the configured one)" : ""));
      if (!frame_rate)
        frame_rate = declared_frame_rate;
      continue;
    }

    if (!frame_rate)
      throw missing_frame_rate_x{get_format_description(m_format)};

    try {
      event_c event{parse_time(start_text, time_format_e::microdvd, frame_rate), parse_time(end_text, time_format_e::microdvd, frame_rate)};
      event.set_text(control_codes_to_override_tags(text));
      result.document.add_event(std::move(event));

    } catch (malformed_timestamp_x const &ex) {
      skip_or_throw(result, options, line_number, ex.what());

    } catch (invalid_timing_x const &ex) {
      skip_or_throw(result, options, line_number, ex.what());
    }
  }

  result.document.m_frame_rate = frame_rate;
}

std::string
microdvd_codec_c::format_text(event_c const &event,
                              document_c const &document,
                              conversion_policy_c const &policy,
                              warnings_t &warnings)
  const {
  auto const &style = document.resolve_style(event.m_style, &warnings);
  auto lines        = split_styled_lines(event, document);
  auto support      = policy.get_emphasis_support();
  std::string color_code;
  std::vector<std::string> formatted_lines;

  for (auto const &line : lines) {
    std::string text, flags;

    for (auto const &segment : line)
      text += segment.text;

    if (!line.empty()) {
      auto const &line_style = line.front().style;

      if (support.bold      && line_style.m_bold)      flags += "b";
      if (support.italic    && line_style.m_italic)    flags += "i";
      if (support.underline && line_style.m_underline) flags += "u";
      if (support.strikeout && line_style.m_strikeout) flags += "s";

      if (color_code.empty() && (line_style.m_primary_color != style.m_primary_color)) {
        auto const &color = line_style.m_primary_color;
        color_code        = fmt::format("{{C:${0:02X}{1:02X}{2:02X}}}", color.m_b, color.m_g, color.m_r);
      }
    }

    formatted_lines.emplace_back((flags.empty() ? std::string{} : fmt::format("{{y:{0}}}", flags)) + text);
  }

  return color_code + stk::string::join(formatted_lines, "|");
}

std::string
microdvd_codec_c::format_document(document_c const &document,
                                  codec_options_t const &options,
                                  conversion_policy_c &policy,
                                  warnings_t &warnings)
  const {
  if (!options.frame_rate)
    throw missing_frame_rate_x{get_format_description(m_format)};

  std::string out;

  if (options.write_frame_rate_declaration)
    out += fmt::format("{{1}}{{1}}{0}\n", stk::string::normalize_fmt_double_output(*options.frame_rate));

  for (auto idx = 0u; idx < document.num_events(); ++idx) {
    auto const &event = document.get_event(idx);

    if (!policy.check_event(idx, event, document))
      continue;

    out += fmt::format("{{{0}}}{{{1}}}{2}\n",
                       format_time(event.get_start(), time_format_e::microdvd, options.frame_rate),
                       format_time(event.get_end(),   time_format_e::microdvd, options.frame_rate),
                       format_text(event, document, policy, warnings));
  }

  return out;
}

}
