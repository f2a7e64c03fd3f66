/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   WebVTT (.vtt) subtitles
*/

#include "common/common_pch.h"

#include <QRegularExpression>

#include "common/qt.h"
#include "common/strings/editing.h"
#include "common/subtitles/html_markup.h"
#include "common/subtitles/subtitles_x.h"
#include "common/subtitles/webvtt_codec.h"

namespace stk::subtitles {

namespace {

bool
is_header_line(std::string const &line) {
  return balg::starts_with(line, "WEBVTT") && ((line.size() == 6) || stk::string::is_blank_or_tab(line[6]));
}

bool
is_opaque_block(std::string const &first_line) {
  for (auto keyword : { "NOTE", "STYLE", "REGION" })
    if (   balg::starts_with(first_line, keyword)
        && ((first_line.size() == std::strlen(keyword)) || stk::string::is_blank_or_tab(first_line[std::strlen(keyword)])))
      return true;

  return false;
}

} // anonymous namespace

webvtt_codec_c::webvtt_codec_c()
  : codec_c{format_e::vtt, "webvtt_codec"}
{
}

bool
webvtt_codec_c::probe(std::string const &text)
  const {
  auto stripped = text;
  if (balg::starts_with(stripped, "\xef\xbb\xbf"))
    stripped.erase(0, 3);

  return balg::starts_with(stk::string::strip_copy(stripped, true), "WEBVTT");
}

void
webvtt_codec_c::parse(std::vector<std::string> const &lines,
                      codec_options_t const &options,
                      read_result_t &result)
  const {
  auto idx = 0u;

  while ((idx < lines.size()) && stk::string::strip_copy(lines[idx]).empty())
    ++idx;

  if ((idx >= lines.size()) || !is_header_line(lines[idx]))
    skip_or_throw(result, options, idx + 1, Y("The WEBVTT header is missing."));

  else {
    // Header block: the signature line plus optional metadata lines.
    for (++idx; (idx < lines.size()) && !stk::string::strip_copy(lines[idx]).empty(); ++idx)
      mxdebug_if(m_debug, fmt::format("line {0}: ignoring header metadata '{1}'\n", idx + 1, lines[idx]));
  }

  std::vector<std::string> block;
  auto first_line_number = 0u;

  for (; idx < lines.size(); ++idx) {
    if (stk::string::strip_copy(lines[idx]).empty()) {
      if (!block.empty())
        parse_block(block, first_line_number, options, result);
      block.clear();
      continue;
    }

    if (block.empty())
      first_line_number = idx + 1;

    block.emplace_back(lines[idx]);
  }

  if (!block.empty())
    parse_block(block, first_line_number, options, result);
}

void
webvtt_codec_c::parse_block(std::vector<std::string> const &block,
                            unsigned int first_line_number,
                            codec_options_t const &options,
                            read_result_t &result)
  const {
  static std::optional<QRegularExpression> s_timing_re;

  if (!s_timing_re)
    s_timing_re = QRegularExpression{"^\\s*(\\S+)\\s+-->\\s+(\\S+)(.*)$"};

  if (is_opaque_block(block.front())) {
    result.document.m_opaque_sections.push_back({ get_format_name(m_format), block.front(), { block.begin() + 1, block.end() } });
    return;
  }

  // An optional cue identifier precedes the timing line.
  auto timing_idx = block.front().find("-->") == std::string::npos ? 1u : 0u;
  auto line       = first_line_number + timing_idx;

  if (timing_idx >= block.size()) {
    skip_or_throw(result, options, first_line_number, Y("Expected a cue timing line."));
    return;
  }

  auto matches = s_timing_re->match(Q(block[timing_idx]));
  if (!matches.hasMatch()) {
    skip_or_throw(result, options, line, Y("Expected a cue timing line."));
    return;
  }

  try {
    auto start = parse_time(to_utf8(matches.captured(1)), time_format_e::webvtt);
    auto end   = parse_time(to_utf8(matches.captured(2)), time_format_e::webvtt);

    if (!matches.captured(3).trimmed().isEmpty())
      mxdebug_if(m_debug, fmt::format("line {0}: ignoring cue settings '{1}'\n", line, to_utf8(matches.captured(3).trimmed())));

    event_c event{start, end};
    parse_cue_text(event, boost::join(std::vector<std::string>{ block.begin() + timing_idx + 1, block.end() }, "\n"), options);

    result.document.add_event(std::move(event));

  } catch (stk::exception const &ex) {
    skip_or_throw(result, options, line, ex.what());
  }
}

void
webvtt_codec_c::parse_cue_text(event_c &event,
                               std::string const &text,
                               codec_options_t const &options)
  const {
  static std::optional<QRegularExpression> s_timestamp_tag_re, s_voice_re, s_voice_end_re;

  if (!s_timestamp_tag_re) {
    s_timestamp_tag_re = QRegularExpression{"<(?:\\d+:)?\\d{2}:\\d{2}\\.\\d{3}>"};
    s_voice_re         = QRegularExpression{"<v(?:\\.[^\\s>]*)?\\s+([^>]*)>"};
    s_voice_end_re     = QRegularExpression{"</v>"};
  }

  if (options.keep_html_tags) {
    event.set_text(text);
    return;
  }

  auto qtext   = Q(text).replace(*s_timestamp_tag_re, QString{});
  auto matches = s_voice_re->match(qtext);

  if (matches.hasMatch())
    event.m_name = to_utf8(matches.captured(1).trimmed());

  qtext          = qtext.replace(*s_voice_re, QString{}).replace(*s_voice_end_re, QString{});
  auto converted = html::emphasis_tags_to_override_tags(to_utf8(qtext));

  event.set_text(options.keep_unknown_html_tags ? converted : strip_markup(converted, options));
}

std::string
webvtt_codec_c::format_header(document_c const &document)
  const {
  std::string out{"WEBVTT\n\n"};

  for (auto const &section : document.m_opaque_sections) {
    if (section.origin_format != get_format_name(m_format))
      continue;

    out += section.name + "\n";
    for (auto const &line : section.lines)
      out += line + "\n";
    out += "\n";
  }

  return out;
}

std::string
webvtt_codec_c::format_empty_document(document_c const &document,
                                      codec_options_t const &)
  const {
  return format_header(document);
}

std::string
webvtt_codec_c::format_document(document_c const &document,
                                codec_options_t const &options,
                                conversion_policy_c &policy,
                                warnings_t &warnings)
  const {
  static std::optional<QRegularExpression> s_multiple_newlines_re;

  if (!s_multiple_newlines_re)
    s_multiple_newlines_re = QRegularExpression{"\n+"};

  std::vector<std::size_t> order;

  for (auto idx = 0u; idx < document.num_events(); ++idx)
    if (policy.check_event(idx, document.get_event(idx), document))
      order.emplace_back(idx);

  std::stable_sort(order.begin(), order.end(), [&document](std::size_t a, std::size_t b) {
    return document.get_event(a).get_start() < document.get_event(b).get_start();
  });

  auto out     = format_header(document);
  auto number  = 1u;
  auto support = policy.get_emphasis_support();

  for (auto idx : order) {
    auto const &event = document.get_event(idx);
    std::string text;

    if (options.keep_ssa_tags) {
      document.resolve_style(event.m_style, &warnings);
      text = unescape_text(event.get_text());

    } else
      text = html::format_styled_lines(split_styled_lines(event, document, &warnings), { support.bold, support.italic, support.underline, support.strikeout }, true);

    text = to_utf8(Q(stk::string::strip_copy(text, true)).replace(*s_multiple_newlines_re, "\n"));

    out += fmt::format("{0}\n{1} --> {2}\n{3}\n\n",
                       number++,
                       format_time(event.get_start(), time_format_e::webvtt, {}, options.timestamp_flavor),
                       format_time(event.get_end(),   time_format_e::webvtt, {}, options.timestamp_flavor),
                       text);
  }

  return out;
}

}
