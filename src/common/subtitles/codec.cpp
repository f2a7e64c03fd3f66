/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   base class for subtitle format readers and writers
*/

#include "common/common_pch.h"

#include "common/strings/editing.h"
#include "common/strings/formatting.h"
#include "common/subtitles/codec.h"
#include "common/subtitles/html_markup.h"
#include "common/subtitles/microdvd_codec.h"
#include "common/subtitles/mpl2_codec.h"
#include "common/subtitles/subrip_codec.h"
#include "common/subtitles/substation_codec.h"
#include "common/subtitles/subtitles_x.h"
#include "common/subtitles/tmp_codec.h"
#include "common/subtitles/webvtt_codec.h"

namespace stk::subtitles {

codec_c::codec_c(format_e format,
                 std::string const &debug_option)
  : m_format{format}
  , m_debug{debug_option}
{
}

std::vector<std::string>
codec_c::split_lines(std::string const &text) {
  auto normalized = stk::string::normalize_line_endings(text);

  if (balg::starts_with(normalized, "\xef\xbb\xbf"))
    normalized.erase(0, 3);

  auto lines = stk::string::split(normalized, "\n");

  // A final line ending doesn't start another line.
  if ((lines.size() > 1) && lines.back().empty())
    lines.pop_back();

  return lines;
}

read_result_t
codec_c::read(std::string const &text,
              codec_options_t const &options)
  const {
  read_result_t result;

  result.document.m_source_format = get_format_name(m_format);

  parse(split_lines(text), options, result);

  if (options.language_detector)
    for (auto idx = 0u; idx < result.document.num_events(); ++idx) {
      auto &event      = result.document.get_event(idx);
      event.m_language = options.language_detector(event.plaintext());
    }

  mxdebug_if(m_debug, fmt::format("read {0} events and {1} styles, {2} warnings\n", result.document.num_events(), result.document.get_styles().size(), result.warnings.size()));

  return result;
}

write_result_t
codec_c::write(document_c const &document,
               codec_options_t const &options)
  const {
  write_result_t result;

  // Frame-based formats fall back to the document's frame rate.
  auto effective_options = options;
  if (!effective_options.frame_rate)
    effective_options.frame_rate = document.m_frame_rate;

  conversion_policy_c policy{m_format, effective_options};

  if (policy.check_empty_document(document))
    result.text = format_empty_document(document, effective_options);

  else {
    policy.check_document(document);
    result.text = format_document(document, effective_options, policy, result.warnings);
  }

  if (options.line_break_style == line_ending_e::cr_lf)
    result.text = stk::string::normalize_line_endings(result.text, stk::string::line_ending_style_e::cr_lf);

  result.lossy_mappings = policy.release_lossy_mappings();

  mxdebug_if(m_debug, fmt::format("wrote {0} bytes, {1} lossy mappings, {2} warnings\n", result.text.size(), result.lossy_mappings.size(), result.warnings.size()));

  return result;
}

std::string
codec_c::format_empty_document(document_c const &,
                               codec_options_t const &)
  const {
  return {};
}

void
codec_c::skip_or_throw(read_result_t &result,
                       codec_options_t const &options,
                       unsigned int line,
                       std::string const &details)
  const {
  if (options.strict)
    throw malformed_input_x{line, details};

  mxdebug_if(m_debug, fmt::format("skipping record in line {0}: {1}\n", line, details));

  result.warnings.push_back({ warning_type_e::skipped_record, line, details });
}

std::string
codec_c::strip_markup(std::string const &text,
                      codec_options_t const &options)
  const {
  return options.strip_html ? options.strip_html(text) : html::strip_tags(text);
}

// ------------------------------------------------------------

codec_cptr
create_codec(format_e format) {
  switch (format) {
    case format_e::ass:
    case format_e::ssa:      return std::make_shared<substation_codec_c>(format);
    case format_e::srt:      return std::make_shared<subrip_codec_c>();
    case format_e::microdvd: return std::make_shared<microdvd_codec_c>();
    case format_e::mpl2:     return std::make_shared<mpl2_codec_c>();
    case format_e::tmp:      return std::make_shared<tmp_codec_c>();
    case format_e::vtt:      return std::make_shared<webvtt_codec_c>();
  }

  throw unknown_format_x{fmt::to_string(static_cast<int>(format))};
}

format_e
autodetect_format(std::string const &text) {
  std::vector<format_e> matches;

  for (auto format : get_all_formats())
    if (create_codec(format)->probe(text))
      matches.emplace_back(format);

  if (matches.size() == 1)
    return matches.front();

  if (matches.empty())
    throw format_autodetection_x{Y("No suitable subtitle format was found.")};

  std::vector<std::string> names;
  for (auto format : matches)
    names.emplace_back(get_format_name(format));

  throw format_autodetection_x{fmt::format(FY("Multiple suitable subtitle formats were found: {0}"), stk::string::join(names, ", "))};
}

read_result_t
read_text(std::string const &text,
          std::optional<format_e> format,
          codec_options_t const &options) {
  return create_codec(format ? *format : autodetect_format(text))->read(text, options);
}

write_result_t
write_text(document_c const &document,
           format_e format,
           codec_options_t const &options) {
  return create_codec(format)->write(document, options);
}

}
