/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   stkconvert command line parsing
*/

#include "common/common_pch.h"

#include "common/strings/editing.h"
#include "common/strings/parsing.h"
#include "common/subtitles/subtitles_x.h"
#include "common/translation.h"
#include "convert/convert_cli_parser.h"
#include "convert/options.h"

convert_cli_parser_c::convert_cli_parser_c(const std::vector<std::string> &args)
  : stk::cli::parser_c{args}
{
  verbose = 0;
}

void
convert_cli_parser_c::init_parser() {
  add_information(YT("stkconvert [options] <input> [<input> ...]"));

  add_section_header(YT("Formats"));

  add_option("f|from=<format>",                     std::bind(&convert_cli_parser_c::set_from,                   this), YT("Format of the input files ('ass', 'ssa', 'srt', 'microdvd', 'mpl2', 'tmp' or 'vtt'). Detected from the content if not given."));
  add_option("t|to=<format>",                       std::bind(&convert_cli_parser_c::set_to,                     this), YT("Format to write. Derived from the output file name if not given."));
  add_option("sub-charset=<charset>",               std::bind(&convert_cli_parser_c::set_sub_charset,            this), YT("Character set of the input files unless they start with a byte order mark."));

  add_section_header(YT("Output"));

  add_option("o|output=<file>",                     std::bind(&convert_cli_parser_c::set_output,                 this), YT("Write the result to this file. Only allowed with a single input file."));
  add_option("output-dir=<dir>",                    std::bind(&convert_cli_parser_c::set_output_dir,             this), YT("Write the results into this directory instead of next to the input files."));
  add_option("crlf",                                std::bind(&convert_cli_parser_c::set_crlf,                   this), YT("Use CR LF line endings in the output."));

  add_section_header(YT("Timing"));

  add_option("fps=<rate>",                          std::bind(&convert_cli_parser_c::set_fps,                    this), YT("Frame rate for frame-based formats (e.g. '25', '23.976' or '24000/1001')."));
  add_option("shift=<duration>",                    std::bind(&convert_cli_parser_c::set_shift,                  this), YT("Shift all events forward by this duration (e.g. '1.5s', '250ms' or '00:00:01.500')."));
  add_option("shift-back=<duration>",               std::bind(&convert_cli_parser_c::set_shift_back,             this), YT("Shift all events backward by this duration."));
  add_option("transform-framerate=<in>,<out>",      std::bind(&convert_cli_parser_c::set_transform_framerate,    this), YT("Rescale all times as if the video was converted from the first to the second frame rate."));

  add_section_header(YT("Processing"));

  add_option("strict",                              std::bind(&convert_cli_parser_c::set_strict,                 this), YT("Abort on the first malformed record (default)."));
  add_option("lenient",                             std::bind(&convert_cli_parser_c::set_lenient,                this), YT("Skip malformed records and report them as warnings."));
  add_option("keep-html-tags",                      std::bind(&convert_cli_parser_c::set_keep_html_tags,         this), YT("Keep HTML tags found in SubRip and WebVTT files as they are."));
  add_option("keep-unknown-html-tags",              std::bind(&convert_cli_parser_c::set_keep_unknown_html_tags, this), YT("Keep HTML tags that have no override tag equivalent."));
  add_option("clean",                               std::bind(&convert_cli_parser_c::set_clean,                  this), YT("Remove comments, drawings, empty and duplicate events."));
  add_option("sort",                                std::bind(&convert_cli_parser_c::set_sort,                   this), YT("Sort the events by their start and end times."));

  add_common_options();

  m_positional_cb = std::bind(&convert_cli_parser_c::add_file_name, this);
}

stk::subtitles::format_e
convert_cli_parser_c::parse_format_arg() {
  try {
    return stk::subtitles::format_from_name(m_next_arg);
  } catch (stk::subtitles::unknown_format_x &) {
    mxerror(fmt::format(FY("Unknown format '{0}' given to '{1}'.\n"), m_next_arg, m_current_arg));
  }

  return stk::subtitles::format_e::srt;
}

int64_t
convert_cli_parser_c::parse_shift_arg() {
  int64_t value{};

  if (!stk::string::parse_timestamp(m_next_arg, value) || (0 > value))
    mxerror(fmt::format(FY("Invalid duration '{0}' given to '{1}': {2}\n"), m_next_arg, m_current_arg, stk::string::timestamp_parser_error));

  return value;
}

void
convert_cli_parser_c::set_from() {
  m_options.m_from = parse_format_arg();
}

void
convert_cli_parser_c::set_to() {
  m_options.m_to = parse_format_arg();
}

void
convert_cli_parser_c::set_output() {
  m_options.m_output_file_name = m_next_arg;
}

void
convert_cli_parser_c::set_output_dir() {
  m_options.m_output_dir = m_next_arg;
}

void
convert_cli_parser_c::set_fps() {
  double fps{};

  if (!stk::string::parse_frame_rate(m_next_arg, fps))
    mxerror(fmt::format(FY("Invalid frame rate '{0}'.\n"), m_next_arg));

  m_options.m_codec_options.frame_rate = fps;
}

void
convert_cli_parser_c::set_shift() {
  m_options.m_shift_ms += parse_shift_arg();
}

void
convert_cli_parser_c::set_shift_back() {
  m_options.m_shift_ms -= parse_shift_arg();
}

void
convert_cli_parser_c::set_transform_framerate() {
  auto parts = stk::string::split(m_next_arg, ",");
  double in_fps{}, out_fps{};

  if (   (parts.size() != 2)
      || !stk::string::parse_frame_rate(stk::string::strip_copy(parts[0]), in_fps)
      || !stk::string::parse_frame_rate(stk::string::strip_copy(parts[1]), out_fps))
    mxerror(fmt::format(FY("Invalid argument '{0}' to '{1}': expected two frame rates separated by a comma.\n"), m_next_arg, m_current_arg));

  m_options.m_transform_framerate = std::make_pair(in_fps, out_fps);
}

void
convert_cli_parser_c::set_strict() {
  m_options.m_codec_options.strict = true;
}

void
convert_cli_parser_c::set_lenient() {
  m_options.m_codec_options.strict = false;
}

void
convert_cli_parser_c::set_sub_charset() {
  m_options.m_sub_charset = m_next_arg;
}

void
convert_cli_parser_c::set_keep_html_tags() {
  m_options.m_codec_options.keep_html_tags = true;
}

void
convert_cli_parser_c::set_keep_unknown_html_tags() {
  m_options.m_codec_options.keep_unknown_html_tags = true;
}

void
convert_cli_parser_c::set_crlf() {
  m_options.m_codec_options.line_break_style = stk::subtitles::line_ending_e::cr_lf;
}

void
convert_cli_parser_c::set_clean() {
  m_options.m_clean = true;
}

void
convert_cli_parser_c::set_sort() {
  m_options.m_sort = true;
}

void
convert_cli_parser_c::add_file_name() {
  if (!m_options_ended && (1 < m_current_arg.size()) && (m_current_arg[0] == '-'))
    mxerror(fmt::format(FY("Unknown option '{0}'.\n"), m_current_arg));

  m_options.m_file_names.push_back(m_current_arg);
}

void
convert_cli_parser_c::validate() {
  if (m_options.m_file_names.empty())
    mxerror(Y("No input file name given.\n"));

  if (!m_options.m_output_file_name.empty() && (1 < m_options.m_file_names.size()))
    mxerror(Y("'--output' can only be used with a single input file.\n"));

  if (!m_options.m_output_file_name.empty() && !m_options.m_output_dir.empty())
    mxerror(Y("'--output' and '--output-dir' cannot be used together.\n"));

  if (m_options.m_to)
    return;

  if (m_options.m_output_file_name.empty())
    mxerror(Y("No output format given. Use '--to' or an output file name with a known extension.\n"));

  try {
    m_options.m_to = stk::subtitles::format_from_file_name(m_options.m_output_file_name);
  } catch (stk::subtitles::unknown_format_x &) {
    mxerror(fmt::format(FY("The output format cannot be derived from the file name '{0}'. Use '--to'.\n"), m_options.m_output_file_name));
  }
}

options_c
convert_cli_parser_c::run() {
  init_parser();
  parse_args();
  validate();

  m_options.m_verbose = verbose;
  verbose             = 0;

  return m_options;
}
