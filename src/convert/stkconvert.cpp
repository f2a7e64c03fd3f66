/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   converts subtitle files between the supported text formats
*/

#include "common/common_pch.h"

#include <boost/filesystem.hpp>

#include "common/command_line.h"
#include "common/debugging.h"
#include "common/subtitles/codec.h"
#include "common/subtitles/subtitles_x.h"
#include "common/text_input.h"
#include "convert/convert_cli_parser.h"

namespace bfs = boost::filesystem;
namespace sts = stk::subtitles;

namespace {

debugging_option_c s_debug{"stkconvert"};

std::string
output_file_name_for(options_c const &options,
                     std::string const &input_file_name) {
  if (!options.m_output_file_name.empty())
    return options.m_output_file_name;

  auto path = bfs::path{input_file_name};
  path.replace_extension(sts::get_file_extension(*options.m_to));

  if (!options.m_output_dir.empty())
    path = bfs::path{options.m_output_dir} / path.filename();

  return path.string();
}

void
report_warnings(std::string const &file_name,
                sts::warnings_t const &warnings) {
  for (auto const &warning : warnings)
    mxwarn_fn(file_name, fmt::format("{0}\n", warning.format()));
}

std::size_t
convert_file(options_c const &options,
             std::string const &input_file_name) {
  auto decoded = stk::text_input::decode(stk::text_input::read_file(input_file_name), options.m_sub_charset);

  mxdebug_if(s_debug, fmt::format("{0}: decoded as {1} (byte order mark: {2})\n", input_file_name, decoded.encoding, decoded.had_byte_order_mark));

  sts::warnings_t warnings;

  if (decoded.had_invalid_utf8)
    warnings.push_back({ sts::warning_type_e::invalid_utf8, {}, Y("The input contained invalid UTF-8 byte sequences which have been replaced.") });

  auto read_result = sts::read_text(decoded.text, options.m_from, options.m_codec_options);
  auto &document   = read_result.document;

  std::copy(read_result.warnings.begin(), read_result.warnings.end(), std::back_inserter(warnings));

  if (options.m_transform_framerate)
    document.transform_framerate(options.m_transform_framerate->first, options.m_transform_framerate->second);

  if (options.m_shift_ms)
    document.shift(options.m_shift_ms);

  if (options.m_clean)
    document.remove_miscellaneous_events();

  if (options.m_sort)
    document.sort();

  auto write_result     = sts::write_text(document, *options.m_to, options.m_codec_options);
  auto output_file_name = output_file_name_for(options, input_file_name);

  std::copy(write_result.warnings.begin(), write_result.warnings.end(), std::back_inserter(warnings));
  for (auto const &mapping : write_result.lossy_mappings)
    warnings.push_back(mapping.to_warning());

  stk::text_input::write_file(output_file_name, write_result.text);

  report_warnings(input_file_name, warnings);

  if (1 <= options.m_verbose)
    mxinfo(fmt::format(FY("'{0}' -> '{1}': {2} event(s), {3} lossy mapping(s).\n"), input_file_name, output_file_name, document.num_events(), write_result.num_lossy_mappings()));

  return warnings.size();
}

}

int
main(int argc,
     char **argv) {
  stk_common_init("stkconvert");

  auto options      = convert_cli_parser_c(stk::cli::args_in_utf8(argc, argv)).run();
  auto num_warnings = std::size_t{};

  for (auto const &file_name : options.m_file_names) {
    try {
      num_warnings += convert_file(options, file_name);

    } catch (stk::exception &ex) {
      mxerror_fn(file_name, fmt::format("{0}\n", ex.what()));
    }
  }

  if (num_warnings)
    mxinfo(fmt::format(FNY("Conversion finished with {0} warning.\n", "Conversion finished with {0} warnings.\n", num_warnings), num_warnings));

  mxexit(0);

  return 0;
}
