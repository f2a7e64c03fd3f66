/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   stkconvert command line parsing
*/

#pragma once

#include "common/common_pch.h"

#include "common/cli_parser.h"
#include "convert/options.h"

class convert_cli_parser_c: public stk::cli::parser_c {
protected:
  options_c m_options;

public:
  convert_cli_parser_c(const std::vector<std::string> &args);

  options_c run();

protected:
  void init_parser();

  void set_from();
  void set_to();
  void set_output();
  void set_output_dir();
  void set_fps();
  void set_shift();
  void set_shift_back();
  void set_transform_framerate();
  void set_strict();
  void set_lenient();
  void set_sub_charset();
  void set_keep_html_tags();
  void set_keep_unknown_html_tags();
  void set_crlf();
  void set_clean();
  void set_sort();
  void add_file_name();

  int64_t parse_shift_arg();
  stk::subtitles::format_e parse_format_arg();
  void validate();
};
