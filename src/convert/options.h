/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   stkconvert options
*/

#pragma once

#include "common/common_pch.h"

#include "common/subtitles/codec_options.h"
#include "common/subtitles/formats.h"

class options_c {
public:
  std::vector<std::string> m_file_names;
  std::string m_output_file_name, m_output_dir, m_sub_charset;
  std::optional<stk::subtitles::format_e> m_from, m_to;
  std::optional<std::pair<double, double>> m_transform_framerate;
  int64_t m_shift_ms{};
  bool m_clean{}, m_sort{};
  int m_verbose{};

  stk::subtitles::codec_options_t m_codec_options;
};
