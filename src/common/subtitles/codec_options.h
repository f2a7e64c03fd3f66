/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   per-invocation settings for reading and writing subtitles
*/

#pragma once

#include "common/common_pch.h"

#include "common/subtitles/time_format.h"

namespace stk::subtitles {

enum class line_ending_e {
  lf,
  cr_lf,
};

using language_detector_t = std::function<std::optional<std::string>(std::string const &)>;
using html_stripper_t     = std::function<std::string(std::string const &)>;

struct codec_options_t {
  // Reading
  bool strict{true};
  bool keep_html_tags{}, keep_unknown_html_tags{};
  language_detector_t language_detector;
  html_stripper_t strip_html;

  // Reading and writing frame-based formats
  std::optional<double> frame_rate;

  // Writing
  timestamp_flavor_e timestamp_flavor{timestamp_flavor_e::standard};
  line_ending_e line_break_style{line_ending_e::lf};
  bool apply_styles{true}, keep_ssa_tags{};
  bool write_frame_rate_declaration{};

  std::string const &get_line_ending() const;
};

}
