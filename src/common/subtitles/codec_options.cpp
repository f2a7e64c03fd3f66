/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   per-invocation settings for reading and writing subtitles
*/

#include "common/common_pch.h"

#include "common/subtitles/codec_options.h"

namespace stk::subtitles {

std::string const &
codec_options_t::get_line_ending()
  const {
  static std::string const s_lf{"\n"}, s_cr_lf{"\r\n"};

  return line_break_style == line_ending_e::cr_lf ? s_cr_lf : s_lf;
}

}
