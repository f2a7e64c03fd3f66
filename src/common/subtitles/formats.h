/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   subtitle format identifiers and file name extensions
*/

#pragma once

#include "common/common_pch.h"

#include "common/subtitles/time_format.h"

namespace stk::subtitles {

enum class format_e {
  ass,
  ssa,
  srt,
  microdvd,
  mpl2,
  tmp,
  vtt,
};

std::vector<format_e> const &get_all_formats();

std::string get_format_name(format_e format);
std::string get_format_description(format_e format);
format_e format_from_name(std::string const &name);

std::string get_file_extension(format_e format);
format_e format_from_extension(std::string const &extension);
format_e format_from_file_name(std::string const &file_name);

time_format_e get_time_format(format_e format);
bool is_substation(format_e format);

}
