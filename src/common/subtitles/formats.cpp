/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   subtitle format identifiers and file name extensions
*/

#include "common/common_pch.h"

#include <boost/filesystem.hpp>

#include "common/strings/formatting.h"
#include "common/strings/editing.h"
#include "common/subtitles/formats.h"
#include "common/subtitles/subtitles_x.h"

namespace stk::subtitles {

namespace {

struct format_info_t {
  format_e format;
  char const *name, *extension, *description;
  time_format_e time_format;
};

std::vector<format_info_t> const s_formats{
  { format_e::ass,      "ass",      ".ass", "Advanced SubStation Alpha", time_format_e::substation },
  { format_e::ssa,      "ssa",      ".ssa", "SubStation Alpha v4",       time_format_e::substation },
  { format_e::srt,      "srt",      ".srt", "SubRip",                    time_format_e::subrip     },
  { format_e::microdvd, "microdvd", ".sub", "MicroDVD",                  time_format_e::microdvd   },
  { format_e::mpl2,     "mpl2",     ".txt", "MPL2",                      time_format_e::mpl2       },
  { format_e::tmp,      "tmp",      ".txt", "TMPlayer",                  time_format_e::tmp        },
  { format_e::vtt,      "vtt",      ".vtt", "WebVTT",                    time_format_e::webvtt     },
};

format_info_t const &
get_info(format_e format) {
  for (auto const &info : s_formats)
    if (info.format == format)
      return info;

  throw stk::invalid_parameter_x{fmt::format("unknown format_e value {0}", static_cast<int>(format))};
}

} // anonymous namespace

std::vector<format_e> const &
get_all_formats() {
  static std::vector<format_e> s_all_formats;

  if (s_all_formats.empty())
    for (auto const &info : s_formats)
      s_all_formats.emplace_back(info.format);

  return s_all_formats;
}

std::string
get_format_name(format_e format) {
  return get_info(format).name;
}

std::string
get_format_description(format_e format) {
  return get_info(format).description;
}

format_e
format_from_name(std::string const &name) {
  auto lower = stk::string::to_lower_ascii(stk::string::strip_copy(name));

  if (lower == "webvtt")
    return format_e::vtt;
  if (lower == "subrip")
    return format_e::srt;

  for (auto const &info : s_formats)
    if (lower == info.name)
      return info.format;

  throw unknown_format_x{name};
}

std::string
get_file_extension(format_e format) {
  return get_info(format).extension;
}

// ".txt" is shared by MPL2 and TMP; the lookup returns TMP for it.
format_e
format_from_extension(std::string const &extension) {
  auto lower = stk::string::to_lower_ascii(extension);
  if (!lower.empty() && (lower[0] != '.'))
    lower = "." + lower;

  for (auto const &info : s_formats)
    if ((lower == info.extension) && (info.format != format_e::mpl2))
      return info.format;

  throw unknown_format_x{extension};
}

format_e
format_from_file_name(std::string const &file_name) {
  return format_from_extension(boost::filesystem::path{file_name}.extension().string());
}

time_format_e
get_time_format(format_e format) {
  return get_info(format).time_format;
}

bool
is_substation(format_e format) {
  return (format == format_e::ass) || (format == format_e::ssa);
}

}
