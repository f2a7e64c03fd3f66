/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   textual timestamp grammars of the supported subtitle formats
*/

#pragma once

#include "common/common_pch.h"

#include "common/timestamp.h"

namespace stk::subtitles {

enum class time_format_e {
  substation,                   // H:MM:SS.cc
  subrip,                       // HH:MM:SS,mmm
  webvtt,                       // [HH:]MM:SS.mmm
  microdvd,                     // frame numbers
  mpl2,                         // deciseconds
  tmp,                          // HH:MM:SS
};

enum class timestamp_flavor_e {
  standard,
  compact,                      // WebVTT: hours omitted when zero
};

constexpr int64_t SUBSTATION_MAX_TIME_MS = 10ll * 3600 * 1000 - 10;
constexpr int64_t SUBRIP_MAX_TIME_MS     = 100ll * 3600 * 1000 - 1;

// Upper bounds for frame numbers and decisecond counters, and for the
// time a frame number may resolve to.
constexpr int64_t COUNTER_MAX_VALUE       = 999'999'999;
constexpr int64_t COUNTER_MAX_TIME_MS     = 1000ll * 1000 * 1000 * 1000;

std::string get_time_format_name(time_format_e format);
bool is_frame_based(time_format_e format);

timestamp_c parse_time(std::string const &text, time_format_e format, std::optional<double> const &frame_rate = {});
std::string format_time(timestamp_c const &time, time_format_e format, std::optional<double> const &frame_rate = {}, timestamp_flavor_e flavor = timestamp_flavor_e::standard);

timestamp_c quantize_time(timestamp_c const &time, time_format_e format, std::optional<double> const &frame_rate = {});
bool is_time_representable(timestamp_c const &time, time_format_e format, std::optional<double> const &frame_rate = {});

}
