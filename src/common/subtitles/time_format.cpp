/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   textual timestamp grammars of the supported subtitle formats
*/

#include "common/common_pch.h"

#include <QRegularExpression>

#include "common/qt.h"
#include "common/strings/editing.h"
#include "common/strings/parsing.h"
#include "common/subtitles/subtitles_x.h"
#include "common/subtitles/time_format.h"

namespace stk::subtitles {

namespace {

int64_t
scale_fraction(QString const &digits) {
  if (digits.isEmpty())
    return 0;

  int64_t fraction{};
  stk::string::parse_number(to_utf8(digits), fraction);

  for (auto num_digits = digits.length(); num_digits < 3; ++num_digits)
    fraction *= 10;

  return fraction;
}

double
require_frame_rate(time_format_e format,
                   std::optional<double> const &frame_rate) {
  if (!frame_rate)
    throw missing_frame_rate_x{get_time_format_name(format)};
  if (!(*frame_rate > 0))
    throw stk::invalid_parameter_x{fmt::format(FY("Invalid frame rate {0}"), *frame_rate)};
  return *frame_rate;
}

timestamp_c
parse_clock_time(std::string const &text,
                 time_format_e format,
                 QRegularExpression const &re) {
  auto matches = re.match(Q(stk::string::strip_copy(text)));
  if (!matches.hasMatch())
    throw malformed_timestamp_x{text, get_time_format_name(format)};

  int64_t hours{}, minutes{}, seconds{};
  if (matches.capturedLength(1))
    stk::string::parse_number(to_utf8(matches.captured(1)), hours);
  stk::string::parse_number(to_utf8(matches.captured(2)), minutes);
  stk::string::parse_number(to_utf8(matches.captured(3)), seconds);

  if ((minutes >= 60) || (seconds >= 60))
    throw malformed_timestamp_x{text, get_time_format_name(format)};

  return timestamp_c::hms(hours, minutes, seconds, scale_fraction(matches.captured(4)));
}

timestamp_c
parse_counter(std::string const &text,
              time_format_e format) {
  auto stripped = stk::string::strip_copy(text);
  int64_t value{};

  if (   stripped.empty()
      || (stripped.size() > 9)
      || !std::all_of(stripped.begin(), stripped.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })
      || !stk::string::parse_number(stripped, value)
      || (value > COUNTER_MAX_VALUE))
    throw malformed_timestamp_x{text, get_time_format_name(format)};

  return timestamp_c::ms(value);
}

} // anonymous namespace

std::string
get_time_format_name(time_format_e format) {
  switch (format) {
    case time_format_e::substation: return "SubStation Alpha";
    case time_format_e::subrip:     return "SubRip";
    case time_format_e::webvtt:     return "WebVTT";
    case time_format_e::microdvd:   return "MicroDVD";
    case time_format_e::mpl2:       return "MPL2";
    case time_format_e::tmp:        return "TMP";
  }

  return "unknown";
}

bool
is_frame_based(time_format_e format) {
  return format == time_format_e::microdvd;
}

timestamp_c
parse_time(std::string const &text,
           time_format_e format,
           std::optional<double> const &frame_rate) {
  static std::optional<QRegularExpression> s_substation_re, s_subrip_re, s_webvtt_re, s_tmp_re;

  if (!s_substation_re) {
    s_substation_re = QRegularExpression{"^(\\d{1,2}):(\\d{1,2}):(\\d{1,2})[.,:](\\d{1,3})$"};
    s_subrip_re     = QRegularExpression{"^(\\d{1,2}):(\\d{1,2}):(\\d{1,2})[.,](\\d{1,3})$"};
    s_webvtt_re     = QRegularExpression{"^(?:(\\d{1,4}):)?(\\d{2}):(\\d{2})\\.(\\d{3})$"};
    s_tmp_re        = QRegularExpression{"^(\\d{1,2}):(\\d{2}):(\\d{2})()$"};
  }

  switch (format) {
    case time_format_e::substation: return parse_clock_time(text, format, *s_substation_re);
    case time_format_e::subrip:     return parse_clock_time(text, format, *s_subrip_re);
    case time_format_e::webvtt:     return parse_clock_time(text, format, *s_webvtt_re);
    case time_format_e::tmp:        return parse_clock_time(text, format, *s_tmp_re);
    case time_format_e::mpl2:       return timestamp_c::ds(parse_counter(text, format).to_ms());
    case time_format_e::microdvd: {
      auto fps   = require_frame_rate(format, frame_rate);
      auto frame = parse_counter(text, format).to_ms();

      if ((frame * 1000.0 / fps) > static_cast<double>(COUNTER_MAX_TIME_MS))
        throw malformed_timestamp_x{text, get_time_format_name(format)};

      return timestamp_c::frames(frame, fps);
    }
  }

  throw malformed_timestamp_x{text, get_time_format_name(format)};
}

std::string
format_time(timestamp_c const &time,
            time_format_e format,
            std::optional<double> const &frame_rate,
            timestamp_flavor_e flavor) {
  auto ms = time.to_ms();

  switch (format) {
    case time_format_e::substation: {
      // Rounded to the nearest centisecond, half up.
      ms = std::min<int64_t>((ms + 5) / 10 * 10, SUBSTATION_MAX_TIME_MS);
      return fmt::format("{0:01}:{1:02}:{2:02}.{3:02}", ms / 3600000, (ms / 60000) % 60, (ms / 1000) % 60, (ms % 1000) / 10);
    }

    case time_format_e::subrip:
      ms = std::min<int64_t>(ms, SUBRIP_MAX_TIME_MS);
      return fmt::format("{0:02}:{1:02}:{2:02},{3:03}", ms / 3600000, (ms / 60000) % 60, (ms / 1000) % 60, ms % 1000);

    case time_format_e::webvtt:
      if ((flavor == timestamp_flavor_e::compact) && (ms < 3600000))
        return fmt::format("{0:02}:{1:02}.{2:03}", (ms / 60000) % 60, (ms / 1000) % 60, ms % 1000);
      return fmt::format("{0:02}:{1:02}:{2:02}.{3:03}", ms / 3600000, (ms / 60000) % 60, (ms / 1000) % 60, ms % 1000);

    case time_format_e::tmp:
      return fmt::format("{0:02}:{1:02}:{2:02}", ms / 3600000, (ms / 60000) % 60, (ms / 1000) % 60);

    case time_format_e::mpl2:
      return fmt::to_string((ms + 50) / 100);

    case time_format_e::microdvd:
      return fmt::to_string(time.to_frames(require_frame_rate(format, frame_rate)));
  }

  return {};
}

timestamp_c
quantize_time(timestamp_c const &time,
              time_format_e format,
              std::optional<double> const &frame_rate) {
  return parse_time(format_time(time, format, frame_rate), format, frame_rate);
}

bool
is_time_representable(timestamp_c const &time,
                      time_format_e format,
                      std::optional<double> const &frame_rate) {
  return quantize_time(time, format, frame_rate) == time;
}

}
