/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   millisecond-resolution timestamps
*/

#pragma once

#include "common/common_pch.h"

#include <cmath>
#include <stdexcept>

#include <boost/operators.hpp>

template<typename T>
class basic_timestamp_c
  : boost::totally_ordered< basic_timestamp_c<T> >
{
private:
  T m_timestamp;

  explicit basic_timestamp_c(T timestamp)
    : m_timestamp{timestamp}
  {
    if (timestamp < 0)
      throw std::domain_error{"negative timestamp"};
  }

  static T round_to_int(double value) {
    return static_cast<T>(std::llround(value));
  }

  static void validate_frame_rate(double fps) {
    if (!(fps > 0))
      throw stk::invalid_parameter_x{fmt::format("invalid frame rate {0}", fps)};
  }

public:
  basic_timestamp_c()
    : m_timestamp{}
  {
  }

  // deconstruction
  T to_ms() const {
    return m_timestamp;
  }

  T to_cs() const {
    return m_timestamp / 10;
  }

  T to_ds() const {
    return m_timestamp / 100;
  }

  T to_s() const {
    return m_timestamp / 1000;
  }

  T to_m() const {
    return m_timestamp / 60000;
  }

  T to_h() const {
    return m_timestamp / 3600000;
  }

  T to_frames(double fps) const {
    validate_frame_rate(fps);
    return round_to_int(m_timestamp * fps / 1000.0);
  }

  // arithmetic; results are clamped at zero
  basic_timestamp_c<T> shifted(T delta) const {
    return basic_timestamp_c<T>{std::max<T>(m_timestamp + delta, 0)};
  }

  basic_timestamp_c<T> scaled(double factor,
                              basic_timestamp_c<T> const &pivot) const {
    auto value = pivot.m_timestamp + (m_timestamp - pivot.m_timestamp) * factor;
    return basic_timestamp_c<T>{std::max<T>(round_to_int(value), 0)};
  }

  T difference(basic_timestamp_c<T> const &other) const {
    return m_timestamp - other.m_timestamp;
  }

  // comparison
  bool operator <(basic_timestamp_c<T> const &other) const {
    return m_timestamp < other.m_timestamp;
  }

  bool operator ==(basic_timestamp_c<T> const &other) const {
    return m_timestamp == other.m_timestamp;
  }

  // construction
  static basic_timestamp_c<T> ms(T value) {
    return basic_timestamp_c<T>{value};
  }

  static basic_timestamp_c<T> cs(T value) {
    return basic_timestamp_c<T>{value * 10};
  }

  static basic_timestamp_c<T> ds(T value) {
    return basic_timestamp_c<T>{value * 100};
  }

  static basic_timestamp_c<T> s(T value) {
    return basic_timestamp_c<T>{value * 1000};
  }

  static basic_timestamp_c<T> m(T value) {
    return basic_timestamp_c<T>{value * 60 * 1000};
  }

  static basic_timestamp_c<T> h(T value) {
    return basic_timestamp_c<T>{value * 3600 * 1000};
  }

  static basic_timestamp_c<T> hms(T hours, T minutes, T seconds, T milliseconds = 0) {
    return basic_timestamp_c<T>{((hours * 60 + minutes) * 60 + seconds) * 1000 + milliseconds};
  }

  static basic_timestamp_c<T> frames(T frame_number, double fps) {
    validate_frame_rate(fps);
    return basic_timestamp_c<T>{round_to_int(frame_number * 1000.0 / fps)};
  }

  // min/max
  static basic_timestamp_c<T> min() {
    return ms(0);
  }

  static basic_timestamp_c<T> max() {
    return ms(std::numeric_limits<T>::max());
  }
};

using timestamp_c = basic_timestamp_c<int64_t>;

inline int64_t
frames_to_ms(int64_t frame_number,
             double fps) {
  return timestamp_c::frames(frame_number, fps).to_ms();
}

inline int64_t
ms_to_frames(int64_t ms,
             double fps) {
  return timestamp_c::ms(ms).to_frames(fps);
}

template<typename T>
std::ostream &
operator <<(std::ostream &out,
            basic_timestamp_c<T> const &timestamp) {
  auto ms = timestamp.to_ms();
  out << fmt::format("{0:02}:{1:02}:{2:02}.{3:03}", ms / 3600000, (ms / 60000) % 60, (ms / 1000) % 60, ms % 1000);
  return out;
}

#if FMT_VERSION >= 90000
template <> struct fmt::formatter<basic_timestamp_c<int64_t>> : ostream_formatter {};
#endif  // FMT_VERSION >= 90000
