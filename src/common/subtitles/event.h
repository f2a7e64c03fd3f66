/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   a single subtitle event
*/

#pragma once

#include "common/common_pch.h"

#include "common/timestamp.h"
#include "common/subtitles/style.h"

namespace stk::subtitles {

enum class event_type_e {
  dialogue,
  comment,
  picture,
  sound,
  movie,
  command,
};

std::string event_type_to_string(event_type_e type);
std::optional<event_type_e> event_type_from_string(std::string const &name);

// Native line break encodings. Event text always uses '\n' internally.
enum class line_break_e {
  newline,
  substation,                   // \N
  pipe,                         // |
};

struct event_margins_t {
  std::optional<int> left, right, vertical;

  bool operator ==(event_margins_t const &other) const;
  bool operator !=(event_margins_t const &other) const {
    return !(*this == other);
  }
  bool empty() const {
    return !left && !right && !vertical;
  }
};

class event_c {
protected:
  timestamp_c m_start, m_end;
  std::string m_text;

public:
  std::string m_style{style_c::DEFAULT_NAME}, m_name, m_effect;
  int m_layer{};
  bool m_marked{};
  event_margins_t m_margins;
  event_type_e m_type{event_type_e::dialogue};
  std::optional<std::string> m_language;

public:
  event_c();
  event_c(timestamp_c const &start, timestamp_c const &end, std::string text = {}, std::string style = style_c::DEFAULT_NAME);

  timestamp_c const &get_start() const {
    return m_start;
  }

  timestamp_c const &get_end() const {
    return m_end;
  }

  void set_start(timestamp_c const &start);
  void set_end(timestamp_c const &end);
  void set_times(timestamp_c const &start, timestamp_c const &end);

  int64_t duration() const;
  void set_duration(int64_t duration_ms);

  std::string const &get_text() const {
    return m_text;
  }

  std::string get_text(line_break_e convention) const;
  void set_text(std::string const &text, line_break_e convention = line_break_e::newline);

  std::string plaintext() const;
  bool is_comment() const;
  bool is_drawing() const;
  style_overrides_t margin_overrides() const;

  event_c shifted(int64_t delta_ms) const;
  event_c scaled(double factor, timestamp_c const &pivot = {}) const;

  bool equals(event_c const &other) const;
};

}
