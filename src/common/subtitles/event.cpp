/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   a single subtitle event
*/

#include "common/common_pch.h"

#include "common/strings/editing.h"
#include "common/subtitles/event.h"
#include "common/subtitles/override_tags.h"
#include "common/subtitles/subtitles_x.h"

namespace stk::subtitles {

namespace {

std::vector<std::pair<event_type_e, std::string>> const s_event_type_names{
  { event_type_e::dialogue, "Dialogue" },
  { event_type_e::comment,  "Comment"  },
  { event_type_e::picture,  "Picture"  },
  { event_type_e::sound,    "Sound"    },
  { event_type_e::movie,    "Movie"    },
  { event_type_e::command,  "Command"  },
};

} // anonymous namespace

std::string
event_type_to_string(event_type_e type) {
  for (auto const &[known_type, name] : s_event_type_names)
    if (known_type == type)
      return name;

  return "Dialogue";
}

std::optional<event_type_e>
event_type_from_string(std::string const &name) {
  for (auto const &[type, known_name] : s_event_type_names)
    if (balg::iequals(known_name, name))
      return type;

  return {};
}

bool
event_margins_t::operator ==(event_margins_t const &other)
  const {
  return (left == other.left) && (right == other.right) && (vertical == other.vertical);
}

// ------------------------------------------------------------

event_c::event_c()
  : m_start{}
  , m_end{timestamp_c::s(10)}
{
}

event_c::event_c(timestamp_c const &start,
                 timestamp_c const &end,
                 std::string text,
                 std::string style)
  : m_start{start}
  , m_end{end}
  , m_style{std::move(style)}
{
  if (m_end < m_start)
    throw invalid_timing_x{m_start.to_ms(), m_end.to_ms()};

  set_text(text);
}

void
event_c::set_start(timestamp_c const &start) {
  set_times(start, m_end);
}

void
event_c::set_end(timestamp_c const &end) {
  set_times(m_start, end);
}

void
event_c::set_times(timestamp_c const &start,
                   timestamp_c const &end) {
  if (end < start)
    throw invalid_timing_x{start.to_ms(), end.to_ms()};

  m_start = start;
  m_end   = end;
}

int64_t
event_c::duration()
  const {
  return m_end.difference(m_start);
}

void
event_c::set_duration(int64_t duration_ms) {
  if (duration_ms < 0)
    throw invalid_timing_x{m_start.to_ms(), m_start.to_ms() + duration_ms};

  m_end = m_start.shifted(duration_ms);
}

/** \brief Set the text converting native line breaks

   Line endings are normalized to '\n' in all cases. Additionally
   SubStation's forced breaks (\N) or pipe characters are turned into
   '\n' depending on \c convention.
*/
void
event_c::set_text(std::string const &text,
                  line_break_e convention) {
  m_text = stk::string::normalize_line_endings(text);

  if (convention == line_break_e::substation)
    balg::replace_all(m_text, "\\N", "\n");

  else if (convention == line_break_e::pipe)
    balg::replace_all(m_text, "|", "\n");
}

std::string
event_c::get_text(line_break_e convention)
  const {
  if (convention == line_break_e::newline)
    return m_text;

  return balg::replace_all_copy(m_text, "\n", convention == line_break_e::substation ? "\\N" : "|");
}

std::string
event_c::plaintext()
  const {
  auto text = strip_override_blocks(m_text);

  balg::replace_all(text, "\\h", " ");
  balg::replace_all(text, "\\n", "\n");

  return text;
}

bool
event_c::is_comment()
  const {
  return m_type == event_type_e::comment;
}

bool
event_c::is_drawing()
  const {
  return contains_drawing(m_text);
}

style_overrides_t
event_c::margin_overrides()
  const {
  style_overrides_t overrides;

  overrides.margin_left     = m_margins.left;
  overrides.margin_right    = m_margins.right;
  overrides.margin_vertical = m_margins.vertical;

  return overrides;
}

event_c
event_c::shifted(int64_t delta_ms)
  const {
  auto copy    = *this;
  copy.m_start = m_start.shifted(delta_ms);
  copy.m_end   = m_end.shifted(delta_ms);

  return copy;
}

event_c
event_c::scaled(double factor,
                timestamp_c const &pivot)
  const {
  if (!(factor > 0))
    throw stk::invalid_parameter_x{fmt::format(FY("Invalid scaling factor {0}"), factor)};

  auto copy    = *this;
  copy.m_start = m_start.scaled(factor, pivot);
  copy.m_end   = std::max(copy.m_start, m_end.scaled(factor, pivot));

  return copy;
}

bool
event_c::equals(event_c const &other)
  const {
  return (m_start    == other.m_start)
      && (m_end      == other.m_end)
      && (m_text     == other.m_text)
      && (m_style    == other.m_style)
      && (m_name     == other.m_name)
      && (m_effect   == other.m_effect)
      && (m_layer    == other.m_layer)
      && (m_marked   == other.m_marked)
      && (m_margins  == other.m_margins)
      && (m_type     == other.m_type)
      && (m_language == other.m_language);
}

}
