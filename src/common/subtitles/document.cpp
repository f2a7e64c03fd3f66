/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   subtitle documents: events, named styles and metadata
*/

#include "common/common_pch.h"

#include "common/strings/editing.h"
#include "common/subtitles/document.h"
#include "common/subtitles/subtitles_x.h"

namespace stk::subtitles {

document_c::document_c()
  : m_styles{ { style_c::DEFAULT_NAME, style_c{} } }
  , m_info{ { "WrapStyle", "0" }, { "ScaledBorderAndShadow", "yes" }, { "Collisions", "Normal" } }
{
}

event_c const &
document_c::get_event(std::size_t idx)
  const {
  return m_events.at(idx);
}

event_c &
document_c::get_event(std::size_t idx) {
  return m_events.at(idx);
}

void
document_c::add_event(event_c event) {
  m_events.emplace_back(std::move(event));
}

void
document_c::insert_event(std::size_t idx,
                         event_c event) {
  if (idx > m_events.size())
    throw stk::invalid_parameter_x{fmt::format(FY("Event index {0} is out of range"), idx)};

  m_events.insert(m_events.begin() + idx, std::move(event));
}

void
document_c::replace_event(std::size_t idx,
                          event_c event) {
  m_events.at(idx) = std::move(event);
}

void
document_c::remove_event(std::size_t idx) {
  if (idx >= m_events.size())
    throw stk::invalid_parameter_x{fmt::format(FY("Event index {0} is out of range"), idx)};

  m_events.erase(m_events.begin() + idx);
}

void
document_c::clear_events() {
  m_events.clear();
}

// ------------------------------------------------------------

std::vector<named_style_t>::iterator
document_c::find_style(std::string const &name) {
  return std::find_if(m_styles.begin(), m_styles.end(), [&name](auto const &entry) { return entry.first == name; });
}

std::vector<named_style_t>::const_iterator
document_c::find_style(std::string const &name)
  const {
  return std::find_if(m_styles.begin(), m_styles.end(), [&name](auto const &entry) { return entry.first == name; });
}

std::vector<std::string>
document_c::get_style_names()
  const {
  std::vector<std::string> names;

  for (auto const &entry : m_styles)
    names.emplace_back(entry.first);

  return names;
}

bool
document_c::has_style(std::string const &name)
  const {
  return find_style(name) != m_styles.end();
}

style_c const &
document_c::get_style(std::string const &name)
  const {
  auto itr = find_style(name);
  if (itr == m_styles.end())
    throw unknown_style_x{name};

  return itr->second;
}

style_c &
document_c::get_style(std::string const &name) {
  auto itr = find_style(name);
  if (itr == m_styles.end())
    throw unknown_style_x{name};

  return itr->second;
}

void
document_c::add_style(std::string const &name,
                      style_c const &style) {
  if (has_style(name))
    throw duplicate_style_x{name};

  m_styles.emplace_back(name, style);
}

void
document_c::set_style(std::string const &name,
                      style_c const &style) {
  auto itr = find_style(name);
  if (itr != m_styles.end())
    itr->second = style;
  else
    m_styles.emplace_back(name, style);
}

void
document_c::remove_style(std::string const &name) {
  if (name == style_c::DEFAULT_NAME)
    throw stk::invalid_parameter_x{Y("The 'Default' style cannot be removed")};

  auto itr = find_style(name);
  if (itr == m_styles.end())
    throw unknown_style_x{name};

  m_styles.erase(itr);
}

/** \brief Rename a style and update all events referencing it

   The 'Default' style cannot be renamed as every document must
   contain it.
*/
void
document_c::rename_style(std::string const &old_name,
                         std::string const &new_name) {
  if (old_name == style_c::DEFAULT_NAME)
    throw stk::invalid_parameter_x{Y("The 'Default' style cannot be renamed")};

  auto itr = find_style(old_name);
  if (itr == m_styles.end())
    throw unknown_style_x{old_name};

  if (old_name == new_name)
    return;

  if (has_style(new_name))
    throw duplicate_style_x{new_name};

  itr->first = new_name;

  for (auto &event : m_events)
    if (event.m_style == old_name)
      event.m_style = new_name;
}

void
document_c::import_styles(document_c const &other,
                          bool overwrite) {
  for (auto const &[name, style] : other.m_styles)
    if (overwrite || !has_style(name))
      set_style(name, style);
}

style_c const &
document_c::resolve_style(std::string const &name,
                          warnings_t *warnings)
  const {
  auto itr = find_style(name);
  if (itr != m_styles.end())
    return itr->second;

  if (warnings)
    warnings->push_back({ warning_type_e::unresolved_style_reference, {}, fmt::format(FY("The style '{0}' does not exist; using 'Default' instead."), name) });

  return get_style(style_c::DEFAULT_NAME);
}

style_c
document_c::effective_style(event_c const &event,
                            warnings_t *warnings)
  const {
  return resolve_effective(resolve_style(event.m_style, warnings), event.margin_overrides());
}

// ------------------------------------------------------------

std::optional<std::string>
document_c::get_info(std::string const &key)
  const {
  for (auto const &entry : m_info)
    if (entry.first == key)
      return entry.second;

  return {};
}

void
document_c::set_info(std::string const &key,
                     std::string const &value) {
  for (auto &entry : m_info)
    if (entry.first == key) {
      entry.second = value;
      return;
    }

  m_info.emplace_back(key, value);
}

void
document_c::remove_info(std::string const &key) {
  m_info.erase(std::remove_if(m_info.begin(), m_info.end(), [&key](auto const &entry) { return entry.first == key; }), m_info.end());
}

void
document_c::clear_info() {
  m_info.clear();
}

// ------------------------------------------------------------

void
document_c::shift(int64_t delta_ms) {
  for (auto &event : m_events)
    event = event.shifted(delta_ms);
}

void
document_c::shift_frames(int64_t frames,
                         double fps) {
  for (auto &event : m_events) {
    auto start = std::max<int64_t>(event.get_start().to_frames(fps) + frames, 0);
    auto end   = std::max<int64_t>(event.get_end().to_frames(fps)   + frames, 0);

    event.set_times(timestamp_c::frames(start, fps), timestamp_c::frames(end, fps));
  }
}

void
document_c::transform_framerate(double in_fps,
                                double out_fps) {
  if (!(in_fps > 0) || !(out_fps > 0))
    throw stk::invalid_parameter_x{fmt::format(FY("Invalid frame rates {0} and {1}"), in_fps, out_fps)};

  auto ratio = in_fps / out_fps;

  for (auto &event : m_events)
    event = event.scaled(ratio);
}

void
document_c::sort() {
  std::stable_sort(m_events.begin(), m_events.end(), [](event_c const &a, event_c const &b) {
    if (a.get_start() != b.get_start())
      return a.get_start() < b.get_start();
    return a.get_end() < b.get_end();
  });
}

/** \brief Remove events that don't show any text

   Removed are comments, drawings, events without visible text and
   events duplicating the text of an earlier event with the same
   timing.
*/
void
document_c::remove_miscellaneous_events() {
  std::vector<event_c> kept;
  std::vector<std::tuple<int64_t, int64_t, std::string>> seen;

  for (auto &event : m_events) {
    if (event.is_comment() || event.is_drawing())
      continue;

    auto plaintext = event.plaintext();
    if (stk::string::strip_copy(plaintext).empty())
      continue;

    auto key = std::make_tuple(event.get_start().to_ms(), event.get_end().to_ms(), plaintext);
    if (std::find(seen.begin(), seen.end(), key) != seen.end())
      continue;

    seen.emplace_back(std::move(key));
    kept.emplace_back(std::move(event));
  }

  m_events = std::move(kept);
}

bool
document_c::equals(document_c const &other)
  const {
  if (   (m_styles          != other.m_styles)
      || (m_info            != other.m_info)
      || (m_play_res_x      != other.m_play_res_x)
      || (m_play_res_y      != other.m_play_res_y)
      || (m_opaque_sections != other.m_opaque_sections)
      || (m_events.size()   != other.m_events.size()))
    return false;

  for (auto idx = 0u; idx < m_events.size(); ++idx)
    if (!m_events[idx].equals(other.m_events[idx]))
      return false;

  return true;
}

/** \brief Combine several documents into a new one

   Events are concatenated in the order of the documents. Styles with
   equal names and attributes are only kept once; styles whose names
   clash with a different style already present are renamed by
   appending a numeric suffix, and the events referencing them are
   updated. Script information and metadata are taken from the first
   document.
*/
document_c
document_c::merge(std::vector<document_c> const &documents) {
  document_c merged;

  if (documents.empty())
    return merged;

  merged.m_info            = documents.front().m_info;
  merged.m_play_res_x      = documents.front().m_play_res_x;
  merged.m_play_res_y      = documents.front().m_play_res_y;
  merged.m_frame_rate      = documents.front().m_frame_rate;
  merged.m_source_format   = documents.front().m_source_format;
  merged.m_opaque_sections = documents.front().m_opaque_sections;

  auto first = true;

  for (auto const &document : documents) {
    std::map<std::string, std::string> renamed;

    for (auto const &[name, style] : document.m_styles) {
      auto itr = merged.find_style(name);

      if (first && (name == style_c::DEFAULT_NAME))
        itr->second = style;

      else if (itr == merged.m_styles.end())
        merged.m_styles.emplace_back(name, style);

      else if (itr->second != style) {
        auto suffix   = 2u;
        auto new_name = fmt::format("{0}_{1}", name, suffix);

        while (merged.has_style(new_name) && (merged.get_style(new_name) != style))
          new_name = fmt::format("{0}_{1}", name, ++suffix);

        if (!merged.has_style(new_name))
          merged.m_styles.emplace_back(new_name, style);

        renamed[name] = new_name;
      }
    }

    for (auto event : document.m_events) {
      auto itr = renamed.find(event.m_style);
      if (itr != renamed.end())
        event.m_style = itr->second;

      merged.m_events.emplace_back(std::move(event));
    }

    first = false;
  }

  return merged;
}

}
