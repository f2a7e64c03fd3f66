/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   subtitle documents: events, named styles and metadata
*/

#pragma once

#include "common/common_pch.h"

#include "common/subtitles/event.h"
#include "common/subtitles/style.h"
#include "common/subtitles/warning.h"

namespace stk::subtitles {

// Section content a format doesn't interpret but has to write back,
// e.g. SubStation's [Fonts] or WebVTT's STYLE blocks.
struct opaque_section_t {
  std::string origin_format, name;
  std::vector<std::string> lines;

  bool operator ==(opaque_section_t const &other) const {
    return (origin_format == other.origin_format) && (name == other.name) && (lines == other.lines);
  }
};

using named_style_t = std::pair<std::string, style_c>;
using info_entry_t  = std::pair<std::string, std::string>;

class document_c {
protected:
  std::vector<event_c> m_events;
  std::vector<named_style_t> m_styles;
  std::vector<info_entry_t> m_info;

public:
  std::optional<int> m_play_res_x, m_play_res_y;
  std::optional<double> m_frame_rate;
  std::optional<std::string> m_source_format;
  std::vector<opaque_section_t> m_opaque_sections;

public:
  document_c();

  // events
  std::vector<event_c> const &get_events() const {
    return m_events;
  }

  std::size_t num_events() const {
    return m_events.size();
  }

  event_c const &get_event(std::size_t idx) const;
  event_c &get_event(std::size_t idx);

  void add_event(event_c event);
  void insert_event(std::size_t idx, event_c event);
  void replace_event(std::size_t idx, event_c event);
  void remove_event(std::size_t idx);
  void clear_events();

  // styles
  std::vector<named_style_t> const &get_styles() const {
    return m_styles;
  }

  std::vector<std::string> get_style_names() const;
  bool has_style(std::string const &name) const;
  style_c const &get_style(std::string const &name) const;
  style_c &get_style(std::string const &name);
  void add_style(std::string const &name, style_c const &style);
  void set_style(std::string const &name, style_c const &style);
  void remove_style(std::string const &name);
  void rename_style(std::string const &old_name, std::string const &new_name);
  void import_styles(document_c const &other, bool overwrite = true);
  style_c const &resolve_style(std::string const &name, warnings_t *warnings = nullptr) const;
  style_c effective_style(event_c const &event, warnings_t *warnings = nullptr) const;

  // script information
  std::vector<info_entry_t> const &get_info() const {
    return m_info;
  }

  std::optional<std::string> get_info(std::string const &key) const;
  void set_info(std::string const &key, std::string const &value);
  void remove_info(std::string const &key);
  void clear_info();

  // bulk edits
  void shift(int64_t delta_ms);
  void shift_frames(int64_t frames, double fps);
  void transform_framerate(double in_fps, double out_fps);
  void sort();
  void remove_miscellaneous_events();

  bool equals(document_c const &other) const;

  static document_c merge(std::vector<document_c> const &documents);

protected:
  std::vector<named_style_t>::iterator find_style(std::string const &name);
  std::vector<named_style_t>::const_iterator find_style(std::string const &name) const;
};

}
