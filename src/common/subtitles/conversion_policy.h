/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   rules for features a target format cannot represent
*/

#pragma once

#include "common/common_pch.h"

#include "common/subtitles/codec_options.h"
#include "common/subtitles/document.h"
#include "common/subtitles/formats.h"
#include "common/subtitles/override_tags.h"

namespace stk::subtitles {

enum class feature_e {
  inline_color,
  inline_font,
  inline_positioning,
  inline_karaoke,
  inline_transform,
  inline_emphasis,
  inline_emphasis_midline,
  inline_opaque_tag,
  drawing,
  comment_event,
  layer,
  margins,
  actor_name,
  effect,
  style_table,
  script_info,
  time_resolution,
  time_range,
  end_time,
  empty_document,
};

enum class policy_action_e {
  keep,
  drop,
  approximate,
  reject,
};

std::string get_feature_name(feature_e feature);
std::string get_policy_action_name(policy_action_e action);
policy_action_e get_policy_action(feature_e feature, format_e target);

struct lossy_mapping_t {
  feature_e feature;
  policy_action_e action;
  std::optional<std::size_t> event_index;
  std::string details;

  warning_t to_warning() const;
  std::string format() const;
};

using lossy_mappings_t = std::vector<lossy_mapping_t>;

// Emphasis attributes a plain text format can express.
struct emphasis_support_t {
  bool bold{}, italic{}, underline{}, strikeout{};
  bool per_line{};
};

class conversion_policy_c {
protected:
  format_e m_target;
  codec_options_t const &m_options;
  lossy_mappings_t m_lossy_mappings;
  std::set<std::pair<std::size_t, feature_e>> m_recorded_for_events;
  std::set<feature_e> m_recorded_for_document;

  debugging_option_c m_debug{"conversion_policy"};

public:
  conversion_policy_c(format_e target, codec_options_t const &options);

  format_e get_target() const {
    return m_target;
  }

  policy_action_e get_action(feature_e feature) const;
  policy_action_e apply(feature_e feature, std::optional<std::size_t> event_index = {}, std::string const &details = {});
  void record(feature_e feature, policy_action_e action, std::optional<std::size_t> event_index = {}, std::string const &details = {});

  lossy_mappings_t const &get_lossy_mappings() const {
    return m_lossy_mappings;
  }

  lossy_mappings_t release_lossy_mappings() {
    return std::move(m_lossy_mappings);
  }

  bool check_empty_document(document_c const &document);
  void check_document(document_c const &document);
  bool check_event(std::size_t idx, event_c const &event, document_c const &document);
  void check_time(std::size_t idx, timestamp_c const &time);

  emphasis_support_t get_emphasis_support() const;

protected:
  void check_ssa_styles(document_c const &document);
  void check_inline_markup(std::size_t idx, event_c const &event, style_c const &style, document_c const &document);
};

}
