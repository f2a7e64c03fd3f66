/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   rules for features a target format cannot represent
*/

#include "common/common_pch.h"

#include "common/container.h"
#include "common/strings/formatting.h"
#include "common/subtitles/conversion_policy.h"
#include "common/subtitles/styled_text.h"

namespace stk::subtitles {

namespace {

bool
colors_differ(style_c const &a,
              style_c const &b) {
  return (a.m_primary_color   != b.m_primary_color)
      || (a.m_secondary_color != b.m_secondary_color)
      || (a.m_outline_color   != b.m_outline_color)
      || (a.m_back_color      != b.m_back_color);
}

bool
font_differs(style_c const &a,
             style_c const &b) {
  return (a.m_font_name != b.m_font_name)
      || (a.m_font_size != b.m_font_size)
      || (a.m_scale_x   != b.m_scale_x)
      || (a.m_scale_y   != b.m_scale_y)
      || (a.m_spacing   != b.m_spacing)
      || (a.m_angle     != b.m_angle)
      || (a.m_outline   != b.m_outline)
      || (a.m_shadow    != b.m_shadow);
}

using emphasis_member_t = bool style_c::*;

std::vector<std::pair<emphasis_member_t, bool emphasis_support_t::*>> const s_emphasis_members{
  { &style_c::m_bold,      &emphasis_support_t::bold      },
  { &style_c::m_italic,    &emphasis_support_t::italic    },
  { &style_c::m_underline, &emphasis_support_t::underline },
  { &style_c::m_strikeout, &emphasis_support_t::strikeout },
};

// Style attributes the SSA v4 style line has no field for.
std::vector<std::string>
attributes_lost_in_ssa(style_c const &style) {
  std::vector<std::string> lost;

  if (style.m_underline)
    lost.emplace_back("underline");
  if (style.m_strikeout)
    lost.emplace_back("strikeout");
  if ((style.m_scale_x != 100.0) || (style.m_scale_y != 100.0))
    lost.emplace_back("scale");
  if (style.m_spacing != 0.0)
    lost.emplace_back("spacing");
  if (style.m_angle != 0.0)
    lost.emplace_back("angle");

  for (auto const &color : { style.m_primary_color, style.m_secondary_color, style.m_outline_color, style.m_back_color })
    if (color.m_a != 0) {
      lost.emplace_back("alpha");
      break;
    }

  return lost;
}

} // anonymous namespace

std::string
get_feature_name(feature_e feature) {
  switch (feature) {
    case feature_e::inline_color:            return "inline_color";
    case feature_e::inline_font:             return "inline_font";
    case feature_e::inline_positioning:      return "inline_positioning";
    case feature_e::inline_karaoke:          return "inline_karaoke";
    case feature_e::inline_transform:        return "inline_transform";
    case feature_e::inline_emphasis:         return "inline_emphasis";
    case feature_e::inline_emphasis_midline: return "inline_emphasis_midline";
    case feature_e::inline_opaque_tag:       return "inline_opaque_tag";
    case feature_e::drawing:                 return "drawing";
    case feature_e::comment_event:           return "comment_event";
    case feature_e::layer:                   return "layer";
    case feature_e::margins:                 return "margins";
    case feature_e::actor_name:              return "actor_name";
    case feature_e::effect:                  return "effect";
    case feature_e::style_table:             return "style_table";
    case feature_e::script_info:             return "script_info";
    case feature_e::time_resolution:         return "time_resolution";
    case feature_e::time_range:              return "time_range";
    case feature_e::end_time:                return "end_time";
    case feature_e::empty_document:          return "empty_document";
  }

  return "unknown";
}

std::string
get_policy_action_name(policy_action_e action) {
  switch (action) {
    case policy_action_e::keep:        return "keep";
    case policy_action_e::drop:        return "drop";
    case policy_action_e::approximate: return "approximate";
    case policy_action_e::reject:      return "reject";
  }

  return "unknown";
}

policy_action_e
get_policy_action(feature_e feature,
                  format_e target) {
  auto substation = is_substation(target);

  switch (feature) {
    case feature_e::inline_color:
      return substation                    ? policy_action_e::keep
           : target == format_e::microdvd  ? policy_action_e::approximate
           :                                 policy_action_e::drop;

    case feature_e::inline_transform:
    case feature_e::layer:
      return target == format_e::ass ? policy_action_e::keep : policy_action_e::drop;

    case feature_e::inline_emphasis_midline:
      return stk::included_in(target, format_e::microdvd, format_e::mpl2) ? policy_action_e::approximate : policy_action_e::keep;

    case feature_e::style_table:
      return substation              ? policy_action_e::keep
           : target == format_e::tmp ? policy_action_e::drop
           :                           policy_action_e::approximate;

    case feature_e::time_resolution:
    case feature_e::time_range:
      return policy_action_e::approximate;

    case feature_e::end_time:
      return target == format_e::tmp ? policy_action_e::approximate : policy_action_e::keep;

    case feature_e::empty_document:
      return policy_action_e::reject;

    default:
      return substation ? policy_action_e::keep : policy_action_e::drop;
  }
}

// ------------------------------------------------------------

std::string
lossy_mapping_t::format()
  const {
  auto message = event_index ? fmt::format(FY("Event {0}: feature '{1}' handled as '{2}'"), *event_index + 1, get_feature_name(feature), get_policy_action_name(action))
               :               fmt::format(FY("Document: feature '{0}' handled as '{1}'"),                   get_feature_name(feature), get_policy_action_name(action));

  if (!details.empty())
    message += fmt::format(" ({0})", details);

  return message;
}

warning_t
lossy_mapping_t::to_warning()
  const {
  return { action == policy_action_e::approximate ? warning_type_e::unsupported_feature_approximated : warning_type_e::unsupported_feature_dropped, {}, format() };
}

// ------------------------------------------------------------

conversion_policy_c::conversion_policy_c(format_e target,
                                         codec_options_t const &options)
  : m_target{target}
  , m_options{options}
{
}

policy_action_e
conversion_policy_c::get_action(feature_e feature)
  const {
  return get_policy_action(feature, m_target);
}

/** \brief Apply the policy for a feature found in the document

   Non-trivial actions are recorded as a lossy mapping. Rejections are
   not recorded.
*/
policy_action_e
conversion_policy_c::apply(feature_e feature,
                           std::optional<std::size_t> event_index,
                           std::string const &details) {
  auto action = get_action(feature);

  if (!stk::included_in(action, policy_action_e::keep, policy_action_e::reject))
    record(feature, action, event_index, details);

  return action;
}

// At most once per event and feature, or once per document for
// document-level features.
void
conversion_policy_c::record(feature_e feature,
                            policy_action_e action,
                            std::optional<std::size_t> event_index,
                            std::string const &details) {
  auto inserted = event_index ? m_recorded_for_events.emplace(*event_index, feature).second
                :               m_recorded_for_document.emplace(feature).second;

  if (!inserted)
    return;

  m_lossy_mappings.push_back({ feature, action, event_index, details });

  mxdebug_if(m_debug, fmt::format("target {0}: {1}\n", get_format_name(m_target), m_lossy_mappings.back().format()));
}

emphasis_support_t
conversion_policy_c::get_emphasis_support()
  const {
  if (is_substation(m_target))
    return { true, true, true, true, false };

  if (!m_options.apply_styles)
    return {};

  switch (m_target) {
    case format_e::srt:      return { true,  true, true,  true,  false };
    case format_e::vtt:      return { true,  true, true,  false, false };
    case format_e::microdvd: return { true,  true, true,  true,  true  };
    case format_e::mpl2:     return { false, true, false, false, true  };
    default:                 return {};
  }
}

bool
conversion_policy_c::check_empty_document(document_c const &document) {
  if (document.num_events() != 0)
    return false;

  return apply(feature_e::empty_document) == policy_action_e::reject;
}

void
conversion_policy_c::check_document(document_c const &document) {
  if (m_target == format_e::ssa)
    check_ssa_styles(document);

  if (is_substation(m_target))
    return;

  auto const &styles = document.get_styles();
  if ((styles.size() > 1) || (styles.front().second != style_c{})) {
    if (m_options.apply_styles)
      apply(feature_e::style_table);
    else
      record(feature_e::style_table, policy_action_e::drop, {}, Y("styles are not applied"));
  }

  document_c pristine;
  auto foreign_sections = std::any_of(document.m_opaque_sections.begin(), document.m_opaque_sections.end(), [this](auto const &section) {
    return section.origin_format != get_format_name(m_target);
  });

  if (   (document.get_info() != pristine.get_info())
      || document.m_play_res_x
      || document.m_play_res_y
      || foreign_sections)
    apply(feature_e::script_info);
}

void
conversion_policy_c::check_ssa_styles(document_c const &document) {
  std::vector<std::string> affected;

  for (auto const &[name, style] : document.get_styles()) {
    auto lost = attributes_lost_in_ssa(style);
    if (!lost.empty())
      affected.emplace_back(fmt::format("{0}: {1}", name, stk::string::join(lost, ", ")));
  }

  if (!affected.empty())
    record(feature_e::style_table, policy_action_e::approximate, {}, fmt::format(FY("not representable in SSA v4 styles: {0}"), stk::string::join(affected, "; ")));
}

void
conversion_policy_c::check_time(std::size_t idx,
                                timestamp_c const &time) {
  auto time_format = get_time_format(m_target);
  auto ms          = time.to_ms();

  if (   ((time_format == time_format_e::substation) && (ms > SUBSTATION_MAX_TIME_MS))
      || ((time_format == time_format_e::subrip)     && (ms > SUBRIP_MAX_TIME_MS))) {
    apply(feature_e::time_range, idx, fmt::format(FY("{0} clamped"), time));
    return;
  }

  if (!is_time_representable(time, time_format, m_options.frame_rate))
    apply(feature_e::time_resolution, idx, fmt::format(FY("{0} rounded"), time));
}

/** \brief Check a single event before it is written

   Returns \c false if the event must be omitted from the output.
*/
bool
conversion_policy_c::check_event(std::size_t idx,
                                 event_c const &event,
                                 document_c const &document) {
  if (event.is_comment())
    return apply(feature_e::comment_event, idx) == policy_action_e::keep;

  if (event.is_drawing() && !is_substation(m_target))
    return apply(feature_e::drawing, idx) == policy_action_e::keep;

  if (event.m_layer != 0)
    apply(feature_e::layer, idx);

  if (!event.m_margins.empty())
    apply(feature_e::margins, idx);

  if (!event.m_name.empty())
    apply(feature_e::actor_name, idx);

  if (!event.m_effect.empty())
    apply(feature_e::effect, idx);

  check_time(idx, event.get_start());
  if (m_target != format_e::tmp)
    check_time(idx, event.get_end());

  check_inline_markup(idx, event, document.resolve_style(event.m_style), document);

  return true;
}

void
conversion_policy_c::check_inline_markup(std::size_t idx,
                                         event_c const &event,
                                         style_c const &style,
                                         document_c const &document) {
  auto const substation = is_substation(m_target);

  if (!substation && m_options.keep_ssa_tags)
    return;

  override_tag_parser_c parser{event.get_text(), false};

  while (auto token = parser.next()) {
    if (token->type == override_token_type_e::comment) {
      if (!substation)
        apply(feature_e::inline_opaque_tag, idx, token->directive.raw);
      continue;
    }

    if (token->type != override_token_type_e::directive)
      continue;

    auto const &directive = token->directive;

    if (directive.kind == directive_kind_e::transform)
      apply(feature_e::inline_transform, idx, directive.raw);

    else if (substation)
      continue;

    else if (directive.kind == directive_kind_e::positioning)
      apply(feature_e::inline_positioning, idx, directive.raw);

    else if (directive.kind == directive_kind_e::karaoke)
      apply(feature_e::inline_karaoke, idx, directive.raw);

    else if (directive.kind == directive_kind_e::unknown)
      apply(feature_e::inline_opaque_tag, idx, directive.raw);
  }

  if (substation)
    return;

  auto support              = get_emphasis_support();
  auto lines                = split_styled_lines(event.get_text(), style, make_style_lookup(document));
  auto colored              = false;
  auto uniformly_colored    = true;
  std::optional<color_c> first_color;

  for (auto const &line : lines) {
    for (auto const &segment : line) {
      auto const &segment_style = segment.style;

      if (colors_differ(segment_style, style))
        colored = true;

      if (!first_color)
        first_color = segment_style.m_primary_color;

      else if (*first_color != segment_style.m_primary_color)
        uniformly_colored = false;

      if (   (segment_style.m_secondary_color != style.m_secondary_color)
          || (segment_style.m_outline_color   != style.m_outline_color)
          || (segment_style.m_back_color      != style.m_back_color))
        uniformly_colored = false;

      if (font_differs(segment_style, style))
        apply(feature_e::inline_font, idx);

      for (auto const &[style_member, support_member] : s_emphasis_members)
        if ((segment_style.*style_member != style.*style_member) && !(support.*support_member))
          apply(feature_e::inline_emphasis, idx);
    }

    if (!support.per_line || line.empty())
      continue;

    for (auto const &[style_member, support_member] : s_emphasis_members) {
      if (!(support.*support_member))
        continue;

      auto first_value = line.front().style.*style_member;
      if (std::any_of(line.begin(), line.end(), [&](auto const &segment) { return segment.style.*style_member != first_value; }))
        apply(feature_e::inline_emphasis_midline, idx);
    }
  }

  if (colored && ((m_target != format_e::microdvd) || !uniformly_colored))
    apply(feature_e::inline_color, idx);
}

}
