/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   SubStation Alpha and Advanced SubStation Alpha scripts
*/

#include "common/common_pch.h"

#include <QRegularExpression>

#include "common/qt.h"
#include "common/strings/editing.h"
#include "common/strings/formatting.h"
#include "common/strings/parsing.h"
#include "common/subtitles/substation_codec.h"
#include "common/subtitles/subtitles_x.h"

namespace stk::subtitles {

namespace {

std::vector<std::string> const s_ass_style_fields{
  "Name", "Fontname", "Fontsize", "PrimaryColour", "SecondaryColour", "OutlineColour", "BackColour", "Bold", "Italic", "Underline", "StrikeOut",
  "ScaleX", "ScaleY", "Spacing", "Angle", "BorderStyle", "Outline", "Shadow", "Alignment", "MarginL", "MarginR", "MarginV", "Encoding",
};

std::vector<std::string> const s_ssa_style_fields{
  "Name", "Fontname", "Fontsize", "PrimaryColour", "SecondaryColour", "TertiaryColour", "BackColour", "Bold", "Italic",
  "BorderStyle", "Outline", "Shadow", "Alignment", "MarginL", "MarginR", "MarginV", "AlphaLevel", "Encoding",
};

std::vector<std::string> const s_ass_event_fields{ "Layer",  "Start", "End", "Style", "Name", "MarginL", "MarginR", "MarginV", "Effect", "Text" };
std::vector<std::string> const s_ssa_event_fields{ "Marked", "Start", "End", "Style", "Name", "MarginL", "MarginR", "MarginV", "Effect", "Text" };

int
parse_int(std::string const &value) {
  int result{};
  if (!stk::string::parse_number(stk::string::strip_copy(value), result))
    throw stk::invalid_parameter_x{fmt::format(FY("'{0}' is not a valid integer"), value)};
  return result;
}

double
parse_double(std::string const &value) {
  double result{};
  if (!stk::string::parse_number(stk::string::strip_copy(value), result))
    throw stk::invalid_parameter_x{fmt::format(FY("'{0}' is not a valid number"), value)};
  return result;
}

std::optional<int>
parse_margin(std::string const &value) {
  auto margin = parse_int(value);
  return margin ? std::optional<int>{margin} : std::optional<int>{};
}

std::string
format_number(double value) {
  return stk::string::normalize_fmt_double_output(value);
}

std::string
format_flag(bool value) {
  return value ? "-1" : "0";
}

std::vector<std::string>
split_fields(std::string const &value,
             std::size_t num_fields) {
  auto fields = stk::string::split(value, ",", num_fields);

  // Only the last field, the text, keeps its whitespace.
  for (auto idx = 0u; (idx + 1) < fields.size(); ++idx)
    stk::string::strip(fields[idx]);

  return fields;
}

std::vector<std::string>
parse_format_line(std::string const &value) {
  auto format = stk::string::split(value, ",");
  stk::string::strip(format);

  for (auto &field : format)
    field = stk::string::to_lower_ascii(field);

  return format;
}

std::vector<std::string>
to_format(std::vector<std::string> const &fields) {
  std::vector<std::string> format;

  for (auto const &field : fields)
    format.emplace_back(stk::string::to_lower_ascii(field));

  return format;
}

style_c
parse_style(std::vector<std::string> const &format,
            std::vector<std::string> const &fields,
            bool is_ass,
            std::string &name) {
  style_c style;

  for (auto idx = 0u; idx < std::min(format.size(), fields.size()); ++idx) {
    auto const &field = format[idx];
    auto const &value = fields[idx];

    if (field == "name")
      name = value;
    else if (field == "fontname")
      style.m_font_name = value;
    else if (field == "fontsize")
      style.m_font_size = parse_double(value);
    else if (field == "primarycolour")
      style.m_primary_color = color_c::from_substation(value);
    else if (field == "secondarycolour")
      style.m_secondary_color = color_c::from_substation(value);
    else if ((field == "outlinecolour") || (field == "tertiarycolour"))
      style.m_outline_color = color_c::from_substation(value);
    else if (field == "backcolour")
      style.m_back_color = color_c::from_substation(value);
    else if (field == "bold")
      style.m_bold = parse_int(value) != 0;
    else if (field == "italic")
      style.m_italic = parse_int(value) != 0;
    else if (field == "underline")
      style.m_underline = parse_int(value) != 0;
    else if (field == "strikeout")
      style.m_strikeout = parse_int(value) != 0;
    else if (field == "scalex")
      style.m_scale_x = parse_double(value);
    else if (field == "scaley")
      style.m_scale_y = parse_double(value);
    else if (field == "spacing")
      style.m_spacing = parse_double(value);
    else if (field == "angle")
      style.m_angle = parse_double(value);
    else if (field == "borderstyle")
      style.m_border_style = parse_int(value) == 3 ? border_style_e::opaque_box : border_style_e::outline;
    else if (field == "outline")
      style.m_outline = parse_double(value);
    else if (field == "shadow")
      style.m_shadow = parse_double(value);
    else if (field == "alignment")
      style.m_alignment = is_ass ? alignment_from_ass(parse_int(value)) : alignment_from_ssa(parse_int(value));
    else if (field == "marginl")
      style.m_margins.left = parse_int(value);
    else if (field == "marginr")
      style.m_margins.right = parse_int(value);
    else if (field == "marginv")
      style.m_margins.vertical = parse_int(value);
    else if (field == "alphalevel")
      style.m_alpha_level = parse_int(value);
    else if (field == "encoding")
      style.m_encoding = parse_int(value);
  }

  return style;
}

event_c
parse_event(std::vector<std::string> const &format,
            std::vector<std::string> const &fields,
            event_type_e type) {
  event_c event;
  std::optional<timestamp_c> start, end;
  std::string text;

  event.m_type = type;

  for (auto idx = 0u; idx < format.size(); ++idx) {
    auto const &field = format[idx];
    auto const &value = fields[idx];

    if (field == "layer")
      event.m_layer = parse_int(value);
    else if (field == "marked")
      event.m_marked = balg::ends_with(value, "1");
    else if (field == "start")
      start = parse_time(value, time_format_e::substation);
    else if (field == "end")
      end = parse_time(value, time_format_e::substation);
    else if (field == "style")
      event.m_style = value;
    else if ((field == "name") || (field == "actor"))
      event.m_name = value;
    else if (field == "marginl")
      event.m_margins.left = parse_margin(value);
    else if (field == "marginr")
      event.m_margins.right = parse_margin(value);
    else if (field == "marginv")
      event.m_margins.vertical = parse_margin(value);
    else if (field == "effect")
      event.m_effect = value;
    else if (field == "text")
      text = value;
  }

  if (!start || !end)
    throw stk::invalid_parameter_x{Y("The start or end time is missing.")};

  event.set_times(*start, *end);
  event.set_text(text, line_break_e::substation);

  return event;
}

} // anonymous namespace

substation_codec_c::substation_codec_c(format_e format)
  : codec_c{format, "substation_codec"}
{
  if (!is_substation(format))
    throw stk::invalid_parameter_x{fmt::format("substation_codec_c cannot handle the format {0}", get_format_name(format))};
}

bool
substation_codec_c::is_ass_script(std::string const &text) {
  static std::optional<QRegularExpression> s_ass_re;

  if (!s_ass_re)
    s_ass_re = QRegularExpression{"^\\s*(\\[V4\\+\\s+Styles\\]|ScriptType:\\s*v4\\.00\\+)", QRegularExpression::CaseInsensitiveOption | QRegularExpression::MultilineOption};

  return Q(text).contains(*s_ass_re);
}

bool
substation_codec_c::probe(std::string const &text)
  const {
  static std::optional<QRegularExpression> s_script_info_re, s_styles_re, s_comment_re;

  if (!s_script_info_re) {
    s_script_info_re = QRegularExpression{"^\\s*\\[script\\s+info\\]",   QRegularExpression::CaseInsensitiveOption};
    s_styles_re      = QRegularExpression{"^\\s*\\[V4\\+?\\s+Styles\\]", QRegularExpression::CaseInsensitiveOption};
    s_comment_re     = QRegularExpression{"^\\s*$|^\\s*[!;]"};
  }

  auto found = false;
  auto lines = split_lines(text);

  // Look at the first 100 lines at most.
  for (auto idx = 0u; (idx < lines.size()) && (idx < 100); ++idx) {
    auto line = Q(lines[idx]);

    if (line.contains(*s_comment_re))
      continue;

    found = line.contains(*s_script_info_re) || line.contains(*s_styles_re);
    break;
  }

  if (!found)
    return false;

  return is_ass_script(text) == is_ass();
}

void
substation_codec_c::parse(std::vector<std::string> const &lines,
                          codec_options_t const &options,
                          read_result_t &result)
  const {
  static std::optional<QRegularExpression> s_section_re;

  if (!s_section_re)
    s_section_re = QRegularExpression{"^\\s*\\[([^\\]]+)\\]\\s*$"};

  auto &document   = result.document;
  auto section     = section_e::none;
  auto ass         = is_ass_script(boost::join(lines, "\n"));
  auto line_number = 0u;
  std::vector<std::string> style_format, event_format;

  for (auto const &line : lines) {
    ++line_number;

    auto stripped = stk::string::strip_copy(line);
    auto matches  = s_section_re->match(Q(stripped));

    if (matches.hasMatch()) {
      auto name  = to_utf8(matches.captured(1));
      auto lower = stk::string::to_lower_ascii(name);

      section = lower == "script info" ? section_e::info
              : lower == "v4+ styles"  ? section_e::styles
              : lower == "v4 styles"   ? section_e::styles
              : lower == "events"      ? section_e::events
              :                          section_e::opaque;

      if (section == section_e::opaque)
        document.m_opaque_sections.push_back({ ass ? "ass" : "ssa", name, {} });

      mxdebug_if(m_debug, fmt::format("line {0}: section '{1}'\n", line_number, name));

      continue;
    }

    if (section == section_e::opaque) {
      document.m_opaque_sections.back().lines.emplace_back(line);
      continue;
    }

    if (stripped.empty() || balg::starts_with(stripped, ";") || balg::starts_with(stripped, "!:"))
      continue;

    auto colon = stripped.find(':');
    if ((colon == std::string::npos) || (section == section_e::none)) {
      skip_or_throw(result, options, line_number, section == section_e::none ? Y("Content outside of a section.") : Y("Expected a 'key: value' line."));
      continue;
    }

    auto key   = stk::string::strip_copy(stripped.substr(0, colon));
    auto value = line.substr(line.find(':') + 1);
    while (!value.empty() && stk::string::is_blank_or_tab(value[0]))
      value.erase(0, 1);

    if (section == section_e::info) {
      auto info_value = stk::string::strip_copy(value);
      int play_res{};

      if (balg::iequals(key, "ScriptType"))
        ass = balg::iequals(info_value, "v4.00+");

      else if (balg::iequals(key, "PlayResX") && stk::string::parse_number(info_value, play_res))
        document.m_play_res_x = play_res;

      else if (balg::iequals(key, "PlayResY") && stk::string::parse_number(info_value, play_res))
        document.m_play_res_y = play_res;

      else
        document.set_info(key, info_value);

      continue;
    }

    if (balg::iequals(key, "Format")) {
      if (section == section_e::styles)
        style_format = parse_format_line(value);
      else
        event_format = parse_format_line(value);
      continue;
    }

    try {
      if ((section == section_e::styles) && balg::iequals(key, "Style")) {
        auto const &format = !style_format.empty() ? style_format : to_format(ass ? s_ass_style_fields : s_ssa_style_fields);
        auto fields        = split_fields(value, format.size());
        std::string name{style_c::DEFAULT_NAME};

        if (fields.size() < format.size())
          throw stk::invalid_parameter_x{fmt::format(FY("Expected {0} fields but found {1}."), format.size(), fields.size())};

        auto style = parse_style(format, fields, ass, name);
        document.set_style(name, style);

        continue;
      }

      auto type = event_type_from_string(key);

      if ((section == section_e::events) && type) {
        auto const &format = !event_format.empty() ? event_format : to_format(ass ? s_ass_event_fields : s_ssa_event_fields);
        auto fields        = split_fields(value, format.size());

        if (fields.size() < format.size())
          throw stk::invalid_parameter_x{fmt::format(FY("Expected {0} fields but found {1}."), format.size(), fields.size())};

        auto event = parse_event(format, fields, *type);
        auto runs  = parse_runs(event.get_text(), false);

        if (runs.unterminated_block_offset)
          result.warnings.push_back({ warning_type_e::unterminated_override_block, line_number,
                                      fmt::format(FY("The override block starting at offset {0} is not terminated and is treated as text."), *runs.unterminated_block_offset) });

        document.add_event(std::move(event));

        continue;
      }

      mxdebug_if(m_debug, fmt::format("line {0}: ignoring unknown key '{1}'\n", line_number, key));

    } catch (stk::exception const &ex) {
      skip_or_throw(result, options, line_number, ex.what());
    }
  }

  for (auto &opaque_section : document.m_opaque_sections)
    while (!opaque_section.lines.empty() && stk::string::strip_copy(opaque_section.lines.back()).empty())
      opaque_section.lines.pop_back();

  document.m_source_format = ass ? "ass" : "ssa";
}

std::string
substation_codec_c::format_style(std::string const &name,
                                 style_c const &style)
  const {
  if (is_ass())
    return fmt::format("Style: {0},{1},{2},{3},{4},{5},{6},{7},{8},{9},{10},{11},{12},{13},{14},{15},{16},{17},{18},{19},{20},{21},{22}\n",
                       name, style.m_font_name, format_number(style.m_font_size),
                       style.m_primary_color.to_ass(), style.m_secondary_color.to_ass(), style.m_outline_color.to_ass(), style.m_back_color.to_ass(),
                       format_flag(style.m_bold), format_flag(style.m_italic), format_flag(style.m_underline), format_flag(style.m_strikeout),
                       format_number(style.m_scale_x), format_number(style.m_scale_y), format_number(style.m_spacing), format_number(style.m_angle),
                       static_cast<int>(style.m_border_style), format_number(style.m_outline), format_number(style.m_shadow),
                       alignment_to_ass(style.m_alignment), style.m_margins.left, style.m_margins.right, style.m_margins.vertical, style.m_encoding);

  return fmt::format("Style: {0},{1},{2},{3},{4},{5},{6},{7},{8},{9},{10},{11},{12},{13},{14},{15},{16},{17}\n",
                     name, style.m_font_name, format_number(style.m_font_size),
                     style.m_primary_color.to_ssa(), style.m_secondary_color.to_ssa(), style.m_outline_color.to_ssa(), style.m_back_color.to_ssa(),
                     format_flag(style.m_bold), format_flag(style.m_italic),
                     static_cast<int>(style.m_border_style), format_number(style.m_outline), format_number(style.m_shadow),
                     alignment_to_ssa(style.m_alignment), style.m_margins.left, style.m_margins.right, style.m_margins.vertical, style.m_alpha_level, style.m_encoding);
}

std::string
substation_codec_c::format_event(event_c const &event,
                                 std::string const &style_name)
  const {
  auto text = event.get_text(line_break_e::substation);

  if (!is_ass())
    text = remove_directives(text, [](override_directive_t const &directive) { return directive.kind == directive_kind_e::transform; });

  return fmt::format("{0}: {1},{2},{3},{4},{5},{6},{7},{8},{9},{10}\n",
                     event_type_to_string(event.m_type),
                     is_ass() ? fmt::to_string(event.m_layer) : fmt::format("Marked={0}", event.m_marked ? 1 : 0),
                     format_time(event.get_start(), time_format_e::substation),
                     format_time(event.get_end(),   time_format_e::substation),
                     style_name,
                     event.m_name,
                     event.m_margins.left.value_or(0),
                     event.m_margins.right.value_or(0),
                     event.m_margins.vertical.value_or(0),
                     event.m_effect,
                     text);
}

std::string
substation_codec_c::format_document(document_c const &document,
                                    codec_options_t const &,
                                    conversion_policy_c &policy,
                                    warnings_t &warnings)
  const {
  std::string out;

  out += "[Script Info]\n"
         "; Script generated by SubTextKit\n";
  out += fmt::format("ScriptType: {0}\n", is_ass() ? "v4.00+" : "v4.00");

  for (auto const &[key, value] : document.get_info())
    out += fmt::format("{0}: {1}\n", key, value);

  if (document.m_play_res_x)
    out += fmt::format("PlayResX: {0}\n", *document.m_play_res_x);
  if (document.m_play_res_y)
    out += fmt::format("PlayResY: {0}\n", *document.m_play_res_y);

  out += fmt::format("\n[{0}]\nFormat: {1}\n", is_ass() ? "V4+ Styles" : "V4 Styles", stk::string::join(is_ass() ? s_ass_style_fields : s_ssa_style_fields, ", "));

  for (auto const &[name, style] : document.get_styles())
    out += format_style(name, style);

  out += fmt::format("\n[Events]\nFormat: {0}\n", stk::string::join(is_ass() ? s_ass_event_fields : s_ssa_event_fields, ", "));

  for (auto idx = 0u; idx < document.num_events(); ++idx) {
    auto const &event = document.get_event(idx);

    if (!policy.check_event(idx, event, document))
      continue;

    auto style_name = event.m_style;
    if (!document.has_style(style_name)) {
      document.resolve_style(style_name, &warnings);
      style_name = style_c::DEFAULT_NAME;
    }

    out += format_event(event, style_name);
  }

  for (auto const &section : document.m_opaque_sections) {
    if (!is_substation(format_from_name(section.origin_format))) {
      policy.record(feature_e::script_info, policy_action_e::drop, {}, section.name);
      continue;
    }

    out += fmt::format("\n[{0}]\n", section.name);
    for (auto const &line : section.lines)
      out += line + "\n";
  }

  return out;
}

std::string
substation_codec_c::format_empty_document(document_c const &document,
                                          codec_options_t const &options)
  const {
  warnings_t warnings;
  conversion_policy_c policy{m_format, options};

  return format_document(document, options, policy, warnings);
}

}
