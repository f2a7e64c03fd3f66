/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   named style records and their attribute overrides
*/

#include "common/common_pch.h"

#include "common/subtitles/style.h"

namespace stk::subtitles {

alignment_e
alignment_from_ass(int value) {
  if ((value < 1) || (value > 9))
    throw stk::invalid_parameter_x{fmt::format(FY("Invalid alignment value {0}"), value)};
  return static_cast<alignment_e>(value);
}

// Legacy SSA alignment: 1-3 bottom, 5-7 top, 9-11 middle.
alignment_e
alignment_from_ssa(int value) {
  auto horizontal = value & 3;
  if (!horizontal || (value < 1) || (value > 11))
    throw stk::invalid_parameter_x{fmt::format(FY("Invalid legacy alignment value {0}"), value)};

  auto row = value & 12;
  return static_cast<alignment_e>(horizontal + (row == 4 ? 6 : row == 8 ? 3 : 0));
}

int
alignment_to_ass(alignment_e alignment) {
  return static_cast<int>(alignment);
}

int
alignment_to_ssa(alignment_e alignment) {
  auto value      = static_cast<int>(alignment);
  auto horizontal = (value - 1) % 3 + 1;

  return value >= 7 ? horizontal + 4
       : value >= 4 ? horizontal + 8
       :              horizontal;
}

bool
style_c::operator ==(style_c const &other)
  const {
  return (m_font_name       == other.m_font_name)
      && (m_font_size       == other.m_font_size)
      && (m_bold            == other.m_bold)
      && (m_italic          == other.m_italic)
      && (m_underline       == other.m_underline)
      && (m_strikeout       == other.m_strikeout)
      && (m_primary_color   == other.m_primary_color)
      && (m_secondary_color == other.m_secondary_color)
      && (m_outline_color   == other.m_outline_color)
      && (m_back_color      == other.m_back_color)
      && (m_scale_x         == other.m_scale_x)
      && (m_scale_y         == other.m_scale_y)
      && (m_spacing         == other.m_spacing)
      && (m_angle           == other.m_angle)
      && (m_border_style    == other.m_border_style)
      && (m_outline         == other.m_outline)
      && (m_shadow          == other.m_shadow)
      && (m_alignment       == other.m_alignment)
      && (m_margins         == other.m_margins)
      && (m_alpha_level     == other.m_alpha_level)
      && (m_encoding        == other.m_encoding)
      && (m_drawing         == other.m_drawing);
}

// ------------------------------------------------------------

bool
style_overrides_t::empty()
  const {
  return *this == style_overrides_t{};
}

bool
style_overrides_t::operator ==(style_overrides_t const &other)
  const {
  return (font_name       == other.font_name)
      && (font_size       == other.font_size)
      && (bold            == other.bold)
      && (italic          == other.italic)
      && (underline       == other.underline)
      && (strikeout       == other.strikeout)
      && (drawing         == other.drawing)
      && (primary_color   == other.primary_color)
      && (secondary_color == other.secondary_color)
      && (outline_color   == other.outline_color)
      && (back_color      == other.back_color)
      && (primary_alpha   == other.primary_alpha)
      && (secondary_alpha == other.secondary_alpha)
      && (outline_alpha   == other.outline_alpha)
      && (back_alpha      == other.back_alpha)
      && (scale_x         == other.scale_x)
      && (scale_y         == other.scale_y)
      && (spacing         == other.spacing)
      && (angle           == other.angle)
      && (outline         == other.outline)
      && (shadow          == other.shadow)
      && (alignment       == other.alignment)
      && (margin_left     == other.margin_left)
      && (margin_right    == other.margin_right)
      && (margin_vertical == other.margin_vertical);
}

namespace {

template<typename T>
void
take_if_set(std::optional<T> &target,
            std::optional<T> const &source) {
  if (source)
    target = source;
}

template<typename T, typename U>
void
apply_if_set(T &target,
             std::optional<U> const &source) {
  if (source)
    target = *source;
}

template<typename T, typename U>
void
drop_if_equal(std::optional<T> &delta,
              U const &current) {
  if (delta && (*delta == current))
    delta.reset();
}

} // anonymous namespace

void
style_overrides_t::merge(style_overrides_t const &other) {
  take_if_set(font_name,       other.font_name);
  take_if_set(font_size,       other.font_size);
  take_if_set(bold,            other.bold);
  take_if_set(italic,          other.italic);
  take_if_set(underline,       other.underline);
  take_if_set(strikeout,       other.strikeout);
  take_if_set(drawing,         other.drawing);
  take_if_set(primary_color,   other.primary_color);
  take_if_set(secondary_color, other.secondary_color);
  take_if_set(outline_color,   other.outline_color);
  take_if_set(back_color,      other.back_color);
  take_if_set(primary_alpha,   other.primary_alpha);
  take_if_set(secondary_alpha, other.secondary_alpha);
  take_if_set(outline_alpha,   other.outline_alpha);
  take_if_set(back_alpha,      other.back_alpha);
  take_if_set(scale_x,         other.scale_x);
  take_if_set(scale_y,         other.scale_y);
  take_if_set(spacing,         other.spacing);
  take_if_set(angle,           other.angle);
  take_if_set(outline,         other.outline);
  take_if_set(shadow,          other.shadow);
  take_if_set(alignment,       other.alignment);
  take_if_set(margin_left,     other.margin_left);
  take_if_set(margin_right,    other.margin_right);
  take_if_set(margin_vertical, other.margin_vertical);
}

/** \brief Remove all deltas that would not change \c current

   Colors are compared without their alpha channel as alpha values
   are carried by the separate alpha deltas.
*/
style_overrides_t
style_overrides_t::without_no_ops(style_c const &current)
  const {
  auto result = *this;

  auto rgb    = [](color_c color) { color.m_a = 0; return color; };

  drop_if_equal(result.font_name,       current.m_font_name);
  drop_if_equal(result.font_size,       current.m_font_size);
  drop_if_equal(result.bold,            current.m_bold);
  drop_if_equal(result.italic,          current.m_italic);
  drop_if_equal(result.underline,       current.m_underline);
  drop_if_equal(result.strikeout,       current.m_strikeout);
  drop_if_equal(result.drawing,         current.m_drawing);
  drop_if_equal(result.primary_color,   rgb(current.m_primary_color));
  drop_if_equal(result.secondary_color, rgb(current.m_secondary_color));
  drop_if_equal(result.outline_color,   rgb(current.m_outline_color));
  drop_if_equal(result.back_color,      rgb(current.m_back_color));
  drop_if_equal(result.primary_alpha,   current.m_primary_color.m_a);
  drop_if_equal(result.secondary_alpha, current.m_secondary_color.m_a);
  drop_if_equal(result.outline_alpha,   current.m_outline_color.m_a);
  drop_if_equal(result.back_alpha,      current.m_back_color.m_a);
  drop_if_equal(result.scale_x,         current.m_scale_x);
  drop_if_equal(result.scale_y,         current.m_scale_y);
  drop_if_equal(result.spacing,         current.m_spacing);
  drop_if_equal(result.angle,           current.m_angle);
  drop_if_equal(result.outline,         current.m_outline);
  drop_if_equal(result.shadow,          current.m_shadow);
  drop_if_equal(result.alignment,       current.m_alignment);
  drop_if_equal(result.margin_left,     current.m_margins.left);
  drop_if_equal(result.margin_right,    current.m_margins.right);
  drop_if_equal(result.margin_vertical, current.m_margins.vertical);

  return result;
}

style_c
resolve_effective(style_c const &style,
                  style_overrides_t const &overrides) {
  auto effective = style;

  auto set_color = [](color_c &target, std::optional<color_c> const &color, std::optional<uint8_t> const &alpha) {
    if (color) {
      auto keep_alpha = target.m_a;
      target          = *color;
      target.m_a      = keep_alpha;
    }
    if (alpha)
      target.m_a = *alpha;
  };

  apply_if_set(effective.m_font_name,        overrides.font_name);
  apply_if_set(effective.m_font_size,        overrides.font_size);
  apply_if_set(effective.m_bold,             overrides.bold);
  apply_if_set(effective.m_italic,           overrides.italic);
  apply_if_set(effective.m_underline,        overrides.underline);
  apply_if_set(effective.m_strikeout,        overrides.strikeout);
  apply_if_set(effective.m_drawing,          overrides.drawing);
  apply_if_set(effective.m_scale_x,          overrides.scale_x);
  apply_if_set(effective.m_scale_y,          overrides.scale_y);
  apply_if_set(effective.m_spacing,          overrides.spacing);
  apply_if_set(effective.m_angle,            overrides.angle);
  apply_if_set(effective.m_outline,          overrides.outline);
  apply_if_set(effective.m_shadow,           overrides.shadow);
  apply_if_set(effective.m_alignment,        overrides.alignment);
  apply_if_set(effective.m_margins.left,     overrides.margin_left);
  apply_if_set(effective.m_margins.right,    overrides.margin_right);
  apply_if_set(effective.m_margins.vertical, overrides.margin_vertical);

  set_color(effective.m_primary_color,   overrides.primary_color,   overrides.primary_alpha);
  set_color(effective.m_secondary_color, overrides.secondary_color, overrides.secondary_alpha);
  set_color(effective.m_outline_color,   overrides.outline_color,   overrides.outline_alpha);
  set_color(effective.m_back_color,      overrides.back_color,      overrides.back_alpha);

  return effective;
}

}
