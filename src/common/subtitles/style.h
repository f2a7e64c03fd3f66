/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   named style records and their attribute overrides
*/

#pragma once

#include "common/common_pch.h"

#include <boost/operators.hpp>

#include "common/subtitles/color.h"

namespace stk::subtitles {

// Values follow the numeric keypad layout used by ASS.
enum class alignment_e {
  bottom_left   = 1,
  bottom_center = 2,
  bottom_right  = 3,
  middle_left   = 4,
  middle_center = 5,
  middle_right  = 6,
  top_left      = 7,
  top_center    = 8,
  top_right     = 9,
};

enum class border_style_e {
  outline    = 1,
  opaque_box = 3,
};

alignment_e alignment_from_ass(int value);
alignment_e alignment_from_ssa(int value);
int alignment_to_ass(alignment_e alignment);
int alignment_to_ssa(alignment_e alignment);

struct margins_t: boost::equality_comparable<margins_t> {
  int left{10}, right{10}, vertical{10};

  bool operator ==(margins_t const &other) const {
    return (left == other.left) && (right == other.right) && (vertical == other.vertical);
  }
};

class style_c: boost::equality_comparable<style_c> {
public:
  static constexpr auto DEFAULT_NAME = "Default";

  std::string m_font_name{"Arial"};
  double m_font_size{20.0};
  bool m_bold{}, m_italic{}, m_underline{}, m_strikeout{};
  color_c m_primary_color{color_c::white()}, m_secondary_color{color_c::red()}, m_outline_color{color_c::black()}, m_back_color{color_c::black()};
  double m_scale_x{100.0}, m_scale_y{100.0}, m_spacing{}, m_angle{};
  border_style_e m_border_style{border_style_e::outline};
  double m_outline{2.0}, m_shadow{2.0};
  alignment_e m_alignment{alignment_e::bottom_center};
  margins_t m_margins;
  int m_alpha_level{}, m_encoding{1};

  // Only ever set through override tags.
  bool m_drawing{};

public:
  bool operator ==(style_c const &other) const;
};

// Attribute deltas carried by override tags and per-event settings.
// Unset members leave the base style's value untouched.
struct style_overrides_t: boost::equality_comparable<style_overrides_t> {
  std::optional<std::string> font_name;
  std::optional<double> font_size;
  std::optional<bool> bold, italic, underline, strikeout, drawing;
  std::optional<color_c> primary_color, secondary_color, outline_color, back_color;
  std::optional<uint8_t> primary_alpha, secondary_alpha, outline_alpha, back_alpha;
  std::optional<double> scale_x, scale_y, spacing, angle, outline, shadow;
  std::optional<alignment_e> alignment;
  std::optional<int> margin_left, margin_right, margin_vertical;

  bool empty() const;
  void merge(style_overrides_t const &other);
  style_overrides_t without_no_ops(style_c const &current) const;

  bool operator ==(style_overrides_t const &other) const;
};

style_c resolve_effective(style_c const &style, style_overrides_t const &overrides);

}
