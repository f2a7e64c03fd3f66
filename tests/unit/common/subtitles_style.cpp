#include "common/common_pch.h"

#include "common/subtitles/color.h"
#include "common/subtitles/style.h"

#include "gtest/gtest.h"

namespace {

using namespace stk::subtitles;

TEST(SubtitlesColor, ChannelRange) {
  EXPECT_NO_THROW(color_c(0, 128, 255, 255));
  EXPECT_THROW(color_c(256, 0, 0),  stk::invalid_parameter_x);
  EXPECT_THROW(color_c(0, -1, 0),   stk::invalid_parameter_x);
  EXPECT_THROW(color_c(0, 0, 0, 300), stk::invalid_parameter_x);
}

TEST(SubtitlesColor, SubStationNotation) {
  auto color = color_c{0x12, 0x34, 0x56, 0x78};

  EXPECT_EQ("&H78563412",   color.to_ass());
  EXPECT_EQ("5649426",      color.to_ssa());
  EXPECT_EQ("&H563412&",    color.to_override());
  EXPECT_EQ("#123456",      color.to_html());

  EXPECT_EQ(color,                      color_c::from_substation("&H78563412"));
  EXPECT_EQ(color,                      color_c::from_substation("&h78563412&"));
  EXPECT_EQ(color_c(0x12, 0x34, 0x56),  color_c::from_substation("5649426"));
  EXPECT_EQ(color_c::white(),           color_c::from_substation("&H00FFFFFF"));
  EXPECT_EQ(color_c::white(),           color_c::from_substation("16777215"));

  EXPECT_THROW(color_c::from_substation("white"), stk::invalid_parameter_x);
  EXPECT_THROW(color_c::from_substation("&Hxyz"), stk::invalid_parameter_x);
}

TEST(SubtitlesColor, OverrideNotation) {
  EXPECT_EQ(color_c(255, 0, 0), *color_c::from_override("&H0000FF&"));
  EXPECT_EQ(color_c(255, 0, 0), *color_c::from_override("&HFF&"));
  EXPECT_EQ(color_c(0, 0, 255), *color_c::from_override("FF0000"));
  EXPECT_FALSE(color_c::from_override("&Hgreen&").has_value());

  EXPECT_EQ(0x80, *color_c::alpha_from_override("&H80&"));
  EXPECT_FALSE(color_c::alpha_from_override("&H800&").has_value());
  EXPECT_EQ("&H0A&", color_c::alpha_to_override(10));
}

TEST(SubtitlesColor, HtmlNotation) {
  EXPECT_EQ(color_c(255, 0, 0),        *color_c::from_html("#ff0000"));
  EXPECT_EQ(color_c(0x12, 0xab, 0xef), *color_c::from_html("#12ABEF"));
  EXPECT_EQ(color_c(255, 255, 0),      *color_c::from_html(" Yellow "));
  EXPECT_FALSE(color_c::from_html("#fff").has_value());
  EXPECT_FALSE(color_c::from_html("chartreuse").has_value());
}

TEST(SubtitlesStyle, Defaults) {
  style_c style;

  EXPECT_EQ("Arial",                  style.m_font_name);
  EXPECT_EQ(20.0,                     style.m_font_size);
  EXPECT_EQ(color_c::white(),         style.m_primary_color);
  EXPECT_EQ(alignment_e::bottom_center, style.m_alignment);
  EXPECT_EQ(margins_t{},              style.m_margins);
  EXPECT_FALSE(style.m_bold);
  EXPECT_EQ(style, style_c{});
}

TEST(SubtitlesStyle, Alignment) {
  EXPECT_EQ(alignment_e::top_right, alignment_from_ass(9));
  EXPECT_THROW(alignment_from_ass(0),  stk::invalid_parameter_x);
  EXPECT_THROW(alignment_from_ass(10), stk::invalid_parameter_x);

  EXPECT_EQ(alignment_e::bottom_left,   alignment_from_ssa(1));
  EXPECT_EQ(alignment_e::top_center,    alignment_from_ssa(6));
  EXPECT_EQ(alignment_e::middle_right,  alignment_from_ssa(11));
  EXPECT_THROW(alignment_from_ssa(4),  stk::invalid_parameter_x);
  EXPECT_THROW(alignment_from_ssa(12), stk::invalid_parameter_x);

  for (auto value = 1; value <= 9; ++value) {
    auto alignment = static_cast<alignment_e>(value);
    EXPECT_EQ(alignment, alignment_from_ssa(alignment_to_ssa(alignment)));
    EXPECT_EQ(value,     alignment_to_ass(alignment));
  }
}

TEST(SubtitlesStyle, ResolveEffective) {
  style_c base;
  base.m_primary_color.m_a = 0x40;

  style_overrides_t overrides;
  overrides.bold          = true;
  overrides.font_size     = 32.0;
  overrides.primary_color = color_c{0, 0, 255};
  overrides.margin_left   = 50;

  auto effective = resolve_effective(base, overrides);

  EXPECT_TRUE(effective.m_bold);
  EXPECT_EQ(32.0,                      effective.m_font_size);
  EXPECT_EQ(color_c(0, 0, 255, 0x40),  effective.m_primary_color);
  EXPECT_EQ(50,                        effective.m_margins.left);
  EXPECT_EQ(10,                        effective.m_margins.right);
  EXPECT_EQ(base.m_font_name,          effective.m_font_name);

  overrides.primary_alpha = 0;
  EXPECT_EQ(color_c(0, 0, 255, 0), resolve_effective(base, overrides).m_primary_color);
}

TEST(SubtitlesStyle, OverridesMergeAndNoOps) {
  style_overrides_t first, second;

  EXPECT_TRUE(first.empty());

  first.bold    = true;
  first.italic  = true;
  second.bold   = false;
  second.shadow = 0.0;

  first.merge(second);

  ASSERT_TRUE(first.bold.has_value());
  EXPECT_FALSE(*first.bold);
  EXPECT_TRUE(*first.italic);
  EXPECT_EQ(0.0, *first.shadow);

  auto reduced = first.without_no_ops(style_c{});

  EXPECT_FALSE(reduced.bold.has_value());
  ASSERT_TRUE(reduced.italic.has_value());
  ASSERT_TRUE(reduced.shadow.has_value());
  EXPECT_EQ(0.0, *reduced.shadow);
}

}
