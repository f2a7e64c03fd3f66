#include "common/common_pch.h"

#include "common/subtitles/override_tags.h"
#include "common/subtitles/subtitles_x.h"

#include "gtest/gtest.h"

namespace {

using namespace stk::subtitles;

std::vector<override_token_type_e>
token_types(std::string const &text,
            bool strict = true) {
  std::vector<override_token_type_e> types;
  override_tag_parser_c parser{text, strict};

  while (auto token = parser.next())
    types.emplace_back(token->type);

  return types;
}

TEST(SubtitlesOverrideTags, Tokenizing) {
  using t = override_token_type_e;

  EXPECT_EQ((std::vector<t>{ t::text, t::block_start, t::directive, t::block_end, t::forced_break, t::text }), token_types("A{\\b1}\\NB"));
  EXPECT_EQ((std::vector<t>{ t::block_start, t::comment, t::directive, t::block_end, t::text }),               token_types("{note\\i1}x"));
  EXPECT_EQ((std::vector<t>{ t::text, t::hard_space, t::text, t::soft_break }),                                token_types("a\\hb\\n"));
  EXPECT_EQ((std::vector<t>{ }),                                                                                token_types(""));
}

TEST(SubtitlesOverrideTags, DirectiveWithParentheses) {
  override_tag_parser_c parser{"{\\clip(0,0,10,10)\\t(0,500,\\fs40)}x"};

  parser.next();
  auto clip = parser.next();
  auto transform = parser.next();

  ASSERT_TRUE(clip && transform);
  EXPECT_EQ("\\clip(0,0,10,10)", clip->raw);
  EXPECT_EQ(directive_kind_e::positioning, clip->directive.kind);
  EXPECT_EQ("\\t(0,500,\\fs40)", transform->raw);
  EXPECT_EQ(directive_kind_e::transform, transform->directive.kind);
}

TEST(SubtitlesOverrideTags, UnterminatedBlock) {
  EXPECT_THROW(token_types("Hello {world"), unterminated_override_block_x);
  EXPECT_THROW(parse_runs("Hello {world"),  unterminated_override_block_x);

  auto parsed = parse_runs("Hello {world", false);

  ASSERT_EQ(1u, parsed.runs.size());
  EXPECT_EQ("Hello {world", parsed.runs[0].text);
  ASSERT_TRUE(parsed.unterminated_block_offset.has_value());
  EXPECT_EQ(6u, *parsed.unterminated_block_offset);

  override_tag_parser_c parser{"a{b", false};
  while (parser.next())
    ;
  EXPECT_EQ(1u, *parser.get_unterminated_offset());

  parser.restart();
  EXPECT_FALSE(parser.get_unterminated_offset().has_value());
}

TEST(SubtitlesOverrideTags, Classification) {
  auto directive = classify_directive("\\fscx120");
  EXPECT_EQ("fscx",                   directive.name);
  EXPECT_EQ("120",                    directive.argument);
  EXPECT_EQ(directive_kind_e::font,   directive.kind);

  EXPECT_EQ(directive_kind_e::karaoke,   classify_directive("\\kf50").kind);
  EXPECT_EQ("kf",                        classify_directive("\\kf50").name);
  EXPECT_EQ(directive_kind_e::font,      classify_directive("\\shad2").kind);
  EXPECT_EQ(directive_kind_e::emphasis,  classify_directive("\\s1").kind);
  EXPECT_EQ(directive_kind_e::font,      classify_directive("\\blur3").kind);
  EXPECT_EQ(directive_kind_e::color,     classify_directive("\\alpha&H80&").kind);
  EXPECT_EQ(directive_kind_e::positioning, classify_directive("\\an8").kind);
  EXPECT_EQ(directive_kind_e::reset,     classify_directive("\\rAlt").kind);
  EXPECT_EQ(directive_kind_e::drawing,   classify_directive("\\p1").kind);

  auto unknown = classify_directive("\\xyz");
  EXPECT_EQ(directive_kind_e::unknown, unknown.kind);
  EXPECT_EQ("xyz",                     unknown.argument);
}

TEST(SubtitlesOverrideTags, DirectiveDelta) {
  style_c base;
  base.m_bold = true;

  EXPECT_TRUE(*directive_delta(classify_directive("\\b700"))->bold);
  EXPECT_FALSE(*directive_delta(classify_directive("\\b0"))->bold);
  EXPECT_TRUE(*directive_delta(classify_directive("\\b"), base)->bold);
  EXPECT_EQ(28.0,  *directive_delta(classify_directive("\\fs28"))->font_size);
  EXPECT_EQ(color_c(0, 255, 0), *directive_delta(classify_directive("\\c&H00FF00&"))->primary_color);
  EXPECT_EQ(alignment_e::top_center, *directive_delta(classify_directive("\\an8"))->alignment);
  EXPECT_EQ(alignment_e::top_center, *directive_delta(classify_directive("\\a6"))->alignment);

  auto alpha = directive_delta(classify_directive("\\alpha&H80&"));
  ASSERT_TRUE(alpha.has_value());
  EXPECT_EQ(0x80, *alpha->primary_alpha);
  EXPECT_EQ(0x80, *alpha->back_alpha);

  EXPECT_FALSE(directive_delta(classify_directive("\\fs+2")).has_value());
  EXPECT_FALSE(directive_delta(classify_directive("\\i2")).has_value());
  EXPECT_FALSE(directive_delta(classify_directive("\\pos(1,2)")).has_value());
  EXPECT_FALSE(directive_delta(classify_directive("\\k20")).has_value());
  EXPECT_FALSE(directive_delta(classify_directive("\\an10")).has_value());
}

TEST(SubtitlesOverrideTags, FormatDelta) {
  style_overrides_t delta;
  EXPECT_EQ("", format_delta(delta));

  delta.primary_color = color_c{255, 0, 0};
  delta.bold          = true;
  EXPECT_EQ("\\b1\\c&H0000FF&", format_delta(delta));

  delta = style_overrides_t{};
  delta.primary_alpha = delta.secondary_alpha = delta.outline_alpha = delta.back_alpha = 0x40;
  EXPECT_EQ("\\alpha&H40&", format_delta(delta));

  delta.back_alpha = 0;
  EXPECT_EQ("\\1a&H40&\\2a&H40&\\3a&H40&\\4a&H00&", format_delta(delta));
}

TEST(SubtitlesOverrideTags, ParseRuns) {
  auto parsed = parse_runs("{\\b1}Bold{\\b0} normal");

  ASSERT_EQ(2u, parsed.runs.size());
  EXPECT_EQ("Bold",    parsed.runs[0].text);
  EXPECT_TRUE(*parsed.runs[0].delta.bold);
  EXPECT_EQ(" normal", parsed.runs[1].text);
  EXPECT_FALSE(*parsed.runs[1].delta.bold);
  EXPECT_FALSE(parsed.unterminated_block_offset.has_value());

  parsed = parse_runs("{\\i1}{\\pos(10,20)}x");
  ASSERT_EQ(1u, parsed.runs.size());
  EXPECT_TRUE(*parsed.runs[0].delta.italic);
  ASSERT_EQ(1u, parsed.runs[0].passthrough.size());
  EXPECT_EQ("\\pos(10,20)", parsed.runs[0].passthrough[0].raw);

  parsed = parse_runs("a{\\rAlt}b");
  ASSERT_EQ(2u, parsed.runs.size());
  EXPECT_FALSE(parsed.runs[0].reset.has_value());
  EXPECT_EQ("Alt", *parsed.runs[1].reset);

  EXPECT_TRUE(parse_runs("").runs.empty());
}

TEST(SubtitlesOverrideTags, SerializeRuns) {
  EXPECT_EQ("{\\b1}Bold{\\b0} normal", serialize_runs(parse_runs("{\\b1}Bold{\\b0} normal").runs));
  EXPECT_EQ("{\\i1\\pos(10,20)}x",     serialize_runs(parse_runs("{\\i1}{\\pos(10,20)}x").runs));

  // Redundant directives are dropped.
  EXPECT_EQ("plain",       serialize_runs(parse_runs("{\\b0\\i0}plain").runs));
  EXPECT_EQ("{\\i1}a b",   serialize_runs(parse_runs("{\\i1}a{\\i1} b").runs));
  EXPECT_EQ("x{\\b1}",     serialize_runs(parse_runs("x{\\b1}").runs));
}

TEST(SubtitlesOverrideTags, SerializeRunsWithComments) {
  EXPECT_EQ("{\\b1}{note}x",            serialize_runs(parse_runs("{\\b1}{note}x").runs));
  EXPECT_EQ("{\\b1}{note}x",            serialize_runs(parse_runs("{note\\b1}x").runs));
  EXPECT_EQ("{\\fnVerdana}{note}x",     serialize_runs(parse_runs("{\\fnVerdana}{note}x").runs));
  EXPECT_EQ("{\\pos(1,2)}{a}{\\k5}x",   serialize_runs(parse_runs("{\\pos(1,2)}{a}{\\k5}x").runs));
}

TEST(SubtitlesOverrideTags, SerializedRunsParseToEquivalentRuns) {
  auto check_equivalent = [](std::string const &text) {
    auto original = parse_runs(text).runs;
    auto reparsed = parse_runs(serialize_runs(original)).runs;

    ASSERT_EQ(original.size(), reparsed.size()) << text;

    for (auto idx = 0u; idx < original.size(); ++idx) {
      EXPECT_EQ(original[idx].text,  reparsed[idx].text)  << text;
      EXPECT_TRUE(original[idx].reset == reparsed[idx].reset) << text;
      EXPECT_TRUE(original[idx].delta == reparsed[idx].delta) << text;

      ASSERT_EQ(original[idx].passthrough.size(), reparsed[idx].passthrough.size()) << text;
      for (auto p_idx = 0u; p_idx < original[idx].passthrough.size(); ++p_idx)
        EXPECT_EQ(original[idx].passthrough[p_idx].raw, reparsed[idx].passthrough[p_idx].raw) << text;
    }
  };

  check_equivalent("{\\b1}{note}x");
  check_equivalent("{\\fnVerdana}{note}x{\\fnTimes}y");
  check_equivalent("{note\\b1}x");
  check_equivalent("a{\\rAlt}{note}b{\\r}c");
  check_equivalent("{\\rAlt\\i1}{note\\pos(1,2)}x");
  check_equivalent("{\\pos(10,20)}{note}x{\\b1}y{two}");
}

TEST(SubtitlesOverrideTags, ParseTags) {
  auto fragments = parse_tags("Hi{\\b1}there{\\rAlt}end", style_c{}, [](std::string const &name) -> std::optional<style_c> {
    if (name != "Alt")
      return {};

    style_c alt;
    alt.m_font_name = "Alt Font";
    return alt;
  });

  ASSERT_EQ(3u, fragments.size());
  EXPECT_EQ("Hi",       fragments[0].first);
  EXPECT_FALSE(fragments[0].second.m_bold);
  EXPECT_EQ("there",    fragments[1].first);
  EXPECT_TRUE(fragments[1].second.m_bold);
  EXPECT_EQ("end",      fragments[2].first);
  EXPECT_FALSE(fragments[2].second.m_bold);
  EXPECT_EQ("Alt Font", fragments[2].second.m_font_name);

  fragments = parse_tags("");
  ASSERT_EQ(1u, fragments.size());
  EXPECT_EQ("", fragments[0].first);
}

TEST(SubtitlesOverrideTags, Removal) {
  auto positioning = [](override_directive_t const &directive) { return directive.kind == directive_kind_e::positioning; };
  auto everything  = [](override_directive_t const &) { return true; };

  EXPECT_EQ("{\\b1}Text", remove_directives("{\\pos(10,20)\\b1}Text", positioning));
  EXPECT_EQ("Text",       remove_directives("{\\pos(10,20)}Text",      positioning));
  EXPECT_EQ("{note}Text", remove_directives("{note\\b1}Text",          everything));

  EXPECT_EQ("AB",         strip_override_blocks("{\\b1}A{comment}B"));
  EXPECT_EQ("a {b",       strip_override_blocks("a {b"));

  EXPECT_EQ("a b\nc\nd",  unescape_text("a\\hb\\nc\\Nd"));
}

}
