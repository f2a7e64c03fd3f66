#include "common/common_pch.h"

#include "common/subtitles/document.h"
#include "common/subtitles/subtitles_x.h"

#include "gtest/gtest.h"

namespace {

using namespace stk::subtitles;

event_c
make_event(int64_t start_ms,
           int64_t end_ms,
           std::string const &text,
           std::string const &style = style_c::DEFAULT_NAME) {
  return { timestamp_c::ms(start_ms), timestamp_c::ms(end_ms), text, style };
}

style_c
make_style(std::string const &font_name) {
  style_c style;
  style.m_font_name = font_name;
  return style;
}

TEST(SubtitlesDocument, Defaults) {
  document_c doc;

  EXPECT_EQ(0u, doc.num_events());
  EXPECT_EQ(std::vector<std::string>{ "Default" }, doc.get_style_names());
  EXPECT_EQ(style_c{}, doc.get_style("Default"));
  EXPECT_EQ("yes", *doc.get_info("ScaledBorderAndShadow"));
  EXPECT_FALSE(doc.m_frame_rate.has_value());
}

TEST(SubtitlesDocument, EventEditing) {
  document_c doc;

  doc.add_event(make_event(0, 1000, "b"));
  doc.insert_event(0, make_event(0, 500, "a"));
  doc.insert_event(2, make_event(2000, 3000, "c"));

  ASSERT_EQ(3u, doc.num_events());
  EXPECT_EQ("a", doc.get_event(0).get_text());
  EXPECT_EQ("c", doc.get_event(2).get_text());

  doc.replace_event(1, make_event(0, 1000, "B"));
  EXPECT_EQ("B", doc.get_event(1).get_text());

  doc.remove_event(0);
  EXPECT_EQ("B", doc.get_event(0).get_text());

  EXPECT_THROW(doc.insert_event(5, event_c{}), stk::invalid_parameter_x);
  EXPECT_THROW(doc.remove_event(2),            stk::invalid_parameter_x);
  EXPECT_THROW(doc.get_event(2),               std::out_of_range);

  doc.clear_events();
  EXPECT_EQ(0u, doc.num_events());
}

TEST(SubtitlesDocument, Styles) {
  document_c doc;

  doc.add_style("Alt", make_style("Verdana"));
  EXPECT_THROW(doc.add_style("Alt", style_c{}), duplicate_style_x);
  EXPECT_TRUE(doc.has_style("Alt"));
  EXPECT_FALSE(doc.has_style("alt"));
  EXPECT_THROW(doc.get_style("Other"), unknown_style_x);

  doc.set_style("Alt", make_style("Tahoma"));
  EXPECT_EQ("Tahoma", doc.get_style("Alt").m_font_name);

  EXPECT_THROW(doc.remove_style("Default"), stk::invalid_parameter_x);
  EXPECT_THROW(doc.remove_style("Other"),   unknown_style_x);

  doc.remove_style("Alt");
  EXPECT_FALSE(doc.has_style("Alt"));
}

TEST(SubtitlesDocument, RenamingStylesUpdatesEvents) {
  document_c doc;

  doc.add_style("Sign", make_style("Impact"));
  doc.add_style("Song", make_style("Georgia"));
  doc.add_event(make_event(0, 1000, "a", "Sign"));
  doc.add_event(make_event(0, 1000, "b"));

  doc.rename_style("Sign", "Signs");

  EXPECT_EQ((std::vector<std::string>{ "Default", "Signs", "Song" }), doc.get_style_names());
  EXPECT_EQ("Signs",   doc.get_event(0).m_style);
  EXPECT_EQ("Default", doc.get_event(1).m_style);

  EXPECT_THROW(doc.rename_style("Default", "Main"), stk::invalid_parameter_x);
  EXPECT_THROW(doc.rename_style("Signs", "Song"),   duplicate_style_x);
  EXPECT_THROW(doc.rename_style("Nope", "Other"),   unknown_style_x);
  EXPECT_NO_THROW(doc.rename_style("Song", "Song"));
}

TEST(SubtitlesDocument, ResolvingStyles) {
  document_c doc;
  warnings_t warnings;

  doc.add_style("Alt", make_style("Verdana"));

  EXPECT_EQ("Verdana", doc.resolve_style("Alt", &warnings).m_font_name);
  EXPECT_TRUE(warnings.empty());

  EXPECT_EQ("Arial", doc.resolve_style("Missing", &warnings).m_font_name);
  ASSERT_EQ(1u, warnings.size());
  EXPECT_EQ(warning_type_e::unresolved_style_reference, warnings[0].type);

  EXPECT_NO_THROW(doc.resolve_style("Missing"));

  auto event = make_event(0, 1, "x", "Alt");
  event.m_margins.left = 77;

  auto effective = doc.effective_style(event);
  EXPECT_EQ("Verdana", effective.m_font_name);
  EXPECT_EQ(77,        effective.m_margins.left);
  EXPECT_EQ(10,        effective.m_margins.right);
}

TEST(SubtitlesDocument, ImportingStyles) {
  document_c first, second;

  first.add_style("Alt", make_style("Verdana"));
  second.add_style("Alt", make_style("Tahoma"));
  second.add_style("New", make_style("Courier"));

  auto copy = first;
  copy.import_styles(second, false);
  EXPECT_EQ("Verdana", copy.get_style("Alt").m_font_name);
  EXPECT_EQ("Courier", copy.get_style("New").m_font_name);

  first.import_styles(second);
  EXPECT_EQ("Tahoma", first.get_style("Alt").m_font_name);
}

TEST(SubtitlesDocument, Info) {
  document_c doc;

  doc.set_info("Title", "Test");
  doc.set_info("WrapStyle", "2");

  EXPECT_EQ("Test", *doc.get_info("Title"));
  EXPECT_EQ("2",    *doc.get_info("WrapStyle"));
  EXPECT_EQ("WrapStyle", doc.get_info().front().first);

  doc.remove_info("Title");
  EXPECT_FALSE(doc.get_info("Title").has_value());

  doc.clear_info();
  EXPECT_TRUE(doc.get_info().empty());
}

TEST(SubtitlesDocument, Shifting) {
  document_c doc;

  doc.add_event(make_event(1000, 2000, "a"));
  doc.add_event(make_event(5000, 6000, "b"));

  doc.shift(-1500);
  EXPECT_EQ(0,    doc.get_event(0).get_start().to_ms());
  EXPECT_EQ(500,  doc.get_event(0).get_end().to_ms());
  EXPECT_EQ(3500, doc.get_event(1).get_start().to_ms());

  doc.shift(1500);
  EXPECT_EQ(1500, doc.get_event(0).get_start().to_ms());

  doc.shift_frames(2, 10.0);
  EXPECT_EQ(1700, doc.get_event(0).get_start().to_ms());
  EXPECT_EQ(2200, doc.get_event(0).get_end().to_ms());

  doc.shift_frames(-100, 10.0);
  EXPECT_EQ(0,    doc.get_event(0).get_start().to_ms());
}

TEST(SubtitlesDocument, TransformingFrameRates) {
  document_c doc;

  doc.add_event(make_event(1000, 2000, "a"));
  doc.transform_framerate(25.0, 50.0);

  EXPECT_EQ(500,  doc.get_event(0).get_start().to_ms());
  EXPECT_EQ(1000, doc.get_event(0).get_end().to_ms());

  EXPECT_THROW(doc.transform_framerate(0.0, 25.0),  stk::invalid_parameter_x);
  EXPECT_THROW(doc.transform_framerate(25.0, -1.0), stk::invalid_parameter_x);
}

TEST(SubtitlesDocument, SortingIsStable) {
  document_c doc;

  doc.add_event(make_event(2000, 3000, "late"));
  doc.add_event(make_event(1000, 4000, "long"));
  doc.add_event(make_event(1000, 2000, "short"));
  doc.add_event(make_event(1000, 2000, "short again"));

  doc.sort();

  EXPECT_EQ("short",       doc.get_event(0).get_text());
  EXPECT_EQ("short again", doc.get_event(1).get_text());
  EXPECT_EQ("long",        doc.get_event(2).get_text());
  EXPECT_EQ("late",        doc.get_event(3).get_text());
}

TEST(SubtitlesDocument, RemovingMiscellaneousEvents) {
  document_c doc;

  auto comment   = make_event(0, 1000, "comment");
  comment.m_type = event_type_e::comment;

  doc.add_event(make_event(0, 1000, "keep"));
  doc.add_event(comment);
  doc.add_event(make_event(0, 1000, "{\\p1}m 0 0 l 1 1"));
  doc.add_event(make_event(0, 1000, "{\\pos(1,1)}  "));
  doc.add_event(make_event(0, 1000, "{\\i1}keep"));
  doc.add_event(make_event(0, 2000, "keep"));

  doc.remove_miscellaneous_events();

  ASSERT_EQ(2u, doc.num_events());
  EXPECT_EQ("keep", doc.get_event(0).get_text());
  EXPECT_EQ(2000,   doc.get_event(1).get_end().to_ms());
}

TEST(SubtitlesDocument, Equality) {
  document_c first, second;

  first.add_event(make_event(0, 1000, "a"));
  second.add_event(make_event(0, 1000, "a"));
  EXPECT_TRUE(first.equals(second));

  second.m_play_res_x = 1920;
  EXPECT_FALSE(first.equals(second));

  second = first;
  second.get_event(0).m_name = "Speaker";
  EXPECT_FALSE(first.equals(second));
}

TEST(SubtitlesDocument, Merging) {
  document_c first, second, third;

  first.m_play_res_x = 640;
  first.add_style("Sign", make_style("Impact"));
  first.add_event(make_event(0, 1000, "one", "Sign"));

  second.m_play_res_x = 1920;
  second.add_style("Sign", make_style("Verdana"));
  second.add_event(make_event(1000, 2000, "two", "Sign"));

  third.add_style("Sign", make_style("Impact"));
  third.add_event(make_event(2000, 3000, "three", "Sign"));

  auto merged = document_c::merge({ first, second, third });

  EXPECT_EQ(640, *merged.m_play_res_x);
  EXPECT_EQ((std::vector<std::string>{ "Default", "Sign", "Sign_2" }), merged.get_style_names());
  EXPECT_EQ("Verdana", merged.get_style("Sign_2").m_font_name);

  ASSERT_EQ(3u, merged.num_events());
  EXPECT_EQ("Sign",   merged.get_event(0).m_style);
  EXPECT_EQ("Sign_2", merged.get_event(1).m_style);
  EXPECT_EQ("Sign",   merged.get_event(2).m_style);

  EXPECT_EQ(0u, document_c::merge({}).num_events());
}

}
