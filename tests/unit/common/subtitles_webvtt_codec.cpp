#include "common/common_pch.h"

#include "common/subtitles/codec.h"
#include "common/subtitles/subtitles_x.h"

#include "gtest/gtest.h"

namespace {

using namespace stk::subtitles;

std::string const s_sample =
  "WEBVTT - sample\n"
  "Kind: captions\n"
  "\n"
  "NOTE a comment\n"
  "\n"
  "1\n"
  "00:01.000 --> 00:02.500 align:start\n"
  "<v Alice>Hi <b>there</b></v>\n"
  "\n"
  "00:00:03.000 --> 00:00:04.000\n"
  "a &lt; b <00:00:03.500>later\n";

TEST(SubtitlesWebVTT, Reading) {
  auto read = read_text(s_sample, format_e::vtt);
  auto const &doc = read.document;

  EXPECT_TRUE(read.warnings.empty());
  ASSERT_EQ(2u, doc.num_events());

  EXPECT_EQ(1000,                  doc.get_event(0).get_start().to_ms());
  EXPECT_EQ(2500,                  doc.get_event(0).get_end().to_ms());
  EXPECT_EQ("Hi {\\b1}there{\\b0}", doc.get_event(0).get_text());
  EXPECT_EQ("Alice",               doc.get_event(0).m_name);

  EXPECT_EQ(3000,                  doc.get_event(1).get_start().to_ms());
  EXPECT_EQ("a < b later",         doc.get_event(1).get_text());

  ASSERT_EQ(1u, doc.m_opaque_sections.size());
  EXPECT_EQ("vtt",            doc.m_opaque_sections[0].origin_format);
  EXPECT_EQ("NOTE a comment", doc.m_opaque_sections[0].name);
  EXPECT_TRUE(doc.m_opaque_sections[0].lines.empty());
}

TEST(SubtitlesWebVTT, Writing) {
  auto written = write_text(read_text(s_sample, format_e::vtt).document, format_e::vtt);

  EXPECT_EQ("WEBVTT\n"
            "\n"
            "NOTE a comment\n"
            "\n"
            "1\n"
            "00:00:01.000 --> 00:00:02.500\n"
            "Hi <b>there</b>\n"
            "\n"
            "2\n"
            "00:00:03.000 --> 00:00:04.000\n"
            "a &lt; b later\n"
            "\n",
            written.text);

  ASSERT_EQ(1u, written.num_lossy_mappings());
  EXPECT_EQ(feature_e::actor_name, written.lossy_mappings[0].feature);
  EXPECT_EQ(policy_action_e::drop, written.lossy_mappings[0].action);
  EXPECT_EQ(0u,                    *written.lossy_mappings[0].event_index);
}

TEST(SubtitlesWebVTT, WritingSortsByStartTime) {
  document_c doc;

  doc.add_event({ timestamp_c::s(5), timestamp_c::s(6), "late" });
  doc.add_event({ timestamp_c::s(1), timestamp_c::s(2), "early" });

  codec_options_t options;
  options.timestamp_flavor = timestamp_flavor_e::compact;

  EXPECT_EQ("WEBVTT\n\n1\n00:01.000 --> 00:02.000\nearly\n\n2\n00:05.000 --> 00:06.000\nlate\n\n", write_text(doc, format_e::vtt, options).text);
}

TEST(SubtitlesWebVTT, EmptyDocument) {
  auto written = write_text(document_c{}, format_e::vtt);

  EXPECT_EQ("WEBVTT\n\n", written.text);
  EXPECT_EQ(0u, written.num_lossy_mappings());

  EXPECT_EQ(0u, read_text("WEBVTT\n", format_e::vtt).document.num_events());
}

TEST(SubtitlesWebVTT, MissingHeader) {
  std::string const text = "00:00:01.000 --> 00:00:02.000\nx\n";

  EXPECT_THROW(read_text(text, format_e::vtt), malformed_input_x);

  codec_options_t options;
  options.strict = false;

  auto read = read_text(text, format_e::vtt, options);

  ASSERT_EQ(1u, read.warnings.size());
  EXPECT_EQ(warning_type_e::skipped_record, read.warnings[0].type);
  ASSERT_EQ(1u, read.document.num_events());
  EXPECT_EQ("x", read.document.get_event(0).get_text());
}

TEST(SubtitlesWebVTT, MalformedCues) {
  std::string const text =
    "WEBVTT\n"
    "\n"
    "00:00:01 --> 00:00:02.000\n"
    "no fraction\n"
    "\n"
    "just text\n"
    "\n"
    "00:00:03.000 --> 00:00:04.000\n"
    "ok\n";

  EXPECT_THROW(read_text(text, format_e::vtt), malformed_input_x);

  codec_options_t options;
  options.strict = false;

  auto read = read_text(text, format_e::vtt, options);

  EXPECT_EQ(2u, read.warnings.size());
  ASSERT_EQ(1u, read.document.num_events());
  EXPECT_EQ("ok", read.document.get_event(0).get_text());
}

TEST(SubtitlesWebVTT, FractionsNeedThreeDigits) {
  std::string const text =
    "WEBVTT\n"
    "Kind: captions\n"
    "Language: en\n"
    "\n"
    "00:00:01.50 --> 00:00:02.000\n"
    "two digits\n"
    "\n"
    "00:00:03.000 --> 00:00:04.000\n"
    "ok\n";

  EXPECT_THROW(read_text(text, format_e::vtt), malformed_input_x);

  codec_options_t options;
  options.strict = false;

  auto read = read_text(text, format_e::vtt, options);

  ASSERT_EQ(1u, read.warnings.size());
  EXPECT_EQ(5u, *read.warnings[0].line);
  ASSERT_EQ(1u, read.document.num_events());
  EXPECT_EQ("ok", read.document.get_event(0).get_text());
}

}
