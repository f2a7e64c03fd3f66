#include "common/common_pch.h"

#include "common/subtitles/codec.h"
#include "common/subtitles/microdvd_codec.h"
#include "common/subtitles/subtitles_x.h"

#include "gtest/gtest.h"

namespace {

using namespace stk::subtitles;

TEST(SubtitlesMicroDVD, FrameRateDeclaration) {
  auto read = read_text("{1}{1}25\n{25}{50}Hello|{y:i}World\n", format_e::microdvd);
  auto const &doc = read.document;

  EXPECT_TRUE(read.warnings.empty());
  ASSERT_TRUE(doc.m_frame_rate.has_value());
  EXPECT_EQ(25.0, *doc.m_frame_rate);

  ASSERT_EQ(1u, doc.num_events());
  EXPECT_EQ(1000,                            doc.get_event(0).get_start().to_ms());
  EXPECT_EQ(2000,                            doc.get_event(0).get_end().to_ms());
  EXPECT_EQ("Hello\n{\\i1}World{\\i0}",      doc.get_event(0).get_text());
}

TEST(SubtitlesMicroDVD, ConfiguredFrameRateWins) {
  codec_options_t options;
  options.frame_rate = 50.0;

  auto read = read_text("{1}{1}25\n{25}{50}Hello\n", format_e::microdvd, options);

  EXPECT_EQ(50.0, *read.document.m_frame_rate);
  EXPECT_EQ(500,  read.document.get_event(0).get_start().to_ms());
}

TEST(SubtitlesMicroDVD, MissingFrameRate) {
  codec_options_t options;
  options.strict = false;

  EXPECT_THROW(read_text("{25}{50}Hello\n", format_e::microdvd),          missing_frame_rate_x);
  EXPECT_THROW(read_text("{25}{50}Hello\n", format_e::microdvd, options), missing_frame_rate_x);

  document_c doc;
  doc.add_event({ timestamp_c::s(1), timestamp_c::s(2), "x" });

  EXPECT_THROW(write_text(doc, format_e::microdvd), missing_frame_rate_x);
}

TEST(SubtitlesMicroDVD, ControlCodes) {
  EXPECT_EQ("{\\c&H0000FF&}Red",                    microdvd_codec_c::control_codes_to_override_tags("{C:$0000FF}Red"));
  EXPECT_EQ("{\\b1\\u1}one{\\b0\\u0}\ntwo",         microdvd_codec_c::control_codes_to_override_tags("{y:bu}one|two"));
  EXPECT_EQ("{\\i1}one\ntwo",                       microdvd_codec_c::control_codes_to_override_tags("{Y:i}one|two"));
  EXPECT_EQ("{\\fnArial}{\\fs12}a{\\fn\\fs}",        microdvd_codec_c::control_codes_to_override_tags("{f:Arial}{s:12}a"));
  EXPECT_EQ("plain",                                microdvd_codec_c::control_codes_to_override_tags("{P:1}plain"));
}

TEST(SubtitlesMicroDVD, Writing) {
  auto doc     = read_text("{1}{1}25\n{25}{50}Hello|{y:i}World\n", format_e::microdvd).document;
  auto written = write_text(doc, format_e::microdvd);

  EXPECT_EQ("{25}{50}Hello|{y:i}World\n", written.text);
  EXPECT_EQ(0u, written.num_lossy_mappings());

  codec_options_t options;
  options.write_frame_rate_declaration = true;

  EXPECT_EQ("{1}{1}25\n{25}{50}Hello|{y:i}World\n", write_text(doc, format_e::microdvd, options).text);

  options.frame_rate = 23.976;
  EXPECT_EQ(0u, write_text(doc, format_e::microdvd, options).text.find("{1}{1}23.976\n"));
}

TEST(SubtitlesMicroDVD, LossyWriting) {
  document_c doc;
  doc.m_frame_rate = 25.0;
  doc.add_event({ timestamp_c::ms(1010), timestamp_c::s(2), "{\\c&H0000FF&}all red" });
  doc.add_event({ timestamp_c::s(3),     timestamp_c::s(4), "half {\\i1}italic" });

  auto written = write_text(doc, format_e::microdvd);

  EXPECT_EQ("{25}{50}{C:$0000FF}all red\n{75}{100}half italic\n", written.text);

  ASSERT_EQ(2u, written.num_lossy_mappings());
  EXPECT_EQ(feature_e::time_resolution,         written.lossy_mappings[0].feature);
  EXPECT_EQ(0u,                                 *written.lossy_mappings[0].event_index);
  EXPECT_EQ(feature_e::inline_emphasis_midline, written.lossy_mappings[1].feature);
  EXPECT_EQ(policy_action_e::approximate,       written.lossy_mappings[1].action);
}

TEST(SubtitlesMicroDVD, MalformedLines) {
  std::string const text = "{25}{50}ok\ngarbage\n{75}{60}reversed\n";
  codec_options_t options;

  options.frame_rate = 25.0;
  EXPECT_THROW(read_text(text, format_e::microdvd, options), malformed_input_x);

  options.strict = false;
  auto read = read_text(text, format_e::microdvd, options);

  EXPECT_EQ(1u, read.document.num_events());
  ASSERT_EQ(2u, read.warnings.size());
  EXPECT_EQ(2u, *read.warnings[0].line);
  EXPECT_EQ(3u, *read.warnings[1].line);
}

TEST(SubtitlesMicroDVD, HugeFrameNumbers) {
  std::string const text = "{25}{50}ok\n{25}{92233720368547758070}huge\n";
  codec_options_t options;

  options.frame_rate = 25.0;
  EXPECT_THROW(read_text(text, format_e::microdvd, options), malformed_input_x);

  options.strict = false;
  auto read = read_text(text, format_e::microdvd, options);

  EXPECT_EQ(1u, read.document.num_events());
  ASSERT_EQ(1u, read.warnings.size());
  EXPECT_EQ(2u, *read.warnings[0].line);
}

}
