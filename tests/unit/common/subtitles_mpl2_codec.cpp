#include "common/common_pch.h"

#include "common/subtitles/codec.h"
#include "common/subtitles/subtitles_x.h"

#include "gtest/gtest.h"

namespace {

using namespace stk::subtitles;

TEST(SubtitlesMPL2, Reading) {
  auto read = read_text("[10][25]/Italic line|normal\n\n[30][45]plain\n", format_e::mpl2);
  auto const &doc = read.document;

  EXPECT_TRUE(read.warnings.empty());
  ASSERT_EQ(2u, doc.num_events());

  EXPECT_EQ(1000,                                doc.get_event(0).get_start().to_ms());
  EXPECT_EQ(2500,                                doc.get_event(0).get_end().to_ms());
  EXPECT_EQ("{\\i1}Italic line{\\i0}\nnormal",   doc.get_event(0).get_text());
  EXPECT_EQ("plain",                             doc.get_event(1).get_text());
}

TEST(SubtitlesMPL2, Writing) {
  std::string const text = "[10][25]/Italic line|normal\n[30][45]plain\n";

  auto written = write_text(read_text(text, format_e::mpl2).document, format_e::mpl2);

  EXPECT_EQ(text, written.text);
  EXPECT_EQ(0u,   written.num_lossy_mappings());
}

TEST(SubtitlesMPL2, LossyWriting) {
  document_c doc;
  doc.add_event({ timestamp_c::ms(1040), timestamp_c::ms(2000), "{\\b1}bold{\\b0} and {\\i1}italic" });

  auto written = write_text(doc, format_e::mpl2);

  EXPECT_EQ("[10][20]bold and italic\n", written.text);

  std::vector<feature_e> features;
  for (auto const &mapping : written.lossy_mappings)
    features.emplace_back(mapping.feature);

  EXPECT_EQ((std::vector<feature_e>{ feature_e::time_resolution, feature_e::inline_emphasis, feature_e::inline_emphasis_midline }), features);
}

TEST(SubtitlesMPL2, MalformedLines) {
  std::string const text = "[10][20]ok\n{10}{20}wrong brackets\n[30][20]reversed\n";

  EXPECT_THROW(read_text(text, format_e::mpl2), malformed_input_x);

  codec_options_t options;
  options.strict = false;

  auto read = read_text(text, format_e::mpl2, options);

  ASSERT_EQ(1u, read.document.num_events());
  ASSERT_EQ(2u, read.warnings.size());
  EXPECT_EQ(2u, *read.warnings[0].line);
  EXPECT_EQ(3u, *read.warnings[1].line);
}

TEST(SubtitlesMPL2, HugeCounters) {
  codec_options_t options;
  options.strict = false;

  auto read = read_text("[10][20]ok\n[10][92233720368547758070]huge\n", format_e::mpl2, options);

  EXPECT_EQ(1u, read.document.num_events());
  ASSERT_EQ(1u, read.warnings.size());
  EXPECT_EQ(2u, *read.warnings[0].line);
}

}
