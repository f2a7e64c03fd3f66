#include "common/common_pch.h"

#include "common/subtitles/codec.h"
#include "common/subtitles/subtitles_x.h"
#include "common/subtitles/tmp_codec.h"

#include "gtest/gtest.h"

namespace {

using namespace stk::subtitles;

TEST(SubtitlesTMP, EndTimesAreInferred) {
  auto read = read_text("00:00:01:Hello\n00:00:02=Second line|two\n0:01:00:last\n", format_e::tmp);
  auto const &doc = read.document;

  EXPECT_TRUE(read.warnings.empty());
  ASSERT_EQ(3u, doc.num_events());

  EXPECT_EQ(1000,                  doc.get_event(0).get_start().to_ms());
  EXPECT_EQ(1000 + 500 + 5 * 67,   doc.get_event(0).get_end().to_ms());

  EXPECT_EQ(2000,                  doc.get_event(1).get_start().to_ms());
  EXPECT_EQ(2000 + 500 + 15 * 67,  doc.get_event(1).get_end().to_ms());
  EXPECT_EQ("Second line\ntwo",    doc.get_event(1).get_text());

  EXPECT_EQ(60000,                 doc.get_event(2).get_start().to_ms());
}

TEST(SubtitlesTMP, EndTimesStopAtTheNextSubtitle) {
  auto next = timestamp_c::ms(1200);

  EXPECT_EQ(1200, tmp_codec_c::infer_end(timestamp_c::s(1), "A rather long subtitle text", next).to_ms());
  EXPECT_EQ(1567, tmp_codec_c::infer_end(timestamp_c::s(1), "x", timestamp_c::s(5)).to_ms());
  EXPECT_EQ(1567, tmp_codec_c::infer_end(timestamp_c::s(1), "x", timestamp_c::s(1)).to_ms());
  EXPECT_EQ(1567, tmp_codec_c::infer_end(timestamp_c::s(1), "x", std::nullopt).to_ms());
  EXPECT_EQ(1634, tmp_codec_c::infer_end(timestamp_c::s(1), "\xc3\xa4\xc3\xb6", std::nullopt).to_ms());
}

TEST(SubtitlesTMP, Writing) {
  std::string const text = "00:00:01:Hello\n00:00:02:Second line|two\n";

  auto written = write_text(read_text(text, format_e::tmp).document, format_e::tmp);

  EXPECT_EQ(text, written.text);
  EXPECT_EQ(0u,   written.num_lossy_mappings());
}

TEST(SubtitlesTMP, StoredEndTimesAreApproximated) {
  document_c doc;
  doc.add_event({ timestamp_c::ms(1500), timestamp_c::s(10), "{\\i1}long{\\i0}" });

  auto written = write_text(doc, format_e::tmp);

  EXPECT_EQ("00:00:01:long\n", written.text);

  std::vector<feature_e> features;
  for (auto const &mapping : written.lossy_mappings)
    features.emplace_back(mapping.feature);

  EXPECT_EQ((std::vector<feature_e>{ feature_e::time_resolution, feature_e::inline_emphasis, feature_e::end_time }), features);
}

TEST(SubtitlesTMP, MalformedLines) {
  std::string const text = "00:00:01:ok\nnot a subtitle\n00:61:00:bad minutes\n";

  EXPECT_THROW(read_text(text, format_e::tmp), malformed_input_x);

  codec_options_t options;
  options.strict = false;

  auto read = read_text(text, format_e::tmp, options);

  ASSERT_EQ(1u, read.document.num_events());
  ASSERT_EQ(2u, read.warnings.size());
  EXPECT_EQ(2u, *read.warnings[0].line);
  EXPECT_EQ(3u, *read.warnings[1].line);
}

}
