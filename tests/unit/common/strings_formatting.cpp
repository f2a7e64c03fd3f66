#include "common/common_pch.h"

#include "common/strings/formatting.h"

#include "gtest/gtest.h"

namespace {

TEST(StringsFormatting, Join) {
  std::vector<std::string> names{ "Layer", "Start", "End" };

  EXPECT_EQ("Layer, Start, End", stk::string::join(names, ", "));
  EXPECT_EQ("Layer|Start",       stk::string::join(names.begin(), names.begin() + 2, "|"));
  EXPECT_EQ("",                  stk::string::join(std::vector<std::string>{}, ", "));
}

TEST(StringsFormatting, ToLowerAscii) {
  EXPECT_EQ("v4+ styles", stk::string::to_lower_ascii("V4+ Styles"));
  EXPECT_EQ("webvtt",     stk::string::to_lower_ascii("WebVtt"));
  EXPECT_EQ("Ärger",      stk::string::to_lower_ascii("Ärger"));
}

TEST(StringsFormatting, NormalizeFmtDoubleOutput) {
  EXPECT_EQ("20",     stk::string::normalize_fmt_double_output(20.0));
  EXPECT_EQ("23.976", stk::string::normalize_fmt_double_output(23.976));
  EXPECT_EQ("0.5",    stk::string::normalize_fmt_double_output(0.5));
  EXPECT_EQ("-2",     stk::string::normalize_fmt_double_output(-2.0));
  EXPECT_EQ("42",     stk::string::normalize_fmt_double_output(42));
}

TEST(StringsFormatting, FormatParagraph) {
  EXPECT_EQ("  -o, --output <file>   Write here.\n", stk::string::format_paragraph("Write here.", 24, "  -o, --output <file>"));
  EXPECT_EQ("  --a-very-long-option-name\n    Text.\n",  stk::string::format_paragraph("Text.", 4, "  --a-very-long-option-name"));
  EXPECT_EQ("one two\nthree\n",                         stk::string::format_paragraph("one two three", 0, {}, {}, 10));
}

}
