#include "common/common_pch.h"

#include "common/strings/parsing.h"

#include "gtest/gtest.h"

namespace {

TEST(StringsParsing, ParseDurationNumberWithUnit) {
  int64_t value;

  EXPECT_TRUE(stk::string::parse_duration_number_with_unit("250ms", value));
  EXPECT_EQ(250, value);

  EXPECT_TRUE(stk::string::parse_duration_number_with_unit("250msec", value));
  EXPECT_EQ(250, value);

  EXPECT_TRUE(stk::string::parse_duration_number_with_unit("1.5s", value));
  EXPECT_EQ(1500, value);

  EXPECT_TRUE(stk::string::parse_duration_number_with_unit("12", value));
  EXPECT_EQ(12000, value);

  EXPECT_TRUE(stk::string::parse_duration_number_with_unit("2m", value));
  EXPECT_EQ(120000, value);

  EXPECT_TRUE(stk::string::parse_duration_number_with_unit("2min", value));
  EXPECT_EQ(120000, value);

  EXPECT_TRUE(stk::string::parse_duration_number_with_unit("1h", value));
  EXPECT_EQ(3600000, value);

  EXPECT_TRUE(stk::string::parse_duration_number_with_unit("1001/24000s", value));
  EXPECT_EQ(42, value);

  EXPECT_TRUE(stk::string::parse_duration_number_with_unit("-0.5s", value));
  EXPECT_EQ(-500, value);
}

TEST(StringsParsing, ParseDurationNumberWithUnitInvalid) {
  int64_t value;

  EXPECT_FALSE(stk::string::parse_duration_number_with_unit("",        value));
  EXPECT_FALSE(stk::string::parse_duration_number_with_unit("s",       value));
  EXPECT_FALSE(stk::string::parse_duration_number_with_unit("12fps",   value));
  EXPECT_FALSE(stk::string::parse_duration_number_with_unit("1/0s",    value));
  EXPECT_FALSE(stk::string::parse_duration_number_with_unit("1.2.3ms", value));
}

TEST(StringsParsing, ParseTimestampValidPatterns) {
  int64_t value;

  EXPECT_TRUE(stk::string::parse_timestamp("00:01:02.5", value));
  EXPECT_EQ(62500, value);

  EXPECT_TRUE(stk::string::parse_timestamp("01:02:03", value));
  EXPECT_EQ(3723000, value);

  EXPECT_TRUE(stk::string::parse_timestamp("02:03", value));
  EXPECT_EQ(123000, value);

  EXPECT_TRUE(stk::string::parse_timestamp("02:03.045", value));
  EXPECT_EQ(123045, value);

  EXPECT_TRUE(stk::string::parse_timestamp("1.5s", value));
  EXPECT_EQ(1500, value);

  EXPECT_TRUE(stk::string::parse_timestamp("-250ms", value, true));
  EXPECT_EQ(-250, value);

  EXPECT_TRUE(stk::string::parse_timestamp("-00:00:01.000", value, true));
  EXPECT_EQ(-1000, value);
}

TEST(StringsParsing, ParseTimestampInvalidPatterns) {
  int64_t value;

  EXPECT_FALSE(stk::string::parse_timestamp("",             value));
  EXPECT_FALSE(stk::string::parse_timestamp("-1s",          value));
  EXPECT_FALSE(stk::string::parse_timestamp("00:60:00",     value));
  EXPECT_FALSE(stk::string::parse_timestamp("00:00:60",     value));
  EXPECT_FALSE(stk::string::parse_timestamp("00:00:01.",    value));
  EXPECT_FALSE(stk::string::parse_timestamp("00:00:01.1234", value));
  EXPECT_FALSE(stk::string::parse_timestamp("1:2:3:4",      value));
  EXPECT_FALSE(stk::string::parse_timestamp("abc",          value));
}

TEST(StringsParsing, ParseFrameRate) {
  double fps{};

  EXPECT_TRUE(stk::string::parse_frame_rate("25", fps));
  EXPECT_DOUBLE_EQ(25.0, fps);

  EXPECT_TRUE(stk::string::parse_frame_rate("25fps", fps));
  EXPECT_DOUBLE_EQ(25.0, fps);

  EXPECT_TRUE(stk::string::parse_frame_rate("24000/1001", fps));
  EXPECT_DOUBLE_EQ(24000.0 / 1001.0, fps);

  EXPECT_TRUE(stk::string::parse_frame_rate("23.976", fps));
  EXPECT_DOUBLE_EQ(24000.0 / 1001.0, fps);

  EXPECT_TRUE(stk::string::parse_frame_rate("29.97", fps));
  EXPECT_DOUBLE_EQ(30000.0 / 1001.0, fps);

  EXPECT_FALSE(stk::string::parse_frame_rate("0",      fps));
  EXPECT_FALSE(stk::string::parse_frame_rate("25/0",   fps));
  EXPECT_FALSE(stk::string::parse_frame_rate("-25",    fps));
  EXPECT_FALSE(stk::string::parse_frame_rate("twenty", fps));
}

TEST(StringsParsing, ParseNumberToRational) {
  stk_rational_t value;

  EXPECT_FALSE(stk::string::parse_floating_point_number_as_rational("",    value));
  EXPECT_FALSE(stk::string::parse_floating_point_number_as_rational("1.x", value));

  EXPECT_TRUE(stk::string::parse_floating_point_number_as_rational("0.25", value));
  EXPECT_EQ(stk_rational_t(1, 4), value);

  EXPECT_TRUE(stk::string::parse_floating_point_number_as_rational("-1.5", value));
  EXPECT_EQ(stk_rational_t(-3, 2), value);

  EXPECT_TRUE(stk::string::parse_number_as_rational("23.976", value));
  EXPECT_EQ(stk_rational_t(23976, 1000), value);
}

TEST(StringsParsing, FromHex) {
  EXPECT_EQ(0xffull,       stk::string::from_hex("ff"));
  EXPECT_EQ(0x00ff00ffull, stk::string::from_hex("00FF00FF"));
  EXPECT_THROW(stk::string::from_hex(""),   stk::invalid_parameter_x);
  EXPECT_THROW(stk::string::from_hex("0g"), stk::invalid_parameter_x);
}

}
