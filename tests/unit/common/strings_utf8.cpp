#include "common/common_pch.h"

#include "common/strings/utf8.h"

#include "gtest/gtest.h"

namespace {

TEST(StringsUtf8, IsValid) {
  EXPECT_TRUE(stk::utf8::is_valid(""));
  EXPECT_TRUE(stk::utf8::is_valid("plain ASCII"));
  EXPECT_TRUE(stk::utf8::is_valid("Grüße \xe2\x99\xaa"));
  EXPECT_FALSE(stk::utf8::is_valid("Gr\xfc\xdf" "e"));
  EXPECT_FALSE(stk::utf8::is_valid("\xe2\x99"));
}

TEST(StringsUtf8, FixInvalid) {
  EXPECT_EQ("valid ü",                 stk::utf8::fix_invalid("valid ü"));
  EXPECT_EQ("a\xef\xbf\xbd" "b",       stk::utf8::fix_invalid("a\xff" "b"));
}

TEST(StringsUtf8, NumCodePoints) {
  EXPECT_EQ(0u, stk::utf8::num_code_points(""));
  EXPECT_EQ(5u, stk::utf8::num_code_points("Hello"));
  EXPECT_EQ(5u, stk::utf8::num_code_points("Grüße"));
  EXPECT_EQ(1u, stk::utf8::num_code_points("\xe2\x99\xaa"));
}

}
