#include <gtest/gtest.h>
#include "utils/text.hpp"

using namespace pwv::utils;

TEST(TextTest, Trim) {
  EXPECT_EQ(trim("  gmail \t"), "gmail");
  EXPECT_EQ(trim("\n\r"), "");
  EXPECT_EQ(trim("a b"), "a b");
  EXPECT_EQ(trim(""), "");
}

// Non-ASCII White_Space is stripped as well
TEST(TextTest, TrimUnicodeWhitespace) {
  EXPECT_EQ(trim("\xC2\xA0"), "");                        // U+00A0
  EXPECT_EQ(trim("\xE3\x80\x80"), "");                    // U+3000
  EXPECT_EQ(trim("\xE2\x80\x83gmail\xE2\x80\xAF"), "gmail");  // U+2003, U+202F
  EXPECT_EQ(trim(" \xC2\x85\t\xE1\x9A\x80x\xE2\x80\xA8 \xE2\x81\x9F"), "x");
  EXPECT_EQ(trim("a\xC2\xA0" "b"), "a\xC2\xA0" "b");
}

// Multi-byte characters that are not whitespace are left alone
TEST(TextTest, TrimKeepsOtherCharacters) {
  EXPECT_EQ(trim("\xC3\xA4"), "\xC3\xA4");                // U+00E4
  EXPECT_EQ(trim("\xE2\x80\x8B"), "\xE2\x80\x8B");        // U+200B is not White_Space
  EXPECT_EQ(trim("\xE2\x82\xAC "), "\xE2\x82\xAC");       // U+20AC
}

TEST(TextTest, ValidUtf8) {
  EXPECT_TRUE(is_valid_utf8(std::string("")));
  EXPECT_TRUE(is_valid_utf8(std::string("ascii only")));
  EXPECT_TRUE(is_valid_utf8(std::string("\xC3\xA4")));          // U+00E4
  EXPECT_TRUE(is_valid_utf8(std::string("\xE2\x82\xAC")));      // U+20AC
  EXPECT_TRUE(is_valid_utf8(std::string("\xF0\x9F\x94\x91")));  // U+1F511
  EXPECT_TRUE(is_valid_utf8(std::string("\xF4\x8F\xBF\xBF")));  // U+10FFFF
}

TEST(TextTest, InvalidUtf8) {
  EXPECT_FALSE(is_valid_utf8(std::string("\xff")));
  EXPECT_FALSE(is_valid_utf8(std::string("\x80")));              // lone continuation
  EXPECT_FALSE(is_valid_utf8(std::string("\xC3")));              // truncated
  EXPECT_FALSE(is_valid_utf8(std::string("\xE2\x82")));          // truncated
  EXPECT_FALSE(is_valid_utf8(std::string("\xC0\xAF")));          // overlong '/'
  EXPECT_FALSE(is_valid_utf8(std::string("\xED\xA0\x80")));      // surrogate
  EXPECT_FALSE(is_valid_utf8(std::string("\xF4\x90\x80\x80")));  // past U+10FFFF
  EXPECT_FALSE(is_valid_utf8(std::vector<uint8_t>{'o', 'k', 0xC3, 0x28}));
}
