#include <gtest/gtest.h>

#include <string>

#include "margin_core/util/hashing.hpp"
#include "margin_core/util/text.hpp"

namespace margin_core {

TEST(TextUtilTest, SanitizeKeepsValidInput) {
  EXPECT_EQ(text::sanitize_utf8("caf\xC3\xA9"), "caf\xC3\xA9");
}

TEST(TextUtilTest, SanitizeReplacesInvalidBytes) {
  std::string cleaned = text::sanitize_utf8("ok\xFF!");
  EXPECT_EQ(cleaned, "ok\xEF\xBF\xBD!");
  EXPECT_EQ(text::char_length(cleaned), 4u);
}

TEST(TextUtilTest, LengthAndTruncateCountCodePoints) {
  const std::string word = "na\xC3\xAFve";  // naive with a diaeresis
  EXPECT_EQ(text::char_length(word), 5u);
  EXPECT_EQ(text::truncate_chars(word, 3), "na\xC3\xAF");
  EXPECT_EQ(text::truncate_chars(word, 50), word);
  EXPECT_EQ(text::truncate_chars(word, 0), "");
}

TEST(TextUtilTest, TrimLowerBlank) {
  EXPECT_EQ(text::trim("  \t spaced \n"), "spaced");
  EXPECT_EQ(text::trim("   "), "");
  EXPECT_EQ(text::to_lower("YeS"), "yes");
  EXPECT_TRUE(text::is_blank(" \n\t"));
  EXPECT_TRUE(text::is_blank(""));
  EXPECT_FALSE(text::is_blank(" x "));
}

TEST(HashingTest, Sha256KnownVectors) {
  EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

}  // namespace margin_core
