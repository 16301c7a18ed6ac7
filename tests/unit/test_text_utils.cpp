#include <gtest/gtest.h>
#include "core/text_utils.hpp"

using namespace tfa;

// ==========================================
// UTF-8 Tests
// ==========================================

TEST(TextUtilsTest, DecodeEncodeKeepsMultiByteText) {
    std::string text = "Très bien مفيد";
    auto code_points = decode_utf8(text);
    EXPECT_EQ(code_points.size(), 14u);
    EXPECT_EQ(encode_utf8(code_points), text);
}

TEST(TextUtilsTest, InvalidBytesBecomeReplacementCharacter) {
    std::string text = "ok\xFF";
    auto code_points = decode_utf8(text);
    ASSERT_EQ(code_points.size(), 3u);
    EXPECT_EQ(code_points[2], U'\uFFFD');
}

TEST(TextUtilsTest, LowerCasesLatinAccents) {
    EXPECT_EQ(to_lower_utf8("FORMATION ÉTÉ Très"), "formation été très");
}

TEST(TextUtilsTest, LowerCaseLeavesArabicUnchanged) {
    std::string arabic = "التكوين ممتاز";
    EXPECT_EQ(to_lower_utf8(arabic), arabic);
}

TEST(TextUtilsTest, TruncateCountsCodePoints) {
    EXPECT_EQ(truncate_utf8("été", 2), "ét");
    EXPECT_EQ(truncate_utf8("abc", 10), "abc");
    EXPECT_EQ(utf8_length("مرحبا"), 5u);
}

// ==========================================
// String Helper Tests
// ==========================================

TEST(TextUtilsTest, BlankAndTrim) {
    EXPECT_TRUE(is_blank(""));
    EXPECT_TRUE(is_blank(" \t\n"));
    EXPECT_FALSE(is_blank("  x "));
    EXPECT_EQ(trim("  bonjour \n"), "bonjour");
    EXPECT_EQ(trim("   "), "");
}

TEST(TextUtilsTest, SplitWhitespace) {
    auto words = split_whitespace("  un  deux\ttrois\n");
    ASSERT_EQ(words.size(), 3u);
    EXPECT_EQ(words[0], "un");
    EXPECT_EQ(words[2], "trois");
}

TEST(TextUtilsTest, WordTokensSplitOnPunctuation) {
    auto tokens = word_tokens("bon, très-bien! w-safi");
    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_EQ(tokens[0], "bon");
    EXPECT_EQ(tokens[1], "très");
    EXPECT_EQ(tokens[2], "bien");
    EXPECT_EQ(tokens[3], "w");
    EXPECT_EQ(tokens[4], "safi");
}

TEST(TextUtilsTest, WordTokensKeepArabicWords) {
    auto tokens = word_tokens("التدريب، مفيد");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0], "التدريب");
    EXPECT_EQ(tokens[1], "مفيد");
}
