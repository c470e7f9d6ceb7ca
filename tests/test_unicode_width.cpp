//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/test_unicode_width.cpp
// Purpose: Verify UTF-8 decoding and terminal column widths.
// Key invariants: Combining marks are zero width, CJK ideographs are double
//                 width, malformed input decodes to one U+FFFD per byte.
// Ownership/Lifetime: decode_utf8 returns owned strings used locally.
// Links: src/text/unicode.cpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "tbox/text/unicode.hpp"

using tbox::text::char_width;
using tbox::text::decode_utf8;
using tbox::text::encode_utf8;

TEST(UnicodeWidth, AsciiIsSingleColumn)
{
    auto s = decode_utf8("A");
    ASSERT_EQ(s.size(), 1u);
    EXPECT_EQ(char_width(s[0]), 1);
}

TEST(UnicodeWidth, CjkIsDoubleColumn)
{
    auto s = decode_utf8("\xE4\xBD\xA0");
    ASSERT_EQ(s.size(), 1u);
    EXPECT_EQ(char_width(s[0]), 2);
}

TEST(UnicodeWidth, CombiningMarkIsZeroWidth)
{
    auto s = decode_utf8("e\xCC\x81");
    ASSERT_EQ(s.size(), 2u);
    EXPECT_EQ(char_width(s[0]), 1);
    EXPECT_EQ(char_width(s[1]), 0);
}

TEST(UnicodeWidth, ControlCharactersAreZeroWidth)
{
    EXPECT_EQ(char_width(U'\t'), 0);
    EXPECT_EQ(char_width(U'\x1b'), 0);
}

TEST(UnicodeDecode, OverlongSequenceBecomesReplacementPerByte)
{
    auto s = decode_utf8("\xC0\xAF");
    ASSERT_EQ(s.size(), 2u);
    EXPECT_EQ(s[0], 0xFFFDu);
    EXPECT_EQ(s[1], 0xFFFDu);
}

TEST(UnicodeDecode, SurrogateBecomesReplacementPerByte)
{
    auto s = decode_utf8("\xED\xA0\x80");
    ASSERT_EQ(s.size(), 3u);
    for (auto ch : s)
        EXPECT_EQ(ch, 0xFFFDu);
}

TEST(UnicodeDecode, BeyondUnicodeRangeBecomesReplacementPerByte)
{
    auto s = decode_utf8("\xF4\x90\x80\x80");
    ASSERT_EQ(s.size(), 4u);
    for (auto ch : s)
        EXPECT_EQ(ch, 0xFFFDu);
}

TEST(UnicodeEncode, BoxGlyphsEncodeToThreeBytes)
{
    EXPECT_EQ(encode_utf8(U'╔'), "╔");
    EXPECT_EQ(encode_utf8(U'A'), "A");
    EXPECT_EQ(decode_utf8(encode_utf8(U'─')), std::u32string(1, U'─'));
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
