//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/test_style.cpp
// Purpose: Verify ANSI colour decoration and style validation.
// Key invariants: Empty text stays undecorated; inner resets re-open the
//                 outer style; unknown names are InvalidStyle errors.
// Ownership/Lifetime: Stylers are stack-owned by each test.
// Links: src/style/color.cpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "tbox/style/color.hpp"

using namespace tbox::style;
using tbox::support::ErrorCode;

TEST(Style, SgrParameters)
{
    EXPECT_EQ(sgrParameters(Channel::Foreground, "red"), "31");
    EXPECT_EQ(sgrParameters(Channel::Background, "blue"), "44");
    EXPECT_EQ(sgrParameters(Channel::Foreground, "bright_white"), "97");
    EXPECT_EQ(sgrParameters(Channel::Background, "bright_blue"), "104");
    EXPECT_EQ(sgrParameters(Channel::Foreground, "bold"), "1");
    EXPECT_EQ(sgrParameters(Channel::Foreground, "#ff8000"), "38;2;255;128;0");
    EXPECT_EQ(sgrParameters(Channel::Background, "#000001"), "48;2;0;0;1");
    EXPECT_FALSE(sgrParameters(Channel::Background, "bold").has_value());
    EXPECT_FALSE(sgrParameters(Channel::Foreground, "mauve").has_value());
}

TEST(Style, DecoratesText)
{
    AnsiStyler styler;
    EXPECT_EQ(styler.applyFg("red", "x"), "\x1b[31mx\x1b[0m");
    EXPECT_EQ(styler.applyBg("green", "x"), "\x1b[42mx\x1b[0m");
    EXPECT_EQ(styler.applyFg("red", ""), "");
}

TEST(Style, ReopensAfterInnerReset)
{
    AnsiStyler styler;
    EXPECT_EQ(styler.applyBg("blue", "\x1b[1ma\x1b[0mb"),
              "\x1b[44m\x1b[1ma\x1b[0m\x1b[44mb\x1b[0m");
}

TEST(Style, DisabledStylerPassesThrough)
{
    AnsiStyler styler(false);
    EXPECT_EQ(styler.applyFg("red", "x"), "x");
}

TEST(Style, BrushAppliesForegroundThenBackground)
{
    AnsiStyler styler;
    Brush brush(styler, ColorPair{std::string("red"), std::string("blue")});
    EXPECT_TRUE(brush.active());
    EXPECT_EQ(brush("x"), "\x1b[44m\x1b[31mx\x1b[0m\x1b[0m");

    Brush plain(styler, ColorPair{});
    EXPECT_FALSE(plain.active());
    EXPECT_EQ(plain("x"), "x");
}

TEST(Style, ValidateReportsBadNames)
{
    StyleSpec spec;
    spec.fg = "red";
    spec.border.bg = "purple";
    auto ok = validate(spec, defaultStyler());
    ASSERT_FALSE(ok);
    EXPECT_EQ(ok.error().code, ErrorCode::InvalidStyle);
    EXPECT_EQ(ok.error().message, "Bad background style or color name 'purple'");

    spec.border.bg = "magenta";
    EXPECT_TRUE(validate(spec, defaultStyler()));
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
