//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/test_title.cpp
// Purpose: Verify border lines with embedded titles.
// Key invariants: Line glyphs fill the space left by corners and titles,
//                 the centre title sits at floor(rest / 2).
// Ownership/Lifetime: Test owns titles and border specs.
// Links: src/render/title.cpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "tbox/render/title.hpp"

using namespace tbox::render;
using tbox::border::BorderSpec;
using tbox::border::GlyphSet;
using tbox::style::AnsiStyler;
using tbox::style::Brush;
using tbox::style::ColorPair;

namespace
{
const AnsiStyler kStyler;
const Brush kPlain(kStyler, ColorPair{});
} // namespace

TEST(Title, CornersFollowSideVisibility)
{
    BorderSpec spec;
    EXPECT_EQ(leftCorner(spec, Edge::Top), "┌");
    EXPECT_EQ(rightCorner(spec, Edge::Bottom), "┘");
    spec.left = false;
    EXPECT_EQ(leftCorner(spec, Edge::Top), "");
    spec.topRight.reset();
    EXPECT_EQ(rightCorner(spec, Edge::Top), "");
}

TEST(Title, SpaceTakenCountsTitlesAndCorners)
{
    Title title;
    title.topLeft = "TITLE";
    title.bottomCenter = "ab";
    BorderSpec spec;
    EXPECT_EQ(titlesSize(title, Edge::Top), 5);
    EXPECT_EQ(topSpaceTaken(title, spec), 7);
    EXPECT_EQ(bottomSpaceTaken(title, spec), 4);
}

TEST(Title, TopLineWithLeftTitle)
{
    Title title;
    title.topLeft = "TITLE";
    EXPECT_EQ(topBorder(title, 10, BorderSpec{}, kPlain), "┌TITLE───┐");
}

TEST(Title, BottomLineCentresTitle)
{
    Title title;
    title.bottomCenter = "x";
    EXPECT_EQ(bottomBorder(title, 7, BorderSpec{}, kPlain), "└──x──┘");
}

TEST(Title, OddRestPutsExtraGlyphAfterCentre)
{
    Title title;
    title.topCenter = "x";
    EXPECT_EQ(topBorder(title, 6, BorderSpec{}, kPlain), "┌─x──┐");
}

TEST(Title, OversizedTitleLeavesNoLine)
{
    Title title;
    title.topRight = "TITLE";
    EXPECT_EQ(topBorder(title, 3, BorderSpec{}, kPlain), "┌TITLE┐");
}

TEST(Title, ThickSetUsesDoubleLines)
{
    BorderSpec spec;
    spec.type = GlyphSet::Thick;
    EXPECT_EQ(topBorder(Title{}, 4, spec, kPlain), "╔══╗");
}

TEST(Title, SegmentsArePaintedSeparately)
{
    Title title;
    title.topLeft = "T";
    BorderSpec spec;
    spec.left = false;
    spec.right = false;
    const Brush red(kStyler, ColorPair{std::string("red"), std::nullopt});
    EXPECT_EQ(topBorder(title, 2, spec, red), "\x1b[31mT\x1b[0m\x1b[31m─\x1b[0m");
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
