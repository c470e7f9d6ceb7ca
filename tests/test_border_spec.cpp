//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/test_border_spec.cpp
// Purpose: Verify parsing of border configuration values.
// Key invariants: Glyph set names and mappings are accepted; unknown keys are
//                 shape errors and unknown glyph names are value errors.
// Ownership/Lifetime: Test owns all BorderValue instances.
// Links: src/border/border_spec.cpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "tbox/border/border_spec.hpp"

using namespace tbox::border;
using tbox::support::ErrorCode;

TEST(BorderSpec, DefaultsToLightWithAllSides)
{
    auto spec = parseBorder(GlyphSet::Light);
    ASSERT_TRUE(spec);
    EXPECT_EQ(spec.value().type, GlyphSet::Light);
    EXPECT_TRUE(spec.value().top && spec.value().bottom);
    EXPECT_TRUE(spec.value().left && spec.value().right);
    EXPECT_EQ(spec.value().topLeft, GlyphKind::CornerTopLeft);
    EXPECT_EQ(spec.value().bottomRight, GlyphKind::CornerBottomRight);
}

TEST(BorderSpec, AcceptsSetNamesAsText)
{
    EXPECT_EQ(parseBorder("thick").value().type, GlyphSet::Thick);
    EXPECT_EQ(parseBorder(":ascii").value().type, GlyphSet::Ascii);
}

TEST(BorderSpec, MappingOverridesSidesAndCorners)
{
    auto spec = parseBorder(BorderValue::mapping({{"type", "thick"},
                                                  {"top", "false"},
                                                  {"left", "pipe"},
                                                  {"top_left", "cross"},
                                                  {"bottom_right", "false"}}));
    ASSERT_TRUE(spec);
    EXPECT_EQ(spec.value().type, GlyphSet::Thick);
    EXPECT_FALSE(spec.value().top);
    EXPECT_TRUE(spec.value().left);
    EXPECT_EQ(spec.value().topLeft, GlyphKind::Cross);
    EXPECT_FALSE(spec.value().bottomRight.has_value());
    EXPECT_EQ(spec.value().topSize(), 0);
    EXPECT_EQ(spec.value().bottomSize(), 1);
}

TEST(BorderSpec, ParsesMappingLiteral)
{
    auto spec = parseBorder("{type: ascii, bottom: off, top_right: :divider_down}");
    ASSERT_TRUE(spec);
    EXPECT_EQ(spec.value().type, GlyphSet::Ascii);
    EXPECT_FALSE(spec.value().bottom);
    EXPECT_EQ(spec.value().topRight, GlyphKind::DividerDown);
}

TEST(BorderSpec, UnknownSideValueIsReported)
{
    auto spec = parseBorder(BorderValue::mapping({{"left", "unknown"}}));
    ASSERT_FALSE(spec);
    EXPECT_EQ(spec.error().code, ErrorCode::InvalidBorderValue);
    EXPECT_EQ(spec.error().message, "Invalid border value: 'unknown' for :left");
}

TEST(BorderSpec, UnknownTypeIsReported)
{
    auto spec = parseBorder(BorderValue::mapping({{"type", "double"}}));
    ASSERT_FALSE(spec);
    EXPECT_EQ(spec.error().message, "Invalid border value: 'double' for :type");
}

TEST(BorderSpec, WrongShapeIsReported)
{
    auto spec = parseBorder("[unknown]");
    ASSERT_FALSE(spec);
    EXPECT_EQ(spec.error().code, ErrorCode::InvalidBorderShape);
    EXPECT_EQ(spec.error().message,
              "Wrong value `[unknown]` for :border configuration option");
}

TEST(BorderSpec, UnknownKeyIsShapeError)
{
    auto spec = parseBorder(BorderValue::mapping({{"middle", "true"}}));
    ASSERT_FALSE(spec);
    EXPECT_EQ(spec.error().code, ErrorCode::InvalidBorderShape);
    EXPECT_EQ(spec.error().message,
              "Wrong value `{middle: true}` for :border configuration option");
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
