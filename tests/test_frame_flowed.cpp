//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/test_frame_flowed.cpp
// Purpose: Verify frames rendered as a sequence of separator-terminated rows.
// Key invariants: Every row ends with the content's separator; the interior
//                 is filled with spaces to the frame width.
// Ownership/Lifetime: Test owns options and rendered strings.
// Links: src/render/frame.cpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "tbox/render/frame.hpp"
#include "tbox/text/ansi.hpp"
#include "tbox/text/lines.hpp"

#include <string>

using namespace tbox::render;
using tbox::border::BorderValue;
using tbox::border::GlyphSet;
using tbox::support::ErrorCode;
using tbox::text::Align;

namespace
{
std::string repeat(const std::string &s, int n)
{
    std::string out;
    for (int i = 0; i < n; ++i)
        out += s;
    return out;
}

std::string render(const Content &content, const FrameOptions &opts)
{
    auto out = frame(content, opts);
    EXPECT_TRUE(out) << out.error().message;
    return out ? out.value() : std::string();
}
} // namespace

TEST(FrameFlowed, EmptyThickBox)
{
    FrameOptions opts;
    opts.width = 35;
    opts.height = 4;
    opts.border = GlyphSet::Thick;

    const std::string expected = "╔" + repeat("═", 33) + "╗\n" + "║" + repeat(" ", 33) +
                                 "║\n" + "║" + repeat(" ", 33) + "║\n" + "╚" +
                                 repeat("═", 33) + "╝\n";
    EXPECT_EQ(render(Content(), opts), expected);
}

TEST(FrameFlowed, SizesToContent)
{
    EXPECT_EQ(render("Hello world", {}),
              "┌───────────┐\n"
              "│Hello world│\n"
              "└───────────┘\n");
}

TEST(FrameFlowed, PaddingSurroundsContent)
{
    FrameOptions opts;
    opts.padding = {1, 2};
    EXPECT_EQ(render("Hi", opts),
              "┌──────┐\n"
              "│      │\n"
              "│  Hi  │\n"
              "│      │\n"
              "└──────┘\n");
}

TEST(FrameFlowed, CentresContent)
{
    FrameOptions opts;
    opts.width = 9;
    opts.height = 3;
    opts.align = Align::Center;
    EXPECT_EQ(render("ab", opts),
              "┌───────┐\n"
              "│  ab   │\n"
              "└───────┘\n");
}

TEST(FrameFlowed, KeepsCarriageReturnSeparator)
{
    EXPECT_EQ(render("a\r\nb", {}), "┌─┐\r\n│a│\r\n│b│\r\n└─┘\r\n");
}

TEST(FrameFlowed, JoinsContentBlocks)
{
    EXPECT_EQ(render(Content{"a", "bc"}, {}), "┌──┐\n│a │\n│bc│\n└──┘\n");
}

TEST(FrameFlowed, ComputedContent)
{
    int calls = 0;
    const auto content = Content::computed([&calls] {
        ++calls;
        return std::string("hey");
    });
    EXPECT_EQ(render(content, {}), "┌───┐\n│hey│\n└───┘\n");
    EXPECT_EQ(calls, 1);
}

TEST(FrameFlowed, TilesHorizontally)
{
    FrameOptions opts;
    opts.width = 4;
    opts.height = 3;
    opts.count = 2;
    EXPECT_EQ(render(Content(), opts),
              "┌──┐  ┌──┐\n"
              "│  │  │  │\n"
              "└──┘  └──┘\n");
}

TEST(FrameFlowed, TitleWidensFrame)
{
    FrameOptions opts;
    opts.title.topLeft = "LONG TITLE";
    opts.title.bottomRight = "v1";
    EXPECT_EQ(render("x", opts),
              "┌LONG TITLE┐\n"
              "│x         │\n"
              "└────────v1┘\n");
}

TEST(FrameFlowed, CrossCorners)
{
    FrameOptions opts;
    opts.width = 10;
    opts.height = 4;
    opts.border = BorderValue::mapping({{"top", "line"},
                                        {"top_left", "cross"},
                                        {"top_right", "cross"},
                                        {"bottom", "line"},
                                        {"bottom_left", "cross"},
                                        {"bottom_right", "cross"}});
    const auto out = render(Content(), opts);
    const auto lines = tbox::text::splitLines(out, "\n");
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "┼────────┼");
    EXPECT_EQ(lines[1], "│        │");
    EXPECT_EQ(lines[3], "┼────────┼");
}

TEST(FrameFlowed, HiddenSidesDropCornersAndPipes)
{
    FrameOptions opts;
    opts.border = BorderValue::mapping({{"left", "false"}, {"right", "false"}});
    EXPECT_EQ(render("ab", opts), "──\nab\n──\n");
}

TEST(FrameFlowed, ContentBeyondHeightIsCut)
{
    FrameOptions opts;
    opts.height = 3;
    EXPECT_EQ(render("a\nb\nc", opts), "┌─┐\n│a│\n└─┘\n");
}

TEST(FrameFlowed, StylesContentAndBorder)
{
    FrameOptions opts;
    opts.style.fg = "red";
    opts.style.border.fg = "blue";
    const std::string pipe = "\x1b[34m│\x1b[0m";
    // Corners and each half of the line are painted as separate segments.
    const auto edge = [](const std::string &l, const std::string &r) {
        return "\x1b[34m" + l + "\x1b[0m\x1b[34m─\x1b[0m\x1b[34m─\x1b[0m\x1b[34m" + r +
               "\x1b[0m";
    };
    EXPECT_EQ(render("Hi", opts),
              edge("┌", "┐") + "\n" + pipe + "\x1b[31mHi\x1b[0m" + pipe + "\n" +
                  edge("└", "┘") + "\n");
}

TEST(FrameFlowed, RowCountMatchesHeight)
{
    FrameOptions opts;
    opts.padding = {1};
    const auto out = render("one\ntwo\nthree", opts);
    const auto lines = tbox::text::splitLines(out, "\n");
    ASSERT_EQ(lines.size(), 7u);
    for (const auto &line : lines)
        EXPECT_EQ(tbox::text::length(line), 9u);
}

TEST(FrameFlowed, ExplicitGeometryHoldsForEverySet)
{
    for (auto set : {GlyphSet::Ascii, GlyphSet::Light, GlyphSet::Thick})
    {
        for (int w = 4; w <= 7; ++w)
        {
            for (int h = 2; h <= 5; ++h)
            {
                FrameOptions opts;
                opts.width = w;
                opts.height = h;
                opts.border = set;
                opts.style.fg = "cyan";
                const auto lines = tbox::text::splitLines(render("xy", opts), "\n");
                ASSERT_EQ(lines.size(), static_cast<std::size_t>(h));
                for (const auto &line : lines)
                    EXPECT_EQ(tbox::text::printableCount(line), static_cast<std::size_t>(w));
            }
        }
    }
}

TEST(FrameFlowed, RenderingIsIdempotent)
{
    FrameOptions opts;
    opts.title.topCenter = "t";
    opts.padding = {0, 1};
    EXPECT_EQ(render("same input", opts), render("same input", opts));
}

TEST(FrameFlowed, RejectsBadOptionsBeforeRendering)
{
    FrameOptions opts;
    opts.count = 0;
    auto count = frame("x", opts);
    ASSERT_FALSE(count);
    EXPECT_EQ(count.error().code, ErrorCode::InvalidCount);
    EXPECT_EQ(count.error().message, "Wrong value `0` for :count option, expected at least 1");

    opts = FrameOptions{};
    opts.padding = {1, 2, 3, 4, 5};
    auto padding = frame("x", opts);
    ASSERT_FALSE(padding);
    EXPECT_EQ(padding.error().code, ErrorCode::InvalidPadding);

    opts = FrameOptions{};
    opts.style.bg = "transparent";
    auto style = frame("x", opts);
    ASSERT_FALSE(style);
    EXPECT_EQ(style.error().code, ErrorCode::InvalidStyle);

    opts = FrameOptions{};
    opts.border = BorderValue::mapping({{"left", "unknown"}});
    auto border = frame("x", opts);
    ASSERT_FALSE(border);
    EXPECT_EQ(border.error().message, "Invalid border value: 'unknown' for :left");
}

TEST(FrameFlowed, InjectedStylerIsUsed)
{
    const tbox::style::AnsiStyler plain(false);
    FrameRenderer renderer(plain);
    FrameOptions opts;
    opts.style.fg = "red";
    auto out = renderer.render("Hi", opts);
    ASSERT_TRUE(out);
    EXPECT_EQ(out.value(), "┌──┐\n│Hi│\n└──┘\n");
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
