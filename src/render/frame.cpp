//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/render/frame.cpp
// Purpose: Implement the frame renderer: validate options, size the box,
//          format the content and emit borders and rows in flowed or
//          positioned mode, tiling the box horizontally when requested.
// Key invariants:
//   - Width never drops below the space the titles and corners need.
//   - Tiles are separated by a two-column gutter and are identical.
//   - In positioned mode unstyled rows are not padded with spaces; the cursor
//     jumps to the right border instead.
// Ownership/Lifetime: The renderer holds a reference to its Styler only.
// Links: include/tbox/render/frame.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Frame composition for flowed and positioned output.
/// @details Both modes share the geometry, border and styling logic; they
///          differ only in how a fragment is placed. Flowed output terminates
///          each row with the separator found in the content, positioned
///          output prefixes rows with cursor moves and emits nothing between
///          rows.

#include "tbox/render/frame.hpp"

#include "tbox/border/glyphs.hpp"
#include "tbox/layout/dimensions.hpp"
#include "tbox/layout/formatter.hpp"
#include "tbox/support/log.hpp"
#include "tbox/term/cursor.hpp"
#include "tbox/text/ansi.hpp"
#include "tbox/text/lines.hpp"

#include <algorithm>
#include <sstream>

namespace tbox::render
{

namespace
{
constexpr std::string_view kGutter = "  ";
constexpr int kGutterWidth = 2;

/// @brief Repeat a rendered border line @p count times separated by the gutter.
std::string tile(const std::string &line, int count)
{
    std::string out;
    for (int i = 0; i < count; ++i)
    {
        out += line;
        if (i < count - 1)
            out.append(kGutter);
    }
    return out;
}
} // namespace

std::string Content::resolve() const
{
    if (const auto *producer = std::get_if<Producer>(&value_))
    {
        return *producer ? (*producer)() : std::string();
    }
    const auto &blocks = std::get<std::vector<std::string>>(value_);
    return text::joinLines(blocks, text::kNewline);
}

support::Expected<std::string> FrameRenderer::render(const Content &content,
                                                     const FrameOptions &options) const
{
    auto parsedBorder = border::parseBorder(options.border);
    if (!parsedBorder)
    {
        return parsedBorder.error();
    }
    auto parsedPadding = text::parsePadding(options.padding);
    if (!parsedPadding)
    {
        return parsedPadding.error();
    }
    if (auto styleOk = style::validate(options.style, styler_); !styleOk)
    {
        return styleOk.error();
    }
    if (options.count < 1)
    {
        return support::makeError(support::ErrorCode::InvalidCount,
                                  "Wrong value `" + std::to_string(options.count) +
                                      "` for :count option, expected at least 1");
    }

    const border::BorderSpec &spec = parsedBorder.value();
    const text::Padding &padding = parsedPadding.value();
    const Title &title = options.title;
    const int count = options.count;

    const std::string str = content.resolve();
    const std::string sep(text::detectLineBreak(str));
    const auto lines = text::splitLines(str, sep);
    const auto dims = layout::inferDimensions(lines, padding);

    int width = options.width.value_or(spec.leftSize() + dims.width + spec.rightSize());
    width = std::max({width, topSpaceTaken(title, spec), bottomSpaceTaken(title, spec)});
    const int height =
        options.height.value_or(spec.topSize() + dims.height + spec.bottomSize());

    const auto rows = layout::formatContent(str, width, padding, options.align);

    const style::Brush paint(styler_, options.style.content());
    const style::Brush borderPaint(styler_, options.style.border);

    const bool positioned = options.positioned();
    const int top = options.top.value_or(0);
    const int left = options.left.value_or(0);

    if (log::enabled(log::Level::Debug))
    {
        std::ostringstream os;
        os << "frame " << width << 'x' << height << " count=" << count
           << (positioned ? " positioned" : " flowed") << " rows=" << rows.size();
        log::debug(os.str());
    }

    const std::string pipe =
        borderPaint(border::glyph(border::GlyphKind::Pipe, spec.type));

    std::string out;

    if (spec.top)
    {
        if (positioned)
            out += term::moveTo(left, top);
        out += tile(topBorder(title, width, spec, borderPaint), count);
        if (!positioned)
            out += sep;
    }

    const int interior = std::max(0, height - spec.topSize() - spec.bottomSize());
    for (int i = 0; i < interior; ++i)
    {
        const int row = top + i + spec.topSize();
        if (positioned)
            out += term::moveTo(left, row);

        for (int x = 0; x < count; ++x)
        {
            if (spec.left)
                out += pipe;

            int contentSize = width - spec.leftSize() - spec.rightSize();
            if (static_cast<std::size_t>(i) < rows.size())
            {
                const std::string &line = rows[static_cast<std::size_t>(i)];
                out += paint(line);
                contentSize -= static_cast<int>(text::printableCount(line));
            }

            if (paint.active() || !positioned)
            {
                out += paint(std::string(static_cast<std::size_t>(std::max(0, contentSize)), ' '));
            }

            if (spec.right)
            {
                if (positioned)
                {
                    const int tileLeft = left + x * (width + kGutterWidth);
                    out += term::moveTo(tileLeft + width - spec.rightSize(), row);
                }
                out += pipe;
            }

            if (x < count - 1)
                out.append(kGutter);
        }

        if (!positioned)
            out += sep;
    }

    if (spec.bottom)
    {
        if (positioned)
            out += term::moveTo(left, top + height - spec.bottomSize());
        out += tile(bottomBorder(title, width, spec, borderPaint), count);
        if (!positioned)
            out += sep;
    }

    return out;
}

support::Expected<std::string> frame(const Content &content, const FrameOptions &options)
{
    return FrameRenderer(style::defaultStyler()).render(content, options);
}

support::Expected<std::string> frame(const FrameOptions &options)
{
    return frame(Content(), options);
}

} // namespace tbox::render
