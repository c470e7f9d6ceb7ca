//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/presets.cpp
// Purpose: Define the preset frames and the override merge.
// Key invariants: Every preset uses a thick border, padding 1 and a top-left
//                 title; border colours equal content colours.
// Ownership/Lifetime: Stateless.
// Links: include/tbox/presets.hpp
//
//===----------------------------------------------------------------------===//

#include "tbox/presets.hpp"

namespace tbox
{

namespace
{
render::FrameOptions makePreset(std::string title, std::string fg, std::string bg)
{
    render::FrameOptions opts;
    opts.title.topLeft = std::move(title);
    opts.border = border::GlyphSet::Thick;
    opts.padding = {1};
    opts.style.fg = fg;
    opts.style.bg = bg;
    opts.style.border.fg = std::move(fg);
    opts.style.border.bg = std::move(bg);
    return opts;
}
} // namespace

render::FrameOptions presetOptions(Preset preset)
{
    switch (preset)
    {
        case Preset::Info:
            return makePreset(" ℹ INFO ", "black", "bright_blue");
        case Preset::Warn:
            return makePreset(" ⚠ WARNING ", "black", "bright_yellow");
        case Preset::Success:
            return makePreset(" ✔ OK ", "black", "bright_green");
        case Preset::Error:
            return makePreset(" ⨯ ERROR ", "bright_white", "red");
    }
    return render::FrameOptions{};
}

render::FrameOptions applyOverrides(render::FrameOptions base, const PresetOverrides &overrides)
{
    if (overrides.top)
        base.top = overrides.top;
    if (overrides.left)
        base.left = overrides.left;
    if (overrides.width)
        base.width = overrides.width;
    if (overrides.height)
        base.height = overrides.height;
    if (overrides.align)
        base.align = *overrides.align;
    if (overrides.padding)
        base.padding = *overrides.padding;
    if (overrides.title)
        base.title = *overrides.title;
    if (overrides.border)
        base.border = *overrides.border;
    if (overrides.style)
        base.style = *overrides.style;
    if (overrides.count)
        base.count = *overrides.count;
    return base;
}

support::Expected<std::string> message(Preset preset,
                                       std::string_view body,
                                       const PresetOverrides &overrides)
{
    const auto options = applyOverrides(presetOptions(preset), overrides);
    const std::string text(body);
    return render::frame(render::Content::computed([&text] { return text; }), options);
}

} // namespace tbox
