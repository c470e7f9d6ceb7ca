//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tbox/presets.hpp
// Purpose: Ready-made info, warning, success and error frames.
// Key invariants: Overrides replace whole options; nested fields such as the
//                 border style are never merged individually.
// Ownership/Lifetime: Value types only.
// Links: src/presets.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tbox/render/frame.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tbox
{

enum class Preset
{
    Info,
    Warn,
    Success,
    Error
};

/// @brief Caller choices applied on top of a preset.
/// @details Each engaged member replaces the preset's value for that option
///          wholesale. Supplying style therefore discards the preset's border
///          colours unless the override sets them again.
struct PresetOverrides
{
    std::optional<int> top;
    std::optional<int> left;
    std::optional<int> width;
    std::optional<int> height;
    std::optional<text::Align> align;
    std::optional<std::vector<int>> padding;
    std::optional<render::Title> title;
    std::optional<border::BorderValue> border;
    std::optional<style::StyleSpec> style;
    std::optional<int> count;
};

/// @brief Default frame options of @p preset.
render::FrameOptions presetOptions(Preset preset);

/// @brief Replace every option of @p base that @p overrides sets.
render::FrameOptions applyOverrides(render::FrameOptions base, const PresetOverrides &overrides);

/// @brief Render @p body with @p preset and @p overrides.
support::Expected<std::string> message(Preset preset,
                                       std::string_view body,
                                       const PresetOverrides &overrides = {});

inline support::Expected<std::string> info(std::string_view msg, const PresetOverrides &o = {})
{
    return message(Preset::Info, msg, o);
}

inline support::Expected<std::string> warn(std::string_view msg, const PresetOverrides &o = {})
{
    return message(Preset::Warn, msg, o);
}

inline support::Expected<std::string> success(std::string_view msg, const PresetOverrides &o = {})
{
    return message(Preset::Success, msg, o);
}

inline support::Expected<std::string> error(std::string_view msg, const PresetOverrides &o = {})
{
    return message(Preset::Error, msg, o);
}

} // namespace tbox
