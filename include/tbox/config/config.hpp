//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tbox/config/config.hpp
// Purpose: INI-like configuration holding default frame options.
// Key invariants: Reads sections [frame], [style] and [log]; values that do
//                 not parse leave the previous value in place.
// Ownership/Lifetime: Config is a value type filled by the loader.
// Links: src/config/config.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tbox/border/border_spec.hpp"
#include "tbox/render/frame.hpp"
#include "tbox/style/color.hpp"
#include "tbox/support/log.hpp"
#include "tbox/text/align.hpp"

#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace tbox::config
{

/// @brief Defaults for the geometry and border of frames.
struct FrameDefaults
{
    border::BorderValue border{border::GlyphSet::Light};
    std::vector<int> padding{0};
    text::Align align{text::Align::Left};
    int count{1};
    std::optional<int> width;
    std::optional<int> height;
};

/// @brief Loaded configuration.
struct Config
{
    FrameDefaults frame;
    style::StyleSpec style;
    log::Level logLevel{log::Level::Info};

    /// @brief Frame options seeded from the loaded defaults.
    [[nodiscard]] render::FrameOptions frameOptions() const;
};

/// @brief Parse configuration text from @p in into @p out.
void loadFromStream(std::istream &in, Config &out);

/// @brief Load configuration from the file at @p path into @p out.
/// @return False when the file cannot be opened.
bool loadFromFile(const std::string &path, Config &out);

} // namespace tbox::config
