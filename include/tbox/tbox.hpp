//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tbox/tbox.hpp
// Purpose: Umbrella header exposing the public box rendering API.
// Links: include/tbox/render/frame.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tbox/border/border_spec.hpp"
#include "tbox/border/glyphs.hpp"
#include "tbox/presets.hpp"
#include "tbox/render/frame.hpp"
#include "tbox/render/merge.hpp"
#include "tbox/style/color.hpp"
#include "tbox/version.hpp"

namespace tbox
{
using border::BorderValue;
using border::cornerChar;
using border::GlyphKind;
using border::GlyphSet;
using render::Content;
using render::frame;
using render::FrameOptions;
using render::mergeBoxes;
using render::Title;
} // namespace tbox
