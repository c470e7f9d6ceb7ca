//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tbox/text/lines.hpp
// Purpose: Line separator detection and splitting shared by the formatter,
//          the renderer and box merging.
// Key invariants: splitLines never returns trailing empty pieces.
// Ownership/Lifetime: Returned vectors own their strings.
// Links: src/text/lines.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace tbox::text
{

/// @brief Default separator used when the text contains none.
inline constexpr std::string_view kNewline = "\n";

/// @brief Return the first line break in @p text ("\r\n", "\r" or "\n").
/// @return The detected separator, or kNewline when @p text has none.
std::string_view detectLineBreak(std::string_view text);

/// @brief Split @p text on @p sep, dropping trailing empty pieces.
/// @details Interior empty pieces are kept, so "a\n\nb" yields three lines
///          while "a\n" yields one and "" yields none.
std::vector<std::string> splitLines(std::string_view text, std::string_view sep);

/// @brief Join @p lines with @p sep between consecutive entries.
std::string joinLines(const std::vector<std::string> &lines, std::string_view sep);

} // namespace tbox::text
