//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tbox/text/ansi.hpp
// Purpose: Measure strings that may carry ANSI escape sequences.
// Key invariants: Escape sequences never contribute to widths or counts.
// Ownership/Lifetime: Stateless helpers returning values.
// Links: src/text/ansi.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace tbox::text
{

/// @brief Length in bytes of the escape sequence starting at @p pos, or 0.
/// @details Recognises CSI (ESC '[' ... final), OSC (ESC ']' ... BEL or ST)
///          and two-byte ESC sequences.
std::size_t escapeLength(std::string_view s, std::size_t pos);

/// @brief Remove every ANSI escape sequence from @p s.
std::string sanitize(std::string_view s);

/// @brief Codepoint count of the raw string, escapes included.
std::size_t length(std::string_view s);

/// @brief Count printable codepoints left after sanitizing @p s.
std::size_t printableCount(std::string_view s);

/// @brief Terminal columns occupied by @p s once escapes are removed.
std::size_t visibleWidth(std::string_view s);

} // namespace tbox::text
