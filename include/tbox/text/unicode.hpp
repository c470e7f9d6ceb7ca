//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tbox/text/unicode.hpp
// Purpose: UTF-8 decoding/encoding and terminal column widths of codepoints.
// Key invariants: Malformed input never throws; every rejected byte decodes
//                 to U+FFFD.
// Ownership/Lifetime: Functions return owned strings.
// Links: src/text/unicode.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <string_view>

namespace tbox::text
{

/// @brief Decode UTF-8 into codepoints.
/// @details Overlong forms, surrogates, values above U+10FFFF, truncated
///          sequences and stray continuation bytes each produce one U+FFFD
///          per consumed byte.
std::u32string decode_utf8(std::string_view bytes);

/// @brief Append the UTF-8 encoding of @p cp to @p out.
void append_utf8(std::string &out, char32_t cp);

/// @brief Encode a single codepoint as UTF-8.
std::string encode_utf8(char32_t cp);

/// @brief Number of terminal columns @p cp occupies (0, 1 or 2).
int char_width(char32_t cp);

} // namespace tbox::text
