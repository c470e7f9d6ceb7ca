//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/text/unicode.cpp
// Purpose: Implement the UTF-8 codec and codepoint width table used to measure
//          box content and border glyphs.
// Key invariants: decode_utf8 consumes every input byte exactly once.
// Ownership/Lifetime: Stateless helpers.
// Links: include/tbox/text/unicode.hpp
//
//===----------------------------------------------------------------------===//

#include "tbox/text/unicode.hpp"

#include <cstddef>
#include <cstdint>

namespace tbox::text
{

namespace
{
constexpr char32_t kReplacement = 0xFFFD;

struct Range
{
    char32_t lo;
    char32_t hi;
};

constexpr Range kZeroWidth[] = {
    {0x0300, 0x036F},
    {0x0483, 0x0489},
    {0x0591, 0x05BD},
    {0x0610, 0x061A},
    {0x064B, 0x065F},
    {0x0E31, 0x0E31},
    {0x0E34, 0x0E3A},
    {0x1AB0, 0x1AFF},
    {0x1DC0, 0x1DFF},
    {0x200B, 0x200F},
    {0x20D0, 0x20FF},
    {0xFE00, 0xFE0F},
    {0xFE20, 0xFE2F},
};

constexpr Range kWide[] = {
    {0x1100, 0x115F},
    {0x2E80, 0x303E},
    {0x3041, 0x33FF},
    {0x3400, 0x4DBF},
    {0x4E00, 0x9FFF},
    {0xA000, 0xA4CF},
    {0xAC00, 0xD7A3},
    {0xF900, 0xFAFF},
    {0xFE30, 0xFE4F},
    {0xFF00, 0xFF60},
    {0xFFE0, 0xFFE6},
    {0x1F300, 0x1F64F},
    {0x1F900, 0x1F9FF},
    {0x20000, 0x2FFFD},
    {0x30000, 0x3FFFD},
};

template <std::size_t N> bool inRanges(const Range (&ranges)[N], char32_t cp)
{
    for (const auto &r : ranges)
    {
        if (cp >= r.lo && cp <= r.hi)
            return true;
    }
    return false;
}

bool isContinuation(unsigned char b)
{
    return (b & 0xC0) == 0x80;
}
} // namespace

std::u32string decode_utf8(std::string_view bytes)
{
    std::u32string out;
    out.reserve(bytes.size());
    std::size_t i = 0;
    while (i < bytes.size())
    {
        const auto b0 = static_cast<unsigned char>(bytes[i]);
        if (b0 < 0x80)
        {
            out.push_back(b0);
            ++i;
            continue;
        }

        std::size_t len = 0;
        char32_t cp = 0;
        char32_t min = 0;
        if ((b0 & 0xE0) == 0xC0)
        {
            len = 2;
            cp = b0 & 0x1F;
            min = 0x80;
        }
        else if ((b0 & 0xF0) == 0xE0)
        {
            len = 3;
            cp = b0 & 0x0F;
            min = 0x800;
        }
        else if ((b0 & 0xF8) == 0xF0)
        {
            len = 4;
            cp = b0 & 0x07;
            min = 0x10000;
        }
        else
        {
            out.push_back(kReplacement);
            ++i;
            continue;
        }

        bool valid = i + len <= bytes.size();
        for (std::size_t k = 1; valid && k < len; ++k)
        {
            const auto b = static_cast<unsigned char>(bytes[i + k]);
            if (!isContinuation(b))
            {
                valid = false;
                break;
            }
            cp = (cp << 6) | (b & 0x3F);
        }
        if (valid && (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)))
        {
            valid = false;
        }

        if (!valid)
        {
            // Reject only the lead byte; the remaining bytes are decoded on
            // their own and become replacements if they are continuations.
            out.push_back(kReplacement);
            ++i;
            continue;
        }
        out.push_back(cp);
        i += len;
    }
    return out;
}

void append_utf8(std::string &out, char32_t ch)
{
    if (ch <= 0x7F)
    {
        out.push_back(static_cast<char>(ch));
    }
    else if (ch <= 0x7FF)
    {
        out.push_back(static_cast<char>(0xC0 | ((ch >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
    }
    else if (ch <= 0xFFFF)
    {
        out.push_back(static_cast<char>(0xE0 | ((ch >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((ch >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | ((ch >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((ch >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((ch >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
    }
}

std::string encode_utf8(char32_t cp)
{
    std::string out;
    append_utf8(out, cp);
    return out;
}

int char_width(char32_t cp)
{
    if (cp == 0)
        return 0;
    if (cp < 0x20 || (cp >= 0x7F && cp < 0xA0))
        return 0;
    if (inRanges(kZeroWidth, cp))
        return 0;
    if (inRanges(kWide, cp))
        return 2;
    return 1;
}

} // namespace tbox::text
