//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/text/ansi.cpp
// Purpose: Strip and measure ANSI-decorated text.
// Key invariants: sanitize() keeps every byte outside escape sequences in
//                 order; an unterminated sequence is dropped to end of input.
// Ownership/Lifetime: Stateless helpers.
// Links: include/tbox/text/ansi.hpp
//
//===----------------------------------------------------------------------===//

#include "tbox/text/ansi.hpp"

#include "tbox/text/unicode.hpp"

namespace tbox::text
{

namespace
{
constexpr char kEsc = '\x1b';

bool isPrintable(char32_t cp)
{
    return cp >= 0x20 && cp != 0x7F && !(cp >= 0x80 && cp < 0xA0);
}
} // namespace

std::size_t escapeLength(std::string_view s, std::size_t pos)
{
    if (pos >= s.size() || s[pos] != kEsc)
    {
        return 0;
    }
    if (pos + 1 >= s.size())
    {
        return 1;
    }
    const char kind = s[pos + 1];
    if (kind == '[')
    {
        std::size_t i = pos + 2;
        while (i < s.size())
        {
            const auto c = static_cast<unsigned char>(s[i]);
            if (c >= 0x40 && c <= 0x7E)
            {
                return i - pos + 1;
            }
            ++i;
        }
        return s.size() - pos;
    }
    if (kind == ']')
    {
        std::size_t i = pos + 2;
        while (i < s.size())
        {
            if (s[i] == '\a')
            {
                return i - pos + 1;
            }
            if (s[i] == kEsc && i + 1 < s.size() && s[i + 1] == '\\')
            {
                return i - pos + 2;
            }
            ++i;
        }
        return s.size() - pos;
    }
    return 2;
}

std::string sanitize(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    std::size_t i = 0;
    while (i < s.size())
    {
        if (const std::size_t esc = escapeLength(s, i))
        {
            i += esc;
            continue;
        }
        out.push_back(s[i]);
        ++i;
    }
    return out;
}

std::size_t length(std::string_view s)
{
    return decode_utf8(s).size();
}

std::size_t printableCount(std::string_view s)
{
    std::size_t count = 0;
    for (char32_t cp : decode_utf8(sanitize(s)))
    {
        if (isPrintable(cp))
            ++count;
    }
    return count;
}

std::size_t visibleWidth(std::string_view s)
{
    std::size_t width = 0;
    for (char32_t cp : decode_utf8(sanitize(s)))
    {
        width += static_cast<std::size_t>(char_width(cp));
    }
    return width;
}

} // namespace tbox::text
