//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/text/lines.cpp
// Purpose: Implement separator detection and splitting of multi-line text.
// Key invariants: See include/tbox/text/lines.hpp.
// Ownership/Lifetime: Stateless helpers.
// Links: include/tbox/text/lines.hpp
//
//===----------------------------------------------------------------------===//

#include "tbox/text/lines.hpp"

namespace tbox::text
{

std::string_view detectLineBreak(std::string_view text)
{
    const auto pos = text.find_first_of("\r\n");
    if (pos == std::string_view::npos)
    {
        return kNewline;
    }
    if (text[pos] == '\r')
    {
        if (pos + 1 < text.size() && text[pos + 1] == '\n')
            return "\r\n";
        return "\r";
    }
    return kNewline;
}

std::vector<std::string> splitLines(std::string_view text, std::string_view sep)
{
    std::vector<std::string> lines;
    if (sep.empty())
    {
        if (!text.empty())
            lines.emplace_back(text);
        return lines;
    }
    std::size_t start = 0;
    while (true)
    {
        const auto pos = text.find(sep, start);
        if (pos == std::string_view::npos)
        {
            lines.emplace_back(text.substr(start));
            break;
        }
        lines.emplace_back(text.substr(start, pos - start));
        start = pos + sep.size();
    }
    while (!lines.empty() && lines.back().empty())
    {
        lines.pop_back();
    }
    return lines;
}

std::string joinLines(const std::vector<std::string> &lines, std::string_view sep)
{
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        if (i > 0)
            out.append(sep);
        out += lines[i];
    }
    return out;
}

} // namespace tbox::text
