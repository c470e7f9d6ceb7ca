//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/render/merge.cpp
// Purpose: Implement side-by-side merging of rendered boxes.
// Key invariants: Output row count is the larger input row count.
// Ownership/Lifetime: Stateless.
// Links: include/tbox/render/merge.hpp
//
//===----------------------------------------------------------------------===//

#include "tbox/render/merge.hpp"

#include "tbox/text/ansi.hpp"
#include "tbox/text/lines.hpp"

#include <algorithm>
#include <vector>

namespace tbox::render
{

std::string mergeBoxes(std::string_view main, std::string_view addition)
{
    const auto first = text::splitLines(main, text::kNewline);
    const auto second = text::splitLines(addition, text::kNewline);
    const std::size_t firstWidth = first.empty() ? 0 : text::length(first.front());
    const std::size_t secondWidth = second.empty() ? 0 : text::length(second.front());

    const std::size_t rows = std::max(first.size(), second.size());
    std::vector<std::string> merged;
    merged.reserve(rows);
    for (std::size_t i = 0; i < rows; ++i)
    {
        std::string line = i < first.size() ? first[i] : std::string(firstWidth, ' ');
        line += "  ";
        line += i < second.size() ? second[i] : std::string(secondWidth, ' ');
        merged.push_back(std::move(line));
    }
    return text::joinLines(merged, text::kNewline);
}

} // namespace tbox::render
