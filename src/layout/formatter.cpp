//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/layout/formatter.cpp
// Purpose: Run the wrap / align / pad pipeline over box content.
// Key invariants: Rows keep the content's own line separator semantics; the
//                 separator itself never appears inside a row.
// Ownership/Lifetime: Stateless.
// Links: include/tbox/layout/formatter.hpp
//
//===----------------------------------------------------------------------===//

#include "tbox/layout/formatter.hpp"

#include "tbox/text/wrap.hpp"

namespace tbox::layout
{

std::vector<std::string> formatContent(std::string_view content,
                                       int totalWidth,
                                       const text::Padding &padding,
                                       text::Align align)
{
    if (content.empty())
    {
        return {};
    }

    const int width = totalWidth - 2 - (padding.left + padding.right);
    auto wrapped = text::wrap(content, width);
    auto aligned = text::align(wrapped, width, align);
    return text::pad(aligned, padding);
}

} // namespace tbox::layout
