//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/text/wrap.cpp
// Purpose: Implement greedy word wrapping over display columns.
// Key invariants: Words are separated by single spaces; runs of spaces are
//                 kept inside a row and dropped at a break.
// Ownership/Lifetime: Stateless helpers.
// Links: include/tbox/text/wrap.hpp
//
//===----------------------------------------------------------------------===//

#include "tbox/text/wrap.hpp"

#include "tbox/text/ansi.hpp"
#include "tbox/text/lines.hpp"
#include "tbox/text/unicode.hpp"

#include <cstddef>

namespace tbox::text
{

namespace
{
/// @brief One indivisible piece of a word: an escape sequence or a codepoint.
struct Unit
{
    std::string_view bytes;
    int width;
};

std::vector<Unit> units(std::string_view word)
{
    std::vector<Unit> out;
    std::size_t i = 0;
    while (i < word.size())
    {
        if (const std::size_t esc = escapeLength(word, i))
        {
            out.push_back({word.substr(i, esc), 0});
            i += esc;
            continue;
        }
        const auto b0 = static_cast<unsigned char>(word[i]);
        std::size_t len = 1;
        if ((b0 & 0xE0) == 0xC0)
            len = 2;
        else if ((b0 & 0xF0) == 0xE0)
            len = 3;
        else if ((b0 & 0xF8) == 0xF0)
            len = 4;
        if (i + len > word.size())
            len = word.size() - i;
        const std::string_view bytes = word.substr(i, len);
        const std::u32string cps = decode_utf8(bytes);
        const int width = cps.size() == 1 ? char_width(cps[0]) : static_cast<int>(cps.size());
        out.push_back({bytes, width});
        i += len;
    }
    return out;
}

class RowBuilder
{
  public:
    explicit RowBuilder(int width) : width_(width) {}

    /// @brief Place @p word, breaking the row first when it does not fit.
    void addWord(std::string_view word)
    {
        const int wordWidth = static_cast<int>(visibleWidth(word));
        if (started_)
        {
            if (rowWidth_ + 1 + wordWidth <= width_)
            {
                row_ += ' ';
                row_.append(word);
                rowWidth_ += 1 + wordWidth;
                return;
            }
            flush();
        }
        if (word.empty() && !rows_.empty())
        {
            return; // spaces at a break are dropped
        }
        if (wordWidth <= width_)
        {
            row_.append(word);
            rowWidth_ = wordWidth;
            started_ = true;
            return;
        }
        splitWord(word);
    }

    std::vector<std::string> finish()
    {
        if (started_)
            flush();
        return std::move(rows_);
    }

  private:
    void flush()
    {
        rows_.push_back(std::move(row_));
        row_.clear();
        rowWidth_ = 0;
        started_ = false;
    }

    void splitWord(std::string_view word)
    {
        for (const Unit &u : units(word))
        {
            if (u.width > 0 && rowWidth_ + u.width > width_ && rowWidth_ > 0)
            {
                flush();
            }
            row_.append(u.bytes);
            rowWidth_ += u.width;
            started_ = true;
        }
    }

    int width_;
    std::string row_;
    int rowWidth_{0};
    bool started_{false};
    std::vector<std::string> rows_;
};

std::vector<std::string> wrapLine(std::string_view line, int width)
{
    if (static_cast<int>(visibleWidth(line)) <= width)
    {
        return {std::string(line)};
    }

    RowBuilder builder(width);
    std::size_t start = 0;
    while (start <= line.size())
    {
        auto pos = line.find(' ', start);
        if (pos == std::string_view::npos)
            pos = line.size();
        builder.addWord(line.substr(start, pos - start));
        start = pos + 1;
    }
    return builder.finish();
}
} // namespace

std::vector<std::string> wrap(std::string_view text, int width)
{
    const auto sep = detectLineBreak(text);
    std::vector<std::string> lines = splitLines(text, sep);
    if (width <= 0)
    {
        return lines;
    }

    std::vector<std::string> rows;
    for (const auto &line : lines)
    {
        for (auto &row : wrapLine(line, width))
        {
            rows.push_back(std::move(row));
        }
    }
    return rows;
}

} // namespace tbox::text
