//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/style/color.cpp
// Purpose: Map colour names onto SGR sequences and decorate text fragments.
// Key invariants:
//   - Decorated text is "<open><text><reset>" with resets inside the text
//     re-opened so an outer colour survives an inner one.
//   - Empty text is never decorated.
// Ownership/Lifetime: The default styler has static storage duration and is
//                     initialised once on first use.
// Links: include/tbox/style/color.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements ANSI colour decoration for tbox.
/// @details Names follow the usual terminal palette: the eight basic colours
///          map to SGR 30-37 (40-47 as background) and their bright_ forms to
///          90-97 (100-107). Foreground also accepts attribute names such as
///          bold. A leading '#' selects 24-bit colour.

#include "tbox/style/color.hpp"

#include <cstdint>
#include <sstream>

namespace tbox::style
{

namespace
{
constexpr std::string_view kReset = "\x1b[0m";

struct NamedCode
{
    std::string_view name;
    int code;
};

constexpr NamedCode kColors[] = {
    {"black", 0},
    {"red", 1},
    {"green", 2},
    {"yellow", 3},
    {"blue", 4},
    {"magenta", 5},
    {"cyan", 6},
    {"white", 7},
};

constexpr NamedCode kAttributes[] = {
    {"bold", 1},
    {"dim", 2},
    {"italic", 3},
    {"underline", 4},
    {"inverse", 7},
    {"hidden", 8},
    {"strikethrough", 9},
};

bool parseHex(std::string_view s, uint8_t &r, uint8_t &g, uint8_t &b)
{
    if (s.size() != 7 || s[0] != '#')
    {
        return false;
    }
    unsigned v = 0;
    for (char c : s.substr(1))
    {
        v <<= 4;
        if (c >= '0' && c <= '9')
            v |= static_cast<unsigned>(c - '0');
        else if (c >= 'a' && c <= 'f')
            v |= static_cast<unsigned>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F')
            v |= static_cast<unsigned>(c - 'A' + 10);
        else
            return false;
    }
    r = static_cast<uint8_t>((v >> 16) & 0xFF);
    g = static_cast<uint8_t>((v >> 8) & 0xFF);
    b = static_cast<uint8_t>(v & 0xFF);
    return true;
}

/// @brief Wrap @p text in @p open and a reset, re-opening after inner resets.
std::string decorate(const std::string &open, std::string_view text)
{
    if (text.empty())
    {
        return std::string();
    }
    std::string out = open;
    std::size_t start = 0;
    while (true)
    {
        const auto pos = text.find(kReset, start);
        if (pos == std::string_view::npos)
        {
            out.append(text.substr(start));
            break;
        }
        const std::size_t next = pos + kReset.size();
        out.append(text.substr(start, next - start));
        if (next < text.size() && text[next] != '\x1b')
        {
            out += open;
        }
        start = next;
    }
    out.append(kReset);
    return out;
}

std::string apply(Channel channel, std::string_view name, std::string_view text, bool enabled)
{
    if (!enabled)
    {
        return std::string(text);
    }
    const auto params = sgrParameters(channel, name);
    if (!params)
    {
        return std::string(text);
    }
    return decorate("\x1b[" + *params + "m", text);
}
} // namespace

std::optional<std::string> sgrParameters(Channel channel, std::string_view name)
{
    const int base = channel == Channel::Foreground ? 30 : 40;
    const int brightBase = channel == Channel::Foreground ? 90 : 100;

    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    if (parseHex(name, r, g, b))
    {
        std::ostringstream os;
        os << (channel == Channel::Foreground ? "38;2;" : "48;2;") << static_cast<int>(r) << ';'
           << static_cast<int>(g) << ';' << static_cast<int>(b);
        return os.str();
    }

    constexpr std::string_view kBright = "bright_";
    const bool bright = name.substr(0, kBright.size()) == kBright;
    const std::string_view color = bright ? name.substr(kBright.size()) : name;
    for (const auto &entry : kColors)
    {
        if (entry.name == color)
        {
            return std::to_string((bright ? brightBase : base) + entry.code);
        }
    }

    if (channel == Channel::Foreground)
    {
        for (const auto &entry : kAttributes)
        {
            if (entry.name == name)
                return std::to_string(entry.code);
        }
    }
    return std::nullopt;
}

std::string AnsiStyler::applyFg(std::string_view name, std::string_view text) const
{
    return apply(Channel::Foreground, name, text, enabled_);
}

std::string AnsiStyler::applyBg(std::string_view name, std::string_view text) const
{
    return apply(Channel::Background, name, text, enabled_);
}

support::Expected<void> AnsiStyler::validate(Channel channel, std::string_view name) const
{
    if (sgrParameters(channel, name))
    {
        return {};
    }
    const char *what = channel == Channel::Foreground ? "foreground" : "background";
    return support::makeError(support::ErrorCode::InvalidStyle,
                              "Bad " + std::string(what) + " style or color name '" +
                                  std::string(name) + "'");
}

const Styler &defaultStyler()
{
    static const AnsiStyler styler(true);
    return styler;
}

support::Expected<void> validate(const StyleSpec &spec, const Styler &styler)
{
    const std::optional<std::string> *fgs[] = {&spec.fg, &spec.border.fg};
    const std::optional<std::string> *bgs[] = {&spec.bg, &spec.border.bg};
    for (const auto *name : fgs)
    {
        if (*name)
        {
            if (auto ok = styler.validate(Channel::Foreground, **name); !ok)
                return ok;
        }
    }
    for (const auto *name : bgs)
    {
        if (*name)
        {
            if (auto ok = styler.validate(Channel::Background, **name); !ok)
                return ok;
        }
    }
    return {};
}

std::string Brush::operator()(std::string_view text) const
{
    std::string out(text);
    if (colors_.fg)
    {
        out = styler_->applyFg(*colors_.fg, out);
    }
    if (colors_.bg)
    {
        out = styler_->applyBg(*colors_.bg, out);
    }
    return out;
}

} // namespace tbox::style
