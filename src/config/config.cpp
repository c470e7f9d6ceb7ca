//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/config/config.cpp
// Purpose: INI-like configuration loader for frame defaults.
// Key invariants: Reads sections [frame], [style] and [log]; unknown sections
//                 and keys are ignored, invalid values are logged and skipped.
// Ownership/Lifetime: Loader does not own external resources beyond the
//                     stream it reads.
// Links: include/tbox/config/config.hpp
//
//===----------------------------------------------------------------------===//

#include "tbox/config/config.hpp"

#include "tbox/text/padding.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string_view>

namespace tbox::config
{

namespace
{
std::string trim(std::string_view sv)
{
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
    {
        sv.remove_suffix(1);
    }
    return std::string(sv);
}

std::string lower(std::string s)
{
    std::transform(
        s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::optional<int> parse_int(const std::string &s)
{
    try
    {
        size_t parsed = 0;
        const int value = std::stoi(s, &parsed);
        if (parsed != s.size())
        {
            return std::nullopt;
        }
        return value;
    }
    catch (const std::invalid_argument &)
    {
        return std::nullopt;
    }
    catch (const std::out_of_range &)
    {
        return std::nullopt;
    }
}

void skip(const std::string &section, const std::string &key, const std::string &value,
          const std::string &why)
{
    log::warn("config: ignoring [" + section + "] " + key + " = '" + value + "': " + why);
}

void frame_entry(const std::string &key, const std::string &value, FrameDefaults &frame)
{
    if (key == "border")
    {
        border::BorderValue raw(value);
        auto parsed = border::parseBorder(raw);
        if (!parsed)
        {
            skip("frame", key, value, parsed.error().message);
            return;
        }
        frame.border = std::move(raw);
    }
    else if (key == "padding")
    {
        auto parsed = text::parsePadding(value);
        if (!parsed)
        {
            skip("frame", key, value, parsed.error().message);
            return;
        }
        const auto &p = parsed.value();
        frame.padding = {p.top, p.right, p.bottom, p.left};
    }
    else if (key == "align")
    {
        if (auto align = text::parseAlign(value))
            frame.align = *align;
        else
            skip("frame", key, value, "expected left, center or right");
    }
    else if (key == "count" || key == "width" || key == "height")
    {
        const auto number = parse_int(value);
        if (!number || *number < 1)
        {
            skip("frame", key, value, "expected a positive integer");
            return;
        }
        if (key == "count")
            frame.count = *number;
        else if (key == "width")
            frame.width = *number;
        else
            frame.height = *number;
    }
}

void style_entry(const std::string &key, const std::string &value, style::StyleSpec &spec)
{
    std::optional<std::string> *slot = nullptr;
    style::Channel channel = style::Channel::Foreground;
    if (key == "fg")
        slot = &spec.fg;
    else if (key == "bg")
        slot = &spec.bg;
    else if (key == "border_fg")
        slot = &spec.border.fg;
    else if (key == "border_bg")
        slot = &spec.border.bg;
    if (!slot)
    {
        return;
    }
    if (key == "bg" || key == "border_bg")
        channel = style::Channel::Background;

    const std::string name = lower(value);
    if (auto ok = style::defaultStyler().validate(channel, name); !ok)
    {
        skip("style", key, value, ok.error().message);
        return;
    }
    *slot = name;
}

} // namespace

render::FrameOptions Config::frameOptions() const
{
    render::FrameOptions opts;
    opts.border = frame.border;
    opts.padding = frame.padding;
    opts.align = frame.align;
    opts.count = frame.count;
    opts.width = frame.width;
    opts.height = frame.height;
    opts.style = style;
    return opts;
}

void loadFromStream(std::istream &in, Config &out)
{
    std::string line;
    std::string section;
    while (std::getline(in, line))
    {
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';')
        {
            continue;
        }
        if (trimmed.front() == '[' && trimmed.back() == ']')
        {
            section = lower(trimmed.substr(1, trimmed.size() - 2));
            continue;
        }
        auto eq = trimmed.find('=');
        if (eq == std::string::npos)
        {
            continue;
        }
        const std::string key = lower(trim(trimmed.substr(0, eq)));
        const std::string value = trim(trimmed.substr(eq + 1));

        if (section == "frame")
        {
            frame_entry(key, value, out.frame);
        }
        else if (section == "style")
        {
            style_entry(key, value, out.style);
        }
        else if (section == "log" && key == "level")
        {
            if (auto level = log::parseLevel(value))
                out.logLevel = *level;
            else
                skip(section, key, value, "expected debug, info, warn, error or off");
        }
    }
}

bool loadFromFile(const std::string &path, Config &out)
{
    std::ifstream in(path);
    if (!in)
    {
        return false;
    }
    loadFromStream(in, out);
    return true;
}

} // namespace tbox::config
