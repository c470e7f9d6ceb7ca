//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/text/padding.cpp
// Purpose: Implement padding shorthand expansion.
// Key invariants: See include/tbox/text/padding.hpp.
// Ownership/Lifetime: Stateless helpers.
// Links: include/tbox/text/padding.hpp
//
//===----------------------------------------------------------------------===//

#include "tbox/text/padding.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

namespace tbox::text
{

namespace
{
std::string describe(const std::vector<int> &values)
{
    std::ostringstream os;
    os << '[';
    for (std::size_t i = 0; i < values.size(); ++i)
    {
        if (i > 0)
            os << ", ";
        os << values[i];
    }
    os << ']';
    return os.str();
}
} // namespace

support::Expected<Padding> parsePadding(const std::vector<int> &shorthand)
{
    using support::ErrorCode;

    for (int v : shorthand)
    {
        if (v < 0)
        {
            return support::makeError(ErrorCode::InvalidPadding,
                                      "Negative value in padding " + describe(shorthand));
        }
    }

    switch (shorthand.size())
    {
        case 1:
            return Padding::uniform(shorthand[0]);
        case 2:
            return Padding{shorthand[0], shorthand[1], shorthand[0], shorthand[1]};
        case 3:
            return Padding{shorthand[0], shorthand[1], shorthand[2], shorthand[1]};
        case 4:
            return Padding{shorthand[0], shorthand[1], shorthand[2], shorthand[3]};
        default:
            return support::makeError(ErrorCode::InvalidPadding,
                                      "Wrong number of values for padding " +
                                          describe(shorthand) + ", expected 1 to 4");
    }
}

support::Expected<Padding> parsePadding(std::string_view text)
{
    std::string normalized(text);
    for (char &c : normalized)
    {
        if (c == ',')
            c = ' ';
    }
    std::istringstream iss(normalized);
    std::vector<int> values;
    std::string token;
    while (iss >> token)
    {
        std::size_t parsed = 0;
        int value = 0;
        try
        {
            value = std::stoi(token, &parsed);
        }
        catch (const std::invalid_argument &)
        {
            parsed = 0;
        }
        catch (const std::out_of_range &)
        {
            parsed = 0;
        }
        if (parsed != token.size())
        {
            return support::makeError(support::ErrorCode::InvalidPadding,
                                      "Invalid padding value '" + token + "'");
        }
        values.push_back(value);
    }
    return parsePadding(values);
}

} // namespace tbox::text
