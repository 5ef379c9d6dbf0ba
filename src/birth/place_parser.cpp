/// @file place_parser.cpp
/// @brief Implementation of the place name splitter.

#include "birth/place_parser.hpp"

#include <vector>

namespace natal::birth
{

namespace
{

bool is_space(char c)
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

} // anonymous namespace

ParsedPlaceName PlaceParser::parse(std::string_view raw)
{
    std::vector<std::string_view> segments;

    std::size_t start = 0;
    while (start <= raw.size())
    {
        const std::size_t comma = raw.find(',', start);
        const std::size_t end = (comma == std::string_view::npos) ? raw.size() : comma;

        const std::string_view segment = trim(raw.substr(start, end - start));
        if (!segment.empty())
        {
            segments.push_back(segment);
        }

        if (comma == std::string_view::npos)
        {
            break;
        }
        start = comma + 1;
    }

    ParsedPlaceName parsed{
        .city    = {},
        .state   = std::nullopt,
        .country = std::string(kUnknownCountry),
    };

    if (segments.empty())
    {
        return parsed;
    }

    parsed.city    = std::string(segments.front());
    parsed.country = std::string(segments.back());

    if (segments.size() > 2)
    {
        parsed.state = std::string(segments[segments.size() - 2]);
    }

    return parsed;
}

std::string_view PlaceParser::trim(std::string_view sv)
{
    while (!sv.empty() && is_space(sv.front()))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && is_space(sv.back()))
    {
        sv.remove_suffix(1);
    }
    return sv;
}

} // namespace natal::birth
