/*
 *  Isola, an Isolation game playing engine with minimax and alpha-beta search.
 *  Copyright (C) 2022  Isola developers
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "utils.h"

#include <algorithm>
#include <cctype>
#include <chrono>

Time now()
{
    using namespace std::chrono;
    static_assert(sizeof(Time) >= sizeof(milliseconds::rep));

    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

// -------------------------------------------------

std::string &trimInplace(std::string &s)
{
    auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };

    s.erase(std::find_if_not(s.rbegin(), s.rend(), isSpace).base(), s.end());
    s.erase(s.begin(), std::find_if_not(s.begin(), s.end(), isSpace));
    return s;
}

std::string &upperInplace(std::string &s)
{
    for (char &c : s)
        c = char(std::toupper((unsigned char)c));
    return s;
}

std::string &lowerInplace(std::string &s)
{
    for (char &c : s)
        c = char(std::tolower((unsigned char)c));
    return s;
}

std::vector<std::string_view> split(std::string_view s, std::string_view delims, bool includeEmpty)
{
    std::vector<std::string_view> pieces;

    size_t begin = 0;
    while (begin <= s.size()) {
        size_t end = std::min(s.find_first_of(delims, begin), s.size());
        if (includeEmpty || end > begin)
            pieces.push_back(s.substr(begin, end - begin));
        begin = end + 1;
    }

    return pieces;
}

// -------------------------------------------------

namespace {

struct Unit
{
    uint64_t    scale;  // Divisor applied to the value
    uint64_t    limit;  // Values below this limit use this unit
    const char *suffix;
};

template <size_t N>
std::string scaledText(uint64_t value, const Unit (&units)[N])
{
    for (const Unit &u : units)
        if (value < u.limit)
            return std::to_string(value / u.scale) + u.suffix;

    const Unit &last = units[N - 1];
    return std::to_string(value / last.scale) + last.suffix;
}

}  // namespace

std::string timeText(Time time)
{
    if (time < 0)
        return "-" + timeText(-time);

    constexpr Unit units[] = {
        {1, 10000, "ms"},
        {1000, 1000000, "s"},
        {60000, 360000000, "min"},
        {3600000, UINT64_MAX, "h"},
    };
    return scaledText(uint64_t(time), units);
}

std::string nodesText(uint64_t nodes)
{
    constexpr Unit units[] = {
        {1, 10000, ""},
        {1000, 10000000, "K"},
        {1000000, 10000000000, "M"},
        {1000000000, UINT64_MAX, "G"},
    };
    return scaledText(nodes, units);
}

std::string speedText(uint64_t nodesPerSecond)
{
    constexpr Unit units[] = {
        {1, 100000, ""},
        {1000, 100000000, "K"},
        {1000000, UINT64_MAX, "M"},
    };
    return scaledText(nodesPerSecond, units);
}
