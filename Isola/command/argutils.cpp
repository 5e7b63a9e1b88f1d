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

#include "argutils.h"

#include "../config.h"
#include "../core/utils.h"
#include "../search/searchcommon.h"

#include <algorithm>
#include <sstream>
#include <string>
#define CXXOPTS_NO_REGEX
#include <cxxopts.hpp>

SearchMethod Command::parseSearchMethod(std::string_view methodStr)
{
    std::string str(methodStr);
    lowerInplace(str);

    if (str == "minimax" || str == "mm")
        return SearchMethod::MINIMAX;
    else if (str == "alphabeta" || str == "ab")
        return SearchMethod::ALPHABETA;
    else
        throw std::invalid_argument("unknown search method " + std::string(methodStr));
}

bool Command::parseBool(std::string_view boolStr)
{
    std::string str(boolStr);
    lowerInplace(str);

    if (str == "1" || str == "true" || str == "yes" || str == "on")
        return true;
    else if (str == "0" || str == "false" || str == "no" || str == "off")
        return false;
    else
        throw std::invalid_argument("invalid bool value " + std::string(boolStr));
}

std::vector<Evaluation::Heuristic> Command::parseHeuristicList(std::string_view listStr)
{
    std::vector<Evaluation::Heuristic> heuristics;
    for (std::string_view name : split(listStr, ",")) {
        std::string nameStr(name);
        trimInplace(nameStr);
        if (nameStr.empty())
            continue;

        Evaluation::Heuristic h = Evaluation::parseHeuristic(nameStr);
        if (std::find(heuristics.begin(), heuristics.end(), h) != heuristics.end())
            throw std::invalid_argument("duplicate heuristic " + nameStr);
        heuristics.push_back(h);
    }
    return heuristics;
}

std::vector<Pos>
Command::parsePositionString(std::string_view positionString, int boardWidth, int boardHeight)
{
    // Convert Pos format to int string
    std::stringstream ss;
    for (char ch : positionString) {
        if (ch >= 'a' && ch <= 'z')
            ss << ' ' << int(ch - 'a' + 1) << ' ';
        else if (ch >= 'A' && ch <= 'Z')
            ss << ' ' << int(ch - 'A' + 1) << ' ';
        else if (ch >= '0' && ch <= '9')
            ss << ch;
        else
            throw std::invalid_argument("invalid position string " + std::string(positionString));
    }

    // Read coordinates from stream
    std::vector<int> coords;
    int              coord = 0;
    while (ss >> coord) {
        int size = coords.size() % 2 == 0 ? boardWidth : boardHeight;
        if (coord <= 0 || coord > size)
            throw std::invalid_argument("invalid position coord " + std::to_string(coord) + " in "
                                        + std::string(positionString));
        coords.push_back(coord - 1);
    }

    // Num coords must be even
    if (coords.size() % 2 != 0)
        throw std::invalid_argument("incomplete position string " + std::string(positionString));

    // Convert coords to pos vector
    std::vector<Pos> position;
    position.reserve(coords.size() / 2);
    for (size_t i = 0; i < coords.size(); i += 2) {
        Pos pos {coords[i], coords[i + 1]};
        if (std::find(position.begin(), position.end(), pos) != position.end())
            throw std::invalid_argument("duplicate position coord in "
                                        + std::string(positionString));
        position.push_back(pos);
    }

    return position;
}

void Command::addSearchOptions(cxxopts::Options &options)
{
    options.add_options("search")  //
        ("method",
         "One of [minimax, alphabeta] search methods",
         cxxopts::value<std::string>())  //
        ("heuristic",
         "Evaluation heuristic, one of [null, open, improved, move_diff_with_spaces, "
         "move_diff_from_center, ratio_of_moves]",
         cxxopts::value<std::string>())  //
        ("depth",
         "Search with a fixed depth instead of iterative deepening",
         cxxopts::value<int>())  //
        ("max-depth",
         "Max depth of iterative deepening",
         cxxopts::value<int>())  //
        ("time-limit",
         "Time limit (ms) of each turn, 0 for unlimited",
         cxxopts::value<Time>()->default_value(std::to_string(Config::DefaultTurnTime)))  //
        ("q,no-search-message",
         "Disable message output during search")  //
        ;
}

Search::SearchOptions Command::parseSearchOptions(const cxxopts::ParseResult &result)
{
    Search::SearchOptions options = Search::SearchOptions::fromConfig();

    if (result.count("method"))
        options.method = parseSearchMethod(result["method"].as<std::string>());
    if (result.count("heuristic"))
        options.heuristic = Evaluation::parseHeuristic(result["heuristic"].as<std::string>());
    if (result.count("depth")) {
        options.iterative   = false;
        options.searchDepth = result["depth"].as<int>();
    }
    if (result.count("max-depth"))
        options.maxDepth = result["max-depth"].as<int>();
    options.silent = result.count("no-search-message") > 0;

    if (options.searchDepth < 1)
        throw std::invalid_argument("depth must be at least 1");
    if (options.maxDepth < 1)
        throw std::invalid_argument("max-depth must be at least 1");

    return options;
}
