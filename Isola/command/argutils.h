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

#pragma once

#include "../core/pos.h"
#include "../core/types.h"
#include "../eval/evaluator.h"

#include <stdexcept>
#include <string_view>
#include <vector>

namespace Search {
struct SearchOptions;
}

namespace Command {

/// Parse search method from string, eg 'alphabeta' or 'ab'.
/// Throws std::invalid_argument if methodStr is not matched.
SearchMethod parseSearchMethod(std::string_view methodStr);

/// Parse a bool option value, one of 1/0, true/false, yes/no, on/off.
/// Throws std::invalid_argument if boolStr is not matched.
bool parseBool(std::string_view boolStr);

/// Parse a comma separated heuristic list, eg 'improved,ratio_of_moves'.
/// Throws std::invalid_argument if any name is unknown.
std::vector<Evaluation::Heuristic> parseHeuristicList(std::string_view listStr);

/// Parse a position from the position string, eg 'd4c2e3'
/// Throws std::invalid_argument if posStr is not correct.
/// @return The parsed pos sequence.
std::vector<Pos> parsePositionString(std::string_view posStr, int boardWidth, int boardHeight);

}  // namespace Command

// forward declaration
namespace cxxopts {
class ParseResult;
class Options;
}  // namespace cxxopts

namespace Command {

/// Add options regarding board size and searching to the options object.
void addSearchOptions(cxxopts::Options &options);

/// Parse search options from arguments, starting from the config defaults.
/// Throws std::invalid_argument if arguments are not correct.
Search::SearchOptions parseSearchOptions(const cxxopts::ParseResult &result);

}  // namespace Command
