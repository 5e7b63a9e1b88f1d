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

#include "searchcommon.h"
#include "searcher.h"
#include "searchoutput.h"

#include <memory>

class Board;

namespace Search {

/// SearchAgent chooses a move for the side to move of a board. It runs a
/// fixed depth search, or deepens iteratively until the timer expires.
class SearchAgent
{
public:
    /// Creates an agent with the search options.
    /// Throws std::invalid_argument if depth options are less than 1.
    explicit SearchAgent(const SearchOptions &options);

    /// Search the board and return the best move found in time.
    /// The returned move is the best move of the deepest completed iteration.
    /// If no iteration completed, the first legal move is returned instead.
    /// Pos::NONE is returned only when the side to move has no legal move.
    /// @param board The position to search, which is not modified.
    /// @param timectl Timer of the current turn, started by the caller.
    SearchResult think(const Board &board, const TimeControl &timectl);

    const SearchOptions &options() const { return opts; }

    /// Printer for all search messages
    SearchPrinter printer;

private:
    SearchOptions             opts;
    std::unique_ptr<Searcher> searcher;
};

}  // namespace Search
