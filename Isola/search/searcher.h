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
#include "timecontrol.h"

#include <cstdint>
#include <memory>

class Board;

namespace Search {

/// SearchContext holds the state shared by all nodes of one depth-limited search.
struct SearchContext
{
    Board                  &board;           /// Board to search on, restored when search returns
    Side                    self;            /// The searching side, which maximizes
    Evaluation::EvalFunction evaluator;       /// Scores leaf nodes from self's point of view
    const TimeControl      &timectl;         /// Timer of the current turn
    Time                    timerThreshold;  /// Abort when less than this is left
    uint64_t                nodes   = 0;     /// Nodes visited
    bool                    aborted = false; /// Set once the timer expired

    /// Checks the timer and marks the search as aborted when time is up.
    /// @return True if the search should unwind immediately.
    bool checkTimeup()
    {
        if (!aborted && timectl.isTimeup(timerThreshold))
            aborted = true;
        return aborted;
    }
};

/// RootResult is the value and best move of one depth-limited root search.
struct RootResult
{
    Pos   bestMove = Pos::NONE;
    Value value    = VALUE_ZERO;
};

/// Searcher is the base class for implementation of all search algorithms.
class Searcher
{
public:
    virtual ~Searcher() = default;

    /// Search the game tree rooted at ctx.board to a fixed depth. Maximizing
    /// layers are the turns of ctx.self, leaves are scored by ctx.evaluator.
    /// @param depth Number of plies to search, at least 1.
    /// @return Root value and best move. Meaningless if ctx.aborted is set.
    virtual RootResult searchRoot(SearchContext &ctx, int depth) = 0;
};

/// Create a searcher instance for the search method.
std::unique_ptr<Searcher> createSearcher(SearchMethod method);

}  // namespace Search
