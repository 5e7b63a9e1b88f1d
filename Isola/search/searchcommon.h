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
#include "../core/utils.h"
#include "../eval/evaluator.h"

#include <cstdint>

class Board;

namespace Search {

/// SearchOptions stores how the agent searches a position: the search
/// algorithm, fixed depth or iterative deepening, and the evaluation function.
struct SearchOptions
{
    SearchMethod method = SearchMethod::ALPHABETA;
    /// Iterative deepening until time is up (otherwise a single fixed depth search).
    bool iterative = true;
    /// Depth of a fixed depth search.
    int searchDepth = 3;
    /// Deepest iteration of an iterative deepening search.
    int maxDepth = 99;
    /// Time (ms) reserved for returning a move. Search aborts when less is left.
    Time timerThreshold = 10;
    /// Evaluation function used at leaf nodes.
    Evaluation::Heuristic heuristic = Evaluation::Heuristic::MOVE_DIFF_FROM_CENTER;
    /// Suppress all search messages regardless of the message mode.
    bool silent = false;

    /// Creates search options from the default values in config.
    static SearchOptions fromConfig();
};

/// SearchResult stores the outcome of one think() call.
struct SearchResult
{
    Pos      bestMove = Pos::NONE;  /// Chosen move, Pos::NONE when there is no legal move
    Value    value    = VALUE_ZERO;  /// Value of the last completed iteration
    int      depth    = 0;           /// Depth of the last completed iteration
    uint64_t nodes    = 0;           /// Total nodes visited, including aborted iterations
    Time     time     = 0;           /// Time spent in milliseconds
    bool     timeout  = false;       /// Whether the last iteration was aborted by timer
};

}  // namespace Search
