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

#include "../core/types.h"

#include <cstdint>
#include <ostream>
#include <string_view>

class Board;

namespace Evaluation {

/// Heuristic enumerates all evaluation functions for non-terminal positions.
enum class Heuristic : uint8_t {
    NULL_SCORE,             // Only knows won and lost positions
    OPEN_MOVE,              // Number of own moves
    IMPROVED,               // Own moves minus opponent moves
    MOVE_DIFF_WITH_SPACES,  // Move difference scaled by how full the board is
    MOVE_DIFF_FROM_CENTER,  // Move difference weighted by closeness to the center
    RATIO_OF_MOVES,         // Ratio of own moves to opponent moves
    HEURISTIC_NB
};

/// EvalFunction scores a position from the point of view of one side.
typedef Value (*EvalFunction)(const Board &board, Side self);

// -------------------------------------------------
// Baseline heuristics

/// Returns VALUE_LOSS if self has lost, VALUE_WIN if self has won, otherwise zero.
Value nullScore(const Board &board, Side self);

/// Returns the number of legal moves of self (or the decided utility).
Value openMoveScore(const Board &board, Side self);

/// Returns own moves minus opponent moves (or the decided utility).
Value improvedScore(const Board &board, Side self);

// -------------------------------------------------
// Custom heuristics
//
// All of them first return VALUE_WIN when the opponent has no legal move and
// then VALUE_LOSS when self has no legal move, regardless of the side to move.

/// Own moves times (cells / blank cells) minus weighted opponent moves.
/// Own mobility gets more valuable as the board fills up.
Value moveDiffWithSpaces(const Board &board, Side self);

/// Each move counts 1 - distance(move, center) / width, so central moves are
/// worth more. Returns own sum minus weighted opponent sum.
Value moveDiffFromCenter(const Board &board, Side self);

/// Ratio of own moves to opponent moves.
Value ratioOfMoves(const Board &board, Side self);

// -------------------------------------------------

/// Get the evaluation function of a heuristic.
EvalFunction evalFunction(Heuristic heuristic);

/// Evaluate the board from the point of view of self with the given heuristic.
inline Value evaluate(const Board &board, Side self, Heuristic heuristic)
{
    return evalFunction(heuristic)(board, self);
}

/// Get the config name of a heuristic, e.g. "move_diff_from_center".
const char *heuristicName(Heuristic heuristic);

/// Get the short name used for agent names, e.g. "Improved".
const char *heuristicShortName(Heuristic heuristic);

/// Parse heuristic from its config name (or its short name, case-insensitive).
/// Throws std::invalid_argument if name is not matched.
Heuristic parseHeuristic(std::string_view name);

std::ostream &operator<<(std::ostream &out, Heuristic heuristic);

}  // namespace Evaluation
