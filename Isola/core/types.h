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

#include <climits>
#include <cstdint>
#include <limits>

// -------------------------------------------------
// Common types

/// Value is the heuristic or search score of a position, seen from one side.
/// Proven wins and losses are represented by positive and negative infinity.
typedef double Value;

constexpr Value VALUE_ZERO = 0.0;
constexpr Value VALUE_WIN  = std::numeric_limits<double>::infinity();
constexpr Value VALUE_LOSS = -std::numeric_limits<double>::infinity();

/// Checks if a value is a proven win or loss.
inline bool isDecisive(Value v)
{
    return v == VALUE_WIN || v == VALUE_LOSS;
}

// -------------------------------------------------

/// Side represents one of the two players
enum Side : uint8_t {
    PLAYER_1,
    PLAYER_2,
    SIDE_NB,  // Total number of sides
};

// Returns the opponent of a side
constexpr Side operator~(Side s)
{
    return Side(s ^ 1);
}

/// CellState is the type of a single cell on board
enum CellState : uint8_t {
    BLANK,    // Not visited by any player
    BLOCKED,  // Visited (or currently occupied) by a player
    WALL,     // Outside of the board
};

// -------------------------------------------------

/// SearchMethod selects the game tree search algorithm.
enum class SearchMethod {
    MINIMAX,
    ALPHABETA,
};

/// Termination describes how a game was decided.
enum class Termination {
    NONE,            // Game is still running
    NO_LEGAL_MOVES,  // Side to move has no legal move left
    TIMEOUT,         // Side to move exceeded its turn time
    ILLEGAL_MOVE,    // Side to move returned a move not in the legal move list
};
