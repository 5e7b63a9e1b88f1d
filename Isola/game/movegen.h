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

#include <vector>

class Board;

/// Generate all legal moves of one side and stores them in the move list.
/// A side that has not been placed yet may occupy any blank cell, otherwise
/// it jumps like a knight to a blank cell. Knight moves are generated in
/// the order of KNIGHT_JUMPS, placements in row-major order.
/// @param board The current board state to generate moves.
/// @param side The side to generate moves for (not necessarily the side to move).
/// @param moveList The begin cursor of an empty move list.
/// @return The end cursor of move list (next of the last element).
Pos *generate(const Board &board, Side side, Pos *moveList);

/// Count legal moves of one side without storing them.
int countMoves(const Board &board, Side side);

/// MoveList is a fixed capacity list of the legal moves in one position.
struct MoveList
{
    MoveList(const Board &board, Side side) : last(generate(board, side, moveList)) {}
    MoveList(const MoveList &)            = delete;
    MoveList &operator=(const MoveList &) = delete;

    const Pos *begin() const { return moveList; }
    const Pos *end() const { return last; }
    size_t     size() const { return last - moveList; }
    bool       empty() const { return last == moveList; }
    Pos        operator[](size_t idx) const { return moveList[idx]; }
    bool       contains(Pos pos) const;

    std::vector<Pos> toVector() const { return {begin(), end()}; }

private:
    Pos  moveList[MAX_MOVES];
    Pos *last;
};
