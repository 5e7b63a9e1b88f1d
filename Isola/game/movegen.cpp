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

#include "movegen.h"

#include "board.h"

#include <algorithm>
#include <cassert>

Pos *generate(const Board &board, Side side, Pos *moveList)
{
    Pos from = board.location(side);

    // First placement: every blank cell is a legal move
    if (from == Pos::NONE) {
        FOR_EVERY_BLANK_POS(&board, pos)
        {
            *moveList++ = pos;
        }
        return moveList;
    }

    for (Direction jump : KNIGHT_JUMPS) {
        Pos to = from + jump;
        if (board.isBlank(to))
            *moveList++ = to;
    }

    return moveList;
}

int countMoves(const Board &board, Side side)
{
    Pos from = board.location(side);
    if (from == Pos::NONE)
        return board.blankCount();

    int count = 0;
    for (Direction jump : KNIGHT_JUMPS)
        count += board.isBlank(from + jump);
    return count;
}

bool MoveList::contains(Pos pos) const
{
    return std::find(begin(), end(), pos) != end();
}
