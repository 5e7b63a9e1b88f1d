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

#include <cmath>
#include <cstdint>
#include <cstdlib>

// -------------------------------------------------
// Board size & limits

/// Full board size. Each row of the cell array has this many cells.
constexpr int FULL_BOARD_SIZE = 32;
/// Full board array size. This also counts all boundary cells.
constexpr int FULL_BOARD_CELL_COUNT = FULL_BOARD_SIZE * FULL_BOARD_SIZE;
/// Reserved boundary so that a knight jump from any board cell stays in the array.
constexpr int BOARD_BOUNDARY = 2;
/// The actual maximum board size we can use, limited by one letter per column name.
constexpr int MAX_BOARD_SIZE = 26;
/// The minimum board size on which a knight can move at all.
constexpr int MIN_BOARD_SIZE = 3;
static_assert(MAX_BOARD_SIZE + 2 * BOARD_BOUNDARY <= FULL_BOARD_SIZE);
/// The maximum possible moves in one position (first placement on an empty board).
constexpr int MAX_MOVES = MAX_BOARD_SIZE * MAX_BOARD_SIZE;

// -------------------------------------------------

/// Pos represents a cell coordinate on board, where x is the column and y is the row.
struct Pos
{
public:
    int16_t _pos;

    Pos() = default;
    constexpr Pos(int x, int y) : _pos(((y + BOARD_BOUNDARY) << 5) | (x + BOARD_BOUNDARY)) {}
    constexpr explicit Pos(int16_t _pos) : _pos(_pos) {}
    constexpr int x() const { return (_pos & 31) - BOARD_BOUNDARY; }
    constexpr int y() const { return (_pos >> 5) - BOARD_BOUNDARY; }
    constexpr     operator int() const { return _pos; }
    inline bool   valid() const { return _pos >= 0 && _pos < FULL_BOARD_END._pos; }
    inline bool   isInBoard(int boardWidth, int boardHeight) const;

    static double euclideanDistance(Pos p1, Pos p2);

    static const Pos NONE;
    static const Pos FULL_BOARD_START;
    static const Pos FULL_BOARD_END;
};

inline constexpr Pos Pos::NONE {0};
inline constexpr Pos Pos::FULL_BOARD_START {0};
inline constexpr Pos Pos::FULL_BOARD_END {FULL_BOARD_CELL_COUNT};

/// Direction represents an offset between two cells in the cell array
enum Direction : int16_t {
    UP    = -FULL_BOARD_SIZE,
    LEFT  = -1,
    DOWN  = -UP,
    RIGHT = -LEFT,
};

constexpr Direction operator+(Direction d1, Direction d2)
{
    return Direction(int(d1) + int(d2));
}
constexpr Direction operator*(int i, Direction d)
{
    return Direction(i * int(d));
}

/// The eight knight jumps, ordered as (row, col) deltas:
/// (-2,-1) (-2,1) (-1,-2) (-1,2) (1,-2) (1,2) (2,-1) (2,1)
constexpr Direction KNIGHT_JUMPS[] = {
    2 * UP + LEFT,
    2 * UP + RIGHT,
    UP + 2 * LEFT,
    UP + 2 * RIGHT,
    DOWN + 2 * LEFT,
    DOWN + 2 * RIGHT,
    2 * DOWN + LEFT,
    2 * DOWN + RIGHT,
};

// -------------------------------------------------
// Pos/Direction related operations

constexpr Pos &operator++(Pos &p)
{
    return p = Pos(int16_t(p + 1));
}
constexpr Pos operator++(Pos &p, int)
{
    Pos tmp = p;
    ++p;
    return tmp;
}

// Jump from a Pos by a Direction

constexpr Pos operator+(Pos p, Direction i)
{
    return Pos(int16_t(int(p) + i));
}

/// Check whether the pos is inside a board with width and height.
inline bool Pos::isInBoard(int boardWidth, int boardHeight) const
{
    int X = x(), Y = y();
    return X >= 0 && X < boardWidth && Y >= 0 && Y < boardHeight;
}

/// Return the Euclidean distance between two pos.
inline double Pos::euclideanDistance(Pos p1, Pos p2)
{
    int xDelta = p1.x() - p2.x();
    int yDelta = p1.y() - p2.y();
    return std::sqrt(double(xDelta * xDelta + yDelta * yDelta));
}

