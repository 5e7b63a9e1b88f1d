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

#include "board.h"

#include "../core/iohelper.h"
#include "movegen.h"

#include <algorithm>
#include <iterator>
#include <sstream>
#include <stdexcept>

Board::Board(int width, int height)
    : boardWidth(width)
    , boardHeight(height)
    , boardCellCount(width * height)
{
    if (width < MIN_BOARD_SIZE || width > MAX_BOARD_SIZE || height < MIN_BOARD_SIZE
        || height > MAX_BOARD_SIZE)
        throw std::invalid_argument("board size must be in range [" + std::to_string(MIN_BOARD_SIZE)
                                    + "," + std::to_string(MAX_BOARD_SIZE) + "]");

    stateInfos.reserve(boardCellCount);
    newGame();
}

void Board::newGame()
{
    for (Pos pos = Pos::FULL_BOARD_START; pos < Pos::FULL_BOARD_END; pos++)
        cells[pos] = pos.isInBoard(boardWidth, boardHeight) ? BLANK : WALL;

    moveCount   = 0;
    numBlanks   = boardCellCount;
    currentSide = PLAYER_1;
    std::fill(std::begin(locations), std::end(locations), Pos::NONE);
    stateInfos.clear();
}

void Board::move(Pos pos)
{
    assert(isLegal(pos));

    stateInfos.push_back({pos, locations[currentSide]});
    cells[pos]             = BLOCKED;
    locations[currentSide] = pos;
    numBlanks--;
    moveCount++;
    currentSide = ~currentSide;
}

void Board::undo()
{
    assert(moveCount > 0);

    const StateInfo &st    = stateInfos.back();
    currentSide            = ~currentSide;
    cells[st.lastMove]     = BLANK;
    locations[currentSide] = st.prevLocation;
    numBlanks++;
    moveCount--;
    stateInfos.pop_back();
}

Board Board::forecastMove(Pos pos) const
{
    Board newBoard(*this);
    newBoard.move(pos);
    return newBoard;
}

bool Board::isLegal(Side side, Pos pos) const
{
    if (!pos.valid() || !isBlank(pos))
        return false;

    Pos from = locations[side];
    if (from == Pos::NONE)
        return true;

    for (Direction jump : KNIGHT_JUMPS)
        if (from + jump == pos)
            return true;
    return false;
}

std::vector<Pos> Board::legalMoves(Side side) const
{
    return MoveList(*this, side).toVector();
}

std::vector<Pos> Board::blankSpaces() const
{
    std::vector<Pos> blanks;
    blanks.reserve(numBlanks);
    FOR_EVERY_BLANK_POS(this, pos)
    {
        blanks.push_back(pos);
    }
    return blanks;
}

bool Board::isLoser(Side side) const
{
    return side == currentSide && countMoves(*this, side) == 0;
}

bool Board::isWinner(Side side) const
{
    return side != currentSide && countMoves(*this, currentSide) == 0;
}

Value Board::utility(Side side) const
{
    if (countMoves(*this, currentSide) > 0)
        return VALUE_ZERO;

    return side == currentSide ? VALUE_LOSS : VALUE_WIN;
}

std::string Board::positionString() const
{
    std::ostringstream ss;
    for (int i = 0; i < moveCount; i++)
        ss << getHistoryMove(i);
    return ss.str();
}

std::string Board::trace() const
{
    std::ostringstream ss;

    ss << "  ";
    for (int x = 0; x < boardWidth; x++)
        ss << ' ' << char('a' + x) << ' ';
    ss << '\n';

    for (int y = 0; y < boardHeight; y++) {
        ss << (y + 1 < 10 ? " " : "") << y + 1;
        for (int x = 0; x < boardWidth; x++) {
            Pos pos {x, y};
            if (pos == locations[PLAYER_1])
                ss << " 1 ";
            else if (pos == locations[PLAYER_2])
                ss << " 2 ";
            else if (get(pos) == BLOCKED)
                ss << " - ";
            else
                ss << " . ";
        }
        ss << '\n';
    }

    return ss.str();
}
