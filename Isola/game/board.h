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

#include <cassert>
#include <string>
#include <vector>

#define FOR_EVERY_BLANK_POS(board, pos)                                  \
    for (Pos pos = (board)->startPos(); pos <= (board)->endPos(); pos++) \
        if ((board)->isBlank(pos))

/// StateInfo struct records what is needed to take back one ply.
struct StateInfo
{
    Pos lastMove;
    Pos prevLocation;
};

/// Board class represents an Isolation position: the blocked cells, the
/// location of both players and the side to move. The whole move history
/// is kept so that move() can be reverted by undo() during search.
class Board
{
public:
    /// Creates an empty board with the given size.
    /// @param width Number of columns, in range [MIN_BOARD_SIZE, MAX_BOARD_SIZE].
    /// @param height Number of rows, in range [MIN_BOARD_SIZE, MAX_BOARD_SIZE].
    Board(int width, int height);
    Board(const Board &)            = default;
    Board &operator=(const Board &) = default;

    // ------------------------------------------------------------------------
    // board modifier

    /// Initialize the board to an empty board state, with player 1 to move.
    void newGame();

    /// Make move for the side to move and block the destination cell.
    /// @param pos Pos to move to. Must be a legal move of the side to move.
    void move(Pos pos);

    /// Undo the last move and rollback the board state.
    void undo();

    /// Returns a copy of this board with the move applied. This board is not changed.
    Board forecastMove(Pos pos) const;

    // ------------------------------------------------------------------------
    // pos-specific info queries

    /// Get state of the cell at pos on board.
    inline CellState get(Pos pos) const
    {
        assert(pos >= 0 && pos < FULL_BOARD_CELL_COUNT);
        return cells[pos];
    }

    /// Check if the pos is in the region of current board size.
    bool isInBoard(Pos pos) const { return pos.isInBoard(boardWidth, boardHeight); }

    /// Check if the pos is on a blank cell.
    /// @pos The pos to query, which is assumed to meet 'pos.valid() == true'.
    bool isBlank(Pos pos) const { return get(pos) == BLANK; }

    /// Check if the pos is a legal move of the given side.
    bool isLegal(Side side, Pos pos) const;

    /// Check if the pos is a legal move of the side to move.
    bool isLegal(Pos pos) const { return isLegal(currentSide, pos); }

    // ------------------------------------------------------------------------
    // general board info queries

    int  width() const { return boardWidth; }
    int  height() const { return boardHeight; }
    int  cellCount() const { return boardCellCount; }
    Pos  centerPos() const { return {boardWidth / 2, boardHeight / 2}; }
    Pos  startPos() const { return {0, 0}; }
    Pos  endPos() const { return {boardWidth - 1, boardHeight - 1}; }

    // ------------------------------------------------------------------------
    // current board state queries

    int  ply() const { return moveCount; }
    int  blankCount() const { return numBlanks; }
    Side sideToMove() const { return currentSide; }

    /// Get the current location of one side, or Pos::NONE if it has not moved yet.
    Pos location(Side side) const { return locations[side]; }

    /// List all legal moves of one side.
    std::vector<Pos> legalMoves(Side side) const;
    /// List all legal moves of the side to move.
    std::vector<Pos> legalMoves() const { return legalMoves(currentSide); }
    /// List all blank cells on board, in row-major order.
    std::vector<Pos> blankSpaces() const;

    /// A side loses when it is to move and has no legal move.
    bool isLoser(Side side) const;
    /// A side wins when its opponent is to move and has no legal move.
    bool isWinner(Side side) const;
    /// Returns VALUE_WIN or VALUE_LOSS if the game is decided, otherwise VALUE_ZERO.
    Value utility(Side side) const;

    // ------------------------------------------------------------------------
    // history board state queries

    /// Get history move pos according to move index.
    /// @param moveIndex Index of the move, in range [0, ply()).
    inline Pos getHistoryMove(int moveIndex) const
    {
        assert(moveIndex >= 0 && moveIndex < moveCount);
        return stateInfos[moveIndex].lastMove;
    }

    /// Get the last move played, or Pos::NONE on an empty board.
    Pos getLastMove() const { return moveCount ? stateInfos[moveCount - 1].lastMove : Pos::NONE; }

    // ------------------------------------------------------------------------
    // miscellaneous

    /// Construct a position string from current board state.
    /// Position string example: `d4c3f5`.
    std::string positionString() const;

    /// Draw the current board state as text. Player locations are shown
    /// as 1 and 2, blocked cells as '-'.
    std::string trace() const;

private:
    /// The cells array of the board. It is larger than the actual board size,
    /// so knight jumps from any board cell never index out of range.
    CellState cells[FULL_BOARD_CELL_COUNT];

    int                    boardWidth;          /// Number of columns of the board
    int                    boardHeight;         /// Number of rows of the board
    int                    boardCellCount;      /// Number of cells of the board
    int                    moveCount;           /// Number of moves played
    int                    numBlanks;           /// Number of blank cells
    Side                   currentSide;         /// The current side to move
    Pos                    locations[SIDE_NB];  /// Current location of both sides
    std::vector<StateInfo> stateInfos;          /// Move history
};
