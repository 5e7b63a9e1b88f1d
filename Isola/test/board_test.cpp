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

#include "core/iohelper.h"
#include "game/board.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

namespace {

Board playMoves(int width, int height, const std::vector<Pos> &moves)
{
    Board board(width, height);
    for (Pos move : moves) {
        EXPECT_TRUE(board.isLegal(move)) << "illegal move " << move;
        board.move(move);
    }
    return board;
}

}  // namespace

TEST(BoardTest, NewBoardIsEmpty)
{
    Board board(7, 7);

    EXPECT_EQ(board.width(), 7);
    EXPECT_EQ(board.height(), 7);
    EXPECT_EQ(board.cellCount(), 49);
    EXPECT_EQ(board.blankCount(), 49);
    EXPECT_EQ(board.ply(), 0);
    EXPECT_EQ(board.sideToMove(), PLAYER_1);
    EXPECT_EQ(board.location(PLAYER_1), Pos::NONE);
    EXPECT_EQ(board.location(PLAYER_2), Pos::NONE);
    EXPECT_EQ(board.getLastMove(), Pos::NONE);
    EXPECT_EQ(board.legalMoves().size(), 49u);
    EXPECT_EQ(board.blankSpaces().size(), 49u);
}

TEST(BoardTest, RejectsUnsupportedSizes)
{
    EXPECT_THROW(Board(2, 7), std::invalid_argument);
    EXPECT_THROW(Board(7, 2), std::invalid_argument);
    EXPECT_THROW(Board(MAX_BOARD_SIZE + 1, 7), std::invalid_argument);
    EXPECT_NO_THROW(Board(MAX_BOARD_SIZE, MIN_BOARD_SIZE));
}

TEST(BoardTest, CenterPosRoundsDown)
{
    EXPECT_EQ(Board(7, 7).centerPos(), Pos(3, 3));
    EXPECT_EQ(Board(8, 5).centerPos(), Pos(4, 2));
}

TEST(BoardTest, FirstMoveMayGoAnywhere)
{
    Board board(7, 7);
    board.move(Pos(0, 0));

    EXPECT_EQ(board.sideToMove(), PLAYER_2);
    EXPECT_EQ(board.location(PLAYER_1), Pos(0, 0));
    EXPECT_EQ(board.get(Pos(0, 0)), BLOCKED);
    EXPECT_EQ(board.blankCount(), 48);

    // Player 2 is not placed yet, so it may take any blank cell but the occupied one
    EXPECT_EQ(board.legalMoves().size(), 48u);
    EXPECT_FALSE(board.isLegal(Pos(0, 0)));
    EXPECT_TRUE(board.isLegal(Pos(6, 6)));
}

TEST(BoardTest, PlacedSideMovesLikeKnight)
{
    Board board = playMoves(7, 7, {Pos(3, 3), Pos(2, 2)});

    EXPECT_EQ(board.sideToMove(), PLAYER_1);
    EXPECT_TRUE(board.isLegal(Pos(2, 1)));
    EXPECT_TRUE(board.isLegal(Pos(5, 4)));
    EXPECT_FALSE(board.isLegal(Pos(3, 4)));
    EXPECT_FALSE(board.isLegal(Pos(4, 4)));
    EXPECT_FALSE(board.isLegal(Pos(2, 2)));  // occupied by player 2
    EXPECT_EQ(board.legalMoves(PLAYER_1).size(), 8u);
    EXPECT_EQ(board.legalMoves(PLAYER_2).size(), 8u);
}

TEST(BoardTest, VisitedCellsStayBlocked)
{
    Board board = playMoves(7, 7, {Pos(3, 3), Pos(2, 2), Pos(1, 4)});

    EXPECT_EQ(board.get(Pos(3, 3)), BLOCKED);
    EXPECT_EQ(board.location(PLAYER_1), Pos(1, 4));
    EXPECT_EQ(board.blankCount() + board.ply(), board.cellCount());

    // b5 is a knight jump of player 2, but is taken by player 1
    EXPECT_FALSE(board.isLegal(PLAYER_2, Pos(1, 4)));
    EXPECT_TRUE(board.isLegal(PLAYER_2, Pos(3, 4)));
}

TEST(BoardTest, UndoRestoresPreviousState)
{
    Board board = playMoves(7, 7, {Pos(3, 3), Pos(2, 2)});
    std::string before = board.trace();

    board.move(Pos(1, 4));
    board.move(Pos(4, 1));
    board.undo();
    board.undo();

    EXPECT_EQ(board.trace(), before);
    EXPECT_EQ(board.ply(), 2);
    EXPECT_EQ(board.blankCount(), 47);
    EXPECT_EQ(board.sideToMove(), PLAYER_1);
    EXPECT_EQ(board.location(PLAYER_1), Pos(3, 3));
    EXPECT_EQ(board.location(PLAYER_2), Pos(2, 2));
    EXPECT_TRUE(board.isBlank(Pos(1, 4)));

    board.undo();
    board.undo();
    EXPECT_EQ(board.location(PLAYER_1), Pos::NONE);
    EXPECT_EQ(board.blankCount(), 49);
}

TEST(BoardTest, ForecastMoveLeavesBoardUnchanged)
{
    Board board = playMoves(7, 7, {Pos(3, 3), Pos(2, 2)});
    Board next  = board.forecastMove(Pos(1, 4));

    EXPECT_EQ(board.ply(), 2);
    EXPECT_EQ(board.location(PLAYER_1), Pos(3, 3));
    EXPECT_TRUE(board.isBlank(Pos(1, 4)));

    EXPECT_EQ(next.ply(), 3);
    EXPECT_EQ(next.location(PLAYER_1), Pos(1, 4));
    EXPECT_EQ(next.sideToMove(), PLAYER_2);
}

TEST(BoardTest, SideToMoveWithoutMovesLoses)
{
    // On a 3x3 board the center has no knight move at all
    Board board = playMoves(3, 3, {Pos(1, 1), Pos(0, 0)});

    EXPECT_TRUE(board.legalMoves().empty());
    EXPECT_TRUE(board.isLoser(PLAYER_1));
    EXPECT_FALSE(board.isWinner(PLAYER_1));
    EXPECT_TRUE(board.isWinner(PLAYER_2));
    EXPECT_FALSE(board.isLoser(PLAYER_2));
    EXPECT_EQ(board.utility(PLAYER_1), VALUE_LOSS);
    EXPECT_EQ(board.utility(PLAYER_2), VALUE_WIN);
}

TEST(BoardTest, UtilityIsZeroWhileGameGoesOn)
{
    Board board = playMoves(7, 7, {Pos(3, 3), Pos(2, 2)});

    EXPECT_FALSE(board.isLoser(PLAYER_1));
    EXPECT_FALSE(board.isWinner(PLAYER_2));
    EXPECT_EQ(board.utility(PLAYER_1), VALUE_ZERO);
    EXPECT_EQ(board.utility(PLAYER_2), VALUE_ZERO);
}

TEST(BoardTest, PositionStringListsHistory)
{
    Board board = playMoves(7, 7, {Pos(3, 3), Pos(2, 2), Pos(1, 4)});

    EXPECT_EQ(board.positionString(), "d4c3b5");
    EXPECT_EQ(board.getHistoryMove(1), Pos(2, 2));
    EXPECT_EQ(board.getLastMove(), Pos(1, 4));
}

TEST(BoardTest, TraceDrawsPlayersAndBlockedCells)
{
    Board board = playMoves(3, 3, {Pos(0, 0), Pos(2, 1), Pos(1, 2)});

    const std::string expected = "   a  b  c \n"
                                 " 1 -  .  . \n"
                                 " 2 .  .  2 \n"
                                 " 3 .  1  . \n";
    EXPECT_EQ(board.trace(), expected);
}

TEST(CoordTest, ParseCoordAcceptsLetterAndRow)
{
    EXPECT_EQ(parseCoord("a1"), Pos(0, 0));
    EXPECT_EQ(parseCoord("D4"), Pos(3, 3));
    EXPECT_EQ(parseCoord("z26"), Pos(25, 25));
}

TEST(CoordTest, ParseCoordRejectsMalformedText)
{
    EXPECT_EQ(parseCoord("a"), Pos::NONE);
    EXPECT_EQ(parseCoord("4d"), Pos::NONE);
    EXPECT_EQ(parseCoord("a0"), Pos::NONE);
    EXPECT_EQ(parseCoord("a27"), Pos::NONE);
    EXPECT_EQ(parseCoord("a100"), Pos::NONE);
    EXPECT_EQ(parseCoord("a99999999999"), Pos::NONE);
    EXPECT_EQ(parseCoord("a99999999999999999999999"), Pos::NONE);
}
