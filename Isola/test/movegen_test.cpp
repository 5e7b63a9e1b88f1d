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

#include "game/board.h"
#include "game/movegen.h"

#include <gtest/gtest.h>

#include <vector>

TEST(MovegenTest, PlacementListsBlankCellsInRowMajorOrder)
{
    Board board(4, 3);
    board.move(Pos(1, 0));

    MoveList moves(board, PLAYER_2);
    ASSERT_EQ(moves.size(), 11u);
    EXPECT_EQ(moves[0], Pos(0, 0));
    EXPECT_EQ(moves[1], Pos(2, 0));
    EXPECT_EQ(moves[3], Pos(0, 1));
    EXPECT_FALSE(moves.contains(Pos(1, 0)));
    EXPECT_EQ(countMoves(board, PLAYER_2), 11);
}

TEST(MovegenTest, KnightJumpsFollowFixedOrder)
{
    Board board(7, 7);
    board.move(Pos(3, 3));

    const std::vector<Pos> expected = {
        Pos(2, 1),  // (-2,-1)
        Pos(4, 1),  // (-2, 1)
        Pos(1, 2),  // (-1,-2)
        Pos(5, 2),  // (-1, 2)
        Pos(1, 4),  // ( 1,-2)
        Pos(5, 4),  // ( 1, 2)
        Pos(2, 5),  // ( 2,-1)
        Pos(4, 5),  // ( 2, 1)
    };
    EXPECT_EQ(MoveList(board, PLAYER_1).toVector(), expected);
    EXPECT_EQ(countMoves(board, PLAYER_1), 8);
}

TEST(MovegenTest, KnightJumpsStayInsideBoard)
{
    Board board(7, 7);
    board.move(Pos(0, 0));

    const std::vector<Pos> expected = {Pos(2, 1), Pos(1, 2)};
    EXPECT_EQ(board.legalMoves(PLAYER_1), expected);

    board.move(Pos(6, 6));
    const std::vector<Pos> expected2 = {Pos(5, 4), Pos(4, 5)};
    EXPECT_EQ(board.legalMoves(PLAYER_2), expected2);
}

TEST(MovegenTest, BlockedCellsAreSkipped)
{
    Board board(7, 7);
    board.move(Pos(3, 3));
    board.move(Pos(2, 1));  // player 2 takes one jump of player 1

    MoveList moves(board, PLAYER_1);
    EXPECT_EQ(moves.size(), 7u);
    EXPECT_FALSE(moves.contains(Pos(2, 1)));
    EXPECT_EQ(countMoves(board, PLAYER_1), 7);
}

TEST(MovegenTest, CountMatchesListOnEveryPly)
{
    Board board(5, 5);
    // Play the first legal move until the game ends
    while (true) {
        for (Side side : {PLAYER_1, PLAYER_2})
            EXPECT_EQ(countMoves(board, side), (int)MoveList(board, side).size());

        MoveList moves(board, board.sideToMove());
        if (moves.empty())
            break;
        board.move(moves[0]);
    }

    EXPECT_TRUE(board.isLoser(board.sideToMove()));
}
