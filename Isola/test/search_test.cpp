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

#include "config.h"
#include "eval/evaluator.h"
#include "game/board.h"
#include "game/movegen.h"
#include "search/agent.h"
#include "search/searchcommon.h"
#include "search/timecontrol.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

using Evaluation::Heuristic;
using namespace Search;

namespace {

Board playMoves(int width, int height, const std::vector<Pos> &moves)
{
    Board board(width, height);
    for (Pos move : moves)
        board.move(move);
    return board;
}

SearchOptions fixedDepth(SearchMethod method, int depth, Heuristic heuristic)
{
    SearchOptions options;
    options.method      = method;
    options.iterative   = false;
    options.searchDepth = depth;
    options.heuristic   = heuristic;
    options.silent      = true;
    return options;
}

class SearchTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        backupMessageMode   = Config::MessageMode;
        Config::MessageMode = MsgMode::NONE;
    }
    void TearDown() override { Config::MessageMode = backupMessageMode; }

    MsgMode backupMessageMode;
};

}  // namespace

TEST(TimeControlTest, ZeroTurnTimeIsUnlimited)
{
    TimeControl timectl(0);

    EXPECT_TRUE(timectl.unlimited());
    EXPECT_FALSE(timectl.isTimeup(1000000));
    EXPECT_GT(timectl.timeLeft(), 1000000);
}

TEST(TimeControlTest, TimeupBelowThreshold)
{
    TimeControl timectl(100);

    EXPECT_FALSE(timectl.unlimited());
    EXPECT_LE(timectl.timeLeft(), 100);
    EXPECT_TRUE(timectl.isTimeup(101));
    EXPECT_FALSE(timectl.isTimeup(-1000));
}

TEST_F(SearchTest, NoLegalMoveReturnsNone)
{
    Board       board = playMoves(3, 3, {Pos(1, 1), Pos(0, 0)});
    SearchAgent agent(fixedDepth(SearchMethod::ALPHABETA, 3, Heuristic::IMPROVED));

    SearchResult result = agent.think(board, TimeControl(0));
    EXPECT_EQ(result.bestMove, Pos::NONE);
    EXPECT_EQ(result.value, VALUE_LOSS);
}

TEST_F(SearchTest, DepthOnePicksBestImmediateScore)
{
    // Player 1 on d4, player 2 on c3, player 1 to move
    Board       board = playMoves(7, 7, {Pos(3, 3), Pos(2, 2)});
    SearchAgent agent(fixedDepth(SearchMethod::MINIMAX, 1, Heuristic::IMPROVED));

    SearchResult result = agent.think(board, TimeControl(0));

    // Scan all moves by hand
    Value best = VALUE_LOSS;
    for (Pos move : board.legalMoves())
        best = std::max(best, Evaluation::improvedScore(board.forecastMove(move), PLAYER_1));

    EXPECT_EQ(result.depth, 1);
    EXPECT_EQ(result.value, best);
    EXPECT_EQ(Evaluation::improvedScore(board.forecastMove(result.bestMove), PLAYER_1), best);
}

TEST_F(SearchTest, TiesGoToFirstMove)
{
    // The null heuristic scores every undecided position as zero
    Board       board = playMoves(7, 7, {Pos(3, 3), Pos(2, 2)});
    SearchAgent agent(fixedDepth(SearchMethod::ALPHABETA, 2, Heuristic::NULL_SCORE));

    SearchResult result = agent.think(board, TimeControl(0));
    EXPECT_EQ(result.value, VALUE_ZERO);
    EXPECT_EQ(result.bestMove, board.legalMoves().front());
}

TEST_F(SearchTest, LostPositionStillReturnsMove)
{
    // Player 1 on c1 can only go to a2, then player 2 takes c3 and player 1
    // is left without a move.
    Board board = playMoves(3, 3, {Pos(0, 0), Pos(2, 1)});
    board.move(Pos(1, 2));
    board.move(Pos(0, 2));
    board.move(Pos(2, 0));
    board.move(Pos(1, 0));
    ASSERT_EQ(board.legalMoves().size(), 1u);

    for (SearchMethod method : {SearchMethod::MINIMAX, SearchMethod::ALPHABETA}) {
        SearchAgent  agent(fixedDepth(method, 4, Heuristic::IMPROVED));
        SearchResult result = agent.think(board, TimeControl(0));
        EXPECT_EQ(result.bestMove, Pos(0, 1));
        EXPECT_EQ(result.value, VALUE_LOSS);
    }
}

TEST_F(SearchTest, AlphaBetaAgreesWithMinimax)
{
    const std::vector<std::vector<Pos>> positions = {
        {Pos(3, 3), Pos(2, 2)},
        {Pos(3, 3), Pos(2, 2), Pos(1, 4), Pos(4, 1)},
        {Pos(0, 0), Pos(4, 4)},
        {Pos(2, 1), Pos(5, 5), Pos(0, 2), Pos(3, 4)},
    };
    const Heuristic heuristics[] = {Heuristic::OPEN_MOVE,
                                    Heuristic::IMPROVED,
                                    Heuristic::MOVE_DIFF_WITH_SPACES,
                                    Heuristic::MOVE_DIFF_FROM_CENTER,
                                    Heuristic::RATIO_OF_MOVES};

    for (const auto &moves : positions) {
        Board board = playMoves(7, 7, moves);
        for (Heuristic h : heuristics) {
            for (int depth = 1; depth <= 4; depth++) {
                SearchAgent mm(fixedDepth(SearchMethod::MINIMAX, depth, h));
                SearchAgent ab(fixedDepth(SearchMethod::ALPHABETA, depth, h));

                SearchResult mmResult = mm.think(board, TimeControl(0));
                SearchResult abResult = ab.think(board, TimeControl(0));

                EXPECT_EQ(mmResult.value, abResult.value)
                    << board.positionString() << " " << h << " depth " << depth;
                EXPECT_EQ(mmResult.bestMove, abResult.bestMove)
                    << board.positionString() << " " << h << " depth " << depth;
                EXPECT_LE(abResult.nodes, mmResult.nodes);
            }
        }
    }
}

TEST_F(SearchTest, SearchDoesNotModifyBoard)
{
    Board       board  = playMoves(7, 7, {Pos(3, 3), Pos(2, 2)});
    std::string before = board.trace();

    SearchAgent agent(fixedDepth(SearchMethod::ALPHABETA, 4, Heuristic::MOVE_DIFF_FROM_CENTER));
    agent.think(board, TimeControl(0));

    EXPECT_EQ(board.trace(), before);
    EXPECT_EQ(board.ply(), 2);
}

TEST_F(SearchTest, TimeoutFallsBackToFirstLegalMove)
{
    Board board = playMoves(7, 7, {Pos(3, 3), Pos(2, 2)});

    SearchOptions options = fixedDepth(SearchMethod::ALPHABETA, 5, Heuristic::IMPROVED);
    options.iterative      = true;
    options.timerThreshold = 1000;
    SearchAgent agent(options);

    // Less time than the threshold: not even depth 1 can run
    SearchResult result = agent.think(board, TimeControl(50));
    EXPECT_TRUE(result.timeout);
    EXPECT_EQ(result.depth, 0);
    EXPECT_EQ(result.bestMove, board.legalMoves().front());
}

TEST_F(SearchTest, IterativeDeepeningReturnsInTime)
{
    Board board = playMoves(7, 7, {Pos(3, 3), Pos(2, 2)});

    SearchOptions options  = fixedDepth(SearchMethod::ALPHABETA, 1, Heuristic::IMPROVED);
    options.iterative      = true;
    options.timerThreshold = 10;
    SearchAgent agent(options);

    TimeControl  timectl(150);
    SearchResult result = agent.think(board, timectl);

    EXPECT_GE(timectl.timeLeft(), 0);
    EXPECT_GE(result.depth, 1);
    EXPECT_TRUE(MoveList(board, PLAYER_1).contains(result.bestMove));
}

TEST_F(SearchTest, IterativeDeepeningStopsWhenTreeIsExhausted)
{
    SearchOptions options = fixedDepth(SearchMethod::ALPHABETA, 1, Heuristic::NULL_SCORE);
    options.iterative     = true;
    SearchAgent agent(options);

    // Without a time limit this only returns because the tree is finite
    Board        board  = playMoves(4, 4, {Pos(0, 0), Pos(3, 3)});
    SearchResult result = agent.think(board, TimeControl(0));

    EXPECT_FALSE(result.timeout);
    EXPECT_LE(result.depth, 14);
    EXPECT_TRUE(isDecisive(result.value));
    EXPECT_TRUE(board.isLegal(result.bestMove));
}

TEST_F(SearchTest, MaxDepthLimitsIterations)
{
    SearchOptions options = fixedDepth(SearchMethod::MINIMAX, 1, Heuristic::IMPROVED);
    options.iterative     = true;
    options.maxDepth      = 2;
    SearchAgent agent(options);

    Board        board  = playMoves(7, 7, {Pos(3, 3), Pos(2, 2)});
    SearchResult result = agent.think(board, TimeControl(0));
    EXPECT_EQ(result.depth, 2);
}

TEST(SearchAgentTest, RejectsInvalidDepth)
{
    SearchOptions options;
    options.searchDepth = 0;
    EXPECT_THROW(SearchAgent {options}, std::invalid_argument);

    options.searchDepth = 3;
    options.maxDepth    = 0;
    EXPECT_THROW(SearchAgent {options}, std::invalid_argument);
}
