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

#include "arena/player.h"
#include "arena/tournament.h"
#include "config.h"
#include "game/board.h"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>

using namespace Arena;
using Evaluation::Heuristic;

namespace {

class TournamentTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        backupMessageMode   = Config::MessageMode;
        Config::MessageMode = MsgMode::NONE;

        options.numMatches     = 1;
        options.timeLimit      = 50;
        options.boardWidth     = 4;
        options.boardHeight    = 4;
        options.seed           = 12345;
        options.minimaxDepth   = 2;
        options.alphabetaDepth = 2;
    }
    void TearDown() override { Config::MessageMode = backupMessageMode; }

    MsgMode           backupMessageMode;
    TournamentOptions options;
};

}  // namespace

TEST_F(TournamentTest, CreatesReferenceOpponentsAndAgents)
{
    options.testHeuristics = {Heuristic::MOVE_DIFF_FROM_CENTER, Heuristic::RATIO_OF_MOVES};
    Tournament tournament(options);

    const char *opponentNames[] =
        {"Random", "MM_Null", "MM_Open", "MM_Improved", "AB_Null", "AB_Open", "AB_Improved"};
    ASSERT_EQ(tournament.opponents().size(), 7u);
    for (size_t i = 0; i < 7; i++)
        EXPECT_EQ(tournament.opponents()[i]->name(), opponentNames[i]);

    ASSERT_EQ(tournament.agents().size(), 3u);
    EXPECT_EQ(tournament.agents()[0]->name(), "ID_Improved");
    EXPECT_EQ(tournament.agents()[1]->name(), "ID_Center");
    EXPECT_EQ(tournament.agents()[2]->name(), "ID_Ratio");
}

TEST_F(TournamentTest, RejectsInvalidOptions)
{
    TournamentOptions bad = options;
    bad.numMatches        = 0;
    EXPECT_THROW(Tournament {bad}, std::invalid_argument);

    bad              = options;
    bad.openingMoves = -1;
    EXPECT_THROW(Tournament {bad}, std::invalid_argument);

    bad            = options;
    bad.boardWidth = 2;
    EXPECT_THROW(Tournament {bad}, std::invalid_argument);

    bad             = options;
    bad.boardHeight = MAX_BOARD_SIZE + 1;
    EXPECT_THROW(Tournament {bad}, std::invalid_argument);

    bad              = options;
    bad.minimaxDepth = 0;
    EXPECT_THROW(Tournament {bad}, std::invalid_argument);
}

TEST_F(TournamentTest, OpeningIsReproducibleWithSeed)
{
    options.boardWidth  = 7;
    options.boardHeight = 7;
    Tournament a(options);
    Tournament b(options);

    for (int i = 0; i < 5; i++) {
        Board openingA = a.makeOpening();
        Board openingB = b.makeOpening();
        EXPECT_EQ(openingA.ply(), 2);
        EXPECT_EQ(openingA.positionString(), openingB.positionString());
    }
}

TEST_F(TournamentTest, OpeningMovesCanBeDisabled)
{
    options.openingMoves = 0;
    Tournament tournament(options);
    EXPECT_EQ(tournament.makeOpening().ply(), 0);
}

TEST_F(TournamentTest, MatchPlaysBothSides)
{
    Tournament   tournament(options);
    RandomPlayer agent("Agent", 1);
    RandomPlayer opponent("Opponent", 2);

    MatchupResult result;
    tournament.playMatch(agent, opponent, result);
    EXPECT_EQ(result.games(), 2);

    result = tournament.playMatchup(agent, opponent);
    EXPECT_EQ(result.agentName, "Agent");
    EXPECT_EQ(result.opponentName, "Opponent");
    EXPECT_EQ(result.games(), 2 * options.numMatches);
    EXPECT_EQ(result.timeouts, 0);
    EXPECT_EQ(result.illegalMoves, 0);
}

TEST_F(TournamentTest, RunCoversEveryMatchup)
{
    options.testHeuristics = {Heuristic::MOVE_DIFF_WITH_SPACES};
    Tournament tournament(options);

    std::ostringstream       progress;
    std::vector<AgentResult> results = tournament.run(&progress);

    ASSERT_EQ(results.size(), 2u);
    for (const AgentResult &agentResult : results) {
        ASSERT_EQ(agentResult.matchups.size(), 7u);
        EXPECT_EQ(agentResult.games(), 7 * 2 * options.numMatches);
        EXPECT_GE(agentResult.winRate(), 0.0);
        EXPECT_LE(agentResult.winRate(), 100.0);
    }
    EXPECT_NE(progress.str().find("Evaluating: ID_Improved"), std::string::npos);
    EXPECT_NE(progress.str().find("Result:"), std::string::npos);

    std::ostringstream table;
    printResults(table, results);
    EXPECT_NE(table.str().find("Opponent"), std::string::npos);
    EXPECT_NE(table.str().find("AB_Improved"), std::string::npos);
    EXPECT_NE(table.str().find("Win Rate:"), std::string::npos);
}

TEST(AgentResultTest, WinRateSumsMatchups)
{
    AgentResult result;
    EXPECT_EQ(result.winRate(), 0.0);

    MatchupResult m1;
    m1.wins   = 3;
    m1.losses = 1;
    MatchupResult m2;
    m2.wins     = 1;
    m2.losses   = 3;
    m2.timeouts = 2;
    result.matchups = {m1, m2};

    EXPECT_EQ(result.wins(), 4);
    EXPECT_EQ(result.games(), 8);
    EXPECT_EQ(result.timeouts(), 2);
    EXPECT_DOUBLE_EQ(result.winRate(), 50.0);
}

TEST(AgentResultTest, PrintsWinRateWithTwoDecimals)
{
    AgentResult result;
    result.name = "ID_Improved";
    MatchupResult m;
    m.agentName    = "ID_Improved";
    m.opponentName = "Random";
    m.wins         = 2;
    m.losses       = 1;
    result.matchups.push_back(m);

    std::ostringstream out;
    printResults(out, {result});
    EXPECT_NE(out.str().find("Win Rate: 66.67%"), std::string::npos);
    EXPECT_EQ(out.str().find("timeouts"), std::string::npos);
}
