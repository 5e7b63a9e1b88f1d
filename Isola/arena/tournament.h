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

#include "../core/types.h"
#include "../core/utils.h"
#include "../eval/evaluator.h"

#include <memory>
#include <ostream>
#include <string>
#include <vector>

class Board;

namespace Arena {

class Player;

/// TournamentOptions stores how agents are evaluated against the reference opponents.
struct TournamentOptions
{
    int      numMatches     = 10;   /// Matches per agent and opponent, two games each
    Time     timeLimit      = 150;  /// Time limit of each turn in milliseconds
    int      boardWidth     = 7;
    int      boardHeight    = 7;
    int      openingMoves   = 2;    /// Random moves played before each match
    uint64_t seed           = 0;    /// Seed for openings and random players, 0 for time based
    int      minimaxDepth   = 3;    /// Search depth of the MM_ opponents
    int      alphabetaDepth = 5;    /// Search depth of the AB_ opponents
    Time     timerThreshold = 10;   /// Timer threshold of all search players

    /// Heuristics of the ID_ agents under test, besides ID_Improved
    std::vector<Evaluation::Heuristic> testHeuristics;

    /// Creates tournament options from the values in config.
    static TournamentOptions fromConfig();
};

/// MatchupResult accumulates the games of one agent against one opponent.
struct MatchupResult
{
    std::string agentName;
    std::string opponentName;
    int         wins             = 0;
    int         losses           = 0;
    int         timeouts         = 0;  /// Games the agent lost on time
    int         illegalMoves     = 0;  /// Games the agent lost by an illegal move
    int         opponentForfeits = 0;  /// Games the opponent lost on time or by an illegal move

    int games() const { return wins + losses; }
};

/// AgentResult collects all matchups of one agent under test.
struct AgentResult
{
    std::string                name;
    std::vector<MatchupResult> matchups;

    int    wins() const;
    int    games() const;
    int    timeouts() const;
    double winRate() const;  /// Percentage of games won
};

/// Tournament plays every agent under test against every reference opponent.
/// Reference opponents are Random, MM_Null, MM_Open, MM_Improved (fixed depth
/// minimax) and AB_Null, AB_Open, AB_Improved (fixed depth alpha-beta). Agents
/// under test are ID_Improved and one ID_ agent per test heuristic, all using
/// iterative deepening alpha-beta.
class Tournament
{
public:
    /// Throws std::invalid_argument if the options are out of range.
    explicit Tournament(const TournamentOptions &options);
    ~Tournament();

    /// Play all matches of all agents.
    /// @param progress Optional stream to print the result of each matchup.
    std::vector<AgentResult> run(std::ostream *progress = nullptr);

    /// Play numMatches matches between an agent and an opponent.
    MatchupResult playMatchup(Player &agent, Player &opponent);

    /// Play two games from the same random opening, the agent moving first in
    /// the first game and second in the other. Results are added to result.
    void playMatch(Player &agent, Player &opponent, MatchupResult &result);

    /// Create a board with openingMoves random moves played.
    Board makeOpening();

    const TournamentOptions                    &options() const { return opts; }
    const std::vector<std::unique_ptr<Player>> &opponents() const { return opponentList; }
    const std::vector<std::unique_ptr<Player>> &agents() const { return agentList; }

private:
    /// Play one game and record it from the agent's point of view.
    void playGame(Board &board, Player &agent, Player &opponent, Side agentSide, MatchupResult &result);

    TournamentOptions                    opts;
    PRNG                                 prng;
    std::vector<std::unique_ptr<Player>> opponentList;
    std::vector<std::unique_ptr<Player>> agentList;
};

/// Print the results table of a finished tournament.
void printResults(std::ostream &out, const std::vector<AgentResult> &results);

}  // namespace Arena
