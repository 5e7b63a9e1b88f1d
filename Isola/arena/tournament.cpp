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

#include "tournament.h"

#include "../config.h"
#include "../core/iohelper.h"
#include "../game/board.h"
#include "match.h"
#include "player.h"

#include <iomanip>
#include <stdexcept>

namespace {

using namespace Arena;

Search::SearchOptions fixedDepthOptions(SearchMethod          method,
                                        int                   depth,
                                        Evaluation::Heuristic heuristic,
                                        Time                  timerThreshold)
{
    Search::SearchOptions options;
    options.method         = method;
    options.iterative      = false;
    options.searchDepth    = depth;
    options.heuristic      = heuristic;
    options.timerThreshold = timerThreshold;
    options.silent         = true;
    return options;
}

Search::SearchOptions iterativeOptions(Evaluation::Heuristic heuristic, Time timerThreshold)
{
    Search::SearchOptions options;
    options.method         = SearchMethod::ALPHABETA;
    options.iterative      = true;
    options.maxDepth       = Config::MaxSearchDepth;
    options.heuristic      = heuristic;
    options.timerThreshold = timerThreshold;
    options.silent         = true;
    return options;
}

}  // namespace

namespace Arena {

TournamentOptions TournamentOptions::fromConfig()
{
    TournamentOptions options;
    options.numMatches     = Config::TournamentNumMatches;
    options.timeLimit      = Config::TournamentTimeLimit;
    options.boardWidth     = Config::TournamentBoardWidth;
    options.boardHeight    = Config::TournamentBoardHeight;
    options.openingMoves   = Config::TournamentOpeningMoves;
    options.minimaxDepth   = Config::TournamentMinimaxDepth;
    options.alphabetaDepth = Config::TournamentAlphaBetaDepth;
    options.timerThreshold = Config::TimerThreshold;
    options.testHeuristics = Config::TournamentTestHeuristics;
    return options;
}

// -------------------------------------------------

int AgentResult::wins() const
{
    int sum = 0;
    for (const MatchupResult &m : matchups)
        sum += m.wins;
    return sum;
}

int AgentResult::games() const
{
    int sum = 0;
    for (const MatchupResult &m : matchups)
        sum += m.games();
    return sum;
}

int AgentResult::timeouts() const
{
    int sum = 0;
    for (const MatchupResult &m : matchups)
        sum += m.timeouts;
    return sum;
}

double AgentResult::winRate() const
{
    int total = games();
    return total ? 100.0 * wins() / total : 0.0;
}

// -------------------------------------------------

Tournament::Tournament(const TournamentOptions &options)
    : opts(options)
    , prng(options.seed ? options.seed : uint64_t(now()))
{
    using Evaluation::Heuristic;

    if (opts.numMatches < 1)
        throw std::invalid_argument("number of matches must be at least 1");
    if (opts.openingMoves < 0)
        throw std::invalid_argument("number of opening moves must not be negative");
    if (opts.minimaxDepth < 1 || opts.alphabetaDepth < 1)
        throw std::invalid_argument("search depth of opponents must be at least 1");
    if (opts.boardWidth < MIN_BOARD_SIZE || opts.boardWidth > MAX_BOARD_SIZE
        || opts.boardHeight < MIN_BOARD_SIZE || opts.boardHeight > MAX_BOARD_SIZE)
        throw std::invalid_argument("board size must be in range ["
                                    + std::to_string(MIN_BOARD_SIZE) + ","
                                    + std::to_string(MAX_BOARD_SIZE) + "]");

    const Heuristic BaselineHeuristics[] = {Heuristic::NULL_SCORE,
                                            Heuristic::OPEN_MOVE,
                                            Heuristic::IMPROVED};

    opponentList.push_back(std::make_unique<RandomPlayer>("Random", prng()));
    for (Heuristic h : BaselineHeuristics)
        opponentList.push_back(std::make_unique<SearchPlayer>(
            std::string("MM_") + Evaluation::heuristicShortName(h),
            fixedDepthOptions(SearchMethod::MINIMAX, opts.minimaxDepth, h, opts.timerThreshold)));
    for (Heuristic h : BaselineHeuristics)
        opponentList.push_back(std::make_unique<SearchPlayer>(
            std::string("AB_") + Evaluation::heuristicShortName(h),
            fixedDepthOptions(SearchMethod::ALPHABETA, opts.alphabetaDepth, h, opts.timerThreshold)));

    agentList.push_back(std::make_unique<SearchPlayer>(
        "ID_Improved",
        iterativeOptions(Heuristic::IMPROVED, opts.timerThreshold)));
    for (Heuristic h : opts.testHeuristics)
        agentList.push_back(
            std::make_unique<SearchPlayer>(std::string("ID_") + Evaluation::heuristicShortName(h),
                                           iterativeOptions(h, opts.timerThreshold)));
}

Tournament::~Tournament() = default;

std::vector<AgentResult> Tournament::run(std::ostream *progress)
{
    std::vector<AgentResult> results;

    for (auto &agent : agentList) {
        AgentResult agentResult;
        agentResult.name = agent->name();

        if (progress)
            *progress << "Evaluating: " << agent->name() << std::endl;

        for (size_t i = 0; i < opponentList.size(); i++) {
            MatchupResult m = playMatchup(*agent, *opponentList[i]);

            if (progress)
                *progress << "  Match " << i + 1 << ": " << std::setw(12) << m.agentName
                          << " vs " << std::setw(12) << m.opponentName << " | Result: " << m.wins
                          << " to " << m.losses << std::endl;

            agentResult.matchups.push_back(std::move(m));
        }

        results.push_back(std::move(agentResult));
    }

    return results;
}

MatchupResult Tournament::playMatchup(Player &agent, Player &opponent)
{
    MatchupResult result;
    result.agentName    = agent.name();
    result.opponentName = opponent.name();

    for (int i = 0; i < opts.numMatches; i++)
        playMatch(agent, opponent, result);

    return result;
}

void Tournament::playMatch(Player &agent, Player &opponent, MatchupResult &result)
{
    Board opening = makeOpening();

    for (Side agentSide : {PLAYER_1, PLAYER_2}) {
        Board board = opening;
        playGame(board, agent, opponent, agentSide, result);
    }
}

Board Tournament::makeOpening()
{
    Board board(opts.boardWidth, opts.boardHeight);

    for (int i = 0; i < opts.openingMoves; i++) {
        std::vector<Pos> moves = board.legalMoves();
        if (moves.empty())
            break;
        board.move(moves[prng() % moves.size()]);
    }

    return board;
}

void Tournament::playGame(Board         &board,
                          Player        &agent,
                          Player        &opponent,
                          Side           agentSide,
                          MatchupResult &result)
{
    GameRecord record = agentSide == PLAYER_1
                            ? Arena::playGame(board, agent, opponent, opts.timeLimit)
                            : Arena::playGame(board, opponent, agent, opts.timeLimit);
    bool forfeit = record.termination == Termination::TIMEOUT
                   || record.termination == Termination::ILLEGAL_MOVE;

    if (record.winner == agentSide) {
        result.wins++;
        if (forfeit)
            result.opponentForfeits++;
    }
    else {
        result.losses++;
        if (record.termination == Termination::TIMEOUT)
            result.timeouts++;
        else if (record.termination == Termination::ILLEGAL_MOVE)
            result.illegalMoves++;
    }

    DEBUGL(record.winnerName << " beats " << record.loserName << " by " << record.termination
                             << " | " << board.positionString());
}

void printResults(std::ostream &out, const std::vector<AgentResult> &results)
{
    out << std::left << std::setw(14) << "Agent" << std::setw(14) << "Opponent" << std::right
        << std::setw(6) << "Won" << std::setw(6) << "Lost" << std::setw(9) << "Timeout"
        << std::setw(9) << "Illegal" << '\n';

    for (const AgentResult &agentResult : results) {
        for (const MatchupResult &m : agentResult.matchups)
            out << std::left << std::setw(14) << m.agentName << std::setw(14) << m.opponentName
                << std::right << std::setw(6) << m.wins << std::setw(6) << m.losses
                << std::setw(9) << m.timeouts << std::setw(9) << m.illegalMoves << '\n';

        out << std::left << std::setw(14) << agentResult.name << "Win Rate: " << std::fixed
            << std::setprecision(2) << agentResult.winRate() << "%" << std::right << '\n';
        out.unsetf(std::ios::fixed);
        out << '\n';
    }

    int totalTimeouts = 0;
    for (const AgentResult &agentResult : results)
        totalTimeouts += agentResult.timeouts();
    if (totalTimeouts)
        out << "There were " << totalTimeouts
            << " timeouts of agents under test during the tournament." << '\n';

    out << std::flush;
}

}  // namespace Arena
