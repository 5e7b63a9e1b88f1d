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
#include "../core/utils.h"
#include "../eval/evaluator.h"
#include "../search/agent.h"
#include "../search/searchcommon.h"

#include <istream>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

class Board;

namespace Search {
class TimeControl;
}

namespace Arena {

/// Player is the base class of everything that can take part in a game.
class Player
{
public:
    explicit Player(std::string name) : playerName(std::move(name)) {}
    virtual ~Player() = default;

    const std::string &name() const { return playerName; }

    /// Choose a move for the side to move of the board.
    /// @param board Current game state. The player can not modify it.
    /// @param legalMoves Legal moves of the side to move, never empty.
    /// @param timectl Timer of this turn. Returning after it ran out forfeits the game.
    /// @return The chosen move. Pos::NONE or any move not in legalMoves forfeits the game.
    virtual Pos getMove(const Board                 &board,
                        const std::vector<Pos>      &legalMoves,
                        const Search::TimeControl &timectl) = 0;

private:
    std::string playerName;
};

/// RandomPlayer picks a legal move uniformly at random.
class RandomPlayer : public Player
{
public:
    RandomPlayer(std::string name, uint64_t seed) : Player(std::move(name)), prng(seed) {}

    Pos getMove(const Board                 &board,
                const std::vector<Pos>      &legalMoves,
                const Search::TimeControl &timectl) override;

private:
    PRNG prng;
};

/// GreedyPlayer picks the move whose resulting position scores best for
/// itself under a heuristic, looking one ply ahead only.
class GreedyPlayer : public Player
{
public:
    GreedyPlayer(std::string name, Evaluation::Heuristic heuristic)
        : Player(std::move(name))
        , heuristic(heuristic)
    {}

    Pos getMove(const Board                 &board,
                const std::vector<Pos>      &legalMoves,
                const Search::TimeControl &timectl) override;

private:
    Evaluation::Heuristic heuristic;
};

/// HumanPlayer reads moves (such as "d4") from an input stream and prompts
/// on an output stream. Input that is not a legal move is asked again.
/// End of input forfeits the game.
class HumanPlayer : public Player
{
public:
    HumanPlayer(std::string name, std::istream &in, std::ostream &out)
        : Player(std::move(name))
        , in(in)
        , out(out)
    {}

    Pos getMove(const Board                 &board,
                const std::vector<Pos>      &legalMoves,
                const Search::TimeControl &timectl) override;

private:
    std::istream &in;
    std::ostream &out;
};

/// SearchPlayer chooses moves with a search agent. When a turn is not
/// limited by the game, it limits itself to its own turn time (if positive).
class SearchPlayer : public Player
{
public:
    SearchPlayer(std::string name, const Search::SearchOptions &options, Time ownTurnTime = 0)
        : Player(std::move(name))
        , agent(options)
        , ownTurnTime(ownTurnTime)
    {}

    Pos getMove(const Board                 &board,
                const std::vector<Pos>      &legalMoves,
                const Search::TimeControl &timectl) override;

    /// Result of the last search, for statistics.
    const Search::SearchResult &lastResult() const { return result; }

private:
    Search::SearchAgent  agent;
    Search::SearchResult result;
    Time                 ownTurnTime;
};

}  // namespace Arena
