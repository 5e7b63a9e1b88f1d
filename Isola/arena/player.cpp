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

#include "player.h"

#include "../core/iohelper.h"
#include "../game/board.h"
#include "../search/timecontrol.h"

#include <cassert>

namespace Arena {

Pos RandomPlayer::getMove(const Board                 &board,
                          const std::vector<Pos>      &legalMoves,
                          const Search::TimeControl &timectl)
{
    if (legalMoves.empty())
        return Pos::NONE;

    return legalMoves[prng() % legalMoves.size()];
}

Pos GreedyPlayer::getMove(const Board                 &board,
                          const std::vector<Pos>      &legalMoves,
                          const Search::TimeControl &timectl)
{
    if (legalMoves.empty())
        return Pos::NONE;

    Side  self      = board.sideToMove();
    Pos   bestMove  = legalMoves.front();
    Value bestValue = VALUE_LOSS;

    for (Pos move : legalMoves) {
        Value value = Evaluation::evaluate(board.forecastMove(move), self, heuristic);
        if (value > bestValue) {
            bestValue = value;
            bestMove  = move;
        }
    }

    return bestMove;
}

Pos HumanPlayer::getMove(const Board                 &board,
                         const std::vector<Pos>      &legalMoves,
                         const Search::TimeControl &timectl)
{
    out << board.trace();
    out << "Legal moves: " << MovesText {legalMoves} << std::endl;

    std::string line;
    while (true) {
        out << board.sideToMove() << " (" << name() << ") move: " << std::flush;
        if (!std::getline(in, line))
            return Pos::NONE;

        trimInplace(line);
        if (line.empty())
            continue;

        Pos move = parseCoord(line);
        if (move != Pos::NONE && contains(legalMoves, move))
            return move;

        out << "Illegal move " << line << ", try again." << std::endl;
    }
}

Pos SearchPlayer::getMove(const Board                 &board,
                          const std::vector<Pos>      &legalMoves,
                          const Search::TimeControl &timectl)
{
    if (timectl.unlimited() && ownTurnTime > 0)
        result = agent.think(board, Search::TimeControl(ownTurnTime));
    else
        result = agent.think(board, timectl);
    assert(result.bestMove == Pos::NONE || contains(legalMoves, result.bestMove));
    return result.bestMove;
}

}  // namespace Arena
