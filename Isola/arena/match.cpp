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

#include "match.h"

#include "../game/board.h"
#include "../search/timecontrol.h"
#include "player.h"

namespace Arena {

GameRecord playGame(Board              &board,
                    Player             &player1,
                    Player             &player2,
                    Time                timeLimit,
                    const MoveCallback &onMove)
{
    Player    *players[SIDE_NB] = {&player1, &player2};
    GameRecord record;

    auto finish = [&](Termination termination, Pos lastMove) {
        record.loser       = board.sideToMove();
        record.winner      = ~record.loser;
        record.loserName   = players[record.loser]->name();
        record.winnerName  = players[record.winner]->name();
        record.termination = termination;
        record.lastMove    = lastMove;
        return record;
    };

    while (true) {
        Side             self       = board.sideToMove();
        std::vector<Pos> legalMoves = board.legalMoves();

        if (legalMoves.empty())
            return finish(Termination::NO_LEGAL_MOVES, board.getLastMove());

        Search::TimeControl timectl(timeLimit);
        Pos  move     = players[self]->getMove(board, legalMoves, timectl);
        Time timeLeft = timectl.timeLeft();

        if (!timectl.unlimited() && timeLeft < 0)
            return finish(Termination::TIMEOUT, board.getLastMove());

        if (!contains(legalMoves, move))
            return finish(Termination::ILLEGAL_MOVE, move);

        board.move(move);
        record.moves.push_back(move);

        if (onMove)
            onMove(board, self, move, timectl.elapsed());
    }
}

}  // namespace Arena
