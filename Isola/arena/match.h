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

#include <functional>
#include <string>
#include <vector>

class Board;

namespace Arena {

class Player;

/// GameRecord is the outcome of one finished game.
struct GameRecord
{
    Side             winner;
    Side             loser;
    std::string      winnerName;
    std::string      loserName;
    Termination      termination = Termination::NONE;
    std::vector<Pos> moves;  /// Moves played in this game, after the given start position
    Pos              lastMove = Pos::NONE;  /// The forfeiting move on ILLEGAL_MOVE, otherwise the last move
};

/// Callback invoked after each move is applied to the board.
typedef std::function<void(const Board &board, Side mover, Pos move, Time time)> MoveCallback;

/// Play a game to the end from the current state of the board.
/// The side to move loses when it has no legal move, when its player returns
/// after the time limit, or when its player returns a move that is not legal.
/// @param board The start position, which is played on in place.
/// @param player1 The player of PLAYER_1.
/// @param player2 The player of PLAYER_2.
/// @param timeLimit Time limit of each turn in milliseconds, 0 for unlimited.
/// @param onMove Optional callback after each applied move.
GameRecord playGame(Board              &board,
                    Player             &player1,
                    Player             &player2,
                    Time                timeLimit,
                    const MoveCallback &onMove = {});

}  // namespace Arena
