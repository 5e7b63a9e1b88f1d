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

#include "../arena/match.h"
#include "../arena/player.h"
#include "../config.h"
#include "../core/iohelper.h"
#include "../game/board.h"
#include "argutils.h"
#include "command.h"

#define CXXOPTS_NO_REGEX
#include <cxxopts.hpp>
#include <iostream>
#include <memory>

void Command::play(int argc, char *argv[])
{
    int                   width, height;
    bool                  humanFirst;
    Time                  turnTime;
    Search::SearchOptions searchOptions;

    cxxopts::Options options("isola play");
    options.add_options()  //
        ("width", "Board width", cxxopts::value<int>()->default_value("7"))    //
        ("height", "Board height", cxxopts::value<int>()->default_value("7"))  //
        ("human-first", "Human moves first")                                   //
        ("h,help", "Print play usage");
    addSearchOptions(options);
    options.allow_unrecognised_options();

    try {
        auto args = options.parse(argc, argv);

        if (args.count("help")) {
            std::cout << options.help() << std::endl;
            std::exit(EXIT_SUCCESS);
        }

        width         = args["width"].as<int>();
        height        = args["height"].as<int>();
        humanFirst    = args.count("human-first");
        turnTime      = args["time-limit"].as<Time>();
        searchOptions = parseSearchOptions(args);

        if (turnTime < 0)
            throw std::invalid_argument("time limit must not be negative");
    }
    catch (const std::exception &e) {
        ERRORL("play argument: " << e.what());
        std::exit(EXIT_FAILURE);
    }

    try {
        Board                board(width, height);
        Arena::HumanPlayer   human("Human", std::cin, std::cout);
        Arena::SearchPlayer  engine("Isola", searchOptions, turnTime);
        Arena::Player       &humanBase  = human;
        Arena::Player       &engineBase = engine;
        Arena::Player       *player1    = humanFirst ? &humanBase : &engineBase;
        Arena::Player       *player2    = humanFirst ? &engineBase : &humanBase;
        Arena::Player       *players[SIDE_NB] = {player1, player2};

        // The human is not timed, the engine keeps to its own turn time
        Arena::GameRecord record = Arena::playGame(
            board,
            *player1,
            *player2,
            0,
            [&](const Board &b, Side mover, Pos move, Time time) {
                if (players[mover] == &engineBase) {
                    const auto &r = engine.lastResult();
                    std::cout << "Isola plays " << move << " (depth " << r.depth << ", eval "
                              << ValueText {r.value} << ", " << timeText(time) << ")"
                              << std::endl;
                }
            });

        std::cout << board.trace();
        std::cout << record.winnerName << " (" << record.winner << ") wins by "
                  << record.termination << " after " << board.ply() << " moves: "
                  << board.positionString() << std::endl;
    }
    catch (const std::exception &e) {
        ERRORL("play: " << e.what());
        std::exit(EXIT_FAILURE);
    }
}
