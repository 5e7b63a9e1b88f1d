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

#include "../arena/tournament.h"
#include "../config.h"
#include "../core/iohelper.h"
#include "../core/utils.h"
#include "argutils.h"
#include "command.h"

#define CXXOPTS_NO_REGEX
#include <cxxopts.hpp>
#include <iostream>

void Command::tournament(int argc, char *argv[])
{
    Arena::TournamentOptions opts = Arena::TournamentOptions::fromConfig();
    bool                     quiet;

    cxxopts::Options options("isola tournament");
    options.add_options()  //
        ("matches",
         "Number of matches (two games each) against each opponent",
         cxxopts::value<int>()->default_value(std::to_string(opts.numMatches)))  //
        ("time-limit",
         "Time limit (ms) of each turn",
         cxxopts::value<Time>()->default_value(std::to_string(opts.timeLimit)))  //
        ("width",
         "Board width",
         cxxopts::value<int>()->default_value(std::to_string(opts.boardWidth)))  //
        ("height",
         "Board height",
         cxxopts::value<int>()->default_value(std::to_string(opts.boardHeight)))  //
        ("opening-moves",
         "Number of random moves played before each match",
         cxxopts::value<int>()->default_value(std::to_string(opts.openingMoves)))  //
        ("seed",
         "Seed of random openings and the random player (0 for a time based seed)",
         cxxopts::value<uint64_t>()->default_value("0"))  //
        ("heuristics",
         "Comma separated heuristics of the agents under test (besides ID_Improved)",
         cxxopts::value<std::string>())  //
        ("q,quiet", "Only print the final results table")  //
        ("h,help", "Print tournament usage");
    options.allow_unrecognised_options();

    try {
        auto args = options.parse(argc, argv);

        if (args.count("help")) {
            std::cout << options.help() << std::endl;
            std::exit(EXIT_SUCCESS);
        }

        opts.numMatches   = args["matches"].as<int>();
        opts.timeLimit    = args["time-limit"].as<Time>();
        opts.boardWidth   = args["width"].as<int>();
        opts.boardHeight  = args["height"].as<int>();
        opts.openingMoves = args["opening-moves"].as<int>();
        opts.seed         = args["seed"].as<uint64_t>();
        quiet             = args.count("quiet");
        if (args.count("heuristics"))
            opts.testHeuristics = parseHeuristicList(args["heuristics"].as<std::string>());

        if (opts.timeLimit <= 0)
            throw std::invalid_argument("time limit must be positive");
    }
    catch (const std::exception &e) {
        ERRORL("tournament argument: " << e.what());
        std::exit(EXIT_FAILURE);
    }

    try {
        Arena::Tournament tournament(opts);

        if (!quiet) {
            MESSAGEL("This script evaluates the performance of the agents under test against "
                     << tournament.opponents().size() << " reference opponents.");
            MESSAGEL("Each agent plays " << opts.numMatches << " matches (" << 2 * opts.numMatches
                                         << " games) against each opponent, "
                                         << opts.timeLimit << "ms per turn, on a "
                                         << opts.boardWidth << "x" << opts.boardHeight
                                         << " board.");
        }

        auto results = tournament.run(quiet ? nullptr : &std::cout);
        std::cout << std::endl;
        Arena::printResults(std::cout, results);
    }
    catch (const std::exception &e) {
        ERRORL("tournament: " << e.what());
        std::exit(EXIT_FAILURE);
    }
}
