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

#include "command/command.h"
#include "core/iohelper.h"
#include "core/utils.h"

#define CXXOPTS_NO_REGEX
#include <cxxopts.hpp>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace {

enum class RunMode { PROTOCOL, TOURNAMENT, PLAY, BENCHMARK };

struct RunModeEntry
{
    const char *name;
    RunMode     mode;
    bool        hasOwnHelp;  // Mode parses its own options and prints its own usage
};

constexpr RunModeEntry RunModes[] = {
    {"protocol", RunMode::PROTOCOL, false},
    {"tournament", RunMode::TOURNAMENT, true},
    {"play", RunMode::PLAY, true},
    {"bench", RunMode::BENCHMARK, false},
};

const RunModeEntry &parseRunMode(std::string name)
{
    lowerInplace(name);
    for (const RunModeEntry &entry : RunModes)
        if (name == entry.name)
            return entry;
    throw std::invalid_argument("unknown mode " + name);
}

}  // namespace

int main(int argc, char *argv[])
{
    Command::CommandLine::init(argc, argv);

    RunMode runMode = RunMode::PROTOCOL;
    try {
        cxxopts::Options options("isola", "Isolation game engine");
        options.add_options()  //
            ("mode",
             "One of [protocol, tournament, play, bench] run modes",
             cxxopts::value<std::string>()->default_value("protocol"))  //
            ("config",
             "Path to the config file, without it the internal config is the fallback",
             cxxopts::value<std::string>())  //
            ("h,help", "Print usage");
        options.parse_positional("mode");
        options.positional_help("[mode]");
        options.show_positional_help();
        options.allow_unrecognised_options();

        auto                result = options.parse(argc, argv);
        const RunModeEntry &entry  = parseRunMode(result["mode"].as<std::string>());
        runMode                    = entry.mode;

        if (result.count("help") && !entry.hasOwnHelp) {
            std::cout << options.help() << std::endl;
            return EXIT_SUCCESS;
        }

        if (result.count("config")) {
            Command::configPath          = result["config"].as<std::string>();
            Command::allowInternalConfig = false;
        }
    }
    catch (const std::exception &e) {
        ERRORL("parsing argument: " << e.what());
        return EXIT_FAILURE;
    }

    if (!Command::loadConfig()) {
        ERRORL("Failed to load config, please check if config is correct.");
        return EXIT_FAILURE;
    }

    switch (runMode) {
    case RunMode::TOURNAMENT: Command::tournament(argc, argv); break;
    case RunMode::PLAY: Command::play(argc, argv); break;
    case RunMode::BENCHMARK: Command::benchmark(); break;
    default: Command::protocolLoop(); break;
    }

    return EXIT_SUCCESS;
}
