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

#include "../core/utils.h"

#include <filesystem>
#include <iostream>

namespace Search {
struct SearchOptions;
}

namespace Command {

namespace CommandLine {
    /// Directory of the executable, used to find a config file beside it.
    extern std::filesystem::path binaryDirectory;

    /// Record the executable location from the startup arguments.
    void init(int argc, char *argv[]);
}  // namespace CommandLine

// -------------------------------------------------
// Config loading

/// Path of the config file, relative paths are resolved by loadConfig().
extern std::filesystem::path configPath;

/// Whether the compiled-in config may be used when no config file is found.
extern bool allowInternalConfig;

/// Load the config file at configPath into the Config namespace.
/// A relative configPath is looked up in the working directory, then in the
/// binary directory. If neither exists, the internal config is loaded when
/// allowInternalConfig is set, otherwise loading fails.
/// @return True if a config was loaded successfully.
bool loadConfig();

// -------------------------------------------------
// Run modes

/// Text protocol for driving the engine from another program. Runs until END
/// or end of input.
void protocolLoop(std::istream &in = std::cin, std::ostream &out = std::cout);

/// Search options of the protocol engine, as changed by INFO and RELOADCONFIG.
const Search::SearchOptions &protocolOptions();

/// Turn time (ms) of the protocol engine, 0 for unlimited.
Time protocolTurnTime();

/// Evaluate agents under test against the reference opponents.
void tournament(int argc, char *argv[]);

/// Play a game against the engine in the terminal.
void play(int argc, char *argv[]);

/// Run a fixed set of searches and print the node count and speed.
void benchmark();

}  // namespace Command
