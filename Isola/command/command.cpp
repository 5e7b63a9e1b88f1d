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

#include "command.h"

#include "../config.h"
#include "../core/iohelper.h"

#include <fstream>
#include <sstream>
#include <system_error>

namespace {

/// Find the config file to load, or an empty path if there is none.
/// Relative paths are looked up in the working directory first, then beside
/// the executable.
std::filesystem::path resolveConfigPath(const std::filesystem::path &path)
{
    namespace fs = std::filesystem;

    if (path.is_absolute())
        return path;
    if (fs::exists(path))
        return path;

    fs::path besideBinary = Command::CommandLine::binaryDirectory / path;
    if (fs::exists(besideBinary))
        return besideBinary;

    return {};
}

}  // namespace

namespace Command {

std::filesystem::path CommandLine::binaryDirectory;
std::filesystem::path configPath          = "config.toml";
bool                  allowInternalConfig = true;

void CommandLine::init(int argc, char *argv[])
{
    namespace fs = std::filesystem;

    if (argc < 1 || !argv[0]) {
        binaryDirectory = fs::current_path();
        return;
    }

    std::error_code ec;
    fs::path        binaryPath = fs::absolute(argv[0], ec);
    binaryDirectory = ec ? fs::current_path() : binaryPath.parent_path();
}

bool loadConfig()
{
    std::filesystem::path path = resolveConfigPath(configPath);

    if (path.empty()) {
        if (!allowInternalConfig) {
            ERRORL("Config file " << configPath.string() << " not found.");
            return false;
        }

        std::istringstream internalConfig(Config::InternalConfig);
        return Config::loadConfig(internalConfig);
    }

    std::ifstream configFile(path);
    if (!configFile) {
        ERRORL("Unable to open config file " << path.string());
        return false;
    }

    MESSAGEL("Load config from " << path.string());
    return Config::loadConfig(configFile);
}

}  // namespace Command
