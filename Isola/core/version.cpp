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

#include "utils.h"

#include <sstream>

namespace {

constexpr int VersionMajor    = 0;
constexpr int VersionMinor    = 3;
constexpr int VersionRevision = 2;

/// Compiler and platform this binary was built with, e.g. "g++ 12.2.0 on Linux".
std::string buildInfo()
{
    std::ostringstream ss;

#if defined(__clang__)
    ss << "clang++ " << __clang_major__ << '.' << __clang_minor__ << '.' << __clang_patchlevel__;
#elif defined(__GNUC__)
    ss << "g++ " << __GNUC__ << '.' << __GNUC_MINOR__ << '.' << __GNUC_PATCHLEVEL__;
#else
    ss << "unknown compiler";
#endif

#if defined(__linux__)
    ss << " on Linux";
#elif defined(__APPLE__)
    ss << " on macOS";
#endif

#ifndef NDEBUG
    ss << " (debug)";
#endif

    return ss.str();
}

}  // namespace

std::tuple<int, int, int> getVersionNumbers()
{
    return {VersionMajor, VersionMinor, VersionRevision};
}

std::string getVersionInfo()
{
    std::ostringstream ss;
    ss << VersionMajor << '.' << VersionMinor << '.' << VersionRevision << " [" << buildInfo()
       << ']';
    return ss.str();
}

std::string getEngineInfo()
{
    std::ostringstream ss;
    ss << "name=\"Isola\", version=\"" << getVersionInfo()
       << "\", author=\"Isola developers\", game=\"Isolation\"";
    return ss.str();
}
