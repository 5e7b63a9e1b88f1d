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

#include "pos.h"
#include "types.h"

#include <iostream>
#include <mutex>
#include <string>
#include <vector>

// -------------------------------------------------
// Synchronized output and logging

/// SyncOutputStream holds the global output lock while it is alive, so that
/// one message line is never interleaved with output from another thread.
class SyncOutputStream
{
public:
    explicit SyncOutputStream(std::ostream &os);
    SyncOutputStream(const SyncOutputStream &)            = delete;
    SyncOutputStream &operator=(const SyncOutputStream &) = delete;

    template <typename T>
    SyncOutputStream &operator<<(const T &value)
    {
        os << value;
        return *this;
    }
    SyncOutputStream &operator<<(std::ostream &(*manip)(std::ostream &))
    {
        os << manip;
        return *this;
    }

private:
    std::unique_lock<std::mutex> lock;
    std::ostream                &os;
};

[[nodiscard]] inline SyncOutputStream sync_cout()
{
    return SyncOutputStream {std::cout};
}

// Engine output other than protocol replies is tagged by its kind.
#define MESSAGEL(message) sync_cout() << "MESSAGE " << message << std::endl
#define ERRORL(message)   sync_cout() << "ERROR " << message << std::endl
#ifdef NDEBUG
    #define DEBUGL(message) ((void)0)
#else
    #define DEBUGL(message) sync_cout() << "DEBUG " << message << std::endl
#endif

// -------------------------------------------------
// Coordinate conversion

/// Convert protocol coordinates (x, y) to a Pos object.
/// (-1, -1) is converted to Pos::NONE.
Pos inputCoordConvert(int x, int y);
/// Convert output coordinates from a Pos object to x. Pos::NONE gives -1.
int outputCoordXConvert(Pos pos);
/// Convert output coordinates from a Pos object to y. Pos::NONE gives -1.
int outputCoordYConvert(Pos pos);
/// Convert a coordinate string (e.g., "a1", "D4") to a Pos object.
/// @return The parsed pos, or Pos::NONE if the string is not a coordinate.
Pos parseCoord(std::string coordStr);

// -------------------------------------------------
// Formatters

/// A struct to format a list of moves for output with custom options.
struct MovesText
{
    const std::vector<Pos> &moves;

    bool withSpace = true;
};

std::ostream &operator<<(std::ostream &out, Pos pos);
std::ostream &operator<<(std::ostream &out, Side side);
std::ostream &operator<<(std::ostream &out, SearchMethod method);
std::ostream &operator<<(std::ostream &out, Termination termination);
std::ostream &operator<<(std::ostream &out, MovesText movesRef);

/// ValueText formats a Value, printing infinite values as +inf/-inf.
struct ValueText
{
    Value value;
};

std::ostream &operator<<(std::ostream &out, ValueText v);
