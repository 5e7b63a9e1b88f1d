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

#include "iohelper.h"

#include <cassert>
#include <cctype>
#include <iomanip>

constexpr int NONE_COORD_X = -1;
constexpr int NONE_COORD_Y = -1;

namespace {

std::mutex &outputMutex()
{
    // Never destroyed, still usable from static destructors
    static std::mutex *mutex = new std::mutex;
    return *mutex;
}

}  // namespace

SyncOutputStream::SyncOutputStream(std::ostream &os) : lock(outputMutex()), os(os) {}

// -------------------------------------------------

Pos inputCoordConvert(int x, int y)
{
    if (x == NONE_COORD_X && y == NONE_COORD_Y)
        return Pos::NONE;
    if (x < 0 || x >= MAX_BOARD_SIZE || y < 0 || y >= MAX_BOARD_SIZE)
        return Pos::NONE;

    return {x, y};
}

int outputCoordXConvert(Pos pos)
{
    return pos == Pos::NONE ? NONE_COORD_X : pos.x();
}

int outputCoordYConvert(Pos pos)
{
    return pos == Pos::NONE ? NONE_COORD_Y : pos.y();
}

Pos parseCoord(std::string coordStr)
{
    // One column letter and at most two row digits
    if (coordStr.size() < 2 || coordStr.size() > 3 || !std::isalpha((unsigned char)coordStr[0]))
        return Pos::NONE;

    for (size_t i = 1; i < coordStr.size(); i++)
        if (!std::isdigit((unsigned char)coordStr[i]))
            return Pos::NONE;

    int x = std::tolower((unsigned char)coordStr[0]) - 'a';
    int y = std::atoi(coordStr.data() + 1) - 1;
    if (x < 0 || x >= MAX_BOARD_SIZE || y < 0 || y >= MAX_BOARD_SIZE)
        return Pos::NONE;

    return Pos(x, y);
}

// -------------------------------------------------

std::ostream &operator<<(std::ostream &out, Pos pos)
{
    assert(pos.valid());

    if (pos == Pos::NONE)
        return out << "None";
    else
        return out << char(pos.x() + 'a') << (pos.y() + 1);
}

std::ostream &operator<<(std::ostream &out, Side side)
{
    assert(side < SIDE_NB);

    const char *SideName[] = {"Player1", "Player2"};
    return out << SideName[side];
}

std::ostream &operator<<(std::ostream &out, SearchMethod method)
{
    switch (method) {
    case SearchMethod::MINIMAX: return out << "minimax";
    case SearchMethod::ALPHABETA: return out << "alphabeta";
    default: return out << "unknown";
    }
}

std::ostream &operator<<(std::ostream &out, Termination termination)
{
    switch (termination) {
    case Termination::NONE: return out << "none";
    case Termination::NO_LEGAL_MOVES: return out << "no legal moves";
    case Termination::TIMEOUT: return out << "timeout";
    case Termination::ILLEGAL_MOVE: return out << "illegal move";
    default: return out << "unknown";
    }
}

std::ostream &operator<<(std::ostream &out, MovesText movesRef)
{
    bool first = true;
    for (Pos pos : movesRef.moves) {
        if (movesRef.withSpace && !first)
            out << ' ';
        out << pos;
        first = false;
    }
    return out;
}

std::ostream &operator<<(std::ostream &out, ValueText v)
{
    if (v.value == VALUE_WIN)
        return out << "+inf";
    else if (v.value == VALUE_LOSS)
        return out << "-inf";

    auto flags = out.flags();
    auto prec  = out.precision();
    out << std::fixed << std::setprecision(3) << v.value;
    out.flags(flags);
    out.precision(prec);
    return out;
}
