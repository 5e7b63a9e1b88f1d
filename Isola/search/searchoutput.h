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

#include <cstdint>

class Board;

namespace Search {

struct SearchOptions;
struct SearchResult;
struct RootResult;
class TimeControl;

/// SearchPrinter controls all message outputs during searching. What is
/// printed depends on Config::MessageMode.
struct SearchPrinter
{
    /// Disable all outputs of this printer.
    bool silent = false;

    /// Print when search starts.
    void printSearchStarts(const SearchOptions &options,
                           const Board         &board,
                           const TimeControl   &tc);
    /// Print when one iterative depth completes.
    void printDepthCompletes(const TimeControl &tc,
                             int                rootDepth,
                             const RootResult  &result,
                             uint64_t           nodes);
    /// Print when the timer expires in the middle of a depth.
    void printDepthAborted(const TimeControl &tc, int rootDepth);
    /// Print when search finishes.
    void printSearchEnds(const TimeControl &tc, const SearchResult &result);
    /// Print when search is not needed to choose a bestmove.
    void printBestmoveWithoutSearch(Pos bestMove, Value moveValue);
};

}  // namespace Search
