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

#include "searchcommon.h"

#include "../config.h"

namespace Search {

SearchOptions SearchOptions::fromConfig()
{
    SearchOptions options;
    options.method         = Config::DefaultSearchMethod;
    options.iterative      = Config::DefaultIterative;
    options.searchDepth    = Config::DefaultSearchDepth;
    options.maxDepth       = Config::MaxSearchDepth;
    options.timerThreshold = Config::TimerThreshold;
    options.heuristic      = Config::DefaultHeuristic;
    return options;
}

}  // namespace Search
