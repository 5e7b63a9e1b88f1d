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

#include "core/types.h"
#include "core/utils.h"

#include <istream>
#include <string>
#include <vector>

/// MsgMode represents the message mode that controls how messages are outputed in search.
enum class MsgMode { NONE, BRIEF, NORMAL };

namespace Evaluation {
enum class Heuristic : uint8_t;  // forward declaration
}

namespace Config {

extern const std::string InternalConfig;

// -------------------------------------------------
// General options
extern MsgMode MessageMode;

// -------------------------------------------------
// Search options
extern SearchMethod          DefaultSearchMethod;
extern bool                  DefaultIterative;
extern int                   DefaultSearchDepth;
extern int                   MaxSearchDepth;
extern Time                  TimerThreshold;
extern Time                  DefaultTurnTime;
extern Evaluation::Heuristic DefaultHeuristic;

// -------------------------------------------------
// Evaluation options
extern double SelfWeight;
extern double SpacesOppoWeight;
extern double CenterOppoWeight;
extern double RatioOppoWeight;

// -------------------------------------------------
// Tournament options
extern int                                TournamentNumMatches;
extern Time                               TournamentTimeLimit;
extern int                                TournamentBoardWidth;
extern int                                TournamentBoardHeight;
extern int                                TournamentOpeningMoves;
extern int                                TournamentMinimaxDepth;
extern int                                TournamentAlphaBetaDepth;
extern std::vector<Evaluation::Heuristic> TournamentTestHeuristics;

// -------------------------------------------------

/// Load config from a stream.
/// @param configStream A input stream that contains a toml config file.
/// @return Returns true if loading succeeded, otherwise returns false.
bool loadConfig(std::istream &configStream);

}  // namespace Config
