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

#include "searchoutput.h"

#include "../config.h"
#include "../core/iohelper.h"
#include "../core/utils.h"
#include "../game/board.h"
#include "searchcommon.h"
#include "searcher.h"
#include "timecontrol.h"

#include <algorithm>

namespace Search {

void SearchPrinter::printSearchStarts(const SearchOptions &options,
                                      const Board         &board,
                                      const TimeControl   &tc)
{
    if (silent)
        return;

    if (Config::MessageMode == MsgMode::NORMAL) {
        if (options.iterative)
            MESSAGEL(options.method << " | Iterative (max " << options.maxDepth << ") | Eval "
                                    << options.heuristic << " | Blanks " << board.blankCount()
                                    << " | TurnTime "
                                    << (tc.unlimited() ? std::string("unlimited")
                                                       : timeText(tc.turn())));
        else
            MESSAGEL(options.method << " | Depth " << options.searchDepth << " | Eval "
                                    << options.heuristic << " | Blanks " << board.blankCount());
    }
}

void SearchPrinter::printDepthCompletes(const TimeControl &tc,
                                        int                rootDepth,
                                        const RootResult  &result,
                                        uint64_t           nodes)
{
    if (silent)
        return;

    if (Config::MessageMode == MsgMode::NORMAL) {
        MESSAGEL("Depth " << rootDepth << " | Eval " << ValueText {result.value} << " | Node "
                          << nodesText(nodes) << " | Time " << timeText(tc.elapsed()) << " | "
                          << result.bestMove);
    }
}

void SearchPrinter::printDepthAborted(const TimeControl &tc, int rootDepth)
{
    if (silent)
        return;

    if (Config::MessageMode == MsgMode::NORMAL)
        MESSAGEL("Depth " << rootDepth << " aborted | Time " << timeText(tc.elapsed()));
}

void SearchPrinter::printSearchEnds(const TimeControl &tc, const SearchResult &result)
{
    if (silent)
        return;

    if (Config::MessageMode == MsgMode::NORMAL || Config::MessageMode == MsgMode::BRIEF) {
        uint64_t speed = result.nodes * 1000 / std::max(tc.elapsed(), (Time)1);

        MESSAGEL("Speed " << speedText(speed) << " | Depth " << result.depth << " | Eval "
                          << ValueText {result.value} << " | Node " << nodesText(result.nodes)
                          << " | Time " << timeText(tc.elapsed()));
        MESSAGEL("Bestmove " << result.bestMove);
    }
}

void SearchPrinter::printBestmoveWithoutSearch(Pos bestMove, Value moveValue)
{
    if (silent)
        return;

    if (Config::MessageMode == MsgMode::NORMAL || Config::MessageMode == MsgMode::BRIEF) {
        if (bestMove == Pos::NONE)
            MESSAGEL("No legal move | Eval " << ValueText {moveValue});
        else
            MESSAGEL("Bestmove " << bestMove << " | Eval " << ValueText {moveValue});
    }
}

}  // namespace Search
