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

#include "agent.h"

#include "../game/board.h"
#include "../game/movegen.h"
#include "ab/searcher.h"
#include "mm/searcher.h"

#include <stdexcept>
#include <string>

namespace Search {

std::unique_ptr<Searcher> createSearcher(SearchMethod method)
{
    switch (method) {
    case SearchMethod::MINIMAX: return std::make_unique<MM::MinimaxSearcher>();
    case SearchMethod::ALPHABETA: return std::make_unique<AB::ABSearcher>();
    default: throw std::invalid_argument("unknown search method");
    }
}

SearchAgent::SearchAgent(const SearchOptions &options)
    : opts(options)
    , searcher(createSearcher(options.method))
{
    if (opts.searchDepth < 1)
        throw std::invalid_argument("search depth must be at least 1, got "
                                    + std::to_string(opts.searchDepth));
    if (opts.maxDepth < 1)
        throw std::invalid_argument("max search depth must be at least 1, got "
                                    + std::to_string(opts.maxDepth));

    printer.silent = opts.silent;
}

SearchResult SearchAgent::think(const Board &board, const TimeControl &timectl)
{
    SearchResult result;
    Board        rootBoard = board;
    Side         self      = rootBoard.sideToMove();
    MoveList     rootMoves(rootBoard, self);

    // Check for immediate return
    if (rootMoves.empty()) {
        result.value = VALUE_LOSS;
        result.time  = timectl.elapsed();
        printer.printBestmoveWithoutSearch(Pos::NONE, result.value);
        return result;
    }

    printer.printSearchStarts(opts, rootBoard, timectl);

    SearchContext ctx {rootBoard,
                       self,
                       Evaluation::evalFunction(opts.heuristic),
                       timectl,
                       opts.timerThreshold};

    // Returned if not even the first iteration completes in time
    result.bestMove = rootMoves[0];

    int startDepth = opts.iterative ? 1 : opts.searchDepth;
    int endDepth   = opts.iterative ? opts.maxDepth : opts.searchDepth;

    for (int depth = startDepth; depth <= endDepth; depth++) {
        RootResult rootResult = searcher->searchRoot(ctx, depth);

        if (ctx.aborted) {
            result.timeout = true;
            printer.printDepthAborted(timectl, depth);
            break;
        }

        result.bestMove = rootResult.bestMove;
        result.value    = rootResult.value;
        result.depth    = depth;
        printer.printDepthCompletes(timectl, depth, rootResult, ctx.nodes);

        // A proven result does not change with depth, and no line is longer
        // than the number of blank cells.
        if (isDecisive(rootResult.value) || depth >= rootBoard.blankCount())
            break;
    }

    result.nodes = ctx.nodes;
    result.time  = timectl.elapsed();
    printer.printSearchEnds(timectl, result);
    return result;
}

}  // namespace Search
