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

#include "searcher.h"

#include "../../game/board.h"
#include "../../game/movegen.h"

#include <cassert>

namespace {

using namespace Search;

/// Minimax search of one node. Writes the best move of this node to bestMove
/// if it is not null.
Value minimax(SearchContext &ctx, int depth, bool maxLayer, Pos *bestMove = nullptr)
{
    if (ctx.checkTimeup())
        return VALUE_ZERO;
    ctx.nodes++;

    Board   &board = ctx.board;
    MoveList moves(board, board.sideToMove());

    if (depth == 0 || moves.empty())
        return ctx.evaluator(board, ctx.self);

    // Every node with moves reports a move, even if all children are lost
    Value bestValue = maxLayer ? VALUE_LOSS : VALUE_WIN;
    Pos   best      = moves[0];

    for (Pos move : moves) {
        board.move(move);
        Value value = minimax(ctx, depth - 1, !maxLayer);
        board.undo();

        if (ctx.aborted)
            return VALUE_ZERO;

        if (maxLayer ? value > bestValue : value < bestValue) {
            bestValue = value;
            best      = move;
        }
    }

    if (bestMove)
        *bestMove = best;
    return bestValue;
}

}  // namespace

namespace Search::MM {

RootResult MinimaxSearcher::searchRoot(SearchContext &ctx, int depth)
{
    assert(depth > 0);
    assert(ctx.board.sideToMove() == ctx.self);

    RootResult result;
    result.value = minimax(ctx, depth, true, &result.bestMove);
    return result;
}

}  // namespace Search::MM
