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

#include <algorithm>
#include <cassert>

namespace {

using namespace Search;

/// Alpha-beta search of one node. Maximizing layers cut off once the best
/// value reaches beta, minimizing layers once it drops to alpha.
Value search(SearchContext &ctx,
             int            depth,
             Value          alpha,
             Value          beta,
             bool           maxLayer,
             Pos           *bestMove = nullptr)
{
    if (ctx.checkTimeup())
        return VALUE_ZERO;
    ctx.nodes++;

    Board   &board = ctx.board;
    MoveList moves(board, board.sideToMove());

    if (depth == 0 || moves.empty())
        return ctx.evaluator(board, ctx.self);

    Value bestValue = maxLayer ? VALUE_LOSS : VALUE_WIN;
    Pos   best      = moves[0];

    for (Pos move : moves) {
        board.move(move);
        Value value = search(ctx, depth - 1, alpha, beta, !maxLayer);
        board.undo();

        if (ctx.aborted)
            return VALUE_ZERO;

        if (maxLayer) {
            if (value > bestValue) {
                bestValue = value;
                best      = move;
            }
            if (bestValue >= beta)
                break;
            alpha = std::max(alpha, bestValue);
        }
        else {
            if (value < bestValue) {
                bestValue = value;
                best      = move;
            }
            if (bestValue <= alpha)
                break;
            beta = std::min(beta, bestValue);
        }
    }

    if (bestMove)
        *bestMove = best;
    return bestValue;
}

}  // namespace

namespace Search::AB {

RootResult ABSearcher::searchRoot(SearchContext &ctx, int depth)
{
    assert(depth > 0);
    assert(ctx.board.sideToMove() == ctx.self);

    RootResult result;
    result.value = search(ctx, depth, VALUE_LOSS, VALUE_WIN, true, &result.bestMove);
    return result;
}

}  // namespace Search::AB
