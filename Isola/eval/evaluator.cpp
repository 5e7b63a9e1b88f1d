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

#include "evaluator.h"

#include "../config.h"
#include "../core/utils.h"
#include "../game/board.h"
#include "../game/movegen.h"

#include <stdexcept>
#include <string>

namespace {

/// Sum of the center closeness of every move in the list.
double centerCloseness(const Board &board, const MoveList &moves)
{
    const Pos    center = board.centerPos();
    const double width  = board.width();

    double sum = 0.0;
    for (Pos move : moves)
        sum += 1.0 - Pos::euclideanDistance(center, move) / width;
    return sum;
}

struct HeuristicEntry
{
    Evaluation::EvalFunction func;
    const char              *name;
    const char              *shortName;
};

constexpr HeuristicEntry HeuristicTable[] = {
    {Evaluation::nullScore, "null", "Null"},
    {Evaluation::openMoveScore, "open", "Open"},
    {Evaluation::improvedScore, "improved", "Improved"},
    {Evaluation::moveDiffWithSpaces, "move_diff_with_spaces", "Spaces"},
    {Evaluation::moveDiffFromCenter, "move_diff_from_center", "Center"},
    {Evaluation::ratioOfMoves, "ratio_of_moves", "Ratio"},
};
static_assert(arraySize(HeuristicTable) == int(Evaluation::Heuristic::HEURISTIC_NB));

}  // namespace

namespace Evaluation {

Value nullScore(const Board &board, Side self)
{
    return board.utility(self);
}

Value openMoveScore(const Board &board, Side self)
{
    if (board.isLoser(self))
        return VALUE_LOSS;
    if (board.isWinner(self))
        return VALUE_WIN;

    return Value(countMoves(board, self));
}

Value improvedScore(const Board &board, Side self)
{
    if (board.isLoser(self))
        return VALUE_LOSS;
    if (board.isWinner(self))
        return VALUE_WIN;

    return Value(countMoves(board, self) - countMoves(board, ~self));
}

Value moveDiffWithSpaces(const Board &board, Side self)
{
    int ownMoves = countMoves(board, self);
    int oppMoves = countMoves(board, ~self);

    if (oppMoves == 0)
        return VALUE_WIN;
    if (ownMoves == 0)
        return VALUE_LOSS;

    double spaceFactor = double(board.cellCount()) / board.blankCount();
    return Config::SelfWeight * ownMoves * spaceFactor - Config::SpacesOppoWeight * oppMoves;
}

Value moveDiffFromCenter(const Board &board, Side self)
{
    MoveList ownMoves(board, self);
    MoveList oppMoves(board, ~self);

    if (oppMoves.empty())
        return VALUE_WIN;
    if (ownMoves.empty())
        return VALUE_LOSS;

    return Config::SelfWeight * centerCloseness(board, ownMoves)
           - Config::CenterOppoWeight * centerCloseness(board, oppMoves);
}

Value ratioOfMoves(const Board &board, Side self)
{
    int ownMoves = countMoves(board, self);
    int oppMoves = countMoves(board, ~self);

    if (oppMoves == 0)
        return VALUE_WIN;
    if (ownMoves == 0)
        return VALUE_LOSS;

    return (Config::SelfWeight * ownMoves) / (Config::RatioOppoWeight * oppMoves);
}

EvalFunction evalFunction(Heuristic heuristic)
{
    return HeuristicTable[size_t(heuristic)].func;
}

const char *heuristicName(Heuristic heuristic)
{
    return HeuristicTable[size_t(heuristic)].name;
}

const char *heuristicShortName(Heuristic heuristic)
{
    return HeuristicTable[size_t(heuristic)].shortName;
}

Heuristic parseHeuristic(std::string_view name)
{
    std::string lowerName(name);
    lowerInplace(lowerName);

    for (int i = 0; i < arraySize(HeuristicTable); i++) {
        std::string shortName = HeuristicTable[i].shortName;
        if (lowerName == HeuristicTable[i].name || lowerName == lowerInplace(shortName))
            return Heuristic(i);
    }

    throw std::invalid_argument("unknown heuristic " + std::string(name));
}

std::ostream &operator<<(std::ostream &out, Heuristic heuristic)
{
    return out << heuristicName(heuristic);
}

}  // namespace Evaluation
