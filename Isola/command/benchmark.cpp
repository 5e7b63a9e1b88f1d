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

#include "../config.h"
#include "../core/hash.h"
#include "../core/iohelper.h"
#include "../core/pos.h"
#include "../core/types.h"
#include "../game/board.h"
#include "../search/agent.h"
#include "../search/timecontrol.h"
#include "argutils.h"
#include "command.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace {

constexpr size_t TotalMoveTestNum = 2000000;

struct BenchEntry
{
    int          boardWidth;
    int          boardHeight;
    SearchMethod method;
    int          searchDepth;
    std::string  positionString;
};

const std::vector<BenchEntry> benchSet = {
    {7, 7, SearchMethod::MINIMAX, 3, "d4"},
    {7, 7, SearchMethod::MINIMAX, 4, "d4c3b5e2"},
    {7, 7, SearchMethod::ALPHABETA, 6, "d4c3"},
    {7, 7, SearchMethod::ALPHABETA, 7, "c2f6a3d5b5b4"},
    {7, 7, SearchMethod::ALPHABETA, 8, "d4c3b5e2d6g3f7e4"},
    {9, 9, SearchMethod::ALPHABETA, 6, "e5d3"},
};

/// Play the position of a bench entry on a new board.
Board makeBenchBoard(const BenchEntry &entry)
{
    Board board(entry.boardWidth, entry.boardHeight);
    std::vector<Pos> position =
        Command::parsePositionString(entry.positionString, entry.boardWidth, entry.boardHeight);

    for (Pos p : position) {
        if (!board.isLegal(p))
            throw std::invalid_argument("illegal move in bench position " + entry.positionString);
        board.move(p);
    }

    return board;
}

}  // namespace

void Command::benchmark()
{
    MsgMode backupMessageMode = Config::MessageMode;

    try {
        // Benchmark for Board::move() and Board::undo()
        MESSAGEL("==========Move Bench==========");
        Time   duration        = 0;
        size_t moveCount       = 0;
        size_t testNumPerEntry = TotalMoveTestNum / benchSet.size();
        for (const auto &benchEntry : benchSet) {
            Board            board = makeBenchBoard(benchEntry);
            std::vector<Pos> position(board.ply());
            for (int i = 0; i < board.ply(); i++)
                position[i] = board.getHistoryMove(i);
            board.newGame();

            Time   startTime = now();
            size_t testNum   = testNumPerEntry / position.size();
            for (size_t test = 0; test < testNum; test++) {
                for (size_t i = 0; i < position.size(); i++)
                    board.move(position[i]);

                for (size_t i = 0; i < position.size(); i++)
                    board.undo();
            }
            Time endTime = now();

            duration += endTime - startTime;
            moveCount += testNum * position.size();
        }

        MESSAGEL("Total Time (ms): " << duration);
        MESSAGEL("Moves/s: " << moveCount * 1000 / std::max<size_t>(duration, 1));

        MESSAGEL("=========Search Bench=========");
        Config::MessageMode = MsgMode::NONE;
        duration            = 0;
        size_t searchNodes  = 0;

        Hash::XXHasher hasher(TotalMoveTestNum);

        for (const auto &benchEntry : benchSet) {
            Board board = makeBenchBoard(benchEntry);

            Search::SearchOptions options = Search::SearchOptions::fromConfig();
            options.method                = benchEntry.method;
            options.iterative             = false;
            options.searchDepth           = benchEntry.searchDepth;
            options.silent                = true;

            Search::SearchAgent  agent(options);
            Search::TimeControl  timectl(0);
            Search::SearchResult result = agent.think(board, timectl);

            duration += result.time;
            searchNodes += result.nodes;

            hasher << result.nodes << result.value << result.bestMove._pos;
        }

        MESSAGEL("Total Time (ms): " << duration);
        MESSAGEL("Nodes: " << searchNodes);
        MESSAGEL("Nodes/s: " << searchNodes * 1000 / std::max<size_t>(duration, 1));
        MESSAGEL("Hash: " << std::hex << hasher.digest32() << std::dec);
    }
    catch (const std::exception &e) {
        ERRORL("benchmark: " << e.what());
    }

    Config::MessageMode = backupMessageMode;
}
