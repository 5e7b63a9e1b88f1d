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
#include "../core/iohelper.h"
#include "../core/utils.h"
#include "../eval/evaluator.h"
#include "../game/board.h"
#include "../search/agent.h"
#include "../search/searchcommon.h"
#include "../search/timecontrol.h"
#include "argutils.h"
#include "command.h"

#include <memory>
#include <optional>
#include <sstream>
#include <string>

namespace {

/// Parse a coord in form 'x,y' from in stream and check if the pos is a legal
/// move of the side to move.
std::optional<Pos> parseLegalCoord(std::istream &is, const Board &board)
{
    int  x = -2, y = -2;
    char comma = 0;
    if (!(is >> x >> comma >> y) || comma != ',') {
        ERRORL("Coord must be in form x,y.");
        return std::nullopt;
    }

    Pos pos = inputCoordConvert(x, y);
    if (pos != Pos::NONE && board.isLegal(pos))
        return pos;

    ERRORL("Coord " << x << ',' << y << " is not a legal move.");
    return std::nullopt;
}

}  // namespace

namespace Command::Protocol {

std::unique_ptr<Board> board;
Search::SearchOptions  options;
Time                   turnTime;

void resetOptions()
{
    options  = Search::SearchOptions::fromConfig();
    turnTime = Config::DefaultTurnTime;
}

/// Search the current board, play the best move and send it to the output.
void think(std::ostream &out)
{
    Search::SearchAgent  agent(options);
    Search::TimeControl  timectl(turnTime);
    Search::SearchResult result = agent.think(*board, timectl);

    if (result.bestMove != Pos::NONE)
        board->move(result.bestMove);

    out << outputCoordXConvert(result.bestMove) << ',' << outputCoordYConvert(result.bestMove)
        << std::endl;
}

void getOption(std::istream &is)
{
    std::string key, value;
    is >> key >> value;
    lowerInplace(key);

    try {
        if (key == "timeout_turn") {
            Time time = std::stoll(value);
            if (time < 0)
                throw std::invalid_argument("turn time must not be negative");
            turnTime = time;
        }
        else if (key == "method")
            options.method = parseSearchMethod(value);
        else if (key == "heuristic")
            options.heuristic = Evaluation::parseHeuristic(value);
        else if (key == "iterative")
            options.iterative = parseBool(value);
        else if (key == "depth") {
            int depth = std::stoi(value);
            if (depth < 1)
                throw std::invalid_argument("depth must be at least 1");
            options.searchDepth = depth;
        }
        else if (key == "max_depth") {
            int depth = std::stoi(value);
            if (depth < 1)
                throw std::invalid_argument("max depth must be at least 1");
            options.maxDepth = depth;
        }
        else if (key == "timer_threshold") {
            Time threshold = std::stoll(value);
            if (threshold < 0)
                throw std::invalid_argument("timer threshold must not be negative");
            options.timerThreshold = threshold;
        }
        else
            ERRORL("Unknown info key: " << key);
    }
    catch (const std::exception &e) {
        ERRORL("INFO " << key << ": " << e.what());
    }
}

void restart(std::ostream &out)
{
    board->newGame();
    out << "OK" << std::endl;
}

void start(std::istream &is, std::ostream &out)
{
    int width = 0, height = 0;
    if (!(is >> width)) {
        ERRORL("START requires a board size.");
        return;
    }
    // A single size starts a square board
    if (!(is >> height))
        height = width;

    try {
        board = std::make_unique<Board>(width, height);
    }
    catch (const std::invalid_argument &e) {
        ERRORL("Unsupported board size: " << e.what());
        return;
    }

    restart(out);
}

void takeBack(std::ostream &out)
{
    if (board->ply() > 0) {
        board->undo();
        out << "OK" << std::endl;
    }
    else
        ERRORL("Board is empty now.");
}

void begin(std::ostream &out)
{
    if (board->ply() != 0)
        ERRORL("Board is not empty.");
    else
        think(out);
}

void turn(std::istream &is, std::ostream &out)
{
    auto pos = parseLegalCoord(is, *board);
    if (!pos.has_value())
        return;

    board->move(*pos);
    think(out);
}

/// Read moves in form 'x,y' line by line until DONE, then think.
/// Moves alternate between the two sides, starting with the first player.
void getPosition(std::istream &in, std::ostream &out)
{
    board->newGame();

    bool        valid = true, done = false;
    std::string line;
    while (std::getline(in, line)) {
        trimInplace(line);
        upperInplace(line);
        if (line == "DONE") {
            done = true;
            break;
        }
        if (line.empty() || !valid)
            continue;

        std::istringstream ss(line);
        auto               pos = parseLegalCoord(ss, *board);
        if (pos.has_value())
            board->move(*pos);
        else
            valid = false;
    }

    if (!done) {
        board->newGame();
        ERRORL("BOARD is not terminated by DONE, board is cleared.");
        return;
    }
    if (!valid) {
        board->newGame();
        ERRORL("Position is not valid, board is cleared.");
        return;
    }

    think(out);
}

void traceBoard()
{
    std::string traceInfo  = board->trace();
    auto        traceLines = split(traceInfo, "\n");
    for (const auto &line : traceLines) {
        MESSAGEL(line);
    }
    MESSAGEL("Side to move: " << board->sideToMove() << " | Ply: " << board->ply()
                              << " | Position: " << board->positionString());
}

void reloadConfig()
{
    if (!loadConfig())
        ERRORL("Failed to reload config, please check if config is correct.");
    else
        resetOptions();
}

/// Fetch and execute one command line.
/// @return True if the protocol loop should exit now.
bool runProtocol(std::istream &in, std::ostream &out)
{
    std::string line;
    if (!std::getline(in, line))
        return true;

    std::istringstream is(line);
    std::string        cmd;
    if (!(is >> cmd))
        return false;

    // We assume the command is in uppercase, but also support lowercase
    upperInplace(cmd);

    auto CheckBoardOK = [&](auto f) {
        if (!board)
            ERRORL("No game has been started.");
        else
            f();
    };

    // clang-format off
    if (cmd == "END")               return true;
    else if (cmd == "ABOUT")        out << getEngineInfo() << std::endl;
    else if (cmd == "START")        start(is, out);
    else if (cmd == "INFO")         getOption(is);
    else if (cmd == "RELOADCONFIG") reloadConfig();
    else if (cmd == "RESTART")      CheckBoardOK([&] { restart(out); });
    else if (cmd == "TAKEBACK")     CheckBoardOK([&] { takeBack(out); });
    else if (cmd == "BEGIN")        CheckBoardOK([&] { begin(out); });
    else if (cmd == "TURN")         CheckBoardOK([&] { turn(is, out); });
    else if (cmd == "BOARD")        CheckBoardOK([&] { getPosition(in, out); });
    else if (cmd == "TRACEBOARD")   CheckBoardOK(traceBoard);
    else                            ERRORL("Unknown command: " << cmd);
    // clang-format on

    return false;
}

}  // namespace Command::Protocol

const Search::SearchOptions &Command::protocolOptions()
{
    return Protocol::options;
}

Time Command::protocolTurnTime()
{
    return Protocol::turnTime;
}

/// Warp around runProtocol(), looping until exit condition is met.
void Command::protocolLoop(std::istream &in, std::ostream &out)
{
    Protocol::board.reset();
    Protocol::resetOptions();

    while (!Protocol::runProtocol(in, out))
        ;
}
