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

#include "command/argutils.h"
#include "config.h"
#include "core/iohelper.h"
#include "search/searchcommon.h"

#include <gtest/gtest.h>

#include <iterator>
#include <stdexcept>
#include <vector>
#define CXXOPTS_NO_REGEX
#include <cxxopts.hpp>

using namespace Command;
using Evaluation::Heuristic;

TEST(ArgUtilsTest, ParseSearchMethod)
{
    EXPECT_EQ(parseSearchMethod("minimax"), SearchMethod::MINIMAX);
    EXPECT_EQ(parseSearchMethod("MM"), SearchMethod::MINIMAX);
    EXPECT_EQ(parseSearchMethod("AlphaBeta"), SearchMethod::ALPHABETA);
    EXPECT_EQ(parseSearchMethod("ab"), SearchMethod::ALPHABETA);
    EXPECT_THROW(parseSearchMethod("mcts"), std::invalid_argument);
}

TEST(ArgUtilsTest, ParseBool)
{
    EXPECT_TRUE(parseBool("1"));
    EXPECT_TRUE(parseBool("True"));
    EXPECT_TRUE(parseBool("on"));
    EXPECT_FALSE(parseBool("0"));
    EXPECT_FALSE(parseBool("no"));
    EXPECT_THROW(parseBool("maybe"), std::invalid_argument);
}

TEST(ArgUtilsTest, ParseHeuristicList)
{
    auto list = parseHeuristicList("improved, ratio_of_moves,Center");
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[0], Heuristic::IMPROVED);
    EXPECT_EQ(list[1], Heuristic::RATIO_OF_MOVES);
    EXPECT_EQ(list[2], Heuristic::MOVE_DIFF_FROM_CENTER);

    EXPECT_TRUE(parseHeuristicList("").empty());
    EXPECT_THROW(parseHeuristicList("open,unknown"), std::invalid_argument);
    EXPECT_THROW(parseHeuristicList("open,Open"), std::invalid_argument);
}

TEST(ArgUtilsTest, ParsePositionString)
{
    auto position = parsePositionString("d4C3b5", 7, 7);
    std::vector<Pos> expected = {Pos(3, 3), Pos(2, 2), Pos(1, 4)};
    EXPECT_EQ(position, expected);

    EXPECT_TRUE(parsePositionString("", 7, 7).empty());
    EXPECT_THROW(parsePositionString("d4c", 7, 7), std::invalid_argument);
    EXPECT_THROW(parsePositionString("h1", 7, 7), std::invalid_argument);
    EXPECT_THROW(parsePositionString("a8", 7, 7), std::invalid_argument);
    EXPECT_THROW(parsePositionString("d4d4", 7, 7), std::invalid_argument);
    EXPECT_THROW(parsePositionString("d4,c3", 7, 7), std::invalid_argument);
}

TEST(ArgUtilsTest, ParseSearchOptionsFromArguments)
{
    cxxopts::Options options("isola_test");
    addSearchOptions(options);

    const char *argv[] = {"isola_test",
                          "--method",
                          "minimax",
                          "--heuristic",
                          "open",
                          "--depth",
                          "4",
                          "-q"};
    auto        result = options.parse(int(std::size(argv)), argv);

    Search::SearchOptions searchOptions = parseSearchOptions(result);
    EXPECT_EQ(searchOptions.method, SearchMethod::MINIMAX);
    EXPECT_EQ(searchOptions.heuristic, Heuristic::OPEN_MOVE);
    EXPECT_FALSE(searchOptions.iterative);
    EXPECT_EQ(searchOptions.searchDepth, 4);
    EXPECT_TRUE(searchOptions.silent);
}

TEST(ArgUtilsTest, ParseSearchOptionsDefaultsToConfig)
{
    cxxopts::Options options("isola_test");
    addSearchOptions(options);

    const char *argv[] = {"isola_test"};
    auto        result = options.parse(int(std::size(argv)), argv);

    Search::SearchOptions searchOptions = parseSearchOptions(result);
    EXPECT_EQ(searchOptions.method, Config::DefaultSearchMethod);
    EXPECT_EQ(searchOptions.heuristic, Config::DefaultHeuristic);
    EXPECT_EQ(searchOptions.iterative, Config::DefaultIterative);
    EXPECT_EQ(searchOptions.maxDepth, Config::MaxSearchDepth);
    EXPECT_FALSE(searchOptions.silent);
}

TEST(ArgUtilsTest, ParseSearchOptionsRejectsBadValues)
{
    cxxopts::Options options("isola_test");
    addSearchOptions(options);

    const char *badDepth[] = {"isola_test", "--depth", "0"};
    EXPECT_THROW(parseSearchOptions(options.parse(int(std::size(badDepth)), badDepth)),
                 std::invalid_argument);

    const char *badMethod[] = {"isola_test", "--method", "negamax"};
    EXPECT_THROW(parseSearchOptions(options.parse(int(std::size(badMethod)), badMethod)),
                 std::invalid_argument);
}
