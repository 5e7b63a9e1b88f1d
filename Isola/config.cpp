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

#include "config.h"

#include "core/iohelper.h"
#include "core/pos.h"
#include "eval/evaluator.h"

#include <cpptoml.h>
#include <stdexcept>

namespace Config {

// -------------------------------------------------
// General options

/// Message output mode.
MsgMode MessageMode = MsgMode::BRIEF;

// -------------------------------------------------
// Search options

/// Search algorithm of the engine when not specified.
SearchMethod DefaultSearchMethod = SearchMethod::ALPHABETA;
/// Whether the engine uses iterative deepening when not specified.
bool DefaultIterative = true;
/// Search depth of fixed-depth search.
int DefaultSearchDepth = 3;
/// Max depth to search in iterative deepening.
int MaxSearchDepth = 99;
/// Search is aborted when time left in the turn drops below this (ms).
Time TimerThreshold = 10;
/// Turn time used by the protocol and play modes (ms, 0 for unlimited).
Time DefaultTurnTime = 1000;
/// Heuristic of the engine when not specified.
Evaluation::Heuristic DefaultHeuristic = Evaluation::Heuristic::MOVE_DIFF_FROM_CENTER;

// -------------------------------------------------
// Evaluation options

/// Weight of own moves in the custom heuristics.
double SelfWeight = 1.0;
/// Weight of opponent moves in move_diff_with_spaces.
double SpacesOppoWeight = 2.0;
/// Weight of opponent moves in move_diff_from_center.
double CenterOppoWeight = 2.0;
/// Weight of opponent moves in ratio_of_moves.
double RatioOppoWeight = 1.0;

// -------------------------------------------------
// Tournament options

/// Number of matches (two games each) against each opponent.
int TournamentNumMatches = 10;
/// Turn time limit of every player (ms).
Time TournamentTimeLimit = 150;
/// Board size of tournament games.
int TournamentBoardWidth  = 7;
int TournamentBoardHeight = 7;
/// Number of random moves played before a match starts.
int TournamentOpeningMoves = 2;
/// Fixed search depth of the minimax reference opponents.
int TournamentMinimaxDepth = 3;
/// Fixed search depth of the alpha-beta reference opponents.
int TournamentAlphaBetaDepth = 5;
/// Heuristics played by the agents under test (besides ID_Improved).
std::vector<Evaluation::Heuristic> TournamentTestHeuristics = {
    Evaluation::Heuristic::MOVE_DIFF_WITH_SPACES,
    Evaluation::Heuristic::MOVE_DIFF_FROM_CENTER,
    Evaluation::Heuristic::RATIO_OF_MOVES,
};

// -------------------------------------------------

/// Values of all options, restored when a config fails to load halfway.
struct Snapshot
{
    MsgMode                            messageMode;
    SearchMethod                       defaultSearchMethod;
    bool                               defaultIterative;
    int                                defaultSearchDepth;
    int                                maxSearchDepth;
    Time                               timerThreshold;
    Time                               defaultTurnTime;
    Evaluation::Heuristic              defaultHeuristic;
    double                             selfWeight;
    double                             spacesOppoWeight;
    double                             centerOppoWeight;
    double                             ratioOppoWeight;
    int                                tournamentNumMatches;
    Time                               tournamentTimeLimit;
    int                                tournamentBoardWidth;
    int                                tournamentBoardHeight;
    int                                tournamentOpeningMoves;
    int                                tournamentMinimaxDepth;
    int                                tournamentAlphaBetaDepth;
    std::vector<Evaluation::Heuristic> tournamentTestHeuristics;

    static Snapshot take()
    {
        return {MessageMode,
                DefaultSearchMethod,
                DefaultIterative,
                DefaultSearchDepth,
                MaxSearchDepth,
                TimerThreshold,
                DefaultTurnTime,
                DefaultHeuristic,
                SelfWeight,
                SpacesOppoWeight,
                CenterOppoWeight,
                RatioOppoWeight,
                TournamentNumMatches,
                TournamentTimeLimit,
                TournamentBoardWidth,
                TournamentBoardHeight,
                TournamentOpeningMoves,
                TournamentMinimaxDepth,
                TournamentAlphaBetaDepth,
                TournamentTestHeuristics};
    }

    void restore() const
    {
        MessageMode              = messageMode;
        DefaultSearchMethod      = defaultSearchMethod;
        DefaultIterative         = defaultIterative;
        DefaultSearchDepth       = defaultSearchDepth;
        MaxSearchDepth           = maxSearchDepth;
        TimerThreshold           = timerThreshold;
        DefaultTurnTime          = defaultTurnTime;
        DefaultHeuristic         = defaultHeuristic;
        SelfWeight               = selfWeight;
        SpacesOppoWeight         = spacesOppoWeight;
        CenterOppoWeight         = centerOppoWeight;
        RatioOppoWeight          = ratioOppoWeight;
        TournamentNumMatches     = tournamentNumMatches;
        TournamentTimeLimit      = tournamentTimeLimit;
        TournamentBoardWidth     = tournamentBoardWidth;
        TournamentBoardHeight    = tournamentBoardHeight;
        TournamentOpeningMoves   = tournamentOpeningMoves;
        TournamentMinimaxDepth   = tournamentMinimaxDepth;
        TournamentAlphaBetaDepth = tournamentAlphaBetaDepth;
        TournamentTestHeuristics = tournamentTestHeuristics;
    }
};

void readRequirement(const cpptoml::table &t);
void readGeneral(const cpptoml::table &t);
void readSearch(const cpptoml::table &t);
void readEvaluation(const cpptoml::table &t);
void readTournament(const cpptoml::table &t);

}  // namespace Config

bool Config::loadConfig(std::istream &configStream)
{
    const Snapshot previous = Snapshot::take();

    try {
        auto c = cpptoml::parser(configStream).parse();

        if (auto requirement = c->get_table("requirement"))
            readRequirement(*requirement);

        if (auto general = c->get_table("general"))
            readGeneral(*general);

        if (auto search = c->get_table("search"))
            readSearch(*search);

        if (auto evaluation = c->get_table("evaluation"))
            readEvaluation(*evaluation);

        if (auto tournament = c->get_table("tournament"))
            readTournament(*tournament);
    }
    catch (const std::exception &e) {
        ERRORL("Failed to load config: " << e.what());
        previous.restore();
        return false;
    }

    return true;
}

/// Read requirement table of the config.
/// This is used to check if the config file is suitable for current version of Isola.
void Config::readRequirement(const cpptoml::table &t)
{
    auto [major, minor, revision] = getVersionNumbers();
    uint64_t isolaVer = ((uint64_t)major << 32) | ((uint64_t)minor << 16) | (uint64_t)revision;
    if (auto minVer = t.get_array_of<int64_t>("min_version")) {
        if (minVer->size() != 3)
            throw std::runtime_error("illegal min_version");
        uint64_t cfgVer = ((*minVer)[0] << 32) | ((*minVer)[1] << 16) | (*minVer)[2];
        if (cfgVer > isolaVer)
            throw std::runtime_error("config requires newer version of isola");
    }
    if (auto maxVer = t.get_array_of<int64_t>("max_version")) {
        if (maxVer->size() != 3)
            throw std::runtime_error("illegal max_version");
        uint64_t cfgVer = ((*maxVer)[0] << 32) | ((*maxVer)[1] << 16) | (*maxVer)[2];
        if (cfgVer < isolaVer)
            throw std::runtime_error("config requires older version of isola");
    }
}

/// Read general table of the config.
void Config::readGeneral(const cpptoml::table &t)
{
    if (t.get_as<std::string>("message_mode")) {
        std::string msgModeStr = *t.get_as<std::string>("message_mode");
        if (msgModeStr == "normal")
            MessageMode = MsgMode::NORMAL;
        else if (msgModeStr == "brief")
            MessageMode = MsgMode::BRIEF;
        else {
            if (msgModeStr != "none")
                MESSAGEL("Warning: unknown message mode [" << msgModeStr << "], reset to [none].");
            MessageMode = MsgMode::NONE;
        }
    }
}

/// Read search table of the config.
void Config::readSearch(const cpptoml::table &t)
{
    if (auto v = t.get_as<std::string>("default_method")) {
        if (*v == "minimax")
            DefaultSearchMethod = SearchMethod::MINIMAX;
        else if (*v == "alphabeta")
            DefaultSearchMethod = SearchMethod::ALPHABETA;
        else {
            MESSAGEL("Warning: unknown search method [" << *v << "], reset to [alphabeta].");
            DefaultSearchMethod = SearchMethod::ALPHABETA;
        }
    }

    if (auto v = t.get_as<std::string>("default_heuristic")) {
        try {
            DefaultHeuristic = Evaluation::parseHeuristic(*v);
        }
        catch (const std::invalid_argument &) {
            MESSAGEL("Warning: unknown heuristic [" << *v << "], reset to ["
                                                     << Evaluation::Heuristic::MOVE_DIFF_FROM_CENTER
                                                     << "].");
            DefaultHeuristic = Evaluation::Heuristic::MOVE_DIFF_FROM_CENTER;
        }
    }

    DefaultIterative   = t.get_as<bool>("iterative").value_or(DefaultIterative);
    DefaultSearchDepth = t.get_as<int>("search_depth").value_or(DefaultSearchDepth);
    MaxSearchDepth     = t.get_as<int>("max_search_depth").value_or(MaxSearchDepth);
    TimerThreshold     = t.get_as<int64_t>("timer_threshold").value_or(TimerThreshold);
    DefaultTurnTime    = t.get_as<int64_t>("turn_time").value_or(DefaultTurnTime);

    if (DefaultSearchDepth < 1)
        throw std::runtime_error("search_depth must be at least 1");
    if (MaxSearchDepth < 1)
        throw std::runtime_error("max_search_depth must be at least 1");
    if (TimerThreshold < 0)
        throw std::runtime_error("timer_threshold must not be negative");
    if (DefaultTurnTime < 0)
        throw std::runtime_error("turn_time must not be negative");
}

/// Read evaluation table of the config.
void Config::readEvaluation(const cpptoml::table &t)
{
    SelfWeight       = t.get_as<double>("self_weight").value_or(SelfWeight);
    SpacesOppoWeight = t.get_as<double>("spaces_oppo_weight").value_or(SpacesOppoWeight);
    CenterOppoWeight = t.get_as<double>("center_oppo_weight").value_or(CenterOppoWeight);
    RatioOppoWeight  = t.get_as<double>("ratio_oppo_weight").value_or(RatioOppoWeight);

    if (RatioOppoWeight == 0.0)
        throw std::runtime_error("ratio_oppo_weight must not be zero");
}

/// Read tournament table of the config.
void Config::readTournament(const cpptoml::table &t)
{
    TournamentNumMatches   = t.get_as<int>("num_matches").value_or(TournamentNumMatches);
    TournamentTimeLimit    = t.get_as<int64_t>("time_limit").value_or(TournamentTimeLimit);
    TournamentBoardWidth   = t.get_as<int>("board_width").value_or(TournamentBoardWidth);
    TournamentBoardHeight  = t.get_as<int>("board_height").value_or(TournamentBoardHeight);
    TournamentOpeningMoves = t.get_as<int>("opening_moves").value_or(TournamentOpeningMoves);
    TournamentMinimaxDepth = t.get_as<int>("minimax_depth").value_or(TournamentMinimaxDepth);
    TournamentAlphaBetaDepth =
        t.get_as<int>("alphabeta_depth").value_or(TournamentAlphaBetaDepth);

    if (auto names = t.get_array_of<std::string>("test_heuristics")) {
        TournamentTestHeuristics.clear();
        for (const std::string &name : *names)
            TournamentTestHeuristics.push_back(Evaluation::parseHeuristic(name));
    }

    if (TournamentNumMatches < 1)
        throw std::runtime_error("num_matches must be at least 1");
    if (TournamentTimeLimit <= 0)
        throw std::runtime_error("time_limit must be positive");
    if (TournamentBoardWidth < MIN_BOARD_SIZE || TournamentBoardWidth > MAX_BOARD_SIZE
        || TournamentBoardHeight < MIN_BOARD_SIZE || TournamentBoardHeight > MAX_BOARD_SIZE)
        throw std::runtime_error("tournament board size out of range");
    if (TournamentOpeningMoves < 0)
        throw std::runtime_error("opening_moves must not be negative");
    if (TournamentMinimaxDepth < 1 || TournamentAlphaBetaDepth < 1)
        throw std::runtime_error("reference opponent depth must be at least 1");
}
