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

const std::string Config::InternalConfig = R"internalConfig(
[requirement]
min_version = [0,3,0]

[general]
message_mode = "brief"

[search]
default_method = "alphabeta"
default_heuristic = "move_diff_from_center"
iterative = true
search_depth = 3
max_search_depth = 99
timer_threshold = 10
turn_time = 1000

[evaluation]
self_weight = 1.0
spaces_oppo_weight = 2.0
center_oppo_weight = 2.0
ratio_oppo_weight = 1.0

[tournament]
num_matches = 10
time_limit = 150
board_width = 7
board_height = 7
opening_moves = 2
minimax_depth = 3
alphabeta_depth = 5
test_heuristics = ["move_diff_with_spaces", "move_diff_from_center", "ratio_of_moves"]
)internalConfig";
