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

#pragma once

#include "../core/types.h"
#include "../core/utils.h"

namespace Search {

/// TimeControl class tracks the time budget of one turn. A turn time of zero
/// (or less) means the turn is unlimited and the timer never expires.
class TimeControl
{
public:
    explicit TimeControl(Time turnTime = 0) { init(turnTime); }

    /// Start the timer of a new turn.
    /// @param turnTime Time budget of this turn in milliseconds, 0 for unlimited.
    void init(Time turnTime);

    /// Time left in this turn, which becomes negative once the budget is overrun.
    Time timeLeft() const;

    /// Check if the time left falls below the threshold.
    /// @param threshold Milliseconds reserved for returning a move.
    bool isTimeup(Time threshold) const { return !unlimited() && timeLeft() < threshold; }

    bool unlimited() const { return turnTime <= 0; }
    Time turn() const { return turnTime; }
    Time elapsed() const { return now() - startTime; }

private:
    Time startTime;
    Time turnTime;
};

}  // namespace Search
