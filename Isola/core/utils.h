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

#include <cstdint>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

// -------------------------------------------------
// Time

/// Time is a time point or duration in milliseconds.
typedef int64_t Time;

/// Milliseconds on a monotonic clock.
Time now();

// -------------------------------------------------
// Array and container helpers

template <typename ElemType, int Size>
constexpr int arraySize(ElemType (&)[Size])
{
    return Size;
}

template <typename Container, typename ElemType>
bool contains(const Container &c, ElemType elem)
{
    for (const auto &e : c)
        if (e == elem)
            return true;
    return false;
}

// -------------------------------------------------
// String helpers

std::string &trimInplace(std::string &s);
std::string &upperInplace(std::string &s);
std::string &lowerInplace(std::string &s);

/// Split s at any of the delimiter characters. Empty pieces are dropped
/// unless includeEmpty is set.
std::vector<std::string_view>
split(std::string_view s, std::string_view delims = "\n", bool includeEmpty = false);

/// Human readable durations and counts for search messages, e.g. "12s", "345K".
std::string timeText(Time time);
std::string nodesText(uint64_t nodes);
std::string speedText(uint64_t nodesPerSecond);

// -------------------------------------------------
// Pseudo random number generator

/// PRNG is the SplitMix64 generator, see <https://xoroshiro.di.unimi.it/splitmix64.c>.
/// It satisfies UniformRandomBitGenerator, and the same seed always gives the
/// same sequence on every platform.
class PRNG
{
public:
    typedef uint64_t result_type;

    static constexpr uint64_t min() { return 0; }
    static constexpr uint64_t max() { return UINT64_MAX; }

    explicit PRNG(uint64_t seed = now()) : state(seed) {}

    uint64_t operator()()
    {
        uint64_t z = (state += 0x9e3779b97f4a7c15);
        z          = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9;
        z          = (z ^ (z >> 27)) * 0x94d049bb133111eb;
        return z ^ (z >> 31);
    }

private:
    uint64_t state;
};

// -------------------------------------------------
// Engine version

std::tuple<int, int, int> getVersionNumbers();

/// Version string with build info, e.g. "0.3.2 [g++ 12.2.0 on Linux]".
std::string getVersionInfo();

/// Engine description sent in reply to ABOUT.
std::string getEngineInfo();
