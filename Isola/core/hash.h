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

#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <xxhash.h>

namespace Hash {

/// XXHasher accumulates trivially copyable values into a 64-bit XXH64 digest.
class XXHasher
{
public:
    explicit XXHasher(uint64_t seed = 0) : state(XXH64_createState())
    {
        XXH64_reset(state, seed);
    }
    XXHasher(const XXHasher &)            = delete;
    XXHasher &operator=(const XXHasher &) = delete;
    ~XXHasher() { XXH64_freeState(state); }

    void update(const void *data, size_t size) { XXH64_update(state, data, size); }

    template <typename T>
    XXHasher &operator<<(const T &value)
    {
        static_assert(std::is_trivially_copyable_v<T>, "only raw bytes can be hashed");
        update(&value, sizeof(T));
        return *this;
    }

    uint64_t digest() const { return XXH64_digest(state); }

    /// The 64-bit digest folded to 32 bits, for short printing.
    uint32_t digest32() const
    {
        uint64_t h = digest();
        return uint32_t(h >> 32) ^ uint32_t(h);
    }

private:
    XXH64_state_t *state;
};

}  // namespace Hash
