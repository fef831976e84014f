/*
 * Copyright (C) 2025 Emeric Poupon
 *
 * This file is part of Jukebox.
 *
 * Jukebox is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Jukebox is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Jukebox.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <random>
#include <string>

namespace jukebox::core::random
{
    using RandGenerator = std::mt19937;
    RandGenerator& getRandGenerator();

    template<typename It>
    void shuffle(It begin, It end)
    {
        std::shuffle(begin, end, getRandGenerator());
    }

    // lower case hexadecimal string made of byteCount random bytes
    std::string generateHexToken(std::size_t byteCount);
} // namespace jukebox::core::random
