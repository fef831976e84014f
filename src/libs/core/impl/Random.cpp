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

#include "core/Random.hpp"

#include <iomanip>
#include <sstream>

namespace jukebox::core::random
{
    RandGenerator& getRandGenerator()
    {
        static thread_local std::random_device rd;
        static thread_local RandGenerator randGenerator(rd());

        return randGenerator;
    }

    std::string generateHexToken(std::size_t byteCount)
    {
        std::ostringstream oss;
        std::uniform_int_distribution<unsigned int> byteDist{ 0, 255 };

        for (std::size_t i{}; i < byteCount; ++i)
            oss << std::hex << std::setfill('0') << std::setw(2) << byteDist(getRandGenerator());

        return oss.str();
    }
} // namespace jukebox::core::random
