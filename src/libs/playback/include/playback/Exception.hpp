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

#include <cstddef>
#include <string>

#include "core/Exception.hpp"

namespace jukebox::playback
{
    class PlaybackException : public core::JukeboxException
    {
    public:
        using core::JukeboxException::JukeboxException;
    };

    class ItemNotFoundException : public PlaybackException
    {
    public:
        ItemNotFoundException(const std::string& itemId)
            : PlaybackException{ "Item '" + itemId + "' not found" }
        {
        }
    };

    class ItemNotReadyException : public PlaybackException
    {
    public:
        ItemNotReadyException(const std::string& itemId)
            : PlaybackException{ "Item '" + itemId + "' is not ready" }
        {
        }
    };

    class IndexOutOfRangeException : public PlaybackException
    {
    public:
        IndexOutOfRangeException(std::size_t oldIndex, std::size_t newIndex, std::size_t queueSize)
            : PlaybackException{ "Index out of range: oldIndex = " + std::to_string(oldIndex) + ", newIndex = " + std::to_string(newIndex) + ", queue length = " + std::to_string(queueSize) }
        {
        }
    };
} // namespace jukebox::playback
