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

#include <optional>

#include "playback/QueueItem.hpp"
#include "resolver/ResolvedMedia.hpp"

namespace jukebox::playback
{
    struct NowPlaying
    {
        ItemId id;
        resolver::ResolvedMedia media; // own copy, the item has left the queue
    };

    struct PlaybackSnapshot
    {
        std::optional<NowPlaying> nowPlaying;
        bool paused{ true };
        double positionSeconds{};
        double durationSeconds{};
        double volumePercent{};

        // set between a successful load request and the first non idle report of the player
        bool awaitingLoadConfirmation{};
    };
} // namespace jukebox::playback
