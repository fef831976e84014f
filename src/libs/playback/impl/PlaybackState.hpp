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
#include <mutex>
#include <optional>

#include "playback/PlaybackSnapshot.hpp"

namespace jukebox::playback
{
    // What is playing and what the player last reported
    class PlaybackState
    {
    public:
        PlaybackState(double initialVolume);
        ~PlaybackState() = default;
        PlaybackState(const PlaybackState&) = delete;
        PlaybackState& operator=(const PlaybackState&) = delete;

        PlaybackSnapshot getSnapshot() const;
        std::optional<ItemId> getNowPlayingId() const;

        // Enters the "awaiting load confirmation" sub state
        void startPlaying(const ItemId& id, const resolver::ResolvedMedia& media);
        void clearNowPlaying();

        // paused, position and duration reset
        void setIdle();
        // the player reports a loaded media: confirms a pending load
        void setPlaying(bool paused, double positionSeconds, double durationSeconds);
        void setVolume(double volumePercent);

        // Returns the number of consecutive idle ticks spent awaiting the load confirmation
        std::size_t incrementAwaitingTicks();
        void abandonLoadConfirmation();

    private:
        mutable std::mutex _mutex;
        PlaybackSnapshot _snapshot;
        std::size_t _awaitingTicks{};
    };

    // Natural end of track: something was playing and the player is now idle
    constexpr bool isEndOfTrack(bool wasPlaying, bool nowIdle)
    {
        return wasPlaying && nowIdle;
    }
} // namespace jukebox::playback
