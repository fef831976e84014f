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

#include "PlaybackState.hpp"

#include <algorithm>

namespace jukebox::playback
{
    PlaybackState::PlaybackState(double initialVolume)
    {
        _snapshot.volumePercent = std::clamp(initialVolume, 0., 100.);
    }

    PlaybackSnapshot PlaybackState::getSnapshot() const
    {
        const std::scoped_lock lock{ _mutex };
        return _snapshot;
    }

    std::optional<ItemId> PlaybackState::getNowPlayingId() const
    {
        const std::scoped_lock lock{ _mutex };

        if (!_snapshot.nowPlaying)
            return std::nullopt;

        return _snapshot.nowPlaying->id;
    }

    void PlaybackState::startPlaying(const ItemId& id, const resolver::ResolvedMedia& media)
    {
        const std::scoped_lock lock{ _mutex };

        _snapshot.nowPlaying = NowPlaying{ .id = id, .media = media };
        _snapshot.paused = false;
        _snapshot.positionSeconds = 0;
        _snapshot.durationSeconds = media.durationSeconds;
        _snapshot.awaitingLoadConfirmation = true;
        _awaitingTicks = 0;
    }

    void PlaybackState::clearNowPlaying()
    {
        const std::scoped_lock lock{ _mutex };

        _snapshot.nowPlaying.reset();
        _snapshot.paused = true;
        _snapshot.positionSeconds = 0;
        _snapshot.durationSeconds = 0;
        _snapshot.awaitingLoadConfirmation = false;
        _awaitingTicks = 0;
    }

    void PlaybackState::setIdle()
    {
        const std::scoped_lock lock{ _mutex };

        _snapshot.paused = true;
        _snapshot.positionSeconds = 0;
        _snapshot.durationSeconds = 0;
    }

    void PlaybackState::setPlaying(bool paused, double positionSeconds, double durationSeconds)
    {
        const std::scoped_lock lock{ _mutex };

        _snapshot.paused = paused;
        _snapshot.positionSeconds = positionSeconds;
        _snapshot.durationSeconds = durationSeconds;
        _snapshot.awaitingLoadConfirmation = false;
        _awaitingTicks = 0;
    }

    void PlaybackState::setVolume(double volumePercent)
    {
        const std::scoped_lock lock{ _mutex };
        _snapshot.volumePercent = std::clamp(volumePercent, 0., 100.);
    }

    std::size_t PlaybackState::incrementAwaitingTicks()
    {
        const std::scoped_lock lock{ _mutex };
        return ++_awaitingTicks;
    }

    void PlaybackState::abandonLoadConfirmation()
    {
        const std::scoped_lock lock{ _mutex };

        _snapshot.awaitingLoadConfirmation = false;
        _awaitingTicks = 0;
    }
} // namespace jukebox::playback
