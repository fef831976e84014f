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

#include <atomic>
#include <mutex>

#include "playback/QueueItem.hpp"

namespace jukebox::player
{
    class IPlayerChannel;
}

namespace jukebox::playback
{
    class IEventPublisher;
    class PlaybackState;
    class QueueStore;

    // Transition policy: decides what plays next and drives the player accordingly
    // Transitions are serialized. They never hold the queue or state locks during player calls
    class PlaybackDirector
    {
    public:
        PlaybackDirector(player::IPlayerChannel& channel, QueueStore& queue, PlaybackState& state, IEventPublisher& publisher, bool autoplay);
        ~PlaybackDirector() = default;
        PlaybackDirector(const PlaybackDirector&) = delete;
        PlaybackDirector& operator=(const PlaybackDirector&) = delete;

        // Returns true if the player acknowledged the load request
        bool playItem(const QueueItem& item);
        void playNext();
        void stop();

        // Plays the item if autoplay is enabled and nothing is playing
        void playIfIdle(const ItemId& id);

        // Called when the player went idle while finishedId was playing
        void onPlaybackEnded(const ItemId& finishedId);

        bool isAutoplayEnabled() const;
        bool toggleAutoplay();

        void publishStatus();

    private:
        bool playItemLocked(const QueueItem& item);
        void playNextLocked();
        void stopLocked();

        player::IPlayerChannel& _channel;
        QueueStore& _queue;
        PlaybackState& _state;
        IEventPublisher& _publisher;

        std::mutex _transitionMutex;
        std::atomic<bool> _autoplay;
    };
} // namespace jukebox::playback
