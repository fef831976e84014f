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

#include "playback/IPlaybackService.hpp"

#include "PlaybackDirector.hpp"
#include "PlaybackState.hpp"
#include "QueueStore.hpp"
#include "ResolutionWorker.hpp"
#include "StatePoller.hpp"

namespace jukebox::playback
{
    class PlaybackService final : public IPlaybackService
    {
    public:
        PlaybackService(const PlaybackServiceParameters& params,
            player::IPlayerSupervisor& supervisor,
            player::IPlayerChannel& channel,
            resolver::IResolver& resolver,
            IEventPublisher& publisher);
        ~PlaybackService() override;
        PlaybackService(const PlaybackService&) = delete;
        PlaybackService& operator=(const PlaybackService&) = delete;

    private:
        ItemId submit(std::string_view url) override;
        void remove(const ItemId& id) override;
        void moveUp(const ItemId& id) override;
        void moveDown(const ItemId& id) override;
        void reorder(std::size_t oldIndex, std::size_t newIndex) override;
        void shuffle() override;
        void clearQueue() override;
        std::vector<QueueItem> getQueue() const override;

        bool playNow(const ItemId& id) override;
        void togglePause() override;
        void stop() override;
        void skip() override;
        void setVolume(double volumePercent) override;
        void seek(double percent) override;
        PlaybackSnapshot getPlaybackSnapshot() const override;

        bool toggleAutoplay() override;
        bool isAutoplayEnabled() const override;

        void search(std::string_view query, resolver::IResolver::SearchCallback callback) override;

        DebugSnapshot getDebugSnapshot() override;
        void shutdown() override;

        player::IPlayerSupervisor& _supervisor;
        player::IPlayerChannel& _channel;
        resolver::IResolver& _resolver;
        IEventPublisher& _publisher;

        QueueStore _queue;
        PlaybackState _state;
        PlaybackDirector _director;
        ResolutionWorker _worker;
        StatePoller _poller;
    };
} // namespace jukebox::playback
