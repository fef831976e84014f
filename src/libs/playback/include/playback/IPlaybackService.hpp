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

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <Wt/Json/Object.h>

#include "playback/PlaybackSnapshot.hpp"
#include "playback/QueueItem.hpp"
#include "resolver/IResolver.hpp"

namespace jukebox::player
{
    class IPlayerChannel;
    class IPlayerSupervisor;
} // namespace jukebox::player

namespace jukebox::playback
{
    class IEventPublisher;

    struct DebugSnapshot
    {
        std::string playerStatus;
        bool playerEndpointPresent{};
        std::vector<QueueItem> queue;
        PlaybackSnapshot playback;
        bool autoplayEnabled{};
    };
    Wt::Json::Object toJson(const DebugSnapshot& snapshot);

    // Control surface of the jukebox
    // Unknown ids raise ItemNotFoundException, invalid indexes raise IndexOutOfRangeException
    class IPlaybackService
    {
    public:
        virtual ~IPlaybackService() = default;

        // Queue
        virtual ItemId submit(std::string_view url) = 0;
        virtual void remove(const ItemId& id) = 0;
        virtual void moveUp(const ItemId& id) = 0;
        virtual void moveDown(const ItemId& id) = 0;
        virtual void reorder(std::size_t oldIndex, std::size_t newIndex) = 0;
        virtual void shuffle() = 0;
        virtual void clearQueue() = 0;
        virtual std::vector<QueueItem> getQueue() const = 0;

        // Playback
        // Throws ItemNotReadyException. Returns false if the player did not accept the item
        virtual bool playNow(const ItemId& id) = 0;
        virtual void togglePause() = 0;
        virtual void stop() = 0;
        virtual void skip() = 0;
        virtual void setVolume(double volumePercent) = 0;
        virtual void seek(double percent) = 0;
        virtual PlaybackSnapshot getPlaybackSnapshot() const = 0;

        virtual bool toggleAutoplay() = 0;
        virtual bool isAutoplayEnabled() const = 0;

        virtual void search(std::string_view query, resolver::IResolver::SearchCallback callback) = 0;

        virtual DebugSnapshot getDebugSnapshot() = 0;

        // Stops polling the player and resolving items. The resolver must be destroyed
        // after this call and before the service
        virtual void shutdown() = 0;
    };

    struct PlaybackServiceParameters
    {
        bool autoplay{ true };
        double initialVolume{ 50 };
        std::chrono::milliseconds pollPeriod{ 500 };
        std::size_t loadConfirmationTicks{ 20 };
    };

    std::unique_ptr<IPlaybackService> createPlaybackService(const PlaybackServiceParameters& params,
        player::IPlayerSupervisor& supervisor,
        player::IPlayerChannel& channel,
        resolver::IResolver& resolver,
        IEventPublisher& publisher);
} // namespace jukebox::playback
