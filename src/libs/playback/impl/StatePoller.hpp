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
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string_view>

#include <boost/asio/steady_timer.hpp>
#include <Wt/WIOService.h>

namespace jukebox::player
{
    class IPlayerChannel;
}

namespace jukebox::playback
{
    class IEventPublisher;
    class PlaybackDirector;
    class PlaybackState;

    struct StatePollerParameters
    {
        std::chrono::milliseconds period{ 500 };
        std::size_t loadConfirmationTicks{ 20 }; // idle ticks before a load is considered as failed
    };

    // Reconciles the player status into the playback state on a fixed period, and detects track ends
    class StatePoller
    {
    public:
        StatePoller(player::IPlayerChannel& channel, PlaybackState& state, PlaybackDirector& director, IEventPublisher& publisher, const StatePollerParameters& params);
        ~StatePoller();
        StatePoller(const StatePoller&) = delete;
        StatePoller& operator=(const StatePoller&) = delete;

        void start();
        void stop();

        // Single poll iteration, never throws
        void tick();

    private:
        void scheduleNextTick();
        void doTick();
        std::optional<bool> getBoolProperty(std::string_view name);
        std::optional<double> getDoubleProperty(std::string_view name);

        player::IPlayerChannel& _channel;
        PlaybackState& _state;
        PlaybackDirector& _director;
        IEventPublisher& _publisher;
        const StatePollerParameters _params;

        std::mutex _controlMutex;
        std::atomic<bool> _running{};
        Wt::WIOService _ioService;
        boost::asio::steady_timer _pollTimer{ _ioService };
    };
} // namespace jukebox::playback
