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

#include "StatePoller.hpp"

#include <exception>

#include <Wt/Json/Value.h>

#include "core/ILogger.hpp"
#include "player/IPlayerChannel.hpp"

#include "PlaybackDirector.hpp"
#include "PlaybackState.hpp"
#include "PublishEvent.hpp"

#define LOG(sev, message) JUKEBOX_LOG(PLAYBACK, sev, "[Poller] " << message)

namespace jukebox::playback
{
    StatePoller::StatePoller(player::IPlayerChannel& channel, PlaybackState& state, PlaybackDirector& director, IEventPublisher& publisher, const StatePollerParameters& params)
        : _channel{ channel }
        , _state{ state }
        , _director{ director }
        , _publisher{ publisher }
        , _params{ params }
    {
        _ioService.setThreadCount(1);
    }

    StatePoller::~StatePoller()
    {
        stop();
    }

    void StatePoller::start()
    {
        const std::scoped_lock lock{ _controlMutex };

        LOG(DEBUG, "Starting, period = " << _params.period.count() << " ms");

        _running = true;
        _ioService.post([this] {
            scheduleNextTick();
        });
        _ioService.start();
    }

    void StatePoller::stop()
    {
        const std::scoped_lock lock{ _controlMutex };

        _running = false;
        _ioService.post([this] {
            _pollTimer.cancel();
        });
        _ioService.stop();
    }

    void StatePoller::scheduleNextTick()
    {
        _pollTimer.expires_after(_params.period);
        _pollTimer.async_wait([this](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted || !_running)
                return;

            tick();
            scheduleNextTick();
        });
    }

    void StatePoller::tick()
    {
        try
        {
            doTick();
        }
        catch (const std::exception& e)
        {
            LOG(ERROR, "Poll failed: " << e.what());
        }
    }

    void StatePoller::doTick()
    {
        // end of track is decided on what was known before this tick
        const PlaybackSnapshot previous{ _state.getSnapshot() };
        const bool wasPlaying{ previous.nowPlaying && !previous.paused };

        std::optional<ItemId> endedItemId;
        if (const std::optional<bool> idle{ getBoolProperty("idle-active") })
        {
            if (*idle && previous.awaitingLoadConfirmation)
            {
                if (_state.incrementAwaitingTicks() >= _params.loadConfirmationTicks)
                {
                    LOG(ERROR, "Player failed to start '" << previous.nowPlaying->media.title << "'");
                    _state.abandonLoadConfirmation();
                    _state.setIdle();
                    endedItemId = previous.nowPlaying->id;
                }
            }
            else if (*idle)
            {
                _state.setIdle();
                if (isEndOfTrack(wasPlaying, *idle))
                    endedItemId = previous.nowPlaying->id;
            }
            else
            {
                const bool paused{ getBoolProperty("pause").value_or(previous.paused) };
                const double position{ getDoubleProperty("time-pos").value_or(previous.positionSeconds) };
                const double duration{ getDoubleProperty("duration").value_or(previous.durationSeconds) };
                _state.setPlaying(paused, position, duration);
            }
        }

        // meaningful even if nothing is loaded
        if (const std::optional<double> volume{ getDoubleProperty("volume") })
            _state.setVolume(*volume);

        if (endedItemId)
            _director.onPlaybackEnded(*endedItemId);

        publishEvent(_publisher, makeStatusEvent(_state.getSnapshot()));
    }

    std::optional<bool> StatePoller::getBoolProperty(std::string_view name)
    {
        const std::optional<Wt::Json::Value> value{ _channel.getProperty(name) };
        if (!value || value->type() != Wt::Json::Type::Bool)
            return std::nullopt;

        return static_cast<bool>(*value);
    }

    std::optional<double> StatePoller::getDoubleProperty(std::string_view name)
    {
        const std::optional<Wt::Json::Value> value{ _channel.getProperty(name) };
        if (!value || value->type() != Wt::Json::Type::Number)
            return std::nullopt;

        return static_cast<double>(*value);
    }
} // namespace jukebox::playback
