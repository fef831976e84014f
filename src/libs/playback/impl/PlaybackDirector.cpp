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

#include "PlaybackDirector.hpp"

#include "core/ILogger.hpp"
#include "player/IPlayerChannel.hpp"
#include "playback/IEventPublisher.hpp"

#include "PlaybackState.hpp"
#include "PublishEvent.hpp"
#include "QueueStore.hpp"

#define LOG(sev, message) JUKEBOX_LOG(PLAYBACK, sev, "[Director] " << message)

namespace jukebox::playback
{
    PlaybackDirector::PlaybackDirector(player::IPlayerChannel& channel, QueueStore& queue, PlaybackState& state, IEventPublisher& publisher, bool autoplay)
        : _channel{ channel }
        , _queue{ queue }
        , _state{ state }
        , _publisher{ publisher }
        , _autoplay{ autoplay }
    {
    }

    bool PlaybackDirector::playItem(const QueueItem& item)
    {
        const std::scoped_lock lock{ _transitionMutex };
        return playItemLocked(item);
    }

    void PlaybackDirector::playNext()
    {
        const std::scoped_lock lock{ _transitionMutex };
        playNextLocked();
    }

    void PlaybackDirector::stop()
    {
        const std::scoped_lock lock{ _transitionMutex };
        stopLocked();
    }

    void PlaybackDirector::playIfIdle(const ItemId& id)
    {
        const std::scoped_lock lock{ _transitionMutex };

        if (!_autoplay || _state.getNowPlayingId())
            return;

        // may have been removed or started in the meantime
        const std::optional<QueueItem> item{ _queue.findItem(id) };
        if (!item || item->status != ItemStatus::Ready)
            return;

        playItemLocked(*item);
    }

    void PlaybackDirector::onPlaybackEnded(const ItemId& finishedId)
    {
        const std::scoped_lock lock{ _transitionMutex };

        // another transition happened in the meantime
        if (_state.getNowPlayingId() != finishedId)
            return;

        LOG(DEBUG, "Playback of '" << finishedId << "' ended");

        if (_autoplay)
        {
            playNextLocked();
        }
        else
        {
            _state.clearNowPlaying();
            publishStatus();
        }
    }

    bool PlaybackDirector::isAutoplayEnabled() const
    {
        return _autoplay;
    }

    bool PlaybackDirector::toggleAutoplay()
    {
        bool enabled{ _autoplay.load() };
        while (!_autoplay.compare_exchange_weak(enabled, !enabled))
            ;

        LOG(INFO, "Autoplay " << (!enabled ? "enabled" : "disabled"));
        publishEvent(_publisher, events::AutoplayToggled{ !enabled });

        return !enabled;
    }

    void PlaybackDirector::publishStatus()
    {
        publishEvent(_publisher, makeStatusEvent(_state.getSnapshot()));
    }

    bool PlaybackDirector::playItemLocked(const QueueItem& item)
    {
        if (!item.resolved)
        {
            LOG(ERROR, "Cannot play item '" << item.id << "': not resolved");
            return false;
        }

        const resolver::ResolvedMedia& media{ *item.resolved };
        LOG(INFO, "Playing '" << media.title << "' (" << item.id << ")");

        const std::optional<player::PlayerResponse> response{ _channel.sendCommand(player::makeCommand({ "loadfile", media.streamUrl, "replace" })) };
        if (!response)
        {
            LOG(ERROR, "Cannot load '" << media.title << "': player unavailable");
            return false;
        }
        if (!response->isSuccess())
        {
            LOG(ERROR, "Cannot load '" << media.title << "': " << response->error);
            return false;
        }

        _queue.takeForPlayback(item.id, [&] {
            _state.startPlaying(item.id, media);
        });

        if (!_channel.setProperty("media-title", Wt::Json::Value{ media.title }))
            LOG(DEBUG, "Cannot set media title");

        publishStatus();
        return true;
    }

    void PlaybackDirector::playNextLocked()
    {
        if (!_autoplay)
        {
            LOG(DEBUG, "Autoplay disabled, not playing next item");
            return;
        }

        const PlaybackSnapshot snapshot{ _state.getSnapshot() };

        if (const std::optional<QueueItem> nextItem{ snapshot.nowPlaying ? _queue.findNextReady() : _queue.findFirstReady() })
        {
            playItemLocked(*nextItem);
            return;
        }

        LOG(DEBUG, "No ready item to play");
        if (snapshot.nowPlaying)
        {
            stopLocked();
            return;
        }

        _state.clearNowPlaying();
        publishStatus();
    }

    void PlaybackDirector::stopLocked()
    {
        const std::optional<player::PlayerResponse> response{ _channel.sendCommand(player::makeCommand({ "stop" })) };
        if (!response || !response->isSuccess())
            LOG(DEBUG, "Stop not acknowledged by player");

        _state.clearNowPlaying();
        publishStatus();
    }
} // namespace jukebox::playback
