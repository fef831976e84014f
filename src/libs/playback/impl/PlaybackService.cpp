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

#include "PlaybackService.hpp"

#include <algorithm>

#include <Wt/Json/Array.h>
#include <Wt/Json/Value.h>

#include "core/ILogger.hpp"
#include "player/IPlayerChannel.hpp"
#include "player/IPlayerSupervisor.hpp"
#include "playback/Exception.hpp"

#include "PublishEvent.hpp"

#define LOG(sev, message) JUKEBOX_LOG(SERVICE, sev, "[Playback] " << message)

namespace jukebox::playback
{
    namespace
    {
        Wt::Json::Object toJson(const PlaybackSnapshot& snapshot)
        {
            Wt::Json::Object res;
            if (snapshot.nowPlaying)
            {
                res["now_playing_id"] = Wt::Json::Value{ snapshot.nowPlaying->id };
                res["now_playing_title"] = Wt::Json::Value{ snapshot.nowPlaying->media.title };
            }
            else
            {
                res["now_playing_id"] = Wt::Json::Value::Null;
                res["now_playing_title"] = Wt::Json::Value::Null;
            }
            res["paused"] = Wt::Json::Value{ snapshot.paused };
            res["time"] = Wt::Json::Value{ snapshot.positionSeconds };
            res["duration"] = Wt::Json::Value{ snapshot.durationSeconds };
            res["volume"] = Wt::Json::Value{ snapshot.volumePercent };
            res["awaiting_load_confirmation"] = Wt::Json::Value{ snapshot.awaitingLoadConfirmation };

            return res;
        }
    } // namespace

    Wt::Json::Object toJson(const DebugSnapshot& snapshot)
    {
        Wt::Json::Array items;
        for (const QueueItem& item : snapshot.queue)
        {
            Wt::Json::Object itemObject;
            itemObject["id"] = Wt::Json::Value{ item.id };
            itemObject["status"] = Wt::Json::Value{ std::string{ getItemStatusName(item.status) } };
            itemObject["has_details"] = Wt::Json::Value{ item.resolved.has_value() };
            if (item.resolved)
                itemObject["title"] = Wt::Json::Value{ item.resolved->title };
            else
                itemObject["title"] = Wt::Json::Value::Null;

            items.push_back(std::move(itemObject));
        }

        Wt::Json::Object res;
        res["player_status"] = Wt::Json::Value{ snapshot.playerStatus };
        res["player_endpoint_exists"] = Wt::Json::Value{ snapshot.playerEndpointPresent };
        res["queue_length"] = Wt::Json::Value{ static_cast<long long>(snapshot.queue.size()) };
        res["queue_items"] = std::move(items);
        res["playback_state"] = toJson(snapshot.playback);
        res["autoplay_enabled"] = Wt::Json::Value{ snapshot.autoplayEnabled };

        return res;
    }

    std::unique_ptr<IPlaybackService> createPlaybackService(const PlaybackServiceParameters& params,
        player::IPlayerSupervisor& supervisor,
        player::IPlayerChannel& channel,
        resolver::IResolver& resolver,
        IEventPublisher& publisher)
    {
        return std::make_unique<PlaybackService>(params, supervisor, channel, resolver, publisher);
    }

    PlaybackService::PlaybackService(const PlaybackServiceParameters& params,
        player::IPlayerSupervisor& supervisor,
        player::IPlayerChannel& channel,
        resolver::IResolver& resolver,
        IEventPublisher& publisher)
        : _supervisor{ supervisor }
        , _channel{ channel }
        , _resolver{ resolver }
        , _publisher{ publisher }
        , _queue{ publisher }
        , _state{ params.initialVolume }
        , _director{ channel, _queue, _state, publisher, params.autoplay }
        , _worker{ resolver, _queue, _director, publisher }
        , _poller{ channel, _state, _director, publisher, StatePollerParameters{ .period = params.pollPeriod, .loadConfirmationTicks = params.loadConfirmationTicks } }
    {
        LOG(INFO, "Started, autoplay = " << std::boolalpha << params.autoplay);
        _poller.start();
    }

    PlaybackService::~PlaybackService()
    {
        shutdown();
    }

    ItemId PlaybackService::submit(std::string_view url)
    {
        const ItemId id{ _queue.submit(url) };
        _worker.enqueue(id, url);

        return id;
    }

    void PlaybackService::remove(const ItemId& id)
    {
        if (_queue.removeAt(id))
            return;

        if (_state.getNowPlayingId() != id)
            throw ItemNotFoundException{ id };

        LOG(DEBUG, "Removing playing item '" << id << "'");
        publishEvent(_publisher, events::ItemRemoved{ id });
        _director.stop();
    }

    void PlaybackService::moveUp(const ItemId& id)
    {
        _queue.swapWithPrevious(id);
    }

    void PlaybackService::moveDown(const ItemId& id)
    {
        _queue.swapWithNext(id);
    }

    void PlaybackService::reorder(std::size_t oldIndex, std::size_t newIndex)
    {
        _queue.moveTo(oldIndex, newIndex);
    }

    void PlaybackService::shuffle()
    {
        _queue.shuffleExceptLeading(_state.getNowPlayingId());
    }

    void PlaybackService::clearQueue()
    {
        _queue.clear();
        _director.stop();
    }

    std::vector<QueueItem> PlaybackService::getQueue() const
    {
        return _queue.getItems();
    }

    bool PlaybackService::playNow(const ItemId& id)
    {
        const std::optional<QueueItem> item{ _queue.findItem(id) };
        if (!item)
            throw ItemNotFoundException{ id };
        if (item->status != ItemStatus::Ready)
            throw ItemNotReadyException{ id };

        _queue.moveToFront(id);
        return _director.playItem(*item);
    }

    void PlaybackService::togglePause()
    {
        const std::optional<player::PlayerResponse> response{ _channel.sendCommand(player::makeCommand({ "cycle", "pause" })) };
        if (!response || !response->isSuccess())
            LOG(ERROR, "Cannot toggle pause");
    }

    void PlaybackService::stop()
    {
        _director.stop();
    }

    void PlaybackService::skip()
    {
        _director.playNext();
    }

    void PlaybackService::setVolume(double volumePercent)
    {
        const double volume{ std::clamp(volumePercent, 0., 100.) };

        if (!_channel.setProperty("volume", Wt::Json::Value{ volume }))
            LOG(ERROR, "Cannot set volume to " << volume);

        _state.setVolume(volume);
    }

    void PlaybackService::seek(double percent)
    {
        const double position{ std::clamp(percent, 0., 100.) };

        if (!_channel.setProperty("percent-pos", Wt::Json::Value{ position }))
            LOG(ERROR, "Cannot seek to " << position << "%");
    }

    PlaybackSnapshot PlaybackService::getPlaybackSnapshot() const
    {
        return _state.getSnapshot();
    }

    bool PlaybackService::toggleAutoplay()
    {
        return _director.toggleAutoplay();
    }

    bool PlaybackService::isAutoplayEnabled() const
    {
        return _director.isAutoplayEnabled();
    }

    void PlaybackService::search(std::string_view query, resolver::IResolver::SearchCallback callback)
    {
        if (query.empty())
            throw PlaybackException{ "Empty search query" };

        _resolver.search(query, std::move(callback));
    }

    DebugSnapshot PlaybackService::getDebugSnapshot()
    {
        DebugSnapshot snapshot;
        snapshot.playerStatus = _supervisor.getStatusDescription();
        snapshot.playerEndpointPresent = _supervisor.isIpcEndpointPresent();
        snapshot.queue = _queue.getItems([&] {
            snapshot.playback = _state.getSnapshot();
        });
        snapshot.autoplayEnabled = _director.isAutoplayEnabled();

        return snapshot;
    }

    void PlaybackService::shutdown()
    {
        _poller.stop();
        _worker.stop();

        LOG(DEBUG, "Shut down");
    }
} // namespace jukebox::playback
