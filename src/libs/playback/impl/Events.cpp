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

#include "playback/Events.hpp"

#include <type_traits>

#include <Wt/Json/Array.h>
#include <Wt/Json/Value.h>

namespace jukebox::playback
{
    namespace
    {
        template<typename T>
        inline constexpr bool alwaysFalse{ false };

        Wt::Json::Value toJsonValue(const std::optional<std::string>& str)
        {
            if (!str)
                return Wt::Json::Value::Null;

            return Wt::Json::Value{ *str };
        }

        Wt::Json::Object toJson(const resolver::ResolvedMedia& media)
        {
            Wt::Json::Object res;
            res["title"] = Wt::Json::Value{ media.title };
            res["thumbnail"] = toJsonValue(media.thumbnailUrl);
            res["audioUrl"] = Wt::Json::Value{ media.streamUrl };
            res["duration"] = Wt::Json::Value{ media.durationSeconds };
            res["source"] = Wt::Json::Value{ media.sourceLabel };

            return res;
        }

        Wt::Json::Array toJson(const std::vector<QueueItem>& items)
        {
            Wt::Json::Array res;
            for (const QueueItem& item : items)
                res.push_back(toJson(item));

            return res;
        }

        Wt::Json::Object toJson(const events::Status& status)
        {
            Wt::Json::Object res;
            res["paused"] = Wt::Json::Value{ status.paused };
            res["time"] = Wt::Json::Value{ status.time };
            res["duration"] = Wt::Json::Value{ status.duration };
            res["volume"] = Wt::Json::Value{ status.volume };

            if (status.current)
            {
                Wt::Json::Object current;
                current["id"] = Wt::Json::Value{ status.current->id };
                current["title"] = Wt::Json::Value{ status.current->title };
                current["thumbnail"] = toJsonValue(status.current->thumbnailUrl);
                current["source"] = Wt::Json::Value{ status.current->source };
                res["current"] = std::move(current);
            }
            else
                res["current"] = Wt::Json::Value::Null;

            return res;
        }
    } // namespace

    std::string_view getItemStatusName(ItemStatus status)
    {
        switch (status)
        {
        case ItemStatus::Pending:
            return "loading";
        case ItemStatus::Ready:
            return "ready";
        case ItemStatus::Error:
            return "error";
        }

        return "unknown";
    }

    std::string_view getEventName(const Event& event)
    {
        return std::visit([](const auto& e) -> std::string_view {
            using T = std::decay_t<decltype(e)>;

            if constexpr (std::is_same_v<T, events::ItemRemoved>)
                return "item_removed";
            else if constexpr (std::is_same_v<T, events::QueueUpdate>)
                return "queue_update";
            else if constexpr (std::is_same_v<T, events::QueueRefreshed>)
                return "queue_refreshed";
            else if constexpr (std::is_same_v<T, events::QueueCleared>)
                return "queue_cleared";
            else if constexpr (std::is_same_v<T, events::Status>)
                return "status";
            else if constexpr (std::is_same_v<T, events::AutoplayToggled>)
                return "autoplay_toggled";
            else if constexpr (std::is_same_v<T, events::CredentialRefreshNeeded>)
                return "show_cookies_modal";
            else
                static_assert(alwaysFalse<T>, "unhandled event type");
        },
            event);
    }

    Wt::Json::Object toJson(const QueueItem& item)
    {
        Wt::Json::Object res;
        res["id"] = Wt::Json::Value{ item.id };
        res["url"] = Wt::Json::Value{ item.sourceUrl };
        res["status"] = Wt::Json::Value{ std::string{ getItemStatusName(item.status) } };
        if (item.resolved)
            res["details"] = toJson(*item.resolved);
        else
            res["details"] = Wt::Json::Value::Null;

        return res;
    }

    Wt::Json::Object toJson(const Event& event)
    {
        return std::visit([](const auto& e) {
            using T = std::decay_t<decltype(e)>;

            Wt::Json::Object res;
            if constexpr (std::is_same_v<T, events::ItemRemoved>)
            {
                res["id"] = Wt::Json::Value{ e.id };
            }
            else if constexpr (std::is_same_v<T, events::QueueUpdate>)
            {
                res["id"] = Wt::Json::Value{ e.item.id };
                res["item"] = toJson(e.item);
            }
            else if constexpr (std::is_same_v<T, events::QueueRefreshed>)
            {
                res["items"] = toJson(e.items);
            }
            else if constexpr (std::is_same_v<T, events::QueueCleared>)
            {
                // no payload
            }
            else if constexpr (std::is_same_v<T, events::Status>)
            {
                res = toJson(e);
            }
            else if constexpr (std::is_same_v<T, events::AutoplayToggled>)
            {
                res["enabled"] = Wt::Json::Value{ e.enabled };
            }
            else if constexpr (std::is_same_v<T, events::CredentialRefreshNeeded>)
            {
                res["url"] = Wt::Json::Value{ e.url };
                res["item_id"] = Wt::Json::Value{ e.itemId };
            }
            else
                static_assert(alwaysFalse<T>, "unhandled event type");

            return res;
        },
            event);
    }

    events::Status makeStatusEvent(const PlaybackSnapshot& snapshot)
    {
        events::Status status;
        status.paused = snapshot.paused;
        status.time = snapshot.positionSeconds;
        status.duration = snapshot.durationSeconds;
        status.volume = snapshot.volumePercent;

        if (snapshot.nowPlaying)
        {
            status.current = events::Status::Current{
                .id = snapshot.nowPlaying->id,
                .title = snapshot.nowPlaying->media.title,
                .thumbnailUrl = snapshot.nowPlaying->media.thumbnailUrl,
                .source = snapshot.nowPlaying->media.sourceLabel,
            };
        }

        return status;
    }
} // namespace jukebox::playback
