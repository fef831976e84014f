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

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <Wt/Json/Object.h>

#include "playback/PlaybackSnapshot.hpp"
#include "playback/QueueItem.hpp"

namespace jukebox::playback
{
    namespace events
    {
        struct ItemRemoved
        {
            ItemId id;
        };

        struct QueueUpdate
        {
            QueueItem item;
        };

        struct QueueRefreshed
        {
            std::vector<QueueItem> items;
        };

        struct QueueCleared
        {
        };

        struct Status
        {
            struct Current
            {
                ItemId id;
                std::string title;
                std::optional<std::string> thumbnailUrl;
                std::string source;
            };

            bool paused{ true };
            double time{};
            double duration{};
            double volume{};
            std::optional<Current> current;
        };

        struct AutoplayToggled
        {
            bool enabled{};
        };

        // The resolver auth material (cookies) probably needs to be refreshed
        struct CredentialRefreshNeeded
        {
            std::string url;
            ItemId itemId;
        };
    } // namespace events

    using Event = std::variant<events::ItemRemoved,
        events::QueueUpdate,
        events::QueueRefreshed,
        events::QueueCleared,
        events::Status,
        events::AutoplayToggled,
        events::CredentialRefreshNeeded>;

    // stable names, to be forwarded as is by transports
    std::string_view getEventName(const Event& event);
    Wt::Json::Object toJson(const Event& event);
    Wt::Json::Object toJson(const QueueItem& item);

    events::Status makeStatusEvent(const PlaybackSnapshot& snapshot);
} // namespace jukebox::playback
