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

#include "resolver/ResolvedMedia.hpp"

namespace jukebox::playback
{
    // opaque, unique within the queue, stable for the item lifetime
    using ItemId = std::string;

    enum class ItemStatus
    {
        Pending,
        Ready,
        Error,
    };

    // "loading", "ready", "error"
    std::string_view getItemStatusName(ItemStatus status);

    struct QueueItem
    {
        ItemId id;
        std::string sourceUrl;
        ItemStatus status{ ItemStatus::Pending };
        std::optional<resolver::ResolvedMedia> resolved; // always set if status is Ready
    };
} // namespace jukebox::playback
