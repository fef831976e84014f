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

namespace jukebox::resolver
{
    // Playable stream and its metadata, never modified once resolved
    struct ResolvedMedia
    {
        std::string title;
        std::optional<std::string> thumbnailUrl;
        std::string streamUrl;
        double durationSeconds{};
        std::string sourceLabel;

        bool operator==(const ResolvedMedia& other) const = default;
    };

    struct SearchEntry
    {
        std::string title;
        std::string uploader;
        std::string url;
        double durationSeconds{};
        std::optional<std::string> thumbnailUrl;
    };

    struct ResolveError
    {
        std::string message;
        bool credentialsLikelyStale{}; // the resolver auth material (cookies) should be refreshed
    };
} // namespace jukebox::resolver
