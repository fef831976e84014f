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
#include <string_view>

#include "resolver/IResolver.hpp"

namespace jukebox::resolver
{
    class ResponseParser
    {
    public:
        // submittedUrl is used as source label if the response has none
        static ResolveResult parseResolveResponse(std::string_view msgBody, std::string_view submittedUrl);

        // invalid entries are skipped
        static SearchResult parseSearchResponse(std::string_view msgBody);

        // transport errors that usually come from stale credentials on the resolver side
        static bool isCredentialRelatedError(std::string_view errorMessage);
        static ResolveError makeError(std::string message, std::optional<int> httpStatus);
    };
} // namespace jukebox::resolver
