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
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "resolver/ResolvedMedia.hpp"

namespace jukebox::resolver
{
    using ResolveResult = std::variant<ResolvedMedia, ResolveError>;
    using SearchResult = std::variant<std::vector<SearchEntry>, ResolveError>;

    // Turns a media URL or search text into playable stream metadata
    // Callbacks are called exactly once, from the io_context threads
    class IResolver
    {
    public:
        virtual ~IResolver() = default;

        using ResolveCallback = std::function<void(const ResolveResult& result)>;
        virtual void resolve(std::string_view url, ResolveCallback callback) = 0;

        using SearchCallback = std::function<void(const SearchResult& result)>;
        virtual void search(std::string_view query, SearchCallback callback) = 0;
    };

    struct ResolverParameters
    {
        std::string url;
        std::chrono::seconds timeout{ 30 };
    };

    std::unique_ptr<IResolver> createResolver(boost::asio::io_context& ioContext, const ResolverParameters& params);
} // namespace jukebox::resolver
