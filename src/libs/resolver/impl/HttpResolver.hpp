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

#include <memory>

#include "core/http/IClient.hpp"
#include "resolver/IResolver.hpp"

namespace jukebox::resolver
{
    class HttpResolver final : public IResolver
    {
    public:
        HttpResolver(std::unique_ptr<core::http::IClient> client);
        ~HttpResolver() override = default;
        HttpResolver(const HttpResolver&) = delete;
        HttpResolver& operator=(const HttpResolver&) = delete;

    private:
        void resolve(std::string_view url, ResolveCallback callback) override;
        void search(std::string_view query, SearchCallback callback) override;

        std::unique_ptr<core::http::IClient> _client;
    };
} // namespace jukebox::resolver
