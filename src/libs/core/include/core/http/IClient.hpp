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
#include <memory>
#include <string_view>

#include <boost/asio/io_context.hpp>

#include "core/http/ClientRequestParameters.hpp"

namespace jukebox::core::http
{
    class IClient
    {
    public:
        virtual ~IClient() = default;

        // Requests are sent one at a time, by priority then by submission order
        virtual void sendPOSTRequest(ClientPOSTRequestParameters&& request) = 0;
    };

    std::unique_ptr<IClient> createClient(boost::asio::io_context& ioContext, std::string_view baseUrl, std::chrono::seconds timeout);
} // namespace jukebox::core::http
