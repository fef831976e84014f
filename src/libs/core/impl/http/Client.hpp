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

#include "core/http/IClient.hpp"

#include "SendQueue.hpp"

namespace jukebox::core::http
{
    class Client final : public IClient
    {
    public:
        Client(boost::asio::io_context& ioContext, std::string_view baseUrl, std::chrono::seconds timeout)
            : _sendQueue{ ioContext, baseUrl, timeout }
        {
        }

    private:
        void sendPOSTRequest(ClientPOSTRequestParameters&& request) override;

        SendQueue _sendQueue;
    };
} // namespace jukebox::core::http
