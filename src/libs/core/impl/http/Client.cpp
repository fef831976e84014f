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

#include "Client.hpp"

namespace jukebox::core::http
{
    std::unique_ptr<IClient> createClient(boost::asio::io_context& ioContext, std::string_view baseUrl, std::chrono::seconds timeout)
    {
        return std::make_unique<Client>(ioContext, baseUrl, timeout);
    }

    void Client::sendPOSTRequest(ClientPOSTRequestParameters&& POSTParams)
    {
        _sendQueue.sendRequest(std::make_unique<ClientRequest>(std::move(POSTParams)));
    }
} // namespace jukebox::core::http
