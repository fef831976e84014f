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

#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/io_context.hpp>
#include <boost/asio/io_context_strand.hpp>

#include <Wt/Http/Client.h>

#include "ClientRequest.hpp"

namespace jukebox::core::http
{
    class SendQueue
    {
    public:
        SendQueue(boost::asio::io_context& ioContext, std::string_view baseUrl, std::chrono::seconds timeout);
        ~SendQueue();

        SendQueue(const SendQueue&) = delete;
        SendQueue& operator=(const SendQueue&) = delete;

        void sendRequest(std::unique_ptr<ClientRequest> request);

    private:
        void abortAllRequests();
        void sendNextQueuedRequest();
        bool sendRequest(const ClientRequest& request);
        void onClientDone(Wt::AsioWrapper::error_code ec, const Wt::Http::Message& msg);
        void onClientAborted(std::unique_ptr<ClientRequest> request);
        void onClientDoneError(std::unique_ptr<ClientRequest> request, Wt::AsioWrapper::error_code ec);
        void onClientDoneSuccess(std::unique_ptr<ClientRequest> request, const Wt::Http::Message& msg);

        enum class State
        {
            Idle,
            Sending,
        };
        void setState(State state);

        boost::asio::io_context& _ioContext;
        boost::asio::io_context::strand _strand{ _ioContext };
        const std::string _baseUrl;

        std::atomic<bool> _abortAllRequests;
        std::atomic<State> _state;
        Wt::Http::Client _client;
        std::map<ClientRequestParameters::Priority, std::deque<std::unique_ptr<ClientRequest>>> _sendQueue;
        std::unique_ptr<ClientRequest> _currentRequest;
    };
} // namespace jukebox::core::http
