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

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

#include <Wt/Http/Message.h>

namespace jukebox::core::http
{
    struct ClientFailure
    {
        std::optional<int> status; // set if the server answered with a non 200 status
        std::string reason;
    };

    struct ClientRequestParameters
    {
        enum class Priority
        {
            High,
            Normal,
            Low,
        };

        Priority priority{ Priority::Normal };
        std::string relativeUrl;                       // relative to baseUrl used by the client
        std::size_t responseBufferSize{ 1024 * 1024 }; // larger responses are considered as failures

        using OnSuccessFunc = std::function<void(const Wt::Http::Message& msg)>;
        OnSuccessFunc onSuccessFunc;

        using OnFailureFunc = std::function<void(const ClientFailure& failure)>;
        OnFailureFunc onFailureFunc;

        using OnAbortFunc = std::function<void()>;
        OnAbortFunc onAbortFunc;
    };

    struct ClientPOSTRequestParameters final : public ClientRequestParameters
    {
        Wt::Http::Message message;
    };
} // namespace jukebox::core::http
