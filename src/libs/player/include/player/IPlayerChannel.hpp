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
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <Wt/Json/Array.h>
#include <Wt/Json/Value.h>

namespace jukebox::player
{
    class IPlayerSupervisor;

    struct PlayerResponse
    {
        std::string error; // "success" or a player error code
        Wt::Json::Value data;

        bool isSuccess() const { return error == "success"; }
    };

    // Request/response link to the player control interface
    // Calls are serialized, each one waits for exactly one response.
    // An empty result means the player could not be reached in time: callers must treat it as "unknown"
    class IPlayerChannel
    {
    public:
        virtual ~IPlayerChannel() = default;

        virtual std::optional<PlayerResponse> sendCommand(const Wt::Json::Array& command) = 0;

        // empty if unavailable or if the player reported an error
        virtual std::optional<Wt::Json::Value> getProperty(std::string_view name) = 0;

        // true if acknowledged by the player
        virtual bool setProperty(std::string_view name, const Wt::Json::Value& value) = 0;
    };

    // Command made of string atoms only
    Wt::Json::Array makeCommand(std::initializer_list<std::string_view> atoms);

    std::unique_ptr<IPlayerChannel> createPlayerChannel(IPlayerSupervisor& supervisor, std::chrono::milliseconds callTimeout);
} // namespace jukebox::player
