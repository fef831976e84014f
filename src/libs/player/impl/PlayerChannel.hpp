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

#include <mutex>

#include <Wt/Json/Object.h>

#include "player/IPlayerChannel.hpp"

namespace jukebox::player
{
    class PlayerChannel final : public IPlayerChannel
    {
    public:
        PlayerChannel(IPlayerSupervisor& supervisor, std::chrono::milliseconds callTimeout);
        ~PlayerChannel() override = default;
        PlayerChannel(const PlayerChannel&) = delete;
        PlayerChannel& operator=(const PlayerChannel&) = delete;

    private:
        std::optional<PlayerResponse> sendCommand(const Wt::Json::Array& command) override;
        std::optional<Wt::Json::Value> getProperty(std::string_view name) override;
        bool setProperty(std::string_view name, const Wt::Json::Value& value) override;

        std::optional<Wt::Json::Object> send(const Wt::Json::Object& request);

        IPlayerSupervisor& _supervisor;
        const std::chrono::milliseconds _callTimeout;

        std::mutex _mutex; // one outstanding request at a time
    };
} // namespace jukebox::player
