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

#include "PlayerChannel.hpp"

#include <Wt/Json/Serializer.h>

#include "core/ILogger.hpp"
#include "player/IPlayerSupervisor.hpp"

#include "IpcExchange.hpp"

#define LOG(sev, message) JUKEBOX_LOG(PLAYER, sev, "[Channel] " << message)

namespace jukebox::player
{
    namespace
    {
        // expected when querying playback properties while idle
        constexpr std::string_view propertyUnavailableError{ "property unavailable" };

        std::optional<PlayerResponse> toResponse(const Wt::Json::Object& message)
        {
            if (message.type("error") != Wt::Json::Type::String)
            {
                LOG(ERROR, "Unexpected message from player: " << Wt::Json::serialize(message, 0));
                return std::nullopt;
            }

            PlayerResponse response;
            response.error = static_cast<std::string>(message.get("error"));
            response.data = message.get("data");

            if (!response.isSuccess() && response.error != propertyUnavailableError)
                LOG(ERROR, "Player command error: " << response.error);

            return response;
        }
    } // namespace

    Wt::Json::Array makeCommand(std::initializer_list<std::string_view> atoms)
    {
        Wt::Json::Array command;
        for (std::string_view atom : atoms)
            command.push_back(Wt::Json::Value{ std::string{ atom } });

        return command;
    }

    std::unique_ptr<IPlayerChannel> createPlayerChannel(IPlayerSupervisor& supervisor, std::chrono::milliseconds callTimeout)
    {
        return std::make_unique<PlayerChannel>(supervisor, callTimeout);
    }

    PlayerChannel::PlayerChannel(IPlayerSupervisor& supervisor, std::chrono::milliseconds callTimeout)
        : _supervisor{ supervisor }
        , _callTimeout{ callTimeout }
    {
    }

    std::optional<PlayerResponse> PlayerChannel::sendCommand(const Wt::Json::Array& command)
    {
        Wt::Json::Object request;
        request["command"] = command;

        const std::optional<Wt::Json::Object> message{ send(request) };
        if (!message)
            return std::nullopt;

        return toResponse(*message);
    }

    std::optional<Wt::Json::Value> PlayerChannel::getProperty(std::string_view name)
    {
        const std::optional<PlayerResponse> response{ sendCommand(makeCommand({ "get_property", name })) };
        if (!response || !response->isSuccess())
            return std::nullopt;

        return response->data;
    }

    bool PlayerChannel::setProperty(std::string_view name, const Wt::Json::Value& value)
    {
        const std::optional<PlayerResponse> response{ sendCommand(Wt::Json::Array{ Wt::Json::Value{ std::string{ "set_property" } }, Wt::Json::Value{ std::string{ name } }, value }) };
        return response && response->isSuccess();
    }

    std::optional<Wt::Json::Object> PlayerChannel::send(const Wt::Json::Object& request)
    {
        const std::scoped_lock lock{ _mutex };

        // the whole call, reconnection included, must not exceed the call timeout
        const auto deadline{ std::chrono::steady_clock::now() + _callTimeout };

        // one reconnection attempt at most
        for (std::size_t attempt{}; attempt < 2; ++attempt)
        {
            try
            {
                _supervisor.ensureRunning(deadline);
            }
            catch (const StartupDelayedException& e)
            {
                LOG(DEBUG, "Player is not running: " << e.what());
                return std::nullopt;
            }
            catch (const StartupFailedException& e)
            {
                LOG(ERROR, "Player is not running and failed to start: " << e.what());
                return std::nullopt;
            }

            const std::chrono::milliseconds remaining{ ipc::getRemainingTime(deadline) };
            if (remaining.count() == 0)
            {
                LOG(WARNING, "No response from player within " << _callTimeout.count() << " ms");
                return std::nullopt;
            }

            if (std::optional<Wt::Json::Object> message{ ipc::exchange(_supervisor.getIpcPath(), request, remaining) })
                return message;

            LOG(WARNING, "No response from player" << (attempt == 0 ? ", retrying" : ""));
        }

        return std::nullopt;
    }
} // namespace jukebox::player
