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
#include <filesystem>
#include <optional>
#include <string>

#include <Wt/Json/Object.h>

namespace jukebox::player::ipc
{
    // Time left before the deadline, zero if past
    std::chrono::milliseconds getRemainingTime(std::chrono::steady_clock::time_point deadline);

    // One line, as expected by the player
    std::string serializeRequest(const Wt::Json::Object& request);

    // Responses carry an "error" member, asynchronous events do not
    bool isResponse(const Wt::Json::Object& message);

    // Connects to the endpoint, sends the request and reads lines until a response is received or the
    // player closes the connection. The last non-empty line read is returned.
    // Empty if the endpoint cannot be reached, on timeout or if the last line is not a JSON object
    std::optional<Wt::Json::Object> exchange(const std::filesystem::path& endpoint, const Wt::Json::Object& request, std::chrono::milliseconds timeout);
} // namespace jukebox::player::ipc
