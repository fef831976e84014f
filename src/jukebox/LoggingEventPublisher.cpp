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

#include "LoggingEventPublisher.hpp"

#include <algorithm>

#include <Wt/Json/Serializer.h>

#include "core/ILogger.hpp"

namespace jukebox
{
    namespace
    {
        std::string toJsonString(const playback::Event& event)
        {
            std::string res{ Wt::Json::serialize(playback::toJson(event), 0) };
            res.erase(std::remove(std::begin(res), std::end(res), '\n'), std::end(res));

            return res;
        }
    } // namespace

    void LoggingEventPublisher::publish(const playback::Event& event)
    {
        // status is published on each poll
        if (std::holds_alternative<playback::events::Status>(event))
            JUKEBOX_LOG(PLAYBACK, DEBUG, "Event '" << playback::getEventName(event) << "': " << toJsonString(event));
        else
            JUKEBOX_LOG(PLAYBACK, INFO, "Event '" << playback::getEventName(event) << "': " << toJsonString(event));
    }
} // namespace jukebox
