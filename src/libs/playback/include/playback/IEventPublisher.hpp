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

#include "playback/Events.hpp"

namespace jukebox::playback
{
    // Forwards state changes to observers
    // Events are published synchronously, in mutation order. Implementations must not call back the playback service.
    class IEventPublisher
    {
    public:
        virtual ~IEventPublisher() = default;

        virtual void publish(const Event& event) = 0;
    };
} // namespace jukebox::playback
