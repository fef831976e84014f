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

#include "playback/IEventPublisher.hpp"

namespace jukebox
{
    // Forwards the playback events to the log, serialized the way a transport would send them
    class LoggingEventPublisher final : public playback::IEventPublisher
    {
    private:
        void publish(const playback::Event& event) override;
    };
} // namespace jukebox
