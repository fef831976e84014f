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

#include <sys/types.h>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "core/Exception.hpp"

namespace jukebox::core
{
    class ChildProcessException : public JukeboxException
    {
    public:
        using JukeboxException::JukeboxException;
    };

    class IChildProcess
    {
    public:
        using Args = std::vector<std::string>;

        enum class OutputMode
        {
            Discard, // stdout goes to /dev/null
            Capture, // stdout can be read using readOutput
        };

        virtual ~IChildProcess() = default;

        virtual ::pid_t getPid() const = 0;

        // reaps the process if it has exited
        virtual bool isRunning() = 0;
        virtual std::optional<int> getExitCode() const = 0;

        virtual void terminate() = 0; // SIGTERM
        virtual void kill() = 0;      // SIGKILL

        // return true if the process has exited within the given duration
        virtual bool waitExit(std::chrono::milliseconds timeout) = 0;

        // Read stdout until EOF or timeout, only for OutputMode::Capture
        virtual std::string readOutput(std::chrono::milliseconds timeout) = 0;
    };
} // namespace jukebox::core
