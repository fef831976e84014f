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
#include <memory>
#include <optional>
#include <string>

#include "core/IChildProcess.hpp"

namespace jukebox::core
{
    class IChildProcessManager
    {
    public:
        virtual ~IChildProcessManager() = default;

        // path is searched in PATH if it does not contain any slash
        virtual std::unique_ptr<IChildProcess> spawnChildProcess(const std::filesystem::path& path, const IChildProcess::Args& args, IChildProcess::OutputMode outputMode) = 0;
    };

    std::unique_ptr<IChildProcessManager> createChildProcessManager();

    struct ChildProcessResult
    {
        std::optional<int> exitCode; // not set if the process did not exit in time
        std::string output;
    };

    // Spawn a short-lived process and collect its standard output
    // Throws ChildProcessException if the process cannot be spawned
    ChildProcessResult runChildProcess(IChildProcessManager& manager, const std::filesystem::path& path, const IChildProcess::Args& args, std::chrono::milliseconds timeout);
} // namespace jukebox::core
