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

#include "ChildProcessManager.hpp"

#include "core/ILogger.hpp"

#include "ChildProcess.hpp"

namespace jukebox::core
{
    std::unique_ptr<IChildProcessManager> createChildProcessManager()
    {
        return std::make_unique<ChildProcessManager>();
    }

    std::unique_ptr<IChildProcess> ChildProcessManager::spawnChildProcess(const std::filesystem::path& path, const IChildProcess::Args& args, IChildProcess::OutputMode outputMode)
    {
        return std::make_unique<ChildProcess>(path, args, outputMode);
    }

    ChildProcessResult runChildProcess(IChildProcessManager& manager, const std::filesystem::path& path, const IChildProcess::Args& args, std::chrono::milliseconds timeout)
    {
        const auto start{ std::chrono::steady_clock::now() };

        std::unique_ptr<IChildProcess> process{ manager.spawnChildProcess(path, args, IChildProcess::OutputMode::Capture) };

        ChildProcessResult result;
        result.output = process->readOutput(timeout);

        // output is closed, give the process what is left of the timeout to exit
        const auto elapsed{ std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start) };
        if (process->waitExit(elapsed < timeout ? timeout - elapsed : std::chrono::milliseconds{ 0 }))
            result.exitCode = process->getExitCode();
        else
            JUKEBOX_LOG(CHILDPROCESS, DEBUG, "'" << path.string() << "' did not exit in time");

        return result;
    }
} // namespace jukebox::core
