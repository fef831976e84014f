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
#include <string>

#include "core/Exception.hpp"
#include "core/IChildProcess.hpp"
#include "player/AudioBackend.hpp"

namespace jukebox::core
{
    class IChildProcessManager;
}

namespace jukebox::player
{
    class StartupFailedException : public core::JukeboxException
    {
    public:
        using core::JukeboxException::JukeboxException;
    };

    // A previous startup failed too recently to attempt a new one
    class StartupDelayedException : public StartupFailedException
    {
    public:
        using StartupFailedException::StartupFailedException;
    };

    struct PlayerSupervisorParameters
    {
        std::filesystem::path playerPath{ "/usr/bin/mpv" };
        std::filesystem::path ipcPath{ "/tmp/mpv.sock" };
        unsigned initialVolume{ 50 };
        std::size_t startupAttempts{ 10 };
        std::chrono::milliseconds startupInterval{ 100 };
        std::chrono::milliseconds shutdownGracePeriod{ 1000 };
        std::chrono::milliseconds responseTimeout{ 2000 };
        std::chrono::milliseconds diagnosticTimeout{ 5000 };
        // no restart is attempted during this period after a failed startup, doubled on each consecutive failure
        std::chrono::milliseconds restartBackoff{ 5000 };
        std::chrono::milliseconds maxRestartBackoff{ 60000 };
        AudioBackendDetectionParameters audioBackendDetection;
    };

    // Owns the external player process
    class IPlayerSupervisor
    {
    public:
        virtual ~IPlayerSupervisor() = default;

        enum class State
        {
            NotStarted,
            Starting,
            Running,
            Dead,
        };

        virtual State getState() = 0;

        // "Not started", "Running (PID: n)", "Dead (exit code: n)"
        virtual std::string getStatusDescription() = 0;

        virtual const std::filesystem::path& getIpcPath() const = 0;
        virtual bool isIpcEndpointPresent() const = 0;

        // Restarts the player if it is not running, if its endpoint is missing or if it does not answer
        // Throws StartupFailedException if the player cannot be brought up, StartupDelayedException if
        // a startup failed less than the backoff period ago
        virtual void ensureRunning() = 0;
        // Same, the responsiveness check does not wait past the deadline
        virtual void ensureRunning(std::chrono::steady_clock::time_point deadline) = 0;

        // Stops the player and removes its endpoint. Only the first call has effect, further calls to
        // ensureRunning will fail
        virtual void shutdown() = 0;
    };

    std::unique_ptr<IPlayerSupervisor> createPlayerSupervisor(core::IChildProcessManager& childProcessManager, const PlayerSupervisorParameters& params);

    std::string_view getStateName(IPlayerSupervisor::State state);

    // Full command line given to the player, the executable excepted
    core::IChildProcess::Args buildPlayerArgs(const PlayerSupervisorParameters& params, AudioBackend backend);
} // namespace jukebox::player
