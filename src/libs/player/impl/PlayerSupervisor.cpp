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

#include "PlayerSupervisor.hpp"

#include <grp.h>
#include <pwd.h>
#include <unistd.h>

#include <algorithm>
#include <thread>
#include <vector>

#include "core/IChildProcessManager.hpp"
#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "player/IPlayerChannel.hpp"

#include "IpcExchange.hpp"

#define LOG(sev, message) JUKEBOX_LOG(PLAYER, sev, "[Supervisor] " << message)

namespace jukebox::player
{
    namespace
    {
        std::string getUserName()
        {
            if (const struct passwd * pw{ ::getpwuid(::getuid()) })
                return pw->pw_name;

            return std::to_string(::getuid());
        }

        std::vector<std::string> getUserGroupNames()
        {
            std::vector<std::string> res;

            const struct passwd* pw{ ::getpwuid(::getuid()) };
            if (!pw)
                return res;

            int groupCount{ 64 };
            std::vector<gid_t> groups(groupCount);
            if (::getgrouplist(pw->pw_name, pw->pw_gid, groups.data(), &groupCount) == -1)
            {
                groups.resize(groupCount);
                if (::getgrouplist(pw->pw_name, pw->pw_gid, groups.data(), &groupCount) == -1)
                    return res;
            }
            groups.resize(groupCount);

            for (const gid_t gid : groups)
            {
                if (const struct group * gr{ ::getgrgid(gid) })
                    res.emplace_back(gr->gr_name);
            }

            return res;
        }
    } // namespace

    std::unique_ptr<IPlayerSupervisor> createPlayerSupervisor(core::IChildProcessManager& childProcessManager, const PlayerSupervisorParameters& params)
    {
        return std::make_unique<PlayerSupervisor>(childProcessManager, params);
    }

    std::string_view getStateName(IPlayerSupervisor::State state)
    {
        switch (state)
        {
        case IPlayerSupervisor::State::NotStarted:
            return "NotStarted";
        case IPlayerSupervisor::State::Starting:
            return "Starting";
        case IPlayerSupervisor::State::Running:
            return "Running";
        case IPlayerSupervisor::State::Dead:
            return "Dead";
        }

        return "Unknown";
    }

    core::IChildProcess::Args buildPlayerArgs(const PlayerSupervisorParameters& params, AudioBackend backend)
    {
        core::IChildProcess::Args args{
            "--no-video",
            "--idle=yes",
            "--input-ipc-server=" + params.ipcPath.string(),
            "--volume=" + std::to_string(params.initialVolume),
        };

        for (std::string& arg : getAudioBackendArgs(backend))
            args.push_back(std::move(arg));

        args.push_back("--no-terminal");
        args.push_back("--msg-level=all=info");

        return args;
    }

    PlayerSupervisor::PlayerSupervisor(core::IChildProcessManager& childProcessManager, const PlayerSupervisorParameters& params)
        : _childProcessManager{ childProcessManager }
        , _params{ params }
        , _restartBackoff{ params.restartBackoff }
    {
        LOG(INFO, "Using player '" << _params.playerPath.string() << "', endpoint = '" << _params.ipcPath.string() << "'");
    }

    PlayerSupervisor::~PlayerSupervisor()
    {
        shutdown();
    }

    IPlayerSupervisor::State PlayerSupervisor::getState()
    {
        const std::scoped_lock lock{ _mutex };

        refreshState();
        return _state;
    }

    std::string PlayerSupervisor::getStatusDescription()
    {
        const std::scoped_lock lock{ _mutex };

        refreshState();
        switch (_state)
        {
        case State::NotStarted:
            return "Not started";
        case State::Starting:
            return "Starting";
        case State::Running:
            return "Running (PID: " + std::to_string(_process->getPid()) + ")";
        case State::Dead:
            if (_process && _process->getExitCode())
                return "Dead (exit code: " + std::to_string(*_process->getExitCode()) + ")";
            return "Dead";
        }

        return "Unknown";
    }

    const std::filesystem::path& PlayerSupervisor::getIpcPath() const
    {
        return _params.ipcPath;
    }

    bool PlayerSupervisor::isIpcEndpointPresent() const
    {
        std::error_code ec;
        return std::filesystem::exists(_params.ipcPath, ec);
    }

    void PlayerSupervisor::ensureRunning()
    {
        ensureRunning(std::chrono::steady_clock::now() + _params.responseTimeout);
    }

    void PlayerSupervisor::ensureRunning(std::chrono::steady_clock::time_point deadline)
    {
        const std::scoped_lock lock{ _mutex };

        if (_shutdown)
            throw StartupFailedException{ "Player supervisor is shut down" };

        const std::optional<std::string> reason{ getRestartReason(deadline) };
        if (!reason)
            return;

        if (_nextStartupAllowed)
        {
            const std::chrono::milliseconds remaining{ ipc::getRemainingTime(*_nextStartupAllowed) };
            if (remaining.count() > 0)
                throw StartupDelayedException{ *reason + ", next startup attempt in " + std::to_string(remaining.count()) + " ms" };
        }

        LOG(WARNING, *reason << ", attempting to restart player...");
        start(deadline);
    }

    void PlayerSupervisor::shutdown()
    {
        const std::scoped_lock lock{ _mutex };

        if (_shutdown)
            return;
        _shutdown = true;

        LOG(INFO, "Shutting down player...");
        stopProcess();
        removeIpcEndpoint();
        _state = State::NotStarted;
    }

    void PlayerSupervisor::refreshState()
    {
        if (_state == State::Running && !_process->isRunning())
        {
            LOG(WARNING, "Player process " << _process->getPid() << " exited");
            _state = State::Dead;
        }
    }

    std::optional<std::string> PlayerSupervisor::getRestartReason(std::chrono::steady_clock::time_point deadline)
    {
        refreshState();

        if (_state != State::Running)
            return "Player process is not running";

        if (!isIpcEndpointPresent())
            return "Player endpoint missing";

        // not checked if there is no time left
        if (const std::optional<bool> responsive{ isResponsive(deadline) }; responsive && !*responsive)
            return "Player not responsive";

        return std::nullopt;
    }

    std::optional<bool> PlayerSupervisor::isResponsive(std::chrono::steady_clock::time_point deadline) const
    {
        const std::chrono::milliseconds timeout{ std::min(ipc::getRemainingTime(deadline), _params.responseTimeout) };
        if (timeout.count() == 0)
            return std::nullopt;

        Wt::Json::Object request;
        request["command"] = makeCommand({ "get_property", "idle-active" });

        return ipc::exchange(_params.ipcPath, request, timeout).has_value();
    }

    void PlayerSupervisor::start(std::chrono::steady_clock::time_point deadline)
    {
        _state = State::Starting;

        stopProcess();
        _process.reset();
        removeIpcEndpoint();

        const AudioBackend backend{ detectAudioBackend(_childProcessManager, _params.audioBackendDetection) };
        const core::IChildProcess::Args args{ buildPlayerArgs(_params, backend) };

        LOG(INFO, "Starting player with command: " << _params.playerPath.string() << " " << core::stringUtils::joinStrings(args, " "));

        try
        {
            _process = _childProcessManager.spawnChildProcess(_params.playerPath, args, core::IChildProcess::OutputMode::Discard);
        }
        catch (const core::ChildProcessException& e)
        {
            onStartupFailure(std::string{ "Cannot spawn player: " } + e.what());
        }

        for (std::size_t attempt{}; attempt < _params.startupAttempts; ++attempt)
        {
            std::this_thread::sleep_for(_params.startupInterval);

            if (!_process->isRunning())
            {
                const std::optional<int> exitCode{ _process->getExitCode() };
                onStartupFailure("Player process died immediately (exit code: " + (exitCode ? std::to_string(*exitCode) : std::string{ "none" }) + ")");
            }

            if (isIpcEndpointPresent())
                break;
        }

        if (!isIpcEndpointPresent())
            onStartupFailure("Player endpoint " + _params.ipcPath.string() + " was not created");

        _state = State::Running;
        _restartBackoff = _params.restartBackoff;
        _nextStartupAllowed.reset();
        LOG(INFO, "Player started successfully with PID " << _process->getPid());

        const std::optional<bool> responsive{ isResponsive(deadline) };
        if (!responsive)
            LOG(DEBUG, "Player communication test skipped");
        else if (!*responsive)
            LOG(WARNING, "Player communication test failed");
        else
            LOG(DEBUG, "Player communication test successful");
    }

    void PlayerSupervisor::onStartupFailure(const std::string& reason)
    {
        LOG(ERROR, "Failed to start player: " << reason);

        logDiagnostics();
        stopProcess();
        _state = State::Dead;

        _nextStartupAllowed = std::chrono::steady_clock::now() + _restartBackoff;
        LOG(INFO, "Next startup attempt in " << _restartBackoff.count() << " ms at the earliest");
        _restartBackoff = std::min(_restartBackoff * 2, _params.maxRestartBackoff);

        throw StartupFailedException{ reason };
    }

    void PlayerSupervisor::stopProcess()
    {
        if (!_process)
            return;

        if (_process->isRunning())
        {
            _process->terminate();
            if (!_process->waitExit(_params.shutdownGracePeriod))
            {
                LOG(WARNING, "Player process " << _process->getPid() << " did not exit gracefully, killing it");
                _process->kill();
                if (!_process->waitExit(_params.shutdownGracePeriod))
                    LOG(ERROR, "Player process " << _process->getPid() << " still alive after kill");
            }
        }
    }

    void PlayerSupervisor::removeIpcEndpoint()
    {
        std::error_code ec;
        if (std::filesystem::remove(_params.ipcPath, ec))
            LOG(DEBUG, "Removed endpoint '" << _params.ipcPath.string() << "'");
        else if (ec)
            LOG(ERROR, "Cannot remove endpoint '" << _params.ipcPath.string() << "': " << ec.message());
    }

    void PlayerSupervisor::logDiagnostics()
    {
        LOG(INFO, "Running player diagnostics...");

        try
        {
            const core::ChildProcessResult result{ core::runChildProcess(_childProcessManager, _params.playerPath, { "--version" }, _params.diagnosticTimeout) };
            if (result.exitCode && *result.exitCode == 0)
            {
                const std::vector<std::string_view> lines{ core::stringUtils::splitString(result.output, '\n') };
                LOG(INFO, "Player version: " << core::stringUtils::stringTrim(lines.front()));
            }
            else
                LOG(ERROR, "Player version check failed");
        }
        catch (const core::ChildProcessException& e)
        {
            LOG(ERROR, "Player not found or not executable: " << e.what());
        }

        try
        {
            const core::ChildProcessResult result{ core::runChildProcess(_childProcessManager, "aplay", { "-l" }, _params.diagnosticTimeout) };
            if (result.exitCode && *result.exitCode == 0)
                LOG(INFO, "ALSA devices:\n"
                              << result.output);
            else
                LOG(WARNING, "No ALSA devices found or aplay not available");
        }
        catch (const core::ChildProcessException& e)
        {
            LOG(WARNING, "Cannot list ALSA devices: " << e.what());
        }

        const std::string userName{ getUserName() };
        std::vector<std::string> audioGroups;
        for (std::string& group : getUserGroupNames())
        {
            if (core::stringUtils::stringCaseInsensitiveContains(group, "audio"))
                audioGroups.push_back(std::move(group));
        }

        LOG(INFO, "User " << userName << " audio groups: [" << core::stringUtils::joinStrings(audioGroups, ", ") << "]");
        if (audioGroups.empty())
            LOG(WARNING, "User not in audio group - this may cause audio issues");
    }
} // namespace jukebox::player
