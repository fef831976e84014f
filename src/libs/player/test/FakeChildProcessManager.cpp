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

#include "FakeChildProcessManager.hpp"

#include <algorithm>

namespace jukebox::player::tests
{
    namespace
    {
        class FakeChildProcess final : public core::IChildProcess
        {
        public:
            FakeChildProcess(std::shared_ptr<FakeChildProcessManager::ProcessState> state, bool ignoreTerminate)
                : _state{ std::move(state) }
                , _ignoreTerminate{ ignoreTerminate }
            {
            }

        private:
            ::pid_t getPid() const override { return _state->pid; }

            bool isRunning() override
            {
                const std::scoped_lock lock{ _state->mutex };
                return _state->running;
            }

            std::optional<int> getExitCode() const override
            {
                const std::scoped_lock lock{ _state->mutex };
                return _state->exitCode;
            }

            void terminate() override
            {
                const std::scoped_lock lock{ _state->mutex };
                _state->terminateCount++;
                if (!_ignoreTerminate)
                    exit(0);
            }

            void kill() override
            {
                const std::scoped_lock lock{ _state->mutex };
                _state->killCount++;
                exit(std::nullopt);
            }

            bool waitExit(std::chrono::milliseconds) override
            {
                const std::scoped_lock lock{ _state->mutex };
                return !_state->running;
            }

            std::string readOutput(std::chrono::milliseconds) override { return ""; }

            void exit(std::optional<int> exitCode)
            {
                _state->running = false;
                _state->exitCode = exitCode;
                _state->player.reset();
            }

            std::shared_ptr<FakeChildProcessManager::ProcessState> _state;
            const bool _ignoreTerminate;
        };
    } // namespace

    std::vector<std::filesystem::path> FakeChildProcessManager::getSpawnedPaths() const
    {
        const std::scoped_lock lock{ _mutex };
        return _spawnedPaths;
    }

    std::vector<core::IChildProcess::Args> FakeChildProcessManager::getPlayerArgs() const
    {
        const std::scoped_lock lock{ _mutex };
        return _playerArgs;
    }

    std::shared_ptr<FakePlayer> FakeChildProcessManager::getPlayer() const
    {
        const std::shared_ptr<ProcessState> state{ getPlayerProcessState() };
        if (!state)
            return {};

        const std::scoped_lock lock{ state->mutex };
        return state->player;
    }

    std::shared_ptr<FakeChildProcessManager::ProcessState> FakeChildProcessManager::getPlayerProcessState() const
    {
        const std::scoped_lock lock{ _mutex };
        return _playerProcessState;
    }

    void FakeChildProcessManager::crashPlayer(int exitCode)
    {
        const std::shared_ptr<ProcessState> state{ getPlayerProcessState() };
        if (!state)
            return;

        const std::scoped_lock lock{ state->mutex };
        state->running = false;
        state->exitCode = exitCode;
        state->player.reset();
    }

    std::unique_ptr<core::IChildProcess> FakeChildProcessManager::spawnChildProcess(const std::filesystem::path& path, const core::IChildProcess::Args& args, core::IChildProcess::OutputMode /* outputMode */)
    {
        const std::scoped_lock lock{ _mutex };

        _spawnedPaths.push_back(path);

        auto state{ std::make_shared<ProcessState>() };
        state->pid = _nextPid++;

        constexpr std::string_view ipcServerArg{ "--input-ipc-server=" };
        auto itIpcServer{ std::find_if(std::cbegin(args), std::cend(args), [&](const std::string& arg) { return arg.starts_with(ipcServerArg); }) };
        if (itIpcServer == std::cend(args))
        {
            // helper programs: version check, audio server query, etc.
            state->running = false;
            state->exitCode = 1;
            return std::make_unique<FakeChildProcess>(state, false);
        }

        _playerSpawnCount++;
        _playerArgs.push_back(args);
        _playerProcessState = state;

        if (playerExitsImmediately)
        {
            state->running = false;
            state->exitCode = 2;
        }
        else if (createPlayerEndpoint)
        {
            state->player = std::make_shared<FakePlayer>(itIpcServer->substr(ipcServerArg.size()));
            state->player->setResponsive(!playerUnresponsive);
        }

        return std::make_unique<FakeChildProcess>(state, playerIgnoresTerminate);
    }
} // namespace jukebox::player::tests
