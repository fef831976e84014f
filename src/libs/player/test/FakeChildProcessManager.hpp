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

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/IChildProcessManager.hpp"

#include "FakePlayer.hpp"

namespace jukebox::player::tests
{
    // Spawned players are FakePlayer instances, other programs exit immediately with code 1
    class FakeChildProcessManager final : public core::IChildProcessManager
    {
    public:
        struct ProcessState
        {
            std::mutex mutex;
            ::pid_t pid{};
            bool running{ true };
            std::optional<int> exitCode;
            std::shared_ptr<FakePlayer> player;
            std::size_t terminateCount{};
            std::size_t killCount{};
        };

        bool createPlayerEndpoint{ true };
        bool playerExitsImmediately{};
        bool playerIgnoresTerminate{};
        bool playerUnresponsive{};

        std::size_t getPlayerSpawnCount() const { return _playerSpawnCount; }
        std::vector<std::filesystem::path> getSpawnedPaths() const;
        std::vector<core::IChildProcess::Args> getPlayerArgs() const;

        // last spawned player
        std::shared_ptr<FakePlayer> getPlayer() const;
        std::shared_ptr<ProcessState> getPlayerProcessState() const;
        void crashPlayer(int exitCode);

    private:
        std::unique_ptr<core::IChildProcess> spawnChildProcess(const std::filesystem::path& path, const core::IChildProcess::Args& args, core::IChildProcess::OutputMode outputMode) override;

        mutable std::mutex _mutex;
        std::atomic<std::size_t> _playerSpawnCount{};
        ::pid_t _nextPid{ 1000 };
        std::vector<std::filesystem::path> _spawnedPaths;
        std::vector<core::IChildProcess::Args> _playerArgs;
        std::shared_ptr<ProcessState> _playerProcessState;
    };
} // namespace jukebox::player::tests
