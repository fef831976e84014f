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

#include <mutex>
#include <optional>

#include "core/IChildProcess.hpp"
#include "player/IPlayerSupervisor.hpp"

namespace jukebox::player
{
    class PlayerSupervisor final : public IPlayerSupervisor
    {
    public:
        PlayerSupervisor(core::IChildProcessManager& childProcessManager, const PlayerSupervisorParameters& params);
        ~PlayerSupervisor() override;
        PlayerSupervisor(const PlayerSupervisor&) = delete;
        PlayerSupervisor& operator=(const PlayerSupervisor&) = delete;

    private:
        State getState() override;
        std::string getStatusDescription() override;
        const std::filesystem::path& getIpcPath() const override;
        bool isIpcEndpointPresent() const override;
        void ensureRunning() override;
        void ensureRunning(std::chrono::steady_clock::time_point deadline) override;
        void shutdown() override;

        void refreshState();
        std::optional<std::string> getRestartReason(std::chrono::steady_clock::time_point deadline);
        std::optional<bool> isResponsive(std::chrono::steady_clock::time_point deadline) const;
        void start(std::chrono::steady_clock::time_point deadline);
        [[noreturn]] void onStartupFailure(const std::string& reason);
        void stopProcess();
        void removeIpcEndpoint();
        void logDiagnostics();

        core::IChildProcessManager& _childProcessManager;
        const PlayerSupervisorParameters _params;

        std::mutex _mutex;
        State _state{ State::NotStarted };
        bool _shutdown{};
        std::unique_ptr<core::IChildProcess> _process;
        std::chrono::milliseconds _restartBackoff;
        std::optional<std::chrono::steady_clock::time_point> _nextStartupAllowed;
    };
} // namespace jukebox::player
