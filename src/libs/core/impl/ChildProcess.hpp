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
#include <unistd.h>

#include <filesystem>
#include <optional>

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include "core/IChildProcess.hpp"

namespace jukebox::core
{
    class ChildProcess : public IChildProcess
    {
    public:
        ChildProcess(const std::filesystem::path& path, const Args& args, OutputMode outputMode);
        ~ChildProcess() override;

        ChildProcess(const ChildProcess&) = delete;
        ChildProcess& operator=(const ChildProcess&) = delete;

    private:
        ::pid_t getPid() const override { return _childPID; }
        bool isRunning() override;
        std::optional<int> getExitCode() const override { return _exitCode; }
        void terminate() override;
        void kill() override;
        bool waitExit(std::chrono::milliseconds timeout) override;
        std::string readOutput(std::chrono::milliseconds timeout) override;

        void sendSignal(int signal);
        bool wait(bool block); // return true if waited

        using FileDescriptor = boost::asio::posix::stream_descriptor;

        boost::asio::io_context _ioContext; // only used to read the captured output
        FileDescriptor _childStdout{ _ioContext };
        ::pid_t _childPID{};
        bool _waited{};
        std::optional<int> _exitCode;
    };
} // namespace jukebox::core
