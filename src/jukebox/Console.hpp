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
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/streambuf.hpp>

namespace jukebox::playback
{
    class IPlaybackService;
}

namespace jukebox
{
    // Line based control console on the standard input
    class Console
    {
    public:
        using QuitCallback = std::function<void()>;
        Console(boost::asio::io_context& ioContext, playback::IPlaybackService& playbackService, QuitCallback onQuit);
        ~Console();
        Console(const Console&) = delete;
        Console& operator=(const Console&) = delete;

        // Throws JukeboxException if the standard input cannot be watched
        void start();

        // Waits for the current command to complete, the io_context must still be running
        void stop();

    private:
        void readNextLine();
        void processLine(std::string_view line);
        void processCommand(std::string_view command, const std::vector<std::string_view>& args);
        void printHelp();
        void printQueue();

        playback::IPlaybackService& _playbackService;
        QuitCallback _onQuit;

        boost::asio::strand<boost::asio::io_context::executor_type> _strand;
        boost::asio::posix::stream_descriptor _input;
        boost::asio::streambuf _inputBuffer;
        std::atomic<bool> _stopped{};
    };
} // namespace jukebox
