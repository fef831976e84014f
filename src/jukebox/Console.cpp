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

#include "Console.hpp"

#include <unistd.h>

#include <iomanip>
#include <iostream>
#include <istream>
#include <latch>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <Wt/Json/Serializer.h>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "playback/Exception.hpp"
#include "playback/IPlaybackService.hpp"

#define LOG(sev, message) JUKEBOX_LOG(MAIN, sev, "[Console] " << message)

namespace jukebox
{
    namespace
    {
        template<typename T>
        T getArg(const std::vector<std::string_view>& args, std::size_t index, std::string_view name)
        {
            if (index >= args.size())
                throw core::JukeboxException{ "Missing argument '" + std::string{ name } + "'" };

            const std::optional<T> value{ core::stringUtils::readAs<T>(args[index]) };
            if (!value)
                throw core::JukeboxException{ "Invalid value for '" + std::string{ name } + "'" };

            return *value;
        }

        void printSearchResult(const resolver::SearchResult& result)
        {
            if (const resolver::ResolveError * error{ std::get_if<resolver::ResolveError>(&result) })
            {
                std::cout << "Search failed: " << error->message << std::endl;
                return;
            }

            const auto& entries{ std::get<std::vector<resolver::SearchEntry>>(result) };
            std::cout << entries.size() << " result(s)" << std::endl;
            for (const resolver::SearchEntry& entry : entries)
                std::cout << "  " << entry.title << " - " << entry.uploader << " (" << static_cast<long>(entry.durationSeconds) << "s): " << entry.url << std::endl;
        }
    } // namespace

    Console::Console(boost::asio::io_context& ioContext, playback::IPlaybackService& playbackService, QuitCallback onQuit)
        : _playbackService{ playbackService }
        , _onQuit{ std::move(onQuit) }
        , _strand{ boost::asio::make_strand(ioContext) }
        , _input{ _strand }
    {
    }

    Console::~Console()
    {
        stop();
    }

    void Console::start()
    {
        boost::system::error_code ec;
        _input.assign(::dup(STDIN_FILENO), ec);
        if (ec)
            throw core::JukeboxException{ "Cannot watch standard input: " + ec.message() };

        std::cout << "Console ready, type 'help' for the list of commands" << std::endl;
        boost::asio::post(_strand, [this] { readNextLine(); });
    }

    void Console::stop()
    {
        if (_stopped.exchange(true))
            return;

        std::latch stopLatch{ 1 };

        boost::asio::post(_strand, [this, &stopLatch] {
            if (_input.is_open())
            {
                boost::system::error_code ec;
                _input.close(ec);
            }
            stopLatch.count_down();
        });

        stopLatch.wait();
    }

    void Console::readNextLine()
    {
        if (_stopped)
            return;

        boost::asio::async_read_until(_input, _inputBuffer, '\n', boost::asio::bind_executor(_strand, [this](const boost::system::error_code& ec, std::size_t) {
            if (ec == boost::asio::error::operation_aborted || _stopped)
                return;

            if (ec)
            {
                // end of input
                LOG(DEBUG, "Input closed: " << ec.message());
                _onQuit();
                return;
            }

            std::istream is{ &_inputBuffer };
            std::string line;
            std::getline(is, line);

            processLine(line);
            readNextLine();
        }));
    }

    void Console::processLine(std::string_view line)
    {
        std::vector<std::string_view> args;
        for (std::string_view arg : core::stringUtils::splitString(core::stringUtils::stringTrim(line), ' '))
        {
            if (!arg.empty())
                args.push_back(arg);
        }

        if (args.empty())
            return;

        const std::string_view command{ args.front() };
        args.erase(std::begin(args));

        try
        {
            processCommand(command, args);
        }
        catch (const playback::PlaybackException& e)
        {
            std::cout << "Error: " << e.what() << std::endl;
        }
        catch (const core::JukeboxException& e)
        {
            std::cout << "Error: " << e.what() << std::endl;
        }
    }

    void Console::processCommand(std::string_view command, const std::vector<std::string_view>& args)
    {
        if (command == "submit")
        {
            const playback::ItemId id{ _playbackService.submit(getArg<std::string>(args, 0, "url")) };
            std::cout << "Submitted '" << id << "'" << std::endl;
        }
        else if (command == "search")
        {
            if (args.empty())
                throw core::JukeboxException{ "Missing argument 'text'" };

            const std::string query{ core::stringUtils::joinStrings(std::vector<std::string>(std::cbegin(args), std::cend(args)), " ") };
            _playbackService.search(query, [](const resolver::SearchResult& result) { printSearchResult(result); });
        }
        else if (command == "pause")
            _playbackService.togglePause();
        else if (command == "stop")
            _playbackService.stop();
        else if (command == "skip")
            _playbackService.skip();
        else if (command == "volume")
            _playbackService.setVolume(getArg<double>(args, 0, "volume"));
        else if (command == "seek")
            _playbackService.seek(getArg<double>(args, 0, "percent"));
        else if (command == "clear")
            _playbackService.clearQueue();
        else if (command == "play")
        {
            if (!_playbackService.playNow(getArg<std::string>(args, 0, "id")))
                std::cout << "Player did not accept the item" << std::endl;
        }
        else if (command == "remove")
            _playbackService.remove(getArg<std::string>(args, 0, "id"));
        else if (command == "shuffle")
            _playbackService.shuffle();
        else if (command == "up")
            _playbackService.moveUp(getArg<std::string>(args, 0, "id"));
        else if (command == "down")
            _playbackService.moveDown(getArg<std::string>(args, 0, "id"));
        else if (command == "move")
            _playbackService.reorder(getArg<std::size_t>(args, 0, "old"), getArg<std::size_t>(args, 1, "new"));
        else if (command == "autoplay")
            std::cout << "Autoplay " << (_playbackService.toggleAutoplay() ? "enabled" : "disabled") << std::endl;
        else if (command == "queue")
            printQueue();
        else if (command == "status")
            std::cout << Wt::Json::serialize(playback::toJson(_playbackService.getDebugSnapshot())) << std::endl;
        else if (command == "help")
            printHelp();
        else if (command == "quit")
            _onQuit();
        else
            std::cout << "Unknown command '" << command << "', type 'help' for the list of commands" << std::endl;
    }

    void Console::printHelp()
    {
        std::cout << "Commands:\n"
                  << "\tsubmit <url>\t\tqueue a media\n"
                  << "\tsearch <text>\t\tsearch media\n"
                  << "\tpause\t\t\ttoggle pause\n"
                  << "\tstop\t\t\tstop playback\n"
                  << "\tskip\t\t\tplay next ready item\n"
                  << "\tvolume <0-100>\t\tset volume\n"
                  << "\tseek <0-100>\t\tseek to percent position\n"
                  << "\tclear\t\t\tclear the queue and stop playback\n"
                  << "\tplay <id>\t\tplay an item now\n"
                  << "\tremove <id>\t\tremove an item\n"
                  << "\tshuffle\t\t\tshuffle the queue\n"
                  << "\tup <id>\t\t\tmove an item up\n"
                  << "\tdown <id>\t\tmove an item down\n"
                  << "\tmove <old> <new>\tmove an item by index\n"
                  << "\tautoplay\t\ttoggle autoplay\n"
                  << "\tqueue\t\t\tdisplay the queue\n"
                  << "\tstatus\t\t\tdisplay debug information\n"
                  << "\tquit\t\t\tstop the jukebox" << std::endl;
    }

    void Console::printQueue()
    {
        const playback::PlaybackSnapshot snapshot{ _playbackService.getPlaybackSnapshot() };
        if (snapshot.nowPlaying)
        {
            std::cout << "Now playing: " << snapshot.nowPlaying->media.title << " [" << snapshot.nowPlaying->id << "] "
                      << std::fixed << std::setprecision(1) << snapshot.positionSeconds << "/" << snapshot.durationSeconds << "s"
                      << (snapshot.paused ? " (paused)" : "") << std::endl;
        }

        const std::vector<playback::QueueItem> items{ _playbackService.getQueue() };
        for (std::size_t i{}; i < items.size(); ++i)
        {
            const playback::QueueItem& item{ items[i] };
            std::cout << i << ": [" << item.id << "] " << playback::getItemStatusName(item.status) << " "
                      << (item.resolved ? item.resolved->title : item.sourceUrl) << std::endl;
        }
    }
} // namespace jukebox
