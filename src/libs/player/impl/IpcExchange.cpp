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

#include "IpcExchange.hpp"

#include <functional>

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>

#include <Wt/Json/Parser.h>
#include <Wt/Json/Serializer.h>

#include "core/ILogger.hpp"
#include "core/String.hpp"

#define LOG(sev, message) JUKEBOX_LOG(PLAYER, sev, "[IPC] " << message)

namespace jukebox::player::ipc
{
    namespace
    {
        std::optional<Wt::Json::Object> parseLine(std::string_view line)
        {
            Wt::Json::Object message;
            Wt::Json::ParseError error;
            if (!Wt::Json::parse(std::string{ line }, message, error))
            {
                LOG(DEBUG, "Cannot parse line '" << line << "': " << error.what());
                return std::nullopt;
            }

            return message;
        }
    } // namespace

    std::chrono::milliseconds getRemainingTime(std::chrono::steady_clock::time_point deadline)
    {
        const auto now{ std::chrono::steady_clock::now() };
        if (now >= deadline)
            return std::chrono::milliseconds{ 0 };

        return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    }

    std::string serializeRequest(const Wt::Json::Object& request)
    {
        std::string res{ Wt::Json::serialize(request, 0) };
        // strings are escaped, remaining line breaks come from the formatting only
        std::erase(res, '\n');
        res += '\n';

        return res;
    }

    bool isResponse(const Wt::Json::Object& message)
    {
        return message.find("error") != std::cend(message);
    }

    std::optional<Wt::Json::Object> exchange(const std::filesystem::path& endpoint, const Wt::Json::Object& request, std::chrono::milliseconds timeout)
    {
        boost::asio::io_context ioContext;
        boost::asio::local::stream_protocol::socket socket{ ioContext };

        const std::string requestLine{ serializeRequest(request) };
        std::string readBuffer;
        std::optional<std::string> lastLine;
        bool completed{};
        bool failed{};

        std::function<void()> readNextLine;
        readNextLine = [&] {
            boost::asio::async_read_until(socket, boost::asio::dynamic_buffer(readBuffer), '\n', [&](const boost::system::error_code& ec, std::size_t lineSize) {
                if (ec)
                {
                    if (ec == boost::asio::error::eof)
                    {
                        // incomplete last line
                        if (const std::string_view remaining{ core::stringUtils::stringTrim(readBuffer) }; !remaining.empty())
                            lastLine = std::string{ remaining };
                    }
                    else
                    {
                        LOG(DEBUG, "Read failed: " << ec.message());
                        failed = true;
                    }

                    completed = true;
                    return;
                }

                const std::string_view line{ core::stringUtils::stringTrim(std::string_view{ readBuffer }.substr(0, lineSize)) };
                bool responseReceived{};
                if (!line.empty())
                {
                    lastLine = std::string{ line };
                    if (const std::optional<Wt::Json::Object> message{ parseLine(line) })
                        responseReceived = isResponse(*message);
                }
                readBuffer.erase(0, lineSize);

                if (responseReceived)
                    completed = true;
                else
                    readNextLine();
            });
        };

        socket.async_connect(boost::asio::local::stream_protocol::endpoint{ endpoint.string() }, [&](const boost::system::error_code& ec) {
            if (ec)
            {
                LOG(DEBUG, "Cannot connect to '" << endpoint.string() << "': " << ec.message());
                failed = true;
                completed = true;
                return;
            }

            boost::asio::async_write(socket, boost::asio::buffer(requestLine), [&](const boost::system::error_code& ec, std::size_t /* bytesWritten */) {
                if (ec)
                {
                    LOG(DEBUG, "Write failed: " << ec.message());
                    failed = true;
                    completed = true;
                    return;
                }

                readNextLine();
            });
        });

        ioContext.run_for(timeout);
        if (!completed)
        {
            LOG(DEBUG, "Timeout while waiting for a response to '" << core::stringUtils::stringTrim(requestLine) << "'");

            boost::system::error_code closeError;
            socket.close(closeError);
            ioContext.restart();
            ioContext.run(); // flush aborted handlers
            return std::nullopt;
        }

        if (failed || !lastLine)
            return std::nullopt;

        return parseLine(*lastLine);
    }
} // namespace jukebox::player::ipc
