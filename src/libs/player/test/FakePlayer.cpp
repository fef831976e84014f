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

#include "FakePlayer.hpp"

#include <unistd.h>

#include <atomic>
#include <sstream>

#include <boost/asio/buffer.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>

#include <Wt/Json/Object.h>
#include <Wt/Json/Parser.h>
#include <Wt/Json/Serializer.h>

namespace jukebox::player::tests
{
    namespace
    {
        std::string toString(const Wt::Json::Value& value)
        {
            switch (value.type())
            {
            case Wt::Json::Type::String:
                return static_cast<std::string>(value);
            case Wt::Json::Type::Bool:
                return static_cast<bool>(value) ? "true" : "false";
            case Wt::Json::Type::Number:
                {
                    std::ostringstream oss;
                    oss << static_cast<double>(value);
                    return oss.str();
                }
            default:
                return "?";
            }
        }

        std::string toLine(const Wt::Json::Object& object)
        {
            std::string res{ Wt::Json::serialize(object, 0) };
            std::erase(res, '\n');
            return res + '\n';
        }

        std::string makeResponse(const std::string& error, const Wt::Json::Value& data = Wt::Json::Value::Null)
        {
            Wt::Json::Object response;
            response["error"] = Wt::Json::Value{ error };
            if (!data.isNull())
                response["data"] = data;
            response["request_id"] = Wt::Json::Value{ 0 };

            return toLine(response);
        }
    } // namespace

    std::filesystem::path makeTestEndpointPath()
    {
        static std::atomic<unsigned> counter{};
        return std::filesystem::temp_directory_path() / ("jukebox-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++) + ".sock");
    }

    struct FakePlayer::Session
    {
        explicit Session(boost::asio::io_context& ioContext)
            : socket{ ioContext } {}

        boost::asio::local::stream_protocol::socket socket;
        std::string buffer;
        std::string reply;
    };

    FakePlayer::FakePlayer(const std::filesystem::path& endpoint)
        : _acceptor{ _ioContext }
    {
        std::filesystem::remove(endpoint);

        const boost::asio::local::stream_protocol::endpoint localEndpoint{ endpoint.string() };
        _acceptor.open(localEndpoint.protocol());
        _acceptor.bind(localEndpoint);
        _acceptor.listen();

        _properties["idle-active"] = Wt::Json::Value{ true };
        _properties["pause"] = Wt::Json::Value{ false };
        _properties["volume"] = Wt::Json::Value{ 50.0 };

        asyncAccept();
        _thread = std::thread{ [this] { _ioContext.run(); } };
    }

    FakePlayer::~FakePlayer()
    {
        _ioContext.stop();
        _thread.join();
    }

    void FakePlayer::setProperty(const std::string& name, const Wt::Json::Value& value)
    {
        const std::scoped_lock lock{ _mutex };
        _properties[name] = value;
    }

    void FakePlayer::unsetProperty(const std::string& name)
    {
        const std::scoped_lock lock{ _mutex };
        _properties.erase(name);
    }

    std::optional<Wt::Json::Value> FakePlayer::getProperty(const std::string& name) const
    {
        const std::scoped_lock lock{ _mutex };

        auto it{ _properties.find(name) };
        if (it == std::cend(_properties))
            return std::nullopt;

        return it->second;
    }

    void FakePlayer::setLoadFileError(const std::string& error)
    {
        const std::scoped_lock lock{ _mutex };
        _loadFileError = error;
    }

    void FakePlayer::setSendEventBeforeResponse(bool send)
    {
        const std::scoped_lock lock{ _mutex };
        _sendEventBeforeResponse = send;
    }

    void FakePlayer::setResponsive(bool responsive)
    {
        const std::scoped_lock lock{ _mutex };
        _responsive = responsive;
    }

    std::vector<std::string> FakePlayer::getReceivedCommands() const
    {
        const std::scoped_lock lock{ _mutex };
        return _receivedCommands;
    }

    void FakePlayer::asyncAccept()
    {
        auto session{ std::make_shared<Session>(_ioContext) };
        _acceptor.async_accept(session->socket, [this, session](const boost::system::error_code& ec) {
            if (ec)
                return;

            asyncReadRequest(session);
            asyncAccept();
        });
    }

    void FakePlayer::asyncReadRequest(std::shared_ptr<Session> session)
    {
        boost::asio::async_read_until(session->socket, boost::asio::dynamic_buffer(session->buffer), '\n', [this, session](const boost::system::error_code& ec, std::size_t lineSize) {
            if (ec)
                return; // client closed the connection

            const std::string line{ session->buffer.substr(0, lineSize) };
            session->buffer.erase(0, lineSize);

            session->reply = processRequest(line);
            if (session->reply.empty())
            {
                asyncReadRequest(session);
                return;
            }

            boost::asio::async_write(session->socket, boost::asio::buffer(session->reply), [this, session](const boost::system::error_code& ec, std::size_t /* bytesWritten */) {
                if (!ec)
                    asyncReadRequest(session);
            });
        });
    }

    std::string FakePlayer::processRequest(const std::string& line)
    {
        Wt::Json::Object request;
        Wt::Json::ParseError error;
        if (!Wt::Json::parse(line, request, error) || request.type("command") != Wt::Json::Type::Array)
            return makeResponse("invalid parameter");

        const Wt::Json::Array& command = request.get("command");

        const std::scoped_lock lock{ _mutex };

        std::string receivedCommand;
        for (const Wt::Json::Value& atom : command)
        {
            if (!receivedCommand.empty())
                receivedCommand += ' ';
            receivedCommand += toString(atom);
        }
        _receivedCommands.push_back(receivedCommand);

        if (!_responsive)
            return "";

        std::string reply;
        if (_sendEventBeforeResponse)
        {
            Wt::Json::Object event;
            event["event"] = Wt::Json::Value{ std::string{ "playback-restart" } };
            reply += toLine(event);
            reply += '\n'; // empty lines are ignored
        }
        reply += processCommand(command);

        return reply;
    }

    std::string FakePlayer::processCommand(const Wt::Json::Array& command)
    {
        if (command.empty() || command[0].type() != Wt::Json::Type::String)
            return makeResponse("invalid parameter");

        const std::string name{ static_cast<std::string>(command[0]) };
        if (name == "get_property" && command.size() == 2)
        {
            auto it{ _properties.find(static_cast<std::string>(command[1])) };
            if (it == std::cend(_properties))
                return makeResponse("property unavailable");

            return makeResponse("success", it->second);
        }

        if (name == "set_property" && command.size() == 3)
        {
            _properties[static_cast<std::string>(command[1])] = command[2];
            return makeResponse("success");
        }

        if (name == "loadfile" && command.size() >= 2)
        {
            if (_loadFileError == "success")
            {
                _properties["idle-active"] = Wt::Json::Value{ false };
                _properties["pause"] = Wt::Json::Value{ false };
                _properties["time-pos"] = Wt::Json::Value{ 0.0 };
            }

            return makeResponse(_loadFileError);
        }

        if (name == "stop")
        {
            _properties["idle-active"] = Wt::Json::Value{ true };
            _properties.erase("time-pos");
            _properties.erase("duration");
            return makeResponse("success");
        }

        if (name == "cycle" && command.size() == 2)
        {
            const std::string property{ static_cast<std::string>(command[1]) };
            const bool value{ _properties.contains(property) && _properties[property].type() == Wt::Json::Type::Bool && static_cast<bool>(_properties[property]) };
            _properties[property] = Wt::Json::Value{ !value };
            return makeResponse("success");
        }

        return makeResponse("invalid parameter");
    }
} // namespace jukebox::player::tests
