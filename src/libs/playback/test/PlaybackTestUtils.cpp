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

#include "PlaybackTestUtils.hpp"

#include <algorithm>
#include <stdexcept>

#include <Wt/Json/Array.h>

#include "core/String.hpp"

namespace jukebox::playback::tests
{
    FakePlayerChannel::FakePlayerChannel()
    {
        _properties["idle-active"] = Wt::Json::Value{ true };
        _properties["pause"] = Wt::Json::Value{ false };
        _properties["volume"] = Wt::Json::Value{ 50. };
    }

    void FakePlayerChannel::setAvailable(bool available)
    {
        const std::scoped_lock lock{ _mutex };
        _available = available;
    }

    void FakePlayerChannel::setLoadError(const std::string& error)
    {
        const std::scoped_lock lock{ _mutex };
        _loadError = error;
    }

    void FakePlayerChannel::setPlayerProperty(const std::string& name, const Wt::Json::Value& value)
    {
        const std::scoped_lock lock{ _mutex };
        _properties[name] = value;
    }

    void FakePlayerChannel::removePlayerProperty(const std::string& name)
    {
        const std::scoped_lock lock{ _mutex };
        _properties.erase(name);
    }

    std::vector<std::string> FakePlayerChannel::getReceivedCommands() const
    {
        const std::scoped_lock lock{ _mutex };
        return _commands;
    }

    std::size_t FakePlayerChannel::countCommands(std::string_view prefix) const
    {
        const std::scoped_lock lock{ _mutex };
        return std::count_if(std::cbegin(_commands), std::cend(_commands), [&](const std::string& command) { return command.starts_with(prefix); });
    }

    std::optional<Wt::Json::Value> FakePlayerChannel::getPlayerProperty(const std::string& name) const
    {
        const std::scoped_lock lock{ _mutex };

        auto it{ _properties.find(name) };
        if (it == std::cend(_properties))
            return std::nullopt;

        return it->second;
    }

    std::optional<player::PlayerResponse> FakePlayerChannel::sendCommand(const Wt::Json::Array& command)
    {
        const std::scoped_lock lock{ _mutex };

        std::vector<std::string> atoms;
        for (const Wt::Json::Value& atom : command)
            atoms.push_back(static_cast<std::string>(atom));
        _commands.push_back(core::stringUtils::joinStrings(atoms, " "));

        if (!_available)
            return std::nullopt;

        player::PlayerResponse response;
        response.error = "success";
        if (!atoms.empty() && atoms.front() == "loadfile" && !_loadError.empty())
            response.error = _loadError;

        return response;
    }

    std::optional<Wt::Json::Value> FakePlayerChannel::getProperty(std::string_view name)
    {
        const std::scoped_lock lock{ _mutex };

        if (!_available)
            return std::nullopt;

        auto it{ _properties.find(std::string{ name }) };
        if (it == std::cend(_properties))
            return std::nullopt;

        return it->second;
    }

    bool FakePlayerChannel::setProperty(std::string_view name, const Wt::Json::Value& value)
    {
        const std::scoped_lock lock{ _mutex };

        _commands.push_back("set_property " + std::string{ name });
        if (!_available)
            return false;

        _properties[std::string{ name }] = value;
        return true;
    }

    std::size_t FakeResolver::getPendingResolveCount() const
    {
        const std::scoped_lock lock{ _mutex };
        return _resolveRequests.size();
    }

    std::string FakeResolver::getNextResolveUrl() const
    {
        const std::scoped_lock lock{ _mutex };
        return _resolveRequests.empty() ? "" : _resolveRequests.front().first;
    }

    void FakeResolver::completeResolve(const resolver::ResolveResult& result)
    {
        ResolveCallback callback;
        {
            const std::scoped_lock lock{ _mutex };
            if (_resolveRequests.empty())
                throw std::logic_error{ "no pending resolve request" };

            callback = std::move(_resolveRequests.front().second);
            _resolveRequests.pop_front();
        }

        callback(result);
    }

    std::size_t FakeResolver::getPendingSearchCount() const
    {
        const std::scoped_lock lock{ _mutex };
        return _searchRequests.size();
    }

    void FakeResolver::completeSearch(const resolver::SearchResult& result)
    {
        SearchCallback callback;
        {
            const std::scoped_lock lock{ _mutex };
            if (_searchRequests.empty())
                throw std::logic_error{ "no pending search request" };

            callback = std::move(_searchRequests.front());
            _searchRequests.pop_front();
        }

        callback(result);
    }

    void FakeResolver::resolve(std::string_view url, ResolveCallback callback)
    {
        const std::scoped_lock lock{ _mutex };
        _resolveRequests.emplace_back(std::string{ url }, std::move(callback));
    }

    void FakeResolver::search(std::string_view, SearchCallback callback)
    {
        const std::scoped_lock lock{ _mutex };
        _searchRequests.emplace_back(std::move(callback));
    }

    void RecordingPublisher::setThrowOnPublish(bool throwOnPublish)
    {
        const std::scoped_lock lock{ _mutex };
        _throwOnPublish = throwOnPublish;
    }

    std::vector<Event> RecordingPublisher::getEvents() const
    {
        const std::scoped_lock lock{ _mutex };
        return _events;
    }

    std::vector<std::string> RecordingPublisher::getEventNames() const
    {
        const std::scoped_lock lock{ _mutex };

        std::vector<std::string> names;
        for (const Event& event : _events)
            names.emplace_back(getEventName(event));

        return names;
    }

    std::size_t RecordingPublisher::countEvents(std::string_view name) const
    {
        const std::scoped_lock lock{ _mutex };
        return std::count_if(std::cbegin(_events), std::cend(_events), [&](const Event& event) { return getEventName(event) == name; });
    }

    std::optional<events::Status> RecordingPublisher::getLastStatus() const
    {
        const std::scoped_lock lock{ _mutex };

        for (auto it{ std::crbegin(_events) }; it != std::crend(_events); ++it)
        {
            if (const events::Status * status{ std::get_if<events::Status>(&*it) })
                return *status;
        }

        return std::nullopt;
    }

    void RecordingPublisher::clear()
    {
        const std::scoped_lock lock{ _mutex };
        _events.clear();
    }

    void RecordingPublisher::publish(const Event& event)
    {
        const std::scoped_lock lock{ _mutex };

        if (_throwOnPublish)
            throw std::runtime_error{ "observer failure" };

        _events.push_back(event);
    }

    resolver::ResolvedMedia makeMedia(std::string_view title, std::string_view streamUrl, double duration)
    {
        resolver::ResolvedMedia media;
        media.title = title;
        media.streamUrl = streamUrl;
        media.durationSeconds = duration;
        media.sourceLabel = "test";

        return media;
    }
} // namespace jukebox::playback::tests
