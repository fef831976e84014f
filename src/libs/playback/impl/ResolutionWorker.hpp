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

#include <deque>
#include <mutex>
#include <string>

#include "playback/QueueItem.hpp"
#include "resolver/IResolver.hpp"

namespace jukebox::playback
{
    class IEventPublisher;
    class PlaybackDirector;
    class QueueStore;

    // Resolves the submitted items one at a time, in submission order
    class ResolutionWorker
    {
    public:
        ResolutionWorker(resolver::IResolver& resolver, QueueStore& queue, PlaybackDirector& director, IEventPublisher& publisher);
        ~ResolutionWorker() = default;
        ResolutionWorker(const ResolutionWorker&) = delete;
        ResolutionWorker& operator=(const ResolutionWorker&) = delete;

        // Never blocks
        void enqueue(const ItemId& id, std::string_view url);

        std::size_t getPendingCount() const;

        // Drops the pending requests, the result of the request in flight is ignored
        void stop();

    private:
        struct Request
        {
            ItemId id;
            std::string url;
        };

        bool isStopped() const;
        void processNextRequest();
        void handleResult(const Request& request, const resolver::ResolveResult& result);
        void onResolved(const Request& request, const resolver::ResolveResult& result);

        resolver::IResolver& _resolver;
        QueueStore& _queue;
        PlaybackDirector& _director;
        IEventPublisher& _publisher;

        mutable std::mutex _mutex;
        std::deque<Request> _requests;
        bool _busy{};
        bool _stopped{};
    };
} // namespace jukebox::playback
