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

#include "ResolutionWorker.hpp"

#include <exception>

#include "core/ILogger.hpp"

#include "PlaybackDirector.hpp"
#include "PublishEvent.hpp"
#include "QueueStore.hpp"

#define LOG(sev, message) JUKEBOX_LOG(RESOLVER, sev, "[Worker] " << message)

namespace jukebox::playback
{
    ResolutionWorker::ResolutionWorker(resolver::IResolver& resolver, QueueStore& queue, PlaybackDirector& director, IEventPublisher& publisher)
        : _resolver{ resolver }
        , _queue{ queue }
        , _director{ director }
        , _publisher{ publisher }
    {
    }

    void ResolutionWorker::enqueue(const ItemId& id, std::string_view url)
    {
        {
            const std::scoped_lock lock{ _mutex };

            if (_stopped)
            {
                LOG(DEBUG, "Stopped, not resolving '" << url << "'");
                return;
            }

            _requests.push_back(Request{ id, std::string{ url } });
            if (_busy)
                return;

            _busy = true;
        }

        processNextRequest();
    }

    std::size_t ResolutionWorker::getPendingCount() const
    {
        const std::scoped_lock lock{ _mutex };
        return _requests.size() + (_busy ? 1 : 0);
    }

    void ResolutionWorker::stop()
    {
        const std::scoped_lock lock{ _mutex };

        if (!_requests.empty())
            LOG(DEBUG, "Dropping " << _requests.size() << " pending requests");

        _stopped = true;
        _requests.clear();
    }

    bool ResolutionWorker::isStopped() const
    {
        const std::scoped_lock lock{ _mutex };
        return _stopped;
    }

    void ResolutionWorker::processNextRequest()
    {
        Request request;
        {
            const std::scoped_lock lock{ _mutex };

            if (_stopped || _requests.empty())
            {
                _busy = false;
                return;
            }

            request = std::move(_requests.front());
            _requests.pop_front();
        }

        LOG(DEBUG, "Resolving '" << request.url << "' (" << request.id << ")");
        try
        {
            _resolver.resolve(request.url, [this, request](const resolver::ResolveResult& result) {
                if (isStopped())
                    return;

                handleResult(request, result);
                processNextRequest();
            });
        }
        catch (const std::exception& e)
        {
            handleResult(request, resolver::ResolveError{ e.what(), false });
            processNextRequest();
        }
    }

    void ResolutionWorker::handleResult(const Request& request, const resolver::ResolveResult& result)
    {
        try
        {
            onResolved(request, result);
        }
        catch (const std::exception& e)
        {
            LOG(ERROR, "Cannot handle resolution of '" << request.id << "': " << e.what());
        }
    }

    void ResolutionWorker::onResolved(const Request& request, const resolver::ResolveResult& result)
    {
        const std::optional<QueueItem> item{ _queue.attachResult(request.id, result) };

        if (const resolver::ResolveError * error{ std::get_if<resolver::ResolveError>(&result) })
        {
            LOG(ERROR, "Cannot resolve '" << request.url << "': " << error->message);

            if (error->credentialsLikelyStale && item)
                publishEvent(_publisher, events::CredentialRefreshNeeded{ request.url, request.id });

            return;
        }

        if (!item)
            return;

        LOG(INFO, "Resolved '" << item->resolved->title << "' (" << item->id << ")");
        _director.playIfIdle(item->id);
    }
} // namespace jukebox::playback
