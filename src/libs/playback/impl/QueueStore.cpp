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

#include "QueueStore.hpp"

#include <algorithm>
#include <iterator>

#include "core/ILogger.hpp"
#include "core/Random.hpp"
#include "playback/Exception.hpp"

#include "PublishEvent.hpp"

#define LOG(sev, message) JUKEBOX_LOG(QUEUE, sev, message)

namespace jukebox::playback
{
    namespace
    {
        constexpr std::size_t idByteCount{ 4 };
    }

    QueueStore::QueueStore(IEventPublisher& publisher)
        : _publisher{ publisher }
    {
    }

    ItemId QueueStore::submit(std::string_view url)
    {
        if (url.empty())
            throw PlaybackException{ "Empty URL" };

        const std::scoped_lock lock{ _mutex };

        ItemId id{ generateUniqueId() };
        QueueItem& item{ _items.emplace_back() };
        item.id = std::move(id);
        item.sourceUrl = url;
        item.status = ItemStatus::Pending;

        LOG(DEBUG, "Submitted item '" << item.id << "', url = '" << item.sourceUrl << "'");
        publishEvent(_publisher, events::QueueUpdate{ item });

        return item.id;
    }

    std::optional<QueueItem> QueueStore::attachResult(const ItemId& id, const resolver::ResolveResult& result)
    {
        const std::scoped_lock lock{ _mutex };

        auto it{ findItemIt(id) };
        if (it == std::end(_items))
        {
            LOG(DEBUG, "Item '" << id << "' removed before resolution completed");
            return std::nullopt;
        }

        if (const resolver::ResolvedMedia * media{ std::get_if<resolver::ResolvedMedia>(&result) })
        {
            it->status = ItemStatus::Ready;
            it->resolved = *media;
        }
        else
        {
            it->status = ItemStatus::Error;
        }

        publishEvent(_publisher, events::QueueUpdate{ *it });
        return *it;
    }

    std::optional<std::size_t> QueueStore::findIndex(const ItemId& id) const
    {
        const std::scoped_lock lock{ _mutex };

        auto it{ findItemIt(id) };
        if (it == std::cend(_items))
            return std::nullopt;

        return std::distance(std::cbegin(_items), it);
    }

    std::optional<QueueItem> QueueStore::findItem(const ItemId& id) const
    {
        const std::scoped_lock lock{ _mutex };

        auto it{ findItemIt(id) };
        if (it == std::cend(_items))
            return std::nullopt;

        return *it;
    }

    std::optional<QueueItem> QueueStore::removeAt(const ItemId& id)
    {
        const std::scoped_lock lock{ _mutex };

        auto it{ findItemIt(id) };
        if (it == std::end(_items))
            return std::nullopt;

        QueueItem removedItem{ std::move(*it) };
        onItemErased(std::distance(std::begin(_items), it));
        _items.erase(it);

        publishEvent(_publisher, events::ItemRemoved{ removedItem.id });
        return removedItem;
    }

    bool QueueStore::moveToFront(const ItemId& id)
    {
        const std::scoped_lock lock{ _mutex };

        auto it{ findItemIt(id) };
        if (it == std::end(_items))
            throw ItemNotFoundException{ id };

        if (it == std::begin(_items))
            return false;

        onItemErased(std::distance(std::begin(_items), it));
        onItemInserted(0);
        std::rotate(std::begin(_items), it, std::next(it));

        publishRefreshed();
        return true;
    }

    bool QueueStore::swapWithPrevious(const ItemId& id)
    {
        const std::scoped_lock lock{ _mutex };

        auto it{ findItemIt(id) };
        if (it == std::end(_items))
            throw ItemNotFoundException{ id };

        if (it == std::begin(_items))
            return false;

        std::iter_swap(it, std::prev(it));

        publishRefreshed();
        return true;
    }

    bool QueueStore::swapWithNext(const ItemId& id)
    {
        const std::scoped_lock lock{ _mutex };

        auto it{ findItemIt(id) };
        if (it == std::end(_items))
            throw ItemNotFoundException{ id };

        if (std::next(it) == std::end(_items))
            return false;

        std::iter_swap(it, std::next(it));

        publishRefreshed();
        return true;
    }

    void QueueStore::moveTo(std::size_t oldIndex, std::size_t newIndex)
    {
        const std::scoped_lock lock{ _mutex };

        if (oldIndex >= _items.size() || newIndex >= _items.size())
            throw IndexOutOfRangeException{ oldIndex, newIndex, _items.size() };

        QueueItem item{ std::move(_items[oldIndex]) };
        _items.erase(std::begin(_items) + oldIndex);
        onItemErased(oldIndex);
        _items.insert(std::begin(_items) + newIndex, std::move(item));
        onItemInserted(newIndex);

        publishRefreshed();
    }

    void QueueStore::shuffleExceptLeading(const std::optional<ItemId>& protectedId)
    {
        const std::scoped_lock lock{ _mutex };

        auto shuffleBegin{ std::begin(_items) };
        if (protectedId)
        {
            auto it{ findItemIt(*protectedId) };
            if (it != std::end(_items))
            {
                std::rotate(std::begin(_items), it, std::next(it));
                shuffleBegin = std::next(std::begin(_items));
            }
        }

        core::random::shuffle(shuffleBegin, std::end(_items));
        _playbackPosition.reset();

        publishRefreshed();
    }

    void QueueStore::clear()
    {
        const std::scoped_lock lock{ _mutex };

        LOG(DEBUG, "Clearing " << _items.size() << " items");
        _items.clear();
        _playbackPosition.reset();

        publishEvent(_publisher, events::QueueCleared{});
    }

    std::optional<QueueItem> QueueStore::findFirstReady() const
    {
        const std::scoped_lock lock{ _mutex };
        return findFirstReadyFrom(0);
    }

    std::optional<QueueItem> QueueStore::findNextReady() const
    {
        const std::scoped_lock lock{ _mutex };
        return findFirstReadyFrom(_playbackPosition.value_or(0));
    }

    std::optional<QueueItem> QueueStore::findFirstReadyFrom(std::size_t fromIndex) const
    {
        auto it{ std::find_if(std::cbegin(_items) + std::min(fromIndex, _items.size()), std::cend(_items), [](const QueueItem& item) { return item.status == ItemStatus::Ready; }) };
        if (it == std::cend(_items))
            return std::nullopt;

        return *it;
    }

    void QueueStore::takeForPlayback(const ItemId& id, const PlaybackInstaller& install)
    {
        const std::scoped_lock lock{ _mutex };

        auto it{ findItemIt(id) };
        if (it == std::end(_items))
        {
            _playbackPosition.reset();
            install();
            return;
        }

        _playbackPosition = std::distance(std::begin(_items), it);
        _items.erase(it);
        install();

        publishEvent(_publisher, events::ItemRemoved{ id });
    }

    std::vector<QueueItem> QueueStore::getItems() const
    {
        const std::scoped_lock lock{ _mutex };
        return _items;
    }

    std::vector<QueueItem> QueueStore::getItems(const std::function<void()>& visitor) const
    {
        const std::scoped_lock lock{ _mutex };

        std::vector<QueueItem> res{ _items };
        visitor();

        return res;
    }

    std::size_t QueueStore::size() const
    {
        const std::scoped_lock lock{ _mutex };
        return _items.size();
    }

    std::vector<QueueItem>::iterator QueueStore::findItemIt(const ItemId& id)
    {
        return std::find_if(std::begin(_items), std::end(_items), [&](const QueueItem& item) { return item.id == id; });
    }

    std::vector<QueueItem>::const_iterator QueueStore::findItemIt(const ItemId& id) const
    {
        return std::find_if(std::cbegin(_items), std::cend(_items), [&](const QueueItem& item) { return item.id == id; });
    }

    ItemId QueueStore::generateUniqueId() const
    {
        while (true)
        {
            ItemId id{ core::random::generateHexToken(idByteCount) };
            if (findItemIt(id) == std::cend(_items))
                return id;
        }
    }

    void QueueStore::onItemErased(std::size_t index)
    {
        // the next item takes the place of an erased item at the position
        if (_playbackPosition && index < *_playbackPosition)
            --*_playbackPosition;
    }

    void QueueStore::onItemInserted(std::size_t index)
    {
        // an item inserted at the position goes before the playing item
        if (_playbackPosition && index <= *_playbackPosition)
            ++*_playbackPosition;
    }

    void QueueStore::publishRefreshed()
    {
        publishEvent(_publisher, events::QueueRefreshed{ _items });
    }
} // namespace jukebox::playback
