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

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

#include "playback/Events.hpp"
#include "playback/QueueItem.hpp"
#include "resolver/IResolver.hpp"

namespace jukebox::playback
{
    class IEventPublisher;

    // Ordered list of the submitted items that are not playing
    // All operations are atomic, events are published in mutation order (while holding the lock)
    class QueueStore
    {
    public:
        QueueStore(IEventPublisher& publisher);
        ~QueueStore() = default;
        QueueStore(const QueueStore&) = delete;
        QueueStore& operator=(const QueueStore&) = delete;

        // Appends a pending item, returns its newly allocated id
        ItemId submit(std::string_view url);

        // Returns the updated item, or nothing if it has been removed in the meantime
        std::optional<QueueItem> attachResult(const ItemId& id, const resolver::ResolveResult& result);

        std::optional<std::size_t> findIndex(const ItemId& id) const;
        std::optional<QueueItem> findItem(const ItemId& id) const;

        std::optional<QueueItem> removeAt(const ItemId& id);

        // Return false if the queue has not been modified (item already at the boundary)
        // Throw ItemNotFoundException
        bool moveToFront(const ItemId& id);
        bool swapWithPrevious(const ItemId& id);
        bool swapWithNext(const ItemId& id);

        // Throws IndexOutOfRangeException, the queue is left unchanged
        void moveTo(std::size_t oldIndex, std::size_t newIndex);

        // If present, protectedId is placed at the front and excluded from the shuffle
        void shuffleExceptLeading(const std::optional<ItemId>& protectedId);

        void clear();

        std::optional<QueueItem> findFirstReady() const;
        // First ready item among the ones queued after the item taken for playback
        // Falls back to the whole queue if that position is unknown (item was not queued, queue shuffled or cleared)
        std::optional<QueueItem> findNextReady() const;

        // Removes the item and calls install while holding the lock, so that the
        // item is never observed both queued and playing, nor in neither state
        using PlaybackInstaller = std::function<void()>;
        void takeForPlayback(const ItemId& id, const PlaybackInstaller& install);

        std::vector<QueueItem> getItems() const;
        // visitor is called while holding the lock, right after the copy
        std::vector<QueueItem> getItems(const std::function<void()>& visitor) const;
        std::size_t size() const;

    private:
        std::vector<QueueItem>::iterator findItemIt(const ItemId& id);
        std::vector<QueueItem>::const_iterator findItemIt(const ItemId& id) const;
        ItemId generateUniqueId() const;
        void publishRefreshed();
        std::optional<QueueItem> findFirstReadyFrom(std::size_t fromIndex) const;
        void onItemErased(std::size_t index);
        void onItemInserted(std::size_t index);

        IEventPublisher& _publisher;

        mutable std::mutex _mutex;
        std::vector<QueueItem> _items;
        // index of the first item that was queued after the playing one, kept up to date by every mutation
        std::optional<std::size_t> _playbackPosition;
    };
} // namespace jukebox::playback
