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

#include <gtest/gtest.h>

#include "PlaybackDirector.hpp"
#include "PlaybackState.hpp"
#include "PlaybackTestUtils.hpp"
#include "QueueStore.hpp"
#include "ResolutionWorker.hpp"

namespace jukebox::playback::tests
{
    namespace
    {
        class ResolutionWorkerTest : public ::testing::Test
        {
        protected:
            ItemId submit(std::string_view url)
            {
                const ItemId id{ queue.submit(url) };
                worker.enqueue(id, url);
                return id;
            }

            FakePlayerChannel channel;
            FakeResolver resolver;
            RecordingPublisher publisher;
            QueueStore queue{ publisher };
            PlaybackState state{ 50 };
            PlaybackDirector director{ channel, queue, state, publisher, true };
            ResolutionWorker worker{ resolver, queue, director, publisher };
        };
    } // namespace

    TEST_F(ResolutionWorkerTest, oneAtATime)
    {
        submit("http://a");
        submit("http://b");
        submit("http://c");

        EXPECT_EQ(resolver.getPendingResolveCount(), 1);
        EXPECT_EQ(resolver.getNextResolveUrl(), "http://a");
        EXPECT_EQ(worker.getPendingCount(), 3);

        resolver.completeResolve(resolver::ResolveError{ "failure", false });
        EXPECT_EQ(resolver.getPendingResolveCount(), 1);
        EXPECT_EQ(resolver.getNextResolveUrl(), "http://b");

        resolver.completeResolve(resolver::ResolveError{ "failure", false });
        EXPECT_EQ(resolver.getNextResolveUrl(), "http://c");

        resolver.completeResolve(resolver::ResolveError{ "failure", false });
        EXPECT_EQ(resolver.getPendingResolveCount(), 0);
        EXPECT_EQ(worker.getPendingCount(), 0);

        // idle worker picks up new requests
        submit("http://d");
        EXPECT_EQ(resolver.getNextResolveUrl(), "http://d");
    }

    TEST_F(ResolutionWorkerTest, resolvedThenPlayed)
    {
        const ItemId id{ submit("A") };
        EXPECT_EQ(queue.findItem(id)->status, ItemStatus::Pending);

        resolver.completeResolve(makeMedia("Song A", "http://a", 120));

        EXPECT_EQ(queue.size(), 0);
        EXPECT_EQ(state.getNowPlayingId(), id);
        EXPECT_EQ(state.getSnapshot().nowPlaying->media.title, "Song A");
        EXPECT_EQ(channel.countCommands("loadfile http://a replace"), 1);
    }

    TEST_F(ResolutionWorkerTest, resolvedWhilePlaying)
    {
        const ItemId idA{ submit("A") };
        const ItemId idB{ submit("B") };

        resolver.completeResolve(makeMedia("Song A", "http://a"));
        resolver.completeResolve(makeMedia("Song B", "http://b"));

        EXPECT_EQ(state.getNowPlayingId(), idA);
        const std::optional<QueueItem> itemB{ queue.findItem(idB) };
        ASSERT_TRUE(itemB);
        EXPECT_EQ(itemB->status, ItemStatus::Ready);
    }

    TEST_F(ResolutionWorkerTest, resolvedAutoplayDisabled)
    {
        director.toggleAutoplay();
        const ItemId id{ submit("A") };

        resolver.completeResolve(makeMedia("Song A", "http://a"));

        EXPECT_FALSE(state.getNowPlayingId());
        EXPECT_EQ(queue.findItem(id)->status, ItemStatus::Ready);
        EXPECT_TRUE(channel.getReceivedCommands().empty());
    }

    TEST_F(ResolutionWorkerTest, failure)
    {
        const ItemId id{ submit("A") };
        publisher.clear();

        resolver.completeResolve(resolver::ResolveError{ "Not found", false });

        EXPECT_EQ(queue.findItem(id)->status, ItemStatus::Error);
        EXPECT_EQ(publisher.getEventNames(), std::vector<std::string>{ "queue_update" });
    }

    TEST_F(ResolutionWorkerTest, failure_staleCredentials)
    {
        const ItemId id{ submit("http://a") };
        publisher.clear();

        resolver.completeResolve(resolver::ResolveError{ "Internal server error", true });

        const std::vector<Event> events{ publisher.getEvents() };
        ASSERT_EQ(events.size(), 2);
        ASSERT_TRUE(std::holds_alternative<events::CredentialRefreshNeeded>(events[1]));
        EXPECT_EQ(std::get<events::CredentialRefreshNeeded>(events[1]).url, "http://a");
        EXPECT_EQ(std::get<events::CredentialRefreshNeeded>(events[1]).itemId, id);
    }

    TEST_F(ResolutionWorkerTest, failure_staleCredentialsRemovedItem)
    {
        const ItemId id{ submit("http://a") };
        ASSERT_TRUE(queue.removeAt(id));
        publisher.clear();

        resolver.completeResolve(resolver::ResolveError{ "Internal server error", true });

        EXPECT_TRUE(publisher.getEvents().empty());
    }

    TEST_F(ResolutionWorkerTest, removedBeforeResolution)
    {
        const ItemId id{ submit("A") };
        ASSERT_TRUE(queue.removeAt(id));

        resolver.completeResolve(makeMedia("Song A", "http://a"));

        EXPECT_EQ(queue.size(), 0);
        EXPECT_FALSE(state.getNowPlayingId());
        EXPECT_TRUE(channel.getReceivedCommands().empty());
    }

    TEST_F(ResolutionWorkerTest, stop)
    {
        const ItemId idA{ submit("A") };
        const ItemId idB{ submit("B") };

        worker.stop();
        resolver.completeResolve(makeMedia("Song A", "http://a"));

        EXPECT_EQ(resolver.getPendingResolveCount(), 0);
        EXPECT_EQ(queue.findItem(idA)->status, ItemStatus::Pending);
        EXPECT_EQ(queue.findItem(idB)->status, ItemStatus::Pending);

        submit("C");
        EXPECT_EQ(resolver.getPendingResolveCount(), 0);
    }
} // namespace jukebox::playback::tests
