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

#include <chrono>

#include <gtest/gtest.h>

#include <Wt/Json/Array.h>
#include <Wt/Json/Object.h>
#include <Wt/Json/Value.h>

#include "playback/Exception.hpp"
#include "playback/IPlaybackService.hpp"

#include "PlaybackTestUtils.hpp"

namespace jukebox::playback::tests
{
    using namespace std::chrono_literals;

    namespace
    {
        class PlaybackServiceTest : public ::testing::Test
        {
        protected:
            PlaybackServiceTest()
            {
                params.pollPeriod = 1h; // ticks are not part of these tests
                service = createPlaybackService(params, supervisor, channel, resolver, publisher);
            }

            ~PlaybackServiceTest() override
            {
                service->shutdown();
            }

            ItemId submitResolved(std::string_view title)
            {
                const ItemId id{ service->submit("http://source/" + std::string{ title }) };
                resolver.completeResolve(makeMedia(title, "http://stream/" + std::string{ title }));
                return id;
            }

            PlaybackServiceParameters params;
            FakePlayerSupervisor supervisor;
            FakePlayerChannel channel;
            FakeResolver resolver;
            RecordingPublisher publisher;
            std::unique_ptr<IPlaybackService> service;
        };
    } // namespace

    TEST_F(PlaybackServiceTest, submitResolveAndPlay)
    {
        const ItemId id{ service->submit("A") };
        ASSERT_EQ(service->getQueue().size(), 1);
        EXPECT_EQ(service->getQueue().front().status, ItemStatus::Pending);

        resolver.completeResolve(makeMedia("Song A", "http://a", 120));

        EXPECT_TRUE(service->getQueue().empty());
        const PlaybackSnapshot snapshot{ service->getPlaybackSnapshot() };
        ASSERT_TRUE(snapshot.nowPlaying);
        EXPECT_EQ(snapshot.nowPlaying->id, id);
        EXPECT_EQ(snapshot.nowPlaying->media.streamUrl, "http://a");
    }

    TEST_F(PlaybackServiceTest, submit_emptyUrl)
    {
        EXPECT_THROW(service->submit(""), PlaybackException);
        EXPECT_EQ(resolver.getPendingResolveCount(), 0);
    }

    TEST_F(PlaybackServiceTest, playNow)
    {
        service->toggleAutoplay();
        const ItemId idA{ submitResolved("A") };
        const ItemId idB{ submitResolved("B") };
        publisher.clear();

        EXPECT_TRUE(service->playNow(idB));

        EXPECT_EQ(service->getPlaybackSnapshot().nowPlaying->id, idB);
        ASSERT_EQ(service->getQueue().size(), 1);
        EXPECT_EQ(service->getQueue().front().id, idA);
        EXPECT_EQ(publisher.getEventNames(), (std::vector<std::string>{ "queue_refreshed", "item_removed", "status" }));
    }

    TEST_F(PlaybackServiceTest, playNow_errors)
    {
        service->toggleAutoplay();
        const ItemId pendingId{ service->submit("A") };

        EXPECT_THROW(service->playNow("unknown"), ItemNotFoundException);
        EXPECT_THROW(service->playNow(pendingId), ItemNotReadyException);
        EXPECT_TRUE(channel.getReceivedCommands().empty());
    }

    TEST_F(PlaybackServiceTest, remove)
    {
        service->toggleAutoplay();
        const ItemId id{ submitResolved("A") };

        service->remove(id);
        EXPECT_TRUE(service->getQueue().empty());
        EXPECT_THROW(service->remove(id), ItemNotFoundException);
    }

    TEST_F(PlaybackServiceTest, remove_playing)
    {
        const ItemId id{ submitResolved("A") };
        ASSERT_EQ(service->getPlaybackSnapshot().nowPlaying->id, id);
        publisher.clear();

        service->remove(id);

        EXPECT_FALSE(service->getPlaybackSnapshot().nowPlaying);
        EXPECT_EQ(channel.countCommands("stop"), 1);
        EXPECT_EQ(publisher.getEventNames(), (std::vector<std::string>{ "item_removed", "status" }));
    }

    TEST_F(PlaybackServiceTest, clearQueue)
    {
        submitResolved("A");
        submitResolved("B");
        ASSERT_TRUE(service->getPlaybackSnapshot().nowPlaying);
        publisher.clear();

        service->clearQueue();

        EXPECT_TRUE(service->getQueue().empty());
        EXPECT_FALSE(service->getPlaybackSnapshot().nowPlaying);
        EXPECT_EQ(channel.countCommands("stop"), 1);
        EXPECT_EQ(publisher.getEventNames(), (std::vector<std::string>{ "queue_cleared", "status" }));
    }

    TEST_F(PlaybackServiceTest, reorder)
    {
        service->toggleAutoplay();
        const ItemId idA{ submitResolved("A") };
        const ItemId idB{ submitResolved("B") };
        const ItemId idC{ submitResolved("C") };

        service->moveDown(idA);
        service->moveUp(idC);
        std::vector<QueueItem> items{ service->getQueue() };
        ASSERT_EQ(items.size(), 3);
        EXPECT_EQ(items[0].id, idB);
        EXPECT_EQ(items[1].id, idC);
        EXPECT_EQ(items[2].id, idA);

        service->reorder(2, 0);
        items = service->getQueue();
        EXPECT_EQ(items[0].id, idA);

        EXPECT_THROW(service->reorder(3, 0), IndexOutOfRangeException);
        EXPECT_THROW(service->moveUp("unknown"), ItemNotFoundException);
    }

    TEST_F(PlaybackServiceTest, shuffle)
    {
        service->toggleAutoplay();
        for (std::size_t i{}; i < 5; ++i)
            submitResolved(std::to_string(i));
        publisher.clear();

        service->shuffle();
        EXPECT_EQ(service->getQueue().size(), 5);
        EXPECT_EQ(publisher.getEventNames(), std::vector<std::string>{ "queue_refreshed" });
    }

    TEST_F(PlaybackServiceTest, skip)
    {
        const ItemId idA{ submitResolved("A") };
        const ItemId idB{ submitResolved("B") };
        ASSERT_EQ(service->getPlaybackSnapshot().nowPlaying->id, idA);

        service->skip();
        EXPECT_EQ(service->getPlaybackSnapshot().nowPlaying->id, idB);

        service->toggleAutoplay();
        service->skip();
        EXPECT_EQ(service->getPlaybackSnapshot().nowPlaying->id, idB);
    }

    TEST_F(PlaybackServiceTest, controls)
    {
        service->togglePause();
        EXPECT_EQ(channel.countCommands("cycle pause"), 1);

        service->setVolume(150);
        EXPECT_DOUBLE_EQ(static_cast<double>(channel.getPlayerProperty("volume").value()), 100);
        EXPECT_DOUBLE_EQ(service->getPlaybackSnapshot().volumePercent, 100);

        service->setVolume(-3);
        EXPECT_DOUBLE_EQ(service->getPlaybackSnapshot().volumePercent, 0);

        service->seek(42.5);
        EXPECT_DOUBLE_EQ(static_cast<double>(channel.getPlayerProperty("percent-pos").value()), 42.5);
        service->seek(250);
        EXPECT_DOUBLE_EQ(static_cast<double>(channel.getPlayerProperty("percent-pos").value()), 100);

        service->stop();
        EXPECT_EQ(channel.countCommands("stop"), 1);
    }

    TEST_F(PlaybackServiceTest, autoplay)
    {
        EXPECT_TRUE(service->isAutoplayEnabled());
        EXPECT_FALSE(service->toggleAutoplay());
        EXPECT_FALSE(service->isAutoplayEnabled());
        EXPECT_EQ(publisher.countEvents("autoplay_toggled"), 1);
    }

    TEST_F(PlaybackServiceTest, search)
    {
        std::optional<resolver::SearchResult> searchResult;
        service->search("some song", [&](const resolver::SearchResult& result) { searchResult = result; });
        ASSERT_EQ(resolver.getPendingSearchCount(), 1);

        resolver::SearchEntry entry;
        entry.title = "Some Song";
        entry.url = "http://some/song";
        resolver.completeSearch(std::vector<resolver::SearchEntry>{ entry });

        ASSERT_TRUE(searchResult);
        ASSERT_TRUE(std::holds_alternative<std::vector<resolver::SearchEntry>>(*searchResult));
        EXPECT_EQ(std::get<std::vector<resolver::SearchEntry>>(*searchResult).front().url, "http://some/song");

        EXPECT_THROW(service->search("", [](const resolver::SearchResult&) {}), PlaybackException);
    }

    TEST_F(PlaybackServiceTest, debugSnapshot)
    {
        service->toggleAutoplay();
        const ItemId idA{ submitResolved("A") };
        service->submit("B");

        const DebugSnapshot snapshot{ service->getDebugSnapshot() };
        EXPECT_EQ(snapshot.playerStatus, "Running (PID: 42)");
        EXPECT_TRUE(snapshot.playerEndpointPresent);
        EXPECT_EQ(snapshot.queue.size(), 2);
        EXPECT_FALSE(snapshot.autoplayEnabled);
        EXPECT_FALSE(snapshot.playback.nowPlaying);

        const Wt::Json::Object json{ toJson(snapshot) };
        EXPECT_EQ(static_cast<std::string>(json.get("player_status")), "Running (PID: 42)");
        EXPECT_EQ(static_cast<int>(json.get("queue_length")), 2);

        const Wt::Json::Array& items = json.get("queue_items");
        ASSERT_EQ(items.size(), 2);
        const Wt::Json::Object& itemA = items[0];
        EXPECT_EQ(static_cast<std::string>(itemA.get("id")), idA);
        EXPECT_EQ(static_cast<std::string>(itemA.get("status")), "ready");
        EXPECT_TRUE(static_cast<bool>(itemA.get("has_details")));
        EXPECT_EQ(static_cast<std::string>(itemA.get("title")), "A");

        const Wt::Json::Object& itemB = items[1];
        EXPECT_EQ(static_cast<std::string>(itemB.get("status")), "loading");
        EXPECT_TRUE(itemB.get("title").isNull());
    }
} // namespace jukebox::playback::tests
