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

#include "ResponseParser.hpp"

namespace jukebox::resolver::tests
{
    TEST(ResponseParser, resolve)
    {
        const ResolveResult result{ ResponseParser::parseResolveResponse(R"({"title":"Song A","thumbnail":"http://a/thumb.jpg","audioUrl":"http://a","duration":120,"source":"YouTube"})", "https://youtu.be/a") };
        ASSERT_TRUE(std::holds_alternative<ResolvedMedia>(result));

        const ResolvedMedia& media{ std::get<ResolvedMedia>(result) };
        EXPECT_EQ(media.title, "Song A");
        EXPECT_EQ(media.thumbnailUrl, "http://a/thumb.jpg");
        EXPECT_EQ(media.streamUrl, "http://a");
        EXPECT_DOUBLE_EQ(media.durationSeconds, 120);
        EXPECT_EQ(media.sourceLabel, "YouTube");
    }

    TEST(ResponseParser, resolve_defaults)
    {
        const ResolveResult result{ ResponseParser::parseResolveResponse(R"({"streamUrl":"http://b"})", "https://youtu.be/b") };
        ASSERT_TRUE(std::holds_alternative<ResolvedMedia>(result));

        const ResolvedMedia& media{ std::get<ResolvedMedia>(result) };
        EXPECT_EQ(media.title, "Unknown");
        EXPECT_EQ(media.thumbnailUrl, std::nullopt);
        EXPECT_EQ(media.streamUrl, "http://b");
        EXPECT_DOUBLE_EQ(media.durationSeconds, 0);
        EXPECT_EQ(media.sourceLabel, "https://youtu.be/b");
    }

    TEST(ResponseParser, resolve_fractionalDuration)
    {
        const ResolveResult result{ ResponseParser::parseResolveResponse(R"({"audioUrl":"http://c","duration":212.5,"title":null})", "c") };
        ASSERT_TRUE(std::holds_alternative<ResolvedMedia>(result));
        EXPECT_DOUBLE_EQ(std::get<ResolvedMedia>(result).durationSeconds, 212.5);
        EXPECT_EQ(std::get<ResolvedMedia>(result).title, "Unknown");
    }

    TEST(ResponseParser, resolve_missingAudioUrl)
    {
        const ResolveResult result{ ResponseParser::parseResolveResponse(R"({"title":"Song A"})", "a") };
        ASSERT_TRUE(std::holds_alternative<ResolveError>(result));
        EXPECT_FALSE(std::get<ResolveError>(result).credentialsLikelyStale);
    }

    TEST(ResponseParser, resolve_malformed)
    {
        EXPECT_TRUE(std::holds_alternative<ResolveError>(ResponseParser::parseResolveResponse("", "a")));
        EXPECT_TRUE(std::holds_alternative<ResolveError>(ResponseParser::parseResolveResponse("<html>Internal error</html>", "a")));
        EXPECT_TRUE(std::holds_alternative<ResolveError>(ResponseParser::parseResolveResponse(R"({"audioUrl":"http://a")", "a")));
    }

    TEST(ResponseParser, search)
    {
        const SearchResult result{ ResponseParser::parseSearchResponse(R"({"results":[{"title":"Song A","uploader":"Artist A","url":"https://youtu.be/a","duration":180},{"title":"No url"},42,{"url":"https://youtu.be/b","thumbnail":"http://b/thumb.jpg"}]})") };
        ASSERT_TRUE(std::holds_alternative<std::vector<SearchEntry>>(result));

        const std::vector<SearchEntry>& entries{ std::get<std::vector<SearchEntry>>(result) };
        ASSERT_EQ(entries.size(), 2);
        EXPECT_EQ(entries[0].title, "Song A");
        EXPECT_EQ(entries[0].uploader, "Artist A");
        EXPECT_EQ(entries[0].url, "https://youtu.be/a");
        EXPECT_DOUBLE_EQ(entries[0].durationSeconds, 180);
        EXPECT_EQ(entries[0].thumbnailUrl, std::nullopt);

        EXPECT_EQ(entries[1].title, "Unknown");
        EXPECT_EQ(entries[1].url, "https://youtu.be/b");
        EXPECT_EQ(entries[1].thumbnailUrl, "http://b/thumb.jpg");
    }

    TEST(ResponseParser, search_empty)
    {
        const SearchResult result{ ResponseParser::parseSearchResponse(R"({"results":[]})") };
        ASSERT_TRUE(std::holds_alternative<std::vector<SearchEntry>>(result));
        EXPECT_TRUE(std::get<std::vector<SearchEntry>>(result).empty());

        EXPECT_TRUE(std::holds_alternative<ResolveError>(ResponseParser::parseSearchResponse(R"({"error":"quota exceeded"})")));
        EXPECT_TRUE(std::holds_alternative<ResolveError>(ResponseParser::parseSearchResponse("")));
    }

    TEST(ResponseParser, credentialRelatedErrors)
    {
        EXPECT_TRUE(ResponseParser::isCredentialRelatedError("Read timeout"));
        EXPECT_TRUE(ResponseParser::isCredentialRelatedError("Connection refused"));
        EXPECT_TRUE(ResponseParser::isCredentialRelatedError("SSL handshake failed"));
        EXPECT_TRUE(ResponseParser::isCredentialRelatedError("certificate verify failed"));
        EXPECT_FALSE(ResponseParser::isCredentialRelatedError("Host not found (authoritative)"));
        EXPECT_FALSE(ResponseParser::isCredentialRelatedError(""));
    }

    TEST(ResponseParser, makeError)
    {
        EXPECT_TRUE(ResponseParser::makeError("HTTP status 500", 500).credentialsLikelyStale);
        EXPECT_FALSE(ResponseParser::makeError("HTTP status 404", 404).credentialsLikelyStale);
        // status takes precedence over the message
        EXPECT_FALSE(ResponseParser::makeError("Connection: close", 403).credentialsLikelyStale);
        EXPECT_TRUE(ResponseParser::makeError("Connection reset by peer", std::nullopt).credentialsLikelyStale);
        EXPECT_FALSE(ResponseParser::makeError("Host not found", std::nullopt).credentialsLikelyStale);
    }
} // namespace jukebox::resolver::tests
