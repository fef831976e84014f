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

#include "ResponseParser.hpp"

#include <algorithm>
#include <array>

#include <Wt/Json/Array.h>
#include <Wt/Json/Object.h>
#include <Wt/Json/Parser.h>
#include <Wt/Json/Value.h>
#include <Wt/WException.h>

#include "core/ILogger.hpp"
#include "core/String.hpp"

#define LOG(sev, message) JUKEBOX_LOG(RESOLVER, sev, "[ResponseParser] " << message)

namespace jukebox::resolver
{
    namespace
    {
        std::optional<std::string> getOptionalString(const Wt::Json::Object& object, const std::string& name)
        {
            if (object.type(name) != Wt::Json::Type::String)
                return std::nullopt;

            std::string value{ static_cast<std::string>(object.get(name)) };
            if (value.empty())
                return std::nullopt;

            return value;
        }

        double getDuration(const Wt::Json::Object& object)
        {
            if (object.type("duration") == Wt::Json::Type::Number)
                return static_cast<double>(object.get("duration"));

            return 0;
        }

        std::optional<SearchEntry> parseSearchEntry(const Wt::Json::Object& entryObject)
        {
            std::optional<std::string> url{ getOptionalString(entryObject, "url") };
            if (!url)
                return std::nullopt;

            SearchEntry entry;
            entry.url = std::move(*url);
            entry.title = getOptionalString(entryObject, "title").value_or("Unknown");
            entry.uploader = getOptionalString(entryObject, "uploader").value_or("");
            entry.durationSeconds = getDuration(entryObject);
            entry.thumbnailUrl = getOptionalString(entryObject, "thumbnail");

            return entry;
        }
    } // namespace

    ResolveResult ResponseParser::parseResolveResponse(std::string_view msgBody, std::string_view submittedUrl)
    {
        try
        {
            Wt::Json::Object root;
            Wt::Json::parse(std::string{ msgBody }, root);

            std::optional<std::string> streamUrl{ getOptionalString(root, "audioUrl") };
            if (!streamUrl)
                streamUrl = getOptionalString(root, "streamUrl");
            if (!streamUrl)
                return ResolveError{ "No audio URL in response", false };

            ResolvedMedia media;
            media.streamUrl = std::move(*streamUrl);
            media.title = getOptionalString(root, "title").value_or("Unknown");
            media.thumbnailUrl = getOptionalString(root, "thumbnail");
            media.durationSeconds = getDuration(root);
            media.sourceLabel = getOptionalString(root, "source").value_or(std::string{ submittedUrl });

            return media;
        }
        catch (const Wt::WException& error)
        {
            LOG(ERROR, "Cannot parse resolve response: " << error.what());
            return ResolveError{ std::string{ "Malformed response: " } + error.what(), false };
        }
    }

    SearchResult ResponseParser::parseSearchResponse(std::string_view msgBody)
    {
        try
        {
            Wt::Json::Object root;
            Wt::Json::parse(std::string{ msgBody }, root);

            if (root.type("results") != Wt::Json::Type::Array)
                return ResolveError{ "No results in response", false };

            const Wt::Json::Array& results = root.get("results");
            LOG(DEBUG, "Parsing " << results.size() << " search results...");

            std::vector<SearchEntry> entries;
            for (const Wt::Json::Value& value : results)
            {
                if (value.type() != Wt::Json::Type::Object)
                {
                    LOG(DEBUG, "Skipping invalid search result");
                    continue;
                }

                const Wt::Json::Object& entryObject = value;
                if (std::optional<SearchEntry> entry{ parseSearchEntry(entryObject) })
                    entries.push_back(std::move(*entry));
                else
                    LOG(DEBUG, "Skipping search result without url");
            }

            return entries;
        }
        catch (const Wt::WException& error)
        {
            LOG(ERROR, "Cannot parse search response: " << error.what());
            return ResolveError{ std::string{ "Malformed response: " } + error.what(), false };
        }
    }

    bool ResponseParser::isCredentialRelatedError(std::string_view errorMessage)
    {
        static constexpr std::array<std::string_view, 4> keywords{ "timeout", "connection", "ssl", "certificate" };

        return std::any_of(std::cbegin(keywords), std::cend(keywords), [&](std::string_view keyword) {
            return core::stringUtils::stringCaseInsensitiveContains(errorMessage, keyword);
        });
    }

    ResolveError ResponseParser::makeError(std::string message, std::optional<int> httpStatus)
    {
        bool credentialsLikelyStale{};
        if (httpStatus)
            credentialsLikelyStale = (*httpStatus == 500);
        else
            credentialsLikelyStale = isCredentialRelatedError(message);

        return ResolveError{ std::move(message), credentialsLikelyStale };
    }
} // namespace jukebox::resolver
