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

#include "HttpResolver.hpp"

#include <Wt/Json/Object.h>
#include <Wt/Json/Serializer.h>
#include <Wt/Json/Value.h>

#include "core/ILogger.hpp"

#include "ResponseParser.hpp"

#define LOG(sev, message) JUKEBOX_LOG(RESOLVER, sev, "[HttpResolver] " << message)

namespace jukebox::resolver
{
    namespace
    {
        core::http::ClientPOSTRequestParameters makeRequest(std::string_view fieldName, std::string_view fieldValue)
        {
            Wt::Json::Object root;
            root[std::string{ fieldName }] = Wt::Json::Value{ std::string{ fieldValue } };

            core::http::ClientPOSTRequestParameters request;
            request.message.addBodyText(Wt::Json::serialize(root));
            request.message.addHeader("Content-Type", "application/json");

            return request;
        }
    } // namespace

    std::unique_ptr<IResolver> createResolver(boost::asio::io_context& ioContext, const ResolverParameters& params)
    {
        LOG(INFO, "Using resolver '" << params.url << "', timeout = " << params.timeout.count() << "s");
        return std::make_unique<HttpResolver>(core::http::createClient(ioContext, params.url, params.timeout));
    }

    HttpResolver::HttpResolver(std::unique_ptr<core::http::IClient> client)
        : _client{ std::move(client) }
    {
    }

    void HttpResolver::resolve(std::string_view url, ResolveCallback callback)
    {
        LOG(DEBUG, "Resolving '" << url << "'");

        core::http::ClientPOSTRequestParameters request{ makeRequest("url", url) };
        request.priority = core::http::ClientRequestParameters::Priority::Normal;

        // callbacks are shared by the handlers, only one of them is called
        auto sharedCallback{ std::make_shared<ResolveCallback>(std::move(callback)) };
        request.onSuccessFunc = [sharedCallback, url = std::string{ url }](const Wt::Http::Message& msg) {
            (*sharedCallback)(ResponseParser::parseResolveResponse(msg.body(), url));
        };
        request.onFailureFunc = [sharedCallback, url = std::string{ url }](const core::http::ClientFailure& failure) {
            LOG(ERROR, "Cannot resolve '" << url << "': " << failure.reason);
            (*sharedCallback)(ResponseParser::makeError(failure.reason, failure.status));
        };
        request.onAbortFunc = [sharedCallback] {
            (*sharedCallback)(ResolveError{ "Request aborted", false });
        };

        _client->sendPOSTRequest(std::move(request));
    }

    void HttpResolver::search(std::string_view query, SearchCallback callback)
    {
        LOG(DEBUG, "Searching '" << query << "'");

        core::http::ClientPOSTRequestParameters request{ makeRequest("query", query) };
        // user is waiting for the results
        request.priority = core::http::ClientRequestParameters::Priority::High;

        auto sharedCallback{ std::make_shared<SearchCallback>(std::move(callback)) };
        request.onSuccessFunc = [sharedCallback](const Wt::Http::Message& msg) {
            (*sharedCallback)(ResponseParser::parseSearchResponse(msg.body()));
        };
        request.onFailureFunc = [sharedCallback, query = std::string{ query }](const core::http::ClientFailure& failure) {
            LOG(ERROR, "Search '" << query << "' failed: " << failure.reason);
            (*sharedCallback)(ResponseParser::makeError(failure.reason, failure.status));
        };
        request.onAbortFunc = [sharedCallback] {
            (*sharedCallback)(ResolveError{ "Request aborted", false });
        };

        _client->sendPOSTRequest(std::move(request));
    }
} // namespace jukebox::resolver
