/*
 * Copyright (C) 2025 Emeric Poupon
 *
 * This file is part of Podkeep.
 *
 * Podkeep is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Podkeep is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Podkeep.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "HttpUtils.hpp"

#include <future>
#include <memory>

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "core/http/IClient.hpp"
#include "services/downloads/Exception.hpp"

#include "UrlUtils.hpp"

namespace podkeep::downloads::httpUtils
{
    namespace
    {
        constexpr std::chrono::seconds probeTimeout{ 30 };

        bool isRedirectStatus(int status)
        {
            return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
        }
    } // namespace

    Wt::Http::Message sendRequestAndWait(core::http::IClient& client, core::http::ClientRequestParameters&& params)
    {
        // shared since the callbacks may outlive this call if the client is destroyed first
        auto promise{ std::make_shared<std::promise<Wt::Http::Message>>() };
        std::future<Wt::Http::Message> future{ promise->get_future() };

        const std::string url{ params.url };
        params.onResponseFunc = [promise](const Wt::Http::Message& msg) {
            promise->set_value(msg);
        };
        params.onFailureFunc = [promise, url](std::string_view error) {
            promise->set_exception(std::make_exception_ptr(Exception{ "Request to '" + url + "' failed: " + std::string{ error } }));
        };
        params.onAbortFunc = [promise, url] {
            promise->set_exception(std::make_exception_ptr(Exception{ "Request to '" + url + "' aborted" }));
        };

        client.sendRequest(std::move(params));

        return future.get();
    }

    std::string resolveRedirects(core::http::IClient& client, std::string_view url, std::size_t maxHops)
    {
        std::string currentUrl{ url };

        try
        {
            for (std::size_t hop{}; hop < maxHops; ++hop)
            {
                core::http::ClientRequestParameters params;
                params.method = core::http::ClientRequestParameters::Method::HEAD;
                params.url = currentUrl;
                params.followRedirects = false;
                params.timeout = probeTimeout;
                params.headers.emplace_back("User-Agent", std::string{ browserUserAgent });

                const Wt::Http::Message response{ sendRequestAndWait(client, std::move(params)) };
                if (!isRedirectStatus(response.status()))
                    return currentUrl;

                const std::string* location{ getHeader(response, "Location") };
                if (!location || location->empty())
                    return currentUrl;

                const std::string nextUrl{ urlUtils::resolveLocation(currentUrl, *location) };
                PODKEEP_LOG(HTTP, DEBUG, "Url '" << currentUrl << "' redirects to '" << nextUrl << "'");
                currentUrl = nextUrl;
            }

            PODKEEP_LOG(HTTP, WARNING, "Too many redirects for '" << url << "', using '" << currentUrl << "'");
        }
        catch (const Exception& e)
        {
            PODKEEP_LOG(HTTP, WARNING, "Cannot resolve redirects of '" << url << "': " << e.what() << ", using original url");
            return std::string{ url };
        }

        return currentUrl;
    }

    const std::string* getHeader(const Wt::Http::Message& message, std::string_view name)
    {
        for (const Wt::Http::Message::Header& header : message.headers())
        {
            if (core::stringUtils::stringCaseInsensitiveEqual(header.name(), name))
                return &header.value();
        }

        return nullptr;
    }
} // namespace podkeep::downloads::httpUtils
