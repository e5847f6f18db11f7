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

#pragma once

#include <string>
#include <string_view>

#include <Wt/Http/Message.h>

#include "core/http/ClientRequestParameters.hpp"

namespace podkeep::core::http
{
    class IClient;
}

namespace podkeep::downloads::httpUtils
{
    constexpr std::string_view browserUserAgent{ "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36" };
    constexpr std::string_view podcastClientUserAgent{ "Overcast/1.0 Podcast Sync (1 subscribers; feed-id=12345)" };

    // Sends the request and blocks until it completes
    // Must not be called from the client's io_context threads
    // Throws Exception on transport failure or abort
    Wt::Http::Message sendRequestAndWait(core::http::IClient& client, core::http::ClientRequestParameters&& params);

    // Follows the redirects of the url using HEAD requests, up to maxHops
    // Returns the url itself if the probe fails
    std::string resolveRedirects(core::http::IClient& client, std::string_view url, std::size_t maxHops = 10);

    // nullptr if the header is not present
    const std::string* getHeader(const Wt::Http::Message& message, std::string_view name);
} // namespace podkeep::downloads::httpUtils
