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

namespace podkeep::downloads::urlUtils
{
    // "https://host/a/b.mp3?x=1" -> "/a/b.mp3"
    std::string_view getPath(std::string_view url);

    // Extension from the url path if any, then from the mime type, "mp3" by default
    std::string getFileExtension(std::string_view url, std::string_view mimeType);

    // Signed CDN urls and tracking redirects may be consumed by a probe request
    bool isSignedUrl(std::string_view url);
    bool isTrackingUrl(std::string_view url);
    inline bool isProbeSensitiveUrl(std::string_view url) { return isSignedUrl(url) || isTrackingUrl(url); }

    // Resolves the value of a Location header against the url of the request
    std::string resolveLocation(std::string_view requestUrl, std::string_view location);
} // namespace podkeep::downloads::urlUtils
