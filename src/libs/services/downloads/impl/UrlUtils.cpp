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

#include "UrlUtils.hpp"

#include <algorithm>
#include <array>
#include <cctype>

#include "core/String.hpp"

namespace podkeep::downloads::urlUtils
{
    namespace
    {
        constexpr std::array<std::string_view, 9> signatureIndicators{
            "Signature=",
            "Expires=",
            "Key-Pair-Id=",
            "Policy=",
            "signature=",
            "expires=",
            "token=",
            "auth=",
            "hmac=",
        };

        constexpr std::array<std::string_view, 14> trackingServices{
            "podtrac.com",
            "mgln.ai",
            "chartable.com",
            "podsights.com",
            "podcorn.com",
            "blubrry.com",
            "feedpress.com",
            "backtracks.fm",
            "claritas.com",
            "podscribe.com",
            "spotify-analytics",
            "art19.com",
            "megaphone.fm",
            "simplecast.com",
        };

        struct MimeTypeExtension
        {
            std::string_view mimeType;
            std::string_view extension;
        };

        constexpr std::array<MimeTypeExtension, 9> mimeTypeExtensions{ {
            { "audio/mpeg", "mp3" },
            { "audio/mp3", "mp3" },
            { "audio/mp4", "m4a" },
            { "audio/m4a", "m4a" },
            { "audio/x-m4a", "m4a" },
            { "audio/aac", "aac" },
            { "audio/ogg", "ogg" },
            { "audio/wav", "wav" },
            { "audio/webm", "webm" },
        } };

        constexpr std::string_view defaultExtension{ "mp3" };
        constexpr std::size_t maxExtensionLength{ 5 };

        // "https://host:port" part of the url, empty if the url is not absolute
        std::string_view getOrigin(std::string_view url)
        {
            const std::size_t schemeEnd{ url.find("://") };
            if (schemeEnd == std::string_view::npos)
                return {};

            const std::size_t pathBegin{ url.find_first_of("/?#", schemeEnd + 3) };
            return url.substr(0, pathBegin);
        }
    } // namespace

    std::string_view getPath(std::string_view url)
    {
        const std::size_t schemeEnd{ url.find("://") };
        if (schemeEnd != std::string_view::npos)
        {
            const std::size_t pathBegin{ url.find_first_of("/?#", schemeEnd + 3) };
            if (pathBegin == std::string_view::npos)
                return {};
            url.remove_prefix(pathBegin);
        }

        const std::size_t pathEnd{ url.find_first_of("?#") };
        return url.substr(0, pathEnd);
    }

    std::string getFileExtension(std::string_view url, std::string_view mimeType)
    {
        std::string_view fileName{ getPath(url) };
        if (const std::size_t lastSlash{ fileName.find_last_of('/') }; lastSlash != std::string_view::npos)
            fileName.remove_prefix(lastSlash + 1);

        if (const std::size_t dotPos{ fileName.find_last_of('.') }; dotPos != std::string_view::npos)
        {
            const std::string_view extension{ fileName.substr(dotPos + 1) };
            if (!extension.empty() && extension.size() <= maxExtensionLength && std::all_of(std::cbegin(extension), std::cend(extension), [](unsigned char c) { return std::isalnum(c); }))
                return core::stringUtils::stringToLower(extension);
        }

        const std::string_view bareMimeType{ core::stringUtils::stringTrim(mimeType.substr(0, mimeType.find(';'))) };
        for (const MimeTypeExtension& entry : mimeTypeExtensions)
        {
            if (core::stringUtils::stringCaseInsensitiveEqual(entry.mimeType, bareMimeType))
                return std::string{ entry.extension };
        }

        return std::string{ defaultExtension };
    }

    bool isSignedUrl(std::string_view url)
    {
        return std::any_of(std::cbegin(signatureIndicators), std::cend(signatureIndicators), [&](std::string_view indicator) { return url.find(indicator) != std::string_view::npos; });
    }

    bool isTrackingUrl(std::string_view url)
    {
        return std::any_of(std::cbegin(trackingServices), std::cend(trackingServices), [&](std::string_view service) { return core::stringUtils::stringCaseInsensitiveContains(url, service); });
    }

    std::string resolveLocation(std::string_view requestUrl, std::string_view location)
    {
        location = core::stringUtils::stringTrim(location);

        if (location.find("://") != std::string_view::npos)
            return std::string{ location };

        // protocol relative
        if (location.starts_with("//"))
        {
            const std::size_t schemeEnd{ requestUrl.find("://") };
            return std::string{ requestUrl.substr(0, schemeEnd + 1) } + std::string{ location };
        }

        const std::string_view origin{ getOrigin(requestUrl) };
        if (location.starts_with('/'))
            return std::string{ origin } + std::string{ location };

        // relative to the directory of the request path
        const std::string_view requestPath{ getPath(requestUrl) };
        const std::size_t lastSlash{ requestPath.find_last_of('/') };
        const std::string_view directory{ lastSlash == std::string_view::npos ? std::string_view{ "/" } : requestPath.substr(0, lastSlash + 1) };

        return std::string{ origin } + std::string{ directory } + std::string{ location };
    }
} // namespace podkeep::downloads::urlUtils
