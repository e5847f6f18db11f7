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

#include "PlexConsumptionOracle.hpp"

#include <pugixml.hpp>

#include <Wt/Utils.h>

#include "core/ILogger.hpp"
#include "services/downloads/Exception.hpp"

#include "HttpUtils.hpp"

namespace podkeep::downloads
{
    namespace
    {
        constexpr std::chrono::seconds requestTimeout{ 30 };
        // "type=10" restricts the listings to tracks
        constexpr std::string_view trackTypeParam{ "type=10" };

        bool isPlayed(const pugi::xml_node& mediaNode)
        {
            return mediaNode.attribute("viewCount").as_ullong() > 0;
        }

        bool hasFile(const pugi::xml_node& mediaNode, const std::filesystem::path& fileName)
        {
            for (const pugi::xml_node& media : mediaNode.children("Media"))
            {
                for (const pugi::xml_node& part : media.children("Part"))
                {
                    if (std::filesystem::path{ part.attribute("file").as_string() }.filename() == fileName)
                        return true;
                }
            }

            return false;
        }

        // first element of the container, whatever its kind (Track, Episode, Video...)
        pugi::xml_node findFirstMedia(const pugi::xml_document& doc)
        {
            return doc.child("MediaContainer").first_child();
        }

        pugi::xml_node findMediaByFile(const pugi::xml_document& doc, const std::filesystem::path& fileName)
        {
            for (const pugi::xml_node& mediaNode : doc.child("MediaContainer").children())
            {
                if (hasFile(mediaNode, fileName))
                    return mediaNode;
            }

            return {};
        }
    } // namespace

    std::unique_ptr<IConsumptionOracle> createPlexConsumptionOracle(core::http::IClient& client, const PlexParameters& params)
    {
        return std::make_unique<PlexConsumptionOracle>(client, params);
    }

    PlexConsumptionOracle::PlexConsumptionOracle(core::http::IClient& client, const PlexParameters& params)
        : _client{ client }
        , _params{ params }
    {
        PODKEEP_LOG(CONSUMPTION, INFO, "Using Plex server '" << _params.url << "', library '" << _params.libraryName << "'");
    }

    bool PlexConsumptionOracle::isConsumed(const std::filesystem::path& filePath)
    {
        const std::string& sectionKey{ getSectionKey() };
        const std::string sectionPath{ "/library/sections/" + sectionKey + "/all" };

        pugi::xml_document doc;

        // title search first, Plex titles default to the file stem
        query(sectionPath, std::string{ trackTypeParam } + "&title=" + Wt::Utils::urlEncode(filePath.stem().string()), doc);
        pugi::xml_node mediaNode{ findFirstMedia(doc) };

        if (!mediaNode)
        {
            query(sectionPath, trackTypeParam, doc);
            mediaNode = findMediaByFile(doc, filePath.filename());
        }

        if (!mediaNode)
        {
            PODKEEP_LOG(CONSUMPTION, DEBUG, "File " << filePath.filename() << " not found in Plex library");
            return false;
        }

        const bool played{ isPlayed(mediaNode) };
        PODKEEP_LOG(CONSUMPTION, DEBUG, "File " << filePath.filename() << ": viewCount = " << mediaNode.attribute("viewCount").as_ullong());
        return played;
    }

    const std::string& PlexConsumptionOracle::getSectionKey()
    {
        std::scoped_lock lock{ _mutex };

        if (_sectionKey)
            return *_sectionKey;

        pugi::xml_document doc;
        query("/library/sections", "", doc);

        for (const pugi::xml_node& directory : doc.child("MediaContainer").children("Directory"))
        {
            if (std::string_view{ directory.attribute("title").as_string() } != _params.libraryName)
                continue;

            const std::string_view key{ directory.attribute("key").as_string() };
            if (key.empty())
                break;

            _sectionKey = key;
            PODKEEP_LOG(CONSUMPTION, DEBUG, "Plex library '" << _params.libraryName << "' has key " << *_sectionKey);
            return *_sectionKey;
        }

        throw Exception{ "Plex library '" + _params.libraryName + "' not found" };
    }

    void PlexConsumptionOracle::query(std::string_view path, std::string_view queryParams, pugi::xml_document& doc)
    {
        core::http::ClientRequestParameters params;
        params.url = _params.url + std::string{ path };
        if (!queryParams.empty())
        {
            params.url += "?";
            params.url += queryParams;
        }
        params.timeout = requestTimeout;
        params.headers.emplace_back("Accept", "application/xml");
        params.headers.emplace_back("X-Plex-Token", _params.token);

        const Wt::Http::Message response{ httpUtils::sendRequestAndWait(_client, std::move(params)) };
        if (response.status() != 200)
            throw Exception{ "Plex request '" + std::string{ path } + "' failed with status " + std::to_string(response.status()) };

        const std::string body{ response.body() };
        const pugi::xml_parse_result result{ doc.load_buffer(body.data(), body.size()) };
        if (!result)
            throw Exception{ "Cannot parse Plex response: " + std::string{ result.description() } };
    }
} // namespace podkeep::downloads
