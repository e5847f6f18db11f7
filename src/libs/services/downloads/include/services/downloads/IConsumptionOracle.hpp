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

#include <filesystem>
#include <memory>
#include <string>

namespace podkeep::core::http
{
    class IClient;
}

namespace podkeep::downloads
{
    // External system that knows whether a media file has been fully played
    class IConsumptionOracle
    {
    public:
        virtual ~IConsumptionOracle() = default;

        // May throw on lookup failure
        virtual bool isConsumed(const std::filesystem::path& filePath) = 0;
    };

    struct PlexParameters
    {
        std::string url; // "http://localhost:32400"
        std::string token;
        std::string libraryName;
    };

    std::unique_ptr<IConsumptionOracle> createPlexConsumptionOracle(core::http::IClient& client, const PlexParameters& params);
} // namespace podkeep::downloads
