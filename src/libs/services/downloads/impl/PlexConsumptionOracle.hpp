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

#include <mutex>
#include <optional>
#include <string>

#include "services/downloads/IConsumptionOracle.hpp"

namespace pugi
{
    class xml_document;
}

namespace podkeep::downloads
{
    // Asks a Plex Media Server whether a file of its library has been played
    class PlexConsumptionOracle : public IConsumptionOracle
    {
    public:
        PlexConsumptionOracle(core::http::IClient& client, const PlexParameters& params);
        ~PlexConsumptionOracle() override = default;
        PlexConsumptionOracle(const PlexConsumptionOracle&) = delete;
        PlexConsumptionOracle& operator=(const PlexConsumptionOracle&) = delete;

    private:
        bool isConsumed(const std::filesystem::path& filePath) override;

        const std::string& getSectionKey();
        void query(std::string_view path, std::string_view queryParams, pugi::xml_document& doc);

        core::http::IClient& _client;
        const PlexParameters _params;

        std::mutex _mutex;
        std::optional<std::string> _sectionKey; // resolved on first use
    };
} // namespace podkeep::downloads
