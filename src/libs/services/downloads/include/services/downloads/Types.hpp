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

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <Wt/WDateTime.h>

#include "database/Types.hpp"
#include "database/objects/DownloadId.hpp"
#include "database/objects/ItemId.hpp"
#include "database/objects/SubscriptionId.hpp"

namespace podkeep::downloads
{
    // Snapshot of a download record
    struct DownloadInfo
    {
        db::DownloadId id;
        db::ItemId itemId;
        db::SubscriptionId subscriptionId;
        std::string itemTitle;
        db::DownloadStatus status;
        std::filesystem::path filePath; // relative to the download root
        std::optional<std::uint64_t> fileSize;
        double progress{};
        std::string errorMessage;
        std::size_t retryCount{};
        Wt::WDateTime createdAt;
        Wt::WDateTime updatedAt;
        Wt::WDateTime startedAt;
        Wt::WDateTime completedAt;
    };

    // Item metadata as produced by feed discovery
    struct ItemMetadata
    {
        std::string guid;
        std::string title;
        std::string description;
        std::string sourceUrl;
        std::string mimeType;
        std::optional<std::uint64_t> declaredSize;
        Wt::WDateTime publishedAt;
        std::optional<int> episodeNumber;
        std::optional<int> seasonNumber;
        std::chrono::seconds duration{};
    };
} // namespace podkeep::downloads
