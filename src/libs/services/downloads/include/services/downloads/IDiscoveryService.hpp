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

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "database/objects/SubscriptionId.hpp"
#include "services/downloads/Types.hpp"

namespace podkeep::db
{
    class IDb;
}

namespace podkeep::downloads
{
    class IDownloadService;
    class IFileSystemPlanner;

    // Produces the items currently published by a feed
    class IFeedSource
    {
    public:
        virtual ~IFeedSource() = default;

        // May throw on fetch or parse failure
        virtual std::vector<ItemMetadata> fetchItems(std::string_view feedUrl) = 0;
    };

    struct RefreshReport
    {
        std::size_t refreshedSubscriptionCount{};
        std::size_t failedSubscriptionCount{};
        std::size_t newItemCount{};
        std::size_t queuedDownloadCount{};
    };

    // Subscriptions and the items discovered from their feeds
    class IDiscoveryService
    {
    public:
        virtual ~IDiscoveryService() = default;

        // Returns the existing subscription if the feed is already tracked
        virtual db::SubscriptionId addSubscription(std::string_view feedUrl, std::string_view title) = 0;
        // Items and downloads are removed too
        virtual bool removeSubscription(db::SubscriptionId subscription, bool alsoDeleteFiles) = 0;

        // maxItemsToKeep is clamped to [1, 100]
        virtual bool setRetentionPolicy(db::SubscriptionId subscription, std::size_t maxItemsToKeep, bool autoDownload) = 0;

        // Items whose guid is already known are skipped
        // Returns the number of created items
        virtual std::size_t addItems(db::SubscriptionId subscription, const std::vector<ItemMetadata>& items) = 0;

        // Enqueues the newest items of the subscription, up to its retention limit
        // Items that do not fit in the available storage are skipped
        // Returns the number of created or reset downloads
        virtual std::size_t queueRecentItems(db::SubscriptionId subscription) = 0;

        // Fetches each subscription feed, adds the new items and queues them if auto download is enabled
        // Does nothing if no feed source is set
        virtual RefreshReport refreshAll() = 0;
    };

    // feedSource is optional
    std::unique_ptr<IDiscoveryService> createDiscoveryService(db::IDb& db, IFileSystemPlanner& planner, IDownloadService& downloadService, IFeedSource* feedSource);
} // namespace podkeep::downloads
