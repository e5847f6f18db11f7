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

#include "services/downloads/IDiscoveryService.hpp"

namespace podkeep::downloads
{
    class DiscoveryService : public IDiscoveryService
    {
    public:
        DiscoveryService(db::IDb& db, IFileSystemPlanner& planner, IDownloadService& downloadService, IFeedSource* feedSource);
        ~DiscoveryService() override = default;
        DiscoveryService(const DiscoveryService&) = delete;
        DiscoveryService& operator=(const DiscoveryService&) = delete;

    private:
        db::SubscriptionId addSubscription(std::string_view feedUrl, std::string_view title) override;
        bool removeSubscription(db::SubscriptionId subscription, bool alsoDeleteFiles) override;
        bool setRetentionPolicy(db::SubscriptionId subscription, std::size_t maxItemsToKeep, bool autoDownload) override;
        std::size_t addItems(db::SubscriptionId subscription, const std::vector<ItemMetadata>& items) override;
        std::size_t queueRecentItems(db::SubscriptionId subscription) override;
        RefreshReport refreshAll() override;

        std::string getUniqueFolderName(std::string_view title);

        db::IDb& _db;
        IFileSystemPlanner& _planner;
        IDownloadService& _downloadService;
        IFeedSource* _feedSource;

        std::mutex _refreshMutex;
    };
} // namespace podkeep::downloads
