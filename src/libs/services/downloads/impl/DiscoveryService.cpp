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

#include "DiscoveryService.hpp"

#include <unordered_set>

#include "core/ILogger.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/objects/Download.hpp"
#include "database/objects/Item.hpp"
#include "database/objects/Subscription.hpp"
#include "services/downloads/Exception.hpp"
#include "services/downloads/IDownloadService.hpp"
#include "services/downloads/IFileSystemPlanner.hpp"

#define LOG(sev, message) PODKEEP_LOG(DISCOVERY, sev, message)

namespace podkeep::downloads
{
    std::unique_ptr<IDiscoveryService> createDiscoveryService(db::IDb& db, IFileSystemPlanner& planner, IDownloadService& downloadService, IFeedSource* feedSource)
    {
        return std::make_unique<DiscoveryService>(db, planner, downloadService, feedSource);
    }

    DiscoveryService::DiscoveryService(db::IDb& db, IFileSystemPlanner& planner, IDownloadService& downloadService, IFeedSource* feedSource)
        : _db{ db }
        , _planner{ planner }
        , _downloadService{ downloadService }
        , _feedSource{ feedSource }
    {
        if (!_feedSource)
            LOG(INFO, "No feed source set, feeds will not be refreshed");
    }

    db::SubscriptionId DiscoveryService::addSubscription(std::string_view feedUrl, std::string_view title)
    {
        if (feedUrl.empty())
            throw Exception{ "Empty feed url" };

        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        if (const db::Subscription::pointer subscription{ db::Subscription::find(session, feedUrl) })
        {
            LOG(DEBUG, "Feed '" << feedUrl << "' already tracked");
            return subscription->getId();
        }

        const std::string folderName{ getUniqueFolderName(title.empty() ? feedUrl : title) };
        const db::Subscription::pointer subscription{ session.create<db::Subscription>(feedUrl, title, folderName) };

        LOG(INFO, "Added subscription '" << title << "' (" << feedUrl << "), stored in '" << folderName << "'");
        return subscription->getId();
    }

    std::string DiscoveryService::getUniqueFolderName(std::string_view title)
    {
        db::Session& session{ _db.getTLSSession() };

        std::unordered_set<std::string> usedFolderNames;
        db::Subscription::find(session, [&](const db::Subscription::pointer& subscription) {
            usedFolderNames.emplace(subscription->getStorageFolderName());
        });

        const std::string baseName{ sanitizeFolderName(title) };
        std::string folderName{ baseName };
        for (std::size_t suffix{ 2 }; usedFolderNames.contains(folderName); ++suffix)
            folderName = baseName + "-" + std::to_string(suffix);

        return folderName;
    }

    bool DiscoveryService::removeSubscription(db::SubscriptionId subscriptionId, bool alsoDeleteFiles)
    {
        std::vector<db::DownloadId> downloads;
        {
            db::Session& session{ _db.getTLSSession() };
            auto transaction{ session.createReadTransaction() };

            if (!db::Subscription::find(session, subscriptionId))
                return false;

            downloads = db::Download::findIds(session, db::Download::FindParameters{}.setSubscription(subscriptionId));
        }

        // removes the files and stops the ongoing transfers
        for (const db::DownloadId download : downloads)
            _downloadService.remove(download, alsoDeleteFiles);

        {
            db::Session& session{ _db.getTLSSession() };
            auto transaction{ session.createWriteTransaction() };

            db::Subscription::pointer subscription{ db::Subscription::find(session, subscriptionId) };
            if (!subscription)
                return false;

            LOG(INFO, "Removing subscription '" << subscription->getTitle() << "'");
            subscription.remove();
        }

        if (alsoDeleteFiles)
            _planner.cleanupEmptyDirectories();

        return true;
    }

    bool DiscoveryService::setRetentionPolicy(db::SubscriptionId subscriptionId, std::size_t maxItemsToKeep, bool autoDownload)
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        db::Subscription::pointer subscription{ db::Subscription::find(session, subscriptionId) };
        if (!subscription)
            return false;

        subscription.modify()->setMaxItemsToKeep(maxItemsToKeep);
        subscription.modify()->setAutoDownloadEnabled(autoDownload);

        LOG(DEBUG, "Subscription '" << subscription->getTitle() << "': keeping " << subscription->getMaxItemsToKeep() << " items, auto download " << (autoDownload ? "enabled" : "disabled"));
        return true;
    }

    std::size_t DiscoveryService::addItems(db::SubscriptionId subscriptionId, const std::vector<ItemMetadata>& items)
    {
        std::size_t createdCount{};

        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        db::Subscription::pointer subscription{ db::Subscription::find(session, subscriptionId) };
        if (!subscription)
            throw NotFoundException{ "Subscription " + subscriptionId.toString() + " not found" };

        for (const ItemMetadata& metadata : items)
        {
            if (metadata.sourceUrl.empty())
            {
                LOG(DEBUG, "Skipping item '" << metadata.title << "': no media url");
                continue;
            }

            // items without guid are identified by their media url
            const std::string_view guid{ metadata.guid.empty() ? metadata.sourceUrl : metadata.guid };
            if (db::Item::find(session, guid))
                continue;

            db::Item::pointer item{ session.create<db::Item>(subscription, guid) };
            item.modify()->setTitle(metadata.title);
            item.modify()->setDescription(metadata.description);
            item.modify()->setSourceUrl(metadata.sourceUrl);
            item.modify()->setMimeType(metadata.mimeType);
            item.modify()->setDeclaredSize(metadata.declaredSize);
            item.modify()->setPublishedAt(metadata.publishedAt);
            item.modify()->setEpisodeNumber(metadata.episodeNumber);
            item.modify()->setSeasonNumber(metadata.seasonNumber);
            item.modify()->setDuration(metadata.duration);

            createdCount++;
        }

        subscription.modify()->setLastCheckedAt(Wt::WDateTime::currentDateTime());

        if (createdCount > 0)
            LOG(INFO, "Subscription '" << subscription->getTitle() << "': " << createdCount << " new items");

        return createdCount;
    }

    std::size_t DiscoveryService::queueRecentItems(db::SubscriptionId subscriptionId)
    {
        std::vector<db::ItemId> itemsToQueue;
        {
            db::Session& session{ _db.getTLSSession() };
            auto transaction{ session.createReadTransaction() };

            const db::Subscription::pointer subscription{ db::Subscription::find(session, subscriptionId) };
            if (!subscription)
                throw NotFoundException{ "Subscription " + subscriptionId.toString() + " not found" };

            db::Item::FindParameters params;
            params.setSubscription(subscriptionId);
            params.setSortMode(db::ItemSortMode::PubDateDesc);
            params.setRange(db::Range{ 0, subscription->getMaxItemsToKeep() });

            // failed and deleted downloads are left to the retry policy and to the user
            db::Item::find(session, params, [&](const db::Item::pointer& item) {
                if (!db::Download::findByItem(session, item->getId()))
                    itemsToQueue.push_back(item->getId());
            });
        }

        std::size_t queuedCount{};
        for (const db::ItemId item : itemsToQueue)
        {
            try
            {
                _downloadService.enqueue(item);
                queuedCount++;
            }
            catch (const InsufficientStorageException& e)
            {
                LOG(WARNING, "Skipping item " << item.toString() << ": " << e.what());
            }
            catch (const NotFoundException& e)
            {
                LOG(WARNING, "Skipping item " << item.toString() << ": " << e.what());
            }
        }

        if (queuedCount > 0)
            LOG(INFO, "Queued " << queuedCount << " new downloads for subscription " << subscriptionId.toString());

        return queuedCount;
    }

    RefreshReport DiscoveryService::refreshAll()
    {
        RefreshReport report;

        if (!_feedSource)
            return report;

        std::scoped_lock lock{ _refreshMutex };

        struct SubscriptionToRefresh
        {
            db::SubscriptionId id;
            std::string feedUrl;
            std::string title;
            bool autoDownload;
        };
        std::vector<SubscriptionToRefresh> subscriptions;
        {
            db::Session& session{ _db.getTLSSession() };
            auto transaction{ session.createReadTransaction() };

            db::Subscription::find(session, [&](const db::Subscription::pointer& subscription) {
                subscriptions.push_back(SubscriptionToRefresh{ subscription->getId(), std::string{ subscription->getFeedUrl() }, std::string{ subscription->getTitle() }, subscription->isAutoDownloadEnabled() });
            });
        }

        if (subscriptions.empty())
        {
            LOG(INFO, "No subscription to refresh");
            return report;
        }

        LOG(INFO, "Refreshing " << subscriptions.size() << " subscriptions...");

        for (const SubscriptionToRefresh& subscription : subscriptions)
        {
            try
            {
                LOG(DEBUG, "Refreshing '" << subscription.title << "'");

                const std::vector<ItemMetadata> items{ _feedSource->fetchItems(subscription.feedUrl) };
                report.newItemCount += addItems(subscription.id, items);
                report.refreshedSubscriptionCount++;

                if (subscription.autoDownload)
                    report.queuedDownloadCount += queueRecentItems(subscription.id);
            }
            catch (const std::exception& e)
            {
                LOG(ERROR, "Cannot refresh '" << subscription.title << "': " << e.what());
                report.failedSubscriptionCount++;
            }
        }

        LOG(INFO, "Refresh done: " << report.refreshedSubscriptionCount << "/" << subscriptions.size() << " subscriptions refreshed, " << report.newItemCount << " new items, " << report.queuedDownloadCount << " downloads queued");

        return report;
    }
} // namespace podkeep::downloads
