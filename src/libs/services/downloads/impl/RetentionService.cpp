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

#include "RetentionService.hpp"

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/objects/Download.hpp"
#include "database/objects/Item.hpp"
#include "database/objects/Subscription.hpp"
#include "services/downloads/IConsumptionOracle.hpp"
#include "services/downloads/IFileSystemPlanner.hpp"

namespace podkeep::downloads
{
    std::unique_ptr<IRetentionService> createRetentionService(db::IDb& db, IFileSystemPlanner& planner, IConsumptionOracle* oracle)
    {
        return std::make_unique<RetentionService>(db, planner, oracle);
    }

    RetentionService::RetentionService(db::IDb& db, IFileSystemPlanner& planner, IConsumptionOracle* oracle)
        : _db{ db }
        , _planner{ planner }
        , _oracle{ oracle }
    {
        if (!_oracle)
            PODKEEP_LOG(RETENTION, INFO, "No consumption tracking configured, using count based retention");
    }

    RetentionReport RetentionService::sweep()
    {
        RetentionReport report;

        std::vector<db::SubscriptionId> subscriptions;
        {
            db::Session& session{ _db.getTLSSession() };
            auto transaction{ session.createReadTransaction() };

            db::Subscription::find(session, [&](const db::Subscription::pointer& subscription) {
                subscriptions.push_back(subscription->getId());
            });
        }

        PODKEEP_LOG(RETENTION, DEBUG, "Sweeping " << subscriptions.size() << " subscriptions");

        for (const db::SubscriptionId subscription : subscriptions)
        {
            try
            {
                sweepSubscription(subscription, report);
            }
            catch (const std::exception& e)
            {
                PODKEEP_LOG(RETENTION, ERROR, "Cannot sweep subscription " << subscription.toString() << ": " << e.what());
                report.failedSubscriptionCount++;
            }
        }

        report.removedDirectoryCount = _planner.cleanupEmptyDirectories();

        PODKEEP_LOG(RETENTION, INFO, "Sweep done: deleted " << report.deletedCount << " downloads, freed " << core::stringUtils::formatByteSize(report.freedBytes)
                                                            << ", kept " << report.keptUnconsumedCount << " unconsumed downloads, removed " << report.removedDirectoryCount << " empty directories");
        if (report.failedSubscriptionCount > 0)
            PODKEEP_LOG(RETENTION, WARNING, report.failedSubscriptionCount << " subscriptions could not be swept");

        return report;
    }

    void RetentionService::sweepSubscription(db::SubscriptionId subscription, RetentionReport& report)
    {
        const std::vector<Candidate> candidates{ getCandidates(subscription) };
        if (candidates.empty())
            return;

        PODKEEP_LOG(RETENTION, DEBUG, "Subscription " << subscription.toString() << ": " << candidates.size() << " downloads beyond the retention limit");

        for (const Candidate& candidate : candidates)
        {
            if (_oracle && !isConsumed(candidate))
            {
                report.keptUnconsumedCount++;
                continue;
            }

            if (const std::optional<std::uint64_t> freedBytes{ deleteDownload(candidate) })
            {
                report.deletedCount++;
                report.freedBytes += *freedBytes;
            }
        }
    }

    std::vector<RetentionService::Candidate> RetentionService::getCandidates(db::SubscriptionId subscriptionId)
    {
        std::vector<Candidate> candidates;

        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createReadTransaction() };

        const db::Subscription::pointer subscription{ db::Subscription::find(session, subscriptionId) };
        if (!subscription)
            return candidates;

        db::Download::FindParameters params;
        params.setSubscription(subscriptionId);
        params.setStatus(db::DownloadStatus::Completed);
        params.setSortMode(db::DownloadSortMode::ItemPubDateDesc);

        // the newest ones are always kept
        std::size_t keptCount{};
        db::Download::find(session, params, [&](const db::Download::pointer& download) {
            if (keptCount < subscription->getMaxItemsToKeep())
            {
                keptCount++;
                return;
            }

            candidates.push_back(Candidate{ download->getId(), download->getFilePath(), std::string{ download->getItem()->getTitle() } });
        });

        return candidates;
    }

    bool RetentionService::isConsumed(const Candidate& candidate)
    {
        const std::optional<std::filesystem::path> absolutePath{ _planner.resolve(candidate.filePath) };
        if (!absolutePath)
        {
            PODKEEP_LOG(CONSUMPTION, WARNING, "Invalid file path " << candidate.filePath << " for '" << candidate.title << "', keeping it");
            return false;
        }

        try
        {
            const bool consumed{ _oracle->isConsumed(*absolutePath) };
            PODKEEP_LOG(CONSUMPTION, DEBUG, "'" << candidate.title << "': " << (consumed ? "consumed" : "not consumed"));
            return consumed;
        }
        catch (const std::exception& e)
        {
            PODKEEP_LOG(CONSUMPTION, WARNING, "Cannot get consumption state of '" << candidate.title << "', keeping it: " << e.what());
            return false;
        }
    }

    std::optional<std::uint64_t> RetentionService::deleteDownload(const Candidate& candidate)
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        db::Download::pointer download{ db::Download::find(session, candidate.id) };
        if (!download || download->getStatus() != db::DownloadStatus::Completed)
            return std::nullopt;

        const std::uint64_t fileSize{ _planner.getFileSize(candidate.filePath).value_or(download->getFileSize().value_or(0)) };
        if (!_planner.deleteFile(candidate.filePath))
            PODKEEP_LOG(RETENTION, WARNING, "Cannot delete file " << candidate.filePath << ", removing record anyway");

        download.remove();
        PODKEEP_LOG(RETENTION, INFO, "Deleted '" << candidate.title << "' (" << core::stringUtils::formatByteSize(fileSize) << ")");

        return fileSize;
    }
} // namespace podkeep::downloads
