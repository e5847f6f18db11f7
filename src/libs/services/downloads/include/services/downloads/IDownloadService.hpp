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
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include "database/Types.hpp"
#include "database/objects/DownloadId.hpp"
#include "database/objects/ItemId.hpp"
#include "database/objects/SubscriptionId.hpp"
#include "services/downloads/Types.hpp"

namespace podkeep::db
{
    class IDb;
}

namespace podkeep::core::http
{
    class IClient;
}

namespace podkeep::downloads
{
    class IFileSystemPlanner;

    struct DownloadServiceParameters
    {
        std::size_t maxConcurrentTransfers{ 3 };
        std::chrono::seconds transferTimeout{ 3600 };
    };

    // Owns the download queue: admission, bounded concurrency, retries and cancellation
    class IDownloadService
    {
    public:
        virtual ~IDownloadService() = default;

        // Creates or resets the download of the given item, idempotent
        // Throws NotFoundException if the item does not exist
        // Throws InsufficientStorageException if the declared size does not fit
        virtual db::DownloadId enqueue(db::ItemId item) = 0;

        // Dispatches all pending downloads, oldest first
        // Blocks while all the transfer slots are busy
        // Returns the number of dispatched downloads
        virtual std::size_t runQueue() = 0;

        // Puts back in the queue the failed downloads that have been tried less than maxRetries times, then runs the queue
        // Returns the number of downloads put back in the queue
        virtual std::size_t retryFailed(std::size_t maxRetries) = 0;

        // Returns false if the download is not pending or downloading
        virtual bool cancel(db::DownloadId download) = 0;

        // Removes the record, the file removal is best effort
        // Returns false if the download does not exist
        virtual bool remove(db::DownloadId download, bool alsoDeleteFile) = 0;

        virtual std::optional<DownloadInfo> getDownload(db::DownloadId download) = 0;

        struct ListParameters
        {
            std::optional<db::DownloadStatus> status;
            db::SubscriptionId subscription;
            std::optional<db::Range> range;
        };
        // Most recently created first
        virtual std::vector<DownloadInfo> listDownloads(const ListParameters& params) = 0;

        // Downloads left in downloading state by a previous run are put back in the queue
        // Must be called before any transfer is dispatched
        virtual std::size_t recoverInterruptedDownloads() = 0;

        virtual std::size_t getOngoingTransferCount() const = 0;
        // Blocks until all dispatched transfers are done
        virtual void waitForTransfers() = 0;

        // Interrupts the ongoing transfers, their partial files are kept and they go back to the queue
        // Nothing is dispatched afterwards, also called on destruction
        virtual void shutdown() = 0;
    };

    std::unique_ptr<IDownloadService> createDownloadService(db::IDb& db, IFileSystemPlanner& planner, core::http::IClient& client, const DownloadServiceParameters& params);
} // namespace podkeep::downloads
