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

#include "DownloadService.hpp"

#include <algorithm>

#include "core/IJob.hpp"
#include "core/ILogger.hpp"
#include "core/SizeLiterals.hpp"
#include "core/http/IClient.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/objects/Download.hpp"
#include "database/objects/Item.hpp"
#include "database/objects/Subscription.hpp"
#include "services/downloads/Exception.hpp"
#include "services/downloads/IFileSystemPlanner.hpp"

#define LOG(sev, message) PODKEEP_LOG(DOWNLOAD, sev, message)

namespace podkeep::downloads
{
    using namespace core::literals;

    namespace
    {
        // free space that must remain once the declared size of an item is downloaded
        constexpr std::uint64_t storageSafetyBuffer{ 1_GiB };

        class TransferJob : public core::IJob
        {
        public:
            TransferJob(DownloadService& service, TransferExecutor& executor, TransferRequest request, core::Semaphore::Slot slot)
                : _service{ service }
                , _executor{ executor }
                , _request{ std::move(request) }
                , _slot{ std::move(slot) }
            {
            }

            ~TransferJob() override
            {
                _service.onTransferReleased(_request.downloadId);
            }

        private:
            core::LiteralString getName() const override { return "Transfer"; }
            void run() override
            {
                const db::DownloadId downloadId{ _request.downloadId };
                const TransferOutcome outcome{ _executor.execute(_request, [this, downloadId] { return _service.getStopRequest(downloadId); }) };
                _service.onTransferDone(downloadId, outcome);
                // slot released on destruction, even if the transfer threw or the job was dropped
            }

            DownloadService& _service;
            TransferExecutor& _executor;
            const TransferRequest _request;
            core::Semaphore::Slot _slot;
        };

        DownloadInfo toDownloadInfo(const db::Download::pointer& download)
        {
            const db::Item::pointer item{ download->getItem() };

            DownloadInfo info;
            info.id = download->getId();
            info.itemId = download->getItemId();
            info.subscriptionId = item->getSubscriptionId();
            info.itemTitle = item->getTitle();
            info.status = download->getStatus();
            info.filePath = download->getFilePath();
            info.fileSize = download->getFileSize();
            info.progress = download->getProgress();
            info.errorMessage = download->getErrorMessage();
            info.retryCount = download->getRetryCount();
            info.createdAt = download->getCreatedAt();
            info.updatedAt = download->getUpdatedAt();
            info.startedAt = download->getStartedAt();
            info.completedAt = download->getCompletedAt();

            return info;
        }
    } // namespace

    std::unique_ptr<IDownloadService> createDownloadService(db::IDb& db, IFileSystemPlanner& planner, core::http::IClient& client, const DownloadServiceParameters& params)
    {
        return std::make_unique<DownloadService>(db, planner, client, params);
    }

    DownloadService::DownloadService(db::IDb& db, IFileSystemPlanner& planner, core::http::IClient& client, const DownloadServiceParameters& params)
        : _db{ db }
        , _planner{ planner }
        , _client{ client }
        , _transferTimeout{ params.transferTimeout }
        , _transferExecutor{ db, planner, client }
        , _transferSlots{ params.maxConcurrentTransfers }
        , _transferScheduler{ core::createJobScheduler("Transfer", params.maxConcurrentTransfers) }
    {
        _transferScheduler->setShouldAbortCallback([this] { return _shuttingDown.load(); });

        LOG(INFO, "Started, max concurrent transfers = " << params.maxConcurrentTransfers);
    }

    DownloadService::~DownloadService()
    {
        shutdown();
    }

    void DownloadService::shutdown()
    {
        if (_shuttingDown.exchange(true))
            return;

        // ongoing transfers go back to the queue and are resumed on next start
        _client.abortAllRequests();
        _transferScheduler->wait();

        LOG(INFO, "Stopped");
    }

    db::DownloadId DownloadService::enqueue(db::ItemId itemId)
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        const db::Item::pointer item{ db::Item::find(session, itemId) };
        if (!item)
            throw NotFoundException{ "Item " + itemId.toString() + " not found" };

        if (db::Download::pointer download{ db::Download::findByItem(session, itemId) })
        {
            switch (download->getStatus())
            {
            case db::DownloadStatus::Pending:
            case db::DownloadStatus::Downloading:
                LOG(DEBUG, "Item '" << item->getTitle() << "' already queued");
                break;

            case db::DownloadStatus::Completed:
                LOG(DEBUG, "Item '" << item->getTitle() << "' already downloaded");
                break;

            case db::DownloadStatus::Failed:
            case db::DownloadStatus::Deleted:
                LOG(INFO, "Queuing item '" << item->getTitle() << "' again");
                download.modify()->setPending();
                break;
            }

            return download->getId();
        }

        const db::Subscription::pointer subscription{ item->getSubscription() };

        ItemFileInfo fileInfo;
        fileInfo.title = item->getTitle();
        fileInfo.publishedAt = item->getPublishedAt();
        fileInfo.sourceUrl = item->getSourceUrl();
        fileInfo.mimeType = item->getMimeType();
        const std::filesystem::path filePath{ _planner.pathFor(fileInfo, subscription->getStorageFolderName(), [&](const std::filesystem::path& path) {
            return db::Download::existsWithFilePath(session, path) || isFileOfOngoingTransfer(path);
        }) };

        // unknown sizes are not checked
        if (const std::optional<std::uint64_t> declaredSize{ item->getDeclaredSize() })
        {
            const std::uint64_t requiredBytes{ *declaredSize + storageSafetyBuffer };
            const std::uint64_t availableBytes{ _planner.availableSpace() };
            if (availableBytes < requiredBytes)
            {
                LOG(ERROR, "Not enough space to download '" << item->getTitle() << "'");
                throw InsufficientStorageException{ requiredBytes, availableBytes };
            }
        }

        const db::Download::pointer download{ session.create<db::Download>(item, filePath) };
        LOG(INFO, "Queued '" << item->getTitle() << "' to " << filePath);

        return download->getId();
    }

    std::size_t DownloadService::runQueue()
    {
        std::scoped_lock runQueueLock{ _runQueueMutex };

        std::vector<db::DownloadId> pendingDownloads;
        {
            db::Session& session{ _db.getTLSSession() };
            auto transaction{ session.createReadTransaction() };

            pendingDownloads = db::Download::findIds(session, db::Download::FindParameters{}.setStatus(db::DownloadStatus::Pending).setSortMode(db::DownloadSortMode::CreatedAtAsc));
        }

        if (pendingDownloads.empty())
        {
            LOG(DEBUG, "No pending download");
            return 0;
        }

        LOG(INFO, "Processing " << pendingDownloads.size() << " pending downloads");

        std::size_t dispatchedCount{};
        for (const db::DownloadId downloadId : pendingDownloads)
        {
            if (_shuttingDown)
                break;

            core::Semaphore::Slot slot{ _transferSlots.acquire() };
            if (_shuttingDown)
                break;

            std::optional<TransferRequest> request{ admit(downloadId) };
            if (!request)
                continue;

            _transferScheduler->scheduleJob(std::make_unique<TransferJob>(*this, _transferExecutor, std::move(*request), std::move(slot)));
            dispatchedCount++;
        }

        LOG(INFO, "Dispatched " << dispatchedCount << " downloads");
        return dispatchedCount;
    }

    std::optional<TransferRequest> DownloadService::admit(db::DownloadId downloadId)
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        db::Download::pointer download{ db::Download::find(session, downloadId) };
        if (!download || download->getStatus() != db::DownloadStatus::Pending)
        {
            LOG(DEBUG, "Download " << downloadId.toString() << " no longer pending, skipping");
            return std::nullopt;
        }

        try
        {
            _planner.folderFor(download->getItem()->getSubscription()->getStorageFolderName());
        }
        catch (const Exception& e)
        {
            LOG(ERROR, "Cannot prepare download " << downloadId.toString() << ": " << e.what());
            download.modify()->setFailed(e.what());
            return std::nullopt;
        }

        {
            std::scoped_lock lock{ _transfersMutex };
            // a cancelled transfer may still be running, it would write the same file
            if (!_ongoingTransfers.try_emplace(downloadId, download->getFilePath()).second)
            {
                LOG(DEBUG, "Previous transfer of download " << downloadId.toString() << " still running, postponed");
                return std::nullopt;
            }
        }

        download.modify()->setDownloading();

        TransferRequest request;
        request.downloadId = downloadId;
        request.sourceUrl = download->getItem()->getSourceUrl();
        request.relativeFilePath = download->getFilePath();
        request.timeout = _transferTimeout;

        return request;
    }

    void DownloadService::onTransferDone(db::DownloadId downloadId, TransferOutcome outcome)
    {
        switch (outcome)
        {
        case TransferOutcome::Completed:
            LOG(DEBUG, "Download " << downloadId.toString() << " completed");
            break;
        case TransferOutcome::Failed:
            LOG(DEBUG, "Download " << downloadId.toString() << " failed");
            break;
        case TransferOutcome::Cancelled:
            LOG(DEBUG, "Download " << downloadId.toString() << " cancelled");
            break;
        case TransferOutcome::Interrupted:
            LOG(DEBUG, "Download " << downloadId.toString() << " interrupted");
            break;
        }
    }

    std::size_t DownloadService::retryFailed(std::size_t maxRetries)
    {
        std::size_t retriedCount{};
        {
            db::Session& session{ _db.getTLSSession() };
            auto transaction{ session.createWriteTransaction() };

            std::vector<db::Download::pointer> downloadsToRetry;
            db::Download::find(session, db::Download::FindParameters{}.setStatus(db::DownloadStatus::Failed).setSortMode(db::DownloadSortMode::UpdatedAtAsc), [&](const db::Download::pointer& download) {
                if (download->getRetryCount() < maxRetries)
                    downloadsToRetry.push_back(download);
            });

            for (db::Download::pointer& download : downloadsToRetry)
                download.modify()->setPending();

            retriedCount = downloadsToRetry.size();
        }

        if (retriedCount == 0)
        {
            LOG(DEBUG, "No failed download to retry");
            return 0;
        }

        LOG(INFO, "Retrying " << retriedCount << " failed downloads");
        runQueue();

        return retriedCount;
    }

    bool DownloadService::cancel(db::DownloadId downloadId)
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        db::Download::pointer download{ db::Download::find(session, downloadId) };
        if (!download)
            return false;

        switch (download->getStatus())
        {
        case db::DownloadStatus::Completed:
            LOG(WARNING, "Cannot cancel completed download " << downloadId.toString());
            return false;

        case db::DownloadStatus::Failed:
        case db::DownloadStatus::Deleted:
            return false;

        case db::DownloadStatus::Downloading:
            markCancelled(downloadId);
            [[fallthrough]];
        case db::DownloadStatus::Pending:
            download.modify()->setDeleted();
            LOG(INFO, "Cancelled download " << downloadId.toString());
            return true;
        }

        return false;
    }

    bool DownloadService::remove(db::DownloadId downloadId, bool alsoDeleteFile)
    {
        std::filesystem::path filePath;
        {
            db::Session& session{ _db.getTLSSession() };
            auto transaction{ session.createWriteTransaction() };

            db::Download::pointer download{ db::Download::find(session, downloadId) };
            if (!download)
                return false;

            if (download->getStatus() == db::DownloadStatus::Downloading)
                markCancelled(downloadId);

            filePath = download->getFilePath();
            download.remove();
        }

        if (alsoDeleteFile && !filePath.empty())
            _planner.deleteFile(filePath);

        LOG(INFO, "Removed download " << downloadId.toString());
        return true;
    }

    std::optional<DownloadInfo> DownloadService::getDownload(db::DownloadId downloadId)
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createReadTransaction() };

        const db::Download::pointer download{ db::Download::find(session, downloadId) };
        if (!download)
            return std::nullopt;

        return toDownloadInfo(download);
    }

    std::vector<DownloadInfo> DownloadService::listDownloads(const ListParameters& params)
    {
        std::vector<DownloadInfo> res;

        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createReadTransaction() };

        db::Download::FindParameters findParams;
        findParams.setStatus(params.status);
        findParams.setSubscription(params.subscription);
        findParams.setRange(params.range);
        findParams.setSortMode(db::DownloadSortMode::CreatedAtDesc);

        db::Download::find(session, findParams, [&](const db::Download::pointer& download) {
            res.push_back(toDownloadInfo(download));
        });

        return res;
    }

    std::size_t DownloadService::recoverInterruptedDownloads()
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        std::vector<db::Download::pointer> interruptedDownloads;
        db::Download::find(session, db::Download::FindParameters{}.setStatus(db::DownloadStatus::Downloading), [&](const db::Download::pointer& download) {
            interruptedDownloads.push_back(download);
        });

        for (db::Download::pointer& download : interruptedDownloads)
            download.modify()->setPending();

        const std::size_t recoveredCount{ interruptedDownloads.size() };

        if (recoveredCount > 0)
            LOG(INFO, "Put back " << recoveredCount << " interrupted downloads in the queue");

        return recoveredCount;
    }

    std::size_t DownloadService::getOngoingTransferCount() const
    {
        return _transferScheduler->getOngoingJobCount();
    }

    void DownloadService::waitForTransfers()
    {
        _transferScheduler->wait();
    }

    TransferExecutor::StopRequest DownloadService::getStopRequest(db::DownloadId downloadId) const
    {
        if (_shuttingDown)
            return TransferExecutor::StopRequest::Interrupt;

        std::scoped_lock lock{ _transfersMutex };
        return _cancelledDownloads.contains(downloadId) ? TransferExecutor::StopRequest::Cancel : TransferExecutor::StopRequest::None;
    }

    void DownloadService::onTransferReleased(db::DownloadId downloadId)
    {
        std::scoped_lock lock{ _transfersMutex };
        _ongoingTransfers.erase(downloadId);
        _cancelledDownloads.erase(downloadId);
    }

    void DownloadService::markCancelled(db::DownloadId downloadId)
    {
        std::scoped_lock lock{ _transfersMutex };
        // no transfer to stop for downloads left over by a previous process
        if (_ongoingTransfers.contains(downloadId))
            _cancelledDownloads.insert(downloadId);
    }

    bool DownloadService::isFileOfOngoingTransfer(const std::filesystem::path& filePath) const
    {
        std::scoped_lock lock{ _transfersMutex };
        return std::any_of(std::cbegin(_ongoingTransfers), std::cend(_ongoingTransfers), [&](const auto& ongoingTransfer) { return ongoingTransfer.second == filePath; });
    }
} // namespace podkeep::downloads
