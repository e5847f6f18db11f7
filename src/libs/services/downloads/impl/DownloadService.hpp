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

#include <atomic>
#include <filesystem>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

#include "core/IJobScheduler.hpp"
#include "core/Semaphore.hpp"
#include "services/downloads/IDownloadService.hpp"

#include "TransferExecutor.hpp"

namespace podkeep::downloads
{
    class DownloadService : public IDownloadService
    {
    public:
        DownloadService(db::IDb& db, IFileSystemPlanner& planner, core::http::IClient& client, const DownloadServiceParameters& params);
        ~DownloadService() override;
        DownloadService(const DownloadService&) = delete;
        DownloadService& operator=(const DownloadService&) = delete;

        TransferExecutor::StopRequest getStopRequest(db::DownloadId download) const;
        void onTransferDone(db::DownloadId download, TransferOutcome outcome);
        // called once the transfer job is gone, whether it ran or not
        void onTransferReleased(db::DownloadId download);

    private:
        db::DownloadId enqueue(db::ItemId item) override;
        std::size_t runQueue() override;
        std::size_t retryFailed(std::size_t maxRetries) override;
        bool cancel(db::DownloadId download) override;
        bool remove(db::DownloadId download, bool alsoDeleteFile) override;
        std::optional<DownloadInfo> getDownload(db::DownloadId download) override;
        std::vector<DownloadInfo> listDownloads(const ListParameters& params) override;
        std::size_t recoverInterruptedDownloads() override;
        std::size_t getOngoingTransferCount() const override;
        void waitForTransfers() override;
        void shutdown() override;

        // admission: pending -> downloading, if still pending and no previous transfer of it is still running
        std::optional<TransferRequest> admit(db::DownloadId download);
        void markCancelled(db::DownloadId download);
        bool isFileOfOngoingTransfer(const std::filesystem::path& filePath) const;

        db::IDb& _db;
        IFileSystemPlanner& _planner;
        core::http::IClient& _client;
        const std::chrono::seconds _transferTimeout;

        TransferExecutor _transferExecutor;
        core::Semaphore _transferSlots;
        std::unique_ptr<core::IJobScheduler> _transferScheduler;
        std::atomic<bool> _shuttingDown{};

        std::mutex _runQueueMutex;

        mutable std::mutex _transfersMutex;
        std::unordered_map<db::DownloadId, std::filesystem::path> _ongoingTransfers; // admitted, job not released yet
        std::unordered_set<db::DownloadId> _cancelledDownloads;
    };
} // namespace podkeep::downloads
