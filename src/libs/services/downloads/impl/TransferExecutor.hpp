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
#include <functional>
#include <string>

#include "database/objects/DownloadId.hpp"

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

    struct TransferRequest
    {
        db::DownloadId downloadId;
        std::string sourceUrl;
        std::filesystem::path relativeFilePath;
        std::chrono::seconds timeout{ 3600 };
    };

    enum class TransferOutcome
    {
        Completed,
        Failed,
        Cancelled,   // the download was cancelled or removed meanwhile, the record is left untouched
        Interrupted, // the request was aborted from outside, the download is back in the queue with its partial file
    };

    // Runs a single resumable transfer and records its result on the download
    // The download must already be in downloading state
    class TransferExecutor
    {
    public:
        TransferExecutor(db::IDb& db, IFileSystemPlanner& planner, core::http::IClient& client);
        ~TransferExecutor() = default;
        TransferExecutor(const TransferExecutor&) = delete;
        TransferExecutor& operator=(const TransferExecutor&) = delete;

        static constexpr std::size_t chunkSize{ 8 * 1024 };
        static constexpr double sizeTolerance{ 0.01 };

        enum class StopRequest
        {
            None,
            Cancel,    // partial file is discarded
            Interrupt, // partial file is kept for a later resume
        };
        // Polled before the request is sent and on each received chunk
        using StopRequestCallback = std::function<StopRequest()>;

        // Blocks until the transfer is done
        TransferOutcome execute(const TransferRequest& request, StopRequestCallback stopRequestCallback = {});

        // Minimum number of bytes between two persisted progress updates
        static std::uint64_t getProgressUpdateThreshold(std::uint64_t totalSize);
        // Actual size is accepted if within 1% of the expected size
        static bool isSizeAcceptable(std::uint64_t expectedSize, std::uint64_t actualSize);

    private:
        void updateProgress(db::DownloadId downloadId, double progress);
        TransferOutcome markCompleted(const TransferRequest& request, std::uint64_t fileSize);
        TransferOutcome markFailed(const TransferRequest& request, std::string_view error);
        TransferOutcome markInterrupted(const TransferRequest& request);
        void discardPartialFile(const TransferRequest& request);

        db::IDb& _db;
        IFileSystemPlanner& _planner;
        core::http::IClient& _client;
    };
} // namespace podkeep::downloads
