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

namespace podkeep::downloads
{
    class IDiscoveryService;
    class IDownloadService;
    class IFileSystemPlanner;
    class IRetentionService;
    class IScheduler;

    struct JobParameters
    {
        std::chrono::seconds feedRefreshInterval{ 3600 };
        std::chrono::seconds queueProcessingInterval{ 300 };
        std::chrono::seconds retryInterval{ 3600 };
        std::size_t maxRetries{ 3 };
        bool retentionEnabled{ true };
        std::chrono::seconds retentionInterval{ 86400 };
        std::chrono::seconds diskSpaceCheckInterval{ 3600 };
    };

    struct JobServices
    {
        IDiscoveryService& discovery;
        IDownloadService& downloads;
        IRetentionService& retention;
        IFileSystemPlanner& planner;
    };

    namespace jobIds
    {
        constexpr const char* feedRefresh{ "feed_refresh" };
        constexpr const char* queueProcessing{ "process_downloads" };
        constexpr const char* retryFailed{ "retry_failed" };
        constexpr const char* retention{ "cleanup" };
        constexpr const char* diskSpaceCheck{ "disk_space_check" };
    } // namespace jobIds

    // Registers the recurring maintenance jobs, the services must outlive the scheduler runs
    void registerJobs(IScheduler& scheduler, const JobServices& services, const JobParameters& params);
} // namespace podkeep::downloads
