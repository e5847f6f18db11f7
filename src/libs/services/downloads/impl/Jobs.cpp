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

#include "services/downloads/Jobs.hpp"

#include "core/ILogger.hpp"
#include "services/downloads/DiskSpace.hpp"
#include "services/downloads/IDiscoveryService.hpp"
#include "services/downloads/IDownloadService.hpp"
#include "services/downloads/IRetentionService.hpp"
#include "services/downloads/IScheduler.hpp"

namespace podkeep::downloads
{
    void registerJobs(IScheduler& scheduler, const JobServices& services, const JobParameters& params)
    {
        scheduler.addJob(jobIds::feedRefresh, "Refresh feeds", params.feedRefreshInterval, true, [&discovery = services.discovery] {
            discovery.refreshAll();
        });

        scheduler.addJob(jobIds::queueProcessing, "Process download queue", params.queueProcessingInterval, true, [&downloads = services.downloads] {
            downloads.runQueue();
        });

        scheduler.addJob(jobIds::retryFailed, "Retry failed downloads", params.retryInterval, false, [&downloads = services.downloads, maxRetries = params.maxRetries] {
            downloads.retryFailed(maxRetries);
        });

        if (params.retentionEnabled)
        {
            scheduler.addJob(jobIds::retention, "Clean up old downloads", params.retentionInterval, false, [&retention = services.retention] {
                retention.sweep();
            });
        }
        else
            PODKEEP_LOG(SCHEDULER, INFO, "Automatic cleanup disabled");

        scheduler.addJob(jobIds::diskSpaceCheck, "Check disk space", params.diskSpaceCheckInterval, true, [&planner = services.planner] {
            checkDiskSpace(planner);
        });
    }
} // namespace podkeep::downloads
