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

#include <filesystem>
#include <string>
#include <vector>

#include "database/objects/DownloadId.hpp"
#include "database/objects/SubscriptionId.hpp"
#include "services/downloads/IRetentionService.hpp"

namespace podkeep::downloads
{
    class RetentionService : public IRetentionService
    {
    public:
        RetentionService(db::IDb& db, IFileSystemPlanner& planner, IConsumptionOracle* oracle);
        ~RetentionService() override = default;
        RetentionService(const RetentionService&) = delete;
        RetentionService& operator=(const RetentionService&) = delete;

    private:
        RetentionReport sweep() override;

        struct Candidate
        {
            db::DownloadId id;
            std::filesystem::path filePath;
            std::string title;
        };

        void sweepSubscription(db::SubscriptionId subscription, RetentionReport& report);
        // completed downloads beyond the newest ones kept by the subscription policy
        std::vector<Candidate> getCandidates(db::SubscriptionId subscription);
        bool isConsumed(const Candidate& candidate);
        // Returns the number of freed bytes, std::nullopt if the download is no longer eligible
        std::optional<std::uint64_t> deleteDownload(const Candidate& candidate);

        db::IDb& _db;
        IFileSystemPlanner& _planner;
        IConsumptionOracle* _oracle;
    };
} // namespace podkeep::downloads
