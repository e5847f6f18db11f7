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

#include <cstddef>
#include <cstdint>
#include <memory>

namespace podkeep::db
{
    class IDb;
}

namespace podkeep::downloads
{
    class IConsumptionOracle;
    class IFileSystemPlanner;

    struct RetentionReport
    {
        std::size_t deletedCount{};
        std::size_t keptUnconsumedCount{};
        std::uint64_t freedBytes{};
        std::size_t failedSubscriptionCount{};
        std::size_t removedDirectoryCount{};
    };

    // Reclaims the storage used by completed downloads beyond the subscription limits
    class IRetentionService
    {
    public:
        virtual ~IRetentionService() = default;

        virtual RetentionReport sweep() = 0;
    };

    // oracle is optional: without it, everything beyond the limit is deleted
    std::unique_ptr<IRetentionService> createRetentionService(db::IDb& db, IFileSystemPlanner& planner, IConsumptionOracle* oracle);
} // namespace podkeep::downloads
