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

#include "services/downloads/DiskSpace.hpp"

#include "core/ILogger.hpp"
#include "core/SizeLiterals.hpp"
#include "core/String.hpp"
#include "services/downloads/IFileSystemPlanner.hpp"

namespace podkeep::downloads
{
    using namespace core::literals;

    DiskSpaceLevel evaluateDiskSpace(std::uint64_t availableBytes)
    {
        if (availableBytes < 1_GiB)
            return DiskSpaceLevel::Critical;
        if (availableBytes < 5_GiB)
            return DiskSpaceLevel::VeryLow;
        if (availableBytes < 10_GiB)
            return DiskSpaceLevel::Low;

        return DiskSpaceLevel::Ok;
    }

    core::LiteralString toString(DiskSpaceLevel level)
    {
        switch (level)
        {
        case DiskSpaceLevel::Ok:
            return "ok";
        case DiskSpaceLevel::Low:
            return "low";
        case DiskSpaceLevel::VeryLow:
            return "very low";
        case DiskSpaceLevel::Critical:
            return "critical";
        }

        return "";
    }

    DiskSpaceLevel checkDiskSpace(const IFileSystemPlanner& planner)
    {
        const std::uint64_t availableBytes{ planner.availableSpace() };
        const DiskSpaceLevel level{ evaluateDiskSpace(availableBytes) };
        const std::string available{ core::stringUtils::formatByteSize(availableBytes) };

        switch (level)
        {
        case DiskSpaceLevel::Critical:
            PODKEEP_LOG(FILESYSTEM, ERROR, "Disk space critically low: " << available << " available in " << planner.getRootPath());
            break;
        case DiskSpaceLevel::VeryLow:
            PODKEEP_LOG(FILESYSTEM, WARNING, "Disk space low: " << available << " available in " << planner.getRootPath());
            break;
        case DiskSpaceLevel::Low:
            PODKEEP_LOG(FILESYSTEM, INFO, "Disk space getting low: " << available << " available in " << planner.getRootPath());
            break;
        case DiskSpaceLevel::Ok:
            PODKEEP_LOG(FILESYSTEM, DEBUG, available << " available in " << planner.getRootPath());
            break;
        }

        return level;
    }
} // namespace podkeep::downloads
