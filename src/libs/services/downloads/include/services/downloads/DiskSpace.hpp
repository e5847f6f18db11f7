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

#include <cstdint>

#include "core/LiteralString.hpp"

namespace podkeep::downloads
{
    class IFileSystemPlanner;

    enum class DiskSpaceLevel
    {
        Ok,
        Low,      // less than 10 GiB
        VeryLow,  // less than 5 GiB
        Critical, // less than 1 GiB
    };

    DiskSpaceLevel evaluateDiskSpace(std::uint64_t availableBytes);
    core::LiteralString toString(DiskSpaceLevel level);

    // Logs with a severity matching the level, never halts anything
    DiskSpaceLevel checkDiskSpace(const IFileSystemPlanner& planner);
} // namespace podkeep::downloads
