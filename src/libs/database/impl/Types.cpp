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

#include "database/Types.hpp"

#include <array>
#include <string>
#include <utility>

namespace podkeep::db
{
    namespace
    {
        constexpr std::array<std::pair<DownloadStatus, std::string_view>, 5> downloadStatusTokens{ {
            { DownloadStatus::Pending, "pending" },
            { DownloadStatus::Downloading, "downloading" },
            { DownloadStatus::Completed, "completed" },
            { DownloadStatus::Failed, "failed" },
            { DownloadStatus::Deleted, "deleted" },
        } };
    } // namespace

    std::string_view toString(DownloadStatus status)
    {
        for (const auto& [value, token] : downloadStatusTokens)
        {
            if (value == status)
                return token;
        }

        throw Exception{ "Unhandled download status " + std::to_string(static_cast<int>(status)) };
    }

    std::optional<DownloadStatus> downloadStatusFromString(std::string_view str)
    {
        for (const auto& [value, token] : downloadStatusTokens)
        {
            if (token == str)
                return value;
        }

        return std::nullopt;
    }
} // namespace podkeep::db
