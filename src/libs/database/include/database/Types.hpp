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
#include <optional>
#include <string_view>

#include "core/Exception.hpp"

namespace podkeep::db
{
    class Exception : public core::PodkeepException
    {
    public:
        using PodkeepException::PodkeepException;
    };

    // Request:
    // 	  size = 0 => means we don't want data
    struct Range
    {
        std::size_t offset{};
        std::size_t size{};

        bool operator==(const Range& rhs) const { return offset == rhs.offset && size == rhs.size; }
    };

    // Persisted as text, do not change the tokens!
    enum class DownloadStatus
    {
        Pending,
        Downloading,
        Completed,
        Failed,
        Deleted,
    };

    std::string_view toString(DownloadStatus status);
    std::optional<DownloadStatus> downloadStatusFromString(std::string_view str);

    // pending and downloading downloads are active: they are owned by the queue
    constexpr bool isActive(DownloadStatus status)
    {
        return status == DownloadStatus::Pending || status == DownloadStatus::Downloading;
    }

    enum class DownloadSortMode
    {
        None,
        CreatedAtAsc,  // queue order
        CreatedAtDesc,
        UpdatedAtAsc,
        ItemPubDateDesc, // newest items first, unknown dates last
    };

    enum class ItemSortMode
    {
        None,
        PubDateDesc, // unknown dates last
        PubDateAsc,
    };
} // namespace podkeep::db
