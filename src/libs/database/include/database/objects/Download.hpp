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
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <Wt/Dbo/Field.h>
#include <Wt/WDateTime.h>

#include "database/Object.hpp"
#include "database/Types.hpp"
#include "database/objects/DownloadId.hpp"
#include "database/objects/ItemId.hpp"
#include "database/objects/SubscriptionId.hpp"

namespace podkeep::db
{
    class Item;
    class Session;

    // Local acquisition state of an item, at most one per item
    class Download final : public Object<Download, DownloadId>
    {
    public:
        struct FindParameters
        {
            DownloadSortMode sortMode{ DownloadSortMode::None };
            std::optional<DownloadStatus> status; // if set, only downloads in this status
            SubscriptionId subscription;          // if set, only downloads of items from this subscription
            std::optional<Range> range;

            FindParameters& setSortMode(DownloadSortMode _sortMode)
            {
                sortMode = _sortMode;
                return *this;
            }
            FindParameters& setStatus(std::optional<DownloadStatus> _status)
            {
                status = _status;
                return *this;
            }
            FindParameters& setSubscription(SubscriptionId _subscription)
            {
                subscription = _subscription;
                return *this;
            }
            FindParameters& setRange(const std::optional<Range>& _range)
            {
                range = _range;
                return *this;
            }
        };

        Download() = default;
        static std::size_t getCount(Session& session);
        static std::size_t getCount(Session& session, DownloadStatus status);
        static pointer find(Session& session, DownloadId id);
        static pointer findByItem(Session& session, ItemId itemId);
        static bool existsWithFilePath(Session& session, const std::filesystem::path& filePath);
        static void find(Session& session, const FindParameters& params, std::function<void(const pointer&)> func);
        static std::vector<DownloadId> findIds(Session& session, const FindParameters& params);
        // sum of the file sizes of completed downloads
        static std::uint64_t getCompletedTotalSize(Session& session, SubscriptionId subscription = {});

        // getters
        DownloadStatus getStatus() const { return _status; }
        const std::filesystem::path& getFilePath() const { return _filePath; }
        std::optional<std::uint64_t> getFileSize() const;
        double getProgress() const { return _progress; }
        std::string_view getErrorMessage() const { return _errorMessage; }
        std::size_t getRetryCount() const { return static_cast<std::size_t>(_retryCount); }
        const Wt::WDateTime& getStartedAt() const { return _startedAt; }
        const Wt::WDateTime& getCompletedAt() const { return _completedAt; }
        const Wt::WDateTime& getCreatedAt() const { return _createdAt; }
        const Wt::WDateTime& getUpdatedAt() const { return _updatedAt; }
        ObjectPtr<Item> getItem() const;
        ItemId getItemId() const;

        // state transitions, they all refresh the update timestamp
        // back to the queue, keeps the retry count
        void setPending();
        void setDownloading();
        // clamped to [0, 1), only completed downloads report full progress
        void setProgress(double progress);
        void setCompleted(std::uint64_t fileSize);
        void setFailed(std::string_view errorMessage);
        void setDeleted();

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _status, "status");
            Wt::Dbo::field(a, _filePath, "file_path");
            Wt::Dbo::field(a, _fileSize, "file_size");
            Wt::Dbo::field(a, _progress, "progress");
            Wt::Dbo::field(a, _errorMessage, "error_message");
            Wt::Dbo::field(a, _retryCount, "retry_count");
            Wt::Dbo::field(a, _startedAt, "started_at");
            Wt::Dbo::field(a, _completedAt, "completed_at");
            Wt::Dbo::field(a, _createdAt, "created_at");
            Wt::Dbo::field(a, _updatedAt, "updated_at");

            Wt::Dbo::belongsTo(a, _item, "item", Wt::Dbo::OnDeleteCascade | Wt::Dbo::NotNull);
        }

    private:
        friend class Session;
        // the destination never changes afterwards, resuming relies on it
        Download(ObjectPtr<Item> item, const std::filesystem::path& filePath);
        static pointer create(Session& session, ObjectPtr<Item> item, const std::filesystem::path& filePath);

        void touch();

        DownloadStatus _status{ DownloadStatus::Pending };
        std::filesystem::path _filePath;
        long long _fileSize{}; // only meaningful when completed
        double _progress{};
        std::string _errorMessage;
        int _retryCount{};
        Wt::WDateTime _startedAt;
        Wt::WDateTime _completedAt;
        Wt::WDateTime _createdAt;
        Wt::WDateTime _updatedAt;

        Wt::Dbo::ptr<Item> _item;
    };
} // namespace podkeep::db
