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

#include "database/objects/Download.hpp"

#include <algorithm>
#include <cmath>

#include <Wt/Dbo/Impl.h>
#include <Wt/Dbo/WtSqlTraits.h>

#include "database/Session.hpp"
#include "database/objects/Item.hpp"

#include "Utils.hpp"
#include "traits/DownloadStatusTraits.hpp"
#include "traits/DboTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(podkeep::db::Download)

namespace podkeep::db
{
    namespace
    {
        template<typename ResultType>
        Wt::Dbo::Query<ResultType> createQuery(Session& session, std::string_view itemToSelect, const Download::FindParameters& params)
        {
            auto query{ session.getDboSession()->query<ResultType>("SELECT " + std::string{ itemToSelect } + " from download d") };

            if (params.subscription.isValid() || params.sortMode == DownloadSortMode::ItemPubDateDesc)
                query.join("item i ON i.id = d.item_id");

            if (params.status)
                query.where("d.status = ?").bind(*params.status);

            if (params.subscription.isValid())
                query.where("i.subscription_id = ?").bind(params.subscription);

            switch (params.sortMode)
            {
            case DownloadSortMode::None:
                break;
            case DownloadSortMode::CreatedAtAsc:
                query.orderBy("d.created_at ASC, d.id ASC");
                break;
            case DownloadSortMode::CreatedAtDesc:
                query.orderBy("d.created_at DESC, d.id DESC");
                break;
            case DownloadSortMode::UpdatedAtAsc:
                query.orderBy("d.updated_at ASC, d.id ASC");
                break;
            case DownloadSortMode::ItemPubDateDesc:
                query.orderBy("i.published_at IS NULL, i.published_at DESC, d.id DESC");
                break;
            }

            return query;
        }

        // only a completed download may report full progress
        constexpr double maxInProgressRatio{ 0.999 };
    } // namespace

    Download::Download(ObjectPtr<Item> item, const std::filesystem::path& filePath)
        : _filePath{ filePath }
        , _createdAt{ utils::now() }
        , _updatedAt{ _createdAt }
        , _item{ getDboPtr(item) }
    {
    }

    Download::pointer Download::create(Session& session, ObjectPtr<Item> item, const std::filesystem::path& filePath)
    {
        return session.getDboSession()->add(std::unique_ptr<Download>{ new Download{ item, filePath } });
    }

    std::size_t Download::getCount(Session& session)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM download"));
    }

    std::size_t Download::getCount(Session& session, DownloadStatus status)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM download d").where("d.status = ?").bind(status));
    }

    Download::pointer Download::find(Session& session, DownloadId id)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<Download>>("SELECT d from download d").where("d.id = ?").bind(id));
    }

    Download::pointer Download::findByItem(Session& session, ItemId itemId)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<Download>>("SELECT d from download d").where("d.item_id = ?").bind(itemId));
    }

    bool Download::existsWithFilePath(Session& session, const std::filesystem::path& filePath)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM download d").where("d.file_path = ?").bind(filePath)) > 0;
    }

    void Download::find(Session& session, const FindParameters& params, std::function<void(const pointer&)> func)
    {
        session.checkReadTransaction();

        auto query{ createQuery<Wt::Dbo::ptr<Download>>(session, "d", params) };
        utils::forEachQueryRangeResult(query, params.range, func);
    }

    std::vector<DownloadId> Download::findIds(Session& session, const FindParameters& params)
    {
        session.checkReadTransaction();

        auto query{ createQuery<DownloadId>(session, "d.id", params) };
        utils::applyRange(query, params.range);
        return utils::fetchQueryResults(query);
    }

    std::uint64_t Download::getCompletedTotalSize(Session& session, SubscriptionId subscription)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<long long>("SELECT COALESCE(SUM(d.file_size), 0) FROM download d") };
        if (subscription.isValid())
        {
            query.join("item i ON i.id = d.item_id");
            query.where("i.subscription_id = ?").bind(subscription);
        }
        query.where("d.status = ?").bind(DownloadStatus::Completed);

        return static_cast<std::uint64_t>(utils::fetchQuerySingleResult(query));
    }

    std::optional<std::uint64_t> Download::getFileSize() const
    {
        if (_status != DownloadStatus::Completed)
            return std::nullopt;

        return static_cast<std::uint64_t>(_fileSize);
    }

    ObjectPtr<Item> Download::getItem() const
    {
        return _item;
    }

    ItemId Download::getItemId() const
    {
        return _item.id();
    }

    void Download::setPending()
    {
        _status = DownloadStatus::Pending;
        _progress = 0;
        _errorMessage.clear();
        _startedAt = {};
        _completedAt = {};
        touch();
    }

    void Download::setDownloading()
    {
        _status = DownloadStatus::Downloading;
        _startedAt = utils::now();
        touch();
    }

    void Download::setProgress(double progress)
    {
        if (std::isnan(progress))
            return;

        _progress = std::clamp(progress, 0.0, maxInProgressRatio);
        touch();
    }

    void Download::setCompleted(std::uint64_t fileSize)
    {
        _status = DownloadStatus::Completed;
        _fileSize = static_cast<long long>(fileSize);
        _progress = 1.0;
        _errorMessage.clear();
        _completedAt = utils::now();
        touch();
    }

    void Download::setFailed(std::string_view errorMessage)
    {
        _status = DownloadStatus::Failed;
        _errorMessage = errorMessage;
        _retryCount += 1;
        touch();
    }

    void Download::setDeleted()
    {
        _status = DownloadStatus::Deleted;
        _progress = 0;
        _fileSize = 0;
        touch();
    }

    void Download::touch()
    {
        _updatedAt = utils::now();
    }
} // namespace podkeep::db
