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

#include "Common.hpp"

#include <algorithm>
#include <fstream>
#include <span>
#include <sstream>
#include <unistd.h>

#include <Wt/Http/Message.h>
#include <Wt/WDate.h>
#include <Wt/WDateTime.h>

#include "core/String.hpp"
#include "database/objects/Download.hpp"
#include "database/objects/Item.hpp"
#include "database/objects/Subscription.hpp"

namespace podkeep::downloads::tests
{
    namespace
    {
        std::filesystem::path createTmpPath(std::string_view suffix)
        {
            static std::atomic<unsigned> counter{};
            return std::filesystem::temp_directory_path() / ("podkeep-downloads-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++) + std::string{ suffix });
        }
    } // namespace

    TmpDirectory::TmpDirectory()
        : _path{ createTmpPath("") }
    {
        std::filesystem::create_directories(_path);
    }

    TmpDirectory::~TmpDirectory()
    {
        std::error_code ec;
        std::filesystem::remove_all(_path, ec);
    }

    TmpDatabase::TmpDatabase()
        : _dbPath{ createTmpPath(".db") }
        , _db{ db::createDb(_dbPath) }
    {
        db::Session session{ *_db };
        session.prepareSchemaIfNeeded();
    }

    TmpDatabase::~TmpDatabase()
    {
        _db.reset();

        std::error_code ec;
        std::filesystem::remove(_dbPath, ec);
    }

    void FakeHttpClient::setHandler(Handler handler)
    {
        std::scoped_lock lock{ _mutex };
        _handler = std::move(handler);
    }

    const std::string* FakeHttpClient::SentRequest::getHeader(std::string_view name) const
    {
        return findHeader(headers, name);
    }

    std::vector<FakeHttpClient::SentRequest> FakeHttpClient::getSentRequests() const
    {
        std::scoped_lock lock{ _mutex };
        return _sentRequests;
    }

    void FakeHttpClient::sendRequest(core::http::ClientRequestParameters&& request)
    {
        using ReceiveResult = core::http::ClientRequestParameters::ReceiveResult;

        Handler handler;
        {
            std::scoped_lock lock{ _mutex };
            _sentRequests.push_back(SentRequest{ request.method, request.url, request.headers });
            handler = _handler;
        }

        const FakeResponse response{ handler ? handler(request) : FakeResponse{ .status = 404 } };

        if (response.transportError)
        {
            if (request.onFailureFunc)
                request.onFailureFunc(*response.transportError);
            return;
        }

        Wt::Http::Message msg;
        msg.setStatus(response.status);
        for (const auto& [name, value] : response.headers)
            msg.addHeader(name, value);

        if (request.onHeadersReceived && request.onHeadersReceived(msg) == ReceiveResult::Abort)
        {
            if (request.onAbortFunc)
                request.onAbortFunc();
            return;
        }

        if (request.onChunkReceived)
        {
            std::string_view remainingBody{ response.body };
            while (!remainingBody.empty())
            {
                const std::string_view chunk{ remainingBody.substr(0, response.chunkSize) };
                remainingBody.remove_prefix(chunk.size());

                if (request.onChunkReceived(std::as_bytes(std::span{ chunk.data(), chunk.size() })) == ReceiveResult::Abort)
                {
                    if (request.onAbortFunc)
                        request.onAbortFunc();
                    return;
                }
            }
        }
        else
        {
            msg.addBodyText(response.body);
        }

        if (request.onResponseFunc)
            request.onResponseFunc(msg);
    }

    FixedSpacePlanner::FixedSpacePlanner(const std::filesystem::path& rootPath, std::uint64_t availableBytes)
        : _planner{ createFileSystemPlanner(rootPath) }
        , _availableBytes{ availableBytes }
    {
    }

    void FakeConsumptionOracle::setConsumed(const std::string& fileName, bool consumed)
    {
        std::scoped_lock lock{ _mutex };
        _consumed[fileName] = consumed;
    }

    void FakeConsumptionOracle::setFailing(const std::string& fileName)
    {
        std::scoped_lock lock{ _mutex };
        _failing.push_back(fileName);
    }

    bool FakeConsumptionOracle::isConsumed(const std::filesystem::path& filePath)
    {
        std::scoped_lock lock{ _mutex };
        _queryCount++;

        const std::string fileName{ filePath.filename().string() };
        if (std::find(std::cbegin(_failing), std::cend(_failing), fileName) != std::cend(_failing))
            throw std::runtime_error{ "lookup failed" };

        auto it{ _consumed.find(fileName) };
        return it != std::cend(_consumed) && it->second;
    }

    db::SubscriptionId DownloadsFixture::createSubscription(std::string_view title, std::size_t maxItemsToKeep)
    {
        auto transaction{ session.createWriteTransaction() };

        db::Subscription::pointer subscription{ session.create<db::Subscription>("https://feeds.example.com/" + std::string{ title }, title, title) };
        subscription.modify()->setMaxItemsToKeep(maxItemsToKeep);

        return subscription->getId();
    }

    db::ItemId DownloadsFixture::createItem(db::SubscriptionId subscriptionId, std::string_view guid, int publishedDay, std::string_view sourceUrl, std::optional<std::uint64_t> declaredSize)
    {
        auto transaction{ session.createWriteTransaction() };

        db::Subscription::pointer subscription{ db::Subscription::find(session, subscriptionId) };
        EXPECT_TRUE(subscription);

        db::Item::pointer item{ session.create<db::Item>(subscription, guid) };
        item.modify()->setTitle("Episode " + std::string{ guid });
        item.modify()->setSourceUrl(sourceUrl);
        item.modify()->setMimeType("audio/mpeg");
        item.modify()->setDeclaredSize(declaredSize);
        item.modify()->setPublishedAt(Wt::WDateTime{ Wt::WDate{ 2024, 1, publishedDay } });

        return item->getId();
    }

    db::DownloadId DownloadsFixture::createDownload(db::ItemId itemId, const std::filesystem::path& relativePath, db::DownloadStatus status)
    {
        db::DownloadId downloadId;
        {
            auto transaction{ session.createWriteTransaction() };

            db::Item::pointer item{ db::Item::find(session, itemId) };
            EXPECT_TRUE(item);

            downloadId = session.create<db::Download>(item, relativePath)->getId();
        }

        setDownloadStatus(downloadId, status);
        return downloadId;
    }

    void DownloadsFixture::setDownloadStatus(db::DownloadId downloadId, db::DownloadStatus status)
    {
        auto transaction{ session.createWriteTransaction() };

        db::Download::pointer download{ db::Download::find(session, downloadId) };
        ASSERT_TRUE(download);

        switch (status)
        {
        case db::DownloadStatus::Pending:
            download.modify()->setPending();
            break;
        case db::DownloadStatus::Downloading:
            download.modify()->setDownloading();
            break;
        case db::DownloadStatus::Completed:
            download.modify()->setCompleted(planner.getFileSize(download->getFilePath()).value_or(0));
            break;
        case db::DownloadStatus::Failed:
            download.modify()->setFailed("failure");
            break;
        case db::DownloadStatus::Deleted:
            download.modify()->setDeleted();
            break;
        }
    }

    std::optional<DownloadInfo> DownloadsFixture::getDownloadInfo(db::DownloadId downloadId)
    {
        auto transaction{ session.createReadTransaction() };

        const db::Download::pointer download{ db::Download::find(session, downloadId) };
        if (!download)
            return std::nullopt;

        DownloadInfo info;
        info.id = download->getId();
        info.itemId = download->getItemId();
        info.status = download->getStatus();
        info.filePath = download->getFilePath();
        info.fileSize = download->getFileSize();
        info.progress = download->getProgress();
        info.errorMessage = download->getErrorMessage();
        info.retryCount = download->getRetryCount();

        return info;
    }

    std::size_t DownloadsFixture::getDownloadCount(std::optional<db::DownloadStatus> status)
    {
        auto transaction{ session.createReadTransaction() };
        return status ? db::Download::getCount(session, *status) : db::Download::getCount(session);
    }

    void DownloadsFixture::writeFile(const std::filesystem::path& relativePath, std::string_view content)
    {
        const std::filesystem::path absolutePath{ planner.getRootPath() / relativePath };
        std::filesystem::create_directories(absolutePath.parent_path());

        std::ofstream file{ absolutePath, std::ios::binary | std::ios::trunc };
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
    }

    std::string DownloadsFixture::readFile(const std::filesystem::path& relativePath)
    {
        std::ifstream file{ planner.getRootPath() / relativePath, std::ios::binary };
        std::ostringstream oss;
        oss << file.rdbuf();
        return oss.str();
    }

    const std::string* findHeader(const std::vector<Wt::Http::Message::Header>& headers, std::string_view name)
    {
        for (const Wt::Http::Message::Header& header : headers)
        {
            if (core::stringUtils::stringCaseInsensitiveEqual(header.name(), name))
                return &header.value();
        }

        return nullptr;
    }

    std::string generateContent(std::size_t size)
    {
        std::string content(size, '\0');
        for (std::size_t i{}; i < size; ++i)
            content[i] = static_cast<char>('a' + (i * 7 + i / 251) % 26);

        return content;
    }
} // namespace podkeep::downloads::tests
