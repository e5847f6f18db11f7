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

#include <atomic>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "core/http/IClient.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/Types.hpp"
#include "database/objects/DownloadId.hpp"
#include "database/objects/ItemId.hpp"
#include "database/objects/SubscriptionId.hpp"
#include "services/downloads/IConsumptionOracle.hpp"
#include "services/downloads/IFileSystemPlanner.hpp"
#include "services/downloads/Types.hpp"

namespace podkeep::downloads::tests
{
    class TmpDirectory final
    {
    public:
        TmpDirectory();
        ~TmpDirectory();
        TmpDirectory(const TmpDirectory&) = delete;
        TmpDirectory& operator=(const TmpDirectory&) = delete;

        const std::filesystem::path& getPath() const { return _path; }

    private:
        const std::filesystem::path _path;
    };

    // Fresh database with all the tables created
    class TmpDatabase final
    {
    public:
        TmpDatabase();
        ~TmpDatabase();
        TmpDatabase(const TmpDatabase&) = delete;
        TmpDatabase& operator=(const TmpDatabase&) = delete;

        db::IDb& getDb() { return *_db; }

    private:
        const std::filesystem::path _dbPath;
        std::unique_ptr<db::IDb> _db;
    };

    struct FakeResponse
    {
        int status{ 200 };
        std::vector<std::pair<std::string, std::string>> headers;
        std::string body;
        std::size_t chunkSize{ 4096 };
        std::optional<std::string> transportError; // if set, onFailureFunc is called instead
    };

    // Serves the requests synchronously, from the calling thread
    class FakeHttpClient final : public core::http::IClient
    {
    public:
        using Handler = std::function<FakeResponse(const core::http::ClientRequestParameters& request)>;

        FakeHttpClient() = default;
        explicit FakeHttpClient(Handler handler)
            : _handler{ std::move(handler) } {}

        void setHandler(Handler handler);

        struct SentRequest
        {
            core::http::ClientRequestParameters::Method method;
            std::string url;
            std::vector<Wt::Http::Message::Header> headers;

            const std::string* getHeader(std::string_view name) const;
        };
        std::vector<SentRequest> getSentRequests() const;
        std::size_t getAbortCount() const { return _abortCount; }

    private:
        void sendRequest(core::http::ClientRequestParameters&& parameters) override;
        void abortAllRequests() override { _abortCount++; }

        mutable std::mutex _mutex;
        Handler _handler;
        std::vector<SentRequest> _sentRequests;
        std::atomic<std::size_t> _abortCount{};
    };

    // Real planner with a configurable amount of free space
    class FixedSpacePlanner final : public IFileSystemPlanner
    {
    public:
        FixedSpacePlanner(const std::filesystem::path& rootPath, std::uint64_t availableBytes);

        void setAvailableSpace(std::uint64_t availableBytes) { _availableBytes = availableBytes; }

        const std::filesystem::path& getRootPath() const override { return _planner->getRootPath(); }
        std::filesystem::path folderFor(std::string_view storageFolderName) override { return _planner->folderFor(storageFolderName); }
        std::filesystem::path pathFor(const ItemFileInfo& item, std::string_view storageFolderName, const IsPathTakenCallback& isPathTaken) const override { return _planner->pathFor(item, storageFolderName, isPathTaken); }
        std::uint64_t availableSpace() const override { return _availableBytes; }
        std::optional<std::filesystem::path> resolve(const std::filesystem::path& relativePath) const override { return _planner->resolve(relativePath); }
        std::optional<std::uint64_t> getFileSize(const std::filesystem::path& relativePath) const override { return _planner->getFileSize(relativePath); }
        std::uint64_t getFolderSize(std::string_view storageFolderName) const override { return _planner->getFolderSize(storageFolderName); }
        bool deleteFile(const std::filesystem::path& relativePath) override { return _planner->deleteFile(relativePath); }
        std::size_t cleanupEmptyDirectories() override { return _planner->cleanupEmptyDirectories(); }

    private:
        std::unique_ptr<IFileSystemPlanner> _planner;
        std::atomic<std::uint64_t> _availableBytes;
    };

    // Consumption states by file name, unknown files are not consumed
    class FakeConsumptionOracle final : public IConsumptionOracle
    {
    public:
        void setConsumed(const std::string& fileName, bool consumed);
        void setFailing(const std::string& fileName);

        std::size_t getQueryCount() const { return _queryCount; }

    private:
        bool isConsumed(const std::filesystem::path& filePath) override;

        std::mutex _mutex;
        std::map<std::string, bool> _consumed;
        std::vector<std::string> _failing;
        std::size_t _queryCount{};
    };

    // Database, planner and http client shared by the service tests
    class DownloadsFixture : public ::testing::Test
    {
    public:
        static constexpr std::uint64_t plentyOfSpace{ std::uint64_t{ 1000 } * 1024 * 1024 * 1024 };

        db::SubscriptionId createSubscription(std::string_view title, std::size_t maxItemsToKeep = 3);
        // publishedDay: day of January 2024
        db::ItemId createItem(db::SubscriptionId subscription, std::string_view guid, int publishedDay, std::string_view sourceUrl = "https://cdn.example.com/episode.mp3", std::optional<std::uint64_t> declaredSize = std::nullopt);

        // Record created directly, bypassing the admission checks
        db::DownloadId createDownload(db::ItemId item, const std::filesystem::path& relativePath, db::DownloadStatus status);
        void setDownloadStatus(db::DownloadId download, db::DownloadStatus status);
        std::optional<DownloadInfo> getDownloadInfo(db::DownloadId download);
        std::size_t getDownloadCount(std::optional<db::DownloadStatus> status = std::nullopt);

        // Writes a file under the download root
        void writeFile(const std::filesystem::path& relativePath, std::string_view content);
        std::string readFile(const std::filesystem::path& relativePath);

        TmpDirectory tmpDir;
        TmpDatabase tmpDb;
        db::Session& session{ tmpDb.getDb().getTLSSession() };
        FixedSpacePlanner planner{ tmpDir.getPath() / "downloads", plentyOfSpace };
        FakeHttpClient client;
    };

    // nullptr if absent, case insensitive
    const std::string* findHeader(const std::vector<Wt::Http::Message::Header>& headers, std::string_view name);

    // Deterministic content of the given size
    std::string generateContent(std::size_t size);
} // namespace podkeep::downloads::tests
