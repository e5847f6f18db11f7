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

#include <atomic>
#include <unistd.h>

namespace podkeep::db::tests
{
    namespace
    {
        std::filesystem::path createTmpDbPath()
        {
            static std::atomic<unsigned> counter{};
            return std::filesystem::temp_directory_path() / ("podkeep-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++) + ".db");
        }
    } // namespace

    TmpDatabase::TmpDatabase()
        : _dbFile{ createTmpDbPath() }
        , _db{ createDb(_dbFile, DbParameters{ .connectionCount = 1 }) }
    {
        Session session{ *_db };
        session.prepareSchemaIfNeeded();
    }

    TmpDatabase::~TmpDatabase()
    {
        _db.reset();

        std::error_code ec;
        for (const char* suffix : { "", "-wal", "-shm" })
            std::filesystem::remove(_dbFile.string() + suffix, ec);
    }

    DatabaseFixture::~DatabaseFixture()
    {
        EXPECT_TRUE(session.areAllTablesEmpty()) << "test did not clean up its objects";
    }

    void DatabaseFixture::SetUpTestSuite()
    {
        _tmpDb = std::make_unique<TmpDatabase>();
    }

    void DatabaseFixture::TearDownTestSuite()
    {
        _tmpDb.reset();
    }

    TEST_F(DatabaseFixture, Common_downloadStatusTokens)
    {
        EXPECT_EQ(toString(DownloadStatus::Pending), "pending");
        EXPECT_EQ(toString(DownloadStatus::Downloading), "downloading");
        EXPECT_EQ(toString(DownloadStatus::Completed), "completed");
        EXPECT_EQ(toString(DownloadStatus::Failed), "failed");
        EXPECT_EQ(toString(DownloadStatus::Deleted), "deleted");

        EXPECT_EQ(downloadStatusFromString("completed"), DownloadStatus::Completed);
        EXPECT_EQ(downloadStatusFromString("Completed"), std::nullopt);
        EXPECT_EQ(downloadStatusFromString(""), std::nullopt);

        EXPECT_TRUE(isActive(DownloadStatus::Pending));
        EXPECT_TRUE(isActive(DownloadStatus::Downloading));
        EXPECT_FALSE(isActive(DownloadStatus::Completed));
        EXPECT_FALSE(isActive(DownloadStatus::Failed));
        EXPECT_FALSE(isActive(DownloadStatus::Deleted));
    }
} // namespace podkeep::db::tests
