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

#include <gtest/gtest.h>

#include "services/downloads/IRetentionService.hpp"

#include "Common.hpp"

namespace podkeep::downloads::tests
{
    class RetentionServiceTest : public DownloadsFixture
    {
    public:
        // file is named after the guid and contains size bytes
        db::DownloadId createCompletedDownload(db::SubscriptionId subscription, std::string_view folder, std::string_view guid, int publishedDay, std::size_t size = 100)
        {
            const std::filesystem::path filePath{ std::filesystem::path{ folder } / (std::string{ guid } + ".mp3") };
            writeFile(filePath, generateContent(size));
            return createDownload(createItem(subscription, guid, publishedDay), filePath, db::DownloadStatus::Completed);
        }

        bool fileExists(std::string_view folder, std::string_view guid)
        {
            return planner.getFileSize(std::filesystem::path{ folder } / (std::string{ guid } + ".mp3")).has_value();
        }
    };

    TEST_F(RetentionServiceTest, nothingToDo)
    {
        auto retention{ createRetentionService(tmpDb.getDb(), planner, nullptr) };

        const RetentionReport report{ retention->sweep() };
        EXPECT_EQ(report.deletedCount, 0);
        EXPECT_EQ(report.freedBytes, 0);
        EXPECT_EQ(report.failedSubscriptionCount, 0);
    }

    TEST_F(RetentionServiceTest, countBased)
    {
        const db::SubscriptionId subscription{ createSubscription("Show", 2) };
        const db::DownloadId a{ createCompletedDownload(subscription, "Show", "a", 4, 10) };
        const db::DownloadId b{ createCompletedDownload(subscription, "Show", "b", 3, 20) };
        const db::DownloadId c{ createCompletedDownload(subscription, "Show", "c", 2, 30) };
        const db::DownloadId d{ createCompletedDownload(subscription, "Show", "d", 1, 40) };

        auto retention{ createRetentionService(tmpDb.getDb(), planner, nullptr) };
        const RetentionReport report{ retention->sweep() };

        EXPECT_EQ(report.deletedCount, 2);
        EXPECT_EQ(report.freedBytes, 70);
        EXPECT_EQ(report.keptUnconsumedCount, 0);

        EXPECT_TRUE(getDownloadInfo(a));
        EXPECT_TRUE(getDownloadInfo(b));
        EXPECT_FALSE(getDownloadInfo(c));
        EXPECT_FALSE(getDownloadInfo(d));
        EXPECT_TRUE(fileExists("Show", "a"));
        EXPECT_TRUE(fileExists("Show", "b"));
        EXPECT_FALSE(fileExists("Show", "c"));
        EXPECT_FALSE(fileExists("Show", "d"));

        // stable
        EXPECT_EQ(retention->sweep().deletedCount, 0);
    }

    TEST_F(RetentionServiceTest, onlyCompletedDownloadsCount)
    {
        const db::SubscriptionId subscription{ createSubscription("Show", 1) };
        createDownload(createItem(subscription, "newest", 10), "Show/newest.mp3", db::DownloadStatus::Pending);
        const db::DownloadId failed{ createDownload(createItem(subscription, "failed", 9), "Show/failed.mp3", db::DownloadStatus::Downloading) };
        setDownloadStatus(failed, db::DownloadStatus::Failed);
        const db::DownloadId kept{ createCompletedDownload(subscription, "Show", "kept", 2) };
        const db::DownloadId deleted{ createCompletedDownload(subscription, "Show", "deleted", 1) };

        auto retention{ createRetentionService(tmpDb.getDb(), planner, nullptr) };
        EXPECT_EQ(retention->sweep().deletedCount, 1);

        EXPECT_TRUE(getDownloadInfo(kept));
        EXPECT_FALSE(getDownloadInfo(deleted));
        EXPECT_EQ(getDownloadCount(db::DownloadStatus::Pending), 1);
        EXPECT_EQ(getDownloadCount(db::DownloadStatus::Failed), 1);
    }

    TEST_F(RetentionServiceTest, consumptionBased)
    {
        const db::SubscriptionId subscription{ createSubscription("Show", 2) };
        const db::DownloadId a{ createCompletedDownload(subscription, "Show", "a", 4) };
        const db::DownloadId b{ createCompletedDownload(subscription, "Show", "b", 3) };
        const db::DownloadId c{ createCompletedDownload(subscription, "Show", "c", 2) };
        const db::DownloadId d{ createCompletedDownload(subscription, "Show", "d", 1) };

        FakeConsumptionOracle oracle;
        oracle.setConsumed("a.mp3", true); // within the limit anyway
        oracle.setConsumed("c.mp3", true);
        oracle.setConsumed("d.mp3", false);

        auto retention{ createRetentionService(tmpDb.getDb(), planner, &oracle) };
        const RetentionReport report{ retention->sweep() };

        EXPECT_EQ(report.deletedCount, 1);
        EXPECT_EQ(report.keptUnconsumedCount, 1);
        EXPECT_EQ(report.freedBytes, 100);
        // only the downloads beyond the limit are looked up
        EXPECT_EQ(oracle.getQueryCount(), 2);

        EXPECT_TRUE(getDownloadInfo(a));
        EXPECT_TRUE(getDownloadInfo(b));
        EXPECT_FALSE(getDownloadInfo(c));
        EXPECT_TRUE(getDownloadInfo(d));
        EXPECT_TRUE(fileExists("Show", "d"));

        oracle.setConsumed("d.mp3", true);
        EXPECT_EQ(retention->sweep().deletedCount, 1);
        EXPECT_FALSE(getDownloadInfo(d));
    }

    TEST_F(RetentionServiceTest, oracleFailureKeepsFile)
    {
        const db::SubscriptionId subscription{ createSubscription("Show", 1) };
        createCompletedDownload(subscription, "Show", "newest", 3);
        const db::DownloadId a{ createCompletedDownload(subscription, "Show", "a", 2) };
        const db::DownloadId b{ createCompletedDownload(subscription, "Show", "b", 1) };

        FakeConsumptionOracle oracle;
        oracle.setFailing("a.mp3");
        oracle.setConsumed("b.mp3", true);

        auto retention{ createRetentionService(tmpDb.getDb(), planner, &oracle) };
        const RetentionReport report{ retention->sweep() };

        EXPECT_EQ(report.deletedCount, 1);
        EXPECT_EQ(report.keptUnconsumedCount, 1);
        EXPECT_EQ(report.failedSubscriptionCount, 0);
        EXPECT_TRUE(getDownloadInfo(a));
        EXPECT_TRUE(fileExists("Show", "a"));
        EXPECT_FALSE(getDownloadInfo(b));
    }

    TEST_F(RetentionServiceTest, missingFile)
    {
        const db::SubscriptionId subscription{ createSubscription("Show", 1) };
        createCompletedDownload(subscription, "Show", "newest", 2);
        const db::DownloadId download{ createDownload(createItem(subscription, "gone", 1), "Show/gone.mp3", db::DownloadStatus::Completed) };

        auto retention{ createRetentionService(tmpDb.getDb(), planner, nullptr) };
        const RetentionReport report{ retention->sweep() };

        EXPECT_EQ(report.deletedCount, 1);
        EXPECT_EQ(report.freedBytes, 0);
        EXPECT_FALSE(getDownloadInfo(download));
    }

    TEST_F(RetentionServiceTest, subscriptionsAreIndependent)
    {
        const db::SubscriptionId first{ createSubscription("First", 1) };
        const db::SubscriptionId second{ createSubscription("Second", 1) };
        createCompletedDownload(first, "First", "first1", 2);
        createCompletedDownload(first, "First", "first2", 1);
        createCompletedDownload(second, "Second", "second1", 1);

        auto retention{ createRetentionService(tmpDb.getDb(), planner, nullptr) };
        EXPECT_EQ(retention->sweep().deletedCount, 1);

        EXPECT_TRUE(fileExists("First", "first1"));
        EXPECT_FALSE(fileExists("First", "first2"));
        EXPECT_TRUE(fileExists("Second", "second1"));
    }

    TEST_F(RetentionServiceTest, emptyDirectoriesRemoved)
    {
        const db::SubscriptionId subscription{ createSubscription("Show", 1) };
        createCompletedDownload(subscription, "Show", "newest", 2);
        createCompletedDownload(subscription, "Previous", "a", 1);
        writeFile("Other/keep.txt", "content");

        auto retention{ createRetentionService(tmpDb.getDb(), planner, nullptr) };
        const RetentionReport report{ retention->sweep() };

        EXPECT_EQ(report.deletedCount, 1);
        EXPECT_EQ(report.removedDirectoryCount, 1);
        EXPECT_FALSE(std::filesystem::exists(planner.getRootPath() / "Previous"));
        EXPECT_TRUE(fileExists("Show", "newest"));
        EXPECT_TRUE(std::filesystem::exists(planner.getRootPath() / "Other" / "keep.txt"));
        EXPECT_TRUE(std::filesystem::is_directory(planner.getRootPath()));
    }
} // namespace podkeep::downloads::tests
