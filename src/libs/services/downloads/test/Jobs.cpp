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

#include "services/downloads/IDiscoveryService.hpp"
#include "services/downloads/IDownloadService.hpp"
#include "services/downloads/IRetentionService.hpp"
#include "services/downloads/IScheduler.hpp"
#include "services/downloads/Jobs.hpp"

#include "Common.hpp"

namespace podkeep::downloads::tests
{
    namespace
    {
        // Only records the registered jobs
        class RecordingScheduler final : public IScheduler
        {
        public:
            struct RegisteredJob
            {
                std::string id;
                std::chrono::seconds interval;
                bool runAtStart;
                JobFunction func;
            };

            const RegisteredJob* findJob(std::string_view id) const
            {
                for (const RegisteredJob& job : jobs)
                {
                    if (job.id == id)
                        return &job;
                }
                return nullptr;
            }

            std::vector<RegisteredJob> jobs;

        private:
            void addJob(std::string_view id, std::string_view, std::chrono::seconds interval, bool runAtStart, JobFunction func) override
            {
                jobs.push_back(RegisteredJob{ std::string{ id }, interval, runAtStart, std::move(func) });
            }
            void start() override {}
            void stop() override {}
            bool pauseJob(std::string_view) override { return false; }
            bool resumeJob(std::string_view) override { return false; }
            bool triggerJob(std::string_view) override { return false; }
            std::vector<JobInfo> getJobs() const override { return {}; }
        };
    } // namespace

    class JobsTest : public DownloadsFixture
    {
    public:
        std::unique_ptr<IDownloadService> downloadService{ createDownloadService(tmpDb.getDb(), planner, client, DownloadServiceParameters{}) };
        std::unique_ptr<IDiscoveryService> discovery{ createDiscoveryService(tmpDb.getDb(), planner, *downloadService, nullptr) };
        std::unique_ptr<IRetentionService> retention{ createRetentionService(tmpDb.getDb(), planner, nullptr) };
        JobServices services{ *discovery, *downloadService, *retention, planner };
    };

    TEST_F(JobsTest, registration)
    {
        RecordingScheduler scheduler;
        JobParameters params;
        params.feedRefreshInterval = std::chrono::seconds{ 1800 };
        params.queueProcessingInterval = std::chrono::seconds{ 600 };
        registerJobs(scheduler, services, params);

        ASSERT_EQ(scheduler.jobs.size(), 5);

        const auto* feedRefresh{ scheduler.findJob(jobIds::feedRefresh) };
        ASSERT_NE(feedRefresh, nullptr);
        EXPECT_EQ(feedRefresh->interval, std::chrono::seconds{ 1800 });
        EXPECT_TRUE(feedRefresh->runAtStart);

        const auto* queueProcessing{ scheduler.findJob(jobIds::queueProcessing) };
        ASSERT_NE(queueProcessing, nullptr);
        EXPECT_EQ(queueProcessing->interval, std::chrono::seconds{ 600 });
        EXPECT_TRUE(queueProcessing->runAtStart);

        const auto* retryFailed{ scheduler.findJob(jobIds::retryFailed) };
        ASSERT_NE(retryFailed, nullptr);
        EXPECT_FALSE(retryFailed->runAtStart);

        const auto* cleanup{ scheduler.findJob(jobIds::retention) };
        ASSERT_NE(cleanup, nullptr);
        EXPECT_EQ(cleanup->interval, std::chrono::seconds{ 86400 });
        EXPECT_FALSE(cleanup->runAtStart);

        const auto* diskSpaceCheck{ scheduler.findJob(jobIds::diskSpaceCheck) };
        ASSERT_NE(diskSpaceCheck, nullptr);
        EXPECT_TRUE(diskSpaceCheck->runAtStart);
    }

    TEST_F(JobsTest, retentionDisabled)
    {
        RecordingScheduler scheduler;
        JobParameters params;
        params.retentionEnabled = false;
        registerJobs(scheduler, services, params);

        EXPECT_EQ(scheduler.jobs.size(), 4);
        EXPECT_EQ(scheduler.findJob(jobIds::retention), nullptr);
    }

    TEST_F(JobsTest, run)
    {
        client.setHandler([](const core::http::ClientRequestParameters& request) {
            return FakeResponse{ .status = 200, .headers = { { "Content-Length", "5" } }, .body = request.method == core::http::ClientRequestParameters::Method::GET ? "audio" : "" };
        });

        RecordingScheduler scheduler;
        JobParameters params;
        params.maxRetries = 2;
        registerJobs(scheduler, services, params);

        const db::SubscriptionId subscription{ createSubscription("Show", 1) };
        const db::DownloadId pending{ downloadService->enqueue(createItem(subscription, "ep1", 1)) };

        scheduler.findJob(jobIds::queueProcessing)->func();
        downloadService->waitForTransfers();
        EXPECT_EQ(getDownloadInfo(pending)->status, db::DownloadStatus::Completed);

        const db::DownloadId failed{ createDownload(createItem(subscription, "ep2", 2), "Show/ep2.mp3", db::DownloadStatus::Downloading) };
        setDownloadStatus(failed, db::DownloadStatus::Failed);
        const db::DownloadId exhausted{ createDownload(createItem(subscription, "ep3", 3), "Show/ep3.mp3", db::DownloadStatus::Downloading) };
        setDownloadStatus(exhausted, db::DownloadStatus::Failed);
        setDownloadStatus(exhausted, db::DownloadStatus::Failed);

        scheduler.findJob(jobIds::retryFailed)->func();
        downloadService->waitForTransfers();
        EXPECT_EQ(getDownloadInfo(failed)->status, db::DownloadStatus::Completed);
        EXPECT_EQ(getDownloadInfo(exhausted)->status, db::DownloadStatus::Failed);

        // only the newest completed download is kept
        scheduler.findJob(jobIds::retention)->func();
        EXPECT_EQ(getDownloadCount(db::DownloadStatus::Completed), 1);
        EXPECT_TRUE(getDownloadInfo(failed));
        EXPECT_FALSE(getDownloadInfo(pending));

        EXPECT_NO_THROW(scheduler.findJob(jobIds::feedRefresh)->func());
        EXPECT_NO_THROW(scheduler.findJob(jobIds::diskSpaceCheck)->func());
    }
} // namespace podkeep::downloads::tests
