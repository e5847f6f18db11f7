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

#include <atomic>
#include <condition_variable>
#include <stdexcept>
#include <thread>

#include <gtest/gtest.h>

#include "core/IOContextRunner.hpp"
#include "services/downloads/Exception.hpp"
#include "services/downloads/IScheduler.hpp"

namespace podkeep::downloads::tests
{
    namespace
    {
        template<typename Predicate>
        bool waitUntil(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::seconds{ 5 })
        {
            const auto deadline{ std::chrono::steady_clock::now() + timeout };
            while (!predicate())
            {
                if (std::chrono::steady_clock::now() > deadline)
                    return false;
                std::this_thread::sleep_for(std::chrono::milliseconds{ 5 });
            }
            return true;
        }

        class Latch
        {
        public:
            void release()
            {
                {
                    std::scoped_lock lock{ _mutex };
                    _released = true;
                }
                _cv.notify_all();
            }

            void wait()
            {
                std::unique_lock lock{ _mutex };
                _cv.wait(lock, [this] { return _released; });
            }

        private:
            std::mutex _mutex;
            std::condition_variable _cv;
            bool _released{};
        };
    } // namespace

    class SchedulerTest : public ::testing::Test
    {
    public:
        IScheduler::JobInfo getJob(std::string_view id) const
        {
            for (const IScheduler::JobInfo& job : scheduler->getJobs())
            {
                if (job.id == id)
                    return job;
            }
            throw std::runtime_error{ "job not found" };
        }

        std::size_t getRunCount(std::string_view id) const { return getJob(id).runCount; }

        ~SchedulerTest() override
        {
            scheduler->stop();
        }

        boost::asio::io_context ioContext;
        std::unique_ptr<IScheduler> scheduler{ createScheduler(ioContext) };
        core::IOContextRunner ioContextRunner{ ioContext, 1, "SchedulerTest" };
    };

    TEST_F(SchedulerTest, addJob)
    {
        scheduler->addJob("job", "Job", std::chrono::seconds{ 10 }, false, [] {});

        EXPECT_THROW(scheduler->addJob("job", "Job again", std::chrono::seconds{ 10 }, false, [] {}), Exception);
        EXPECT_THROW(scheduler->addJob("zero", "Zero", std::chrono::seconds{ 0 }, false, [] {}), Exception);

        scheduler->start();
        EXPECT_THROW(scheduler->addJob("late", "Late", std::chrono::seconds{ 10 }, false, [] {}), Exception);

        const std::vector<IScheduler::JobInfo> jobs{ scheduler->getJobs() };
        ASSERT_EQ(jobs.size(), 1);
        EXPECT_EQ(jobs[0].id, "job");
        EXPECT_EQ(jobs[0].name, "Job");
        EXPECT_EQ(jobs[0].interval, std::chrono::seconds{ 10 });
        EXPECT_FALSE(jobs[0].paused);
        EXPECT_EQ(jobs[0].runCount, 0);
        EXPECT_FALSE(jobs[0].lastRunAt.isValid());
    }

    TEST_F(SchedulerTest, runAtStart)
    {
        std::atomic<std::size_t> startedRunCount{};
        std::atomic<std::size_t> delayedRunCount{};
        scheduler->addJob("started", "Started", std::chrono::hours{ 1 }, true, [&] { startedRunCount++; });
        scheduler->addJob("delayed", "Delayed", std::chrono::hours{ 1 }, false, [&] { delayedRunCount++; });

        scheduler->start();

        ASSERT_TRUE(waitUntil([&] { return getRunCount("started") == 1; }));
        EXPECT_EQ(startedRunCount.load(), 1);
        EXPECT_TRUE(getJob("started").lastRunAt.isValid());

        std::this_thread::sleep_for(std::chrono::milliseconds{ 50 });
        EXPECT_EQ(delayedRunCount.load(), 0);
        EXPECT_EQ(getRunCount("delayed"), 0);
    }

    TEST_F(SchedulerTest, periodic)
    {
        std::atomic<std::size_t> runCount{};
        scheduler->addJob("job", "Job", std::chrono::seconds{ 1 }, false, [&] { runCount++; });
        scheduler->start();

        ASSERT_TRUE(waitUntil([&] { return runCount >= 2; }));
    }

    TEST_F(SchedulerTest, trigger)
    {
        std::atomic<std::size_t> runCount{};
        scheduler->addJob("job", "Job", std::chrono::hours{ 1 }, false, [&] { runCount++; });

        // not started yet
        EXPECT_TRUE(scheduler->triggerJob("job"));

        scheduler->start();
        EXPECT_TRUE(scheduler->triggerJob("job"));
        ASSERT_TRUE(waitUntil([&] { return getRunCount("job") == 1; }));
        EXPECT_EQ(runCount.load(), 1);

        EXPECT_FALSE(scheduler->triggerJob("unknown"));
    }

    TEST_F(SchedulerTest, pauseResume)
    {
        std::atomic<std::size_t> runCount{};
        scheduler->addJob("job", "Job", std::chrono::seconds{ 1 }, true, [&] { runCount++; });

        EXPECT_TRUE(scheduler->pauseJob("job"));
        EXPECT_FALSE(scheduler->pauseJob("unknown"));
        EXPECT_TRUE(getJob("job").paused);

        scheduler->start();
        std::this_thread::sleep_for(std::chrono::milliseconds{ 1500 });
        EXPECT_EQ(runCount.load(), 0);

        // paused jobs can still be triggered manually
        EXPECT_TRUE(scheduler->triggerJob("job"));
        ASSERT_TRUE(waitUntil([&] { return getRunCount("job") == 1; }));

        EXPECT_TRUE(scheduler->resumeJob("job"));
        EXPECT_FALSE(scheduler->resumeJob("unknown"));
        EXPECT_FALSE(getJob("job").paused);
        ASSERT_TRUE(waitUntil([&] { return getRunCount("job") >= 2; }));
    }

    TEST_F(SchedulerTest, noOverlap)
    {
        Latch started;
        Latch mayFinish;
        std::atomic<std::size_t> concurrentRunCount{};
        std::atomic<std::size_t> maxConcurrentRunCount{};

        scheduler->addJob("job", "Job", std::chrono::hours{ 1 }, true, [&] {
            const std::size_t count{ ++concurrentRunCount };
            if (count > maxConcurrentRunCount)
                maxConcurrentRunCount = count;

            started.release();
            mayFinish.wait();
            concurrentRunCount--;
        });

        scheduler->start();
        started.wait();
        EXPECT_TRUE(getJob("job").running);

        EXPECT_TRUE(scheduler->triggerJob("job"));
        EXPECT_TRUE(scheduler->triggerJob("job"));
        EXPECT_EQ(getJob("job").skippedCount, 2);

        mayFinish.release();
        ASSERT_TRUE(waitUntil([&] { return getRunCount("job") == 1; }));
        EXPECT_FALSE(getJob("job").running);
        EXPECT_EQ(maxConcurrentRunCount.load(), 1);
    }

    TEST_F(SchedulerTest, failingJob)
    {
        std::atomic<std::size_t> callCount{};
        scheduler->addJob("job", "Job", std::chrono::hours{ 1 }, true, [&] {
            callCount++;
            throw std::runtime_error{ "failure" };
        });

        scheduler->start();
        ASSERT_TRUE(waitUntil([&] { return getRunCount("job") == 1; }));

        // still schedulable
        EXPECT_TRUE(scheduler->triggerJob("job"));
        ASSERT_TRUE(waitUntil([&] { return getRunCount("job") == 2; }));
        EXPECT_EQ(callCount.load(), 2);
    }

    TEST_F(SchedulerTest, stopWaitsForOngoingRuns)
    {
        Latch started;
        std::atomic<bool> finished{};
        scheduler->addJob("job", "Job", std::chrono::hours{ 1 }, true, [&] {
            started.release();
            std::this_thread::sleep_for(std::chrono::milliseconds{ 100 });
            finished = true;
        });

        scheduler->start();
        started.wait();
        scheduler->stop();
        EXPECT_TRUE(finished.load());

        EXPECT_TRUE(scheduler->triggerJob("job"));
        EXPECT_EQ(getRunCount("job"), 1);
    }
} // namespace podkeep::downloads::tests
