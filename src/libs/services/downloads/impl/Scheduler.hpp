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

#include <map>
#include <memory>
#include <mutex>

#include <boost/asio/steady_timer.hpp>

#include "core/IJobScheduler.hpp"
#include "services/downloads/IScheduler.hpp"

namespace podkeep::downloads
{
    class Scheduler : public IScheduler
    {
    public:
        Scheduler(boost::asio::io_context& ioContext);
        ~Scheduler() override;
        Scheduler(const Scheduler&) = delete;
        Scheduler& operator=(const Scheduler&) = delete;

    private:
        void addJob(std::string_view id, std::string_view name, std::chrono::seconds interval, bool runAtStart, JobFunction func) override;
        void start() override;
        void stop() override;
        bool pauseJob(std::string_view id) override;
        bool resumeJob(std::string_view id) override;
        bool triggerJob(std::string_view id) override;
        std::vector<JobInfo> getJobs() const override;

        struct Job
        {
            Job(boost::asio::io_context& ioContext, std::string_view id, std::string_view name, std::chrono::seconds interval, bool runAtStart, JobFunction func);

            const std::string id;
            const std::string name;
            const std::chrono::seconds interval;
            const bool runAtStart;
            const JobFunction func;

            boost::asio::steady_timer timer;
            bool paused{};
            bool running{};
            std::size_t runCount{};
            std::size_t skippedCount{};
            Wt::WDateTime lastRunAt;
        };

        // all these need _mutex to be locked
        void scheduleTick(Job& job, std::chrono::steady_clock::duration fromNow);
        void onTick(Job& job);
        void launch(Job& job);

        void onRunDone(Job& job);

        boost::asio::io_context& _ioContext;

        mutable std::mutex _mutex;
        std::map<std::string, std::unique_ptr<Job>, std::less<>> _jobs;
        bool _started{};
        bool _stopped{};
        std::unique_ptr<core::IJobScheduler> _runner;
    };
} // namespace podkeep::downloads
