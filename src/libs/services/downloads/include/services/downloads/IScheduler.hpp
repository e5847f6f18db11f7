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

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <Wt/WDateTime.h>

namespace podkeep::downloads
{
    // Runs jobs on fixed intervals, at most one instance of each job at a time
    // A tick that happens while the previous run of the same job is still ongoing is skipped
    class IScheduler
    {
    public:
        virtual ~IScheduler() = default;

        using JobFunction = std::function<void()>;
        // runAtStart: first run right after start() instead of after a full interval
        virtual void addJob(std::string_view id, std::string_view name, std::chrono::seconds interval, bool runAtStart, JobFunction func) = 0;

        virtual void start() = 0;
        // Waits for the ongoing runs
        virtual void stop() = 0;

        // Return false if the job does not exist
        virtual bool pauseJob(std::string_view id) = 0;
        virtual bool resumeJob(std::string_view id) = 0;
        // Runs the job as soon as possible, even if paused
        virtual bool triggerJob(std::string_view id) = 0;

        struct JobInfo
        {
            std::string id;
            std::string name;
            std::chrono::seconds interval;
            bool paused{};
            bool running{};
            std::size_t runCount{};
            std::size_t skippedCount{};
            Wt::WDateTime lastRunAt;
        };
        virtual std::vector<JobInfo> getJobs() const = 0;
    };

    std::unique_ptr<IScheduler> createScheduler(boost::asio::io_context& ioContext);
} // namespace podkeep::downloads
