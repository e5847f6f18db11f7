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

#include "Scheduler.hpp"

#include "core/IJob.hpp"
#include "core/ILogger.hpp"
#include "services/downloads/Exception.hpp"

namespace podkeep::downloads
{
    namespace
    {
        class RunJob : public core::IJob
        {
        public:
            RunJob(std::function<void()> func)
                : _func{ std::move(func) } {}

        private:
            core::LiteralString getName() const override { return "Scheduled job"; }
            void run() override { _func(); }

            std::function<void()> _func;
        };
    } // namespace

    std::unique_ptr<IScheduler> createScheduler(boost::asio::io_context& ioContext)
    {
        return std::make_unique<Scheduler>(ioContext);
    }

    Scheduler::Job::Job(boost::asio::io_context& ioContext, std::string_view _id, std::string_view _name, std::chrono::seconds _interval, bool _runAtStart, JobFunction _func)
        : id{ _id }
        , name{ _name }
        , interval{ _interval }
        , runAtStart{ _runAtStart }
        , func{ std::move(_func) }
        , timer{ ioContext }
    {
    }

    Scheduler::Scheduler(boost::asio::io_context& ioContext)
        : _ioContext{ ioContext }
    {
    }

    Scheduler::~Scheduler()
    {
        stop();
    }

    void Scheduler::addJob(std::string_view id, std::string_view name, std::chrono::seconds interval, bool runAtStart, JobFunction func)
    {
        if (interval.count() <= 0)
            throw Exception{ "Job '" + std::string{ id } + "': interval must be strictly positive" };

        std::scoped_lock lock{ _mutex };

        if (_started)
            throw Exception{ "Cannot add job '" + std::string{ id } + "': scheduler already started" };

        auto [it, inserted]{ _jobs.emplace(std::string{ id }, nullptr) };
        if (!inserted)
            throw Exception{ "Job '" + std::string{ id } + "' already exists" };

        it->second = std::make_unique<Job>(_ioContext, id, name, interval, runAtStart, std::move(func));
        PODKEEP_LOG(SCHEDULER, DEBUG, "Added job '" << name << "', every " << interval.count() << " seconds");
    }

    void Scheduler::start()
    {
        std::scoped_lock lock{ _mutex };

        if (_started)
            return;

        _started = true;
        _runner = core::createJobScheduler("Scheduler", std::max<std::size_t>(_jobs.size(), 1));

        for (auto& [id, job] : _jobs)
            scheduleTick(*job, job->runAtStart ? std::chrono::steady_clock::duration::zero() : std::chrono::steady_clock::duration{ job->interval });

        PODKEEP_LOG(SCHEDULER, INFO, "Started with " << _jobs.size() << " jobs");
    }

    void Scheduler::stop()
    {
        {
            std::scoped_lock lock{ _mutex };

            if (!_started || _stopped)
                return;

            _stopped = true;
            for (auto& [id, job] : _jobs)
                job->timer.cancel();
        }

        // ongoing runs are not interrupted
        _runner->wait();
        PODKEEP_LOG(SCHEDULER, INFO, "Stopped");
    }

    bool Scheduler::pauseJob(std::string_view id)
    {
        std::scoped_lock lock{ _mutex };

        auto it{ _jobs.find(id) };
        if (it == std::cend(_jobs))
            return false;

        it->second->paused = true;
        PODKEEP_LOG(SCHEDULER, INFO, "Paused job '" << it->second->name << "'");
        return true;
    }

    bool Scheduler::resumeJob(std::string_view id)
    {
        std::scoped_lock lock{ _mutex };

        auto it{ _jobs.find(id) };
        if (it == std::cend(_jobs))
            return false;

        it->second->paused = false;
        PODKEEP_LOG(SCHEDULER, INFO, "Resumed job '" << it->second->name << "'");
        return true;
    }

    bool Scheduler::triggerJob(std::string_view id)
    {
        std::scoped_lock lock{ _mutex };

        auto it{ _jobs.find(id) };
        if (it == std::cend(_jobs))
            return false;

        Job& job{ *it->second };
        if (!_started || _stopped)
        {
            PODKEEP_LOG(SCHEDULER, WARNING, "Cannot trigger job '" << job.name << "': scheduler not running");
            return true;
        }

        if (job.running)
        {
            PODKEEP_LOG(SCHEDULER, DEBUG, "Job '" << job.name << "' already running");
            job.skippedCount++;
            return true;
        }

        PODKEEP_LOG(SCHEDULER, DEBUG, "Triggering job '" << job.name << "'");
        launch(job);
        return true;
    }

    std::vector<IScheduler::JobInfo> Scheduler::getJobs() const
    {
        std::vector<JobInfo> res;

        std::scoped_lock lock{ _mutex };
        for (const auto& [id, job] : _jobs)
        {
            JobInfo info;
            info.id = job->id;
            info.name = job->name;
            info.interval = job->interval;
            info.paused = job->paused;
            info.running = job->running;
            info.runCount = job->runCount;
            info.skippedCount = job->skippedCount;
            info.lastRunAt = job->lastRunAt;

            res.push_back(std::move(info));
        }

        return res;
    }

    void Scheduler::scheduleTick(Job& job, std::chrono::steady_clock::duration fromNow)
    {
        job.timer.expires_after(fromNow);
        job.timer.async_wait([this, &job](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted)
                return;

            if (ec)
                throw Exception{ "Steady timer failure: " + std::string{ ec.message() } };

            std::scoped_lock lock{ _mutex };
            onTick(job);
        });
    }

    void Scheduler::onTick(Job& job)
    {
        if (_stopped)
            return;

        // fixed rate, whatever the run duration
        scheduleTick(job, job.interval);

        if (job.paused)
        {
            PODKEEP_LOG(SCHEDULER, DEBUG, "Job '" << job.name << "' paused, skipping");
            return;
        }

        if (job.running)
        {
            PODKEEP_LOG(SCHEDULER, DEBUG, "Job '" << job.name << "' still running, skipping this run");
            job.skippedCount++;
            return;
        }

        launch(job);
    }

    void Scheduler::launch(Job& job)
    {
        job.running = true;

        _runner->scheduleJob(std::make_unique<RunJob>([this, &job] {
            PODKEEP_LOG(SCHEDULER, DEBUG, "Running job '" << job.name << "'");

            try
            {
                job.func();
            }
            catch (const std::exception& e)
            {
                PODKEEP_LOG(SCHEDULER, ERROR, "Job '" << job.name << "' failed: " << e.what());
            }

            onRunDone(job);
        }));
    }

    void Scheduler::onRunDone(Job& job)
    {
        std::scoped_lock lock{ _mutex };

        job.running = false;
        job.runCount++;
        job.lastRunAt = Wt::WDateTime::currentDateTime();

        PODKEEP_LOG(SCHEDULER, DEBUG, "Job '" << job.name << "' done");
    }
} // namespace podkeep::downloads
