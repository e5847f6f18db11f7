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

#include "JobScheduler.hpp"

#include <boost/asio/post.hpp>

#include "core/IJob.hpp"
#include "core/ILogger.hpp"

namespace podkeep::core
{
    std::unique_ptr<IJobScheduler> createJobScheduler(core::LiteralString name, std::size_t threadCount)
    {
        return std::make_unique<JobScheduler>(name, threadCount);
    }

    JobScheduler::JobScheduler(core::LiteralString name, std::size_t threadCount)
        : _name{ name }
        , _ioContextRunner{ _ioContext, threadCount, name.str() }
    {
    }

    JobScheduler::~JobScheduler()
    {
        wait();
    }

    void JobScheduler::setShouldAbortCallback(ShouldAbortCallback callback)
    {
        _shouldAbort = std::move(callback);
    }

    std::size_t JobScheduler::getThreadCount() const
    {
        return _ioContextRunner.getThreadCount();
    }

    void JobScheduler::scheduleJob(std::unique_ptr<IJob> job)
    {
        {
            const std::scoped_lock lock{ _mutex };
            ++_queuedOrRunningJobs;
        }

        boost::asio::post(_ioContext, [this, job = std::move(job)]() mutable {
            execute(*job);
            job.reset(); // job resources must be released before waiters are notified
            onJobDone();
        });
    }

    void JobScheduler::execute(IJob& job)
    {
        if (_shouldAbort && _shouldAbort())
        {
            PODKEEP_LOG(UTILS, DEBUG, "[" << _name << "] dropping queued job '" << job.getName() << "'");
            return;
        }

        try
        {
            job.run();
        }
        catch (const std::exception& e)
        {
            PODKEEP_LOG(UTILS, ERROR, "[" << _name << "] job '" << job.getName() << "' failed: " << e.what());
        }
    }

    void JobScheduler::onJobDone()
    {
        {
            const std::scoped_lock lock{ _mutex };
            --_queuedOrRunningJobs;
        }
        _jobDone.notify_all();
    }

    std::size_t JobScheduler::getOngoingJobCount() const
    {
        const std::scoped_lock lock{ _mutex };
        return _queuedOrRunningJobs;
    }

    void JobScheduler::waitUntilJobCountAtMost(std::size_t maxOngoingJobs)
    {
        std::unique_lock lock{ _mutex };
        _jobDone.wait(lock, [&] { return _queuedOrRunningJobs <= maxOngoingJobs; });
    }

    void JobScheduler::wait()
    {
        waitUntilJobCountAtMost(0);
    }
} // namespace podkeep::core
