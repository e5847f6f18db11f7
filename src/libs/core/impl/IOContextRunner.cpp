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

#include "core/IOContextRunner.hpp"

#include "core/ILogger.hpp"

namespace podkeep::core
{
    IOContextRunner::IOContextRunner(boost::asio::io_context& ioContext, std::size_t threadCount, std::string_view name)
        : _name{ name }
        , _ioContext{ ioContext }
        , _workGuard{ boost::asio::make_work_guard(ioContext) }
    {
        PODKEEP_LOG(UTILS, INFO, "IO context '" << _name << "': starting " << threadCount << " worker(s)");

        _workers.reserve(threadCount);
        for (std::size_t workerIndex{}; workerIndex < threadCount; ++workerIndex)
            _workers.emplace_back([this, workerIndex] { workerLoop(workerIndex); });
    }

    IOContextRunner::~IOContextRunner()
    {
        stop();

        for (std::thread& worker : _workers)
        {
            if (worker.joinable())
                worker.join();
        }

        PODKEEP_LOG(UTILS, DEBUG, "IO context '" << _name << "': all workers joined");
    }

    void IOContextRunner::stop()
    {
        if (_stopRequested.exchange(true))
            return;

        PODKEEP_LOG(UTILS, DEBUG, "IO context '" << _name << "': stop requested");
        _workGuard.reset();
        _ioContext.stop();
    }

    void IOContextRunner::workerLoop(std::size_t workerIndex)
    {
        // A handler that throws must not take the whole pool down:
        // log it and go back to running the remaining handlers
        while (!_stopRequested)
        {
            try
            {
                _ioContext.run();
                break;
            }
            catch (const std::exception& e)
            {
                PODKEEP_LOG(UTILS, ERROR, "IO context '" << _name << "', worker " << workerIndex << ": uncaught exception in handler: " << e.what());
            }
        }

        PODKEEP_LOG(UTILS, DEBUG, "IO context '" << _name << "', worker " << workerIndex << " exited");
    }
} // namespace podkeep::core
