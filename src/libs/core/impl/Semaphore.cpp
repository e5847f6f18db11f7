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

#include "core/Semaphore.hpp"

#include <utility>

#include "core/Exception.hpp"

namespace podkeep::core
{
    Semaphore::Semaphore(std::size_t capacity)
        : _capacity{ capacity }
        , _available{ capacity }
    {
        if (_capacity == 0)
            throw PodkeepException{ "Semaphore capacity must be at least 1" };
    }

    Semaphore::Slot Semaphore::acquire()
    {
        std::unique_lock lock{ _mutex };
        _cv.wait(lock, [this] { return _available > 0; });
        _available -= 1;

        return Slot{ *this };
    }

    Semaphore::Slot Semaphore::tryAcquire()
    {
        std::scoped_lock lock{ _mutex };
        if (_available == 0)
            return Slot{};

        _available -= 1;
        return Slot{ *this };
    }

    std::size_t Semaphore::getAvailableCount() const
    {
        std::scoped_lock lock{ _mutex };
        return _available;
    }

    void Semaphore::release()
    {
        {
            std::scoped_lock lock{ _mutex };
            _available += 1;
        }
        _cv.notify_one();
    }

    Semaphore::Slot::~Slot()
    {
        release();
    }

    Semaphore::Slot::Slot(Slot&& other) noexcept
        : _semaphore{ std::exchange(other._semaphore, nullptr) }
    {
    }

    Semaphore::Slot& Semaphore::Slot::operator=(Slot&& other) noexcept
    {
        if (this != &other)
        {
            release();
            _semaphore = std::exchange(other._semaphore, nullptr);
        }

        return *this;
    }

    void Semaphore::Slot::release()
    {
        if (Semaphore * semaphore{ std::exchange(_semaphore, nullptr) })
            semaphore->release();
    }
} // namespace podkeep::core
