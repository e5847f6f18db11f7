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

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace podkeep::core
{
    // Counting semaphore that bounds how many holders may run at the same time
    class Semaphore
    {
    public:
        explicit Semaphore(std::size_t capacity);
        ~Semaphore() = default;
        Semaphore(const Semaphore&) = delete;
        Semaphore& operator=(const Semaphore&) = delete;

        // Held slot, given back on destruction
        class Slot
        {
        public:
            Slot() = default;
            ~Slot();
            Slot(Slot&& other) noexcept;
            Slot& operator=(Slot&& other) noexcept;
            Slot(const Slot&) = delete;
            Slot& operator=(const Slot&) = delete;

            bool isHeld() const { return _semaphore != nullptr; }
            void release();

        private:
            friend class Semaphore;
            explicit Slot(Semaphore& semaphore)
                : _semaphore{ &semaphore } {}

            Semaphore* _semaphore{};
        };

        // blocks until a slot is available
        [[nodiscard]] Slot acquire();
        [[nodiscard]] Slot tryAcquire();

        std::size_t getCapacity() const { return _capacity; }
        std::size_t getAvailableCount() const;

    private:
        void release();

        const std::size_t _capacity;
        mutable std::mutex _mutex;
        std::condition_variable _cv;
        std::size_t _available;
    };
} // namespace podkeep::core
