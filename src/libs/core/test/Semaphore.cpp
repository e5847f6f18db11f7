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

#include <atomic>
#include <thread>
#include <vector>

#include "core/Exception.hpp"
#include "core/Semaphore.hpp"

namespace podkeep::core::tests
{
    TEST(Semaphore, zeroCapacity)
    {
        EXPECT_THROW(Semaphore{ 0 }, PodkeepException);
    }

    TEST(Semaphore, tryAcquire)
    {
        Semaphore semaphore{ 2 };
        EXPECT_EQ(semaphore.getCapacity(), 2);
        EXPECT_EQ(semaphore.getAvailableCount(), 2);

        Semaphore::Slot slot1{ semaphore.tryAcquire() };
        EXPECT_TRUE(slot1.isHeld());
        Semaphore::Slot slot2{ semaphore.tryAcquire() };
        EXPECT_TRUE(slot2.isHeld());
        EXPECT_EQ(semaphore.getAvailableCount(), 0);

        Semaphore::Slot slot3{ semaphore.tryAcquire() };
        EXPECT_FALSE(slot3.isHeld());

        slot1.release();
        EXPECT_FALSE(slot1.isHeld());
        EXPECT_EQ(semaphore.getAvailableCount(), 1);

        // releasing twice has no effect
        slot1.release();
        EXPECT_EQ(semaphore.getAvailableCount(), 1);
    }

    TEST(Semaphore, slotMove)
    {
        Semaphore semaphore{ 1 };

        {
            Semaphore::Slot slot{ semaphore.acquire() };
            Semaphore::Slot moved{ std::move(slot) };
            EXPECT_FALSE(slot.isHeld());
            EXPECT_TRUE(moved.isHeld());
            EXPECT_EQ(semaphore.getAvailableCount(), 0);
        }

        EXPECT_EQ(semaphore.getAvailableCount(), 1);

        Semaphore::Slot slot{ semaphore.acquire() };
        slot = Semaphore::Slot{};
        EXPECT_EQ(semaphore.getAvailableCount(), 1);
    }

    TEST(Semaphore, boundsConcurrency)
    {
        constexpr std::size_t capacity{ 3 };
        Semaphore semaphore{ capacity };

        std::atomic<std::size_t> running{};
        std::atomic<std::size_t> maxRunning{};

        std::vector<std::thread> threads;
        for (std::size_t i{}; i < 10; ++i)
        {
            threads.emplace_back([&] {
                const Semaphore::Slot slot{ semaphore.acquire() };

                const std::size_t current{ ++running };
                std::size_t expected{ maxRunning.load() };
                while (current > expected && !maxRunning.compare_exchange_weak(expected, current))
                    ;

                std::this_thread::sleep_for(std::chrono::milliseconds{ 10 });
                --running;
            });
        }

        for (std::thread& thread : threads)
            thread.join();

        EXPECT_LE(maxRunning.load(), capacity);
        EXPECT_EQ(semaphore.getAvailableCount(), capacity);
    }
} // namespace podkeep::core::tests
