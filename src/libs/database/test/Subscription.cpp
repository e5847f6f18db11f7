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

#include "Common.hpp"

namespace podkeep::db::tests
{
    TEST_F(DatabaseFixture, Subscription)
    {
        {
            auto transaction{ session.createReadTransaction() };
            EXPECT_EQ(Subscription::getCount(session), 0);
        }

        ScopedSubscription subscription{ session, "https://example.com/feed.xml", "My Show", "My-Show" };

        {
            auto transaction{ session.createReadTransaction() };
            EXPECT_EQ(Subscription::getCount(session), 1);

            const Subscription::pointer s{ Subscription::find(session, subscription.getId()) };
            ASSERT_NE(s, Subscription::pointer{});
            EXPECT_EQ(s->getFeedUrl(), "https://example.com/feed.xml");
            EXPECT_EQ(s->getTitle(), "My Show");
            EXPECT_EQ(s->getStorageFolderName(), "My-Show");
            EXPECT_EQ(s->getMaxItemsToKeep(), Subscription::defaultMaxItemsToKeep);
            EXPECT_TRUE(s->isAutoDownloadEnabled());
            EXPECT_FALSE(s->getLastCheckedAt().isValid());
            EXPECT_TRUE(s->getCreatedAt().isValid());

            EXPECT_EQ(Subscription::find(session, "https://example.com/feed.xml"), s);
            EXPECT_EQ(Subscription::find(session, "https://example.com/other.xml"), Subscription::pointer{});
        }

        {
            auto transaction{ session.createWriteTransaction() };

            Subscription::pointer s{ Subscription::find(session, subscription.getId()) };
            s.modify()->setTitle("Renamed");
            s.modify()->setAutoDownloadEnabled(false);
            s.modify()->setMaxItemsToKeep(7);
            s.modify()->setLastCheckedAt(Wt::WDateTime::currentDateTime());
        }

        {
            auto transaction{ session.createReadTransaction() };

            const Subscription::pointer s{ Subscription::find(session, subscription.getId()) };
            EXPECT_EQ(s->getTitle(), "Renamed");
            // folder is never renamed
            EXPECT_EQ(s->getStorageFolderName(), "My-Show");
            EXPECT_FALSE(s->isAutoDownloadEnabled());
            EXPECT_EQ(s->getMaxItemsToKeep(), 7);
            EXPECT_TRUE(s->getLastCheckedAt().isValid());
        }
    }

    TEST_F(DatabaseFixture, Subscription_maxItemsToKeepClamped)
    {
        ScopedSubscription subscription{ session, "https://example.com/feed.xml", "My Show", "My-Show" };

        struct TestCase
        {
            std::size_t requested;
            std::size_t expected;
        };

        constexpr TestCase tests[]{
            { 0, 1 },
            { 1, 1 },
            { 3, 3 },
            { 100, 100 },
            { 101, 100 },
            { 5000, 100 },
        };

        for (const TestCase& test : tests)
        {
            auto transaction{ session.createWriteTransaction() };

            Subscription::pointer s{ subscription.get() };
            s.modify()->setMaxItemsToKeep(test.requested);
            EXPECT_EQ(s->getMaxItemsToKeep(), test.expected) << "requested = " << test.requested;
        }
    }

    TEST_F(DatabaseFixture, Subscription_uniqueFeedUrl)
    {
        ScopedSubscription subscription{ session, "https://example.com/feed.xml", "My Show", "My-Show" };

        EXPECT_THROW(
            {
                Session otherSession{ session.getDb() };
                auto transaction{ otherSession.createWriteTransaction() };
                otherSession.create<Subscription>("https://example.com/feed.xml", "Duplicate", "Duplicate");
            },
            Wt::Dbo::Exception);
    }
} // namespace podkeep::db::tests
