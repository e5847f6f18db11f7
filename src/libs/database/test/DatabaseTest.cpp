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
    TEST_F(DatabaseFixture, SubscriptionItemsDownloadsCascade)
    {
        ScopedSubscription subscription{ session, "https://example.com/feed.xml", "Feed", "Feed" };

        {
            auto transaction{ session.createWriteTransaction() };

            for (int i{}; i < 3; ++i)
            {
                Item::pointer item{ session.create<Item>(subscription.get(), "guid-" + std::to_string(i)) };
                session.create<Download>(item, "Feed/" + std::to_string(i) + ".mp3");
            }
        }

        {
            auto transaction{ session.createReadTransaction() };
            EXPECT_EQ(Item::getCount(session), 3);
            EXPECT_EQ(Download::getCount(session), 3);
        }

        {
            auto transaction{ session.createWriteTransaction() };
            Subscription::find(session, subscription.getId()).remove();
        }

        {
            auto transaction{ session.createReadTransaction() };
            EXPECT_EQ(Subscription::getCount(session), 0);
            EXPECT_EQ(Item::getCount(session), 0);
            EXPECT_EQ(Download::getCount(session), 0);
        }
    }
} // namespace podkeep::db::tests

int main(int argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
