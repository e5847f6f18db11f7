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

#include "core/Exception.hpp"
#include "core/Service.hpp"

namespace podkeep::core::tests
{
    class IStore
    {
    public:
        virtual ~IStore() = default;
    };

    class LocalStore : public IStore
    {
    };

    class RemoteStore : public IStore
    {
    };

    struct LocalTag
    {
    };
    struct RemoteTag
    {
    };

    TEST(Service, ctr)
    {
        EXPECT_FALSE(Service<IStore>::exists());
        EXPECT_EQ(Service<IStore>::get(), nullptr);

        {
            Service<IStore> store{ std::make_unique<LocalStore>() };

            EXPECT_TRUE(Service<IStore>::exists());
            EXPECT_EQ(Service<IStore>::get(), store.operator->());
        }

        EXPECT_FALSE(Service<IStore>::exists());
    }

    TEST(Service, tags)
    {
        Service<IStore, LocalTag> localStore{ std::make_unique<LocalStore>() };
        Service<IStore, RemoteTag> remoteStore{ std::make_unique<RemoteStore>() };

        EXPECT_FALSE(Service<IStore>::exists());

        EXPECT_TRUE((Service<IStore, LocalTag>::exists()));
        EXPECT_TRUE((Service<IStore, RemoteTag>::exists()));
        EXPECT_NE((Service<IStore, LocalTag>::get()), (Service<IStore, RemoteTag>::get()));
        EXPECT_EQ((Service<IStore, LocalTag>::get()), localStore.operator->());
        EXPECT_EQ((Service<IStore, RemoteTag>::get()), remoteStore.operator->());
    }

    TEST(Service, alreadyRegistered)
    {
        Service<IStore> store{ std::make_unique<LocalStore>() };

        EXPECT_THROW(Service<IStore>{ std::make_unique<RemoteStore>() }, PodkeepException);
        EXPECT_TRUE(Service<IStore>::exists());
        EXPECT_EQ(Service<IStore>::get(), store.operator->());
    }

    TEST(Service, nullInstance)
    {
        EXPECT_THROW(Service<IStore>{ nullptr }, PodkeepException);
        EXPECT_FALSE(Service<IStore>::exists());
    }
} // namespace podkeep::core::tests
