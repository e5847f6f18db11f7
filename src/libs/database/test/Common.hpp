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

#include <filesystem>
#include <memory>

#include <gtest/gtest.h>

#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/Types.hpp"
#include "database/objects/Download.hpp"
#include "database/objects/Item.hpp"
#include "database/objects/Subscription.hpp"

namespace podkeep::db::tests
{
    // Creates an object in its own write transaction, removes it on destruction
    // (unless it has already been removed by a cascade)
    template<typename T>
    class [[nodiscard]] ScopedEntity
    {
    public:
        using IdType = typename T::IdType;

        template<typename... Args>
        ScopedEntity(db::Session& session, Args&&... args)
            : _session{ session }
        {
            auto transaction{ _session.createWriteTransaction() };

            const typename T::pointer created{ _session.create<T>(std::forward<Args>(args)...) };
            EXPECT_TRUE(created);
            _id = created->getId();
        }

        ~ScopedEntity()
        {
            auto transaction{ _session.createWriteTransaction() };

            if (typename T::pointer remaining{ T::find(_session, _id) })
                remaining.remove();
        }

        ScopedEntity(const ScopedEntity&) = delete;
        ScopedEntity& operator=(const ScopedEntity&) = delete;

        IdType getId() const { return _id; }

        // Requires an active transaction
        typename T::pointer get()
        {
            _session.checkReadTransaction();

            typename T::pointer found{ T::find(_session, _id) };
            EXPECT_TRUE(found);
            return found;
        }

        typename T::pointer lockAndGet()
        {
            auto transaction{ _session.createReadTransaction() };
            return get();
        }

    private:
        db::Session& _session;
        IdType _id;
    };

    using ScopedSubscription = ScopedEntity<db::Subscription>;
    using ScopedItem = ScopedEntity<db::Item>;
    using ScopedDownload = ScopedEntity<db::Download>;

    // Database stored in a temporary file, deleted on destruction
    class TmpDatabase final
    {
    public:
        TmpDatabase();
        ~TmpDatabase();
        TmpDatabase(const TmpDatabase&) = delete;
        TmpDatabase& operator=(const TmpDatabase&) = delete;

        IDb& getDb() { return *_db; }

    private:
        const std::filesystem::path _dbFile;
        std::unique_ptr<IDb> _db;
    };

    // All the tests of a suite share the same database, which must be left empty by each test
    class DatabaseFixture : public ::testing::Test
    {
    protected:
        ~DatabaseFixture() override;

        static void SetUpTestSuite();
        static void TearDownTestSuite();

    private:
        static inline std::unique_ptr<TmpDatabase> _tmpDb;

    protected:
        db::Session session{ _tmpDb->getDb() };
    };
} // namespace podkeep::db::tests
