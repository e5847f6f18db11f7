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

#include <atomic>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

#include <Wt/Dbo/SqlConnectionPool.h>

#include "database/IDb.hpp"

namespace podkeep::db
{
    class Db : public IDb
    {
    public:
        Db(const std::filesystem::path& dbPath, const DbParameters& params);

    private:
        Db(const Db&) = delete;
        Db& operator=(const Db&) = delete;

        friend class Session;

        Session& getTLSSession() override;

        std::recursive_mutex& getMutex() { return _writeMutex; }
        Wt::Dbo::SqlConnectionPool& getConnectionPool() { return *_connectionPool; }

        void checkIntegrity(IntegrityCheck check);
        // Returns the rows that report a problem
        std::vector<std::string> runCheckPragma(std::string_view pragma);

        // Borrows a connection from the pool for the current scope
        class ScopedConnection
        {
        public:
            ScopedConnection(Wt::Dbo::SqlConnectionPool& pool);
            ~ScopedConnection();
            ScopedConnection(const ScopedConnection&) = delete;
            ScopedConnection& operator=(const ScopedConnection&) = delete;

            Wt::Dbo::SqlConnection* operator->() const { return _connection.get(); }

        private:
            Wt::Dbo::SqlConnectionPool& _connectionPool;
            std::unique_ptr<Wt::Dbo::SqlConnection> _connection;
        };

        static inline std::atomic<std::size_t> _nextInstanceId{};
        const std::size_t _instanceId{ _nextInstanceId++ };

        std::recursive_mutex _writeMutex;
        std::unique_ptr<Wt::Dbo::SqlConnectionPool> _connectionPool;

        std::mutex _tlsSessionsMutex;
        std::vector<std::unique_ptr<Session>> _tlsSessions;
    };
} // namespace podkeep::db
