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

#include "Db.hpp"

#include <unordered_map>

#include <Wt/Dbo/FixedSqlConnectionPool.h>
#include <Wt/Dbo/backend/Sqlite3.h>

#include "core/ILogger.hpp"
#include "database/Session.hpp"
#include "database/Types.hpp"

namespace podkeep::db
{
    namespace
    {
        constexpr std::chrono::seconds connectionPoolTimeout{ 10 };

        class Connection : public Wt::Dbo::backend::Sqlite3
        {
        public:
            Connection(const std::filesystem::path& dbPath)
                : Wt::Dbo::backend::Sqlite3{ dbPath.string() }
            {
                applySettings();
            }

            Connection(const Connection& other)
                : Wt::Dbo::backend::Sqlite3{ other }
            {
                applySettings();
            }
            Connection& operator=(const Connection&) = delete;

        private:
            std::unique_ptr<SqlConnection> clone() const override
            {
                return std::make_unique<Connection>(*this);
            }

            void applySettings()
            {
                // transfers update their progress while other threads read
                executeSql("PRAGMA journal_mode=WAL");
                executeSql("PRAGMA synchronous=normal");
                // items and downloads are removed along with their parent
                executeSql("PRAGMA foreign_keys=ON");
                executeSql("PRAGMA busy_timeout=5000");
            }
        };

        std::string_view getIntegrityCheckName(IntegrityCheck check)
        {
            switch (check)
            {
            case IntegrityCheck::None:
                return "none";
            case IntegrityCheck::Quick:
                return "quick";
            case IntegrityCheck::Full:
                return "full";
            }
            return "";
        }
    } // namespace

    std::unique_ptr<IDb> createDb(const std::filesystem::path& dbPath, const DbParameters& params)
    {
        return std::make_unique<Db>(dbPath, params);
    }

    Db::Db(const std::filesystem::path& dbPath, const DbParameters& params)
    {
        PODKEEP_LOG(DB, INFO, "Opening database " << dbPath << " with " << params.connectionCount << " connections");

        auto connection{ std::make_unique<Connection>(dbPath) };
        connection->setProperty("show-queries", params.showQueries ? "true" : "false");

        auto connectionPool{ std::make_unique<Wt::Dbo::FixedSqlConnectionPool>(std::move(connection), params.connectionCount) };
        connectionPool->setTimeout(connectionPoolTimeout);
        _connectionPool = std::move(connectionPool);

        {
            ScopedConnection scopedConnection{ *_connectionPool };
            scopedConnection->executeSql("PRAGMA temp_store=MEMORY");
        }

        checkIntegrity(params.integrityCheck);
    }

    Session& Db::getTLSSession()
    {
        // keyed by instance since several databases may live in the same process
        static thread_local std::unordered_map<std::size_t, Session*> tlsSessions;

        Session*& tlsSession{ tlsSessions[_instanceId] };
        if (!tlsSession)
        {
            auto newSession{ std::make_unique<Session>(*this) };
            tlsSession = newSession.get();

            std::scoped_lock lock{ _tlsSessionsMutex };
            _tlsSessions.push_back(std::move(newSession));
        }

        return *tlsSession;
    }

    void Db::checkIntegrity(IntegrityCheck check)
    {
        if (check == IntegrityCheck::None)
            return;

        PODKEEP_LOG(DB, INFO, "Performing " << getIntegrityCheckName(check) << " database check...");

        std::vector<std::string> errors{ runCheckPragma(check == IntegrityCheck::Full ? "integrity_check" : "quick_check") };
        if (check == IntegrityCheck::Full)
        {
            const std::vector<std::string> foreignKeyErrors{ runCheckPragma("foreign_key_check") };
            errors.insert(std::end(errors), std::cbegin(foreignKeyErrors), std::cend(foreignKeyErrors));
        }

        for (const std::string& error : errors)
            PODKEEP_LOG(DB, ERROR, "Database check: " << error);

        if (errors.empty())
        {
            PODKEEP_LOG(DB, INFO, "Database check passed!");
            return;
        }

        if (check == IntegrityCheck::Full)
            throw Exception{ "Database check failed with " + std::to_string(errors.size()) + " errors, please restore from a backup or remove the database" };

        PODKEEP_LOG(DB, WARNING, "Database check done with " << errors.size() << " errors");
    }

    std::vector<std::string> Db::runCheckPragma(std::string_view pragma)
    {
        std::vector<std::string> errors;

        ScopedConnection connection{ *_connectionPool };
        auto statement{ connection->prepareStatement("PRAGMA " + std::string{ pragma }) };
        statement->execute();

        // integrity checks report a single "ok" row on success, foreign_key_check reports nothing
        // foreign_key_check rows: table, rowid, referred table, foreign key index
        const bool isForeignKeyCheck{ pragma == "foreign_key_check" };
        while (statement->nextRow())
        {
            std::string result;
            result.reserve(256);
            statement->getResult(0, &result, static_cast<int>(result.capacity()));

            if (isForeignKeyCheck)
            {
                long long rowId{};
                std::string referredTable;
                referredTable.reserve(64);
                statement->getResult(1, &rowId);
                statement->getResult(2, &referredTable, static_cast<int>(referredTable.capacity()));

                errors.push_back("foreign key failure in table '" + result + "', rowid " + std::to_string(rowId) + ", referring to '" + referredTable + "'");
            }
            else if (result != "ok")
            {
                errors.push_back(std::move(result));
            }
        }

        return errors;
    }

    Db::ScopedConnection::ScopedConnection(Wt::Dbo::SqlConnectionPool& pool)
        : _connectionPool{ pool }
        , _connection{ _connectionPool.getConnection() }
    {
    }

    Db::ScopedConnection::~ScopedConnection()
    {
        _connectionPool.returnConnection(std::move(_connection));
    }
} // namespace podkeep::db
