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

#include "database/Session.hpp"

#include <Wt/Dbo/WtSqlTraits.h>

#include "core/ILogger.hpp"
#include "database/objects/Download.hpp"
#include "database/objects/Item.hpp"
#include "database/objects/Subscription.hpp"

#include "Db.hpp"
#include "TransactionChecker.hpp"
#include "Utils.hpp"
#include "traits/DownloadStatusTraits.hpp"
#include "traits/DboTraits.hpp"

namespace podkeep::db
{
    Session::Session(IDb& db)
        : _db{ db }
    {
        _session.setConnectionPool(static_cast<Db&>(_db).getConnectionPool());

        _session.mapClass<Download>("download");
        _session.mapClass<Item>("item");
        _session.mapClass<Subscription>("subscription");
    }

    WriteTransaction Session::createWriteTransaction()
    {
        return WriteTransaction{ static_cast<Db&>(_db).getMutex(), _session };
    }

    ReadTransaction Session::createReadTransaction()
    {
        return ReadTransaction{ _session };
    }

    void Session::checkWriteTransaction() const
    {
        TransactionChecker::checkWriteTransaction(_session);
    }

    void Session::checkReadTransaction() const
    {
        TransactionChecker::checkReadTransaction(_session);
    }

    bool Session::areAllTablesEmpty()
    {
        auto transaction{ createReadTransaction() };

        return Download::getCount(*this) == 0
            && Item::getCount(*this) == 0
            && Subscription::getCount(*this) == 0;
    }

    void Session::prepareSchemaIfNeeded()
    {
        PODKEEP_LOG(DB, INFO, "Preparing schema...");

        try
        {
            auto transaction{ createWriteTransaction() };
            _session.createTables();
            PODKEEP_LOG(DB, INFO, "Tables created");
        }
        catch (const Wt::Dbo::Exception& e)
        {
            // tables are created all at once, on first start only
            if (std::string_view{ e.what() }.find("already exists") == std::string_view::npos)
            {
                PODKEEP_LOG(DB, ERROR, "Cannot create tables: " << e.what());
                throw;
            }
        }

        auto transaction{ createWriteTransaction() };

        utils::executeCommand(_session, "CREATE UNIQUE INDEX IF NOT EXISTS subscription_feed_url_idx ON subscription(feed_url)");

        utils::executeCommand(_session, "CREATE UNIQUE INDEX IF NOT EXISTS item_guid_idx ON item(guid)");
        utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS item_subscription_published_at_idx ON item(subscription_id, published_at)");

        utils::executeCommand(_session, "CREATE UNIQUE INDEX IF NOT EXISTS download_item_idx ON download(item_id)");
        utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS download_status_created_at_idx ON download(status, created_at)");
        utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS download_file_path_idx ON download(file_path)");

        PODKEEP_LOG(DB, INFO, "Schema ready");
    }
} // namespace podkeep::db
