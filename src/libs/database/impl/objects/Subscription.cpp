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

#include "database/objects/Subscription.hpp"

#include <algorithm>

#include <Wt/Dbo/Impl.h>
#include <Wt/Dbo/WtSqlTraits.h>

#include "database/Session.hpp"
#include "database/objects/Item.hpp"

#include "Utils.hpp"
#include "traits/DboTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(podkeep::db::Subscription)

namespace podkeep::db
{
    Subscription::Subscription(std::string_view feedUrl, std::string_view title, std::string_view storageFolderName)
        : _feedUrl{ feedUrl }
        , _title{ title }
        , _storageFolderName{ storageFolderName }
        , _createdAt{ utils::now() }
    {
    }

    Subscription::pointer Subscription::create(Session& session, std::string_view feedUrl, std::string_view title, std::string_view storageFolderName)
    {
        return session.getDboSession()->add(std::unique_ptr<Subscription>{ new Subscription{ feedUrl, title, storageFolderName } });
    }

    std::size_t Subscription::getCount(Session& session)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM subscription"));
    }

    Subscription::pointer Subscription::find(Session& session, SubscriptionId id)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<Subscription>>("SELECT s from subscription s").where("s.id = ?").bind(id));
    }

    Subscription::pointer Subscription::find(Session& session, std::string_view feedUrl)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<Subscription>>("SELECT s from subscription s").where("s.feed_url = ?").bind(std::string{ feedUrl }));
    }

    void Subscription::find(Session& session, std::function<void(const pointer&)> func)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<Wt::Dbo::ptr<Subscription>>("SELECT s from subscription s").orderBy("s.id") };
        utils::forEachQueryResult(query, func);
    }

    void Subscription::setMaxItemsToKeep(std::size_t count)
    {
        _maxItemsToKeep = static_cast<int>(std::clamp(count, minItemsToKeep, maxItemsToKeep));
    }
} // namespace podkeep::db
