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

#include "database/objects/Item.hpp"

#include <Wt/Dbo/Impl.h>
#include <Wt/Dbo/WtSqlTraits.h>

#include "database/Session.hpp"
#include "database/objects/Subscription.hpp"

#include "Utils.hpp"
#include "traits/DboTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(podkeep::db::Item)

namespace podkeep::db
{
    namespace
    {
        Wt::Dbo::Query<Wt::Dbo::ptr<Item>> createQuery(Session& session, const Item::FindParameters& params)
        {
            auto query{ session.getDboSession()->query<Wt::Dbo::ptr<Item>>("SELECT i from item i") };

            if (params.subscription.isValid())
                query.where("i.subscription_id = ?").bind(params.subscription);

            switch (params.sortMode)
            {
            case ItemSortMode::None:
                break;
            case ItemSortMode::PubDateDesc:
                query.orderBy("i.published_at IS NULL, i.published_at DESC, i.id DESC");
                break;
            case ItemSortMode::PubDateAsc:
                query.orderBy("i.published_at IS NULL, i.published_at ASC, i.id ASC");
                break;
            }

            return query;
        }
    } // namespace

    Item::Item(ObjectPtr<Subscription> subscription, std::string_view guid)
        : _guid{ guid }
        , _createdAt{ utils::now() }
        , _subscription{ getDboPtr(subscription) }
    {
    }

    Item::pointer Item::create(Session& session, ObjectPtr<Subscription> subscription, std::string_view guid)
    {
        return session.getDboSession()->add(std::unique_ptr<Item>{ new Item{ subscription, guid } });
    }

    std::size_t Item::getCount(Session& session)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM item"));
    }

    Item::pointer Item::find(Session& session, ItemId id)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<Item>>("SELECT i from item i").where("i.id = ?").bind(id));
    }

    Item::pointer Item::find(Session& session, std::string_view guid)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<Item>>("SELECT i from item i").where("i.guid = ?").bind(std::string{ guid }));
    }

    void Item::find(Session& session, const FindParameters& params, std::function<void(const pointer&)> func)
    {
        session.checkReadTransaction();

        auto query{ createQuery(session, params) };
        utils::forEachQueryRangeResult(query, params.range, func);
    }

    std::optional<std::uint64_t> Item::getDeclaredSize() const
    {
        if (_declaredSize <= 0)
            return std::nullopt;

        return static_cast<std::uint64_t>(_declaredSize);
    }

    std::optional<int> Item::getEpisodeNumber() const
    {
        return _episodeNumber > 0 ? std::optional<int>{ _episodeNumber } : std::nullopt;
    }

    std::optional<int> Item::getSeasonNumber() const
    {
        return _seasonNumber > 0 ? std::optional<int>{ _seasonNumber } : std::nullopt;
    }

    ObjectPtr<Subscription> Item::getSubscription() const
    {
        return _subscription;
    }

    SubscriptionId Item::getSubscriptionId() const
    {
        return _subscription.id();
    }
} // namespace podkeep::db
