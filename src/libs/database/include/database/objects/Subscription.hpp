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

#include <functional>
#include <string>
#include <string_view>

#include <Wt/Dbo/Field.h>
#include <Wt/Dbo/collection.h>
#include <Wt/WDateTime.h>

#include "database/Object.hpp"
#include "database/objects/SubscriptionId.hpp"

namespace podkeep::db
{
    class Item;
    class Session;

    // A followed feed, owns its items
    class Subscription final : public Object<Subscription, SubscriptionId>
    {
    public:
        static constexpr std::size_t defaultMaxItemsToKeep{ 3 };
        static constexpr std::size_t minItemsToKeep{ 1 };
        static constexpr std::size_t maxItemsToKeep{ 100 };

        Subscription() = default;
        static std::size_t getCount(Session& session);
        static pointer find(Session& session, SubscriptionId id);
        static pointer find(Session& session, std::string_view feedUrl);
        static void find(Session& session, std::function<void(const pointer&)> func);

        // getters
        std::string_view getFeedUrl() const { return _feedUrl; }
        std::string_view getTitle() const { return _title; }
        std::string_view getStorageFolderName() const { return _storageFolderName; }
        std::size_t getMaxItemsToKeep() const { return static_cast<std::size_t>(_maxItemsToKeep); }
        bool isAutoDownloadEnabled() const { return _autoDownload; }
        const Wt::WDateTime& getLastCheckedAt() const { return _lastCheckedAt; }
        const Wt::WDateTime& getCreatedAt() const { return _createdAt; }

        // setters
        void setTitle(std::string_view title) { _title = title; }
        // clamped to [minItemsToKeep, maxItemsToKeep]
        void setMaxItemsToKeep(std::size_t count);
        void setAutoDownloadEnabled(bool enabled) { _autoDownload = enabled; }
        void setLastCheckedAt(const Wt::WDateTime& dateTime) { _lastCheckedAt = dateTime; }

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _feedUrl, "feed_url");
            Wt::Dbo::field(a, _title, "title");
            Wt::Dbo::field(a, _storageFolderName, "storage_folder_name");
            Wt::Dbo::field(a, _maxItemsToKeep, "max_items_to_keep");
            Wt::Dbo::field(a, _autoDownload, "auto_download");
            Wt::Dbo::field(a, _lastCheckedAt, "last_checked_at");
            Wt::Dbo::field(a, _createdAt, "created_at");

            Wt::Dbo::hasMany(a, _items, Wt::Dbo::ManyToOne, "subscription");
        }

    private:
        friend class Session;
        Subscription(std::string_view feedUrl, std::string_view title, std::string_view storageFolderName);
        static pointer create(Session& session, std::string_view feedUrl, std::string_view title, std::string_view storageFolderName);

        std::string _feedUrl;
        std::string _title;
        std::string _storageFolderName; // derived once at creation, never renamed
        int _maxItemsToKeep{ static_cast<int>(defaultMaxItemsToKeep) };
        bool _autoDownload{ true };
        Wt::WDateTime _lastCheckedAt;
        Wt::WDateTime _createdAt;

        Wt::Dbo::collection<Wt::Dbo::ptr<Item>> _items;
    };
} // namespace podkeep::db
