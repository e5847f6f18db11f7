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

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <Wt/Dbo/Field.h>
#include <Wt/WDateTime.h>

#include "database/Object.hpp"
#include "database/Types.hpp"
#include "database/objects/ItemId.hpp"
#include "database/objects/SubscriptionId.hpp"

namespace podkeep::db
{
    class Session;
    class Subscription;

    // A single episode of a subscription
    class Item final : public Object<Item, ItemId>
    {
    public:
        struct FindParameters
        {
            ItemSortMode sortMode{ ItemSortMode::None };
            SubscriptionId subscription; // if set, only items from this subscription
            std::optional<Range> range;

            FindParameters& setSortMode(ItemSortMode _sortMode)
            {
                sortMode = _sortMode;
                return *this;
            }
            FindParameters& setSubscription(SubscriptionId _subscription)
            {
                subscription = _subscription;
                return *this;
            }
            FindParameters& setRange(const std::optional<Range>& _range)
            {
                range = _range;
                return *this;
            }
        };

        Item() = default;
        static std::size_t getCount(Session& session);
        static pointer find(Session& session, ItemId id);
        static pointer find(Session& session, std::string_view guid);
        static void find(Session& session, const FindParameters& params, std::function<void(const pointer&)> func);

        // getters
        std::string_view getGuid() const { return _guid; }
        std::string_view getTitle() const { return _title; }
        std::string_view getDescription() const { return _description; }
        std::string_view getSourceUrl() const { return _sourceUrl; }
        std::string_view getMimeType() const { return _mimeType; }
        std::optional<std::uint64_t> getDeclaredSize() const;
        const Wt::WDateTime& getPublishedAt() const { return _publishedAt; } // may be invalid
        std::optional<int> getEpisodeNumber() const;
        std::optional<int> getSeasonNumber() const;
        std::chrono::seconds getDuration() const { return std::chrono::seconds{ _durationSecs }; }
        const Wt::WDateTime& getCreatedAt() const { return _createdAt; }
        ObjectPtr<Subscription> getSubscription() const;
        SubscriptionId getSubscriptionId() const;

        // setters
        void setTitle(std::string_view title) { _title = title; }
        void setDescription(std::string_view description) { _description = description; }
        void setSourceUrl(std::string_view sourceUrl) { _sourceUrl = sourceUrl; }
        void setMimeType(std::string_view mimeType) { _mimeType = mimeType; }
        void setDeclaredSize(std::optional<std::uint64_t> size) { _declaredSize = size ? static_cast<long long>(*size) : 0; }
        void setPublishedAt(const Wt::WDateTime& publishedAt) { _publishedAt = publishedAt; }
        void setEpisodeNumber(std::optional<int> number) { _episodeNumber = number.value_or(0); }
        void setSeasonNumber(std::optional<int> number) { _seasonNumber = number.value_or(0); }
        void setDuration(std::chrono::seconds duration) { _durationSecs = static_cast<int>(duration.count()); }

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _guid, "guid");
            Wt::Dbo::field(a, _title, "title");
            Wt::Dbo::field(a, _description, "description");
            Wt::Dbo::field(a, _sourceUrl, "source_url");
            Wt::Dbo::field(a, _mimeType, "mime_type");
            Wt::Dbo::field(a, _declaredSize, "declared_size");
            Wt::Dbo::field(a, _publishedAt, "published_at");
            Wt::Dbo::field(a, _episodeNumber, "episode_number");
            Wt::Dbo::field(a, _seasonNumber, "season_number");
            Wt::Dbo::field(a, _durationSecs, "duration");
            Wt::Dbo::field(a, _createdAt, "created_at");

            Wt::Dbo::belongsTo(a, _subscription, "subscription", Wt::Dbo::OnDeleteCascade | Wt::Dbo::NotNull);
        }

    private:
        friend class Session;
        Item(ObjectPtr<Subscription> subscription, std::string_view guid);
        static pointer create(Session& session, ObjectPtr<Subscription> subscription, std::string_view guid);

        std::string _guid; // globally unique
        std::string _title;
        std::string _description;
        std::string _sourceUrl;
        std::string _mimeType;
        long long _declaredSize{}; // 0 if unknown
        Wt::WDateTime _publishedAt;
        int _episodeNumber{}; // 0 if unknown
        int _seasonNumber{};  // 0 if unknown
        int _durationSecs{};
        Wt::WDateTime _createdAt;

        Wt::Dbo::ptr<Subscription> _subscription;
    };
} // namespace podkeep::db
