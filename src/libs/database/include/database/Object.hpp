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

#include <type_traits>

#include <Wt/Dbo/ptr.h>

#include "database/IdType.hpp"

namespace podkeep::db
{
    namespace details
    {
        // throws db::Exception if there is no active write transaction on the session
        void checkWriteAccess(Wt::Dbo::Session* session);
    } // namespace details

    // Const access is always granted, modify() and remove() require a write transaction
    template<typename T>
    class ObjectPtr
    {
    public:
        ObjectPtr() = default;
        ObjectPtr(Wt::Dbo::ptr<T> obj)
            : _dboPtr{ std::move(obj) } {}

        const T* operator->() const { return _dboPtr.get(); }
        operator bool() const { return static_cast<bool>(_dboPtr); }
        bool operator==(const ObjectPtr& other) const = default;

        T* modify()
        {
            details::checkWriteAccess(_dboPtr.session());
            return _dboPtr.modify();
        }

        void remove()
        {
            details::checkWriteAccess(_dboPtr.session());
            _dboPtr.remove();
        }

    private:
        template<typename, typename>
        friend class Object;

        Wt::Dbo::ptr<T> _dboPtr;
    };

    // Base of all persisted objects: exposes a strong typed id instead of the raw dbo one
    template<typename T, typename ObjectIdType>
    class Object : public Wt::Dbo::Dbo<T>
    {
        static_assert(std::is_base_of_v<db::IdType, ObjectIdType> && !std::is_same_v<db::IdType, ObjectIdType>);

    public:
        using pointer = ObjectPtr<T>;
        using IdType = ObjectIdType;

        IdType getId() const { return IdType{ Wt::Dbo::Dbo<T>::id() }; }

    protected:
        // Relations between objects are set up using the underlying dbo pointers
        template<typename Other>
        static const Wt::Dbo::ptr<Other>& getDboPtr(const ObjectPtr<Other>& ptr)
        {
            return ptr._dboPtr;
        }
    };
} // namespace podkeep::db
