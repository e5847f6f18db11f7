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

namespace podkeep::db
{
    class IdType
    {
    public:
        using ValueType = long long;

        IdType();
        IdType(ValueType id);

        bool isValid() const;
        std::string toString() const;

        ValueType getValue() const { return _id; }
        auto operator<=>(const IdType& other) const = default;

    private:
        ValueType _id;
    };
} // namespace podkeep::db

#define PODKEEP_DECLARE_IDTYPE(name)                                             \
    namespace podkeep::db                                                        \
    {                                                                            \
        class name : public IdType                                               \
        {                                                                        \
        public:                                                                  \
            using IdType::IdType;                                                \
            auto operator<=>(const name& other) const = default;                 \
        };                                                                       \
    }                                                                            \
    namespace std                                                                \
    {                                                                            \
        template<>                                                               \
        class hash<podkeep::db::name>                                            \
        {                                                                        \
        public:                                                                  \
            size_t operator()(podkeep::db::name id) const                        \
            {                                                                    \
                return std::hash<podkeep::db::name::ValueType>()(id.getValue()); \
            }                                                                    \
        };                                                                       \
    } // ns std
