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

// Wt::Dbo sql_value_traits for the column types that Wt does not support natively

#include <filesystem>
#include <string>
#include <type_traits>

#include <Wt/Dbo/SqlStatement.h>
#include <Wt/Dbo/StdSqlTraits.h>

#include "database/IdType.hpp"

namespace podkeep::db::traits
{
    template<typename T>
    concept StrongId = std::is_base_of_v<IdType, T> && !std::is_same_v<IdType, T>;
} // namespace podkeep::db::traits

namespace Wt::Dbo
{
    // Strong ids are stored as their underlying integer
    template<podkeep::db::traits::StrongId T>
    struct sql_value_traits<T, void>
    {
        using ValueTraits = sql_value_traits<typename T::ValueType>;
        static const bool specialized = true;

        static std::string type(SqlConnection* conn, int size)
        {
            return ValueTraits::type(conn, size);
        }

        static void bind(const T& id, SqlStatement* statement, int column, int size)
        {
            ValueTraits::bind(id.getValue(), statement, column, size);
        }

        static bool read(T& id, SqlStatement* statement, int column, int size)
        {
            typename T::ValueType value{};
            const bool notNull{ ValueTraits::read(value, statement, column, size) };
            id = notNull ? T{ value } : T{};
            return notNull;
        }
    };

    // Paths are stored as strings, using the native encoding
    template<>
    struct sql_value_traits<std::filesystem::path>
    {
        static const bool specialized = true;

        static std::string type(SqlConnection* conn, int size)
        {
            return sql_value_traits<std::string>::type(conn, size);
        }

        static void bind(const std::filesystem::path& path, SqlStatement* statement, int column, int size)
        {
            sql_value_traits<std::string>::bind(path.native(), statement, column, size);
        }

        static bool read(std::filesystem::path& path, SqlStatement* statement, int column, int size)
        {
            std::string str;
            const bool notNull{ sql_value_traits<std::string>::read(str, statement, column, size) };
            path = notNull ? std::filesystem::path{ std::move(str) } : std::filesystem::path{};
            return notNull;
        }
    };
} // namespace Wt::Dbo
