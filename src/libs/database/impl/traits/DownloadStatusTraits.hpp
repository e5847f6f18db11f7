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

#include <optional>
#include <string>

#include <Wt/Dbo/SqlStatement.h>
#include <Wt/Dbo/SqlTraits.h>
#include <Wt/Dbo/StdSqlTraits.h>

#include "database/Types.hpp"

namespace Wt::Dbo
{
    // Stored as its text token
    template<>
    struct sql_value_traits<podkeep::db::DownloadStatus>
    {
        static std::string type(SqlConnection* conn, int size)
        {
            return sql_value_traits<std::string>::type(conn, size);
        }

        static void bind(podkeep::db::DownloadStatus status, SqlStatement* statement, int column, int /* size */)
        {
            statement->bind(column, std::string{ podkeep::db::toString(status) });
        }

        static bool read(podkeep::db::DownloadStatus& status, SqlStatement* statement, int column, int size)
        {
            std::string s;
            if (!statement->getResult(column, &s, size))
                return false;

            const std::optional<podkeep::db::DownloadStatus> res{ podkeep::db::downloadStatusFromString(s) };
            if (!res)
                throw podkeep::db::Exception{ "Unexpected download status '" + s + "' in database" };

            status = *res;
            return true;
        }
    };
} // namespace Wt::Dbo
