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
#include <string_view>
#include <vector>

#include <Wt/Dbo/Call.h>
#include <Wt/Dbo/Query.h>
#include <Wt/Dbo/Session.h>
#include <Wt/Dbo/collection.h>
#include <Wt/WDateTime.h>

#include "database/Types.hpp"

namespace podkeep::db::utils
{
    // Truncated to the second, as stored in the database
    Wt::WDateTime normalizeDateTime(const Wt::WDateTime& dateTime);
    Wt::WDateTime now();

    template<typename Query>
    void applyRange(Query& query, std::optional<Range> range)
    {
        if (!range)
            return;

        query.limit(static_cast<int>(range->size));
        if (range->offset != 0)
            query.offset(static_cast<int>(range->offset));
    }

    template<typename Query, typename UnaryFunc>
    void forEachQueryResult(const Query& query, UnaryFunc&& func)
    {
        const auto results{ query.resultList() };
        for (auto it{ results.begin() }; it != results.end(); ++it)
            func(*it);
    }

    template<typename Query, typename UnaryFunc>
    void forEachQueryRangeResult(Query& query, std::optional<Range> range, UnaryFunc&& func)
    {
        applyRange(query, range);
        forEachQueryResult(query, std::forward<UnaryFunc>(func));
    }

    template<typename Query>
    auto fetchQueryResults(const Query& query)
    {
        auto results{ query.resultList() };

        using ResultType = typename decltype(results)::value_type;
        return std::vector<ResultType>(results.begin(), results.end());
    }

    template<typename Query>
    auto fetchQuerySingleResult(const Query& query)
    {
        return query.resultValue();
    }

    // Statement with positional parameters
    template<typename... Args>
    void executeCommand(Wt::Dbo::Session& session, std::string_view command, const Args&... args)
    {
        Wt::Dbo::Call call{ session.execute(std::string{ command }) };
        (call.bind(args), ...);
        call.run();
    }
} // namespace podkeep::db::utils
