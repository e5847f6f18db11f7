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

#include "database/Object.hpp"

#include "database/Types.hpp"

#include "TransactionChecker.hpp"

namespace podkeep::db
{
    void details::checkWriteAccess(Wt::Dbo::Session* session)
    {
        if (!session)
            throw Exception{ "Cannot modify an object that is not attached to a session" };

        TransactionChecker::checkWriteTransaction(*session);
    }
} // namespace podkeep::db
