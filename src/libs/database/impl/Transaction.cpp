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

#include "database/Transaction.hpp"

#include <exception>

#include "TransactionChecker.hpp"

namespace podkeep::db
{
    WriteTransaction::WriteTransaction(std::recursive_mutex& mutex, Wt::Dbo::Session& session)
        : _lock{ mutex }
        , _transaction{ session }
    {
        TransactionChecker::push(TransactionChecker::TransactionType::Write, _transaction.session());
    }

    WriteTransaction::~WriteTransaction()
    {
        TransactionChecker::pop(TransactionChecker::TransactionType::Write, _transaction.session());
        // Not committing here when unwinding: the Wt transaction rolls back on destruction
        if (std::uncaught_exceptions() == 0)
            _transaction.commit();
    }

    ReadTransaction::ReadTransaction(Wt::Dbo::Session& session)
        : _transaction{ session }
    {
        TransactionChecker::push(TransactionChecker::TransactionType::Read, _transaction.session());
    }

    ReadTransaction::~ReadTransaction()
    {
        TransactionChecker::pop(TransactionChecker::TransactionType::Read, _transaction.session());
    }
} // namespace podkeep::db
