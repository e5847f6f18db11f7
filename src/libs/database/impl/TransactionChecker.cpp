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

#include "TransactionChecker.hpp"

#include <algorithm>
#include <vector>

#include "database/Types.hpp"

namespace podkeep::db
{
    namespace
    {
        struct OpenedTransaction
        {
            TransactionChecker::TransactionType type;
            const Wt::Dbo::Session* session{};
        };

        thread_local std::vector<OpenedTransaction> openedTransactions;

        bool hasTransaction(const Wt::Dbo::Session& session, bool writeOnly)
        {
            return std::any_of(std::cbegin(openedTransactions), std::cend(openedTransactions), [&](const OpenedTransaction& transaction) {
                return transaction.session == &session && (!writeOnly || transaction.type == TransactionChecker::TransactionType::Write);
            });
        }
    } // namespace

    void TransactionChecker::push(TransactionType type, const Wt::Dbo::Session& session)
    {
        openedTransactions.push_back(OpenedTransaction{ type, &session });
    }

    void TransactionChecker::pop(TransactionType type, const Wt::Dbo::Session& session) noexcept
    {
        // transactions are scoped, the last matching one is the one being closed
        auto it{ std::find_if(std::rbegin(openedTransactions), std::rend(openedTransactions), [&](const OpenedTransaction& transaction) {
            return transaction.type == type && transaction.session == &session;
        }) };

        if (it != std::rend(openedTransactions))
            openedTransactions.erase(std::next(it).base());
    }

    void TransactionChecker::checkWriteTransaction(const Wt::Dbo::Session& session)
    {
        if (!hasTransaction(session, true))
            throw Exception{ "Write access outside of a write transaction" };
    }

    void TransactionChecker::checkReadTransaction(const Wt::Dbo::Session& session)
    {
        if (!hasTransaction(session, false))
            throw Exception{ "Read access outside of a transaction" };
    }
} // namespace podkeep::db
