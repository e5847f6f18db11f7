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

namespace Wt::Dbo
{
    class Session;
}

namespace podkeep::db
{
    // Tracks the transactions opened by the current thread
    // Accessing objects outside of a suitable transaction throws an Exception
    class TransactionChecker
    {
    public:
        enum class TransactionType
        {
            Read,
            Write,
        };

        static void push(TransactionType type, const Wt::Dbo::Session& session);
        static void pop(TransactionType type, const Wt::Dbo::Session& session) noexcept;

        // read transactions nested in a write one keep write access
        static void checkWriteTransaction(const Wt::Dbo::Session& session);
        static void checkReadTransaction(const Wt::Dbo::Session& session);
    };
} // namespace podkeep::db
