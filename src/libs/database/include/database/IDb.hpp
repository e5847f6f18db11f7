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

#include <cstddef>
#include <filesystem>
#include <memory>

namespace podkeep::db
{
    class Session;

    class IDb
    {
    public:
        virtual ~IDb() = default;

        // One session per thread, created on first use
        virtual Session& getTLSSession() = 0;
    };

    enum class IntegrityCheck
    {
        None,
        Quick, // errors are only logged
        Full,  // integrity and foreign keys, throws on error
    };

    struct DbParameters
    {
        // at least one per thread that may access the database at the same time
        std::size_t connectionCount{ 10 };
        IntegrityCheck integrityCheck{ IntegrityCheck::Quick };
        bool showQueries{};
    };

    std::unique_ptr<IDb> createDb(const std::filesystem::path& dbPath, const DbParameters& params = {});
} // namespace podkeep::db
