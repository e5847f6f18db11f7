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

#include "core/Path.hpp"

#include <iterator>

#include "core/ILogger.hpp"

namespace podkeep::core::pathUtils
{
    bool ensureDirectory(const std::filesystem::path& dir)
    {
        std::error_code ec;
        if (std::filesystem::exists(dir, ec))
            return std::filesystem::is_directory(dir, ec);

        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            PODKEEP_LOG(FILESYSTEM, ERROR, "Cannot create directory '" << dir.string() << "': " << ec.message());
            return false;
        }

        return true;
    }

    bool isPathInRootPath(const std::filesystem::path& path, const std::filesystem::path& rootPath)
    {
        // compare component by component, a trailing separator on the root yields an empty last component
        auto rootIt{ rootPath.begin() };
        auto rootEnd{ rootPath.end() };
        if (rootIt != rootEnd && std::prev(rootEnd)->empty())
            --rootEnd;

        auto pathIt{ path.begin() };
        for (; rootIt != rootEnd; ++rootIt, ++pathIt)
        {
            if (pathIt == path.end() || *pathIt != *rootIt)
                return false;
        }

        return true;
    }
} // namespace podkeep::core::pathUtils
