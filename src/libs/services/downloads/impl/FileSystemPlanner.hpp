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

#include "services/downloads/IFileSystemPlanner.hpp"

namespace podkeep::downloads
{
    class FileSystemPlanner : public IFileSystemPlanner
    {
    public:
        FileSystemPlanner(const std::filesystem::path& rootPath);
        ~FileSystemPlanner() override = default;
        FileSystemPlanner(const FileSystemPlanner&) = delete;
        FileSystemPlanner& operator=(const FileSystemPlanner&) = delete;

    private:
        const std::filesystem::path& getRootPath() const override { return _rootPath; }

        std::filesystem::path folderFor(std::string_view storageFolderName) override;
        std::filesystem::path pathFor(const ItemFileInfo& item, std::string_view storageFolderName, const IsPathTakenCallback& isPathTaken) const override;
        std::uint64_t availableSpace() const override;
        std::optional<std::filesystem::path> resolve(const std::filesystem::path& relativePath) const override;
        std::optional<std::uint64_t> getFileSize(const std::filesystem::path& relativePath) const override;
        std::uint64_t getFolderSize(std::string_view storageFolderName) const override;
        bool deleteFile(const std::filesystem::path& relativePath) override;
        std::size_t cleanupEmptyDirectories() override;

        // Throws if the folder escapes the root
        std::filesystem::path resolveFolder(const std::filesystem::path& relativeFolderPath) const;

        const std::filesystem::path _rootPath;
    };
} // namespace podkeep::downloads
