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

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <Wt/WDateTime.h>

namespace podkeep::downloads
{
    // What is needed to plan the destination of an item
    struct ItemFileInfo
    {
        std::string title;
        Wt::WDateTime publishedAt; // may be invalid, today is used instead
        std::string sourceUrl;
        std::string mimeType;
    };

    // Path computation and storage accounting under a single root directory
    // Relative paths are always relative to the root directory
    class IFileSystemPlanner
    {
    public:
        virtual ~IFileSystemPlanner() = default;

        virtual const std::filesystem::path& getRootPath() const = 0;

        // Returns the relative folder of the subscription, created if needed
        virtual std::filesystem::path folderFor(std::string_view storageFolderName) = 0;

        // Returns true if the relative path is already assigned to another item
        using IsPathTakenCallback = std::function<bool(const std::filesystem::path& relativePath)>;
        // "YYYY-MM-DD-title.ext", relative to the root. Nothing is created on disk
        // "-2", "-3"... are appended to the title part while the path is taken or a file already exists there
        virtual std::filesystem::path pathFor(const ItemFileInfo& item, std::string_view storageFolderName, const IsPathTakenCallback& isPathTaken) const = 0;

        // Free bytes on the filesystem that holds the root directory
        virtual std::uint64_t availableSpace() const = 0;

        // Returns std::nullopt if the relative path escapes the root directory
        virtual std::optional<std::filesystem::path> resolve(const std::filesystem::path& relativePath) const = 0;
        virtual std::optional<std::uint64_t> getFileSize(const std::filesystem::path& relativePath) const = 0;
        // Total size of the regular files in the subscription folder
        virtual std::uint64_t getFolderSize(std::string_view storageFolderName) const = 0;

        // Best effort, never throw
        virtual bool deleteFile(const std::filesystem::path& relativePath) = 0;
        // Removes the empty subscription folders, returns the number of removed folders
        virtual std::size_t cleanupEmptyDirectories() = 0;
    };

    std::unique_ptr<IFileSystemPlanner> createFileSystemPlanner(const std::filesystem::path& rootPath);

    // Filesystem safe folder name, kept human readable ("My Show: Live!" -> "My-Show-Live!")
    std::string sanitizeFolderName(std::string_view name);
    // Lower case slug, at most maxLength bytes ("Hello, World!" -> "hello-world")
    // Latin-1 accented letters are transliterated ("Épisode" -> "episode"), other non ascii letters are kept
    std::string slugify(std::string_view name, std::size_t maxLength);
} // namespace podkeep::downloads
