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

#include "FileSystemPlanner.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <system_error>

#include "core/ILogger.hpp"
#include "core/Path.hpp"
#include "core/String.hpp"
#include "services/downloads/Exception.hpp"

#include "UrlUtils.hpp"

namespace podkeep::downloads
{
    namespace
    {
        constexpr std::size_t maxTitleLength{ 150 };
        constexpr std::string_view unnamed{ "unnamed" };

        std::filesystem::path normalizeRootPath(const std::filesystem::path& rootPath)
        {
            std::error_code ec;
            std::filesystem::path res{ std::filesystem::weakly_canonical(std::filesystem::absolute(rootPath), ec) };
            if (ec)
                throw Exception{ "Cannot resolve download root '" + rootPath.string() + "': " + ec.message() };

            return res;
        }

        std::filesystem::path getFolderRelativePath(std::string_view storageFolderName)
        {
            return std::filesystem::path{ storageFolderName.empty() ? std::string{ unnamed } : std::string{ storageFolderName } };
        }

        // Lower case ascii transliterations of U+00C0 to U+00FF, empty for the symbols
        constexpr std::array<std::string_view, 64> latin1Transliterations{
            "a", "a", "a", "a", "a", "a", "ae", "c", "e", "e", "e", "e", "i", "i", "i", "i",
            "d", "n", "o", "o", "o", "o", "o", "", "o", "u", "u", "u", "u", "y", "th", "ss",
            "a", "a", "a", "a", "a", "a", "ae", "c", "e", "e", "e", "e", "i", "i", "i", "i",
            "d", "n", "o", "o", "o", "o", "o", "", "o", "u", "u", "u", "u", "y", "th", "y"
        };

        // Returns the length of the utf-8 sequence at the start of str, 0 if invalid
        std::size_t decodeUtf8(std::string_view str, char32_t& codePoint)
        {
            const unsigned char lead{ static_cast<unsigned char>(str.front()) };

            std::size_t length{};
            if (lead < 0x80)
            {
                codePoint = lead;
                return 1;
            }
            if ((lead & 0xE0) == 0xC0)
            {
                length = 2;
                codePoint = lead & 0x1F;
            }
            else if ((lead & 0xF0) == 0xE0)
            {
                length = 3;
                codePoint = lead & 0x0F;
            }
            else if ((lead & 0xF8) == 0xF0)
            {
                length = 4;
                codePoint = lead & 0x07;
            }
            else
            {
                return 0;
            }

            if (str.size() < length)
                return 0;

            for (std::size_t i{ 1 }; i < length; ++i)
            {
                const unsigned char c{ static_cast<unsigned char>(str[i]) };
                if ((c & 0xC0) != 0x80)
                    return 0;
                codePoint = (codePoint << 6) | (c & 0x3F);
            }

            return length;
        }

        bool isApostrophe(char32_t codePoint)
        {
            return codePoint == U'\'' || codePoint == U'\u2018' || codePoint == U'\u2019';
        }

        // Slug text of a non ascii code point, empty if it acts as a separator
        std::string_view getSlugText(char32_t codePoint, std::string_view utf8Sequence)
        {
            if (codePoint < 0xC0)
                return {}; // controls and latin-1 symbols

            if (codePoint <= 0xFF)
                return latin1Transliterations[codePoint - 0xC0];

            const bool isSeparator{ (codePoint >= 0x2000 && codePoint <= 0x2BFF)  // punctuation, arrows, math and misc symbols
                                    || (codePoint >= 0x3000 && codePoint <= 0x303F) // cjk punctuation
                                    || (codePoint >= 0xD800 && codePoint <= 0xDFFF) // surrogates
                                    || (codePoint >= 0xFE30 && codePoint <= 0xFE4F) // cjk compatibility forms
                                    || (codePoint >= 0xFF00 && codePoint <= 0xFF0F) // fullwidth punctuation
                                    || (codePoint >= 0xFF1A && codePoint <= 0xFF20)
                                    || (codePoint >= 0xFF3B && codePoint <= 0xFF40)
                                    || (codePoint >= 0xFF5B && codePoint <= 0xFF65)
                                    || (codePoint >= 0x1F000 && codePoint <= 0x1FAFF) }; // emojis
            if (isSeparator)
                return {};

            return utf8Sequence;
        }

        bool fileExists(const std::filesystem::path& path)
        {
            std::error_code ec;
            const bool exists{ std::filesystem::exists(path, ec) };
            if (ec)
                PODKEEP_LOG(FILESYSTEM, WARNING, "Cannot check " << path << ": " << ec.message());

            return exists;
        }
    } // namespace

    std::unique_ptr<IFileSystemPlanner> createFileSystemPlanner(const std::filesystem::path& rootPath)
    {
        return std::make_unique<FileSystemPlanner>(rootPath);
    }

    std::string sanitizeFolderName(std::string_view name)
    {
        std::string replaced;
        replaced.reserve(name.size());
        for (const char c : name)
        {
            switch (c)
            {
            case '<':
            case '>':
            case ':':
            case '"':
            case '/':
            case '\\':
            case '|':
            case '?':
            case '*':
                replaced.push_back('-');
                break;
            default:
                replaced.push_back(c);
            }
        }

        const std::string_view trimmed{ core::stringUtils::stringTrim(replaced, ". ") };

        // collapse runs of hyphens and whitespaces into a single hyphen
        std::string res;
        res.reserve(trimmed.size());
        bool inSeparatorRun{};
        for (const char c : trimmed)
        {
            if (c == '-' || std::isspace(static_cast<unsigned char>(c)))
            {
                if (!inSeparatorRun)
                    res.push_back('-');
                inSeparatorRun = true;
                continue;
            }

            inSeparatorRun = false;
            res.push_back(c);
        }

        if (res.empty())
            res = unnamed;

        return res;
    }

    std::string slugify(std::string_view name, std::size_t maxLength)
    {
        std::string res;
        res.reserve(std::min(name.size(), maxLength));

        bool pendingHyphen{};
        // never cuts a utf-8 sequence, returns false once maxLength is reached
        auto append{ [&](std::string_view text) {
            const bool addHyphen{ pendingHyphen && !res.empty() };
            if (res.size() + text.size() + (addHyphen ? 1 : 0) > maxLength)
                return false;

            if (addHyphen)
                res.push_back('-');
            pendingHyphen = false;
            res.append(text);
            return true;
        } };

        for (std::size_t pos{}; pos < name.size();)
        {
            char32_t codePoint{};
            const std::size_t length{ decodeUtf8(name.substr(pos), codePoint) };
            if (length == 0)
            {
                pendingHyphen = true;
                ++pos;
                continue;
            }

            const std::string_view sequence{ name.substr(pos, length) };
            pos += length;

            if (isApostrophe(codePoint))
                continue;

            std::string_view text;
            char lowerChar{};
            if (codePoint < 0x80)
            {
                if (std::isalnum(static_cast<unsigned char>(codePoint)))
                {
                    lowerChar = static_cast<char>(std::tolower(static_cast<unsigned char>(codePoint)));
                    text = std::string_view{ &lowerChar, 1 };
                }
            }
            else
            {
                text = getSlugText(codePoint, sequence);
            }

            if (text.empty())
                pendingHyphen = true;
            else if (!append(text))
                break;
        }

        return res;
    }

    FileSystemPlanner::FileSystemPlanner(const std::filesystem::path& rootPath)
        : _rootPath{ normalizeRootPath(rootPath) }
    {
        if (!core::pathUtils::ensureDirectory(_rootPath))
            throw Exception{ "Cannot create download root '" + _rootPath.string() + "'" };

        PODKEEP_LOG(FILESYSTEM, INFO, "Download root is " << _rootPath);
    }

    std::filesystem::path FileSystemPlanner::folderFor(std::string_view storageFolderName)
    {
        const std::filesystem::path relativePath{ getFolderRelativePath(storageFolderName) };
        const std::filesystem::path absolutePath{ resolveFolder(relativePath) };

        if (!core::pathUtils::ensureDirectory(absolutePath))
            throw Exception{ "Cannot create storage folder '" + absolutePath.string() + "'" };

        return relativePath;
    }

    std::filesystem::path FileSystemPlanner::pathFor(const ItemFileInfo& item, std::string_view storageFolderName, const IsPathTakenCallback& isPathTaken) const
    {
        const std::filesystem::path folderPath{ getFolderRelativePath(storageFolderName) };
        const std::filesystem::path absoluteFolderPath{ resolveFolder(folderPath) };

        const Wt::WDate date{ item.publishedAt.isValid() ? item.publishedAt.date() : Wt::WDate::currentDate() };

        std::string titlePart{ slugify(item.title, maxTitleLength) };
        if (titlePart.empty())
            titlePart = unnamed;

        const std::string baseName{ date.toString("yyyy-MM-dd").toUTF8() + "-" + titlePart };
        const std::string extension{ "." + urlUtils::getFileExtension(item.sourceUrl, item.mimeType) };

        auto isTaken{ [&](const std::string& fileName) {
            return (isPathTaken && isPathTaken(folderPath / fileName)) || fileExists(absoluteFolderPath / fileName);
        } };

        std::string fileName{ baseName + extension };
        for (std::size_t suffix{ 2 }; isTaken(fileName); ++suffix)
            fileName = baseName + "-" + std::to_string(suffix) + extension;

        return folderPath / fileName;
    }

    std::filesystem::path FileSystemPlanner::resolveFolder(const std::filesystem::path& relativeFolderPath) const
    {
        const std::optional<std::filesystem::path> absolutePath{ resolve(relativeFolderPath) };
        if (!absolutePath)
            throw Exception{ "Storage folder '" + relativeFolderPath.string() + "' is outside of the download root" };

        return *absolutePath;
    }

    std::uint64_t FileSystemPlanner::availableSpace() const
    {
        std::error_code ec;
        const std::filesystem::space_info spaceInfo{ std::filesystem::space(_rootPath, ec) };
        if (ec)
        {
            PODKEEP_LOG(FILESYSTEM, ERROR, "Cannot get available space for " << _rootPath << ": " << ec.message());
            return 0;
        }

        return spaceInfo.available;
    }

    std::optional<std::filesystem::path> FileSystemPlanner::resolve(const std::filesystem::path& relativePath) const
    {
        if (relativePath.empty() || relativePath.is_absolute())
            return std::nullopt;

        std::error_code ec;
        const std::filesystem::path resolvedPath{ std::filesystem::weakly_canonical(_rootPath / relativePath, ec) };
        if (ec)
            return std::nullopt;

        // strictly inside the root
        if (resolvedPath == _rootPath || !core::pathUtils::isPathInRootPath(resolvedPath, _rootPath))
        {
            PODKEEP_LOG(FILESYSTEM, WARNING, "Rejected path " << relativePath << ": not inside " << _rootPath);
            return std::nullopt;
        }

        return resolvedPath;
    }

    std::optional<std::uint64_t> FileSystemPlanner::getFileSize(const std::filesystem::path& relativePath) const
    {
        const std::optional<std::filesystem::path> absolutePath{ resolve(relativePath) };
        if (!absolutePath)
            return std::nullopt;

        std::error_code ec;
        if (!std::filesystem::is_regular_file(*absolutePath, ec))
            return std::nullopt;

        const std::uintmax_t fileSize{ std::filesystem::file_size(*absolutePath, ec) };
        if (ec)
        {
            PODKEEP_LOG(FILESYSTEM, ERROR, "Cannot get size of " << *absolutePath << ": " << ec.message());
            return std::nullopt;
        }

        return fileSize;
    }

    std::uint64_t FileSystemPlanner::getFolderSize(std::string_view storageFolderName) const
    {
        const std::optional<std::filesystem::path> folderPath{ resolve(std::filesystem::path{ std::string{ storageFolderName } }) };
        if (!folderPath)
            return 0;

        std::uint64_t totalSize{};

        std::error_code ec;
        std::filesystem::recursive_directory_iterator itPath{ *folderPath, std::filesystem::directory_options::skip_permission_denied, ec };
        for (; !ec && itPath != std::filesystem::recursive_directory_iterator{}; itPath.increment(ec))
        {
            std::error_code fileEc;
            if (!itPath->is_regular_file(fileEc))
                continue;

            const std::uintmax_t fileSize{ itPath->file_size(fileEc) };
            if (!fileEc)
                totalSize += fileSize;
        }

        if (ec && ec != std::errc::no_such_file_or_directory)
            PODKEEP_LOG(FILESYSTEM, ERROR, "Cannot iterate " << *folderPath << ": " << ec.message());

        return totalSize;
    }

    bool FileSystemPlanner::deleteFile(const std::filesystem::path& relativePath)
    {
        const std::optional<std::filesystem::path> absolutePath{ resolve(relativePath) };
        if (!absolutePath)
            return false;

        std::error_code ec;
        if (!std::filesystem::exists(*absolutePath, ec))
        {
            PODKEEP_LOG(FILESYSTEM, DEBUG, "File " << *absolutePath << " does not exist, nothing to delete");
            return false;
        }

        if (!std::filesystem::is_regular_file(*absolutePath, ec))
        {
            PODKEEP_LOG(FILESYSTEM, WARNING, "Not deleting " << *absolutePath << ": not a regular file");
            return false;
        }

        std::filesystem::remove(*absolutePath, ec);
        if (ec)
        {
            PODKEEP_LOG(FILESYSTEM, ERROR, "Cannot delete " << *absolutePath << ": " << ec.message());
            return false;
        }

        PODKEEP_LOG(FILESYSTEM, DEBUG, "Deleted " << *absolutePath);
        return true;
    }

    std::size_t FileSystemPlanner::cleanupEmptyDirectories()
    {
        std::size_t removedCount{};

        std::error_code ec;
        std::filesystem::directory_iterator itPath{ _rootPath, ec };
        for (; !ec && itPath != std::filesystem::directory_iterator{}; itPath.increment(ec))
        {
            const std::filesystem::path& path{ itPath->path() };

            std::error_code dirEc;
            if (!itPath->is_directory(dirEc) || !std::filesystem::is_empty(path, dirEc) || dirEc)
                continue;

            if (std::filesystem::remove(path, dirEc))
            {
                PODKEEP_LOG(FILESYSTEM, DEBUG, "Removed empty directory " << path);
                removedCount++;
            }
            else if (dirEc)
            {
                PODKEEP_LOG(FILESYSTEM, WARNING, "Cannot remove directory " << path << ": " << dirEc.message());
            }
        }

        if (ec)
            PODKEEP_LOG(FILESYSTEM, ERROR, "Cannot iterate " << _rootPath << ": " << ec.message());

        return removedCount;
    }
} // namespace podkeep::downloads
