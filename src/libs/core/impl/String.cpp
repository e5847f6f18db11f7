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

#include "core/String.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>

#include <Wt/WDateTime.h>

namespace podkeep::core::stringUtils
{
    namespace
    {
        char toLowerChar(char c)
        {
            return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    } // namespace

    template<>
    std::optional<std::string> readAs(std::string_view str)
    {
        return std::string{ str };
    }

    template<>
    std::optional<bool> readAs(std::string_view str)
    {
        if (str == "1" || stringCaseInsensitiveEqual(str, "true"))
            return true;
        if (str == "0" || stringCaseInsensitiveEqual(str, "false"))
            return false;

        return std::nullopt;
    }

    std::string_view stringTrim(std::string_view str, std::string_view whitespaces)
    {
        const std::size_t first{ str.find_first_not_of(whitespaces) };
        if (first == std::string_view::npos)
            return {};

        const std::size_t last{ str.find_last_not_of(whitespaces) };
        return str.substr(first, last - first + 1);
    }

    std::string stringToLower(std::string_view str)
    {
        std::string res(str.size(), '\0');
        std::transform(std::cbegin(str), std::cend(str), std::begin(res), toLowerChar);
        return res;
    }

    bool stringCaseInsensitiveEqual(std::string_view strA, std::string_view strB)
    {
        return std::equal(std::cbegin(strA), std::cend(strA), std::cbegin(strB), std::cend(strB),
                          [](char a, char b) { return toLowerChar(a) == toLowerChar(b); });
    }

    bool stringCaseInsensitiveContains(std::string_view str, std::string_view strToFind)
    {
        const auto it{ std::search(std::cbegin(str), std::cend(str), std::cbegin(strToFind), std::cend(strToFind),
                                   [](char a, char b) { return toLowerChar(a) == toLowerChar(b); }) };
        return it != std::cend(str) || strToFind.empty();
    }

    std::string toISO8601String(const Wt::WDateTime& dateTime)
    {
        if (!dateTime.isValid())
            return {};

        return dateTime.toString("yyyy-MM-ddThh:mm:ss.zzz", false).toUTF8() + 'Z';
    }

    std::string formatByteSize(std::uint64_t bytes)
    {
        constexpr std::array<const char*, 5> units{ "B", "KB", "MB", "GB", "TB" };

        if (bytes < 1024)
            return std::to_string(bytes) + " B";

        double size{ static_cast<double>(bytes) };
        std::size_t unit{};
        while (size >= 1024.0 && unit + 1 < units.size())
        {
            size /= 1024.0;
            ++unit;
        }

        std::array<char, 32> buffer{};
        std::snprintf(buffer.data(), buffer.size(), "%.1f %s", size, units[unit]);
        return buffer.data();
    }
} // namespace podkeep::core::stringUtils
