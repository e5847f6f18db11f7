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

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace Wt
{
    class WDateTime;
} // namespace Wt

namespace podkeep::core::stringUtils
{
    [[nodiscard]] std::string_view stringTrim(std::string_view str, std::string_view whitespaces = " \t\r");

    [[nodiscard]] std::string stringToLower(std::string_view str);

    [[nodiscard]] bool stringCaseInsensitiveEqual(std::string_view strA, std::string_view strB);
    [[nodiscard]] bool stringCaseInsensitiveContains(std::string_view str, std::string_view strToFind);

    // Integral values must span the whole string
    template<typename T>
    [[nodiscard]] std::optional<T> readAs(std::string_view str)
    {
        static_assert(std::is_integral_v<T>);

        T res{};
        const char* const end{ str.data() + str.size() };
        const auto [ptr, ec]{ std::from_chars(str.data(), end, res) };
        if (ec != std::errc{} || ptr != end)
            return std::nullopt;

        return res;
    }

    template<>
    [[nodiscard]] std::optional<std::string> readAs(std::string_view str);

    // "1"/"true" and "0"/"false", case insensitive
    template<>
    [[nodiscard]] std::optional<bool> readAs(std::string_view str);

    // UTC, millisecond precision, empty if the date time is invalid
    [[nodiscard]] std::string toISO8601String(const Wt::WDateTime& dateTime);

    // "1.5 GB", "12.0 MB", "512 B"
    [[nodiscard]] std::string formatByteSize(std::uint64_t bytes);
} // namespace podkeep::core::stringUtils
