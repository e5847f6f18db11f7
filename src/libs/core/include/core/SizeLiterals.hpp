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

// Binary size suffixes, usable as "5_MiB"
namespace podkeep::core::literals
{
    namespace details
    {
        constexpr std::uint64_t kibi{ 1024 };
    }

    constexpr std::uint64_t operator""_KiB(unsigned long long int count)
    {
        return count * details::kibi;
    }

    constexpr std::uint64_t operator""_MiB(unsigned long long int count)
    {
        return count * details::kibi * details::kibi;
    }

    constexpr std::uint64_t operator""_GiB(unsigned long long int count)
    {
        return count * details::kibi * details::kibi * details::kibi;
    }

    static_assert(1_GiB == 1073741824);
} // namespace podkeep::core::literals
