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
#include <string>

#include "core/Exception.hpp"

namespace podkeep::downloads
{
    class Exception : public core::PodkeepException
    {
    public:
        using core::PodkeepException::PodkeepException;
    };

    // Requested item, subscription or download does not exist
    class NotFoundException : public Exception
    {
    public:
        using Exception::Exception;
    };

    class InsufficientStorageException : public Exception
    {
    public:
        InsufficientStorageException(std::uint64_t requiredBytes, std::uint64_t availableBytes);

        std::uint64_t getRequiredBytes() const { return _requiredBytes; }
        std::uint64_t getAvailableBytes() const { return _availableBytes; }

    private:
        std::uint64_t _requiredBytes;
        std::uint64_t _availableBytes;
    };
} // namespace podkeep::downloads
