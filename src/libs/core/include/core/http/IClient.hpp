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

#include <memory>

#include <boost/asio/io_context.hpp>

#include "core/http/ClientRequestParameters.hpp"

namespace podkeep::core::http
{
    // Asynchronous HTTP client, requests are run concurrently
    // Exactly one of onResponseFunc, onFailureFunc or onAbortFunc is called for each request
    class IClient
    {
    public:
        virtual ~IClient() = default;

        virtual void sendRequest(ClientRequestParameters&& parameters) = 0;

        // Blocks until all ongoing requests are aborted
        virtual void abortAllRequests() = 0;
    };

    std::unique_ptr<IClient> createClient(boost::asio::io_context& ioContext);
} // namespace podkeep::core::http
