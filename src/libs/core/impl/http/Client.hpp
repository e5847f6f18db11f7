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

#include <condition_variable>
#include <memory>
#include <mutex>
#include <unordered_map>

#include <boost/asio/io_context.hpp>
#include <boost/asio/io_context_strand.hpp>
#include <Wt/Http/Client.h>

#include "core/http/IClient.hpp"

namespace podkeep::core::http
{
    class Client final : public IClient
    {
    public:
        Client(boost::asio::io_context& ioContext);
        ~Client() override;
        Client(const Client&) = delete;
        Client& operator=(const Client&) = delete;

    private:
        void sendRequest(ClientRequestParameters&& parameters) override;
        void abortAllRequests() override;

        struct OngoingRequest
        {
            ClientRequestParameters parameters;
            std::unique_ptr<Wt::Http::Client> client;
        };

        void onHeadersReceived(OngoingRequest& request, const Wt::Http::Message& msg);
        void onBodyDataReceived(OngoingRequest& request, const std::string& data);
        void onDone(OngoingRequest& request, Wt::AsioWrapper::error_code ec, const Wt::Http::Message& msg);
        void removeRequest(OngoingRequest& request);

        boost::asio::io_context& _ioContext;
        boost::asio::io_context::strand _strand{ _ioContext };

        std::mutex _mutex;
        std::condition_variable _requestsCv;
        std::unordered_map<OngoingRequest*, std::unique_ptr<OngoingRequest>> _ongoingRequests;
    };
} // namespace podkeep::core::http
