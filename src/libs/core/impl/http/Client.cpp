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

#include "Client.hpp"

#include <cassert>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/error.hpp>

#include "core/ILogger.hpp"

#define LOG(sev, message) PODKEEP_LOG(HTTP, sev, "[Http Client] - " << message)

namespace podkeep::core::http
{
    namespace
    {
        const char* methodToString(ClientRequestParameters::Method method)
        {
            switch (method)
            {
            case ClientRequestParameters::Method::GET:
                return "GET";
            case ClientRequestParameters::Method::HEAD:
                return "HEAD";
            }
            return "";
        }
    } // namespace

    std::unique_ptr<IClient> createClient(boost::asio::io_context& ioContext)
    {
        return std::make_unique<Client>(ioContext);
    }

    Client::Client(boost::asio::io_context& ioContext)
        : _ioContext{ ioContext }
    {
    }

    Client::~Client()
    {
        abortAllRequests();
    }

    void Client::sendRequest(ClientRequestParameters&& parameters)
    {
        auto request{ std::make_unique<OngoingRequest>() };
        request->parameters = std::move(parameters);
        request->client = std::make_unique<Wt::Http::Client>(_ioContext);

        OngoingRequest& ongoingRequest{ *request };
        const ClientRequestParameters& params{ ongoingRequest.parameters };
        Wt::Http::Client& client{ *ongoingRequest.client };

        client.setFollowRedirect(params.followRedirects);
        client.setTimeout(params.timeout);
        client.setMaximumResponseSize(params.onChunkReceived ? 0 : params.responseBufferSize);

        // response data is copied for each callback, but Wt's code already makes copies anyway
        if (params.onHeadersReceived)
        {
            client.headersReceived().connect([this, &ongoingRequest](Wt::Http::Message msg) {
                boost::asio::post(boost::asio::bind_executor(_strand, [this, &ongoingRequest, msg = std::move(msg)] {
                    onHeadersReceived(ongoingRequest, msg);
                }));
            });
        }

        if (params.onChunkReceived)
        {
            client.bodyDataReceived().connect([this, &ongoingRequest](const std::string& data) {
                boost::asio::post(boost::asio::bind_executor(_strand, [this, &ongoingRequest, data] {
                    onBodyDataReceived(ongoingRequest, data);
                }));
            });
        }

        client.done().connect([this, &ongoingRequest](Wt::AsioWrapper::error_code ec, const Wt::Http::Message& msg) {
            boost::asio::post(boost::asio::bind_executor(_strand, [this, &ongoingRequest, ec, msg] {
                onDone(ongoingRequest, ec, msg);
            }));
        });

        {
            std::scoped_lock lock{ _mutex };
            _ongoingRequests.emplace(&ongoingRequest, std::move(request));
        }

        LOG(DEBUG, "Sending " << methodToString(params.method) << " request to url '" << params.url << "'");

        bool res{};
        switch (params.method)
        {
        case ClientRequestParameters::Method::GET:
            res = client.get(params.url, params.headers);
            break;

        case ClientRequestParameters::Method::HEAD:
            res = client.head(params.url, params.headers);
            break;
        }

        if (!res)
        {
            LOG(ERROR, "Send failed for url '" << params.url << "', bad url or unsupported scheme?");
            boost::asio::post(boost::asio::bind_executor(_strand, [this, &ongoingRequest] {
                if (ongoingRequest.parameters.onFailureFunc)
                    ongoingRequest.parameters.onFailureFunc("bad url or unsupported scheme");
                removeRequest(ongoingRequest);
            }));
        }
    }

    void Client::abortAllRequests()
    {
        std::unique_lock lock{ _mutex };
        if (_ongoingRequests.empty())
            return;

        LOG(DEBUG, "Aborting " << _ongoingRequests.size() << " requests...");
        for (auto& [ptr, request] : _ongoingRequests)
        {
            boost::asio::post(boost::asio::bind_executor(_strand, [client = request->client.get()] {
                client->abort();
            }));
        }

        _requestsCv.wait(lock, [this] { return _ongoingRequests.empty(); });
        LOG(DEBUG, "All requests aborted!");
    }

    void Client::onHeadersReceived(OngoingRequest& request, const Wt::Http::Message& msg)
    {
        assert(_strand.running_in_this_thread());

        if (request.parameters.onHeadersReceived(msg) == ClientRequestParameters::ReceiveResult::Abort)
        {
            LOG(DEBUG, "Request to '" << request.parameters.url << "' aborted after headers, status = " << msg.status());
            request.client->abort();
        }
    }

    void Client::onBodyDataReceived(OngoingRequest& request, const std::string& data)
    {
        assert(_strand.running_in_this_thread());

        const auto byteSpan{ std::as_bytes(std::span{ data.data(), data.size() }) };
        if (request.parameters.onChunkReceived(byteSpan) == ClientRequestParameters::ReceiveResult::Abort)
            request.client->abort();
    }

    void Client::onDone(OngoingRequest& request, Wt::AsioWrapper::error_code ec, const Wt::Http::Message& msg)
    {
        assert(_strand.running_in_this_thread());

        const ClientRequestParameters& params{ request.parameters };
        LOG(DEBUG, "Request to '" << params.url << "' done. ec = " << ec.message() << " (" << ec.value() << "), status = " << msg.status());

        if (ec == boost::asio::error::operation_aborted)
        {
            if (params.onAbortFunc)
                params.onAbortFunc();
        }
        else if (ec && (ec != boost::asio::ssl::error::stream_truncated))
        {
            LOG(WARNING, "Request to '" << params.url << "' failed: " << ec.message());
            if (params.onFailureFunc)
                params.onFailureFunc(ec.message());
        }
        else if (params.onResponseFunc)
        {
            params.onResponseFunc(msg);
        }

        removeRequest(request);
    }

    void Client::removeRequest(OngoingRequest& request)
    {
        std::unique_ptr<OngoingRequest> removedRequest;
        {
            std::scoped_lock lock{ _mutex };

            auto itRequest{ _ongoingRequests.find(&request) };
            if (itRequest == std::end(_ongoingRequests))
            {
                PODKEEP_LOG(HTTP, ERROR, "Cannot find finished request in ongoing requests");
                return;
            }
            removedRequest = std::move(itRequest->second);
            _ongoingRequests.erase(itRequest);
        }
        _requestsCv.notify_all();

        // the Wt client may still be unwinding the done() signal, destroy it later
        boost::asio::post(_ioContext, [removedRequest = std::move(removedRequest)] {});
    }
} // namespace podkeep::core::http
