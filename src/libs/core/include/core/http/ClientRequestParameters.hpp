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

#include <chrono>
#include <cstddef>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <Wt/Http/Message.h>

namespace podkeep::core::http
{
    struct ClientRequestParameters
    {
        enum class Method
        {
            GET,
            HEAD,
        };

        Method method{ Method::GET };
        std::string url; // absolute
        std::vector<Wt::Http::Message::Header> headers;
        std::chrono::seconds timeout{ 30 };
        bool followRedirects{ true };
        std::size_t responseBufferSize{ 10 * 1024 * 1024 }; // only used if onChunkReceived is not set

        enum class ReceiveResult
        {
            Continue,
            Abort, // onAbortFunc will be called
        };

        // Called once the status line and headers are known, before any body chunk
        using OnHeadersReceived = std::function<ReceiveResult(const Wt::Http::Message& msg)>;
        OnHeadersReceived onHeadersReceived;

        // If `onChunkReceived` is set, the response will be streamed in chunks.
        // In that case, `onResponseFunc` is still called at the end (with an empty body).
        // If `onChunkReceived` is not set, the response will be fully buffered and passed to `onResponseFunc`.
        using OnChunkReceived = std::function<ReceiveResult(std::span<const std::byte> chunk)>;
        OnChunkReceived onChunkReceived;

        // Called for any received response, whatever its status
        using OnResponseFunc = std::function<void(const Wt::Http::Message& msg)>;
        OnResponseFunc onResponseFunc;

        // Transport level failure: bad url, connection error, timeout...
        using OnFailureFunc = std::function<void(std::string_view error)>;
        OnFailureFunc onFailureFunc;

        using OnAbortFunc = std::function<void()>;
        OnAbortFunc onAbortFunc;
    };
} // namespace podkeep::core::http
