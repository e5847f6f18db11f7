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

#include "TransferExecutor.hpp"

#include <algorithm>
#include <fstream>
#include <future>
#include <memory>
#include <optional>

#include "core/ILogger.hpp"
#include "core/Path.hpp"
#include "core/SizeLiterals.hpp"
#include "core/String.hpp"
#include "core/http/IClient.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/objects/Download.hpp"
#include "services/downloads/IFileSystemPlanner.hpp"

#include "HttpUtils.hpp"
#include "UrlUtils.hpp"

namespace podkeep::downloads
{
    using namespace core::literals;

    namespace
    {
        enum class StreamResult
        {
            Done,
            AlreadyComplete, // 416 on a resume request
            Failed,
            Cancelled,
            Interrupted,
        };

        // Accessed from the client callbacks only, which are serialized
        struct TransferState
        {
            std::filesystem::path filePath;
            std::uint64_t resumeOffset{};
            std::chrono::steady_clock::time_point deadline;
            TransferExecutor::StopRequestCallback getStopRequest;
            std::function<void(double)> onProgress;

            bool headersHandled{};
            std::ofstream file;
            std::uint64_t totalSize{}; // 0 if unknown
            std::uint64_t downloadedBytes{};
            std::uint64_t lastProgressUpdateBytes{};
            std::uint64_t progressUpdateThreshold{};

            StreamResult result{ StreamResult::Done };
            std::string error;
            std::promise<void> done;
        };

        std::vector<Wt::Http::Message::Header> createHeaders(bool probeSensitiveUrl, std::uint64_t resumeOffset)
        {
            std::vector<Wt::Http::Message::Header> headers;

            // some CDNs only hand out their signed urls to podcast clients
            if (probeSensitiveUrl)
            {
                headers.emplace_back("User-Agent", std::string{ httpUtils::podcastClientUserAgent });
            }
            else
            {
                headers.emplace_back("User-Agent", std::string{ httpUtils::browserUserAgent });
                headers.emplace_back("Accept", "*/*");
                headers.emplace_back("Accept-Language", "en-US,en;q=0.9");
            }

            // byte offsets must match the stored file for resumption
            headers.emplace_back("Accept-Encoding", "identity");

            if (resumeOffset > 0)
                headers.emplace_back("Range", "bytes=" + std::to_string(resumeOffset) + "-");

            return headers;
        }

        std::optional<std::uint64_t> getContentLength(const Wt::Http::Message& msg)
        {
            const std::string* contentLength{ httpUtils::getHeader(msg, "Content-Length") };
            if (!contentLength)
                return std::nullopt;

            return core::stringUtils::readAs<std::uint64_t>(core::stringUtils::stringTrim(*contentLength));
        }

        // Returns true if the transfer has to stop
        bool checkStopRequest(TransferState& state)
        {
            if (!state.getStopRequest)
                return false;

            switch (state.getStopRequest())
            {
            case TransferExecutor::StopRequest::None:
                return false;
            case TransferExecutor::StopRequest::Cancel:
                state.result = StreamResult::Cancelled;
                return true;
            case TransferExecutor::StopRequest::Interrupt:
                state.result = StreamResult::Interrupted;
                return true;
            }

            return false;
        }

        core::http::ClientRequestParameters::ReceiveResult fail(TransferState& state, std::string error)
        {
            state.result = StreamResult::Failed;
            state.error = std::move(error);
            return core::http::ClientRequestParameters::ReceiveResult::Abort;
        }

        core::http::ClientRequestParameters::ReceiveResult onHeaders(TransferState& state, const Wt::Http::Message& msg)
        {
            using ReceiveResult = core::http::ClientRequestParameters::ReceiveResult;

            const int status{ msg.status() };
            if (status >= 300 && status < 400)
                return ReceiveResult::Continue; // redirect being followed by the client

            state.headersHandled = true;

            if (status == 416 && state.resumeOffset > 0)
            {
                state.result = StreamResult::AlreadyComplete;
                return ReceiveResult::Abort;
            }

            if (status != 200 && status != 206)
                return fail(state, "HTTP " + std::to_string(status));

            if (checkStopRequest(state))
                return ReceiveResult::Abort;

            const std::uint64_t contentLength{ getContentLength(msg).value_or(0) };

            std::ios::openmode mode{ std::ios::binary };
            if (status == 206)
            {
                mode |= std::ios::app;
                state.downloadedBytes = state.resumeOffset;
                state.totalSize = contentLength > 0 ? contentLength + state.resumeOffset : 0;
            }
            else
            {
                if (state.resumeOffset > 0)
                    PODKEEP_LOG(TRANSFER, INFO, "Server ignored the range request, restarting " << state.filePath << " from scratch");

                mode |= std::ios::trunc;
                state.downloadedBytes = 0;
                state.totalSize = contentLength;
            }

            state.file.open(state.filePath, mode);
            if (!state.file)
                return fail(state, "Cannot open file '" + state.filePath.string() + "' for writing");

            state.lastProgressUpdateBytes = state.downloadedBytes;
            state.progressUpdateThreshold = TransferExecutor::getProgressUpdateThreshold(state.totalSize);

            return ReceiveResult::Continue;
        }

        core::http::ClientRequestParameters::ReceiveResult onChunk(TransferState& state, std::span<const std::byte> chunk)
        {
            using ReceiveResult = core::http::ClientRequestParameters::ReceiveResult;

            // body of a redirect response
            if (!state.file.is_open())
                return ReceiveResult::Continue;

            if (checkStopRequest(state))
                return ReceiveResult::Abort;

            if (std::chrono::steady_clock::now() > state.deadline)
                return fail(state, "Transfer timed out");

            while (!chunk.empty())
            {
                const std::size_t writeSize{ std::min(chunk.size(), TransferExecutor::chunkSize) };
                state.file.write(reinterpret_cast<const char*>(chunk.data()), static_cast<std::streamsize>(writeSize));
                if (!state.file)
                    return fail(state, "Cannot write to file '" + state.filePath.string() + "'");

                state.downloadedBytes += writeSize;
                chunk = chunk.subspan(writeSize);
            }

            if (state.totalSize > 0 && state.downloadedBytes - state.lastProgressUpdateBytes >= state.progressUpdateThreshold)
            {
                state.onProgress(static_cast<double>(state.downloadedBytes) / static_cast<double>(state.totalSize));
                state.lastProgressUpdateBytes = state.downloadedBytes;
            }

            return ReceiveResult::Continue;
        }

        void onResponse(TransferState& state, const Wt::Http::Message& msg)
        {
            // status not already handled by onHeaders
            if (!state.headersHandled)
            {
                const int status{ msg.status() };
                if (status == 416 && state.resumeOffset > 0)
                    state.result = StreamResult::AlreadyComplete;
                else if (status != 200 && status != 206)
                    fail(state, "HTTP " + std::to_string(status));
                else if (!state.file.is_open())
                    fail(state, "Empty response");
            }
        }
    } // namespace

    TransferExecutor::TransferExecutor(db::IDb& db, IFileSystemPlanner& planner, core::http::IClient& client)
        : _db{ db }
        , _planner{ planner }
        , _client{ client }
    {
    }

    std::uint64_t TransferExecutor::getProgressUpdateThreshold(std::uint64_t totalSize)
    {
        return std::max<std::uint64_t>(totalSize / 20, 5_MiB);
    }

    bool TransferExecutor::isSizeAcceptable(std::uint64_t expectedSize, std::uint64_t actualSize)
    {
        const std::uint64_t difference{ expectedSize > actualSize ? expectedSize - actualSize : actualSize - expectedSize };
        return static_cast<double>(difference) <= static_cast<double>(expectedSize) * sizeTolerance;
    }

    TransferOutcome TransferExecutor::execute(const TransferRequest& request, StopRequestCallback stopRequestCallback)
    {
        const std::optional<std::filesystem::path> filePath{ _planner.resolve(request.relativeFilePath) };
        if (!filePath)
            return markFailed(request, "Invalid destination path '" + request.relativeFilePath.string() + "'");

        if (!core::pathUtils::ensureDirectory(filePath->parent_path()))
            return markFailed(request, "Cannot create directory '" + filePath->parent_path().string() + "'");

        auto state{ std::make_shared<TransferState>() };
        state->filePath = *filePath;
        state->resumeOffset = _planner.getFileSize(request.relativeFilePath).value_or(0);
        state->deadline = std::chrono::steady_clock::now() + request.timeout;
        state->getStopRequest = std::move(stopRequestCallback);
        state->onProgress = [this, downloadId = request.downloadId](double progress) { updateProgress(downloadId, progress); };

        if (state->resumeOffset > 0)
            PODKEEP_LOG(TRANSFER, INFO, "Resuming " << *filePath << " from byte " << state->resumeOffset);

        const bool probeSensitiveUrl{ urlUtils::isProbeSensitiveUrl(request.sourceUrl) };
        std::string url;
        if (probeSensitiveUrl)
        {
            PODKEEP_LOG(TRANSFER, DEBUG, "Signed or tracking url detected, not probing '" << request.sourceUrl << "'");
            url = request.sourceUrl;
        }
        else
        {
            url = httpUtils::resolveRedirects(_client, request.sourceUrl);
        }

        core::http::ClientRequestParameters params;
        params.method = core::http::ClientRequestParameters::Method::GET;
        params.url = url;
        params.headers = createHeaders(probeSensitiveUrl, state->resumeOffset);
        params.timeout = request.timeout;
        params.followRedirects = true;
        params.onHeadersReceived = [state](const Wt::Http::Message& msg) { return onHeaders(*state, msg); };
        params.onChunkReceived = [state](std::span<const std::byte> chunk) { return onChunk(*state, chunk); };
        params.onResponseFunc = [state](const Wt::Http::Message& msg) {
            onResponse(*state, msg);
            state->done.set_value();
        };
        params.onFailureFunc = [state](std::string_view error) {
            fail(*state, "Network error: " + std::string{ error });
            state->done.set_value();
        };
        params.onAbortFunc = [state] {
            // the abort reason is already set, unless aborted from outside
            if (state->result == StreamResult::Done)
                state->result = StreamResult::Interrupted;
            state->done.set_value();
        };

        std::future<void> done{ state->done.get_future() };

        if (!checkStopRequest(*state))
        {
            PODKEEP_LOG(TRANSFER, DEBUG, "Downloading '" << url << "' to " << *filePath);
            _client.sendRequest(std::move(params));
            done.wait();
        }

        state->file.close();

        switch (state->result)
        {
        case StreamResult::Cancelled:
            PODKEEP_LOG(TRANSFER, INFO, "Transfer of " << *filePath << " cancelled");
            discardPartialFile(request);
            return TransferOutcome::Cancelled;

        case StreamResult::Failed:
            return markFailed(request, state->error);

        case StreamResult::Interrupted:
            PODKEEP_LOG(TRANSFER, INFO, "Transfer of " << *filePath << " interrupted");
            return markInterrupted(request);

        case StreamResult::AlreadyComplete:
            PODKEEP_LOG(TRANSFER, INFO, "File " << *filePath << " already complete");
            return markCompleted(request, _planner.getFileSize(request.relativeFilePath).value_or(0));

        case StreamResult::Done:
            break;
        }

        if (state->totalSize > 0 && state->downloadedBytes > state->lastProgressUpdateBytes)
            updateProgress(request.downloadId, static_cast<double>(state->downloadedBytes) / static_cast<double>(state->totalSize));

        const std::optional<std::uint64_t> actualSize{ _planner.getFileSize(request.relativeFilePath) };
        if (!actualSize)
            return markFailed(request, "Downloaded file '" + filePath->string() + "' is missing");

        if (state->totalSize > 0 && *actualSize != state->totalSize)
        {
            const std::string error{ "Size mismatch: expected " + std::to_string(state->totalSize) + ", got " + std::to_string(*actualSize) };
            if (!isSizeAcceptable(state->totalSize, *actualSize))
                return markFailed(request, error);

            PODKEEP_LOG(TRANSFER, WARNING, error << " for " << *filePath << ", within tolerance");
        }

        PODKEEP_LOG(TRANSFER, INFO, "Downloaded " << *filePath << " (" << core::stringUtils::formatByteSize(*actualSize) << ")");
        return markCompleted(request, *actualSize);
    }

    void TransferExecutor::updateProgress(db::DownloadId downloadId, double progress)
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        db::Download::pointer download{ db::Download::find(session, downloadId) };
        if (!download || download->getStatus() != db::DownloadStatus::Downloading)
            return;

        // never goes backwards while downloading
        if (progress > download->getProgress())
            download.modify()->setProgress(progress);
    }

    TransferOutcome TransferExecutor::markCompleted(const TransferRequest& request, std::uint64_t fileSize)
    {
        {
            db::Session& session{ _db.getTLSSession() };
            auto transaction{ session.createWriteTransaction() };

            db::Download::pointer download{ db::Download::find(session, request.downloadId) };
            if (download && download->getStatus() == db::DownloadStatus::Downloading)
            {
                download.modify()->setCompleted(fileSize);
                return TransferOutcome::Completed;
            }
        }

        // cancelled or removed while transferring
        PODKEEP_LOG(TRANSFER, INFO, "Download " << request.downloadId.toString() << " is no longer active, discarding its file");
        discardPartialFile(request);
        return TransferOutcome::Cancelled;
    }

    TransferOutcome TransferExecutor::markFailed(const TransferRequest& request, std::string_view error)
    {
        PODKEEP_LOG(TRANSFER, ERROR, "Transfer of '" << request.sourceUrl << "' failed: " << error);

        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        db::Download::pointer download{ db::Download::find(session, request.downloadId) };
        if (download && download->getStatus() == db::DownloadStatus::Downloading)
        {
            download.modify()->setFailed(error);
            return TransferOutcome::Failed;
        }

        discardPartialFile(request);
        return TransferOutcome::Cancelled;
    }

    TransferOutcome TransferExecutor::markInterrupted(const TransferRequest& request)
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        db::Download::pointer download{ db::Download::find(session, request.downloadId) };
        if (download && download->getStatus() == db::DownloadStatus::Downloading)
            download.modify()->setPending();

        return TransferOutcome::Interrupted;
    }

    void TransferExecutor::discardPartialFile(const TransferRequest& request)
    {
        _planner.deleteFile(request.relativeFilePath);
    }
} // namespace podkeep::downloads
