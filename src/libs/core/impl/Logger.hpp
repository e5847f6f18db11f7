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

#include <array>
#include <filesystem>
#include <fstream>
#include <iosfwd>
#include <mutex>

#include "core/ILogger.hpp"

namespace podkeep::core::logging
{
    // Writes logs either to a file, or to stdout/stderr depending on the severity
    class Logger final : public ILogger
    {
    public:
        Logger(Severity minSeverity, const std::filesystem::path& logFilePath);
        ~Logger() override = default;
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

    private:
        bool isSeverityActive(Severity severity) const override;
        void processLog(const Log& log) override;
        void processLog(Module module, Severity severity, std::string_view message) override;

        struct Sink
        {
            std::ostream* stream{};
            std::mutex mutex;
        };
        Sink& getSink(Severity severity);

        const Severity _minSeverity;
        std::ofstream _logFile;
        Sink _fileSink;
        Sink _stdoutSink;
        Sink _stderrSink;
    };
} // namespace podkeep::core::logging
