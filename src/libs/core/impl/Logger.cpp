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

#include "Logger.hpp"

#include <array>
#include <iostream>
#include <thread>

#include <Wt/WDateTime.h>

#include "core/Exception.hpp"
#include "core/String.hpp"

namespace podkeep::core::logging
{
    const char* getModuleName(Module mod)
    {
        switch (mod)
        {
        case Module::CONFIG:
            return "CONFIG";
        case Module::CONSUMPTION:
            return "CONSUMPTION";
        case Module::DB:
            return "DB";
        case Module::DISCOVERY:
            return "DISCOVERY";
        case Module::DOWNLOAD:
            return "DOWNLOAD";
        case Module::FILESYSTEM:
            return "FILESYSTEM";
        case Module::HTTP:
            return "HTTP";
        case Module::MAIN:
            return "MAIN";
        case Module::RETENTION:
            return "RETENTION";
        case Module::SCHEDULER:
            return "SCHEDULER";
        case Module::TRANSFER:
            return "TRANSFER";
        case Module::UTILS:
            return "UTILS";
        }
        return "";
    }

    const char* getSeverityName(Severity sev)
    {
        switch (sev)
        {
        case Severity::FATAL:
            return "fatal";
        case Severity::ERROR:
            return "error";
        case Severity::WARNING:
            return "warning";
        case Severity::INFO:
            return "info";
        case Severity::DEBUG:
            return "debug";
        }
        return "";
    }

    std::optional<Severity> parseSeverity(std::string_view str)
    {
        constexpr std::array<Severity, 5> severities{ Severity::FATAL, Severity::ERROR, Severity::WARNING, Severity::INFO, Severity::DEBUG };

        for (const Severity severity : severities)
        {
            if (stringUtils::stringCaseInsensitiveEqual(str, getSeverityName(severity)))
                return severity;
        }

        return std::nullopt;
    }

    Log::Log(ILogger& logger, Module module, Severity severity)
        : _logger{ logger }
        , _module{ module }
        , _severity{ severity }
    {
    }

    Log::~Log()
    {
        _logger.processLog(*this);
    }

    std::string Log::getMessage() const
    {
        return _oss.str();
    }

    std::unique_ptr<ILogger> createLogger(Severity minSeverity, const std::filesystem::path& logFilePath)
    {
        return std::make_unique<Logger>(minSeverity, logFilePath);
    }

    Logger::Logger(Severity minSeverity, const std::filesystem::path& logFilePath)
        : _minSeverity{ minSeverity }
    {
        _stdoutSink.stream = &std::cout;
        _stderrSink.stream = &std::cerr;

        if (!logFilePath.empty())
        {
            _logFile.open(logFilePath, std::ios::out | std::ios::app);
            if (!_logFile.is_open())
            {
                const std::error_code ec{ errno, std::generic_category() };
                throw PodkeepException{ "Cannot open log file '" + logFilePath.string() + "' for writing: " + ec.message() };
            }
            _fileSink.stream = &_logFile;
        }
    }

    Logger::Sink& Logger::getSink(Severity severity)
    {
        if (_fileSink.stream)
            return _fileSink;

        return (severity == Severity::DEBUG || severity == Severity::INFO) ? _stdoutSink : _stderrSink;
    }

    bool Logger::isSeverityActive(Severity severity) const
    {
        // lower values are more severe
        return static_cast<int>(severity) <= static_cast<int>(_minSeverity);
    }

    void Logger::processLog(const Log& log)
    {
        processLog(log.getModule(), log.getSeverity(), log.getMessage());
    }

    void Logger::processLog(Module module, Severity severity, std::string_view message)
    {
        if (!isSeverityActive(severity))
            return;

        const std::string timestamp{ stringUtils::toISO8601String(Wt::WDateTime::currentDateTime()) };

        Sink& sink{ getSink(severity) };
        const std::scoped_lock lock{ sink.mutex };
        *sink.stream << timestamp << " " << std::this_thread::get_id() << " [" << getSeverityName(severity) << "] [" << getModuleName(module) << "] " << message << std::endl;
    }
} // namespace podkeep::core::logging
