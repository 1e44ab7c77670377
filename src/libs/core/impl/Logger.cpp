/*
 * Copyright (C) 2013 Emeric Poupon
 *
 * This file is part of Guidkit.
 *
 * Guidkit is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Guidkit is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Guidkit.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "Logger.hpp"

#include <Wt/WDateTime.h>

#include <cassert>
#include <cerrno>
#include <fstream>
#include <iostream>
#include <system_error>
#include <thread>

#include "core/Exception.hpp"
#include "core/String.hpp"

namespace guidkit::core::logging
{
    const char* getModuleName(Module mod)
    {
        switch (mod)
        {
        case Module::CODEGEN:
            return "CODEGEN";
        case Module::MAIN:
            return "MAIN";
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
        for (Severity severity : { Severity::FATAL, Severity::ERROR, Severity::WARNING, Severity::INFO, Severity::DEBUG })
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
        assert(_logger.isSeverityActive(_severity));
        _logger.processLog(*this);
    }

    std::string Log::getMessage() const
    {
        return _oss.str();
    }

    std::ostream& operator<<(std::ostream& os, const Log& log)
    {
        return os << "[" << getSeverityName(log.getSeverity()) << "] [" << getModuleName(log.getModule()) << "] " << log.getMessage();
    }

    std::unique_ptr<ILogger> createLogger(Severity minSeverity, const std::filesystem::path& logFilePath)
    {
        return std::make_unique<Logger>(minSeverity, logFilePath);
    }

    Logger::OutputStream::OutputStream(std::ostream& os)
        : stream{ os }
    {
    }

    Logger::Logger(Severity minSeverity, const std::filesystem::path& logFilePath)
        : _minSeverity{ minSeverity }
        , _fileOutput{ _logFile }
        , _standardOutput{ std::cout }
        , _errorOutput{ std::cerr }
    {
        if (!logFilePath.empty())
        {
            _logFile.open(logFilePath, std::ios::out | std::ios::app);
            if (!_logFile.is_open())
            {
                const std::error_code ec{ errno, std::generic_category() };
                throw GuidkitException{ "Cannot open log file '" + logFilePath.string() + "' for writing: " + ec.message() };
            }
        }
    }

    Logger::~Logger() = default;

    bool Logger::isSeverityActive(Severity severity) const
    {
        // FATAL is the lowest value
        return severity <= _minSeverity;
    }

    Logger::OutputStream& Logger::getOutputStream(Severity severity)
    {
        if (_logFile.is_open())
            return _fileOutput;

        return severity >= Severity::INFO ? _standardOutput : _errorOutput;
    }

    void Logger::processLog(const Log& log)
    {
        assert(isSeverityActive(log.getSeverity())); // should have been filtered out by a isSeverityActive call
        OutputStream& output{ getOutputStream(log.getSeverity()) };
        const Wt::WDateTime now{ Wt::WDateTime::currentDateTime() };

        const std::scoped_lock lock{ output.mutex };
        output.stream << stringUtils::toISO8601String(now) << " " << std::this_thread::get_id() << " " << log << std::endl;
    }
} // namespace guidkit::core::logging
