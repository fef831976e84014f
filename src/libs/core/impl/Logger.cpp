/*
 * Copyright (C) 2025 Emeric Poupon
 *
 * This file is part of Jukebox.
 *
 * Jukebox is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Jukebox is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Jukebox.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "Logger.hpp"

#include <Wt/WDateTime.h>

#include <cassert>
#include <iostream>
#include <thread>

#include "core/Exception.hpp"
#include "core/String.hpp"

namespace jukebox::core::logging
{
    const char* getModuleName(Module mod)
    {
        switch (mod)
        {
        case Module::CHILDPROCESS:
            return "CHILDPROC";
        case Module::HTTP:
            return "HTTP";
        case Module::MAIN:
            return "MAIN";
        case Module::PLAYBACK:
            return "PLAYBACK";
        case Module::PLAYER:
            return "PLAYER";
        case Module::QUEUE:
            return "QUEUE";
        case Module::RESOLVER:
            return "RESOLVER";
        case Module::SERVICE:
            return "SERVICE";
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

    Severity parseSeverity(std::string_view str)
    {
        for (Severity severity : { Severity::DEBUG, Severity::INFO, Severity::WARNING, Severity::ERROR, Severity::FATAL })
        {
            if (str == getSeverityName(severity))
                return severity;
        }

        throw JukeboxException{ "Invalid log severity '" + std::string{ str } + "'" };
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

    std::unique_ptr<ILogger> createLogger(Severity minSeverity, const std::filesystem::path& logFilePath)
    {
        return std::make_unique<Logger>(minSeverity, logFilePath);
    }

    Logger::Logger(Severity minSeverity, const std::filesystem::path& logFilePath)
        : _minSeverity{ minSeverity }
    {
        if (logFilePath.empty())
            return;

        _logFileStream = std::make_unique<std::ofstream>(logFilePath, std::ios::out | std::ios::app);
        if (!_logFileStream->is_open())
        {
            const std::error_code ec{ errno, std::generic_category() };
            throw JukeboxException{ "Cannot open log file '" + logFilePath.string() + "' for writing: " + ec.message() };
        }
    }

    Logger::~Logger() = default;

    bool Logger::isSeverityActive(Severity severity) const
    {
        return severity <= _minSeverity;
    }

    void Logger::processLog(const Log& log)
    {
        // console: warnings and errors on stderr
        std::ostream& stream{ _logFileStream ? *_logFileStream : (log.getSeverity() >= Severity::INFO ? std::cout : std::cerr) };
        const Wt::WDateTime now{ Wt::WDateTime::currentDateTime() };

        const std::scoped_lock lock{ _mutex };
        stream << stringUtils::toISO8601String(now) << " " << std::this_thread::get_id() << " [" << getSeverityName(log.getSeverity()) << "] [" << getModuleName(log.getModule()) << "] " << log.getMessage() << std::endl;
    }
} // namespace jukebox::core::logging
