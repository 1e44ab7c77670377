/*
 * Copyright (C) 2019 Emeric Poupon
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

#pragma once

#include <filesystem>
#include <fstream>
#include <iosfwd>
#include <mutex>

#include "core/ILogger.hpp"

namespace guidkit::core::logging
{
    // Console: debug and info go to stdout, the rest to stderr
    // File: every severity goes to the log file
    class Logger final : public ILogger
    {
    public:
        Logger(Severity minSeverity, const std::filesystem::path& logFilePath);
        ~Logger() override;

    private:
        bool isSeverityActive(Severity severity) const override;
        void processLog(const Log& log) override;

        struct OutputStream
        {
            explicit OutputStream(std::ostream& os);

            std::ostream& stream;
            std::mutex mutex;
        };
        OutputStream& getOutputStream(Severity severity);

        const Severity _minSeverity;
        std::ofstream _logFile;
        OutputStream _fileOutput;
        OutputStream _standardOutput;
        OutputStream _errorOutput;
    };
} // namespace guidkit::core::logging
