/*
 * Copyright (C) 2024 Emeric Poupon
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

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"
#include "core/StreamLogger.hpp"

namespace guidkit::core::logging::tests
{
    TEST(Logger, parseSeverity)
    {
        EXPECT_EQ(parseSeverity("debug"), Severity::DEBUG);
        EXPECT_EQ(parseSeverity("INFO"), Severity::INFO);
        EXPECT_EQ(parseSeverity("Warning"), Severity::WARNING);
        EXPECT_EQ(parseSeverity("error"), Severity::ERROR);
        EXPECT_EQ(parseSeverity("fatal"), Severity::FATAL);
        EXPECT_EQ(parseSeverity(""), std::nullopt);
        EXPECT_EQ(parseSeverity("verbose"), std::nullopt);
    }

    TEST(Logger, streamLogger)
    {
        std::ostringstream oss;
        {
            Service<ILogger> logger{ std::make_unique<StreamLogger>(oss) };

            GUIDKIT_LOG(CODEGEN, INFO, "value = " << 42);
            GUIDKIT_LOG(CODEGEN, DEBUG, "filtered out");
            GUIDKIT_LOG_IF(MAIN, WARNING, false, "filtered out");
            GUIDKIT_LOG_IF(MAIN, WARNING, true, "kept");
        }

        EXPECT_EQ(oss.str(), "[info] [CODEGEN] value = 42\n[warning] [MAIN] kept\n");
    }

    TEST(Logger, noLogger)
    {
        ASSERT_FALSE(Service<ILogger>::exists());

        bool evaluated{};
        GUIDKIT_LOG(MAIN, ERROR, (evaluated = true));
        EXPECT_FALSE(evaluated);
    }

    TEST(Logger, file)
    {
        const std::filesystem::path logFilePath{ std::filesystem::temp_directory_path() / "guidkit-test-logger.log" };
        std::filesystem::remove(logFilePath);

        {
            Service<ILogger> logger{ createLogger(Severity::WARNING, logFilePath) };
            EXPECT_FALSE(logger->isSeverityActive(Severity::INFO));
            EXPECT_TRUE(logger->isSeverityActive(Severity::WARNING));
            EXPECT_TRUE(logger->isSeverityActive(Severity::FATAL));

            GUIDKIT_LOG(MAIN, WARNING, "something happened");
            GUIDKIT_LOG(MAIN, INFO, "filtered out");
        }

        std::ifstream logFile{ logFilePath };
        std::stringstream content;
        content << logFile.rdbuf();

        EXPECT_NE(content.str().find("[warning] [MAIN] something happened\n"), std::string::npos);
        EXPECT_EQ(content.str().find("filtered out"), std::string::npos);

        std::filesystem::remove(logFilePath);
    }

    TEST(Logger, minSeverity)
    {
        const std::unique_ptr<ILogger> logger{ createLogger(Severity::DEBUG) };
        for (Severity severity : { Severity::FATAL, Severity::ERROR, Severity::WARNING, Severity::INFO, Severity::DEBUG })
            EXPECT_TRUE(logger->isSeverityActive(severity)) << getSeverityName(severity);

        const std::unique_ptr<ILogger> fatalLogger{ createLogger(Severity::FATAL) };
        EXPECT_TRUE(fatalLogger->isSeverityActive(Severity::FATAL));
        EXPECT_FALSE(fatalLogger->isSeverityActive(Severity::ERROR));
        EXPECT_FALSE(fatalLogger->isSeverityActive(Severity::DEBUG));
    }

    TEST(Logger, concurrentWrites)
    {
        constexpr std::size_t threadCount{ 8 };
        constexpr std::size_t logCount{ 100 };

        std::ostringstream oss;
        {
            Service<ILogger> logger{ std::make_unique<StreamLogger>(oss) };

            std::vector<std::thread> threads;
            for (std::size_t i{}; i < threadCount; ++i)
            {
                threads.emplace_back([] {
                    for (std::size_t j{}; j < logCount; ++j)
                        GUIDKIT_LOG(CODEGEN, INFO, "line " << j);
                });
            }

            for (std::thread& thread : threads)
                thread.join();
        }

        std::istringstream iss{ oss.str() };
        std::size_t lineCount{};
        for (std::string line; std::getline(iss, line); ++lineCount)
            ASSERT_EQ(line.rfind("[info] [CODEGEN] line ", 0), 0) << line;

        EXPECT_EQ(lineCount, threadCount * logCount);
    }

    TEST(Logger, badFile)
    {
        EXPECT_THROW(createLogger(Severity::INFO, "/nonexistent-guidkit-dir/test.log"), GuidkitException);
    }
} // namespace guidkit::core::logging::tests
