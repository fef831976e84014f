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

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"
#include "core/Random.hpp"
#include "core/Service.hpp"
#include "core/StreamLogger.hpp"

namespace jukebox::core::logging::tests
{
    TEST(Logger, parseSeverity)
    {
        EXPECT_EQ(parseSeverity("debug"), Severity::DEBUG);
        EXPECT_EQ(parseSeverity("info"), Severity::INFO);
        EXPECT_EQ(parseSeverity("warning"), Severity::WARNING);
        EXPECT_EQ(parseSeverity("error"), Severity::ERROR);
        EXPECT_EQ(parseSeverity("fatal"), Severity::FATAL);

        EXPECT_THROW(parseSeverity(""), JukeboxException);
        EXPECT_THROW(parseSeverity("verbose"), JukeboxException);
        EXPECT_THROW(parseSeverity("DEBUG"), JukeboxException);
    }

    TEST(Logger, streamLogger)
    {
        std::ostringstream oss;
        Service<ILogger> logger{ std::make_unique<StreamLogger>(oss, Severity::INFO) };

        JUKEBOX_LOG(QUEUE, INFO, "Queued item " << 42);
        JUKEBOX_LOG(PLAYER, DEBUG, "not logged");
        JUKEBOX_LOG_IF(PLAYBACK, ERROR, false, "not logged either");
        JUKEBOX_LOG_IF(PLAYBACK, ERROR, true, "Load failed");

        const std::string output{ oss.str() };
        EXPECT_NE(output.find("[info] [QUEUE] Queued item 42"), std::string::npos) << output;
        EXPECT_NE(output.find("[error] [PLAYBACK] Load failed"), std::string::npos) << output;
        EXPECT_EQ(output.find("not logged"), std::string::npos) << output;
    }

    TEST(Logger, logFile)
    {
        const std::filesystem::path logFilePath{ std::filesystem::temp_directory_path() / ("jukebox-test-" + random::generateHexToken(8) + ".log") };

        {
            Service<ILogger> logger{ createLogger(Severity::WARNING, logFilePath) };

            JUKEBOX_LOG(PLAYER, WARNING, "Player not responsive");
            JUKEBOX_LOG(PLAYER, INFO, "not logged");
        }

        std::ifstream ifs{ logFilePath };
        const std::string content{ std::istreambuf_iterator<char>{ ifs }, std::istreambuf_iterator<char>{} };
        std::filesystem::remove(logFilePath);

        EXPECT_NE(content.find("[warning] [PLAYER] Player not responsive"), std::string::npos) << content;
        EXPECT_EQ(content.find("not logged"), std::string::npos) << content;
    }

    TEST(Logger, logFileCannotBeOpened)
    {
        EXPECT_THROW(createLogger(Severity::INFO, "/nonexistent/dir/jukebox.log"), JukeboxException);
    }

    TEST(Logger, noLogger)
    {
        ASSERT_FALSE(Service<ILogger>::exists());

        // must be a no-op
        JUKEBOX_LOG(MAIN, FATAL, "nobody listens");
    }
} // namespace jukebox::core::logging::tests
