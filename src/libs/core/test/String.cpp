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

#include <gtest/gtest.h>

#include <Wt/WDate.h>
#include <Wt/WDateTime.h>
#include <Wt/WTime.h>

#include "core/String.hpp"

namespace jukebox::core::stringUtils::tests
{
    TEST(StringUtils, splitString)
    {
        struct TestCase
        {
            std::string_view input;
            char delimiter;
            std::vector<std::string_view> expectedOutput;
        };

        TestCase tests[]{
            { "submit", ' ', { "submit" } },
            { "", ' ', { "" } },
            { "volume 42", ' ', { "volume", "42" } },
            { "move id 3", ' ', { "move", "id", "3" } },
            { "a  b", ' ', { "a", "", "b" } },
            { " a", ' ', { "", "a" } },
            { "a ", ' ', { "a", "" } },
            { "/usr/bin:/bin", ':', { "/usr/bin", "/bin" } },
            { ":", ':', { "", "" } },
            { "a=b=c", '=', { "a", "b", "c" } },
        };

        for (const TestCase& test : tests)
        {
            const std::vector<std::string_view> res{ splitString(test.input, test.delimiter) };
            EXPECT_EQ(res, test.expectedOutput) << "Input = '" << test.input << "', delim = '" << test.delimiter << "'";
        }
    }

    TEST(StringUtils, joinStrings)
    {
        EXPECT_EQ(joinStrings(std::vector<std::string>{}, " "), "");
        EXPECT_EQ(joinStrings(std::vector<std::string>{ "loadfile" }, " "), "loadfile");
        EXPECT_EQ(joinStrings(std::vector<std::string>{ "loadfile", "http://host/a", "replace" }, " "), "loadfile http://host/a replace");
        EXPECT_EQ(joinStrings(std::vector<std::string>{ "a", "", "b" }, ", "), "a, , b");
    }

    TEST(StringUtils, stringTrim)
    {
        struct TestCase
        {
            std::string_view input;
            std::string_view expectedOutput;
        };

        TestCase tests[]{
            { "", "" },
            { " ", "" },
            { "\r\n", "" },
            { "skip", "skip" },
            { "skip\n", "skip" },
            { "  volume 10 \t", "volume 10" },
            { "\tpause\r\n", "pause" },
        };

        for (const TestCase& test : tests)
            EXPECT_EQ(stringTrim(test.input), test.expectedOutput) << "Input = '" << test.input << "'";

        EXPECT_EQ(stringTrim("--abc--", "-"), "abc");
    }

    TEST(StringUtils, stringCaseInsensitiveContains)
    {
        EXPECT_TRUE(stringCaseInsensitiveContains("Sign in to confirm you are not a bot", "SIGN IN"));
        EXPECT_TRUE(stringCaseInsensitiveContains("HTTP Error 403: Forbidden", "forbidden"));
        EXPECT_TRUE(stringCaseInsensitiveContains("anything", ""));
        EXPECT_TRUE(stringCaseInsensitiveContains("", ""));
        EXPECT_FALSE(stringCaseInsensitiveContains("", "a"));
        EXPECT_FALSE(stringCaseInsensitiveContains("timeout", "forbidden"));
    }

    TEST(StringUtils, readAs_integers)
    {
        EXPECT_EQ(readAs<int>("42"), 42);
        EXPECT_EQ(readAs<int>("-5"), -5);
        EXPECT_EQ(readAs<unsigned>("100"), 100u);
        EXPECT_EQ(readAs<int>(""), std::nullopt);
        EXPECT_EQ(readAs<int>("abc"), std::nullopt);
        EXPECT_EQ(readAs<int>("42a"), std::nullopt);
        EXPECT_EQ(readAs<int>("4 2"), std::nullopt);
    }

    TEST(StringUtils, readAs_floatingPoint)
    {
        ASSERT_TRUE(readAs<double>("12.5").has_value());
        EXPECT_DOUBLE_EQ(*readAs<double>("12.5"), 12.5);
        EXPECT_DOUBLE_EQ(*readAs<double>("0"), 0.);
        EXPECT_EQ(readAs<double>("12.5s"), std::nullopt);
    }

    TEST(StringUtils, readAs_bool)
    {
        EXPECT_EQ(readAs<bool>("1"), true);
        EXPECT_EQ(readAs<bool>("true"), true);
        EXPECT_EQ(readAs<bool>("True"), true);
        EXPECT_EQ(readAs<bool>("0"), false);
        EXPECT_EQ(readAs<bool>("FALSE"), false);
        EXPECT_EQ(readAs<bool>("yes"), std::nullopt);
        EXPECT_EQ(readAs<bool>("untrue"), std::nullopt);
        EXPECT_EQ(readAs<bool>("falsey"), std::nullopt);
        EXPECT_EQ(readAs<bool>(""), std::nullopt);
    }

    TEST(StringUtils, readAs_string)
    {
        EXPECT_EQ(readAs<std::string>(""), "");
        EXPECT_EQ(readAs<std::string>("two words"), "two words");
    }

    TEST(StringUtils, readAs_enum)
    {
        enum class MyEnum
        {
            A = 1,
            B = 2,
        };

        EXPECT_EQ(readAs<MyEnum>("2"), MyEnum::B);
        EXPECT_EQ(readAs<MyEnum>("B"), std::nullopt);
    }

    TEST(StringUtils, toISO8601String)
    {
        EXPECT_EQ(toISO8601String(Wt::WDateTime{}), "");
        EXPECT_EQ(toISO8601String(Wt::WDateTime{ Wt::WDate{ 2025, 3, 7 }, Wt::WTime{ 9, 5, 2, 31 } }), "2025-03-07T09:05:02.031Z");
    }
} // namespace jukebox::core::stringUtils::tests
