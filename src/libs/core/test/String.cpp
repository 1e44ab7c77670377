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

#include <gtest/gtest.h>

#include <Wt/WDate.h>
#include <Wt/WDateTime.h>
#include <Wt/WTime.h>

#include "core/String.hpp"

namespace guidkit::core::stringUtils::tests
{
    TEST(StringUtils, splitString)
    {
        struct TestCase
        {
            std::string_view input;
            std::string_view delimiter;
            std::vector<std::string_view> expectedOutput;
        };

        const TestCase tests[]{
            { "", "", { "" } },
            { "abc", "", { "abc" } },
            { "abc", "::", { "abc" } },
            { "a::b", "::", { "a", "b" } },
            { "a::b::c", "::", { "a", "b", "c" } },
            { "::a", "::", { "", "a" } },
            { "a::", "::", { "a", "" } },
            { "a::::b", "::", { "a", "", "b" } },
            { "a:b", "::", { "a:b" } },
            { ":::", "::", { "", ":" } },
        };

        for (const TestCase& test : tests)
        {
            const std::vector<std::string_view> res{ splitString(test.input, test.delimiter) };
            EXPECT_EQ(res, test.expectedOutput) << "Input = '" << test.input << "', delim = '" << test.delimiter << "'";
        }
    }

    TEST(StringUtils, stringCaseInsensitiveEqual)
    {
        EXPECT_TRUE(stringCaseInsensitiveEqual("", ""));
        EXPECT_TRUE(stringCaseInsensitiveEqual("debug", "DEBUG"));
        EXPECT_TRUE(stringCaseInsensitiveEqual("WaRnInG", "warning"));
        EXPECT_FALSE(stringCaseInsensitiveEqual("info", "infos"));
        EXPECT_FALSE(stringCaseInsensitiveEqual("info", "inf0"));
    }

    TEST(StringUtils, readAs)
    {
        EXPECT_EQ(readAs<int>("42"), 42);
        EXPECT_EQ(readAs<unsigned>("abc"), std::nullopt);
    }

    TEST(StringUtils, toHexString)
    {
        const std::uint8_t bytes[]{ 0x00, 0x01, 0x7F, 0xAB, 0xFF };
        EXPECT_EQ(toHexString(bytes), "00017FABFF");
        EXPECT_EQ(toHexString({}), "");
    }

    TEST(StringUtils, toISO8601String)
    {
        EXPECT_EQ(toISO8601String(Wt::WDateTime{ Wt::WDate{ 2024, 10, 18 }, Wt::WTime{ 13, 5, 42, 123 } }), "2024-10-18T13:05:42.123Z");
        EXPECT_EQ(toISO8601String(Wt::WDateTime{}), "");
    }
} // namespace guidkit::core::stringUtils::tests
