/*
 * Copyright (C) 2025 The Cine developers
 *
 * This file is part of Cine.
 *
 * Cine is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Cine is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Cine.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <gtest/gtest.h>

#include <Wt/WDate.h>
#include <Wt/WDateTime.h>
#include <Wt/WTime.h>

#include "core/String.hpp"

namespace cine::core::stringUtils::tests
{
    TEST(StringUtils, splitString_charDelim)
    {
        struct TestCase
        {
            std::string_view input;
            char delimiter;
            std::vector<std::string_view> expectedOutput;
        };

        TestCase tests[]{
            { "abc", '-', { "abc" } },
            { "", '-', { "" } },
            { "a-b-c", '-', { "a", "b", "c" } },
            { ";b;c", ';', { "", "b", "c" } },
            { " ;;c", ';', { " ", "", "c" } },
            { ";", ';', { "", "" } },
            { "Q1\tP136\tQ2", '\t', { "Q1", "P136", "Q2" } },
            { "genre;1.0;shares the genre", ';', { "genre", "1.0", "shares the genre" } },
        };

        for (const TestCase& test : tests)
        {
            const std::vector<std::string_view> res{ splitString(test.input, test.delimiter) };
            EXPECT_EQ(res, test.expectedOutput) << "Input = '" << test.input << "', delim = '" << test.delimiter << "'";
        }
    }

    TEST(StringUtils, splitString_stringDelim)
    {
        struct TestCase
        {
            std::string_view input;
            std::string_view delimiter;
            std::vector<std::string_view> expectedOutput;
        };

        TestCase tests[]{
            { "", "", { "" } },
            { "abc", "", { "abc" } },
            { "//abc//", "//", { "", "abc", "" } },
            { "ab/cd", "/ ", { "ab/cd" } },
            { "a, b, c", ", ", { "a", "b", "c" } },
        };

        for (const TestCase& test : tests)
        {
            const std::vector<std::string_view> res{ splitString(test.input, test.delimiter) };
            EXPECT_EQ(res, test.expectedOutput) << "Input = '" << test.input << "', delim = '" << test.delimiter << "'";
        }
    }

    TEST(StringUtils, stringTrim)
    {
        EXPECT_EQ(stringTrim(""), "");
        EXPECT_EQ(stringTrim("   "), "");
        EXPECT_EQ(stringTrim(" a "), "a");
        EXPECT_EQ(stringTrim("\ta b\r\n"), "a b");
    }

    TEST(StringUtils, stringToLower)
    {
        EXPECT_EQ(stringToLower("Start Over"), "start over");
    }

    TEST(StringUtils, readAs)
    {
        EXPECT_EQ(readAs<int>("1999"), 1999);
        EXPECT_EQ(readAs<int>("-12"), -12);
        EXPECT_EQ(readAs<int>("abc"), std::nullopt);
        EXPECT_EQ(readAs<int>("12abc"), std::nullopt);
        EXPECT_EQ(readAs<int>(""), std::nullopt);

        EXPECT_DOUBLE_EQ(readAs<double>("7.5").value(), 7.5);
        EXPECT_DOUBLE_EQ(readAs<double>("0.25 ").value(), 0.25);
    }

    TEST(StringUtils, toISO8601String)
    {
        EXPECT_EQ(toISO8601String(Wt::WDateTime{ Wt::WDate{ 2020, 1, 3 }, Wt::WTime{ 9, 8, 11, 75 } }), "2020-01-03T09:08:11.075Z");
        EXPECT_EQ(toISO8601String(Wt::WDateTime{}), "");
    }
} // namespace cine::core::stringUtils::tests
