/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file test_string_utils.cpp
 * @brief String helpers
 **/

#include <gtest/gtest.h>

#include "common/string_utils.hpp"

#include <chrono>

using namespace wdev;

TEST(StringUtilsTest, ToUint32)
{
    EXPECT_EQ(5555u, StringUtils::to_uint32("5555", 10).value());
    EXPECT_EQ(WDEV_INVALID_ARGUMENT, StringUtils::to_uint32("-1", 10).status());
    EXPECT_EQ(WDEV_INVALID_ARGUMENT, StringUtils::to_uint32("12ab", 10).status());
    EXPECT_EQ(WDEV_INVALID_ARGUMENT, StringUtils::to_uint32("", 10).status());
}

TEST(StringUtilsTest, ToInt32)
{
    EXPECT_EQ(-12, StringUtils::to_int32("-12", 10).value());
    EXPECT_EQ(WDEV_INVALID_ARGUMENT, StringUtils::to_int32("x", 10).status());
}

TEST(StringUtilsTest, Trim)
{
    EXPECT_EQ("abc", StringUtils::trim(" \tabc\r\n"));
    EXPECT_EQ("a b", StringUtils::trim("a b"));
    EXPECT_EQ("", StringUtils::trim(" \n "));
}

TEST(StringUtilsTest, SplitLines)
{
    const std::vector<std::string> expected = {"first", "  second", "third"};
    EXPECT_EQ(expected, StringUtils::split_lines("first\r\n  second\n\n   \nthird"));
    EXPECT_TRUE(StringUtils::split_lines("").empty());
}

TEST(StringUtilsTest, SplitWhitespace)
{
    const std::vector<std::string> expected = {"R58M123ABC", "device"};
    EXPECT_EQ(expected, StringUtils::split_whitespace("  R58M123ABC \t device \n"));
}

TEST(StringUtilsTest, StartsWith)
{
    EXPECT_TRUE(StringUtils::starts_with("connected to 1.2.3.4:5555", "connected to"));
    EXPECT_FALSE(StringUtils::starts_with("already connected to", "connected to"));
    EXPECT_FALSE(StringUtils::starts_with("con", "connected"));
}

TEST(StringUtilsTest, Iso8601Utc)
{
    // 2024-05-01T10:20:30.045Z
    const std::chrono::system_clock::time_point time_point(std::chrono::milliseconds(1714558830045LL));
    EXPECT_EQ("2024-05-01T10:20:30.045Z", StringUtils::to_iso8601_utc(time_point));
}
