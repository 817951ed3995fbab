/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file test_prompt.cpp
 * @brief Interactive prompts over string streams
 **/

#include <gtest/gtest.h>

#include "prompt.hpp"
#include "common.hpp"

#include <sstream>

TEST(PromptTest, InputRepromptsUntilValid)
{
    std::istringstream input("phone\n192.168.1\n 192.168.1.12:5555 \n");
    std::ostringstream output;
    Prompt prompt(input, output);

    auto endpoint = prompt.input("Enter device IP and port (e.g., 192.168.1.100:5555):",
        std::regex(WDEV_ENDPOINT_PATTERN), "Please enter a valid IP address and optional port");
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ("192.168.1.12:5555", endpoint.value());

    const auto text = output.str();
    const std::string error_message = "Please enter a valid IP address and optional port";
    const auto first = text.find(error_message);
    ASSERT_NE(std::string::npos, first);
    const auto second = text.find(error_message, first + 1);
    ASSERT_NE(std::string::npos, second);
    EXPECT_EQ(std::string::npos, text.find(error_message, second + 1));
}

TEST(PromptTest, InputAcceptsAddressWithoutPort)
{
    std::istringstream input("10.0.0.7\n");
    std::ostringstream output;
    Prompt prompt(input, output);

    auto endpoint = prompt.input("Address:", std::regex(WDEV_ENDPOINT_PATTERN), "invalid");
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ("10.0.0.7", endpoint.value());
}

TEST(PromptTest, InputEndOfStreamAborts)
{
    std::istringstream input("nope\n");
    std::ostringstream output;
    Prompt prompt(input, output);

    auto endpoint = prompt.input("Address:", std::regex(WDEV_ENDPOINT_PATTERN), "invalid");
    EXPECT_EQ(WDEV_ABORTED_BY_USER, endpoint.status());
}

TEST(PromptTest, SelectReturnsZeroBasedIndex)
{
    std::istringstream input("2\n");
    std::ostringstream output;
    Prompt prompt(input, output);

    auto index = prompt.select("Select a device:", {"Pixel 7 (192.168.1.12:5555)", "SM-G991B (192.168.1.13:5555)"});
    ASSERT_TRUE(index.has_value());
    EXPECT_EQ(1u, index.value());
    EXPECT_NE(std::string::npos, output.str().find("2) SM-G991B (192.168.1.13:5555)"));
}

TEST(PromptTest, SelectRejectsOutOfRange)
{
    std::istringstream input("0\n3\nfirst\n-1\n1\n");
    std::ostringstream output;
    Prompt prompt(input, output);

    auto index = prompt.select("Select a device:", {"a", "b"});
    ASSERT_TRUE(index.has_value());
    EXPECT_EQ(0u, index.value());
}

TEST(PromptTest, SelectEndOfStreamAborts)
{
    std::istringstream input("");
    std::ostringstream output;
    Prompt prompt(input, output);

    EXPECT_EQ(WDEV_ABORTED_BY_USER, prompt.select("Select a device:", {"a"}).status());
}

TEST(PromptTest, SelectNeedsChoices)
{
    std::istringstream input("1\n");
    std::ostringstream output;
    Prompt prompt(input, output);

    EXPECT_EQ(WDEV_INVALID_ARGUMENT, prompt.select("Select a device:", {}).status());
}
