/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file test_process.cpp
 * @brief Child process helper
 **/

#include <gtest/gtest.h>

#include "common/process.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace wdev;

static const std::chrono::milliseconds TIMEOUT(5000);

TEST(ProcessTest, CapturesOutputAndExitCode)
{
    auto result = Process::create_and_wait_for_output("echo hello; echo world", Process::DEFAULT_MAX_OUTPUT_SIZE,
        TIMEOUT);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(0, result->first);
    EXPECT_EQ("hello\nworld", result->second);
}

TEST(ProcessTest, MergesStderr)
{
    auto result = Process::create_and_wait_for_output("echo oops 1>&2; exit 3", Process::DEFAULT_MAX_OUTPUT_SIZE,
        TIMEOUT);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(3, result->first);
    EXPECT_EQ("oops", result->second);
}

TEST(ProcessTest, MissingCommand)
{
    auto result = Process::create_and_wait_for_output("wdev-no-such-command-xyz", Process::DEFAULT_MAX_OUTPUT_SIZE,
        TIMEOUT);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(127, result->first);
}

TEST(ProcessTest, TruncatesOutput)
{
    auto result = Process::create_and_wait_for_output("printf 0123456789", 4, TIMEOUT);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ("0123", result->second);
}

TEST(ProcessTest, TimeoutKillsChild)
{
    const auto start = std::chrono::steady_clock::now();
    auto result = Process::create_and_wait_for_output("sleep 10", Process::DEFAULT_MAX_OUTPUT_SIZE,
        std::chrono::milliseconds(200));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(WDEV_TIMEOUT, result.status());
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(ProcessTest, QuotesArguments)
{
    const auto command_line = "printf %s " + Process::quote_argument("it's $HOME; `id`");
    auto result = Process::create_and_wait_for_output(command_line, Process::DEFAULT_MAX_OUTPUT_SIZE, TIMEOUT);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ("it's $HOME; `id`", result->second);
}

TEST(ProcessTest, WaitReturnsExitCode)
{
    auto exit_code = Process::create_and_wait("exit 7");
    ASSERT_TRUE(exit_code.has_value());
    EXPECT_EQ(7, exit_code.value());
}

TEST(ProcessTest, ConcurrentShortLivedChildrenKeepTheirOutput)
{
    static const size_t THREADS_COUNT = 32;
    static const size_t CALLS_PER_THREAD = 20;

    std::atomic<size_t> lost(0);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < THREADS_COUNT; i++) {
        threads.emplace_back([i, &lost]() {
            for (size_t j = 0; j < CALLS_PER_THREAD; j++) {
                // Exits right around the poll interval, while the output still sits in the pipe
                const auto command_line = "sleep 0.0" + std::to_string(15 + ((i + j) % 10)) + "; echo connected to x";
                auto result = Process::create_and_wait_for_output(command_line, 4096, TIMEOUT);
                if (!result || (0 != result->first) || ("connected to x" != result->second)) {
                    lost++;
                }
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    EXPECT_EQ(0u, lost.load());
}
