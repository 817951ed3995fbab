/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file common.cpp
 * @brief Common functions.
 **/

#include "common.hpp"
#include "common/network_utils.hpp"
#include "common/string_utils.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <thread>

#include <unistd.h>

static const std::string ELLIPSIS = "...  ";
static const size_t COLUMN_SPACING = 1;

void CliCommon::print_success(const std::string &message)
{
    std::cout << colored(message, FORMAT_GREEN_PRINT) << std::endl;
}

void CliCommon::print_info(const std::string &message)
{
    std::cout << colored(message, FORMAT_BLUE_PRINT) << std::endl;
}

void CliCommon::print_warning(const std::string &message)
{
    std::cout << colored(message, FORMAT_YELLOW_PRINT) << std::endl;
}

void CliCommon::print_error(const std::string &message)
{
    if (isatty(STDERR_FILENO)) {
        std::cerr << FORMAT_RED_PRINT << message << FORMAT_NORMAL_PRINT << std::endl;
    } else {
        std::cerr << message << std::endl;
    }
}

std::string CliCommon::colored(const std::string &text, const char *color)
{
    if ((nullptr == color) || !isatty(STDOUT_FILENO)) {
        return text;
    }
    return std::string(color) + text + FORMAT_NORMAL_PRINT;
}

void CliCommon::print_table_header(const std::vector<TableColumn> &columns)
{
    size_t line_length = 0;
    for (const auto &column : columns) {
        std::cout << format_cell(column.title, column.width);
        line_length += column.width + COLUMN_SPACING;
    }
    std::cout << std::endl << std::string(line_length, '-') << std::endl;
}

std::string CliCommon::format_cell(const std::string &text, size_t width, const char *color)
{
    std::stringstream cell;
    cell << std::setw(static_cast<int>(width)) << std::left << truncate_str(text, width);
    return colored(cell.str(), color) + std::string(COLUMN_SPACING, ' ');
}

std::string CliCommon::truncate_str(const std::string &str, size_t max_length)
{
    return (str.length() > max_length) ? str.substr(0, (max_length - ELLIPSIS.length())) + ELLIPSIS : str;
}

std::string CliCommon::get_local_address()
{
    auto address = NetworkUtils::get_local_ipv4_address();
    if (!address) {
        LOGGER__WARNING("No local IPv4 address found, falling back to {}", WDEV_LOOPBACK_ADDRESS);
        return WDEV_LOOPBACK_ADDRESS;
    }
    return address.release();
}

std::string CliCommon::now_timestamp()
{
    return StringUtils::to_iso8601_utc(std::chrono::system_clock::now());
}

void CliCommon::wait_for_settle()
{
    std::this_thread::sleep_for(std::chrono::milliseconds(WDEV_DEFAULT_SETTLE_DELAY_MS));
}
