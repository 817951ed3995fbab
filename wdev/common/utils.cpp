/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file utils.cpp
 * @brief Utilities for wireless-dev
 **/

#include "common/utils.hpp"
#include "common/string_utils.hpp"

#include <sstream>
#include <limits>
#include <ctime>
#include <stdlib.h>
#include <errno.h>

namespace wdev
{

static const char *WHITESPACE_CHARS = " \t\r\n";

Expected<uint32_t> StringUtils::to_uint32(const std::string &str, int base)
{
    errno = 0;
    char *end_pointer = nullptr;

    auto value = strtoul(str.c_str(), &end_pointer, base);
    static_assert(sizeof(value) >= sizeof(uint32_t), "Size of value must be equal or greater than size of uint32_t");
    CHECK_AS_EXPECTED(errno == 0, WDEV_INVALID_ARGUMENT, "Failed to convert string {} to uint32_t. strtoul failed with errno {}", str, errno);
    CHECK_AS_EXPECTED(((*end_pointer == '\0') || (*end_pointer == '\n')  || (*end_pointer == ' ') || (*end_pointer == '\r')),
        WDEV_INVALID_ARGUMENT, "Failed to convert string {} to uint32_t", str);
    if (end_pointer == str.c_str()) {
        LOGGER__ERROR("Failed to convert string {} to uint32_t.", str);
        return make_unexpected(WDEV_INVALID_ARGUMENT);
    }
    CHECK_AS_EXPECTED(('-' != str[str.find_first_not_of(WHITESPACE_CHARS)]), WDEV_INVALID_ARGUMENT,
        "Failed to convert string {} to uint32_t.", str);

    CHECK_AS_EXPECTED((value <= std::numeric_limits<uint32_t>::max()),
        WDEV_INVALID_ARGUMENT, "Failed to convert string {} to uint32_t.", str);

    return static_cast<uint32_t>(value);
}

Expected<int32_t> StringUtils::to_int32(const std::string &str, int base)
{
    errno = 0;
    char *end_pointer = nullptr;

    auto value = strtol(str.c_str(), &end_pointer, base);
    static_assert(sizeof(value) >= sizeof(int32_t), "Size of value must be equal or greater than size of int32_t");
    CHECK_AS_EXPECTED(errno == 0, WDEV_INVALID_ARGUMENT, "Failed to convert string {} to int32_t. strtol failed with errno {}", str, errno);
    CHECK_AS_EXPECTED(((*end_pointer == '\0') || (*end_pointer == '\n')  || (*end_pointer == ' ') || (*end_pointer == '\r')),
        WDEV_INVALID_ARGUMENT, "Failed to convert string {} to int32_t", str);
    if (end_pointer == str.c_str()) {
        LOGGER__ERROR("Failed to convert string {} to int32_t.", str);
        return make_unexpected(WDEV_INVALID_ARGUMENT);
    }

    CHECK_AS_EXPECTED(((value >= std::numeric_limits<int32_t>::min()) && (value <= std::numeric_limits<int32_t>::max())),
        WDEV_INVALID_ARGUMENT, "Failed to convert string {} to int32.", str);

    return static_cast<int32_t>(value);
}

std::string StringUtils::trim(const std::string &str)
{
    const auto first = str.find_first_not_of(WHITESPACE_CHARS);
    if (std::string::npos == first) {
        return "";
    }
    const auto last = str.find_last_not_of(WHITESPACE_CHARS);
    return str.substr(first, last - first + 1);
}

std::vector<std::string> StringUtils::split_lines(const std::string &str)
{
    std::vector<std::string> lines;
    std::istringstream stream(str);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && ('\r' == line.back())) {
            line.pop_back();
        }
        if (!trim(line).empty()) {
            lines.emplace_back(line);
        }
    }
    return lines;
}

std::vector<std::string> StringUtils::split_whitespace(const std::string &str)
{
    std::vector<std::string> tokens;
    std::istringstream stream(str);
    std::string token;
    while (stream >> token) {
        tokens.emplace_back(token);
    }
    return tokens;
}

bool StringUtils::starts_with(const std::string &str, const std::string &prefix)
{
    return (str.size() >= prefix.size()) && (0 == str.compare(0, prefix.size(), prefix));
}

std::string StringUtils::to_iso8601_utc(std::chrono::system_clock::time_point time_point)
{
    const auto since_epoch = time_point.time_since_epoch();
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch - seconds).count();

    const std::time_t as_time_t = static_cast<std::time_t>(seconds.count());
    struct tm utc_time = {};
    (void)gmtime_r(&as_time_t, &utc_time);

    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", utc_time.tm_year + 1900, utc_time.tm_mon + 1,
        utc_time.tm_mday, utc_time.tm_hour, utc_time.tm_min, utc_time.tm_sec, millis);
}

} /* namespace wdev */
