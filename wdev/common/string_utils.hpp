/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file string_utils.hpp
 * @brief Defines utilities methods for string.
 **/

#ifndef _WDEV_STRING_UTILS_HPP_
#define _WDEV_STRING_UTILS_HPP_

#include "wdev/expected.hpp"

#include <string>
#include <vector>
#include <chrono>

namespace wdev
{

class StringUtils {
public:
    static Expected<int32_t> to_int32(const std::string &str, int base);
    static Expected<uint32_t> to_uint32(const std::string &str, int base);

    // Strips spaces, tabs and line endings from both ends
    static std::string trim(const std::string &str);
    // Splits on '\n', dropping '\r' and lines that are empty after trimming
    static std::vector<std::string> split_lines(const std::string &str);
    static std::vector<std::string> split_whitespace(const std::string &str);
    static bool starts_with(const std::string &str, const std::string &prefix);

    // "2025-01-31T08:15:00.123Z"
    static std::string to_iso8601_utc(std::chrono::system_clock::time_point time_point);
};

} /* namespace wdev */

#endif /* _WDEV_STRING_UTILS_HPP_ */
