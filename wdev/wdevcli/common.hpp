/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file common.hpp
 * @brief Common functions.
 **/

#ifndef _WDEV_WDEVCLI_COMMON_HPP_
#define _WDEV_WDEVCLI_COMMON_HPP_

#include "CLI/CLI.hpp"

#include "wdevcli.hpp"

#include <regex>
#include <sstream>
#include <string>
#include <vector>

// http://www.climagic.org/mirrors/VT100_Escape_Codes.html
#define FORMAT_RED_PRINT "\x1B[1;31m"
#define FORMAT_GREEN_PRINT "\x1B[1;32m"
#define FORMAT_YELLOW_PRINT "\x1B[1;33m"
#define FORMAT_BLUE_PRINT "\x1B[1;34m"
#define FORMAT_NORMAL_PRINT "\x1B[0m"

// Address with an optional port, as typed by the user
#define WDEV_ENDPOINT_PATTERN (R"(^\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}(:\d+)?$)")

struct TableColumn {
    std::string title;
    size_t width;
};

class CliCommon final
{
public:
    CliCommon() = delete;

    static void print_success(const std::string &message);
    static void print_info(const std::string &message);
    static void print_warning(const std::string &message);
    // Goes to stderr
    static void print_error(const std::string &message);

    // Wraps text in the color codes when stdout is a terminal
    static std::string colored(const std::string &text, const char *color);

    static void print_table_header(const std::vector<TableColumn> &columns);
    // Pads (or truncates) each cell to its column width before coloring it
    static std::string format_cell(const std::string &text, size_t width, const char *color = nullptr);
    static std::string truncate_str(const std::string &str, size_t max_length);

    // This host's IPv4 address, or the loopback address (with a warning) when there is none
    static std::string get_local_address();
    static std::string now_timestamp();
    static void wait_for_settle();
};

// Validators
struct EndpointValidator : public CLI::Validator {
    EndpointValidator() {
        name_ = "IP[:PORT]";
        func_ = [](const std::string &endpoint) {
            if (!std::regex_match(endpoint, std::regex(WDEV_ENDPOINT_PATTERN))) {
                std::stringstream error_message;
                error_message << "'" << endpoint << "' is not an IP address with an optional port." << std::endl;
                return error_message.str();
            }
            // Success
            return std::string();
        };
    }
};

#endif /* _WDEV_WDEVCLI_COMMON_HPP_ */
