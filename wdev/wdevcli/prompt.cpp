/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file prompt.cpp
 * @brief Line based interactive prompts
 **/

#include "prompt.hpp"
#include "common/string_utils.hpp"

#include <algorithm>
#include <cctype>

static const size_t MAX_CHOICE_DIGITS = 9;

static bool is_number(const std::string &str)
{
    return !str.empty() && (str.size() <= MAX_CHOICE_DIGITS) &&
        std::all_of(str.begin(), str.end(), [](unsigned char c) { return 0 != std::isdigit(c); });
}

Prompt::Prompt(std::istream &input, std::ostream &output) :
    m_input(input),
    m_output(output)
{}

Expected<size_t> Prompt::select(const std::string &message, const std::vector<std::string> &choices)
{
    CHECK(!choices.empty(), WDEV_INVALID_ARGUMENT, "Nothing to select from");

    m_output << "? " << message << std::endl;
    for (size_t i = 0; i < choices.size(); i++) {
        m_output << "  " << (i + 1) << ") " << choices[i] << std::endl;
    }

    while (true) {
        m_output << "Enter a number [1-" << choices.size() << "]: " << std::flush;
        TRY_WITH_ACCEPTABLE_STATUS(WDEV_ABORTED_BY_USER, const auto line, read_line());

        if (is_number(line)) {
            auto number = StringUtils::to_uint32(line, 10);
            if (number && (0 < number.value()) && (number.value() <= choices.size())) {
                return Expected<size_t>(number.value() - 1);
            }
        }
        m_output << "Please enter a number between 1 and " << choices.size() << std::endl;
    }
}

Expected<std::string> Prompt::input(const std::string &message, const std::regex &pattern,
    const std::string &error_message)
{
    while (true) {
        m_output << "? " << message << " " << std::flush;
        TRY_WITH_ACCEPTABLE_STATUS(WDEV_ABORTED_BY_USER, auto line, read_line());

        if (std::regex_match(line, pattern)) {
            return line;
        }
        m_output << error_message << std::endl;
    }
}

Expected<std::string> Prompt::read_line()
{
    std::string line;
    if (!std::getline(m_input, line)) {
        m_output << std::endl;
        LOGGER__INFO("Input closed while prompting");
        return make_unexpected(WDEV_ABORTED_BY_USER);
    }
    return StringUtils::trim(line);
}
