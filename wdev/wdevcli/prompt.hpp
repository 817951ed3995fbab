/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file prompt.hpp
 * @brief Line based interactive prompts
 **/

#ifndef _WDEV_PROMPT_HPP_
#define _WDEV_PROMPT_HPP_

#include "wdevcli.hpp"

#include <istream>
#include <ostream>
#include <regex>
#include <string>
#include <vector>

class Prompt final
{
public:
    Prompt(std::istream &input, std::ostream &output);

    /**
     * Prints the choices numbered from 1 and reads until a valid number is entered.
     *
     * @return The zero based index of the chosen item, WDEV_ABORTED_BY_USER on end of input,
     *         WDEV_INVALID_ARGUMENT if choices is empty.
     */
    Expected<size_t> select(const std::string &message, const std::vector<std::string> &choices);

    /**
     * Reads a line until it matches pattern, printing error_message after every mismatch.
     * Leading and trailing whitespace is dropped.
     */
    Expected<std::string> input(const std::string &message, const std::regex &pattern,
        const std::string &error_message);

private:
    Expected<std::string> read_line();

    std::istream &m_input;
    std::ostream &m_output;
};

#endif /* _WDEV_PROMPT_HPP_ */
