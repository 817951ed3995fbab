/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file os_utils.hpp
 * @brief Utilities for OS methods
 **/

#ifndef _WDEV_OS_UTILS_HPP_
#define _WDEV_OS_UTILS_HPP_

#include "wdev/wdev.h"

#include <string>
#include <cstdint>


namespace wdev
{

class OsUtils final
{
public:
    OsUtils() = delete;

    static void set_current_thread_name(const std::string &name);
};

} /* namespace wdev */

#endif /* _WDEV_OS_UTILS_HPP_ */
