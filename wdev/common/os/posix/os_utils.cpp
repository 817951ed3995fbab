/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file os_utils.cpp
 * @brief Utilities for Posix methods
 **/

#include "common/os_utils.hpp"

#include <pthread.h>


namespace wdev
{

// pthread_setname_np name size is limited to 16 chars (including null terminator)
static const size_t MAX_THREAD_NAME_LENGTH = 15;

void OsUtils::set_current_thread_name(const std::string &name)
{
    const auto truncated_name = name.substr(0, MAX_THREAD_NAME_LENGTH);
    (void)pthread_setname_np(pthread_self(), truncated_name.c_str());
}

} /* namespace wdev */
