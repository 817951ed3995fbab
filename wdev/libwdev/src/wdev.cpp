/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file wdev.cpp
 * @brief Implementation of the libwdev C entry points
 **/

#include "wdev/wdev.h"

#include "common/utils.hpp"
#include "common/logger_macros.hpp"

using namespace wdev;

wdev_status wdev_get_library_version(wdev_version_t *version)
{
    CHECK_ARG_NOT_NULL(version);
    version->major = WDEV_MAJOR_VERSION;
    version->minor = WDEV_MINOR_VERSION;
    version->revision = WDEV_REVISION_VERSION;
    return WDEV_SUCCESS;
}

static const char *wdev_status_msg_format[] =
{
#define WDEV_STATUS__X(value, name) #name,
    WDEV_STATUS_VARIABLES
#undef WDEV_STATUS__X
};

const char* wdev_get_status_message(wdev_status status)
{
    if ((status < 0) || (status >= WDEV_STATUS_COUNT)) {
        LOGGER__ERROR("Failed to get wdev_status message because of invalid wdev_status value. Max wdev_status value = {}, given value = {}",
            (WDEV_STATUS_COUNT-1), static_cast<int>(status));
        return nullptr;
    }
    return wdev_status_msg_format[status];
}
