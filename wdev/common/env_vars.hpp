/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file env_vars.hpp
 * @brief: defines a set of environment variables used in wireless-dev
 * **/

#ifndef _WDEV_ENV_VARS_HPP_
#define _WDEV_ENV_VARS_HPP_


namespace wdev
{

/* Directory holding config.json and the main log file (default: ~/.wireless-dev) */
#define WDEV_CONFIG_DIR_ENV_VAR ("WDEV_CONFIG_DIR")

/* Path of the bridge executable (default: "adb", resolved through PATH) */
#define WDEV_ADB_PATH_ENV_VAR ("WDEV_ADB_PATH")

#define WDEV_LOGGER_PATH_ENV_VAR ("WDEV_LOGGER_PATH")

#define WDEV_CONSOLE_LOGGER_LEVEL_ENV_VAR ("WDEV_CONSOLE_LOGGER_LEVEL")

} /* namespace wdev */

#endif /* _WDEV_ENV_VARS_HPP_ */
