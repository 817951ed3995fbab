/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file wdev_paths.hpp
 * @brief Locations of the per-user files written by wireless-dev
 **/

#ifndef _WDEV_PATHS_HPP_
#define _WDEV_PATHS_HPP_

#include "common/utils.hpp"
#include "common/env_vars.hpp"
#include "common/filesystem.hpp"

#include <string>

namespace wdev
{

#define WDEV_CONFIG_DIR_NAME (".wireless-dev")
#define WDEV_CONFIG_FILE_NAME ("config.json")
#define WDEV_LOGGER_FILENAME ("wireless-dev.log")

class WdevPaths final {
public:
    WdevPaths() = delete;

    // $WDEV_CONFIG_DIR, or ~/.wireless-dev
    static std::string get_config_dir()
    {
        auto config_dir = get_env_variable(WDEV_CONFIG_DIR_ENV_VAR);
        if (config_dir) {
            return config_dir.release();
        }
        return Filesystem::join(Filesystem::get_home_directory(), WDEV_CONFIG_DIR_NAME);
    }

    static std::string get_config_file_path()
    {
        return Filesystem::join(get_config_dir(), WDEV_CONFIG_FILE_NAME);
    }
};

} /* namespace wdev */

#endif /* _WDEV_PATHS_HPP_ */
