/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file filesystem.hpp
 * @brief File system API
 **/

#ifndef _WDEV_FILESYSTEM_HPP_
#define _WDEV_FILESYSTEM_HPP_

#include "wdev/wdev.h"
#include "wdev/expected.hpp"

#include <string>


namespace wdev
{

class Filesystem final {
public:
    Filesystem() = delete;

    static Expected<bool> is_directory(const std::string &path);
    // Creates the directory if it does not exist yet (parent must exist)
    static wdev_status create_directory(const std::string &dir_path);
    static std::string get_home_directory();
    static bool is_path_accesible(const std::string &path);
    static bool does_file_exists(const std::string &path);

    /**
     * Writes the content to a temporary file beside file_path and renames it over file_path,
     * so readers never observe a half written file.
     */
    static wdev_status write_file_atomically(const std::string &file_path, const std::string &content);

    static std::string join(const std::string &dir_path, const std::string &name)
    {
        if (dir_path.empty() || (dir_path.back() == SEPARATOR[0])) {
            return dir_path + name;
        }
        return dir_path + SEPARATOR + name;
    }

private:
    static const char *SEPARATOR;
};

} /* namespace wdev */

#endif /* _WDEV_FILESYSTEM_HPP_ */
