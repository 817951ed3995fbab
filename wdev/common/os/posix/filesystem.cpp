/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file filesystem.cpp
 * @brief Filesystem wrapper for Linux
 **/

#include "common/filesystem.hpp"
#include "common/logger_macros.hpp"
#include "common/utils.hpp"

#include <errno.h>
#include <stdio.h>
#include <sys/stat.h>
#include <unistd.h>
#include <pwd.h>
#include <fstream>

namespace wdev
{

const char *Filesystem::SEPARATOR = "/";
static const char *TMP_FILE_SUFFIX = ".tmp";

Expected<bool> Filesystem::is_directory(const std::string &path)
{
    struct stat path_stat{};
    auto ret_val = stat(path.c_str(), &path_stat);
    if (ret_val != 0 && (errno == ENOENT)) {
        // Directory path does not exist
        return false;
    }
    CHECK(0 == ret_val, WDEV_FILE_OPERATION_FAILURE,
        "stat() on path \"{}\" failed. errno {}", path, errno);

    return S_ISDIR(path_stat.st_mode);
}

wdev_status Filesystem::create_directory(const std::string &dir_path)
{
    auto ret_val = mkdir(dir_path.c_str(), S_IRWXU | S_IRWXG | S_IRWXO);
    CHECK((ret_val == 0) || (errno == EEXIST), WDEV_FILE_OPERATION_FAILURE,
        "Failed to create directory {}. errno {}", dir_path, errno);
    return WDEV_SUCCESS;
}

std::string Filesystem::get_home_directory()
{
    const char *homedir = getenv("HOME");
    if (NULL == homedir) {
        const auto *pw = getpwuid(getuid());
        homedir = (nullptr != pw) ? pw->pw_dir : ".";
    }
    return homedir;
}

bool Filesystem::is_path_accesible(const std::string &path)
{
    auto ret = access(path.c_str(), W_OK);
    if (ret == 0) {
        return true;
    }
    if (EACCES != errno) {
        LOGGER__DEBUG("access() on path \"{}\" failed. errno {}", path, errno);
    }
    return false;
}

bool Filesystem::does_file_exists(const std::string &path)
{
    struct stat buffer;
    return (0 == stat(path.c_str(), &buffer));
}

wdev_status Filesystem::write_file_atomically(const std::string &file_path, const std::string &content)
{
    const auto tmp_path = file_path + TMP_FILE_SUFFIX;
    {
        std::ofstream ofs(tmp_path, std::ios::out | std::ios::trunc);
        CHECK(ofs.good(), WDEV_OPEN_FILE_FAILURE, "Failed opening file {} for writing. errno {}", tmp_path, errno);

        ofs << content;
        ofs.flush();
        CHECK(ofs.good(), WDEV_FILE_OPERATION_FAILURE, "Failed writing file {}. errno {}", tmp_path, errno);
    }

    auto ret_val = rename(tmp_path.c_str(), file_path.c_str());
    if (0 != ret_val) {
        LOGGER__ERROR("Failed renaming {} to {}. errno {}", tmp_path, file_path, errno);
        (void)remove(tmp_path.c_str());
        return WDEV_FILE_OPERATION_FAILURE;
    }

    return WDEV_SUCCESS;
}

} /* namespace wdev */
