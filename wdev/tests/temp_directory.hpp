/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file temp_directory.hpp
 * @brief Scratch directory removed with its content on destruction
 **/

#ifndef _WDEV_TEMP_DIRECTORY_HPP_
#define _WDEV_TEMP_DIRECTORY_HPP_

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <stdlib.h>

namespace wdev
{

class TempDirectory final
{
public:
    TempDirectory()
    {
        std::string path_template = (std::filesystem::temp_directory_path() / "wdev_test_XXXXXX").string();
        std::vector<char> buffer(path_template.begin(), path_template.end());
        buffer.push_back('\0');
        if (nullptr == mkdtemp(buffer.data())) {
            throw std::runtime_error("mkdtemp failed for " + path_template);
        }
        m_path = buffer.data();
    }

    ~TempDirectory()
    {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDirectory(const TempDirectory &) = delete;
    TempDirectory &operator=(const TempDirectory &) = delete;

    const std::string &path() const
    {
        return m_path;
    }

    std::string file(const std::string &name) const
    {
        return m_path + "/" + name;
    }

    void write(const std::string &name, const std::string &content) const
    {
        std::ofstream ofs(file(name), std::ios::trunc);
        ofs << content;
    }

private:
    std::string m_path;
};

} /* namespace wdev */

#endif /* _WDEV_TEMP_DIRECTORY_HPP_ */
