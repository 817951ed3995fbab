/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file file_descriptor.hpp
 * @brief Wrapper around system file descriptors
 **/

#ifndef _WDEV_FILE_DESCRIPTOR_HPP_
#define _WDEV_FILE_DESCRIPTOR_HPP_

#include "common/logger_macros.hpp"
#include "wdev/expected.hpp"

#include <utility>

namespace wdev
{

class FileDescriptor
{
  public:
    explicit FileDescriptor(int fd);
    ~FileDescriptor();

    FileDescriptor(const FileDescriptor &other) = delete;
    FileDescriptor &operator=(const FileDescriptor &other) = delete;
    FileDescriptor(FileDescriptor &&other) noexcept;
    FileDescriptor &operator=(FileDescriptor &&other) noexcept
    {
        std::swap(m_fd, other.m_fd);
        return *this;
    };

    operator int() const
    {
        return m_fd;
    }

  private:
    int m_fd;
};

} /* namespace wdev */

#endif /* _WDEV_FILE_DESCRIPTOR_HPP_ */
