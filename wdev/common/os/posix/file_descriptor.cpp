/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file file_descriptor.cpp
 * @brief Wrapper around system file descriptors for Unix
 **/

#include "common/logger_macros.hpp"
#include "common/file_descriptor.hpp"

#include <errno.h>
#include <unistd.h>

namespace wdev
{

#define INVALID_FD (-1)


FileDescriptor::FileDescriptor(int fd) : m_fd(fd)
{}

FileDescriptor::~FileDescriptor()
{
    if (m_fd != INVALID_FD) {
        if (0 != close(m_fd)) {
            LOGGER__ERROR("Failed to close fd. errno={}", errno);
        }
    }
}

FileDescriptor::FileDescriptor(FileDescriptor &&other) noexcept : m_fd(std::exchange(other.m_fd, INVALID_FD))
{}

} /* namespace wdev */
