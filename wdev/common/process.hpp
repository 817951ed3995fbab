/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file process.hpp
 * @brief Create shell processes and retrieve output
 **/

#ifndef _WDEV_PROCESS_HPP_
#define _WDEV_PROCESS_HPP_

#include "wdev/wdev.h"
#include "wdev/expected.hpp"

#include <string>
#include <chrono>
#include <utility>

#include <sys/types.h>

namespace wdev
{

class Process final {
public:
    static const uint32_t DEFAULT_MAX_OUTPUT_SIZE = 256 * 1024;

    // Note:
    // * This function will block until the process exits or the timeout expires!
    // * The command line is run by /bin/sh; stderr is merged into the captured stdout and stdin is /dev/null
    // * On timeout the whole process group is killed and WDEV_TIMEOUT is returned
    // * If the process' output size exceeds max_output_size, the output will be truncated to max_output_size
    // * We remove the trailing newline if it's the last char
    static Expected<std::pair<int32_t, std::string>> create_and_wait_for_output(const std::string &command_line,
        uint32_t max_output_size, std::chrono::milliseconds timeout);

    // Runs the command line with the terminal's stdio until it exits, returning its exit code.
    // SIGINT/SIGQUIT are ignored by this process meanwhile, so Ctrl-C only stops the child.
    static Expected<int32_t> create_and_wait(const std::string &command_line);

    // Wraps arg in single quotes so /bin/sh passes it as one literal word
    static std::string quote_argument(const std::string &arg);

    Process() = delete;

private:
    class ChildProcess final {
    public:
        static Expected<ChildProcess> create(const std::string &command_line, bool capture_output);
        ~ChildProcess();
        ChildProcess(const ChildProcess &other) = delete;
        ChildProcess &operator=(const ChildProcess &other) = delete;
        ChildProcess &operator=(ChildProcess &&other) = delete;
        ChildProcess(ChildProcess &&other);

        // Reads until EOF or exit. Returns WDEV_TIMEOUT if the deadline passes first.
        Expected<std::string> read_output(uint32_t max_output_size, std::chrono::steady_clock::time_point deadline);
        Expected<int32_t> wait(std::chrono::steady_clock::time_point deadline);
        Expected<int32_t> wait_blocking();
        void kill();

    private:
        ChildProcess(pid_t pid, int output_fd, const std::string &command_line);
        bool try_reap();
        // Appends one read() worth of output. Returns false on EOF.
        Expected<bool> read_chunk(std::string &output, uint32_t max_output_size, bool &truncated);
        // Reads what is already buffered in the pipe without waiting for more
        wdev_status drain_output(std::string &output, uint32_t max_output_size, bool &truncated);
        static int32_t to_exit_code(int wait_status);

        pid_t m_pid;
        int m_output_fd;
        bool m_reaped;
        int32_t m_exit_code;
        const std::string m_command_line;
    };
};

} /* namespace wdev */

#endif /* _WDEV_PROCESS_HPP_ */
