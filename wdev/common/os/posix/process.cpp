/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file process.cpp
 * @brief Process wrapper for Linux
 **/

#include "common/process.hpp"
#include "common/utils.hpp"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>

#include <thread>
#include <array>

namespace wdev
{

static const int SHELL_NOT_FOUND_EXIT_CODE = 127;
static const int SIGNALED_EXIT_CODE_BASE = 128;
static const std::chrono::milliseconds POLL_INTERVAL(20);
static const std::chrono::milliseconds REAP_INTERVAL(5);
static const size_t READ_CHUNK_SIZE = 4096;

Expected<std::pair<int32_t, std::string>> Process::create_and_wait_for_output(const std::string &command_line,
    uint32_t max_output_size, std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    TRY(auto child, ChildProcess::create(command_line, true));
    TRY_WITH_ACCEPTABLE_STATUS(WDEV_TIMEOUT, auto output, child.read_output(max_output_size, deadline));
    TRY_WITH_ACCEPTABLE_STATUS(WDEV_TIMEOUT, const auto exit_code, child.wait(deadline));

    // We remove the trailing newline if it's the last char
    if (!output.empty() && (output.back() == '\n')) {
        output.pop_back();
    }
    return std::make_pair(exit_code, output);
}

Expected<int32_t> Process::create_and_wait(const std::string &command_line)
{
    struct sigaction ignore_action{};
    ignore_action.sa_handler = SIG_IGN;
    sigemptyset(&ignore_action.sa_mask);

    struct sigaction old_int_action{};
    struct sigaction old_quit_action{};
    (void)sigaction(SIGINT, &ignore_action, &old_int_action);
    (void)sigaction(SIGQUIT, &ignore_action, &old_quit_action);

    auto child = ChildProcess::create(command_line, false);
    auto exit_code = child ? child->wait_blocking() : Expected<int32_t>(make_unexpected(child.status()));

    (void)sigaction(SIGINT, &old_int_action, nullptr);
    (void)sigaction(SIGQUIT, &old_quit_action, nullptr);
    return exit_code;
}

std::string Process::quote_argument(const std::string &arg)
{
    std::string quoted = "'";
    for (const auto c : arg) {
        if ('\'' == c) {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

Expected<Process::ChildProcess> Process::ChildProcess::create(const std::string &command_line, bool capture_output)
{
    std::array<int, 2> pipe_fds = {-1, -1};
    if (capture_output) {
        CHECK(0 == pipe2(pipe_fds.data(), O_CLOEXEC), WDEV_PROCESS_SPAWN_FAILURE,
            "pipe() for \"{}\" failed with errno={}", command_line, errno);
    }

    const auto pid = fork();
    if (-1 == pid) {
        LOGGER__ERROR("fork() for \"{}\" failed with errno={}", command_line, errno);
        if (capture_output) {
            (void)close(pipe_fds[0]);
            (void)close(pipe_fds[1]);
        }
        return make_unexpected(WDEV_PROCESS_SPAWN_FAILURE);
    }

    if (0 == pid) {
        // Child - only async-signal-safe calls from here on
        if (capture_output) {
            (void)setpgid(0, 0);
            (void)dup2(pipe_fds[1], STDOUT_FILENO);
            (void)dup2(pipe_fds[1], STDERR_FILENO);
            const auto dev_null = open("/dev/null", O_RDONLY);
            if (-1 != dev_null) {
                (void)dup2(dev_null, STDIN_FILENO);
            }
        }
        execl("/bin/sh", "sh", "-c", command_line.c_str(), static_cast<char*>(nullptr));
        _exit(SHELL_NOT_FOUND_EXIT_CODE);
    }

    int output_fd = -1;
    if (capture_output) {
        // Also set from the parent so a kill right after fork reaches the group
        (void)setpgid(pid, pid);
        (void)close(pipe_fds[1]);
        output_fd = pipe_fds[0];
    }

    LOGGER__TRACE("Spawned pid {} for \"{}\"", pid, command_line);
    return ChildProcess(pid, output_fd, command_line);
}

Process::ChildProcess::ChildProcess(pid_t pid, int output_fd, const std::string &command_line) :
    m_pid(pid),
    m_output_fd(output_fd),
    m_reaped(false),
    m_exit_code(-1),
    m_command_line(command_line)
{}

Process::ChildProcess::ChildProcess(ChildProcess &&other) :
    m_pid(std::exchange(other.m_pid, -1)),
    m_output_fd(std::exchange(other.m_output_fd, -1)),
    m_reaped(std::exchange(other.m_reaped, true)),
    m_exit_code(other.m_exit_code),
    m_command_line(other.m_command_line)
{}

Process::ChildProcess::~ChildProcess()
{
    if (!m_reaped && (-1 != m_pid)) {
        kill();
    }
    if (-1 != m_output_fd) {
        (void)close(m_output_fd);
    }
}

Expected<std::string> Process::ChildProcess::read_output(uint32_t max_output_size,
    std::chrono::steady_clock::time_point deadline)
{
    CHECK(-1 != m_output_fd, WDEV_INVALID_OPERATION, "Output of \"{}\" is not captured", m_command_line);

    std::string output;
    bool truncated = false;

    while (true) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            LOGGER__DEBUG("\"{}\" timed out, killing pid {}", m_command_line, m_pid);
            kill();
            return make_unexpected(WDEV_TIMEOUT);
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);

        struct pollfd poll_fd{};
        poll_fd.fd = m_output_fd;
        poll_fd.events = POLLIN;
        const auto poll_res = poll(&poll_fd, 1, static_cast<int>(std::min(remaining, POLL_INTERVAL).count()));
        if (-1 == poll_res) {
            if (EINTR == errno) {
                continue;
            }
            LOGGER__ERROR("poll() on output of \"{}\" failed with errno={}", m_command_line, errno);
            return make_unexpected(WDEV_FILE_OPERATION_FAILURE);
        }

        if (0 < poll_res) {
            TRY(const auto has_more, read_chunk(output, max_output_size, truncated));
            if (!has_more) {
                break;
            }
            continue;
        }

        // A grandchild may keep the pipe open after the child exits (e.g. a freshly started adb server).
        // The child may also have written and exited since the poll above, so take what is buffered first.
        if (try_reap()) {
            CHECK_SUCCESS(drain_output(output, max_output_size, truncated));
            break;
        }
    }

    return output;
}

Expected<bool> Process::ChildProcess::read_chunk(std::string &output, uint32_t max_output_size, bool &truncated)
{
    std::array<char, READ_CHUNK_SIZE> chunk{};
    ssize_t num_read = -1;
    do {
        num_read = read(m_output_fd, chunk.data(), chunk.size());
    } while ((-1 == num_read) && (EINTR == errno));
    CHECK(-1 != num_read, WDEV_FILE_OPERATION_FAILURE, "read() on output of \"{}\" failed with errno={}",
        m_command_line, errno);
    if (0 == num_read) {
        // EOF
        return false;
    }

    const auto space_left = max_output_size - output.size();
    if (static_cast<size_t>(num_read) > space_left) {
        output.append(chunk.data(), space_left);
        if (!truncated) {
            LOGGER__WARNING("Truncating output of command \"{}\" to {} chars long! "
                "The max_output_size needs to be bigger!", m_command_line, max_output_size);
            truncated = true;
        }
    } else {
        output.append(chunk.data(), static_cast<size_t>(num_read));
    }
    return true;
}

wdev_status Process::ChildProcess::drain_output(std::string &output, uint32_t max_output_size, bool &truncated)
{
    while (true) {
        struct pollfd poll_fd{};
        poll_fd.fd = m_output_fd;
        poll_fd.events = POLLIN;
        const auto poll_res = poll(&poll_fd, 1, 0);
        if ((-1 == poll_res) && (EINTR == errno)) {
            continue;
        }
        CHECK(-1 != poll_res, WDEV_FILE_OPERATION_FAILURE, "poll() on output of \"{}\" failed with errno={}",
            m_command_line, errno);
        if (0 == poll_res) {
            return WDEV_SUCCESS;
        }

        TRY(const auto has_more, read_chunk(output, max_output_size, truncated));
        if (!has_more) {
            return WDEV_SUCCESS;
        }
    }
}

Expected<int32_t> Process::ChildProcess::wait(std::chrono::steady_clock::time_point deadline)
{
    while (!try_reap()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            LOGGER__DEBUG("\"{}\" did not exit in time, killing pid {}", m_command_line, m_pid);
            kill();
            return make_unexpected(WDEV_TIMEOUT);
        }
        std::this_thread::sleep_for(REAP_INTERVAL);
    }
    return Expected<int32_t>(m_exit_code);
}

Expected<int32_t> Process::ChildProcess::wait_blocking()
{
    int wait_status = 0;
    while (-1 == waitpid(m_pid, &wait_status, 0)) {
        CHECK(EINTR == errno, WDEV_INTERNAL_FAILURE, "waitpid() for \"{}\" failed with errno={}", m_command_line, errno);
    }
    m_reaped = true;
    m_exit_code = to_exit_code(wait_status);
    return Expected<int32_t>(m_exit_code);
}

void Process::ChildProcess::kill()
{
    if (m_reaped || (-1 == m_pid)) {
        return;
    }
    // Captured children lead their own process group
    const auto target = (-1 != m_output_fd) ? -m_pid : m_pid;
    (void)::kill(target, SIGKILL);
    int wait_status = 0;
    while ((-1 == waitpid(m_pid, &wait_status, 0)) && (EINTR == errno)) {}
    m_reaped = true;
    m_exit_code = to_exit_code(wait_status);
}

bool Process::ChildProcess::try_reap()
{
    if (m_reaped) {
        return true;
    }
    int wait_status = 0;
    const auto res = waitpid(m_pid, &wait_status, WNOHANG);
    if (res == m_pid) {
        m_reaped = true;
        m_exit_code = to_exit_code(wait_status);
        return true;
    }
    if ((-1 == res) && (ECHILD == errno)) {
        LOGGER__WARNING("pid {} of \"{}\" was already reaped", m_pid, m_command_line);
        m_reaped = true;
        return true;
    }
    return false;
}

int32_t Process::ChildProcess::to_exit_code(int wait_status)
{
    if (WIFEXITED(wait_status)) {
        return WEXITSTATUS(wait_status);
    }
    if (WIFSIGNALED(wait_status)) {
        return SIGNALED_EXIT_CODE_BASE + WTERMSIG(wait_status);
    }
    return -1;
}

} /* namespace wdev */
