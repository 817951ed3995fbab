/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file wdev_logger.cpp
 * @brief Implements the logger used by wireless-dev.
 **/

#include "common/utils.hpp"
#include "common/filesystem.hpp"
#include "common/env_vars.hpp"

#include "utils/wdev_logger.hpp"
#include "utils/wdev_paths.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/null_sink.h>
#include <iostream>


namespace wdev
{


#define MAX_LOG_FILE_SIZE (1024 * 1024) // 1MB

#define WDEV_LOGGER_NAME ("wireless-dev")
#define WDEV_MAX_NUMBER_OF_LOG_FILES (1) // There will be 2 log files - 1 spare
#define WDEV_LOGGER_PATH_DISABLED ("NONE")
#ifdef NDEBUG
#define WDEV_CONSOLE_LOGGER_PATTERN ("[%n] [%^%l%$] %v") // Console logger will print: [wireless-dev] [log level] msg
#else
#define WDEV_CONSOLE_LOGGER_PATTERN ("[%Y-%m-%d %X.%e] [%P] [%t] [%n] [%^%l%$] [%s:%#] [%!] %v") // Console logger will print: [timestamp] [PID] [TID] [wireless-dev] [log level] [source file:line number] [function name] msg
#endif
#define WDEV_MAIN_FILE_LOGGER_PATTERN ("[%Y-%m-%d %X.%e] [%P] [%t] [%n] [%l] [%s:%#] [%!] %v") // File logger will print: [timestamp] [PID] [TID] [wireless-dev] [log level] [source file:line number] [function name] msg


std::string WdevLogger::get_main_log_path()
{
    auto log_path = get_env_variable(WDEV_LOGGER_PATH_ENV_VAR);
    if (log_path) {
        if (WDEV_LOGGER_PATH_DISABLED == log_path.value()) {
            return "";
        }
        return log_path.release();
    }

    return WdevPaths::get_config_dir();
}

std::shared_ptr<spdlog::sinks::sink> WdevLogger::create_file_sink(const std::string &dir_path, const std::string &filename)
{
    if ("" == dir_path) {
        return make_shared_nothrow<spdlog::sinks::null_sink_st>();
    }

    auto is_dir = Filesystem::is_directory(dir_path);
    if (!is_dir) {
        std::cerr << "wireless-dev warning: Cannot create log file " << filename << "! Path " << dir_path << " is not valid." << std::endl;
        return make_shared_nothrow<spdlog::sinks::null_sink_st>();
    }
    if (!is_dir.value()) {
        auto status = Filesystem::create_directory(dir_path);
        if (status != WDEV_SUCCESS) {
            std::cerr << "wireless-dev warning: Cannot create log file " << filename << "! Path " << dir_path << " is not valid." << std::endl;
            return make_shared_nothrow<spdlog::sinks::null_sink_st>();
        }
    }

    if (!Filesystem::is_path_accesible(dir_path)) {
        std::cerr << "wireless-dev warning: Cannot create log file " << filename << "! Please check the directory " << dir_path << " write permissions." << std::endl;
        return make_shared_nothrow<spdlog::sinks::null_sink_st>();
    }

    const auto file_path = Filesystem::join(dir_path, filename);
    if (Filesystem::does_file_exists(file_path) && !Filesystem::is_path_accesible(file_path)) {
        std::cerr << "wireless-dev warning: Cannot create log file " << filename << "! Please check the file " << file_path << " write permissions." << std::endl;
        return make_shared_nothrow<spdlog::sinks::null_sink_st>();
    }

    return make_shared_nothrow<spdlog::sinks::rotating_file_sink_mt>(file_path, MAX_LOG_FILE_SIZE, WDEV_MAX_NUMBER_OF_LOG_FILES);
}

WdevLogger::WdevLogger(spdlog::level::level_enum console_level, spdlog::level::level_enum file_level, spdlog::level::level_enum flush_level) :
    m_console_sink(make_shared_nothrow<spdlog::sinks::stderr_color_sink_mt>()),
    m_main_log_file_sink(create_file_sink(get_main_log_path(), WDEV_LOGGER_FILENAME))
{
    if ((nullptr == m_console_sink) || (nullptr == m_main_log_file_sink)) {
        std::cerr << "Allocating memory on heap for logger sinks has failed! Please check if this host has enough memory." << std::endl;
        return;
    }

    m_main_log_file_sink->set_pattern(WDEV_MAIN_FILE_LOGGER_PATTERN);
    m_console_sink->set_pattern(WDEV_CONSOLE_LOGGER_PATTERN);
    std::vector<std::shared_ptr<spdlog::sinks::sink>> sink_vector = { m_console_sink, m_main_log_file_sink };

    m_wdev_logger = make_shared_nothrow<spdlog::logger>(WDEV_LOGGER_NAME, sink_vector.begin(), sink_vector.end());
    if (nullptr == m_wdev_logger) {
        std::cerr << "Allocating memory on heap for wireless-dev logger has failed! Please check if this host has enough memory." << std::endl;
        return;
    }

    set_levels(console_level, file_level, flush_level);
    spdlog::set_default_logger(m_wdev_logger);
}

void WdevLogger::set_levels(spdlog::level::level_enum console_level, spdlog::level::level_enum file_level,
    spdlog::level::level_enum flush_level)
{
    m_console_sink->set_level(console_level);
    m_main_log_file_sink->set_level(file_level);
    m_wdev_logger->flush_on(flush_level);

    // Setting logger level to min active level, as traces will only show if the sink level is set to their level
    m_wdev_logger->set_level(static_cast<spdlog::level::level_enum>(SPDLOG_ACTIVE_LEVEL));
}

} /* namespace wdev */
