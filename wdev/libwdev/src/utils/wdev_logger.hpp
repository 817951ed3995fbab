/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file wdev_logger.hpp
 * @brief Class declaration for the wireless-dev logger
 **/

#ifndef _WDEV_LOGGER_HPP_
#define _WDEV_LOGGER_HPP_

#include "wdev/wdev.h"
#include "common/logger_macros.hpp"
#include "common/utils.hpp"
#include "common/env_vars.hpp"

#include <string>
#include <memory>
#include <unordered_map>

namespace wdev
{

class WdevLogger {
public:
#ifdef NDEBUG
    static std::unique_ptr<WdevLogger> &get_instance(spdlog::level::level_enum console_level = spdlog::level::warn,
        spdlog::level::level_enum file_level = spdlog::level::info, spdlog::level::level_enum flush_level = spdlog::level::warn)
#else
    static std::unique_ptr<WdevLogger> &get_instance(spdlog::level::level_enum console_level = spdlog::level::warn,
        spdlog::level::level_enum file_level = spdlog::level::debug, spdlog::level::level_enum flush_level = spdlog::level::debug)
#endif
    {
        static std::unique_ptr<WdevLogger> instance = nullptr;
        auto user_console_logger_level = get_env_variable(WDEV_CONSOLE_LOGGER_LEVEL_ENV_VAR);
        if (user_console_logger_level) {
            auto expected_console_level = get_console_logger_level_from_string(user_console_logger_level.value());
            if (expected_console_level) {
                console_level = expected_console_level.release();
            } else {
                LOGGER__WARNING("Failed to parse console logger level from environment variable: {}, status: {}",
                    user_console_logger_level.value(), expected_console_level.status());
            }
        }
        if (nullptr == instance) {
            instance = make_unique_nothrow<WdevLogger>(console_level, file_level, flush_level);
        }
        return instance;
    }

    WdevLogger(spdlog::level::level_enum console_level, spdlog::level::level_enum file_level, spdlog::level::level_enum flush_level);
    ~WdevLogger() = default;
    WdevLogger(WdevLogger const&) = delete;
    void operator=(WdevLogger const&) = delete;

    // Directory of the log file: $WDEV_LOGGER_PATH, or the config directory. Empty when file logging is disabled.
    static std::string get_main_log_path();
    static std::shared_ptr<spdlog::sinks::sink> create_file_sink(const std::string &dir_path, const std::string &filename);
    static Expected<spdlog::level::level_enum> get_console_logger_level_from_string(const std::string &user_console_logger_level)
    {
        static const std::unordered_map<std::string, spdlog::level::level_enum> log_level_map = {
            {"debug", spdlog::level::debug},
            {"info", spdlog::level::info},
            {"warning", spdlog::level::warn},
            {"error", spdlog::level::err},
            {"critical", spdlog::level::critical}
        };
        if(log_level_map.find(user_console_logger_level) != log_level_map.end()) {
            return Expected<spdlog::level::level_enum>(log_level_map.at(user_console_logger_level));
        }
        return make_unexpected(WDEV_INVALID_ARGUMENT);
    }

private:
    void set_levels(spdlog::level::level_enum console_level, spdlog::level::level_enum file_level,
        spdlog::level::level_enum flush_level);

    std::shared_ptr<spdlog::sinks::sink> m_console_sink;
    std::shared_ptr<spdlog::sinks::sink> m_main_log_file_sink;
    std::shared_ptr<spdlog::logger> m_wdev_logger;
};

} /* namespace wdev */

#endif /* _WDEV_LOGGER_HPP_ */
