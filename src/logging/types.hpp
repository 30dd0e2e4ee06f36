/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-2

Description: Logging configuration types

**************************************************/

#ifndef NETFLEET_LOGGING_TYPES_HPP
#define NETFLEET_LOGGING_TYPES_HPP

#include <string>

#include <spdlog/spdlog.h>
#include "atom/type/json.hpp"

namespace netfleet::logging {

/**
 * @brief Logging system configuration
 */
struct LoggingConfig {
    spdlog::level::level_enum level{spdlog::level::info};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v"};

    // Console settings
    bool enable_console{true};
    bool console_color{true};

    // File settings
    bool enable_file{true};
    std::string log_dir{"logs"};
    std::string log_filename{"netfleet"};
    size_t max_file_size{10 * 1024 * 1024};  // 10MB
    size_t max_files{5};

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    [[nodiscard]] static auto fromJson(const nlohmann::json& j)
        -> LoggingConfig;

    /**
     * @brief Full path of the rotating log file
     */
    [[nodiscard]] auto filePath() const -> std::string;
};

/**
 * @brief Parse a level name, falling back to info for unknown names
 */
[[nodiscard]] auto levelFromString(const std::string& level)
    -> spdlog::level::level_enum;

[[nodiscard]] auto levelToString(spdlog::level::level_enum level)
    -> std::string;

}  // namespace netfleet::logging

#endif  // NETFLEET_LOGGING_TYPES_HPP
