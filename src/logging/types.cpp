/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace netfleet::logging {

auto levelFromString(const std::string& level) -> spdlog::level::level_enum {
    std::string lower = level;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "warning") {
        return spdlog::level::warn;
    }
    if (lower == "error") {
        return spdlog::level::err;
    }
    auto parsed = spdlog::level::from_str(lower);
    // from_str maps unknown names to off
    if (parsed == spdlog::level::off && lower != "off") {
        return spdlog::level::info;
    }
    return parsed;
}

auto levelToString(spdlog::level::level_enum level) -> std::string {
    auto view = spdlog::level::to_string_view(level);
    return std::string(view.data(), view.size());
}

// ============================================================================
// LoggingConfig Implementation
// ============================================================================

auto LoggingConfig::toJson() const -> nlohmann::json {
    return {{"level", levelToString(level)},
            {"pattern", pattern},
            {"enable_console", enable_console},
            {"console_color", console_color},
            {"enable_file", enable_file},
            {"log_dir", log_dir},
            {"log_filename", log_filename},
            {"max_file_size", max_file_size},
            {"max_files", max_files}};
}

auto LoggingConfig::fromJson(const nlohmann::json& j) -> LoggingConfig {
    LoggingConfig config;
    config.level = levelFromString(j.value("level", "info"));
    config.pattern = j.value("pattern", config.pattern);
    config.enable_console = j.value("enable_console", config.enable_console);
    config.console_color = j.value("console_color", config.console_color);
    config.enable_file = j.value("enable_file", config.enable_file);
    config.log_dir = j.value("log_dir", config.log_dir);
    config.log_filename = j.value("log_filename", config.log_filename);
    config.max_file_size = j.value("max_file_size", config.max_file_size);
    config.max_files = j.value("max_files", config.max_files);
    return config;
}

auto LoggingConfig::filePath() const -> std::string {
    return (std::filesystem::path(log_dir) / (log_filename + ".log"))
        .string();
}

}  // namespace netfleet::logging
