/*
 * logging_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-2

Description: Process-wide spdlog setup

**************************************************/

#ifndef NETFLEET_LOGGING_LOGGING_MANAGER_HPP
#define NETFLEET_LOGGING_LOGGING_MANAGER_HPP

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "types.hpp"

namespace netfleet::logging {

/**
 * @brief Owns the sinks behind the default "netfleet" logger.
 *
 * Components log through the spdlog free functions; initialize() swaps the
 * default logger for one writing to the configured console and rotating
 * file sinks.
 */
class LoggingManager {
public:
    static auto getInstance() -> LoggingManager&;

    /**
     * @brief Replace the default logger with a console-only one.
     *
     * Used before initialize() so early diagnostics stay off stdout.
     */
    static void installConsoleLogger(const LoggingConfig& config = {});

    /**
     * @brief Install sinks and the default logger.
     *
     * Calling it again replaces the previous setup.
     */
    void initialize(const LoggingConfig& config);

    /**
     * @brief Flush and drop all loggers
     */
    void shutdown();

    [[nodiscard]] auto isInitialized() const -> bool;

    /**
     * @brief Get or create a named logger sharing the configured sinks
     */
    auto getLogger(const std::string& name) -> std::shared_ptr<spdlog::logger>;

    void setGlobalLevel(spdlog::level::level_enum level);

    [[nodiscard]] auto getConfig() const -> LoggingConfig;

private:
    LoggingManager() = default;

    mutable std::mutex mutex_;
    LoggingConfig config_;
    std::vector<spdlog::sink_ptr> sinks_;
    bool initialized_{false};
};

}  // namespace netfleet::logging

#endif  // NETFLEET_LOGGING_LOGGING_MANAGER_HPP
