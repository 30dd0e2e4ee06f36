/*
 * sink_factory.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef NETFLEET_LOGGING_SINK_FACTORY_HPP
#define NETFLEET_LOGGING_SINK_FACTORY_HPP

#include <vector>

#include <spdlog/spdlog.h>

#include "types.hpp"

namespace netfleet::logging {

/**
 * @brief Builds the sinks behind the fleet logger.
 *
 * Console output goes to stderr; stdout is reserved for command results.
 */
class SinkFactory {
public:
    static auto createConsoleSink(const LoggingConfig& config)
        -> spdlog::sink_ptr;

    /**
     * @brief Rotating file sink at config.filePath(); creates log_dir
     * @throws spdlog::spdlog_ex or std::filesystem::filesystem_error
     */
    static auto createFileSink(const LoggingConfig& config)
        -> spdlog::sink_ptr;

    /**
     * @brief All sinks enabled by the config.
     *
     * A file sink that cannot be opened is reported on the console sink and
     * left out.
     */
    static auto createSinks(const LoggingConfig& config)
        -> std::vector<spdlog::sink_ptr>;
};

}  // namespace netfleet::logging

#endif  // NETFLEET_LOGGING_SINK_FACTORY_HPP
