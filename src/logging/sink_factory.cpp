/*
 * sink_factory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sink_factory.hpp"

#include <filesystem>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace netfleet::logging {

auto SinkFactory::createConsoleSink(const LoggingConfig& config)
    -> spdlog::sink_ptr {
    spdlog::sink_ptr sink;
    if (config.console_color) {
        sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    } else {
        sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
    }
    sink->set_level(config.level);
    if (!config.pattern.empty()) {
        sink->set_pattern(config.pattern);
    }
    return sink;
}

auto SinkFactory::createFileSink(const LoggingConfig& config)
    -> spdlog::sink_ptr {
    std::filesystem::create_directories(config.log_dir);
    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        config.filePath(), config.max_file_size, config.max_files);
    sink->set_level(config.level);
    if (!config.pattern.empty()) {
        sink->set_pattern(config.pattern);
    }
    return sink;
}

auto SinkFactory::createSinks(const LoggingConfig& config)
    -> std::vector<spdlog::sink_ptr> {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.enable_console) {
        sinks.push_back(createConsoleSink(config));
    }
    if (!config.enable_file) {
        return sinks;
    }

    try {
        sinks.push_back(createFileSink(config));
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::error("Failed to create file sink '{}': {}", config.filePath(),
                      e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Failed to create log directory '{}': {}",
                      config.log_dir, e.what());
    }
    return sinks;
}

}  // namespace netfleet::logging
