/*
 * logging_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logging_manager.hpp"

#include "sink_factory.hpp"

namespace netfleet::logging {

auto LoggingManager::getInstance() -> LoggingManager& {
    static LoggingManager instance;
    return instance;
}

void LoggingManager::initialize(const LoggingConfig& config) {
    std::lock_guard lock(mutex_);

    if (initialized_) {
        spdlog::warn("LoggingManager already initialized, reinitializing...");
        spdlog::drop_all();
        sinks_.clear();
    }

    config_ = config;

    sinks_ = SinkFactory::createSinks(config);

    auto logger = std::make_shared<spdlog::logger>("netfleet", sinks_.begin(),
                                                   sinks_.end());
    logger->set_level(config.level);
    logger->set_pattern(config.pattern);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    initialized_ = true;
    spdlog::info("LoggingManager initialized with {} sinks", sinks_.size());
}

void LoggingManager::shutdown() {
    std::lock_guard lock(mutex_);
    if (!initialized_) {
        return;
    }
    spdlog::info("LoggingManager shutting down...");
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& logger) {
        logger->flush();
    });
    spdlog::drop_all();
    sinks_.clear();

    // drop_all() also clears the default logger; later log calls need one
    installConsoleLogger(config_);
    initialized_ = false;
}

void LoggingManager::installConsoleLogger(const LoggingConfig& config) {
    auto logger = std::make_shared<spdlog::logger>(
        "netfleet", SinkFactory::createConsoleSink(config));
    logger->set_level(config.level);
    spdlog::set_default_logger(logger);
}

auto LoggingManager::isInitialized() const -> bool {
    std::lock_guard lock(mutex_);
    return initialized_;
}

auto LoggingManager::getLogger(const std::string& name)
    -> std::shared_ptr<spdlog::logger> {
    std::lock_guard lock(mutex_);
    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    auto logger =
        std::make_shared<spdlog::logger>(name, sinks_.begin(), sinks_.end());
    logger->set_level(config_.level);
    logger->set_pattern(config_.pattern);
    spdlog::register_logger(logger);
    return logger;
}

void LoggingManager::setGlobalLevel(spdlog::level::level_enum level) {
    std::lock_guard lock(mutex_);
    config_.level = level;
    spdlog::set_level(level);
}

auto LoggingManager::getConfig() const -> LoggingConfig {
    std::lock_guard lock(mutex_);
    return config_;
}

}  // namespace netfleet::logging
