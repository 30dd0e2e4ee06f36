/*
 * settings.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "settings.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>

#include <spdlog/spdlog.h>

#include "common/exceptions.hpp"

namespace netfleet::config {

namespace {

auto sectionOf(const json& j, const char* key) -> json {
    if (j.contains(key) && j[key].is_object()) {
        return j[key];
    }
    return json::object();
}

auto readUnsignedEnv(const char* name) -> std::optional<size_t> {
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') {
        return std::nullopt;
    }
    std::string_view text(raw);
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(),
                                     value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        spdlog::warn("Ignoring non-numeric value '{}' for {}", text, name);
        return std::nullopt;
    }
    return value;
}

}  // namespace

auto Settings::toJson() const -> json {
    json creds = json::object();
    for (const auto& [name, set] : credentials) {
        creds[name] = set.toJson();
    }
    return {{"pool", pool.toJson()},
            {"cache", cache.toJson()},
            {"dispatch", dispatch.toJson()},
            {"output", output.toJson()},
            {"security", security.toJson()},
            {"tasks", tasks.toJson()},
            {"transport", transport.toJson()},
            {"inventory", inventory.toJson()},
            {"logging", logging.toJson()},
            {"credentials", creds}};
}

auto Settings::fromJson(const json& j) -> Settings {
    Settings settings;
    settings.pool = PoolConfig::fromJson(sectionOf(j, "pool"));
    settings.cache = CacheConfig::fromJson(sectionOf(j, "cache"));
    settings.dispatch = DispatchConfig::fromJson(sectionOf(j, "dispatch"));
    settings.output = OutputConfig::fromJson(sectionOf(j, "output"));
    settings.security = SecurityConfig::fromJson(sectionOf(j, "security"));
    settings.tasks = TaskConfig::fromJson(sectionOf(j, "tasks"));
    settings.transport = TransportConfig::fromJson(sectionOf(j, "transport"));
    settings.inventory = InventoryConfig::fromJson(sectionOf(j, "inventory"));
    settings.logging = ::netfleet::logging::LoggingConfig::fromJson(
        sectionOf(j, "logging"));

    for (const auto& [name, set] : sectionOf(j, "credentials").items()) {
        settings.credentials[name] = CredentialSet::fromJson(set);
    }
    return settings;
}

auto Settings::loadFromFile(const std::string& path) -> Settings {
    if (!std::filesystem::exists(path)) {
        spdlog::warn("Settings file {} not found, using defaults", path);
        return Settings{};
    }

    std::ifstream input(path);
    if (!input.is_open()) {
        THROW_CONFIG_ERROR("Cannot open settings file: " + path);
    }

    try {
        auto document = json::parse(input);
        if (!document.is_object()) {
            THROW_CONFIG_ERROR("Settings file " + path +
                               " must contain a JSON object");
        }
        spdlog::info("Loaded settings from {}", path);
        return fromJson(document);
    } catch (const json::exception& e) {
        THROW_CONFIG_ERROR("Malformed settings file " + path + ": " +
                           e.what());
    }
}

void Settings::applyEnvironment() {
    if (auto v = readUnsignedEnv("NETFLEET_WORKERS")) {
        dispatch.workers = *v;
    }
    if (auto v = readUnsignedEnv("MAX_CONNECTIONS")) {
        if (*v == 0) {
            spdlog::warn("Ignoring MAX_CONNECTIONS=0, at least one connection "
                         "is required");
        } else {
            pool.maxConnections = *v;
        }
    }
    if (auto v = readUnsignedEnv("CONNECTION_TIMEOUT")) {
        pool.idleTimeoutSeconds = *v;
    }
    if (auto v = readUnsignedEnv("COMMAND_TIMEOUT")) {
        dispatch.commandTimeoutSeconds = *v;
    }
    if (auto v = readUnsignedEnv("CACHE_MAX_SIZE")) {
        cache.maxEntries = *v;
    }
    if (auto v = readUnsignedEnv("CACHE_TTL")) {
        cache.ttlSeconds = *v;
    }
    if (auto v = readUnsignedEnv("ASYNC_TASK_CLEANUP_INTERVAL")) {
        tasks.cleanupIntervalSeconds = *v;
    }
    if (auto v = readUnsignedEnv("ASYNC_TASK_TTL")) {
        tasks.taskTtlSeconds = *v;
    }
    if (const char* level = std::getenv("LOG_LEVEL");
        level != nullptr && *level != '\0') {
        logging.level = ::netfleet::logging::levelFromString(level);
    }
}

}  // namespace netfleet::config
