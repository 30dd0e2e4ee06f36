/*
 * settings.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-2

Description: Runtime settings for pool, cache, dispatch and tasks

**************************************************/

#ifndef NETFLEET_CONFIG_SETTINGS_HPP
#define NETFLEET_CONFIG_SETTINGS_HPP

#include <algorithm>
#include <chrono>
#include <map>
#include <string>
#include <vector>

#include "atom/type/json.hpp"

#include "logging/types.hpp"

namespace netfleet::config {

using json = nlohmann::json;

/**
 * @brief Connection pool configuration
 */
struct PoolConfig {
    size_t maxConnections{5};           ///< Live sessions across all devices
    size_t idleTimeoutSeconds{300};     ///< Idle handles older than this expire
    size_t connectTimeoutMs{10000};     ///< Session open timeout
    size_t acquireTimeoutMs{30000};     ///< Wait for a free slot

    [[nodiscard]] auto idleTimeout() const -> std::chrono::seconds {
        return std::chrono::seconds(idleTimeoutSeconds);
    }
    [[nodiscard]] auto connectTimeout() const -> std::chrono::milliseconds {
        return std::chrono::milliseconds(connectTimeoutMs);
    }
    [[nodiscard]] auto acquireTimeout() const -> std::chrono::milliseconds {
        return std::chrono::milliseconds(acquireTimeoutMs);
    }

    [[nodiscard]] json toJson() const {
        return {{"maxConnections", maxConnections},
                {"idleTimeoutSeconds", idleTimeoutSeconds},
                {"connectTimeoutMs", connectTimeoutMs},
                {"acquireTimeoutMs", acquireTimeoutMs}};
    }

    [[nodiscard]] static PoolConfig fromJson(const json& j) {
        PoolConfig cfg;
        cfg.maxConnections = std::max<size_t>(
            j.value("maxConnections", cfg.maxConnections), 1);
        cfg.idleTimeoutSeconds =
            j.value("idleTimeoutSeconds", cfg.idleTimeoutSeconds);
        cfg.connectTimeoutMs = j.value("connectTimeoutMs", cfg.connectTimeoutMs);
        cfg.acquireTimeoutMs = j.value("acquireTimeoutMs", cfg.acquireTimeoutMs);
        return cfg;
    }
};

/**
 * @brief Result cache configuration
 */
struct CacheConfig {
    size_t maxEntries{512};
    size_t ttlSeconds{300};
    std::vector<std::string> cacheableKeywords{"version", "inventory",
                                               "logging"};

    [[nodiscard]] auto ttl() const -> std::chrono::seconds {
        return std::chrono::seconds(ttlSeconds);
    }

    [[nodiscard]] json toJson() const {
        return {{"maxEntries", maxEntries},
                {"ttlSeconds", ttlSeconds},
                {"cacheableKeywords", cacheableKeywords}};
    }

    [[nodiscard]] static CacheConfig fromJson(const json& j) {
        CacheConfig cfg;
        cfg.maxEntries = j.value("maxEntries", cfg.maxEntries);
        cfg.ttlSeconds = j.value("ttlSeconds", cfg.ttlSeconds);
        cfg.cacheableKeywords =
            j.value("cacheableKeywords", cfg.cacheableKeywords);
        return cfg;
    }
};

/**
 * @brief Batch dispatch configuration
 */
struct DispatchConfig {
    size_t workers{5};                  ///< Concurrent device units
    size_t commandTimeoutSeconds{20};   ///< Per-command read timeout
    bool preflightHealthCheck{true};    ///< Probe pooled targets before dispatch

    [[nodiscard]] auto commandTimeout() const -> std::chrono::milliseconds {
        return std::chrono::seconds(commandTimeoutSeconds);
    }

    [[nodiscard]] json toJson() const {
        return {{"workers", workers},
                {"commandTimeoutSeconds", commandTimeoutSeconds},
                {"preflightHealthCheck", preflightHealthCheck}};
    }

    [[nodiscard]] static DispatchConfig fromJson(const json& j) {
        DispatchConfig cfg;
        cfg.workers = j.value("workers", cfg.workers);
        cfg.commandTimeoutSeconds =
            j.value("commandTimeoutSeconds", cfg.commandTimeoutSeconds);
        cfg.preflightHealthCheck =
            j.value("preflightHealthCheck", cfg.preflightHealthCheck);
        return cfg;
    }
};

/**
 * @brief Device output length limits
 */
struct OutputConfig {
    size_t summaryThreshold{10000};
    size_t maxLength{50000};

    [[nodiscard]] json toJson() const {
        return {{"summaryThreshold", summaryThreshold},
                {"maxLength", maxLength}};
    }

    [[nodiscard]] static OutputConfig fromJson(const json& j) {
        OutputConfig cfg;
        cfg.summaryThreshold = j.value("summaryThreshold", cfg.summaryThreshold);
        cfg.maxLength = j.value("maxLength", cfg.maxLength);
        return cfg;
    }
};

/**
 * @brief Command validation policy
 */
struct SecurityConfig {
    std::vector<std::string> allowedPrefixes{"show", "ping", "traceroute"};
    std::vector<std::string> dangerousKeywords{"configure", "write", "delete",
                                               "shutdown"};
    size_t maxCommandLength{200};
    bool strictValidation{true};  ///< Enforce the prefix allow-list

    [[nodiscard]] json toJson() const {
        return {{"allowedPrefixes", allowedPrefixes},
                {"dangerousKeywords", dangerousKeywords},
                {"maxCommandLength", maxCommandLength},
                {"strictValidation", strictValidation}};
    }

    [[nodiscard]] static SecurityConfig fromJson(const json& j) {
        SecurityConfig cfg;
        cfg.allowedPrefixes = j.value("allowedPrefixes", cfg.allowedPrefixes);
        cfg.dangerousKeywords =
            j.value("dangerousKeywords", cfg.dangerousKeywords);
        cfg.maxCommandLength = j.value("maxCommandLength", cfg.maxCommandLength);
        cfg.strictValidation = j.value("strictValidation", cfg.strictValidation);
        return cfg;
    }
};

/**
 * @brief Async task registry configuration
 */
struct TaskConfig {
    size_t workers{4};
    size_t cleanupIntervalSeconds{3600};
    size_t taskTtlSeconds{86400};

    [[nodiscard]] json toJson() const {
        return {{"workers", workers},
                {"cleanupIntervalSeconds", cleanupIntervalSeconds},
                {"taskTtlSeconds", taskTtlSeconds}};
    }

    [[nodiscard]] static TaskConfig fromJson(const json& j) {
        TaskConfig cfg;
        cfg.workers = j.value("workers", cfg.workers);
        cfg.cleanupIntervalSeconds =
            j.value("cleanupIntervalSeconds", cfg.cleanupIntervalSeconds);
        cfg.taskTtlSeconds = j.value("taskTtlSeconds", cfg.taskTtlSeconds);
        return cfg;
    }
};

/**
 * @brief Line-oriented CLI transport configuration
 */
struct TransportConfig {
    int port{23};
    std::vector<std::string> promptSuffixes{"#", ">"};
    std::string paginationCommand{"terminal length 0"};
    std::string usernamePrompt{"sername:"};
    std::string passwordPrompt{"assword:"};

    [[nodiscard]] json toJson() const {
        return {{"port", port},
                {"promptSuffixes", promptSuffixes},
                {"paginationCommand", paginationCommand},
                {"usernamePrompt", usernamePrompt},
                {"passwordPrompt", passwordPrompt}};
    }

    [[nodiscard]] static TransportConfig fromJson(const json& j) {
        TransportConfig cfg;
        cfg.port = j.value("port", cfg.port);
        cfg.promptSuffixes = j.value("promptSuffixes", cfg.promptSuffixes);
        cfg.paginationCommand =
            j.value("paginationCommand", cfg.paginationCommand);
        cfg.usernamePrompt = j.value("usernamePrompt", cfg.usernamePrompt);
        cfg.passwordPrompt = j.value("passwordPrompt", cfg.passwordPrompt);
        return cfg;
    }
};

/**
 * @brief Inventory file locations
 */
struct InventoryConfig {
    std::string devicesFile{"config/devices.json"};
    std::string groupsFile{"config/groups.json"};

    [[nodiscard]] json toJson() const {
        return {{"devicesFile", devicesFile}, {"groupsFile", groupsFile}};
    }

    [[nodiscard]] static InventoryConfig fromJson(const json& j) {
        InventoryConfig cfg;
        cfg.devicesFile = j.value("devicesFile", cfg.devicesFile);
        cfg.groupsFile = j.value("groupsFile", cfg.groupsFile);
        return cfg;
    }
};

/**
 * @brief Named credential set referenced by devices
 */
struct CredentialSet {
    std::string username;
    std::string password;

    [[nodiscard]] json toJson() const {
        return {{"username", username}, {"password", password}};
    }

    [[nodiscard]] static CredentialSet fromJson(const json& j) {
        CredentialSet cfg;
        cfg.username = j.value("username", cfg.username);
        cfg.password = j.value("password", cfg.password);
        return cfg;
    }
};

/**
 * @brief Complete settings document
 */
struct Settings {
    PoolConfig pool;
    CacheConfig cache;
    DispatchConfig dispatch;
    OutputConfig output;
    SecurityConfig security;
    TaskConfig tasks;
    TransportConfig transport;
    InventoryConfig inventory;
    ::netfleet::logging::LoggingConfig logging;
    std::map<std::string, CredentialSet> credentials;

    [[nodiscard]] json toJson() const;

    [[nodiscard]] static Settings fromJson(const json& j);

    /**
     * @brief Load settings from a JSON file.
     *
     * A missing file yields defaults; a malformed one throws ConfigException.
     */
    [[nodiscard]] static Settings loadFromFile(const std::string& path);

    /**
     * @brief Apply environment variable overrides in place.
     *
     * Recognized: NETFLEET_WORKERS, MAX_CONNECTIONS, CONNECTION_TIMEOUT,
     * COMMAND_TIMEOUT, CACHE_MAX_SIZE, CACHE_TTL,
     * ASYNC_TASK_CLEANUP_INTERVAL, ASYNC_TASK_TTL, LOG_LEVEL.
     */
    void applyEnvironment();
};

}  // namespace netfleet::config

#endif  // NETFLEET_CONFIG_SETTINGS_HPP
