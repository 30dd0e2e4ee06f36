/*
 * fake_fleet.hpp - Three-device fleet wired to scripted sessions
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef NETFLEET_TESTS_FAKE_FLEET_HPP
#define NETFLEET_TESTS_FAKE_FLEET_HPP

#include <memory>

#include "batch/orchestrator.hpp"
#include "device/inventory.hpp"
#include "fake_session.hpp"

namespace netfleet::testing {

inline constexpr const char* kDeviceA = "10.0.0.1";
inline constexpr const char* kDeviceB = "10.0.0.2";
inline constexpr const char* kDeviceC = "10.0.0.3";

inline auto fleetInventoryJson() -> nlohmann::json {
    return {{"devices",
             {{{"ip", kDeviceA},
               {"name", "core-sw-01"},
               {"platform", "cisco_xe"},
               {"username", "admin"},
               {"password", "secret"}},
              {{"ip", kDeviceB},
               {"name", "core-sw-02"},
               {"platform", "cisco_xe"},
               {"username", "admin"},
               {"password", "secret"}},
              {{"ip", kDeviceC},
               {"name", "access-sw-01"},
               {"platform", "cisco_ios"},
               {"groups", {"access"}},
               {"username", "admin"},
               {"password", "secret"}}}}};
}

inline auto fleetGroupsJson() -> nlohmann::json {
    return {{"groups",
             {{{"name", "core"},
               {"description", "Core switches"},
               {"devices", {kDeviceA, kDeviceB}}}}}};
}

/**
 * @brief Inventory, scripted pool, cache and orchestrator in one place
 */
struct FakeFleet {
    explicit FakeFleet(
        nlohmann::json devices = fleetInventoryJson(),
        nlohmann::json groups = fleetGroupsJson(),
        config::PoolConfig poolConfig = defaultPoolConfig(),
        config::DispatchConfig dispatch = defaultDispatchConfig()) {
        factory = std::make_shared<FakeSessionFactory>();
        inventory = std::make_shared<const device::Inventory>(
            device::Inventory::fromJson(devices, groups));
        pool = std::make_shared<network::ConnectionPool>(
            factory, device::CredentialResolver{}, poolConfig);
        cache = std::make_shared<network::ResultCache>(config::CacheConfig{});
        orchestrator = std::make_shared<batch::BatchOrchestrator>(
            inventory, pool, cache,
            network::CommandValidator(config::SecurityConfig{}), dispatch,
            config::OutputConfig{});
    }

    static auto defaultPoolConfig() -> config::PoolConfig {
        config::PoolConfig config;
        config.maxConnections = 5;
        config.acquireTimeoutMs = 2000;
        return config;
    }

    static auto defaultDispatchConfig() -> config::DispatchConfig {
        config::DispatchConfig config;
        config.workers = 4;
        config.commandTimeoutSeconds = 2;
        return config;
    }

    auto script() -> FakeScript& { return factory->script(); }

    std::shared_ptr<FakeSessionFactory> factory;
    std::shared_ptr<const device::Inventory> inventory;
    std::shared_ptr<network::ConnectionPool> pool;
    std::shared_ptr<network::ResultCache> cache;
    std::shared_ptr<batch::BatchOrchestrator> orchestrator;
};

}  // namespace netfleet::testing

#endif  // NETFLEET_TESTS_FAKE_FLEET_HPP
