/*
 * orchestrator.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-2

Description: Concurrent command dispatch across the device fleet

**************************************************/

#ifndef NETFLEET_BATCH_ORCHESTRATOR_HPP
#define NETFLEET_BATCH_ORCHESTRATOR_HPP

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "batch_result.hpp"
#include "config/settings.hpp"
#include "device/inventory.hpp"
#include "network/command_validator.hpp"
#include "network/connection_pool.hpp"
#include "network/output_limiter.hpp"
#include "network/result_cache.hpp"
#include "scope.hpp"

namespace netfleet::server {
class EventLoop;
}

namespace netfleet::batch {

/**
 * @brief Called from a worker thread after each device finishes
 */
using ProgressCallback = std::function<void(
    size_t completed, size_t total, const std::string& device)>;

/**
 * @brief Runs one command across many devices.
 *
 * Per-device work runs on a fixed-size worker pool owned by the
 * orchestrator. Each device is served from the result cache when the
 * command is cacheable, otherwise over a pooled session. A transport
 * failure is retried once on a fresh session; any other failure is final.
 * Per-device failures never abort the batch.
 */
class BatchOrchestrator {
public:
    BatchOrchestrator(std::shared_ptr<const device::Inventory> inventory,
                      std::shared_ptr<network::ConnectionPool> pool,
                      std::shared_ptr<network::ResultCache> cache,
                      network::CommandValidator validator,
                      config::DispatchConfig dispatch = {},
                      config::OutputConfig output = {});
    ~BatchOrchestrator();

    BatchOrchestrator(const BatchOrchestrator&) = delete;
    BatchOrchestrator& operator=(const BatchOrchestrator&) = delete;

    /**
     * @brief Run a command on the given devices, or on all devices.
     *
     * @param command Command text, validated once for the whole batch
     * @param devices Target addresses; nullopt means the full inventory
     * @param scope   Restriction intersected with the targets
     * @param progress Optional per-device completion callback
     * @return Always a complete result; pre-dispatch rejections carry a
     *         single classified error and zero devices
     */
    auto runBatch(const std::string& command,
                  const std::optional<std::vector<std::string>>& devices =
                      std::nullopt,
                  const ExecutionScope& scope = {},
                  const ProgressCallback& progress = {}) -> BatchResult;

    /**
     * @brief Run a command on every member of an inventory group
     */
    auto runGroupCommand(const std::string& command, const std::string& group,
                         const ExecutionScope& scope = {},
                         const ProgressCallback& progress = {})
        -> BatchResult;

    /**
     * @brief Open (or reuse) and probe a session for each device.
     *
     * Unhealthy sessions are evicted.
     */
    auto healthCheckDevices(
        const std::optional<std::vector<std::string>>& devices = std::nullopt,
        const ExecutionScope& scope = {}) -> std::map<std::string, bool>;

    /**
     * @brief Drop expired sessions and probe pooled sessions of the targets.
     *
     * @return Number of targets whose pooled session failed its probe
     */
    auto cleanupFailedConnections(const std::vector<std::string>& targets)
        -> size_t;

    [[nodiscard]] auto inventory() const -> const device::Inventory& {
        return *inventory_;
    }

    [[nodiscard]] auto pool() const -> network::ConnectionPool& {
        return *pool_;
    }

    [[nodiscard]] auto cache() const -> network::ResultCache& {
        return *cache_;
    }

private:
    struct Attempt {
        bool ok{false};
        std::string output;
        std::string error;
        bool transport{false};
    };

    struct DeviceOutcome {
        std::string device;
        bool success{false};
        std::string output;
        std::string error;
        bool cacheHit{false};
    };

    auto resolveTargets(const std::vector<std::string>& requested,
                        const ExecutionScope& scope) const
        -> std::vector<const device::Device*>;

    auto dispatch(const std::string& command,
                  const std::vector<const device::Device*>& targets,
                  const ProgressCallback& progress) -> BatchResult;

    auto runUnit(const device::Device& device, const std::string& command,
                 bool cacheable) -> DeviceOutcome;

    auto attempt(const device::Device& device, const std::string& command,
                 bool cacheable) -> Attempt;

    std::shared_ptr<const device::Inventory> inventory_;
    std::shared_ptr<network::ConnectionPool> pool_;
    std::shared_ptr<network::ResultCache> cache_;
    network::CommandValidator validator_;
    network::OutputLimiter limiter_;
    config::DispatchConfig dispatch_;
    std::unique_ptr<server::EventLoop> workers_;
};

}  // namespace netfleet::batch

#endif  // NETFLEET_BATCH_ORCHESTRATOR_HPP
