/*
 * orchestrator.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-2

Description: Batch orchestrator implementation

**************************************************/

#include "orchestrator.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <format>
#include <future>
#include <unordered_set>

#include <spdlog/spdlog.h>

#include "atom/error/exception.hpp"

#include "common/exceptions.hpp"
#include "server/eventloop.hpp"

namespace netfleet::batch {

namespace {

auto trim(const std::string& text) -> std::string {
    auto begin = std::find_if_not(text.begin(), text.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c));
    });
    auto end = std::find_if_not(text.rbegin(), text.rend(), [](char c) {
                   return std::isspace(static_cast<unsigned char>(c));
               }).base();
    return begin < end ? std::string(begin, end) : std::string{};
}

}  // namespace

BatchOrchestrator::BatchOrchestrator(
    std::shared_ptr<const device::Inventory> inventory,
    std::shared_ptr<network::ConnectionPool> pool,
    std::shared_ptr<network::ResultCache> cache,
    network::CommandValidator validator, config::DispatchConfig dispatch,
    config::OutputConfig output)
    : inventory_(std::move(inventory)),
      pool_(std::move(pool)),
      cache_(std::move(cache)),
      validator_(std::move(validator)),
      limiter_(output),
      dispatch_(dispatch) {
    if (!inventory_ || !pool_ || !cache_) {
        THROW_INVALID_ARGUMENT(
            "BatchOrchestrator requires an inventory, a pool and a cache");
    }

    // Evicting a session drops its cached output in the same critical section
    pool_->setEvictionListener(
        [cache = cache_](const std::string& device) {
            cache->invalidate(device);
        });

    workers_ = std::make_unique<server::EventLoop>(dispatch_.workers);
    spdlog::info("BatchOrchestrator ready: {} devices, {} workers",
                 inventory_->size(), workers_->threadCount());
}

BatchOrchestrator::~BatchOrchestrator() {
    workers_->stop();
    pool_->setEvictionListener({});
}

auto BatchOrchestrator::resolveTargets(
    const std::vector<std::string>& requested,
    const ExecutionScope& scope) const -> std::vector<const device::Device*> {
    std::vector<const device::Device*> targets;
    std::unordered_set<std::string> seen;

    for (const auto& raw : requested) {
        auto address = trim(raw);
        if (address.empty() || !seen.insert(address).second) {
            continue;
        }
        if (!scope.allows(address)) {
            spdlog::warn("Device {} is outside the execution scope, skipped",
                         address);
            continue;
        }
        const auto* device = inventory_->find(address);
        if (device == nullptr) {
            spdlog::warn("Device {} is not in the inventory, skipped",
                         address);
            continue;
        }
        targets.push_back(device);
    }
    return targets;
}

auto BatchOrchestrator::runBatch(
    const std::string& command,
    const std::optional<std::vector<std::string>>& devices,
    const ExecutionScope& scope, const ProgressCallback& progress)
    -> BatchResult {
    if (auto verdict = validator_.validate(command); !verdict) {
        spdlog::warn("Rejected command '{}': {}", command, verdict.reason);
        return BatchResult::rejected(command, "security", verdict.reason);
    }

    auto targets =
        resolveTargets(devices ? *devices : inventory_->addresses(), scope);
    if (targets.empty()) {
        return BatchResult::rejected(
            command, "filter",
            "No matching devices found for the requested targets");
    }

    return dispatch(command, targets, progress);
}

auto BatchOrchestrator::runGroupCommand(const std::string& command,
                                        const std::string& group,
                                        const ExecutionScope& scope,
                                        const ProgressCallback& progress)
    -> BatchResult {
    if (auto verdict = validator_.validate(command); !verdict) {
        spdlog::warn("Rejected command '{}': {}", command, verdict.reason);
        return BatchResult::rejected(command, "security", verdict.reason);
    }

    auto targets = resolveTargets(inventory_->membersOf(group), scope);
    if (targets.empty()) {
        return BatchResult::rejected(
            command, "group", std::format("No devices in group '{}'", group));
    }

    return dispatch(command, targets, progress);
}

auto BatchOrchestrator::dispatch(
    const std::string& command,
    const std::vector<const device::Device*>& targets,
    const ProgressCallback& progress) -> BatchResult {
    if (!pool_->isAccepting()) {
        return BatchResult::rejected(command, "pool",
                                     "Connection pool is shut down");
    }

    const auto start = std::chrono::steady_clock::now();
    const bool cacheable = cache_->isCacheable(command);
    spdlog::info("Running '{}' on {} devices (cacheable: {})", command,
                 targets.size(), cacheable);

    if (targets.size() > 1 && dispatch_.preflightHealthCheck) {
        std::vector<std::string> addresses;
        for (const auto* device : targets) {
            addresses.push_back(device->address);
        }
        cleanupFailedConnections(addresses);
    }

    const auto total = targets.size();
    auto completed = std::make_shared<std::atomic<size_t>>(0);

    std::vector<std::pair<std::string, std::future<DeviceOutcome>>> pending;
    pending.reserve(total);
    for (const auto* device : targets) {
        try {
            pending.emplace_back(
                device->address,
                workers_->post([this, device, &command, cacheable, completed,
                                total, &progress]() {
                    auto outcome = runUnit(*device, command, cacheable);
                    auto done = completed->fetch_add(1) + 1;
                    if (progress) {
                        try {
                            progress(done, total, device->address);
                        } catch (const std::exception& e) {
                            spdlog::warn("Progress callback raised: {}",
                                         e.what());
                        }
                    }
                    return outcome;
                }));
        } catch (const std::exception& e) {
            std::promise<DeviceOutcome> failed;
            failed.set_value(DeviceOutcome{
                device->address, false, {},
                std::format("Failed to schedule {}: {}", device->address,
                            e.what()),
                false});
            pending.emplace_back(device->address, failed.get_future());
        }
    }

    BatchResult result;
    result.command = command;
    result.totalDevices = total;

    for (auto& [address, future] : pending) {
        DeviceOutcome outcome;
        try {
            outcome = future.get();
        } catch (const std::exception& e) {
            outcome = DeviceOutcome{address, false, {},
                                    std::format("Execution on {} aborted: {}",
                                                address, e.what()),
                                    false};
        }

        if (outcome.cacheHit) {
            result.cacheHits++;
        } else {
            result.cacheMisses++;
        }

        if (outcome.success) {
            result.results.emplace(address, std::move(outcome.output));
        } else {
            spdlog::warn("'{}' failed on {}: {}", command, address,
                         outcome.error);
            auto details = network::ErrorClassifier::classify(outcome.error);
            result.errors.emplace(
                address, DeviceFailure{std::move(outcome.error), details});
        }
    }

    result.successfulDevices = result.results.size();
    result.failedDevices = result.errors.size();
    result.executionTimeSeconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start)
            .count();

    spdlog::info(
        "Finished '{}': {}/{} succeeded in {:.2f}s (cache hits {}, misses {})",
        command, result.successfulDevices, result.totalDevices,
        result.executionTimeSeconds, result.cacheHits, result.cacheMisses);
    return result;
}

auto BatchOrchestrator::runUnit(const device::Device& device,
                                const std::string& command, bool cacheable)
    -> DeviceOutcome {
    DeviceOutcome outcome;
    outcome.device = device.address;

    if (cacheable) {
        if (auto cached = cache_->get(device.address, command)) {
            spdlog::debug("Cache hit for '{}' on {}", command, device.address);
            outcome.success = true;
            outcome.output = std::move(*cached);
            outcome.cacheHit = true;
            return outcome;
        }
    }

    auto result = attempt(device, command, cacheable);
    if (!result.ok && result.transport) {
        spdlog::info("Retrying '{}' on {} after transport failure: {}",
                     command, device.address, result.error);
        pool_->evict(device.address);
        result = attempt(device, command, cacheable);
    }

    outcome.success = result.ok;
    outcome.output = std::move(result.output);
    outcome.error = std::move(result.error);
    return outcome;
}

auto BatchOrchestrator::attempt(const device::Device& device,
                                const std::string& command, bool cacheable)
    -> Attempt {
    // Observed before acquire so output from a session evicted meanwhile is
    // never cached
    auto generation = cache_->generation(device.address);

    try {
        auto lease = pool_->acquire(device);
        if (lease.isFresh()) {
            // Evictions during acquire concerned an older session
            generation = cache_->generation(device.address);
        }
        auto reply =
            lease.session().execute(command, dispatch_.commandTimeout());
        if (!reply) {
            const auto& error = reply.error();
            if (error.isTransport()) {
                lease.markBroken();
            }
            return {false, {}, error.message, error.isTransport()};
        }

        auto output = limiter_.apply(command, std::move(*reply));
        lease.release();
        if (cacheable) {
            cache_->put(device.address, command, output, generation);
        }
        return {true, std::move(output), {}, false};
    } catch (const ConnectionException& e) {
        return {false, {}, e.reason(), true};
    } catch (const FleetException& e) {
        // Credentials, login rejection, pool exhaustion: not retried
        return {false, {}, e.reason(), false};
    } catch (const std::exception& e) {
        return {false,
                {},
                std::format("Unexpected error on {}: {}", device.address,
                            e.what()),
                false};
    }
}

auto BatchOrchestrator::cleanupFailedConnections(
    const std::vector<std::string>& targets) -> size_t {
    pool_->cleanupExpired();

    std::vector<std::future<bool>> checks;
    for (const auto& address : targets) {
        if (!pool_->contains(address)) {
            continue;
        }
        try {
            checks.push_back(workers_->post(
                [this, address]() { return pool_->healthCheck(address); }));
        } catch (const std::exception& e) {
            spdlog::warn("Could not schedule health check for {}: {}",
                         address, e.what());
        }
    }

    size_t unhealthy = 0;
    for (auto& check : checks) {
        try {
            if (!check.get()) {
                unhealthy++;
            }
        } catch (const std::exception& e) {
            spdlog::warn("Health check raised: {}", e.what());
            unhealthy++;
        }
    }

    if (unhealthy > 0) {
        spdlog::info("Pre-flight cleanup evicted {} unhealthy connections",
                     unhealthy);
    }
    return unhealthy;
}

auto BatchOrchestrator::healthCheckDevices(
    const std::optional<std::vector<std::string>>& devices,
    const ExecutionScope& scope) -> std::map<std::string, bool> {
    auto targets =
        resolveTargets(devices ? *devices : inventory_->addresses(), scope);

    std::vector<std::pair<std::string, std::future<bool>>> checks;
    for (const auto* device : targets) {
        auto probe = [this, device]() -> bool {
            try {
                auto lease = pool_->acquire(*device);
                if (lease.session().probe()) {
                    return true;
                }
                lease.markBroken();
                return false;
            } catch (const std::exception& e) {
                spdlog::warn("Health check of {} failed: {}", device->address,
                             e.what());
                return false;
            }
        };
        try {
            checks.emplace_back(device->address, workers_->post(probe));
        } catch (const std::exception& e) {
            spdlog::warn("Could not schedule health check for {}: {}",
                         device->address, e.what());
            std::promise<bool> failed;
            failed.set_value(false);
            checks.emplace_back(device->address, failed.get_future());
        }
    }

    std::map<std::string, bool> results;
    for (auto& [address, check] : checks) {
        try {
            results[address] = check.get();
        } catch (const std::exception& e) {
            spdlog::warn("Health check of {} raised: {}", address, e.what());
            results[address] = false;
        }
    }
    return results;
}

}  // namespace netfleet::batch
