/*
 * batch_tasks.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "batch_tasks.hpp"

#include <format>
#include <mutex>
#include <unordered_set>

#include <spdlog/spdlog.h>

#include "atom/error/exception.hpp"
#include "batch/deadline.hpp"
#include "common/exceptions.hpp"

namespace netfleet::server {

namespace {

auto optionalAddresses(const json& payload, const char* key)
    -> std::optional<std::vector<std::string>> {
    if (!payload.contains(key) || payload[key].is_null()) {
        return std::nullopt;
    }
    if (!payload[key].is_array()) {
        THROW_TASK_PAYLOAD_ERROR(
            std::format("'{}' must be a list of device addresses", key));
    }
    std::vector<std::string> out;
    for (const auto& item : payload[key]) {
        if (!item.is_string()) {
            THROW_TASK_PAYLOAD_ERROR(
                std::format("'{}' must contain only strings", key));
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

auto countTargets(const batch::BatchOrchestrator& orchestrator,
                  const std::optional<std::vector<std::string>>& devices,
                  const batch::ExecutionScope& scope) -> size_t {
    const auto& inventory = orchestrator.inventory();
    size_t count = 0;
    if (devices) {
        std::unordered_set<std::string> seen;
        for (const auto& address : *devices) {
            if (inventory.contains(address) && scope.allows(address) &&
                seen.insert(address).second) {
                ++count;
            }
        }
        return count;
    }
    for (const auto& address : inventory.addresses()) {
        if (scope.allows(address)) {
            ++count;
        }
    }
    return count;
}

}  // namespace

auto runBatchTask(TaskContext& context,
                  const std::shared_ptr<batch::BatchOrchestrator>& orchestrator)
    -> json {
    const auto& payload = context.payload();
    if (!payload.contains("command") || !payload["command"].is_string()) {
        THROW_TASK_PAYLOAD_ERROR("batch_execute requires a 'command' string");
    }
    auto command = payload["command"].get<std::string>();
    auto scope = batch::ExecutionScope::fromJson(
        payload.value("scope", json(nullptr)));
    auto devices = optionalAddresses(payload, "devices");

    // An explicit device list takes precedence over a group
    std::optional<std::string> group;
    if (!devices && payload.contains("group") && payload["group"].is_string()) {
        group = payload["group"].get<std::string>();
    }

    context.updateProgress(5.0, "Starting batch execution");

    auto total = countTargets(
        *orchestrator,
        group ? std::optional(orchestrator->inventory().membersOf(*group))
              : devices,
        scope);
    context.updateProgress(10.0,
                           std::format("Dispatching to {} devices", total));

    // The context is copied so late progress from a batch that outlived its
    // deadline still lands on a valid registry. Workers finish in any order;
    // only a higher completion count is reported.
    struct Reported {
        std::mutex mutex;
        size_t completed{0};
    };
    batch::ProgressCallback progress =
        [ctx = context, reported = std::make_shared<Reported>()](
            size_t completed, size_t count,
            const std::string& device) mutable {
            std::lock_guard lock(reported->mutex);
            if (completed <= reported->completed) {
                return;
            }
            reported->completed = completed;
            double pct =
                10.0 + 70.0 * static_cast<double>(completed) /
                           static_cast<double>(count == 0 ? 1 : count);
            ctx.updateProgress(pct, std::format("Completed {}/{} devices",
                                                completed, count),
                               json{{"last_device", device}});
        };

    batch::BatchResult result;
    if (payload.contains("timeout_seconds") &&
        payload["timeout_seconds"].is_number() &&
        payload["timeout_seconds"].get<double>() > 0) {
        auto deadline = std::chrono::milliseconds(static_cast<int64_t>(
            payload["timeout_seconds"].get<double>() * 1000.0));
        result = group ? batch::runGroupCommandWithDeadline(
                             orchestrator, command, *group, scope, deadline,
                             progress)
                       : batch::runBatchWithDeadline(orchestrator, command,
                                                     devices, scope, deadline,
                                                     progress);
    } else if (group) {
        result =
            orchestrator->runGroupCommand(command, *group, scope, progress);
    } else {
        result = orchestrator->runBatch(command, devices, scope, progress);
    }

    context.updateProgress(90.0, "Aggregating results");
    return result.toJson();
}

auto runHealthCheckTask(TaskContext& context,
                        batch::BatchOrchestrator& orchestrator) -> json {
    auto devices = optionalAddresses(context.payload(), "devices");
    auto scope = batch::ExecutionScope::fromJson(
        context.payload().value("scope", json(nullptr)));

    context.updateProgress(10.0, "Checking device connectivity");
    auto results = orchestrator.healthCheckDevices(devices, scope);

    json out = json::object();
    size_t healthy = 0;
    for (const auto& [address, ok] : results) {
        out[address] = ok;
        if (ok) {
            ++healthy;
        }
    }
    context.updateProgress(90.0, "Aggregating results");
    return {{"results", out},
            {"healthy", healthy},
            {"unhealthy", results.size() - healthy}};
}

void registerBatchHandlers(
    TaskRegistry& registry,
    std::shared_ptr<batch::BatchOrchestrator> orchestrator) {
    if (!orchestrator) {
        THROW_INVALID_ARGUMENT("Batch handlers require an orchestrator");
    }
    registry.registerHandler(
        kBatchExecuteTask, [orchestrator](TaskContext& context) -> json {
            return runBatchTask(context, orchestrator);
        });
    registry.registerHandler(
        kHealthCheckTask, [orchestrator](TaskContext& context) -> json {
            return runHealthCheckTask(context, *orchestrator);
        });
    spdlog::info("Registered {} and {} task handlers", kBatchExecuteTask,
                 kHealthCheckTask);
}

}  // namespace netfleet::server
