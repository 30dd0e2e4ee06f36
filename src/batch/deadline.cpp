/*
 * deadline.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "deadline.hpp"

#include <format>
#include <functional>
#include <future>
#include <thread>

#include <spdlog/spdlog.h>

#include "common/exceptions.hpp"

namespace netfleet::batch {

namespace {

auto awaitWithDeadline(const std::string& command,
                       std::chrono::milliseconds deadline,
                       std::function<BatchResult()> run) -> BatchResult {
    auto promise = std::make_shared<std::promise<BatchResult>>();
    auto future = promise->get_future();

    // Detached so an overrunning batch does not block the caller; it owns
    // copies of everything it touches
    std::thread([run = std::move(run), promise]() {
        try {
            promise->set_value(run());
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (future.wait_for(deadline) == std::future_status::timeout) {
        spdlog::error("Batch '{}' exceeded its {} ms deadline", command,
                      deadline.count());
        THROW_BATCH_DEADLINE(std::format(
            "Batch execution of '{}' exceeded deadline of {} ms", command,
            deadline.count()));
    }
    return future.get();
}

}  // namespace

auto runBatchWithDeadline(std::shared_ptr<BatchOrchestrator> orchestrator,
                          const std::string& command,
                          const std::optional<std::vector<std::string>>& devices,
                          const ExecutionScope& scope,
                          std::chrono::milliseconds deadline,
                          ProgressCallback progress) -> BatchResult {
    return awaitWithDeadline(
        command, deadline,
        [orchestrator = std::move(orchestrator), command, devices, scope,
         progress = std::move(progress)]() {
            return orchestrator->runBatch(command, devices, scope, progress);
        });
}

auto runGroupCommandWithDeadline(
    std::shared_ptr<BatchOrchestrator> orchestrator, const std::string& command,
    const std::string& group, const ExecutionScope& scope,
    std::chrono::milliseconds deadline, ProgressCallback progress)
    -> BatchResult {
    return awaitWithDeadline(
        command, deadline,
        [orchestrator = std::move(orchestrator), command, group, scope,
         progress = std::move(progress)]() {
            return orchestrator->runGroupCommand(command, group, scope,
                                                 progress);
        });
}

}  // namespace netfleet::batch
