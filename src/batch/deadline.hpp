/*
 * deadline.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef NETFLEET_BATCH_DEADLINE_HPP
#define NETFLEET_BATCH_DEADLINE_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "orchestrator.hpp"

namespace netfleet::batch {

/**
 * @brief Run a batch with a hard wall-clock deadline.
 *
 * The batch runs on its own thread. When the deadline expires the call
 * throws and the batch keeps running in the background; its result is
 * discarded and its sessions are left to later health checks.
 *
 * @throws BatchDeadlineException when the deadline expires first
 */
auto runBatchWithDeadline(std::shared_ptr<BatchOrchestrator> orchestrator,
                          const std::string& command,
                          const std::optional<std::vector<std::string>>& devices,
                          const ExecutionScope& scope,
                          std::chrono::milliseconds deadline,
                          ProgressCallback progress = {}) -> BatchResult;

/**
 * @brief runGroupCommand() under the same deadline rules
 *
 * @throws BatchDeadlineException when the deadline expires first
 */
auto runGroupCommandWithDeadline(
    std::shared_ptr<BatchOrchestrator> orchestrator, const std::string& command,
    const std::string& group, const ExecutionScope& scope,
    std::chrono::milliseconds deadline, ProgressCallback progress = {})
    -> BatchResult;

}  // namespace netfleet::batch

#endif  // NETFLEET_BATCH_DEADLINE_HPP
