/*
 * batch_tasks.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef NETFLEET_SERVER_BATCH_TASKS_HPP
#define NETFLEET_SERVER_BATCH_TASKS_HPP

#include <memory>

#include "batch/orchestrator.hpp"
#include "task_registry.hpp"

namespace netfleet::server {

inline constexpr const char* kBatchExecuteTask = "batch_execute";
inline constexpr const char* kHealthCheckTask = "health_check";

/**
 * @brief Run a batch_execute payload, reporting progress through the context.
 *
 * Payload: {command, devices?, group?, scope?, timeout_seconds?}
 *
 * @throws TaskPayloadException if the command is missing
 * @throws BatchDeadlineException if timeout_seconds elapses first
 */
auto runBatchTask(TaskContext& context,
                  const std::shared_ptr<batch::BatchOrchestrator>& orchestrator)
    -> json;

/**
 * @brief Run a health_check payload {devices?}
 */
auto runHealthCheckTask(TaskContext& context,
                        batch::BatchOrchestrator& orchestrator) -> json;

/**
 * @brief Register batch_execute and health_check on a registry
 */
void registerBatchHandlers(
    TaskRegistry& registry,
    std::shared_ptr<batch::BatchOrchestrator> orchestrator);

}  // namespace netfleet::server

#endif  // NETFLEET_SERVER_BATCH_TASKS_HPP
