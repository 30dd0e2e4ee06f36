/*
 * task_registry.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-2

Description: Async task lifecycle registry

**************************************************/

#ifndef NETFLEET_SERVER_TASK_REGISTRY_HPP
#define NETFLEET_SERVER_TASK_REGISTRY_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "atom/type/json.hpp"

#include "config/settings.hpp"
#include "eventloop.hpp"

namespace netfleet::server {

using json = nlohmann::json;

enum class TaskStatus : uint8_t { Pending, Running, Completed, Failed, Cancelled };

[[nodiscard]] auto taskStatusToString(TaskStatus status) -> std::string;

[[nodiscard]] auto taskStatusFromString(std::string_view text)
    -> std::optional<TaskStatus>;

[[nodiscard]] constexpr auto isTerminalStatus(TaskStatus status) noexcept
    -> bool {
    return status == TaskStatus::Completed || status == TaskStatus::Failed ||
           status == TaskStatus::Cancelled;
}

/**
 * @brief Progress of a running task
 */
struct TaskProgress {
    double percentage{0.0};  ///< 0-100, two decimals
    std::string stage{"Waiting to start"};
    json details = json::object();

    [[nodiscard]] auto toJson() const -> json;
};

/**
 * @brief Immutable copy of a task taken under the registry lock
 */
struct TaskSnapshot {
    std::string id;
    std::string kind;
    TaskStatus status{TaskStatus::Pending};
    json payload;
    TaskProgress progress;
    std::chrono::system_clock::time_point createdAt;
    std::optional<std::chrono::system_clock::time_point> startedAt;
    std::optional<std::chrono::system_clock::time_point> completedAt;
    std::optional<json> result;        ///< Only when Completed
    std::optional<std::string> error;  ///< Only when Failed or Cancelled

    [[nodiscard]] auto isActive() const noexcept -> bool {
        return !isTerminalStatus(status);
    }

    [[nodiscard]] auto isTerminal() const noexcept -> bool {
        return isTerminalStatus(status);
    }

    /**
     * @brief Seconds between start and completion, if both happened
     */
    [[nodiscard]] auto executionTimeSeconds() const -> std::optional<double>;

    [[nodiscard]] auto toJson() const -> json;
};

namespace detail {
class TaskRegistryState;
}  // namespace detail

/**
 * @brief Handle given to a running task body
 */
class TaskContext {
public:
    [[nodiscard]] auto id() const noexcept -> const std::string& {
        return id_;
    }

    [[nodiscard]] auto payload() const noexcept -> const json& {
        return payload_;
    }

    /**
     * @brief Report progress; ignored unless the task is still running
     */
    auto updateProgress(std::optional<double> percentage,
                        std::optional<std::string> stage = std::nullopt,
                        const json& details = json::object()) -> bool;

    /**
     * @brief Whether the task was cancelled while running
     */
    [[nodiscard]] auto isCancelled() const -> bool;

private:
    friend class detail::TaskRegistryState;

    TaskContext(std::shared_ptr<detail::TaskRegistryState> state,
                std::string id, json payload);

    std::shared_ptr<detail::TaskRegistryState> state_;
    std::string id_;
    json payload_;
};

/**
 * @brief Creates, tracks and reclaims asynchronous tasks.
 *
 * Task bodies run on the shared EventLoop. Every mutation happens under one
 * lock and follows PENDING -> RUNNING -> {COMPLETED | FAILED | CANCELLED};
 * terminal states never change. Cancellation only marks the task; a body
 * still running finishes and its result is dropped. Terminal tasks older
 * than the TTL (measured from completion) are removed by the cleanup loop.
 */
class TaskRegistry {
public:
    using Runner = std::function<json(TaskContext&)>;

    explicit TaskRegistry(std::shared_ptr<EventLoop> event_loop,
                          config::TaskConfig config = {});
    ~TaskRegistry();

    TaskRegistry(const TaskRegistry&) = delete;
    TaskRegistry& operator=(const TaskRegistry&) = delete;

    /**
     * @brief Register the body used for tasks of a kind
     */
    void registerHandler(const std::string& kind, Runner runner);

    [[nodiscard]] auto hasHandler(const std::string& kind) const -> bool;

    /**
     * @brief Create a task using the handler registered for its kind.
     *
     * A kind with no handler yields a task that is already FAILED.
     *
     * @return Generated task ID
     */
    auto createTask(const std::string& kind, const json& payload)
        -> std::string;

    /**
     * @brief Create a task with an explicit body
     */
    auto createTask(const std::string& kind, const json& payload,
                    Runner runner) -> std::string;

    [[nodiscard]] auto getTask(const std::string& id) const
        -> std::optional<TaskSnapshot>;

    /**
     * @brief List tasks newest first.
     *
     * @param status Only tasks in this state
     * @param kind   Only tasks of this kind
     * @param limit  Maximum number returned (0 = all)
     */
    [[nodiscard]] auto listTasks(std::optional<TaskStatus> status = std::nullopt,
                                 std::optional<std::string> kind = std::nullopt,
                                 size_t limit = 0) const
        -> std::vector<TaskSnapshot>;

    /**
     * @brief PENDING -> RUNNING
     */
    auto startTask(const std::string& id) -> bool;

    /**
     * @brief Update progress of a RUNNING task; a no-op otherwise.
     *
     * The percentage is clamped to 0-100; details are merged.
     */
    auto updateProgress(const std::string& id,
                        std::optional<double> percentage,
                        std::optional<std::string> stage = std::nullopt,
                        const json& details = json::object()) -> bool;

    auto completeTask(const std::string& id, json result) -> bool;

    auto failTask(const std::string& id, const std::string& error) -> bool;

    /**
     * @brief Cancel an active task
     * @return false if the task is unknown or already terminal
     */
    auto cancelTask(const std::string& id,
                    const std::string& reason = "Cancelled by user") -> bool;

    /**
     * @brief Remove terminal tasks completed more than the TTL ago
     * @return Number of removed tasks
     */
    auto sweepExpired() -> size_t;

    /**
     * @brief Start the periodic sweep thread
     */
    void startCleanupLoop();

    void stopCleanupLoop();

    [[nodiscard]] auto isCleanupLoopRunning() const -> bool;

    [[nodiscard]] auto stats() const -> json;

    [[nodiscard]] auto size() const -> size_t;

private:
    std::shared_ptr<detail::TaskRegistryState> state_;
    std::jthread cleanup_thread_;
};

}  // namespace netfleet::server

#endif  // NETFLEET_SERVER_TASK_REGISTRY_HPP
