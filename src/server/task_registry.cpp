/*
 * task_registry.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "task_registry.hpp"

#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <cstdio>
#include <ctime>
#include <deque>
#include <mutex>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "atom/error/exception.hpp"
#include "atom/utils/uuid.hpp"

#include "common/exceptions.hpp"

namespace netfleet::server {

namespace {

auto formatTimestamp(std::chrono::system_clock::time_point tp)
    -> std::string {
    auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      tp - seconds)
                      .count();
    std::time_t t = std::chrono::system_clock::to_time_t(seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[48];
    std::snprintf(out, sizeof(out), "%s.%03lldZ", buf,
                  static_cast<long long>(millis));
    return out;
}

auto optionalTimestamp(
    const std::optional<std::chrono::system_clock::time_point>& tp) -> json {
    return tp ? json(formatTimestamp(*tp)) : json(nullptr);
}

auto roundPercentage(double value) -> double {
    value = std::clamp(value, 0.0, 100.0);
    return std::round(value * 100.0) / 100.0;
}

}  // namespace

// ============================================================================
// Status / snapshot
// ============================================================================

auto taskStatusToString(TaskStatus status) -> std::string {
    switch (status) {
        case TaskStatus::Pending:
            return "pending";
        case TaskStatus::Running:
            return "running";
        case TaskStatus::Completed:
            return "completed";
        case TaskStatus::Failed:
            return "failed";
        case TaskStatus::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

auto taskStatusFromString(std::string_view text) -> std::optional<TaskStatus> {
    if (text == "pending") {
        return TaskStatus::Pending;
    }
    if (text == "running") {
        return TaskStatus::Running;
    }
    if (text == "completed") {
        return TaskStatus::Completed;
    }
    if (text == "failed") {
        return TaskStatus::Failed;
    }
    if (text == "cancelled") {
        return TaskStatus::Cancelled;
    }
    return std::nullopt;
}

auto TaskProgress::toJson() const -> json {
    return {{"percentage", percentage},
            {"current_stage", stage},
            {"details", details}};
}

auto TaskSnapshot::executionTimeSeconds() const -> std::optional<double> {
    if (!startedAt || !completedAt) {
        return std::nullopt;
    }
    return std::chrono::duration<double>(*completedAt - *startedAt).count();
}

auto TaskSnapshot::toJson() const -> json {
    auto elapsed = executionTimeSeconds();
    return {{"task_id", id},
            {"task_type", kind},
            {"status", taskStatusToString(status)},
            {"payload", payload},
            {"progress", progress.toJson()},
            {"created_at", formatTimestamp(createdAt)},
            {"started_at", optionalTimestamp(startedAt)},
            {"completed_at", optionalTimestamp(completedAt)},
            {"execution_time", elapsed ? json(*elapsed) : json(nullptr)},
            {"result", result ? *result : json(nullptr)},
            {"error", error ? json(*error) : json(nullptr)}};
}

// ============================================================================
// Shared registry state
// ============================================================================

namespace detail {

class TaskRegistryState
    : public std::enable_shared_from_this<TaskRegistryState> {
public:
    TaskRegistryState(std::shared_ptr<EventLoop> loop,
                      config::TaskConfig config)
        : event_loop_(std::move(loop)),
          config_(config),
          started_(std::chrono::steady_clock::now()) {}

    void registerHandler(const std::string& kind, TaskRegistry::Runner runner) {
        std::lock_guard lock(mutex_);
        handlers_[kind] = std::move(runner);
    }

    auto hasHandler(const std::string& kind) const -> bool {
        std::lock_guard lock(mutex_);
        return handlers_.contains(kind);
    }

    auto findHandler(const std::string& kind) const
        -> std::optional<TaskRegistry::Runner> {
        std::lock_guard lock(mutex_);
        auto it = handlers_.find(kind);
        if (it == handlers_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    auto insert(const std::string& kind, const json& payload) -> std::string {
        TaskSnapshot task;
        task.id = atom::utils::UUID().toString();
        task.kind = kind;
        task.payload = payload;
        task.createdAt = std::chrono::system_clock::now();

        std::lock_guard lock(mutex_);
        auto id = task.id;
        tasks_.emplace(id, std::move(task));
        order_.push_back(id);
        ++total_created_;
        return id;
    }

    void schedule(const std::string& id, const json& payload,
                  TaskRegistry::Runner runner) {
        auto loop = event_loop_.lock();
        if (!loop || !loop->isRunning()) {
            spdlog::error("Cannot schedule task {}: event loop not available",
                          id);
            fail(id, "EventLoop not available");
            return;
        }
        auto run = std::make_shared<ScheduledRun>(shared_from_this(), id);
        try {
            // The future is not kept; completion is observed through the
            // task state.
            (void)loop->post([run, payload, runner = std::move(runner)]() {
                run->started = true;
                run->state->execute(run->id, payload, runner);
            });
        } catch (const atom::error::Exception& e) {
            spdlog::error("Cannot schedule task {}: {}", id, e.what());
            fail(id, "EventLoop not available");
        }
    }

    /**
     * @brief Fails its task if the loop drops the run before a worker
     * picks it up, e.g. when the loop is stopped with work still queued.
     */
    struct ScheduledRun {
        ScheduledRun(std::shared_ptr<TaskRegistryState> s, std::string taskId)
            : state(std::move(s)), id(std::move(taskId)) {}

        ScheduledRun(const ScheduledRun&) = delete;
        ScheduledRun& operator=(const ScheduledRun&) = delete;

        ~ScheduledRun() {
            if (started) {
                return;
            }
            try {
                if (state->fail(id, "EventLoop not available")) {
                    spdlog::warn("Task {} dropped by a stopped event loop",
                                 id);
                }
            } catch (const std::exception& e) {
                spdlog::error("Could not fail dropped task {}: {}", id,
                              e.what());
            }
        }

        std::shared_ptr<TaskRegistryState> state;
        std::string id;
        bool started{false};
    };

    void execute(const std::string& id, const json& payload,
                 const TaskRegistry::Runner& runner) {
        if (!start(id)) {
            spdlog::info("Task {} not started, no longer pending", id);
            return;
        }

        TaskContext context(shared_from_this(), id, payload);
        try {
            json result = runner(context);
            if (!complete(id, std::move(result))) {
                spdlog::info("Discarding result of task {}", id);
            }
        } catch (const FleetException& e) {
            spdlog::error("Task {} failed: {}", id, e.reason());
            if (!fail(id, e.reason())) {
                spdlog::info("Discarding failure of task {}", id);
            }
        } catch (const std::exception& e) {
            spdlog::error("Task {} failed: {}", id, e.what());
            if (!fail(id, e.what())) {
                spdlog::info("Discarding failure of task {}", id);
            }
        } catch (...) {
            spdlog::error("Task {} failed with a non-standard exception", id);
            fail(id, "Unknown error");
            throw;
        }
    }

    auto get(const std::string& id) const -> std::optional<TaskSnapshot> {
        std::lock_guard lock(mutex_);
        auto it = tasks_.find(id);
        if (it == tasks_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    auto list(std::optional<TaskStatus> status,
              const std::optional<std::string>& kind, size_t limit) const
        -> std::vector<TaskSnapshot> {
        std::vector<TaskSnapshot> out;
        std::lock_guard lock(mutex_);
        for (auto it = order_.rbegin(); it != order_.rend(); ++it) {
            auto found = tasks_.find(*it);
            if (found == tasks_.end()) {
                continue;
            }
            const auto& task = found->second;
            if (status && task.status != *status) {
                continue;
            }
            if (kind && task.kind != *kind) {
                continue;
            }
            out.push_back(task);
            if (limit > 0 && out.size() >= limit) {
                break;
            }
        }
        return out;
    }

    auto start(const std::string& id) -> bool {
        std::lock_guard lock(mutex_);
        auto* task = findLocked(id);
        if (task == nullptr || task->status != TaskStatus::Pending) {
            return false;
        }
        task->status = TaskStatus::Running;
        task->startedAt = std::chrono::system_clock::now();
        task->progress.stage = "Running";
        spdlog::debug("Task {} ({}) started", id, task->kind);
        return true;
    }

    auto updateProgress(const std::string& id, std::optional<double> percentage,
                        std::optional<std::string> stage, const json& details)
        -> bool {
        std::lock_guard lock(mutex_);
        auto* task = findLocked(id);
        if (task == nullptr) {
            spdlog::warn("Progress update for unknown task {}", id);
            return false;
        }
        if (task->status != TaskStatus::Running) {
            spdlog::warn("Ignoring progress update for task {} in state {}", id,
                         taskStatusToString(task->status));
            return false;
        }
        if (percentage) {
            task->progress.percentage = roundPercentage(*percentage);
        }
        if (stage) {
            task->progress.stage = std::move(*stage);
        }
        if (details.is_object() && !details.empty()) {
            task->progress.details.update(details);
        }
        return true;
    }

    auto complete(const std::string& id, json result) -> bool {
        std::lock_guard lock(mutex_);
        auto* task = findLocked(id);
        if (task == nullptr || task->status != TaskStatus::Running) {
            return false;
        }
        task->status = TaskStatus::Completed;
        task->completedAt = std::chrono::system_clock::now();
        task->result = std::move(result);
        task->progress.percentage = 100.0;
        task->progress.stage = "Completed";
        ++total_completed_;
        spdlog::info("Task {} ({}) completed in {:.2f}s", id, task->kind,
                     task->executionTimeSeconds().value_or(0.0));
        return true;
    }

    auto fail(const std::string& id, const std::string& error) -> bool {
        std::lock_guard lock(mutex_);
        auto* task = findLocked(id);
        if (task == nullptr || task->isTerminal()) {
            return false;
        }
        task->status = TaskStatus::Failed;
        task->completedAt = std::chrono::system_clock::now();
        task->error = error;
        ++total_failed_;
        return true;
    }

    auto cancel(const std::string& id, const std::string& reason) -> bool {
        std::lock_guard lock(mutex_);
        auto* task = findLocked(id);
        if (task == nullptr || task->isTerminal()) {
            return false;
        }
        task->status = TaskStatus::Cancelled;
        task->completedAt = std::chrono::system_clock::now();
        task->error = "Task cancelled: " + reason;
        ++total_cancelled_;
        spdlog::info("Task {} cancelled: {}", id, reason);
        return true;
    }

    auto isCancelled(const std::string& id) const -> bool {
        std::lock_guard lock(mutex_);
        auto it = tasks_.find(id);
        return it != tasks_.end() &&
               it->second.status == TaskStatus::Cancelled;
    }

    auto sweep() -> size_t {
        auto now = std::chrono::system_clock::now();
        auto ttl = std::chrono::seconds(config_.taskTtlSeconds);

        std::lock_guard lock(mutex_);
        size_t removed = 0;
        for (auto it = order_.begin(); it != order_.end();) {
            auto found = tasks_.find(*it);
            if (found == tasks_.end()) {
                it = order_.erase(it);
                continue;
            }
            const auto& task = found->second;
            if (task.isTerminal() && task.completedAt &&
                now - *task.completedAt > ttl) {
                tasks_.erase(found);
                it = order_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        ++cleanup_runs_;
        tasks_cleaned_ += removed;
        if (removed > 0) {
            spdlog::info("Removed {} expired tasks", removed);
        }
        return removed;
    }

    auto stats() const -> json {
        std::lock_guard lock(mutex_);
        size_t active = 0;
        for (const auto& [_, task] : tasks_) {
            if (task.isActive()) {
                ++active;
            }
        }
        auto uptime = std::chrono::duration<double>(
                          std::chrono::steady_clock::now() - started_)
                          .count();
        return {{"total_created", total_created_},
                {"total_completed", total_completed_},
                {"total_failed", total_failed_},
                {"total_cancelled", total_cancelled_},
                {"cleanup_runs", cleanup_runs_},
                {"tasks_cleaned", tasks_cleaned_},
                {"current_tasks", tasks_.size()},
                {"active_tasks", active},
                {"finished_tasks", tasks_.size() - active},
                {"cleanup_interval_seconds", config_.cleanupIntervalSeconds},
                {"task_ttl_seconds", config_.taskTtlSeconds},
                {"uptime_seconds", uptime}};
    }

    auto size() const -> size_t {
        std::lock_guard lock(mutex_);
        return tasks_.size();
    }

    auto config() const noexcept -> const config::TaskConfig& {
        return config_;
    }

    // Sweep loop wake-up
    std::mutex cleanup_mutex;
    std::condition_variable_any cleanup_cv;

private:
    auto findLocked(const std::string& id) -> TaskSnapshot* {
        auto it = tasks_.find(id);
        return it == tasks_.end() ? nullptr : &it->second;
    }

    std::weak_ptr<EventLoop> event_loop_;
    config::TaskConfig config_;
    std::chrono::steady_clock::time_point started_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, TaskSnapshot> tasks_;
    std::deque<std::string> order_;
    std::unordered_map<std::string, TaskRegistry::Runner> handlers_;

    size_t total_created_{0};
    size_t total_completed_{0};
    size_t total_failed_{0};
    size_t total_cancelled_{0};
    size_t cleanup_runs_{0};
    size_t tasks_cleaned_{0};
};

}  // namespace detail

// ============================================================================
// TaskContext
// ============================================================================

TaskContext::TaskContext(std::shared_ptr<detail::TaskRegistryState> state,
                         std::string id, json payload)
    : state_(std::move(state)), id_(std::move(id)), payload_(std::move(payload)) {}

auto TaskContext::updateProgress(std::optional<double> percentage,
                                 std::optional<std::string> stage,
                                 const json& details) -> bool {
    return state_->updateProgress(id_, percentage, std::move(stage), details);
}

auto TaskContext::isCancelled() const -> bool {
    return state_->isCancelled(id_);
}

// ============================================================================
// TaskRegistry
// ============================================================================

TaskRegistry::TaskRegistry(std::shared_ptr<EventLoop> event_loop,
                           config::TaskConfig config) {
    if (!event_loop) {
        THROW_INVALID_ARGUMENT("TaskRegistry requires an event loop");
    }
    state_ = std::make_shared<detail::TaskRegistryState>(std::move(event_loop),
                                                         config);
}

TaskRegistry::~TaskRegistry() { stopCleanupLoop(); }

void TaskRegistry::registerHandler(const std::string& kind, Runner runner) {
    if (!runner) {
        THROW_INVALID_ARGUMENT("Handler for task kind '" + kind +
                               "' is empty");
    }
    state_->registerHandler(kind, std::move(runner));
    spdlog::debug("Registered task handler '{}'", kind);
}

auto TaskRegistry::hasHandler(const std::string& kind) const -> bool {
    return state_->hasHandler(kind);
}

auto TaskRegistry::createTask(const std::string& kind, const json& payload)
    -> std::string {
    auto handler = state_->findHandler(kind);
    if (!handler) {
        auto id = state_->insert(kind, payload);
        spdlog::warn("No handler registered for task kind '{}'", kind);
        state_->fail(id, "No handler registered for task kind '" + kind + "'");
        return id;
    }
    return createTask(kind, payload, std::move(*handler));
}

auto TaskRegistry::createTask(const std::string& kind, const json& payload,
                              Runner runner) -> std::string {
    auto id = state_->insert(kind, payload);
    spdlog::info("Created task {} ({})", id, kind);
    state_->schedule(id, payload, std::move(runner));
    return id;
}

auto TaskRegistry::getTask(const std::string& id) const
    -> std::optional<TaskSnapshot> {
    return state_->get(id);
}

auto TaskRegistry::listTasks(std::optional<TaskStatus> status,
                             std::optional<std::string> kind,
                             size_t limit) const -> std::vector<TaskSnapshot> {
    return state_->list(status, kind, limit);
}

auto TaskRegistry::startTask(const std::string& id) -> bool {
    return state_->start(id);
}

auto TaskRegistry::updateProgress(const std::string& id,
                                  std::optional<double> percentage,
                                  std::optional<std::string> stage,
                                  const json& details) -> bool {
    return state_->updateProgress(id, percentage, std::move(stage), details);
}

auto TaskRegistry::completeTask(const std::string& id, json result) -> bool {
    return state_->complete(id, std::move(result));
}

auto TaskRegistry::failTask(const std::string& id, const std::string& error)
    -> bool {
    return state_->fail(id, error);
}

auto TaskRegistry::cancelTask(const std::string& id, const std::string& reason)
    -> bool {
    return state_->cancel(id, reason);
}

auto TaskRegistry::sweepExpired() -> size_t { return state_->sweep(); }

void TaskRegistry::startCleanupLoop() {
    if (cleanup_thread_.joinable()) {
        return;
    }
    cleanup_thread_ = std::jthread([state = state_](std::stop_token token) {
        auto interval =
            std::chrono::seconds(state->config().cleanupIntervalSeconds);
        spdlog::info("**Task cleanup loop started (interval {}s)**",
                     interval.count());
        while (!token.stop_requested()) {
            {
                std::unique_lock lock(state->cleanup_mutex);
                state->cleanup_cv.wait_for(lock, token, interval,
                                           [] { return false; });
            }
            if (token.stop_requested()) {
                break;
            }
            state->sweep();
        }
        spdlog::info("**Task cleanup loop stopped**");
    });
}

void TaskRegistry::stopCleanupLoop() {
    if (!cleanup_thread_.joinable()) {
        return;
    }
    cleanup_thread_.request_stop();
    cleanup_thread_.join();
}

auto TaskRegistry::isCleanupLoopRunning() const -> bool {
    return cleanup_thread_.joinable();
}

auto TaskRegistry::stats() const -> json { return state_->stats(); }

auto TaskRegistry::size() const -> size_t { return state_->size(); }

}  // namespace netfleet::server
