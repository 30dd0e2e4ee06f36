/*
 * eventloop.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-2

Description: Fixed-size priority worker pool

**************************************************/

#ifndef NETFLEET_SERVER_EVENTLOOP_HPP
#define NETFLEET_SERVER_EVENTLOOP_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace netfleet::server {

/**
 * @brief Thread pool executing prioritized and delayed tasks.
 *
 * Workers start in the constructor and are joined by stop() or the
 * destructor. Tasks still queued at shutdown are dropped; their futures
 * report std::future_errc::broken_promise.
 */
class EventLoop {
public:
    /**
     * @brief Constructs an EventLoop with the given number of workers.
     *
     * @param thread_count Number of worker threads (at least 1)
     */
    explicit EventLoop(size_t thread_count = 1);

    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /**
     * @brief Stops accepting work and joins all workers.
     */
    void stop();

    [[nodiscard]] auto isRunning() const noexcept -> bool {
        return running_.load();
    }

    [[nodiscard]] auto threadCount() const noexcept -> size_t {
        return thread_count_;
    }

    /**
     * @brief Number of queued tasks not yet picked up by a worker
     */
    [[nodiscard]] auto pendingTasks() const -> size_t;

    /**
     * @brief Posts a task with specified priority to the event loop.
     *
     * @param priority Task priority (higher values = higher priority)
     * @param function Callable object to execute
     * @param arguments Arguments to pass to the function
     * @return Future representing the task result
     * @throws atom::error::RuntimeError if the loop has been stopped
     */
    template <typename Function, typename... Arguments>
    auto post(int priority, Function&& function, Arguments&&... arguments)
        -> std::future<std::invoke_result_t<Function, Arguments...>>;

    /**
     * @brief Posts a task with default priority (0).
     */
    template <typename Function, typename... Arguments>
    auto post(Function&& function, Arguments&&... arguments)
        -> std::future<std::invoke_result_t<Function, Arguments...>>;

    /**
     * @brief Posts a task that becomes eligible after a delay.
     */
    template <typename Function, typename... Arguments>
    auto postDelayed(std::chrono::milliseconds delay, Function&& function,
                     Arguments&&... arguments)
        -> std::future<std::invoke_result_t<Function, Arguments...>>;

private:
    using Clock = std::chrono::steady_clock;

    struct Task {
        std::function<void()> function;
        int priority{0};
        Clock::time_point executionTime;
        uint64_t sequence{0};
    };

    struct ReadyOrder {
        auto operator()(const Task& a, const Task& b) const -> bool {
            if (a.priority != b.priority) {
                return a.priority < b.priority;
            }
            return a.sequence > b.sequence;
        }
    };

    struct DelayedOrder {
        auto operator()(const Task& a, const Task& b) const -> bool {
            if (a.executionTime != b.executionTime) {
                return a.executionTime > b.executionTime;
            }
            return a.sequence > b.sequence;
        }
    };

    template <typename Function, typename... Arguments>
    auto schedule(int priority, Clock::time_point when, Function&& function,
                  Arguments&&... arguments)
        -> std::future<std::invoke_result_t<Function, Arguments...>>;

    void enqueue(std::function<void()> function, int priority,
                 Clock::time_point when);
    void workerThread(std::stop_token stop_token);

    size_t thread_count_;
    std::atomic<bool> running_{true};
    mutable std::mutex queue_mutex_;
    std::condition_variable_any condition_;
    std::priority_queue<Task, std::vector<Task>, ReadyOrder> ready_;
    std::priority_queue<Task, std::vector<Task>, DelayedOrder> delayed_;
    uint64_t next_sequence_{0};
    std::vector<std::jthread> workers_;
};

template <typename Function, typename... Arguments>
auto EventLoop::schedule(int priority, Clock::time_point when,
                         Function&& function, Arguments&&... arguments)
    -> std::future<std::invoke_result_t<Function, Arguments...>> {
    using ReturnType = std::invoke_result_t<Function, Arguments...>;

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        [func = std::forward<Function>(function),
         ... args = std::forward<Arguments>(arguments)]() mutable {
            return std::invoke(std::move(func), std::move(args)...);
        });
    auto future = task->get_future();
    enqueue([task]() { (*task)(); }, priority, when);
    return future;
}

template <typename Function, typename... Arguments>
auto EventLoop::post(int priority, Function&& function,
                     Arguments&&... arguments)
    -> std::future<std::invoke_result_t<Function, Arguments...>> {
    return schedule(priority, Clock::now(), std::forward<Function>(function),
                    std::forward<Arguments>(arguments)...);
}

template <typename Function, typename... Arguments>
auto EventLoop::post(Function&& function, Arguments&&... arguments)
    -> std::future<std::invoke_result_t<Function, Arguments...>> {
    return post(0, std::forward<Function>(function),
                std::forward<Arguments>(arguments)...);
}

template <typename Function, typename... Arguments>
auto EventLoop::postDelayed(std::chrono::milliseconds delay,
                            Function&& function, Arguments&&... arguments)
    -> std::future<std::invoke_result_t<Function, Arguments...>> {
    return schedule(0, Clock::now() + delay, std::forward<Function>(function),
                    std::forward<Arguments>(arguments)...);
}

}  // namespace netfleet::server

#endif  // NETFLEET_SERVER_EVENTLOOP_HPP
