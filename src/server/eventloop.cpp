/*
 * eventloop.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "eventloop.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "atom/error/exception.hpp"

namespace netfleet::server {

EventLoop::EventLoop(size_t thread_count)
    : thread_count_(std::max<size_t>(thread_count, 1)) {
    spdlog::debug("**Initializing EventLoop** with {} threads", thread_count_);
    workers_.reserve(thread_count_);
    for (size_t i = 0; i < thread_count_; ++i) {
        workers_.emplace_back(
            [this](std::stop_token st) { workerThread(std::move(st)); });
    }
}

EventLoop::~EventLoop() { stop(); }

void EventLoop::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    condition_.notify_all();
    for (auto& worker : workers_) {
        if (worker.get_id() == std::this_thread::get_id()) {
            worker.detach();
        } else if (worker.joinable()) {
            worker.join();
        }
    }

    std::lock_guard lock(queue_mutex_);
    auto dropped = ready_.size() + delayed_.size();
    ready_ = {};
    delayed_ = {};
    spdlog::debug("**EventLoop stopped**, {} queued tasks dropped", dropped);
}

auto EventLoop::pendingTasks() const -> size_t {
    std::lock_guard lock(queue_mutex_);
    return ready_.size() + delayed_.size();
}

void EventLoop::enqueue(std::function<void()> function, int priority,
                        Clock::time_point when) {
    {
        std::lock_guard lock(queue_mutex_);
        if (!running_.load()) {
            THROW_RUNTIME_ERROR("EventLoop is stopped");
        }
        Task task{std::move(function), priority, when, next_sequence_++};
        if (when > Clock::now()) {
            delayed_.push(std::move(task));
        } else {
            ready_.push(std::move(task));
        }
    }
    condition_.notify_one();
}

void EventLoop::workerThread(std::stop_token stop_token) {
    while (!stop_token.stop_requested()) {
        std::function<void()> function;
        {
            std::unique_lock lock(queue_mutex_);

            while (!delayed_.empty() &&
                   delayed_.top().executionTime <= Clock::now()) {
                ready_.push(delayed_.top());
                delayed_.pop();
            }

            if (ready_.empty()) {
                auto hasWork = [this] {
                    return !ready_.empty() ||
                           (!delayed_.empty() &&
                            delayed_.top().executionTime <= Clock::now());
                };
                if (delayed_.empty()) {
                    condition_.wait(lock, stop_token, hasWork);
                } else {
                    condition_.wait_until(lock, stop_token,
                                          delayed_.top().executionTime,
                                          hasWork);
                }
                continue;
            }

            function = ready_.top().function;
            ready_.pop();
        }

        try {
            function();
        } catch (const std::exception& e) {
            // packaged_task stores exceptions in the future; this only
            // catches failures of the wrapper itself
            spdlog::error("**Task execution failed**: {}", e.what());
        }
    }
}

}  // namespace netfleet::server
