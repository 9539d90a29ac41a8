/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file thread_pool.cpp
#include "geoindex/thread_pool.hpp"

namespace geoindex
{
    thread_pool::thread_pool(const std::size_t num_threads) noexcept(false)
    {
        const std::size_t worker_count {(num_threads > 0u) ? num_threads : 1u};
        workers_.reserve(worker_count);
        for (std::size_t i {}; i < worker_count; ++i)
            workers_.emplace_back([this](const std::stop_token stop) { worker_loop(stop); });
    }

    thread_pool::~thread_pool() noexcept
    {
        {
            std::scoped_lock lock {queue_mutex_};
            accepting_ = false;
        }
        for (std::jthread& worker: workers_)
            worker.request_stop();
        workers_.clear(); // joins
    }

    std::size_t thread_pool::pending_tasks() const noexcept(false)
    {
        std::scoped_lock lock {queue_mutex_};
        return tasks_.size();
    }

    void thread_pool::worker_loop(const std::stop_token stop) noexcept
    {
        while (true)
        {
            std::function<void()> task {};
            {
                std::unique_lock lock {queue_mutex_};
                // Returns early on a stop request; the queue is still drained before leaving.
                task_available_.wait(lock, stop, [this] { return !tasks_.empty(); });
                if (tasks_.empty())
                    return;

                task = std::move(tasks_.front());
                tasks_.pop();
            }
            // Only packaged tasks are queued; they store their own exceptions in the shared state.
            task();
        }
    }

} // namespace geoindex
