/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file thread_pool.hpp
#pragma once
#ifndef PCH
    #include <condition_variable>
    #include <functional>
    #include <future>
    #include <memory>
    #include <mutex>
    #include <queue>
    #include <stdexcept>
    #include <stop_token>
    #include <thread>
    #include <vector>
#endif

namespace geoindex
{
    /// @brief Fixed-size pool of `std::jthread` workers sharing one FIFO queue.
    /// Each worker waits on its own stop token; the destructor requests stop on all of them, and a worker
    /// leaves only once the queue is empty, so every task accepted before destruction still runs.
    /// Results and exceptions of a task reach the caller through the returned future.
    class thread_pool
    {
    public:
        /// @param num_threads Number of workers. Zero is promoted to one.
        explicit thread_pool(std::size_t num_threads) noexcept(false);
        ~thread_pool() noexcept;

        /// @brief Queues `f(args...)`.
        /// @throws std::runtime_error If the pool is shutting down.
        template <class F, class... Args>
        auto enqueue_task(F&& f, Args&&... args) noexcept(false) -> std::future<std::invoke_result_t<F, Args...>>;

        std::size_t size() const noexcept { return workers_.size(); }

        /// @brief Tasks queued but not yet picked up by a worker.
        std::size_t pending_tasks() const noexcept(false);

        thread_pool(const thread_pool&) = delete;
        thread_pool& operator=(const thread_pool&) = delete;
        thread_pool(thread_pool&&) = delete;
        thread_pool& operator=(thread_pool&&) = delete;

    private:
        void worker_loop(std::stop_token stop) noexcept;

        std::queue<std::function<void()>> tasks_ {};
        mutable std::mutex queue_mutex_ {};
        std::condition_variable_any task_available_ {};
        bool accepting_ {true};
        // Declared last so the workers are joined before the queue and its guards are destroyed.
        std::vector<std::jthread> workers_ {};
    };

    template <class F, class... Args>
    auto thread_pool::enqueue_task(F&& f, Args&&... args) noexcept(false) -> std::future<std::invoke_result_t<F, Args...>>
    {
        using result_type = std::invoke_result_t<F, Args...>;

        // std::function needs a copyable target, so the packaged task is shared.
        auto task = std::make_shared<std::packaged_task<result_type()>>(
            [fn = std::forward<F>(f), ... bound = std::forward<Args>(args)]() mutable { return std::invoke(std::move(fn), std::move(bound)...); });
        std::future<result_type> result {task->get_future()};
        {
            std::scoped_lock lock {queue_mutex_};
            if (!accepting_)
                throw std::runtime_error("enqueue_task on stopped thread_pool");
            tasks_.emplace([task] { (*task)(); });
        }
        task_available_.notify_one();
        return result;
    }

} // namespace geoindex
