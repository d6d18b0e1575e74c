#pragma once

/** \file worker_pool.hpp
 *  \brief Fixed-size FIFO worker pool for request handling.
 *
 * Requests run in submission order across the workers. Two condition variables
 * split the traffic: work_cv_ wakes workers for new requests or close, idle_cv_
 * wakes callers of wait_idle() once nothing is queued or running. Both counts
 * live under mu_.
 *
 * close() is a drain: requests already queued still run, later submissions are
 * refused with unavailable, and the workers are joined before it returns.
 */

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <expected>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "docqa/error.hpp"

#if defined(__linux__)
#include <pthread.h>
#endif

namespace docqa::engine {

class WorkerPool {
public:
    /** \param num_threads Number of worker threads (0 = hardware concurrency / 2) */
    explicit WorkerPool(std::size_t num_threads = 0) {
        if (num_threads == 0) {
            num_threads = std::max(1u, std::thread::hardware_concurrency() / 2);
        }
        workers_.reserve(num_threads);
        for (std::size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this] { run(); });
        }
    }

    ~WorkerPool() { close(); }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /** \brief Queue \p func; its result (or exception) is delivered through the future.
     *  Errors: unavailable once close() has begun.
     */
    template <typename Func>
    auto submit(Func&& func)
        -> std::expected<std::future<std::invoke_result_t<std::decay_t<Func>>>, core::error> {
        using R = std::invoke_result_t<std::decay_t<Func>>;

        // std::function needs a copyable target, so the task is shared.
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<Func>(func));
        auto future = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (closed_) {
                return std::unexpected(core::error{core::error_code::unavailable,
                    "worker pool is closed", "engine.pool"});
            }
            queue_.emplace_back([task] { (*task)(); });
        }
        work_cv_.notify_one();
        return future;
    }

    [[nodiscard]] auto num_threads() const noexcept -> std::size_t { return workers_.size(); }

    /** \brief Requests queued or running right now. */
    [[nodiscard]] auto outstanding() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mu_);
        return queue_.size() + running_;
    }

    /** \brief Block until the queue is empty and no worker is running a request. */
    void wait_idle() {
        std::unique_lock<std::mutex> lock(mu_);
        idle_cv_.wait(lock, [this] { return queue_.empty() && running_ == 0; });
    }

    /** \brief Refuse new submissions, run what is queued, join the workers. Idempotent. */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            closed_ = true;
        }
        work_cv_.notify_all();
        for (auto& w : workers_) {
            if (w.joinable()) w.join();
        }
    }

private:
    void run() {
#if defined(__linux__)
        pthread_setname_np(pthread_self(), "docqa-worker");
#endif
        std::unique_lock<std::mutex> lock(mu_);
        while (true) {
            work_cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
            if (queue_.empty()) return;  // closed and drained

            auto task = std::move(queue_.front());
            queue_.pop_front();
            ++running_;
            lock.unlock();
            task();  // packaged_task stores any exception in its future
            lock.lock();
            --running_;
            if (queue_.empty() && running_ == 0) idle_cv_.notify_all();
        }
    }

    mutable std::mutex mu_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::deque<std::function<void()>> queue_;
    std::size_t running_{0};
    bool closed_{false};
    std::vector<std::thread> workers_;
};

} // namespace docqa::engine
