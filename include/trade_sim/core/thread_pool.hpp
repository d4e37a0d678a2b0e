// include/trade_sim/core/thread_pool.hpp
#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>
#include "trade_sim/core/cancellation.hpp"

namespace trade_sim {

/**
 * @brief Fixed-size worker pool serving one stoppable batch
 *
 * Tasks start in submission order on the first idle worker. Before a task
 * starts, the pool polls its BatchControl; once the control reports a stop,
 * that task and every later one are skipped and their futures hold an empty
 * optional. Tasks already running are never interrupted.
 * The destructor drains the queue before joining.
 */
class ThreadPool {
public:
    /**
     * @brief Start the workers
     * @param n_threads Number of workers, 0 selects the hardware concurrency
     * @param control Stop conditions polled before each task
     */
    explicit ThreadPool(size_t n_threads, BatchControl control = BatchControl())
        : control_(std::move(control)), stop_(false) {
        if (n_threads == 0) {
            n_threads = std::max<size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(n_threads);
        for (size_t i = 0; i < n_threads; ++i) {
            workers_.emplace_back([this]() { worker_loop(); });
        }
    }

    ~ThreadPool() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable())
                worker.join();
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queue a callable returning a value
     * @return Future holding the result, an empty optional when the task was
     *         skipped, or the callable's exception
     */
    template <class F>
    auto submit(F&& f) -> std::future<std::optional<decltype(f())>> {
        using R = decltype(f());

        auto task = std::make_shared<std::packaged_task<std::optional<R>()>>(
            [this, fn = std::forward<F>(f)]() mutable -> std::optional<R> {
                if (skip_next())
                    return std::nullopt;
                return std::optional<R>(fn());
            });
        std::future<std::optional<R>> future = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tasks_.emplace([task]() { (*task)(); });
        }
        cv_.notify_one();
        return future;
    }

    /**
     * @brief First stop the control reported, NONE while every task ran
     */
    StopReason stop_reason() const {
        return stop_reason_.load();
    }

    size_t size() const {
        return workers_.size();
    }

private:
    bool skip_next() {
        if (stop_reason_.load() != StopReason::NONE)
            return true;
        StopReason reason = control_.check();
        if (reason == StopReason::NONE)
            return false;
        StopReason expected = StopReason::NONE;
        stop_reason_.compare_exchange_strong(expected, reason);
        return true;
    }

    void worker_loop() {
        for (;;) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [&]() { return stop_ || !tasks_.empty(); });
                if (stop_ && tasks_.empty())
                    return;
                job = std::move(tasks_.front());
                tasks_.pop();
            }
            job();
        }
    }

    const BatchControl control_;
    std::atomic<StopReason> stop_reason_{StopReason::NONE};

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_;
    std::queue<std::function<void()>> tasks_;
    std::vector<std::thread> workers_;
};

}  // namespace trade_sim
