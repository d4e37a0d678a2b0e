// include/trade_sim/core/batch_runner.hpp
#pragma once

#include <future>
#include <optional>
#include <vector>
#include "trade_sim/core/cancellation.hpp"
#include "trade_sim/core/logger.hpp"
#include "trade_sim/core/thread_pool.hpp"

namespace trade_sim {

/**
 * @brief Results of a batch, indexed like the submitted jobs
 *
 * Jobs skipped because the batch was stopped leave an empty slot.
 */
template <typename R>
struct BatchOutcome {
    std::vector<std::optional<R>> results;
    size_t completed{0};
    StopReason stop_reason{StopReason::NONE};
};

/**
 * @brief Run n_jobs independent jobs on a pool and collect them at a barrier
 *
 * Each job is `R job(size_t index)` and must own all mutable state it touches.
 * The stop control is polled before every job starts, so a cancelled or timed-out
 * batch returns the results of the jobs that already finished.
 *
 * @param n_jobs Number of jobs
 * @param max_threads Pool size, 0 for hardware concurrency, 1 runs inline
 * @param control Cancellation token and deadline
 * @param job Job callable
 */
template <typename R, typename F>
BatchOutcome<R> run_batch(size_t n_jobs, size_t max_threads, const BatchControl& control,
                          F&& job) {
    BatchOutcome<R> outcome;
    outcome.results.resize(n_jobs);

    if (max_threads == 1) {
        for (size_t i = 0; i < n_jobs; ++i) {
            StopReason reason = control.check();
            if (reason != StopReason::NONE) {
                outcome.stop_reason = reason;
                break;
            }
            try {
                outcome.results[i] = job(i);
                ++outcome.completed;
            } catch (const std::exception& e) {
                ERROR("Batch job " << i << " failed: " << e.what());
            }
        }
        return outcome;
    }

    ThreadPool pool(max_threads, control);
    std::vector<std::future<std::optional<R>>> futures;
    futures.reserve(n_jobs);
    for (size_t i = 0; i < n_jobs; ++i) {
        futures.push_back(pool.submit([&job, i]() -> R { return job(i); }));
    }

    for (size_t i = 0; i < n_jobs; ++i) {
        try {
            outcome.results[i] = futures[i].get();
            if (outcome.results[i])
                ++outcome.completed;
        } catch (const std::exception& e) {
            ERROR("Batch job " << i << " failed: " << e.what());
        }
    }
    outcome.stop_reason = pool.stop_reason();
    return outcome;
}

}  // namespace trade_sim
