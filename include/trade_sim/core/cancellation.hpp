// include/trade_sim/core/cancellation.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace trade_sim {

/**
 * @brief Why a batch stopped before running every job
 */
enum class StopReason {
    NONE,
    CANCELLED,
    TIMED_OUT
};

inline std::string stop_reason_to_string(StopReason reason) {
    switch (reason) {
        case StopReason::CANCELLED:
            return "CANCELLED";
        case StopReason::TIMED_OUT:
            return "TIMED_OUT";
        default:
            return "NONE";
    }
}

/**
 * @brief Cooperative cancellation flag shared between a caller and a batch
 */
class CancellationToken {
public:
    void cancel() noexcept {
        cancelled_.store(true, std::memory_order_release);
    }

    bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief Stop conditions of one batch: an optional token and an optional deadline
 *
 * Jobs poll should_stop() before starting; running jobs are never interrupted.
 */
class BatchControl {
public:
    BatchControl() = default;

    BatchControl(std::shared_ptr<const CancellationToken> token,
                 std::optional<std::chrono::milliseconds> timeout)
        : token_(std::move(token)) {
        if (timeout) {
            deadline_ = std::chrono::steady_clock::now() + *timeout;
        }
    }

    StopReason check() const {
        if (token_ && token_->is_cancelled())
            return StopReason::CANCELLED;
        if (deadline_ && std::chrono::steady_clock::now() >= *deadline_)
            return StopReason::TIMED_OUT;
        return StopReason::NONE;
    }

    bool should_stop() const {
        return check() != StopReason::NONE;
    }

private:
    std::shared_ptr<const CancellationToken> token_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
};

}  // namespace trade_sim
