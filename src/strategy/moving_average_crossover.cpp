#include "trade_sim/strategy/moving_average_crossover.hpp"

#include <algorithm>
#include <cmath>

namespace trade_sim {
namespace strategy {

MovingAverageCrossover::MovingAverageCrossover(MovingAverageCrossoverConfig config)
    : config_(std::move(config)) {}

std::string MovingAverageCrossover::name() const {
    return "MovingAverageCrossover(" + std::to_string(config_.fast_window) + "," +
           std::to_string(config_.slow_window) + ")";
}

double MovingAverageCrossover::sma(const backtest::HistoricalWindow& window, size_t end,
                                   int length) {
    double sum = 0.0;
    for (size_t i = end - static_cast<size_t>(length); i < end; ++i) {
        sum += window[i].close;
    }
    return sum / length;
}

Result<Signal> MovingAverageCrossover::generate_signal(const backtest::HistoricalWindow& window) {
    if (config_.fast_window < 1 || config_.slow_window <= config_.fast_window) {
        return make_error<Signal>(ErrorCode::INVALID_ARGUMENT,
                                  "Windows must satisfy 1 <= fast < slow (got " +
                                      std::to_string(config_.fast_window) + ", " +
                                      std::to_string(config_.slow_window) + ")",
                                  "MovingAverageCrossover");
    }

    // Need the previous bar's averages too
    const size_t n = window.size();
    if (n < static_cast<size_t>(config_.slow_window) + 1) {
        return Signal::hold();
    }

    double fast_now = sma(window, n, config_.fast_window);
    double slow_now = sma(window, n, config_.slow_window);
    double fast_prev = sma(window, n - 1, config_.fast_window);
    double slow_prev = sma(window, n - 1, config_.slow_window);

    Signal signal;
    if (fast_prev <= slow_prev && fast_now > slow_now) {
        signal.action = SignalAction::BUY;
    } else if (fast_prev >= slow_prev && fast_now < slow_now) {
        signal.action = SignalAction::SELL;
    } else {
        return Signal::hold();
    }

    const double close = window.back().close;
    const double s = signal.action == SignalAction::BUY ? 1.0 : -1.0;
    if (config_.stop_loss_pct) {
        signal.stop_loss = close * (1.0 - s * *config_.stop_loss_pct);
    }
    if (config_.take_profit_pct) {
        signal.take_profit = close * (1.0 + s * *config_.take_profit_pct);
    }

    // Spread between the averages relative to price, saturating at 1%
    signal.confidence = std::min(1.0, std::abs(fast_now - slow_now) / close / 0.01);
    return signal;
}

backtest::SignalGeneratorFactory make_moving_average_crossover_factory(
    MovingAverageCrossoverConfig base) {
    return [base](const backtest::ParameterSet& parameters) {
        MovingAverageCrossoverConfig config = base;
        auto fast = parameters.find("fast_window");
        if (fast != parameters.end()) {
            config.fast_window = static_cast<int>(std::lround(fast->second));
        }
        auto slow = parameters.find("slow_window");
        if (slow != parameters.end()) {
            config.slow_window = static_cast<int>(std::lround(slow->second));
        }
        return std::make_shared<MovingAverageCrossover>(config);
    };
}

}  // namespace strategy
}  // namespace trade_sim
