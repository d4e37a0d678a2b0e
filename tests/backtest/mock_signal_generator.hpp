#pragma once

#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "trade_sim/backtest/signal_generator.hpp"

namespace trade_sim {
namespace testing {

/**
 * @brief Generator replaying signals scripted by bar index within a symbol
 *
 * Index i is the decision on the symbol's (i + 1)-th bar. Indices listed
 * in failing_at return an error, those in throwing_at throw.
 */
class ScriptedSignalGenerator : public backtest::SignalGenerator {
public:
    ScriptedSignalGenerator() = default;
    explicit ScriptedSignalGenerator(std::map<size_t, Signal> script) : script_(std::move(script)) {}

    Result<Signal> generate_signal(const backtest::HistoricalWindow& window) override {
        const size_t index = window.size() - 1;
        seen_.push_back(window.back().timestamp);
        window_sizes_.push_back(window.size());

        if (throwing_at.count(index) > 0) {
            throw std::runtime_error("scripted failure at bar " + std::to_string(index));
        }
        if (failing_at.count(index) > 0) {
            return make_error<Signal>(ErrorCode::STRATEGY_ERROR,
                                      "scripted error at bar " + std::to_string(index),
                                      "ScriptedSignalGenerator");
        }
        auto it = script_.find(index);
        if (it == script_.end()) {
            return Signal::hold();
        }
        return it->second;
    }

    std::string name() const override {
        return "ScriptedSignalGenerator";
    }

    const std::vector<Timestamp>& seen() const {
        return seen_;
    }
    const std::vector<size_t>& window_sizes() const {
        return window_sizes_;
    }

    std::set<size_t> failing_at;
    std::set<size_t> throwing_at;

private:
    std::map<size_t, Signal> script_;
    std::vector<Timestamp> seen_;
    std::vector<size_t> window_sizes_;
};

inline Signal buy_signal(std::optional<Price> stop_loss = std::nullopt,
                         std::optional<Price> take_profit = std::nullopt) {
    Signal signal;
    signal.action = SignalAction::BUY;
    signal.stop_loss = stop_loss;
    signal.take_profit = take_profit;
    return signal;
}

inline Signal sell_signal(std::optional<Price> stop_loss = std::nullopt) {
    Signal signal;
    signal.action = SignalAction::SELL;
    signal.stop_loss = stop_loss;
    return signal;
}

}  // namespace testing
}  // namespace trade_sim
