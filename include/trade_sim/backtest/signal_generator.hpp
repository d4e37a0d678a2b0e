#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "trade_sim/core/error.hpp"
#include "trade_sim/core/types.hpp"

namespace trade_sim {
namespace backtest {

/**
 * @brief Read-only view of a symbol's bars up to and including the current bar
 *
 * The view never exposes bars after the decision point.
 */
class HistoricalWindow {
public:
    using const_iterator = std::vector<Bar>::const_iterator;

    HistoricalWindow(std::string symbol, const std::vector<Bar>& bars, size_t end)
        : symbol_(std::move(symbol)), bars_(bars), end_(std::min(end, bars.size())) {}

    const std::string& symbol() const {
        return symbol_;
    }
    size_t size() const {
        return end_;
    }
    bool empty() const {
        return end_ == 0;
    }
    const Bar& operator[](size_t i) const {
        return bars_[i];
    }
    const Bar& back() const {
        return bars_[end_ - 1];
    }
    const_iterator begin() const {
        return bars_.begin();
    }
    const_iterator end() const {
        return bars_.begin() + static_cast<std::ptrdiff_t>(end_);
    }

private:
    std::string symbol_;
    const std::vector<Bar>& bars_;
    size_t end_;
};

/**
 * @brief External strategy producing one signal per bar
 *
 * Implementations may keep state between calls; the engine asks one
 * generator instance per run, in timestamp order.
 */
class SignalGenerator {
public:
    virtual ~SignalGenerator() = default;

    /**
     * @brief Decide on the latest bar of the window
     * @param window History of one symbol ending at the current bar
     * @return Signal, or an error which the engine treats as HOLD
     */
    virtual Result<Signal> generate_signal(const HistoricalWindow& window) = 0;

    virtual std::string name() const {
        return "SignalGenerator";
    }
};

/**
 * @brief Named strategy parameters
 */
using ParameterSet = std::map<std::string, double>;

/**
 * @brief Builds a fresh generator for one run from a parameter set
 */
using SignalGeneratorFactory =
    std::function<std::shared_ptr<SignalGenerator>(const ParameterSet& parameters)>;

std::string parameters_to_string(const ParameterSet& parameters);

}  // namespace backtest
}  // namespace trade_sim
