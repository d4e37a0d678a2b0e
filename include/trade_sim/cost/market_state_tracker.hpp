#pragma once

#include <deque>
#include <map>
#include <string>

#include "trade_sim/core/types.hpp"

namespace trade_sim {
namespace cost {

/**
 * @brief Rolling per-symbol liquidity and volatility estimates
 *
 * Feed every processed bar through update(). The estimates only ever
 * contain bars already seen, so callers must update after filling
 * orders on a bar, never before.
 */
class MarketStateTracker {
public:
    MarketStateTracker(size_t volume_lookback = 20, size_t volatility_lookback = 20);

    void update(const Bar& bar);

    /**
     * @brief Rolling average bar volume, 0 if no history
     */
    double average_volume(const std::string& symbol) const;

    /**
     * @brief Rolling standard deviation of log close-to-close returns,
     * 0 with fewer than two returns
     */
    double volatility(const std::string& symbol) const;

    void clear();

private:
    struct SymbolHistory {
        std::deque<double> volumes;
        std::deque<double> log_returns;
        double last_close{0.0};
    };

    size_t volume_lookback_;
    size_t volatility_lookback_;
    std::map<std::string, SymbolHistory> history_;
};

}  // namespace cost
}  // namespace trade_sim
