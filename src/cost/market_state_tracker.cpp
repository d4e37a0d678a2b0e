#include "trade_sim/cost/market_state_tracker.hpp"

#include <cmath>
#include <numeric>
#include <vector>

#include "trade_sim/statistics/statistics_tools.hpp"

namespace trade_sim {
namespace cost {

MarketStateTracker::MarketStateTracker(size_t volume_lookback, size_t volatility_lookback)
    : volume_lookback_(volume_lookback), volatility_lookback_(volatility_lookback) {}

void MarketStateTracker::update(const Bar& bar) {
    auto& history = history_[bar.symbol];

    history.volumes.push_back(bar.volume);
    while (history.volumes.size() > volume_lookback_) {
        history.volumes.pop_front();
    }

    if (history.last_close > 0.0 && bar.close > 0.0) {
        history.log_returns.push_back(std::log(bar.close / history.last_close));
        while (history.log_returns.size() > volatility_lookback_) {
            history.log_returns.pop_front();
        }
    }
    history.last_close = bar.close;
}

double MarketStateTracker::average_volume(const std::string& symbol) const {
    auto it = history_.find(symbol);
    if (it == history_.end() || it->second.volumes.empty()) {
        return 0.0;
    }
    const auto& volumes = it->second.volumes;
    return std::accumulate(volumes.begin(), volumes.end(), 0.0) /
           static_cast<double>(volumes.size());
}

double MarketStateTracker::volatility(const std::string& symbol) const {
    auto it = history_.find(symbol);
    if (it == history_.end() || it->second.log_returns.size() < 2) {
        return 0.0;
    }
    std::vector<double> returns(it->second.log_returns.begin(), it->second.log_returns.end());
    return statistics::standard_deviation(returns, statistics::Normalization::SAMPLE);
}

void MarketStateTracker::clear() {
    history_.clear();
}

}  // namespace cost
}  // namespace trade_sim
