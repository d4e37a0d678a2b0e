#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "trade_sim/backtest/backtest_config.hpp"
#include "trade_sim/backtest/execution_simulator.hpp"
#include "trade_sim/backtest/metrics_calculator.hpp"
#include "trade_sim/backtest/signal_generator.hpp"
#include "trade_sim/backtest/trade.hpp"
#include "trade_sim/core/error.hpp"
#include "trade_sim/core/types.hpp"
#include "trade_sim/cost/cost_model.hpp"

namespace trade_sim {
namespace backtest {

/**
 * @brief Processing phase of the event loop
 */
enum class EnginePhase {
    INIT,
    DECIDE,
    SIZE,
    EXECUTE,
    UPDATE,
    FINALIZE
};

std::string engine_phase_to_string(EnginePhase phase);

/**
 * @brief Everything one run produces
 */
struct BacktestResult {
    std::vector<Trade> trades;
    EquityCurve equity_curve;
    MetricsSnapshot metrics;

    // Run diagnostics
    size_t bars_processed{0};
    size_t skipped_bars{0};
    size_t signals_received{0};
    size_t unfilled_orders{0};
    size_t dropped_orders{0};          // Still pending at the end of the data
    size_t ignored_exit_signals{0};    // Exit requested without an open position
    double missed_opportunity_cost{0.0};  // Opportunity cost of orders that never filled

    double final_equity() const {
        return equity_curve.empty() ? 0.0 : equity_curve.back().equity;
    }

    nlohmann::json to_json() const;
};

/**
 * @brief Event-driven backtest of one signal generator over historical bars
 *
 * For every bar, in timestamp order: pending orders fill, protective exits
 * are checked, the generator decides on the history up to the bar, the
 * decision is sized and executed, and the portfolio is marked to market.
 * Open positions are force-closed at the last close.
 *
 * run() keeps all mutable state local, so one engine can serve concurrent
 * runs as long as each run gets its own generator.
 */
class BacktestEngine {
public:
    explicit BacktestEngine(BacktestConfig config);

    /**
     * @brief Run the simulation
     *
     * @param data Bars per symbol
     * @param generator Signal generator consulted on every bar
     * @return Result with trades, equity curve and metrics, or a
     *         ValidationError when the configuration is invalid
     */
    Result<BacktestResult> run(const MarketData& data, SignalGenerator& generator) const;

    const BacktestConfig& config() const {
        return config_;
    }

    const cost::CostModel& cost_model() const {
        return cost_model_;
    }

    const MetricsCalculator& metrics_calculator() const {
        return metrics_;
    }

private:
    BacktestConfig config_;
    cost::CostModel cost_model_;
    ExecutionSimulator simulator_;
    MetricsCalculator metrics_;
};

}  // namespace backtest
}  // namespace trade_sim
