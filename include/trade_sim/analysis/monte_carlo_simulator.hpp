#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "trade_sim/backtest/backtest_engine.hpp"
#include "trade_sim/backtest/metrics_calculator.hpp"
#include "trade_sim/backtest/trade.hpp"
#include "trade_sim/core/cancellation.hpp"
#include "trade_sim/core/config_base.hpp"
#include "trade_sim/core/error.hpp"
#include "trade_sim/statistics/statistics_tools.hpp"

namespace trade_sim {
namespace analysis {

/**
 * @brief Configuration for Monte Carlo trade resampling
 */
struct MonteCarloConfig : public ConfigBase {
    double initial_capital{100000.0};  // Start of the path when resampling a bare trade list
    double ruin_threshold{0.5};        // Max drawdown counted as ruin
    uint64_t seed{42};
    size_t max_threads{0};              // 0 = hardware concurrency, 1 = inline
    std::optional<int64_t> timeout_ms;  // Wall-clock limit of the batch
    std::vector<int> percentile_levels{5, 25, 50, 75, 95};
    std::vector<int> confidence_levels{90, 95, 99};                 // Percent coverage
    std::vector<double> drawdown_thresholds{0.1, 0.2, 0.3, 0.4, 0.5};

    void validate(std::vector<std::string>& violations) const override;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Chooses the order in which one simulation replays the historical trades
 */
class TradeResampler {
public:
    virtual ~TradeResampler() = default;

    /**
     * @param n_trades Number of historical trades, in closing order
     * @param rng Stream owned by the simulation
     * @return Indices of the trades to apply, in application order
     */
    virtual std::vector<size_t> resample(size_t n_trades, std::mt19937_64& rng) const = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Draws n_trades trades uniformly with replacement
 */
class BootstrapResampler : public TradeResampler {
public:
    std::vector<size_t> resample(size_t n_trades, std::mt19937_64& rng) const override;

    std::string name() const override {
        return "BootstrapResampler";
    }
};

/**
 * @brief Replays the historical sequence unchanged
 */
class IdentityResampler : public TradeResampler {
public:
    std::vector<size_t> resample(size_t n_trades, std::mt19937_64& rng) const override;

    std::string name() const override {
        return "IdentityResampler";
    }
};

struct MonteCarloResult {
    std::map<int, double> return_percentiles;
    std::map<int, double> drawdown_percentiles;
    double mean_return{0.0};
    double mean_max_drawdown{0.0};
    double probability_of_profit{0.0};
    double probability_of_ruin{0.0};

    // Shape of the simulated distributions
    statistics::SampleSummary return_distribution;
    statistics::SampleSummary drawdown_distribution;
    std::map<int, statistics::ConfidenceInterval> return_intervals;    // By percent coverage
    std::map<int, statistics::ConfidenceInterval> drawdown_intervals;
    std::map<double, double> drawdown_exceedance;  // Threshold -> P(max drawdown > threshold)

    // Statistics of the unshuffled history
    double historical_return{0.0};
    double historical_max_drawdown{0.0};
    double historical_percentile_rank{0.0};  // Percent of simulated returns below the history

    size_t trades_resampled{0};
    size_t simulations_requested{0};
    size_t simulations_run{0};
    bool completed{true};
    StopReason stop_reason{StopReason::NONE};

    nlohmann::json to_json() const;
};

/**
 * @brief Outcome distribution of a strategy by resampling its closed trades
 *
 * Each simulation applies the resampled trades to the initial capital and
 * records total return and max drawdown of the resulting equity path.
 * Simulation i draws from a stream seeded with (seed, i), so the result is
 * independent of the thread count.
 */
class MonteCarloSimulator {
public:
    explicit MonteCarloSimulator(MonteCarloConfig config,
                                 std::shared_ptr<const TradeResampler> resampler = nullptr);

    /**
     * @brief Resample the trades of a finished backtest
     *
     * The path starts at the backtest's initial equity. Each trade carries
     * the mark-to-market equity changes of the bars up to its exit, so the
     * identity resampler replays the backtest's equity curve and reproduces
     * its total return and max drawdown. Trades closed on the same bar move
     * together as one unit.
     */
    Result<MonteCarloResult> run(const backtest::BacktestResult& backtest_result,
                                 size_t n_simulations,
                                 std::shared_ptr<const CancellationToken> token = nullptr) const;

    /**
     * @brief Resample a bare trade list, each trade moving equity by its P&L
     * @return Result with the distribution; a stopped batch aggregates the
     *         simulations that finished and sets completed = false
     */
    Result<MonteCarloResult> run(const std::vector<backtest::Trade>& trades, size_t n_simulations,
                                 std::shared_ptr<const CancellationToken> token = nullptr) const;

    /**
     * @brief Equity after each trade, starting at the configured capital
     */
    std::vector<double> equity_path(const std::vector<double>& pnl) const;

    const MonteCarloConfig& config() const {
        return config_;
    }

private:
    // Equity changes attributed to each trade, in closing order
    struct TradeHistory {
        double initial_capital{0.0};
        std::vector<std::vector<double>> trades;
        double total_return{0.0};
        double max_drawdown{0.0};
    };

    struct SimulationOutcome {
        double total_return{0.0};
        double max_drawdown{0.0};
    };

    SimulationOutcome evaluate(const TradeHistory& history, const std::vector<size_t>& order) const;

    Result<MonteCarloResult> simulate(const TradeHistory& history, size_t n_simulations,
                                      std::shared_ptr<const CancellationToken> token) const;

    MonteCarloConfig config_;
    std::shared_ptr<const TradeResampler> resampler_;
    backtest::MetricsCalculator metrics_;
};

}  // namespace analysis
}  // namespace trade_sim
