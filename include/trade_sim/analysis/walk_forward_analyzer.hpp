#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "trade_sim/analysis/parameter_search.hpp"
#include "trade_sim/backtest/backtest_engine.hpp"
#include "trade_sim/core/cancellation.hpp"
#include "trade_sim/core/config_base.hpp"
#include "trade_sim/core/error.hpp"

namespace trade_sim {
namespace analysis {

/**
 * @brief Metric maximized by the in-sample search
 */
enum class ObjectiveMetric {
    SHARPE,
    SORTINO,
    CALMAR,
    TOTAL_RETURN
};

std::string objective_metric_to_string(ObjectiveMetric metric);

/**
 * @throws std::invalid_argument on an unknown name
 */
ObjectiveMetric objective_metric_from_string(const std::string& name);

/**
 * @brief How the in-sample range moves between windows
 *
 * ROLLING keeps its length and slides by the step; EXPANDING stays anchored
 * at the first bar and grows by the step.
 */
enum class WindowType {
    ROLLING,
    EXPANDING
};

std::string window_type_to_string(WindowType type);

/**
 * @throws std::invalid_argument on an unknown name
 */
WindowType window_type_from_string(const std::string& name);

/**
 * @brief Configuration for walk-forward analysis
 */
struct WalkForwardConfig : public ConfigBase {
    ObjectiveMetric objective{ObjectiveMetric::SHARPE};
    WindowType window_type{WindowType::ROLLING};
    double complexity_penalty{0.01};  // Subtracted per parameter in the set

    size_t max_threads{0};                 // 0 = hardware concurrency, 1 = inline
    std::optional<int64_t> timeout_ms;     // Wall-clock limit of the whole analysis

    // Robustness thresholds
    double max_overfitting{0.05};
    double min_parameter_stability{0.7};
    double parameter_change_tolerance{0.2};  // Max relative change for a "stable" pair

    void validate(std::vector<std::string>& violations) const override;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Inclusive timestamp range of a slice
 */
struct TimeRange {
    Timestamp start{};
    Timestamp end{};
    size_t bars{0};  // Distinct timestamps in the range
};

/**
 * @brief One in-sample optimization and its out-of-sample check
 */
struct WalkForwardWindow {
    size_t index{0};
    TimeRange in_sample;
    TimeRange out_of_sample;
    backtest::ParameterSet optimal_parameters;
    double objective_value{0.0};
    size_t trials_evaluated{0};
    size_t trials_excluded{0};
    backtest::BacktestResult in_sample_result;
    backtest::BacktestResult out_of_sample_result;

    // (IS return - OOS return) / |IS return|, 0 when the IS return is 0
    double performance_degradation{0.0};

    double in_sample_return() const {
        return in_sample_result.metrics.total_return;
    }
    double out_of_sample_return() const {
        return out_of_sample_result.metrics.total_return;
    }

    nlohmann::json to_json() const;
};

/**
 * @brief Metrics averaged over the windows of one side
 */
struct WindowAverages {
    double total_return{0.0};
    double sharpe_ratio{0.0};
    double max_drawdown{0.0};
    double win_rate{0.0};
    double profit_factor{0.0};

    nlohmann::json to_json() const;
};

WindowAverages average_metrics(const std::vector<const backtest::MetricsSnapshot*>& metrics);

struct WalkForwardResult {
    std::vector<WalkForwardWindow> windows;
    size_t windows_planned{0};
    size_t windows_skipped{0};

    double mean_in_sample_return{0.0};
    double mean_out_of_sample_return{0.0};
    double overfitting_indicator{0.0};     // mean IS return - mean OOS return
    double parameter_stability_rate{0.0};  // Stable successive window pairs / pairs
    bool robust{false};

    WindowAverages in_sample_averages;
    WindowAverages out_of_sample_averages;
    double in_out_correlation{0.0};  // Pearson over windows of IS vs OOS return
    double success_rate{0.0};        // Share of windows with a positive OOS return

    bool completed{true};
    StopReason stop_reason{StopReason::NONE};

    nlohmann::json to_json() const;
};

/**
 * @brief Rolling or expanding in-sample optimization with out-of-sample validation
 *
 * Windows move over the merged timeline of all symbols. Trials of one
 * window run in parallel on a pool; every trial builds its own generator
 * from the factory and its own portfolio inside the engine.
 */
class WalkForwardAnalyzer {
public:
    WalkForwardAnalyzer(backtest::BacktestConfig backtest_config, WalkForwardConfig config);

    /**
     * @brief Run the analysis
     *
     * @param data Bars per symbol
     * @param in_sample_len In-sample length in timeline bars
     * @param out_of_sample_len Out-of-sample length in timeline bars
     * @param step_len Offset between successive windows
     * @param search Candidate parameter sets
     * @param factory Builds one generator per trial
     * @param token Optional cancellation, checked between trials and windows
     * @return Result with windows and aggregates; a stopped analysis returns
     *         the finished windows with completed = false
     */
    Result<WalkForwardResult> analyze(const MarketData& data, size_t in_sample_len,
                                      size_t out_of_sample_len, size_t step_len,
                                      const ParameterSearch& search,
                                      const backtest::SignalGeneratorFactory& factory,
                                      std::shared_ptr<const CancellationToken> token = nullptr) const;

    /**
     * @brief Grid search over a parameter space
     */
    Result<WalkForwardResult> analyze(const MarketData& data, size_t in_sample_len,
                                      size_t out_of_sample_len, size_t step_len,
                                      const ParameterSpace& space,
                                      const backtest::SignalGeneratorFactory& factory,
                                      std::shared_ptr<const CancellationToken> token = nullptr) const;

    /**
     * @brief Objective of one in-sample result: metric - penalty * parameter count
     */
    double objective(const backtest::MetricsSnapshot& metrics, size_t parameter_count) const;

    /**
     * @brief Largest relative change of any parameter between two sets
     *
     * A parameter present in only one set, or moving away from zero, counts
     * as an unbounded change.
     */
    static double max_relative_change(const backtest::ParameterSet& previous,
                                      const backtest::ParameterSet& current);

    /**
     * @brief Fraction of successive windows whose optimal parameters stayed
     * within the tolerance; 1 with a single window, 0 with none
     */
    double parameter_stability_rate(const std::vector<WalkForwardWindow>& windows) const;

    const WalkForwardConfig& config() const {
        return config_;
    }

private:
    backtest::BacktestEngine engine_;
    WalkForwardConfig config_;
};

}  // namespace analysis
}  // namespace trade_sim
