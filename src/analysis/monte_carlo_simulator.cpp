#include "trade_sim/analysis/monte_carlo_simulator.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <numeric>

#include "trade_sim/core/batch_runner.hpp"
#include "trade_sim/core/logger.hpp"

namespace trade_sim {
namespace analysis {

namespace {

nlohmann::json summary_to_json(const statistics::SampleSummary& summary) {
    return {{"count", summary.count},
            {"mean", summary.mean},
            {"standard_deviation", summary.standard_deviation},
            {"min", summary.min},
            {"max", summary.max},
            {"skewness", summary.skewness},
            {"excess_kurtosis", summary.excess_kurtosis}};
}

nlohmann::json intervals_to_json(const std::map<int, statistics::ConfidenceInterval>& intervals) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [level, interval] : intervals) {
        j["ci" + std::to_string(level)] = {{"lower", interval.lower}, {"upper", interval.upper}};
    }
    return j;
}

}  // namespace

void MonteCarloConfig::validate(std::vector<std::string>& violations) const {
    if (!(initial_capital > 0.0)) {
        violations.push_back("monte_carlo.initial_capital must be > 0");
    }
    if (!(ruin_threshold > 0.0 && ruin_threshold <= 1.0)) {
        violations.push_back("monte_carlo.ruin_threshold must be within (0, 1]");
    }
    if (timeout_ms && *timeout_ms <= 0) {
        violations.push_back("monte_carlo.timeout_ms must be > 0");
    }
    for (int level : percentile_levels) {
        if (level < 0 || level > 100) {
            violations.push_back("monte_carlo.percentile_levels must be within [0, 100] (got " +
                                 std::to_string(level) + ")");
        }
    }
    for (int level : confidence_levels) {
        if (level <= 0 || level >= 100) {
            violations.push_back("monte_carlo.confidence_levels must be within (0, 100) (got " +
                                 std::to_string(level) + ")");
        }
    }
    for (double threshold : drawdown_thresholds) {
        if (!(threshold > 0.0 && threshold <= 1.0)) {
            violations.push_back("monte_carlo.drawdown_thresholds must be within (0, 1] (got " +
                                 std::to_string(threshold) + ")");
        }
    }
}

nlohmann::json MonteCarloConfig::to_json() const {
    nlohmann::json j;
    j["initial_capital"] = initial_capital;
    j["ruin_threshold"] = ruin_threshold;
    j["seed"] = seed;
    j["max_threads"] = max_threads;
    if (timeout_ms)
        j["timeout_ms"] = *timeout_ms;
    j["percentile_levels"] = percentile_levels;
    j["confidence_levels"] = confidence_levels;
    j["drawdown_thresholds"] = drawdown_thresholds;
    return j;
}

void MonteCarloConfig::from_json(const nlohmann::json& j) {
    if (j.contains("initial_capital"))
        initial_capital = j.at("initial_capital").get<double>();
    if (j.contains("ruin_threshold"))
        ruin_threshold = j.at("ruin_threshold").get<double>();
    if (j.contains("seed"))
        seed = j.at("seed").get<uint64_t>();
    if (j.contains("max_threads"))
        max_threads = j.at("max_threads").get<size_t>();
    if (j.contains("timeout_ms"))
        timeout_ms = j.at("timeout_ms").get<int64_t>();
    if (j.contains("percentile_levels"))
        percentile_levels = j.at("percentile_levels").get<std::vector<int>>();
    if (j.contains("confidence_levels"))
        confidence_levels = j.at("confidence_levels").get<std::vector<int>>();
    if (j.contains("drawdown_thresholds"))
        drawdown_thresholds = j.at("drawdown_thresholds").get<std::vector<double>>();
}

std::vector<size_t> BootstrapResampler::resample(size_t n_trades, std::mt19937_64& rng) const {
    std::vector<size_t> order;
    if (n_trades == 0) {
        return order;
    }
    order.reserve(n_trades);
    std::uniform_int_distribution<size_t> pick(0, n_trades - 1);
    for (size_t i = 0; i < n_trades; ++i) {
        order.push_back(pick(rng));
    }
    return order;
}

std::vector<size_t> IdentityResampler::resample(size_t n_trades, std::mt19937_64&) const {
    std::vector<size_t> order(n_trades);
    std::iota(order.begin(), order.end(), size_t{0});
    return order;
}

nlohmann::json MonteCarloResult::to_json() const {
    auto percentiles_to_json = [](const std::map<int, double>& values) {
        nlohmann::json j = nlohmann::json::object();
        for (const auto& [level, value] : values) {
            j["p" + std::to_string(level)] = value;
        }
        return j;
    };

    nlohmann::json j;
    j["return_percentiles"] = percentiles_to_json(return_percentiles);
    j["drawdown_percentiles"] = percentiles_to_json(drawdown_percentiles);
    j["mean_return"] = mean_return;
    j["mean_max_drawdown"] = mean_max_drawdown;
    j["probability_of_profit"] = probability_of_profit;
    j["probability_of_ruin"] = probability_of_ruin;
    j["return_distribution"] = summary_to_json(return_distribution);
    j["drawdown_distribution"] = summary_to_json(drawdown_distribution);
    j["return_intervals"] = intervals_to_json(return_intervals);
    j["drawdown_intervals"] = intervals_to_json(drawdown_intervals);

    nlohmann::json exceedance = nlohmann::json::array();
    for (const auto& [threshold, probability] : drawdown_exceedance) {
        exceedance.push_back({{"threshold", threshold}, {"probability", probability}});
    }
    j["drawdown_exceedance"] = exceedance;

    j["historical_return"] = historical_return;
    j["historical_max_drawdown"] = historical_max_drawdown;
    j["historical_percentile_rank"] = historical_percentile_rank;
    j["trades_resampled"] = trades_resampled;
    j["simulations_requested"] = simulations_requested;
    j["simulations_run"] = simulations_run;
    j["completed"] = completed;
    j["stop_reason"] = stop_reason_to_string(stop_reason);
    return j;
}

MonteCarloSimulator::MonteCarloSimulator(MonteCarloConfig config,
                                         std::shared_ptr<const TradeResampler> resampler)
    : config_(std::move(config)),
      resampler_(resampler ? std::move(resampler) : std::make_shared<BootstrapResampler>()) {}

std::vector<double> MonteCarloSimulator::equity_path(const std::vector<double>& pnl) const {
    std::vector<double> path;
    path.reserve(pnl.size() + 1);
    double equity = config_.initial_capital;
    path.push_back(equity);
    for (double value : pnl) {
        equity += value;
        path.push_back(equity);
    }
    return path;
}

MonteCarloSimulator::SimulationOutcome MonteCarloSimulator::evaluate(
    const TradeHistory& history, const std::vector<size_t>& order) const {
    std::vector<double> path;
    double equity = history.initial_capital;
    path.push_back(equity);
    for (size_t index : order) {
        for (double change : history.trades[index]) {
            equity += change;
            path.push_back(equity);
        }
    }

    SimulationOutcome outcome;
    outcome.total_return = metrics_.calculate_total_return(path.front(), path.back());
    outcome.max_drawdown = metrics_.calculate_max_drawdown(path);
    return outcome;
}

Result<MonteCarloResult> MonteCarloSimulator::run(const backtest::BacktestResult& backtest_result,
                                                  size_t n_simulations,
                                                  std::shared_ptr<const CancellationToken> token) const {
    Logger::register_component("MonteCarloSimulator");

    const auto& curve = backtest_result.equity_curve;
    if (backtest_result.trades.empty() || curve.empty()) {
        return make_error<MonteCarloResult>(ErrorCode::INVALID_DATA,
                                            "Backtest has no trades to resample",
                                            "MonteCarloSimulator");
    }

    // One unit per distinct exit bar, in closing order
    std::vector<Timestamp> exits;
    exits.reserve(backtest_result.trades.size());
    for (const auto& trade : backtest_result.trades) {
        exits.push_back(trade.exit.execution_timestamp);
    }
    std::sort(exits.begin(), exits.end());
    exits.erase(std::unique(exits.begin(), exits.end()), exits.end());

    TradeHistory history;
    history.initial_capital = curve.front().equity;
    history.trades.resize(exits.size());
    history.total_return = backtest_result.metrics.total_return;
    history.max_drawdown = backtest_result.metrics.max_drawdown;

    // A bar's equity change belongs to the first trade exiting at or after it;
    // bars after the last exit stay with the last trade
    size_t unit = 0;
    for (size_t i = 1; i < curve.size(); ++i) {
        while (unit + 1 < exits.size() && curve[i].timestamp > exits[unit]) {
            ++unit;
        }
        history.trades[unit].push_back(curve[i].equity - curve[i - 1].equity);
    }

    if (exits.size() < backtest_result.trades.size()) {
        DEBUG("Merged " << backtest_result.trades.size() << " trades into " << exits.size()
                        << " units sharing exit bars");
    }
    return simulate(history, n_simulations, std::move(token));
}

Result<MonteCarloResult> MonteCarloSimulator::run(const std::vector<backtest::Trade>& trades,
                                                  size_t n_simulations,
                                                  std::shared_ptr<const CancellationToken> token) const {
    Logger::register_component("MonteCarloSimulator");

    if (trades.empty()) {
        return make_error<MonteCarloResult>(ErrorCode::INVALID_DATA, "No trades to resample",
                                            "MonteCarloSimulator");
    }

    TradeHistory history;
    history.initial_capital = config_.initial_capital;
    history.trades.reserve(trades.size());
    for (const auto& trade : trades) {
        history.trades.push_back({trade.pnl});
    }

    std::vector<size_t> in_order(trades.size());
    std::iota(in_order.begin(), in_order.end(), size_t{0});
    SimulationOutcome historical = evaluate(history, in_order);
    history.total_return = historical.total_return;
    history.max_drawdown = historical.max_drawdown;

    return simulate(history, n_simulations, std::move(token));
}

Result<MonteCarloResult> MonteCarloSimulator::simulate(
    const TradeHistory& history, size_t n_simulations,
    std::shared_ptr<const CancellationToken> token) const {
    std::vector<std::string> violations;
    config_.validate(violations);
    if (!violations.empty()) {
        return make_validation_error<MonteCarloResult>(std::move(violations),
                                                       "MonteCarloSimulator");
    }
    if (n_simulations == 0) {
        return make_error<MonteCarloResult>(ErrorCode::INVALID_ARGUMENT,
                                            "n_simulations must be > 0", "MonteCarloSimulator");
    }

    MonteCarloResult result;
    result.simulations_requested = n_simulations;
    result.trades_resampled = history.trades.size();
    result.historical_return = history.total_return;
    result.historical_max_drawdown = history.max_drawdown;

    INFO("Monte Carlo: " << n_simulations << " simulations of " << history.trades.size()
                         << " trades from " << history.initial_capital << " ("
                         << resampler_->name() << ", seed " << config_.seed << ")");

    std::optional<std::chrono::milliseconds> timeout;
    if (config_.timeout_ms) {
        timeout = std::chrono::milliseconds(*config_.timeout_ms);
    }
    const BatchControl control(std::move(token), timeout);

    auto outcome = run_batch<SimulationOutcome>(
        n_simulations, config_.max_threads, control, [&](size_t i) {
            std::seed_seq seq{static_cast<uint32_t>(config_.seed),
                              static_cast<uint32_t>(config_.seed >> 32),
                              static_cast<uint32_t>(i), static_cast<uint32_t>(uint64_t(i) >> 32)};
            std::mt19937_64 rng(seq);
            return evaluate(history, resampler_->resample(history.trades.size(), rng));
        });

    std::vector<double> returns;
    std::vector<double> drawdowns;
    for (const auto& simulation : outcome.results) {
        if (simulation) {
            returns.push_back(simulation->total_return);
            drawdowns.push_back(simulation->max_drawdown);
        }
    }

    result.simulations_run = returns.size();
    result.stop_reason = outcome.stop_reason;
    result.completed = outcome.stop_reason == StopReason::NONE && returns.size() == n_simulations;
    if (!result.completed) {
        WARN("Monte Carlo stopped after " << returns.size() << " of " << n_simulations
                                          << " simulations ("
                                          << stop_reason_to_string(outcome.stop_reason) << ")");
    }
    if (returns.empty()) {
        return result;
    }

    result.return_percentiles = statistics::percentiles(returns, config_.percentile_levels);
    result.drawdown_percentiles = statistics::percentiles(drawdowns, config_.percentile_levels);
    result.return_distribution = statistics::summarize(returns);
    result.drawdown_distribution = statistics::summarize(drawdowns);
    result.mean_return = result.return_distribution.mean;
    result.mean_max_drawdown = result.drawdown_distribution.mean;

    for (int level : config_.confidence_levels) {
        result.return_intervals[level] = statistics::confidence_interval(returns, level / 100.0);
        result.drawdown_intervals[level] =
            statistics::confidence_interval(drawdowns, level / 100.0);
    }

    const double n = static_cast<double>(returns.size());
    auto share_of_drawdowns_above = [&](double threshold) {
        return std::count_if(drawdowns.begin(), drawdowns.end(),
                             [&](double dd) { return dd > threshold; }) /
               n;
    };
    result.probability_of_profit =
        std::count_if(returns.begin(), returns.end(), [](double r) { return r > 0.0; }) / n;
    result.probability_of_ruin = share_of_drawdowns_above(config_.ruin_threshold);
    for (double threshold : config_.drawdown_thresholds) {
        result.drawdown_exceedance[threshold] = share_of_drawdowns_above(threshold);
    }
    result.historical_percentile_rank =
        statistics::percentile_rank(returns, result.historical_return);

    INFO("Monte Carlo finished: mean return " << result.mean_return << ", P(profit) "
                                              << result.probability_of_profit << ", P(ruin) "
                                              << result.probability_of_ruin
                                              << ", history at percentile "
                                              << result.historical_percentile_rank);
    return result;
}

}  // namespace analysis
}  // namespace trade_sim
