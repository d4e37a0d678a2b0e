#include "trade_sim/analysis/walk_forward_analyzer.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <map>
#include <set>
#include <stdexcept>

#include "trade_sim/core/batch_runner.hpp"
#include "trade_sim/core/logger.hpp"
#include "trade_sim/core/time_utils.hpp"
#include "trade_sim/statistics/statistics_tools.hpp"

namespace trade_sim {
namespace analysis {

std::string objective_metric_to_string(ObjectiveMetric metric) {
    switch (metric) {
        case ObjectiveMetric::SHARPE:
            return "SHARPE";
        case ObjectiveMetric::SORTINO:
            return "SORTINO";
        case ObjectiveMetric::CALMAR:
            return "CALMAR";
        case ObjectiveMetric::TOTAL_RETURN:
            return "TOTAL_RETURN";
        default:
            return "UNKNOWN";
    }
}

ObjectiveMetric objective_metric_from_string(const std::string& name) {
    if (name == "SHARPE")
        return ObjectiveMetric::SHARPE;
    if (name == "SORTINO")
        return ObjectiveMetric::SORTINO;
    if (name == "CALMAR")
        return ObjectiveMetric::CALMAR;
    if (name == "TOTAL_RETURN")
        return ObjectiveMetric::TOTAL_RETURN;
    throw std::invalid_argument("Unknown objective metric: " + name);
}

std::string window_type_to_string(WindowType type) {
    switch (type) {
        case WindowType::ROLLING:
            return "ROLLING";
        case WindowType::EXPANDING:
            return "EXPANDING";
        default:
            return "UNKNOWN";
    }
}

WindowType window_type_from_string(const std::string& name) {
    if (name == "ROLLING")
        return WindowType::ROLLING;
    if (name == "EXPANDING")
        return WindowType::EXPANDING;
    throw std::invalid_argument("Unknown window type: " + name);
}

void WalkForwardConfig::validate(std::vector<std::string>& violations) const {
    if (!(complexity_penalty >= 0.0)) {
        violations.push_back("walk_forward.complexity_penalty must be >= 0");
    }
    if (timeout_ms && *timeout_ms <= 0) {
        violations.push_back("walk_forward.timeout_ms must be > 0");
    }
    if (!(min_parameter_stability >= 0.0 && min_parameter_stability <= 1.0)) {
        violations.push_back("walk_forward.min_parameter_stability must be within [0, 1]");
    }
    if (!(parameter_change_tolerance > 0.0)) {
        violations.push_back("walk_forward.parameter_change_tolerance must be > 0");
    }
}

nlohmann::json WalkForwardConfig::to_json() const {
    nlohmann::json j;
    j["objective"] = objective_metric_to_string(objective);
    j["window_type"] = window_type_to_string(window_type);
    j["complexity_penalty"] = complexity_penalty;
    j["max_threads"] = max_threads;
    if (timeout_ms)
        j["timeout_ms"] = *timeout_ms;
    j["max_overfitting"] = max_overfitting;
    j["min_parameter_stability"] = min_parameter_stability;
    j["parameter_change_tolerance"] = parameter_change_tolerance;
    return j;
}

void WalkForwardConfig::from_json(const nlohmann::json& j) {
    if (j.contains("objective"))
        objective = objective_metric_from_string(j.at("objective").get<std::string>());
    if (j.contains("window_type"))
        window_type = window_type_from_string(j.at("window_type").get<std::string>());
    if (j.contains("complexity_penalty"))
        complexity_penalty = j.at("complexity_penalty").get<double>();
    if (j.contains("max_threads"))
        max_threads = j.at("max_threads").get<size_t>();
    if (j.contains("timeout_ms"))
        timeout_ms = j.at("timeout_ms").get<int64_t>();
    if (j.contains("max_overfitting"))
        max_overfitting = j.at("max_overfitting").get<double>();
    if (j.contains("min_parameter_stability"))
        min_parameter_stability = j.at("min_parameter_stability").get<double>();
    if (j.contains("parameter_change_tolerance"))
        parameter_change_tolerance = j.at("parameter_change_tolerance").get<double>();
}

namespace {

nlohmann::json time_range_to_json(const TimeRange& range) {
    return {{"start", core::format_timestamp(range.start)},
            {"end", core::format_timestamp(range.end)},
            {"bars", range.bars}};
}

nlohmann::json result_summary_to_json(const backtest::BacktestResult& result) {
    nlohmann::json j;
    j["metrics"] = result.metrics.to_json();
    j["trades"] = result.trades.size();
    j["final_equity"] = result.final_equity();
    return j;
}

/**
 * @brief Bars of every symbol whose timestamp falls in [start, end]
 */
MarketData slice(const MarketData& data, Timestamp start, Timestamp end) {
    MarketData sliced;
    for (const auto& [symbol, bars] : data) {
        std::vector<Bar> selected;
        for (const Bar& bar : bars) {
            if (bar.timestamp >= start && bar.timestamp <= end) {
                selected.push_back(bar);
            }
        }
        if (!selected.empty()) {
            sliced.emplace(symbol, std::move(selected));
        }
    }
    return sliced;
}

struct TrialOutcome {
    bool valid{false};
    double objective{0.0};
    backtest::BacktestResult result;
};

}  // namespace

nlohmann::json WalkForwardWindow::to_json() const {
    nlohmann::json j;
    j["index"] = index;
    j["in_sample"] = time_range_to_json(in_sample);
    j["out_of_sample"] = time_range_to_json(out_of_sample);
    j["optimal_parameters"] = optimal_parameters;
    j["objective_value"] = objective_value;
    j["trials_evaluated"] = trials_evaluated;
    j["trials_excluded"] = trials_excluded;
    j["in_sample_result"] = result_summary_to_json(in_sample_result);
    j["out_of_sample_result"] = result_summary_to_json(out_of_sample_result);
    j["performance_degradation"] = performance_degradation;
    return j;
}

nlohmann::json WindowAverages::to_json() const {
    return {{"total_return", total_return},
            {"sharpe_ratio", sharpe_ratio},
            {"max_drawdown", max_drawdown},
            {"win_rate", win_rate},
            {"profit_factor", profit_factor}};
}

WindowAverages average_metrics(const std::vector<const backtest::MetricsSnapshot*>& metrics) {
    auto average = [&](double backtest::MetricsSnapshot::*field) {
        std::vector<double> values;
        values.reserve(metrics.size());
        for (const auto* snapshot : metrics) {
            values.push_back(snapshot->*field);
        }
        return statistics::mean(values);
    };

    WindowAverages averages;
    averages.total_return = average(&backtest::MetricsSnapshot::total_return);
    averages.sharpe_ratio = average(&backtest::MetricsSnapshot::sharpe_ratio);
    averages.max_drawdown = average(&backtest::MetricsSnapshot::max_drawdown);
    averages.win_rate = average(&backtest::MetricsSnapshot::win_rate);
    averages.profit_factor = average(&backtest::MetricsSnapshot::profit_factor);
    return averages;
}

nlohmann::json WalkForwardResult::to_json() const {
    nlohmann::json j;
    j["windows"] = nlohmann::json::array();
    for (const auto& window : windows) {
        j["windows"].push_back(window.to_json());
    }
    j["windows_planned"] = windows_planned;
    j["windows_skipped"] = windows_skipped;
    j["mean_in_sample_return"] = mean_in_sample_return;
    j["mean_out_of_sample_return"] = mean_out_of_sample_return;
    j["overfitting_indicator"] = overfitting_indicator;
    j["parameter_stability_rate"] = parameter_stability_rate;
    j["robust"] = robust;
    j["in_sample_averages"] = in_sample_averages.to_json();
    j["out_of_sample_averages"] = out_of_sample_averages.to_json();
    j["in_out_correlation"] = in_out_correlation;
    j["success_rate"] = success_rate;
    j["completed"] = completed;
    j["stop_reason"] = stop_reason_to_string(stop_reason);
    return j;
}

WalkForwardAnalyzer::WalkForwardAnalyzer(backtest::BacktestConfig backtest_config,
                                         WalkForwardConfig config)
    : engine_(std::move(backtest_config)), config_(std::move(config)) {}

double WalkForwardAnalyzer::objective(const backtest::MetricsSnapshot& metrics,
                                      size_t parameter_count) const {
    double value = 0.0;
    switch (config_.objective) {
        case ObjectiveMetric::SHARPE:
            value = metrics.sharpe_ratio;
            break;
        case ObjectiveMetric::SORTINO:
            value = metrics.sortino_ratio;
            break;
        case ObjectiveMetric::CALMAR:
            value = metrics.calmar_ratio;
            break;
        case ObjectiveMetric::TOTAL_RETURN:
            value = metrics.total_return;
            break;
    }
    return value - config_.complexity_penalty * static_cast<double>(parameter_count);
}

double WalkForwardAnalyzer::max_relative_change(const backtest::ParameterSet& previous,
                                                const backtest::ParameterSet& current) {
    constexpr double kUnbounded = std::numeric_limits<double>::infinity();
    double max_change = 0.0;

    for (const auto& [name, before] : previous) {
        auto it = current.find(name);
        if (it == current.end()) {
            return kUnbounded;
        }
        double after = it->second;
        if (before == after) {
            continue;
        }
        if (before == 0.0) {
            return kUnbounded;
        }
        max_change = std::max(max_change, std::abs(after - before) / std::abs(before));
    }
    for (const auto& entry : current) {
        if (previous.count(entry.first) == 0) {
            return kUnbounded;
        }
    }
    return max_change;
}

double WalkForwardAnalyzer::parameter_stability_rate(
    const std::vector<WalkForwardWindow>& windows) const {
    if (windows.empty()) {
        return 0.0;
    }
    if (windows.size() == 1) {
        return 1.0;
    }

    size_t stable = 0;
    for (size_t i = 1; i < windows.size(); ++i) {
        double change =
            max_relative_change(windows[i - 1].optimal_parameters, windows[i].optimal_parameters);
        if (change < config_.parameter_change_tolerance) {
            ++stable;
        }
    }
    return static_cast<double>(stable) / static_cast<double>(windows.size() - 1);
}

Result<WalkForwardResult> WalkForwardAnalyzer::analyze(
    const MarketData& data, size_t in_sample_len, size_t out_of_sample_len, size_t step_len,
    const ParameterSpace& space, const backtest::SignalGeneratorFactory& factory,
    std::shared_ptr<const CancellationToken> token) const {
    return analyze(data, in_sample_len, out_of_sample_len, step_len, GridSearch(space), factory,
                   std::move(token));
}

Result<WalkForwardResult> WalkForwardAnalyzer::analyze(
    const MarketData& data, size_t in_sample_len, size_t out_of_sample_len, size_t step_len,
    const ParameterSearch& search, const backtest::SignalGeneratorFactory& factory,
    std::shared_ptr<const CancellationToken> token) const {
    Logger::register_component("WalkForwardAnalyzer");

    std::vector<std::string> violations = engine_.config().collect_violations();
    config_.validate(violations);
    if (in_sample_len == 0)
        violations.push_back("in_sample_len must be > 0");
    if (out_of_sample_len == 0)
        violations.push_back("out_of_sample_len must be > 0");
    if (step_len == 0)
        violations.push_back("step_len must be > 0");
    if (!violations.empty()) {
        return make_validation_error<WalkForwardResult>(std::move(violations),
                                                        "WalkForwardAnalyzer");
    }
    if (!factory) {
        return make_error<WalkForwardResult>(ErrorCode::INVALID_ARGUMENT,
                                             "No signal generator factory", "WalkForwardAnalyzer");
    }

    const std::vector<backtest::ParameterSet> candidates = search.candidates();
    if (candidates.empty()) {
        return make_error<WalkForwardResult>(ErrorCode::INVALID_ARGUMENT,
                                             search.name() + " produced no parameter sets",
                                             "WalkForwardAnalyzer");
    }

    std::set<Timestamp> distinct;
    for (const auto& [symbol, bars] : data) {
        for (const Bar& bar : bars) {
            distinct.insert(bar.timestamp);
        }
    }
    const std::vector<Timestamp> timeline(distinct.begin(), distinct.end());
    if (timeline.size() < in_sample_len + out_of_sample_len) {
        return make_error<WalkForwardResult>(
            ErrorCode::INVALID_DATA,
            "Timeline has " + std::to_string(timeline.size()) + " bars, a window needs " +
                std::to_string(in_sample_len + out_of_sample_len),
            "WalkForwardAnalyzer");
    }

    std::optional<std::chrono::milliseconds> timeout;
    if (config_.timeout_ms) {
        timeout = std::chrono::milliseconds(*config_.timeout_ms);
    }
    const BatchControl control(std::move(token), timeout);

    WalkForwardResult result;
    for (size_t start = 0; start + in_sample_len + out_of_sample_len <= timeline.size();
         start += step_len) {
        result.windows_planned++;
    }

    INFO("Walk-forward over " << timeline.size() << " bars: " << result.windows_planned << " "
                              << window_type_to_string(config_.window_type) << " windows, "
                              << candidates.size() << " candidates (" << search.name() << ")");

    size_t window_index = 0;
    for (size_t start = 0; start + in_sample_len + out_of_sample_len <= timeline.size();
         start += step_len, ++window_index) {
        StopReason reason = control.check();
        if (reason != StopReason::NONE) {
            result.completed = false;
            result.stop_reason = reason;
            break;
        }

        WalkForwardWindow window;
        window.index = window_index;
        const size_t in_sample_begin = config_.window_type == WindowType::EXPANDING ? 0 : start;
        window.in_sample = {timeline[in_sample_begin], timeline[start + in_sample_len - 1],
                            start + in_sample_len - in_sample_begin};
        window.out_of_sample = {timeline[start + in_sample_len],
                                timeline[start + in_sample_len + out_of_sample_len - 1],
                                out_of_sample_len};

        const MarketData in_sample = slice(data, window.in_sample.start, window.in_sample.end);
        const MarketData out_of_sample =
            slice(data, window.out_of_sample.start, window.out_of_sample.end);

        auto outcome = run_batch<TrialOutcome>(
            candidates.size(), config_.max_threads, control, [&](size_t i) {
                Logger::register_component("WalkForwardAnalyzer");
                TrialOutcome trial;
                const auto& params = candidates[i];
                auto generator = factory(params);
                if (!generator) {
                    WARN("Window " << window_index << ": factory returned no generator for "
                                   << backtest::parameters_to_string(params) << ", excluded");
                    return trial;
                }
                auto run = engine_.run(in_sample, *generator);
                if (run.is_error()) {
                    WARN("Window " << window_index << ": trial "
                                   << backtest::parameters_to_string(params)
                                   << " failed: " << run.error()->what() << ", excluded");
                    return trial;
                }
                if (run.value().trades.empty()) {
                    DEBUG("Window " << window_index << ": trial "
                                    << backtest::parameters_to_string(params)
                                    << " produced no trades, excluded");
                    return trial;
                }
                trial.valid = true;
                trial.result = run.value();
                trial.objective = objective(trial.result.metrics, params.size());
                return trial;
            });

        if (outcome.stop_reason != StopReason::NONE) {
            WARN("Window " << window_index << " search stopped ("
                           << stop_reason_to_string(outcome.stop_reason) << "), window discarded");
            result.completed = false;
            result.stop_reason = outcome.stop_reason;
            break;
        }

        // Earliest candidate wins ties
        std::optional<size_t> best;
        for (size_t i = 0; i < outcome.results.size(); ++i) {
            const auto& trial = outcome.results[i];
            if (!trial || !trial->valid) {
                window.trials_excluded++;
                continue;
            }
            window.trials_evaluated++;
            if (!best || trial->objective > outcome.results[*best]->objective) {
                best = i;
            }
        }

        if (!best) {
            WARN("Window " << window_index << " has no valid trial, skipped");
            result.windows_skipped++;
            continue;
        }

        window.optimal_parameters = candidates[*best];
        window.objective_value = outcome.results[*best]->objective;
        window.in_sample_result = std::move(outcome.results[*best]->result);

        auto generator = factory(window.optimal_parameters);
        if (!generator) {
            WARN("Window " << window_index << ": factory returned no generator for the winner, "
                           << "skipped");
            result.windows_skipped++;
            continue;
        }
        auto oos = engine_.run(out_of_sample, *generator);
        if (oos.is_error()) {
            WARN("Window " << window_index << " out-of-sample run failed: " << oos.error()->what()
                           << ", skipped");
            result.windows_skipped++;
            continue;
        }
        window.out_of_sample_result = oos.value();
        if (window.in_sample_return() != 0.0) {
            window.performance_degradation =
                (window.in_sample_return() - window.out_of_sample_return()) /
                std::abs(window.in_sample_return());
        }

        INFO("Window " << window_index << ": best "
                       << backtest::parameters_to_string(window.optimal_parameters)
                       << " IS return " << window.in_sample_return() << ", OOS return "
                       << window.out_of_sample_return());
        result.windows.push_back(std::move(window));
    }

    std::vector<double> in_sample_returns;
    std::vector<double> out_of_sample_returns;
    std::vector<const backtest::MetricsSnapshot*> in_sample_metrics;
    std::vector<const backtest::MetricsSnapshot*> out_of_sample_metrics;
    size_t successes = 0;
    for (const auto& window : result.windows) {
        in_sample_returns.push_back(window.in_sample_return());
        out_of_sample_returns.push_back(window.out_of_sample_return());
        in_sample_metrics.push_back(&window.in_sample_result.metrics);
        out_of_sample_metrics.push_back(&window.out_of_sample_result.metrics);
        if (window.out_of_sample_return() > 0.0) {
            ++successes;
        }
    }
    result.in_sample_averages = average_metrics(in_sample_metrics);
    result.out_of_sample_averages = average_metrics(out_of_sample_metrics);
    result.in_out_correlation = statistics::correlation(in_sample_returns, out_of_sample_returns);
    if (!result.windows.empty()) {
        result.success_rate =
            static_cast<double>(successes) / static_cast<double>(result.windows.size());
    }
    result.mean_in_sample_return = statistics::mean(in_sample_returns);
    result.mean_out_of_sample_return = statistics::mean(out_of_sample_returns);
    result.overfitting_indicator = result.mean_in_sample_return - result.mean_out_of_sample_return;
    result.parameter_stability_rate = parameter_stability_rate(result.windows);
    result.robust = !result.windows.empty() &&
                    result.overfitting_indicator < config_.max_overfitting &&
                    result.parameter_stability_rate > config_.min_parameter_stability;

    INFO("Walk-forward finished: " << result.windows.size() << " windows, overfitting "
                                   << result.overfitting_indicator << ", stability "
                                   << result.parameter_stability_rate << ", success rate "
                                   << result.success_rate
                                   << (result.robust ? ", robust" : ", not robust")
                                   << (result.completed ? "" : " (stopped early)"));
    return result;
}

}  // namespace analysis
}  // namespace trade_sim
