#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <cmath>
#include <limits>
#include <stdexcept>
#include "../backtest/mock_signal_generator.hpp"
#include "../core/test_base.hpp"
#include "trade_sim/analysis/walk_forward_analyzer.hpp"
#include "trade_sim/statistics/statistics_tools.hpp"

using namespace trade_sim;
using namespace trade_sim::analysis;
using namespace trade_sim::backtest;
using namespace trade_sim::testing;

namespace {

// Buys on the first bar of a run and sells "hold" bars later; 0 builds
// nothing and a negative hold never trades
std::shared_ptr<SignalGenerator> make_hold_generator(const ParameterSet& params) {
    double hold = params.at("hold");
    if (hold == 0.0) {
        return nullptr;
    }
    std::map<size_t, Signal> script;
    if (hold > 0.0) {
        script[0] = buy_signal();
        script[static_cast<size_t>(hold)] = sell_signal();
    }
    return std::make_shared<ScriptedSignalGenerator>(std::move(script));
}

}  // namespace

class WalkForwardAnalyzerTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        t0_ = std::chrono::system_clock::from_time_t(1577836800);

        backtest_config_.cost_config = cost::CostConfig::zero_cost();
        backtest_config_.execution_config.fill_price_source = FillPriceSource::CLOSE;

        config_.objective = ObjectiveMetric::TOTAL_RETURN;
        config_.complexity_penalty = 0.0;
        config_.max_threads = 1;

        std::vector<Bar> bars;
        for (int i = 0; i < 100; ++i) {
            double price = 100.0 + i;
            bars.emplace_back(day(i), price, price, price, price, 1e9, "AAA");
        }
        data_["AAA"] = std::move(bars);
    }

    Timestamp day(int i) const {
        return t0_ + std::chrono::hours(24 * i);
    }

    BacktestConfig backtest_config_;
    WalkForwardConfig config_;
    MarketData data_;
    Timestamp t0_;
};

TEST_F(WalkForwardAnalyzerTest, WindowsSlideOverTimeline) {
    WalkForwardAnalyzer analyzer(backtest_config_, config_);
    auto result = analyzer.analyze(data_, 40, 20, 20, ParameterSpace{{"hold", {5, 10, 20}}},
                                   make_hold_generator);
    ASSERT_TRUE(result.is_ok());

    const auto& wf = result.value();
    EXPECT_TRUE(wf.completed);
    EXPECT_EQ(wf.windows_planned, 3u);
    ASSERT_EQ(wf.windows.size(), 3u);

    const auto& second = wf.windows[1];
    EXPECT_EQ(second.index, 1u);
    EXPECT_EQ(second.in_sample.start, day(20));
    EXPECT_EQ(second.in_sample.end, day(59));
    EXPECT_EQ(second.out_of_sample.start, day(60));
    EXPECT_EQ(second.out_of_sample.end, day(79));
    EXPECT_EQ(second.in_sample.bars, 40u);

    // Rising prices reward the longest hold in every window
    for (const auto& window : wf.windows) {
        EXPECT_DOUBLE_EQ(window.optimal_parameters.at("hold"), 20.0);
        EXPECT_EQ(window.trials_evaluated, 3u);
        EXPECT_GT(window.in_sample_return(), 0.0);
        EXPECT_GT(window.out_of_sample_return(), 0.0);
        EXPECT_DOUBLE_EQ(window.objective_value, window.in_sample_return());
    }
    EXPECT_DOUBLE_EQ(wf.parameter_stability_rate, 1.0);
    EXPECT_NEAR(wf.overfitting_indicator, wf.mean_in_sample_return - wf.mean_out_of_sample_return,
                1e-12);
}

TEST_F(WalkForwardAnalyzerTest, TrialsWithoutTradesExcluded) {
    WalkForwardAnalyzer analyzer(backtest_config_, config_);
    GridSearch search(std::vector<ParameterSet>{{{"hold", -1.0}}, {{"hold", 0.0}}, {{"hold", 5.0}}});
    auto result = analyzer.analyze(data_, 40, 20, 20, search, make_hold_generator);
    ASSERT_TRUE(result.is_ok());

    ASSERT_EQ(result.value().windows.size(), 3u);
    for (const auto& window : result.value().windows) {
        EXPECT_EQ(window.trials_evaluated, 1u);
        EXPECT_EQ(window.trials_excluded, 2u);
        EXPECT_DOUBLE_EQ(window.optimal_parameters.at("hold"), 5.0);
    }
}

TEST_F(WalkForwardAnalyzerTest, WindowsWithoutValidTrialSkipped) {
    WalkForwardAnalyzer analyzer(backtest_config_, config_);
    auto result =
        analyzer.analyze(data_, 40, 20, 20, ParameterSpace{{"hold", {-1}}}, make_hold_generator);
    ASSERT_TRUE(result.is_ok());

    EXPECT_TRUE(result.value().windows.empty());
    EXPECT_EQ(result.value().windows_skipped, 3u);
    EXPECT_DOUBLE_EQ(result.value().parameter_stability_rate, 0.0);
    EXPECT_FALSE(result.value().robust);
}

TEST_F(WalkForwardAnalyzerTest, InvalidArgumentsRejected) {
    WalkForwardAnalyzer analyzer(backtest_config_, config_);
    ParameterSpace space{{"hold", {5}}};

    auto lengths = analyzer.analyze(data_, 0, 20, 0, space, make_hold_generator);
    ASSERT_TRUE(lengths.is_error());
    auto* validation = dynamic_cast<const ValidationError*>(lengths.error());
    ASSERT_NE(validation, nullptr);
    EXPECT_EQ(validation->violations().size(), 2u);

    auto no_factory = analyzer.analyze(data_, 40, 20, 20, space, SignalGeneratorFactory{});
    ASSERT_TRUE(no_factory.is_error());
    EXPECT_EQ(no_factory.error()->code(), ErrorCode::INVALID_ARGUMENT);

    auto no_candidates =
        analyzer.analyze(data_, 40, 20, 20, ParameterSpace{{"hold", {}}}, make_hold_generator);
    ASSERT_TRUE(no_candidates.is_error());
    EXPECT_EQ(no_candidates.error()->code(), ErrorCode::INVALID_ARGUMENT);

    auto too_short = analyzer.analyze(data_, 90, 20, 20, space, make_hold_generator);
    ASSERT_TRUE(too_short.is_error());
    EXPECT_EQ(too_short.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(WalkForwardAnalyzerTest, InvalidBacktestConfigListedWithOwnViolations) {
    backtest_config_.initial_capital = 0.0;
    config_.parameter_change_tolerance = 0.0;
    WalkForwardAnalyzer analyzer(backtest_config_, config_);

    auto result =
        analyzer.analyze(data_, 40, 20, 20, ParameterSpace{{"hold", {5}}}, make_hold_generator);
    ASSERT_TRUE(result.is_error());
    auto* validation = dynamic_cast<const ValidationError*>(result.error());
    ASSERT_NE(validation, nullptr);
    EXPECT_EQ(validation->violations().size(), 2u);
}

TEST_F(WalkForwardAnalyzerTest, CancelledBeforeStart) {
    auto token = std::make_shared<CancellationToken>();
    token->cancel();
    WalkForwardAnalyzer analyzer(backtest_config_, config_);

    auto result = analyzer.analyze(data_, 40, 20, 20, ParameterSpace{{"hold", {5, 10}}},
                                   make_hold_generator, token);
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value().completed);
    EXPECT_EQ(result.value().stop_reason, StopReason::CANCELLED);
    EXPECT_TRUE(result.value().windows.empty());
}

TEST_F(WalkForwardAnalyzerTest, CancelledMidWindowKeepsFinishedWindows) {
    auto token = std::make_shared<CancellationToken>();
    std::atomic<int> calls{0};
    // Window 0 makes three trial calls and one out-of-sample call
    auto factory = [&](const ParameterSet& params) {
        if (++calls == 5) {
            token->cancel();
        }
        return make_hold_generator(params);
    };

    WalkForwardAnalyzer analyzer(backtest_config_, config_);
    auto result = analyzer.analyze(data_, 40, 20, 20, ParameterSpace{{"hold", {5, 10, 20}}},
                                   factory, token);
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value().completed);
    EXPECT_EQ(result.value().stop_reason, StopReason::CANCELLED);
    ASSERT_EQ(result.value().windows.size(), 1u);
    EXPECT_EQ(result.value().windows[0].index, 0u);
}

TEST_F(WalkForwardAnalyzerTest, ResultIndependentOfThreadCount) {
    ParameterSpace space{{"hold", {3, 7, 15, 25}}};

    config_.max_threads = 1;
    auto inline_run = WalkForwardAnalyzer(backtest_config_, config_)
                          .analyze(data_, 40, 20, 10, space, make_hold_generator);
    config_.max_threads = 4;
    auto pooled_run = WalkForwardAnalyzer(backtest_config_, config_)
                          .analyze(data_, 40, 20, 10, space, make_hold_generator);

    ASSERT_TRUE(inline_run.is_ok());
    ASSERT_TRUE(pooled_run.is_ok());
    EXPECT_EQ(inline_run.value().to_json(), pooled_run.value().to_json());
}

TEST_F(WalkForwardAnalyzerTest, ObjectiveSubtractsComplexityPenalty) {
    config_.complexity_penalty = 0.01;
    WalkForwardAnalyzer analyzer(backtest_config_, config_);

    MetricsSnapshot metrics;
    metrics.total_return = 0.1;
    metrics.sharpe_ratio = 1.5;
    EXPECT_NEAR(analyzer.objective(metrics, 2), 0.08, 1e-12);

    config_.objective = ObjectiveMetric::SHARPE;
    WalkForwardAnalyzer sharpe(backtest_config_, config_);
    EXPECT_NEAR(sharpe.objective(metrics, 1), 1.49, 1e-12);
}

TEST_F(WalkForwardAnalyzerTest, RelativeParameterChange) {
    const double inf = std::numeric_limits<double>::infinity();
    EXPECT_DOUBLE_EQ(WalkForwardAnalyzer::max_relative_change({{"a", 10}}, {{"a", 10}}), 0.0);
    EXPECT_NEAR(WalkForwardAnalyzer::max_relative_change({{"a", 10}, {"b", 4}},
                                                         {{"a", 11}, {"b", 5}}),
                0.25, 1e-12);
    EXPECT_EQ(WalkForwardAnalyzer::max_relative_change({{"a", 0}}, {{"a", 1}}), inf);
    EXPECT_EQ(WalkForwardAnalyzer::max_relative_change({{"a", 1}}, {{"b", 1}}), inf);
    EXPECT_EQ(WalkForwardAnalyzer::max_relative_change({{"a", 1}}, {{"a", 1}, {"b", 1}}), inf);
}

TEST_F(WalkForwardAnalyzerTest, StabilityRateOverSuccessivePairs) {
    WalkForwardAnalyzer analyzer(backtest_config_, config_);

    std::vector<WalkForwardWindow> windows(4);
    windows[0].optimal_parameters = {{"fast", 10}};
    windows[1].optimal_parameters = {{"fast", 11}};  // 10% change, stable
    windows[2].optimal_parameters = {{"fast", 20}};  // 82% change
    windows[3].optimal_parameters = {{"fast", 21}};  // 5% change, stable
    EXPECT_NEAR(analyzer.parameter_stability_rate(windows), 2.0 / 3.0, 1e-12);

    windows.resize(1);
    EXPECT_DOUBLE_EQ(analyzer.parameter_stability_rate(windows), 1.0);
    EXPECT_DOUBLE_EQ(analyzer.parameter_stability_rate({}), 0.0);
}

TEST_F(WalkForwardAnalyzerTest, ObjectiveNamesRoundTrip) {
    EXPECT_EQ(objective_metric_from_string("CALMAR"), ObjectiveMetric::CALMAR);
    EXPECT_EQ(objective_metric_to_string(ObjectiveMetric::SORTINO), "SORTINO");
    EXPECT_THROW(objective_metric_from_string("ALPHA"), std::invalid_argument);

    WalkForwardConfig loaded;
    loaded.from_json(nlohmann::json{{"objective", "TOTAL_RETURN"}, {"max_threads", 2}});
    EXPECT_EQ(loaded.objective, ObjectiveMetric::TOTAL_RETURN);
    EXPECT_EQ(loaded.max_threads, 2u);
}

TEST_F(WalkForwardAnalyzerTest, ExpandingWindowsStayAnchored) {
    config_.window_type = WindowType::EXPANDING;
    WalkForwardAnalyzer analyzer(backtest_config_, config_);
    auto result = analyzer.analyze(data_, 40, 20, 20, ParameterSpace{{"hold", {5, 10, 20}}},
                                   make_hold_generator);
    ASSERT_TRUE(result.is_ok());

    const auto& windows = result.value().windows;
    ASSERT_EQ(windows.size(), 3u);
    for (size_t i = 0; i < windows.size(); ++i) {
        EXPECT_EQ(windows[i].in_sample.start, day(0));
        EXPECT_EQ(windows[i].in_sample.end, day(39 + 20 * static_cast<int>(i)));
        EXPECT_EQ(windows[i].in_sample.bars, 40u + 20u * i);
        EXPECT_EQ(windows[i].out_of_sample.start, day(40 + 20 * static_cast<int>(i)));
        EXPECT_EQ(windows[i].out_of_sample.bars, 20u);
    }
    EXPECT_EQ(result.value().to_json()["windows"].size(), 3u);
}

TEST_F(WalkForwardAnalyzerTest, SummaryAveragesWindowMetrics) {
    WalkForwardAnalyzer analyzer(backtest_config_, config_);
    auto result = analyzer.analyze(data_, 40, 20, 20, ParameterSpace{{"hold", {5, 10, 20}}},
                                   make_hold_generator);
    ASSERT_TRUE(result.is_ok());
    const auto& wf = result.value();
    ASSERT_EQ(wf.windows.size(), 3u);

    std::vector<double> is_returns;
    std::vector<double> oos_returns;
    double oos_drawdown = 0.0;
    for (const auto& window : wf.windows) {
        is_returns.push_back(window.in_sample_return());
        oos_returns.push_back(window.out_of_sample_return());
        oos_drawdown += window.out_of_sample_result.metrics.max_drawdown / 3.0;
        EXPECT_NEAR(window.performance_degradation,
                    (window.in_sample_return() - window.out_of_sample_return()) /
                        std::abs(window.in_sample_return()),
                    1e-12);
    }

    EXPECT_NEAR(wf.in_sample_averages.total_return, wf.mean_in_sample_return, 1e-12);
    EXPECT_NEAR(wf.out_of_sample_averages.total_return, wf.mean_out_of_sample_return, 1e-12);
    EXPECT_NEAR(wf.out_of_sample_averages.max_drawdown, oos_drawdown, 1e-12);
    // Every trade on a rising series wins
    EXPECT_DOUBLE_EQ(wf.in_sample_averages.win_rate, 1.0);
    EXPECT_DOUBLE_EQ(wf.out_of_sample_averages.win_rate, 1.0);
    EXPECT_DOUBLE_EQ(wf.success_rate, 1.0);
    EXPECT_NEAR(wf.in_out_correlation, statistics::correlation(is_returns, oos_returns), 1e-12);

    auto j = wf.to_json();
    EXPECT_TRUE(j.contains("in_out_correlation"));
    EXPECT_TRUE(j["out_of_sample_averages"].contains("profit_factor"));
    EXPECT_TRUE(j["windows"][0].contains("performance_degradation"));
}

TEST_F(WalkForwardAnalyzerTest, LosingOutOfSampleLowersSuccessRate) {
    std::vector<Bar> falling;
    for (int i = 0; i < 100; ++i) {
        double price = 200.0 - i;
        falling.emplace_back(day(i), price, price, price, price, 1e9, "AAA");
    }
    data_["AAA"] = std::move(falling);

    WalkForwardAnalyzer analyzer(backtest_config_, config_);
    auto result = analyzer.analyze(data_, 40, 20, 20, ParameterSpace{{"hold", {5, 10}}},
                                   make_hold_generator);
    ASSERT_TRUE(result.is_ok());

    const auto& wf = result.value();
    ASSERT_EQ(wf.windows.size(), 3u);
    EXPECT_DOUBLE_EQ(wf.success_rate, 0.0);
    EXPECT_DOUBLE_EQ(wf.out_of_sample_averages.win_rate, 0.0);
    for (const auto& window : wf.windows) {
        EXPECT_LT(window.out_of_sample_return(), 0.0);
    }
}

TEST_F(WalkForwardAnalyzerTest, WindowTypeNamesRoundTrip) {
    EXPECT_EQ(window_type_from_string("EXPANDING"), WindowType::EXPANDING);
    EXPECT_EQ(window_type_to_string(WindowType::ROLLING), "ROLLING");
    EXPECT_THROW(window_type_from_string("SLIDING"), std::invalid_argument);

    WalkForwardConfig loaded;
    loaded.from_json(nlohmann::json{{"window_type", "EXPANDING"}});
    EXPECT_EQ(loaded.window_type, WindowType::EXPANDING);
    EXPECT_EQ(loaded.to_json()["window_type"], "EXPANDING");
}
