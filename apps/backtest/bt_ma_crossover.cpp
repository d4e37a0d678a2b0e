#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "trade_sim/analysis/monte_carlo_simulator.hpp"
#include "trade_sim/analysis/walk_forward_analyzer.hpp"
#include "trade_sim/backtest/backtest_engine.hpp"
#include "trade_sim/core/logger.hpp"
#include "trade_sim/strategy/moving_average_crossover.hpp"

using namespace trade_sim;
using namespace trade_sim::backtest;

namespace {

/**
 * @brief Settings of the example run, loadable from one JSON file
 */
struct ExampleConfig : public ConfigBase {
    LoggerConfig logger;
    BacktestConfig backtest;
    analysis::WalkForwardConfig walk_forward;
    analysis::MonteCarloConfig monte_carlo;

    std::vector<std::string> symbols{"AAA", "BBB"};
    size_t bars{750};
    uint64_t data_seed{7};
    size_t simulations{1000};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["logger"] = logger.to_json();
        j["backtest"] = backtest.to_json();
        j["walk_forward"] = walk_forward.to_json();
        j["monte_carlo"] = monte_carlo.to_json();
        j["symbols"] = symbols;
        j["bars"] = bars;
        j["data_seed"] = data_seed;
        j["simulations"] = simulations;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("logger"))
            logger.from_json(j.at("logger"));
        if (j.contains("backtest"))
            backtest.from_json(j.at("backtest"));
        if (j.contains("walk_forward"))
            walk_forward.from_json(j.at("walk_forward"));
        if (j.contains("monte_carlo"))
            monte_carlo.from_json(j.at("monte_carlo"));
        if (j.contains("symbols"))
            symbols = j.at("symbols").get<std::vector<std::string>>();
        if (j.contains("bars"))
            bars = j.at("bars").get<size_t>();
        if (j.contains("data_seed"))
            data_seed = j.at("data_seed").get<uint64_t>();
        if (j.contains("simulations"))
            simulations = j.at("simulations").get<size_t>();
    }

    void validate(std::vector<std::string>& violations) const override {
        logger.validate(violations);
        backtest.validate(violations);
        walk_forward.validate(violations);
        monte_carlo.validate(violations);
        if (symbols.empty())
            violations.push_back("symbols must not be empty");
        if (simulations == 0)
            violations.push_back("simulations must be > 0");
    }
};

/**
 * @brief Daily geometric random walk per symbol with drifting regimes
 */
MarketData make_synthetic_data(const std::vector<std::string>& symbols, size_t bars,
                               uint64_t seed) {
    MarketData data;
    std::mt19937_64 rng(seed);
    std::normal_distribution<double> shock(0.0, 1.0);
    std::uniform_real_distribution<double> volume(5e5, 2e6);
    const auto start = std::chrono::system_clock::from_time_t(1577836800);  // 2020-01-01

    for (const auto& symbol : symbols) {
        std::vector<Bar> series;
        series.reserve(bars);
        double price = 100.0;
        double drift = 0.0005;
        for (size_t i = 0; i < bars; ++i) {
            if (i % 120 == 0) {
                drift = -drift;
            }
            double open = price;
            double close = open * std::exp(drift + 0.015 * shock(rng));
            double high = std::max(open, close) * (1.0 + 0.005 * std::abs(shock(rng)));
            double low = std::min(open, close) * (1.0 - 0.005 * std::abs(shock(rng)));
            series.emplace_back(start + std::chrono::hours(24 * static_cast<int64_t>(i)), open,
                                high, low, close, volume(rng), symbol);
            price = close;
        }
        data.emplace(symbol, std::move(series));
    }
    return data;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        Logger::reset_for_tests();

        // Logs go to a file so stdout carries only the JSON report
        ExampleConfig config;
        config.logger.destination = LogDestination::FILE;
        config.logger.filename_prefix = "bt_ma_crossover";
        config.backtest.max_position_size_percent = 25.0;
        config.backtest.trailing_stop_pct = 0.08;
        config.walk_forward.objective = analysis::ObjectiveMetric::SHARPE;

        if (argc > 1) {
            auto loaded = config.load_from_file(argv[1]);
            if (loaded.is_error()) {
                std::cerr << "Failed to load " << argv[1] << ": " << loaded.error()->what()
                          << std::endl;
                return 1;
            }
        }

        auto& logger = Logger::instance();
        logger.initialize(config.logger);
        if (!logger.is_initialized()) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }
        Logger::register_component("bt_ma_crossover");

        MarketData data = make_synthetic_data(config.symbols, config.bars, config.data_seed);
        INFO("Generated " << config.bars << " synthetic bars for " << config.symbols.size()
                          << " symbols");

        // Single run
        auto factory = strategy::make_moving_average_crossover_factory({10, 40, 0.03, std::nullopt});
        auto generator = factory({});
        BacktestEngine engine(config.backtest);
        auto backtest = engine.run(data, *generator);
        if (backtest.is_error()) {
            std::cerr << "Backtest failed: " << backtest.error()->what() << std::endl;
            return 1;
        }

        // Walk-forward over a small grid
        analysis::WalkForwardAnalyzer analyzer(config.backtest, config.walk_forward);
        analysis::ParameterSpace space{{"fast_window", {5, 10, 20}}, {"slow_window", {30, 50, 80}}};
        auto walk_forward = analyzer.analyze(data, 250, 60, 60, space, factory);
        if (walk_forward.is_error()) {
            std::cerr << "Walk-forward failed: " << walk_forward.error()->what() << std::endl;
            return 1;
        }

        // Monte Carlo on the single run's trades
        analysis::MonteCarloSimulator simulator(config.monte_carlo);
        nlohmann::json monte_carlo_json;
        auto monte_carlo = simulator.run(backtest.value(), config.simulations);
        if (monte_carlo.is_error()) {
            WARN("Monte Carlo skipped: " << monte_carlo.error()->what());
        } else {
            monte_carlo_json = monte_carlo.value().to_json();
        }

        nlohmann::json report;
        report["config"] = config.to_json();
        report["backtest"] = backtest.value().to_json();
        report["walk_forward"] = walk_forward.value().to_json();
        report["monte_carlo"] = monte_carlo_json;
        std::cout << report.dump(2) << std::endl;

        INFO("Example run complete");
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
