#pragma once

#include <memory>
#include <optional>
#include <string>

#include "trade_sim/backtest/signal_generator.hpp"
#include "trade_sim/core/error.hpp"
#include "trade_sim/core/types.hpp"

namespace trade_sim {
namespace strategy {

/**
 * @brief Configuration of the moving-average crossover
 */
struct MovingAverageCrossoverConfig {
    int fast_window{10};
    int slow_window{30};
    std::optional<double> stop_loss_pct;    // Attach a stop this far from the close
    std::optional<double> take_profit_pct;  // Attach a target this far from the close
};

/**
 * @brief Buys when the fast SMA crosses above the slow SMA, sells on the
 * opposite cross
 *
 * Stateless between bars: every decision is recomputed from the window.
 */
class MovingAverageCrossover : public backtest::SignalGenerator {
public:
    explicit MovingAverageCrossover(MovingAverageCrossoverConfig config);

    Result<Signal> generate_signal(const backtest::HistoricalWindow& window) override;

    std::string name() const override;

    const MovingAverageCrossoverConfig& config() const {
        return config_;
    }

private:
    /**
     * @brief Simple moving average of the closes ending at index end - 1
     */
    static double sma(const backtest::HistoricalWindow& window, size_t end, int length);

    MovingAverageCrossoverConfig config_;
};

/**
 * @brief Factory reading "fast_window" and "slow_window" from a parameter set
 *
 * Parameters missing from the set keep the values of the base configuration.
 */
backtest::SignalGeneratorFactory make_moving_average_crossover_factory(
    MovingAverageCrossoverConfig base = {});

}  // namespace strategy
}  // namespace trade_sim
