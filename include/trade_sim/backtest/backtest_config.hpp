#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "trade_sim/backtest/execution_simulator.hpp"
#include "trade_sim/core/config_base.hpp"
#include "trade_sim/core/error.hpp"
#include "trade_sim/cost/cost_config.hpp"

namespace trade_sim {
namespace backtest {

/**
 * @brief Configuration of one backtest run
 */
struct BacktestConfig : public ConfigBase {
    double initial_capital{100000.0};

    // Sizing
    double risk_per_trade{0.01};              // Fraction of equity risked per entry
    double min_stop_distance_pct{0.005};      // Floor on the stop distance
    double default_stop_loss_pct{0.02};       // Stop when the signal gives none
    std::optional<double> max_position_size_percent;  // Cap on notional, percent of equity
    std::optional<double> trailing_stop_pct;

    // Signals
    bool allow_short{false};
    double min_confidence{0.0};

    // Metrics
    double periods_per_year{252.0};
    double risk_free_rate{0.0};

    // Seed of the slippage noise stream
    uint64_t random_seed{42};

    cost::CostConfig cost_config;
    ExecutionConfig execution_config;

    /**
     * @brief Sizing and metric constraints, then those of the cost and
     * execution sections
     */
    void validate(std::vector<std::string>& violations) const override;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

}  // namespace backtest
}  // namespace trade_sim
