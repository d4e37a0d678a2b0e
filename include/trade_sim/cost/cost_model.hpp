#pragma once

#include <optional>
#include <nlohmann/json.hpp>

#include "trade_sim/core/types.hpp"
#include "trade_sim/cost/cost_config.hpp"

namespace trade_sim {
namespace cost {

/**
 * @brief Cost components of one execution or one round trip, in currency
 */
struct CostBreakdown {
    double commission{0.0};
    double slippage{0.0};
    double market_impact{0.0};
    double opportunity_cost{0.0};
    double total{0.0};

    CostBreakdown& operator+=(const CostBreakdown& other) {
        commission += other.commission;
        slippage += other.slippage;
        market_impact += other.market_impact;
        opportunity_cost += other.opportunity_cost;
        total += other.total;
        return *this;
    }

    nlohmann::json to_json() const {
        return {{"commission", commission},
                {"slippage", slippage},
                {"market_impact", market_impact},
                {"opportunity_cost", opportunity_cost},
                {"total", total}};
    }
};

/**
 * @brief Order and market state at the moment of execution
 */
struct MarketState {
    Price reference_price{0.0};  // Un-costed fill level
    Price decision_price{0.0};   // Price when the order was decided
    Price mark_price{0.0};       // Close of the execution bar
    Price benchmark_price{0.0};  // VWAP proxy of the execution bar
    double average_volume{0.0};
    double volatility{0.0};           // Per-bar return volatility
    double intrabar_volatility{0.0};  // (high - low) / close of the execution bar
    double session_progress{0.5};     // 0 at the open, 1 at the close
    Quantity order_quantity{0.0};
    Quantity filled_quantity{0.0};
    std::optional<Price> limit_price;  // Effective price may not cross it
    std::optional<double> noise_draw;  // Standard normal draw from a seeded stream
};

/**
 * @brief Slippage and impact as fractions of the reference price
 */
struct PriceAdjustment {
    double slippage_fraction{0.0};
    double impact_fraction{0.0};

    double total() const {
        return slippage_fraction + impact_fraction;
    }
};

/**
 * @brief The one cost model shared by every fill of a run
 *
 * Stateless: every method is a pure function of the configuration and
 * its arguments, so one instance may be shared across threads.
 */
class CostModel {
public:
    explicit CostModel(CostConfig config = CostConfig());

    /**
     * @brief Costs of an order that opens a position
     *
     * @param order_value Filled quantity times effective price
     * @param side Order side
     * @param state Order and market state at execution
     * @return Cost breakdown with total = sum of the components
     */
    CostBreakdown calculate_entry_cost(double order_value, Side side,
                                       const MarketState& state) const;

    /**
     * @brief Costs of an order that closes a position
     */
    CostBreakdown calculate_exit_cost(double order_value, Side side,
                                      const MarketState& state) const;

    /**
     * @brief Combined costs of the entry and exit executions of one trade
     */
    CostBreakdown calculate_round_trip_cost(const Execution& entry, const Execution& exit) const;

    /**
     * @brief Commission for one order, clamped to the configured bounds
     * @param order_value Notional of the filled quantity
     * @param quantity Filled quantity
     */
    double calculate_commission(double order_value, Quantity quantity) const;

    /**
     * @brief Order quantity over average volume, clamped to [0, max_participation]
     *
     * Missing volume history counts as the maximum participation.
     */
    double participation_rate(const MarketState& state) const;

    double slippage_fraction(const MarketState& state) const;

    double impact_fraction(const MarketState& state) const;

    /**
     * @brief Slippage and impact fractions, reduced pro rata so the
     * effective price never crosses a limit
     */
    PriceAdjustment price_adjustment(Side side, const MarketState& state) const;

    /**
     * @brief Reference price moved against the side by slippage and impact
     */
    Price adjusted_price(Side side, const MarketState& state) const;

    /**
     * @brief Unfilled drift, execution delay and timing cost
     */
    double calculate_opportunity_cost(Side side, const MarketState& state) const;

    const CostConfig& config() const {
        return config_;
    }

private:
    CostBreakdown calculate_execution_cost(double order_value, Side side,
                                           const MarketState& state) const;

    CostConfig config_;
};

}  // namespace cost
}  // namespace trade_sim
