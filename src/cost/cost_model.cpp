#include "trade_sim/cost/cost_model.hpp"

#include <algorithm>
#include <cmath>

namespace trade_sim {
namespace cost {

CostModel::CostModel(CostConfig config) : config_(std::move(config)) {}

CostBreakdown CostModel::calculate_entry_cost(double order_value, Side side,
                                              const MarketState& state) const {
    return calculate_execution_cost(order_value, side, state);
}

CostBreakdown CostModel::calculate_exit_cost(double order_value, Side side,
                                             const MarketState& state) const {
    return calculate_execution_cost(order_value, side, state);
}

CostBreakdown CostModel::calculate_execution_cost(double order_value, Side side,
                                                  const MarketState& state) const {
    CostBreakdown costs;
    Quantity filled = std::max(0.0, state.filled_quantity);

    if (filled > 0.0) {
        PriceAdjustment adjustment = price_adjustment(side, state);
        costs.commission = calculate_commission(std::abs(order_value), filled);
        costs.slippage = state.reference_price * adjustment.slippage_fraction * filled;
        costs.market_impact = state.reference_price * adjustment.impact_fraction * filled;
    }
    costs.opportunity_cost = calculate_opportunity_cost(side, state);
    costs.total = costs.commission + costs.slippage + costs.market_impact + costs.opportunity_cost;
    return costs;
}

CostBreakdown CostModel::calculate_round_trip_cost(const Execution& entry,
                                                   const Execution& exit) const {
    CostBreakdown costs;
    for (const Execution* exec : {&entry, &exit}) {
        costs.commission += exec->commission;
        costs.slippage += exec->slippage_amount;
        costs.market_impact += exec->market_impact_amount;
        costs.opportunity_cost += exec->opportunity_cost;
    }
    costs.total = costs.commission + costs.slippage + costs.market_impact + costs.opportunity_cost;
    return costs;
}

double CostModel::calculate_commission(double order_value, Quantity quantity) const {
    if (quantity <= 0.0) {
        return 0.0;
    }

    const auto& cfg = config_.commission;
    double commission = 0.0;

    switch (cfg.type) {
        case CommissionType::FIXED:
            commission = cfg.fixed_amount;
            break;
        case CommissionType::PERCENTAGE:
            commission = order_value * cfg.rate_percent / 100.0;
            break;
        case CommissionType::TIERED: {
            // Each band's rate applies only to the quantity inside the band
            double lower = 0.0;
            double remaining = quantity;
            double last_rate = 0.0;
            for (const auto& tier : cfg.tiers) {
                if (remaining <= 0.0)
                    break;
                double band = std::min(remaining, tier.up_to_quantity - lower);
                commission += band * tier.rate_per_unit;
                remaining -= band;
                lower = tier.up_to_quantity;
                last_rate = tier.rate_per_unit;
            }
            // Quantity beyond the last bounded tier stays at the last rate
            if (remaining > 0.0) {
                commission += remaining * last_rate;
            }
            break;
        }
    }

    if (cfg.min_commission) {
        commission = std::max(commission, *cfg.min_commission);
    }
    if (cfg.max_commission) {
        commission = std::min(commission, *cfg.max_commission);
    }
    return commission;
}

double CostModel::participation_rate(const MarketState& state) const {
    double max_participation = config_.impact.max_participation;
    if (state.average_volume <= 0.0) {
        return max_participation;
    }
    double participation = std::abs(state.order_quantity) / state.average_volume;
    return std::clamp(participation, 0.0, max_participation);
}

double CostModel::slippage_fraction(const MarketState& state) const {
    const auto& cfg = config_.slippage;

    double volatility = state.volatility > 0.0 ? state.volatility : state.intrabar_volatility;
    double base = cfg.half_spread_bps / 10000.0 +
                  cfg.volatility_coefficient * volatility * std::sqrt(participation_rate(state));
    if (state.noise_draw) {
        base += cfg.noise_bps / 10000.0 * *state.noise_draw;
    }

    double edge = 2.0 * std::clamp(state.session_progress, 0.0, 1.0) - 1.0;
    double session_factor = 1.0 + cfg.session_edge_premium * edge * edge;

    return std::max(0.0, base * session_factor);
}

double CostModel::impact_fraction(const MarketState& state) const {
    const auto& cfg = config_.impact;
    double participation = participation_rate(state);
    double impact_bps =
        cfg.temporary_impact_bps * std::sqrt(participation) + cfg.permanent_impact_bps * participation;
    return std::min(impact_bps, cfg.max_impact_bps) / 10000.0;
}

PriceAdjustment CostModel::price_adjustment(Side side, const MarketState& state) const {
    PriceAdjustment adjustment{slippage_fraction(state), impact_fraction(state)};

    if (state.limit_price && state.reference_price > 0.0) {
        double room = side_sign(side) * (*state.limit_price - state.reference_price) /
                      state.reference_price;
        room = std::max(0.0, room);
        double total = adjustment.total();
        if (total > room) {
            double scale = total > 0.0 ? room / total : 0.0;
            adjustment.slippage_fraction *= scale;
            adjustment.impact_fraction *= scale;
        }
    }
    return adjustment;
}

Price CostModel::adjusted_price(Side side, const MarketState& state) const {
    return state.reference_price * (1.0 + side_sign(side) * price_adjustment(side, state).total());
}

double CostModel::calculate_opportunity_cost(Side side, const MarketState& state) const {
    const auto& cfg = config_.opportunity;
    Quantity filled = std::max(0.0, state.filled_quantity);
    Quantity unfilled = std::max(0.0, state.order_quantity - filled);

    double cost = 0.0;

    if (unfilled > 0.0 && state.decision_price > 0.0 && state.mark_price > 0.0) {
        cost += unfilled * std::abs(state.mark_price - state.decision_price);
    }

    if (filled > 0.0 && cfg.execution_latency_seconds > 0.0) {
        cost += cfg.execution_delay_coefficient * std::sqrt(cfg.execution_latency_seconds) *
                state.intrabar_volatility * state.reference_price * filled;
    }

    if (filled > 0.0 && cfg.include_timing_cost && state.benchmark_price > 0.0) {
        double deviation = side_sign(side) * (state.reference_price - state.benchmark_price);
        cost += std::max(0.0, deviation) * filled;
    }

    return cost;
}

}  // namespace cost
}  // namespace trade_sim
