#include "trade_sim/backtest/execution_simulator.hpp"

#include <algorithm>
#include <cmath>

#include "trade_sim/core/logger.hpp"

namespace trade_sim {
namespace backtest {

std::string fill_price_source_to_string(FillPriceSource source) {
    return source == FillPriceSource::CLOSE ? "CLOSE" : "OPEN";
}

void ExecutionConfig::validate(std::vector<std::string>& violations) const {
    double previous = 0.0;
    for (size_t i = 0; i < partial_fill_bands.size(); ++i) {
        const auto& band = partial_fill_bands[i];
        std::string name = "execution.partial_fill_bands[" + std::to_string(i) + "]";
        if (!(band.max_participation > previous)) {
            violations.push_back(name + ".max_participation must exceed the previous band");
        }
        if (!(band.fill_ratio > 0.0 && band.fill_ratio <= 1.0)) {
            violations.push_back(name + ".fill_ratio must be within (0, 1]");
        }
        previous = band.max_participation;
    }
    if (!(residual_fill_ratio > 0.0 && residual_fill_ratio <= 1.0)) {
        violations.push_back("execution.residual_fill_ratio must be within (0, 1]");
    }
}

nlohmann::json ExecutionConfig::to_json() const {
    nlohmann::json j;
    j["fill_price_source"] = fill_price_source_to_string(fill_price_source);
    j["allow_fractional_quantity"] = allow_fractional_quantity;
    j["partial_fill_bands"] = nlohmann::json::array();
    for (const auto& band : partial_fill_bands) {
        j["partial_fill_bands"].push_back(
            {{"max_participation", band.max_participation}, {"fill_ratio", band.fill_ratio}});
    }
    j["residual_fill_ratio"] = residual_fill_ratio;
    return j;
}

void ExecutionConfig::from_json(const nlohmann::json& j) {
    if (j.contains("fill_price_source")) {
        fill_price_source = j.at("fill_price_source").get<std::string>() == "CLOSE"
                                ? FillPriceSource::CLOSE
                                : FillPriceSource::OPEN;
    }
    if (j.contains("allow_fractional_quantity"))
        allow_fractional_quantity = j.at("allow_fractional_quantity").get<bool>();
    if (j.contains("partial_fill_bands")) {
        partial_fill_bands.clear();
        for (const auto& b : j.at("partial_fill_bands")) {
            partial_fill_bands.push_back(
                {b.at("max_participation").get<double>(), b.at("fill_ratio").get<double>()});
        }
    }
    if (j.contains("residual_fill_ratio"))
        residual_fill_ratio = j.at("residual_fill_ratio").get<double>();
}

ExecutionSimulator::ExecutionSimulator(ExecutionConfig config) : config_(std::move(config)) {}

double ExecutionSimulator::partial_fill_ratio(Quantity quantity, double bar_volume) const {
    if (bar_volume <= 0.0) {
        return config_.residual_fill_ratio;
    }
    double participation = quantity / bar_volume;
    for (const auto& band : config_.partial_fill_bands) {
        if (participation < band.max_participation) {
            return band.fill_ratio;
        }
    }
    return config_.residual_fill_ratio;
}

Quantity ExecutionSimulator::round_quantity(Quantity quantity) const {
    if (config_.allow_fractional_quantity) {
        return quantity;
    }
    // Tolerance keeps 1999.9999999 from flooring to 1999
    return std::floor(quantity + 1e-9);
}

Execution ExecutionSimulator::fill(const OrderIntent& intent, const Bar* bar,
                                   const cost::CostModel& cost_model,
                                   const FillContext& context) const {
    Execution exec;
    exec.order_id = intent.order_id;
    exec.symbol = intent.symbol;
    exec.side = intent.side;
    exec.requested_quantity = std::max(0.0, intent.quantity);
    exec.execution_timestamp = bar ? bar->timestamp : intent.decision_timestamp;

    if (intent.quantity <= 0.0) {
        DEBUG("Order " << intent.order_id << " has no quantity, nothing to fill");
        return exec;
    }
    if (intent.side == Side::NONE) {
        WARN("Order " << intent.order_id << " has no side, nothing to fill");
        return exec;
    }
    if (bar == nullptr) {
        WARN("No bar for " << intent.symbol << " to fill order " << intent.order_id);
        return exec;
    }
    if (!bar->is_valid()) {
        WARN("Invalid bar for " << intent.symbol << ", order " << intent.order_id
                                << " left unfilled");
        return exec;
    }

    const bool is_buy = intent.side == Side::BUY;
    bool triggered = false;
    Price reference = 0.0;
    double session_progress = 0.5;
    double fill_ratio = 1.0;

    switch (intent.order_type) {
        case OrderType::MARKET: {
            FillPriceSource source = context.price_source.value_or(config_.fill_price_source);
            triggered = true;
            reference = source == FillPriceSource::OPEN ? bar->open : bar->close;
            session_progress = source == FillPriceSource::OPEN ? 0.0 : 1.0;
            break;
        }
        case OrderType::LIMIT: {
            if (!intent.limit_price) {
                WARN("LIMIT order " << intent.order_id << " has no limit price");
                return exec;
            }
            Price limit = *intent.limit_price;
            triggered = is_buy ? bar->low <= limit : bar->high >= limit;
            reference = is_buy ? std::min(limit, bar->open) : std::max(limit, bar->open);
            fill_ratio = partial_fill_ratio(intent.quantity, bar->volume);
            break;
        }
        case OrderType::STOP: {
            if (!intent.limit_price) {
                WARN("STOP order " << intent.order_id << " has no stop price");
                return exec;
            }
            Price stop = *intent.limit_price;
            triggered = is_buy ? bar->high >= stop : bar->low <= stop;
            // A gap through the stop fills at the open
            reference = is_buy ? std::max(stop, bar->open) : std::min(stop, bar->open);
            break;
        }
    }
    if (intent.order_type != OrderType::MARKET && triggered && reference == bar->open) {
        session_progress = 0.0;
    }

    Quantity filled = triggered ? round_quantity(intent.quantity * fill_ratio) : 0.0;
    if (filled > intent.quantity) {
        if (filled - intent.quantity > 1e-9) {
            WARN("Over-fill on order " << intent.order_id << ": " << filled << " > "
                                       << intent.quantity << ", clamped");
        }
        filled = intent.quantity;
    }
    filled = std::max(0.0, filled);

    cost::MarketState state;
    state.reference_price = reference;
    state.decision_price = intent.decision_price;
    state.mark_price = bar->close;
    state.benchmark_price = (bar->high + bar->low + bar->close) / 3.0;
    state.average_volume = context.average_volume > 0.0 ? context.average_volume : bar->volume;
    state.volatility = context.volatility;
    state.intrabar_volatility = bar->close > 0.0 ? (bar->high - bar->low) / bar->close : 0.0;
    state.session_progress = session_progress;
    state.order_quantity = intent.quantity;
    state.filled_quantity = filled;
    state.noise_draw = context.noise_draw;
    if (intent.order_type == OrderType::LIMIT) {
        state.limit_price = intent.limit_price;
    }

    Price average = filled > 0.0 ? cost_model.adjusted_price(intent.side, state) : 0.0;
    double order_value = filled * average;
    cost::CostBreakdown costs = intent.purpose == OrderPurpose::ENTRY
                                    ? cost_model.calculate_entry_cost(order_value, intent.side, state)
                                    : cost_model.calculate_exit_cost(order_value, intent.side, state);

    exec.filled_quantity = filled;
    exec.reference_price = filled > 0.0 ? reference : 0.0;
    exec.average_price = average;
    exec.commission = costs.commission;
    exec.slippage_amount = costs.slippage;
    exec.market_impact_amount = costs.market_impact;
    exec.opportunity_cost = costs.opportunity_cost;

    if (!triggered) {
        DEBUG(order_type_to_string(intent.order_type) << " order " << intent.order_id << " on "
                                                      << intent.symbol << " not triggered");
    } else if (exec.is_partial()) {
        DEBUG("Partial fill on " << intent.order_id << ": " << filled << "/" << intent.quantity);
    }
    TRACE("Fill " << intent.order_id << " " << side_to_string(intent.side) << " " << filled
                  << " " << intent.symbol << " @ " << average << " (ref " << reference << ")");
    return exec;
}

}  // namespace backtest
}  // namespace trade_sim
