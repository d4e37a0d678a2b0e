#include "trade_sim/backtest/portfolio.hpp"

#include <algorithm>
#include <stdexcept>

#include "trade_sim/core/logger.hpp"

namespace trade_sim {
namespace backtest {

namespace {

constexpr double kQuantityEpsilon = 1e-9;

// Volume-weighted merge of a further exit fill into the aggregated exit
void merge_exit_fill(Execution& aggregate, const Execution& fill) {
    double total = aggregate.filled_quantity + fill.filled_quantity;
    if (total > 0.0) {
        aggregate.reference_price = (aggregate.reference_price * aggregate.filled_quantity +
                                     fill.reference_price * fill.filled_quantity) /
                                    total;
        aggregate.average_price = (aggregate.average_price * aggregate.filled_quantity +
                                   fill.average_price * fill.filled_quantity) /
                                  total;
    }
    aggregate.filled_quantity = total;
    aggregate.requested_quantity += fill.requested_quantity;
    aggregate.commission += fill.commission;
    aggregate.slippage_amount += fill.slippage_amount;
    aggregate.market_impact_amount += fill.market_impact_amount;
    aggregate.opportunity_cost += fill.opportunity_cost;
    aggregate.execution_timestamp = fill.execution_timestamp;
    aggregate.order_id = fill.order_id;
}

}  // namespace

Portfolio::Portfolio(double initial_capital) : initial_capital_(initial_capital) {}

Result<PositionId> Portfolio::open_position(const Execution& entry,
                                            const ProtectiveLevels& levels) {
    if (!entry.is_filled()) {
        return make_error<PositionId>(ErrorCode::INVALID_ORDER,
                                      "Cannot open a position from an unfilled execution " +
                                          entry.order_id,
                                      "Portfolio");
    }
    if (entry.side != Side::BUY && entry.side != Side::SELL) {
        return make_error<PositionId>(ErrorCode::INVALID_ORDER,
                                      "Entry execution " + entry.order_id + " has no side",
                                      "Portfolio");
    }
    if (symbol_index_.count(entry.symbol) > 0) {
        return make_error<PositionId>(ErrorCode::INVALID_ORDER,
                                      "Position already open for " + entry.symbol, "Portfolio");
    }

    Position position;
    position.id = arena_.size();
    position.symbol = entry.symbol;
    position.side = entry.side;
    position.quantity = entry.filled_quantity;
    position.entry = entry;
    position.opened_at = entry.execution_timestamp;
    position.stop_loss = levels.stop_loss;
    position.take_profit = levels.take_profit;
    position.trailing_stop_pct = levels.trailing_stop_pct;
    position.best_price = entry.reference_price;
    if (levels.trailing_stop_pct) {
        position.trailing_stop =
            entry.reference_price * (1.0 - side_sign(entry.side) * *levels.trailing_stop_pct);
    }

    arena_.push_back(position);
    symbol_index_[entry.symbol] = position.id;

    DEBUG("Opened " << (entry.side == Side::BUY ? "long " : "short ") << position.quantity << " "
                    << entry.symbol << " @ " << entry.reference_price);
    return position.id;
}

std::optional<PositionId> Portfolio::find_open_position(const std::string& symbol) const {
    auto it = symbol_index_.find(symbol);
    if (it == symbol_index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const Position& Portfolio::position(PositionId id) const {
    if (id >= arena_.size()) {
        throw std::out_of_range("Unknown position id " + std::to_string(id));
    }
    return arena_[id];
}

Result<std::optional<Trade>> Portfolio::apply_exit(PositionId id, const Execution& exit,
                                                   ExitReason reason,
                                                   const cost::CostModel& cost_model) {
    if (id >= arena_.size()) {
        return make_error<std::optional<Trade>>(ErrorCode::POSITION_NOT_FOUND,
                                                "Unknown position id " + std::to_string(id),
                                                "Portfolio");
    }
    Position& position = arena_[id];
    auto open = symbol_index_.find(position.symbol);
    if (open == symbol_index_.end() || open->second != id) {
        return make_error<std::optional<Trade>>(
            ErrorCode::POSITION_NOT_FOUND,
            "Position " + std::to_string(id) + " for " + position.symbol + " is not open",
            "Portfolio");
    }
    if (exit.side != opposite(position.side)) {
        return make_error<std::optional<Trade>>(
            ErrorCode::INVALID_ORDER,
            "Exit " + exit.order_id + " does not reduce the " + position.symbol + " position",
            "Portfolio");
    }
    if (!exit.is_filled()) {
        return std::optional<Trade>();
    }

    Execution fill = exit;
    if (fill.filled_quantity > position.quantity + kQuantityEpsilon) {
        WARN("Exit fill " << fill.filled_quantity << " exceeds open quantity "
                          << position.quantity << " for " << position.symbol << ", clamped");
        fill.filled_quantity = position.quantity;
    }

    if (position.partial_exit) {
        merge_exit_fill(*position.partial_exit, fill);
    } else {
        position.partial_exit = fill;
    }
    position.quantity = std::max(0.0, position.quantity - fill.filled_quantity);

    if (position.quantity > kQuantityEpsilon) {
        DEBUG("Partial exit on " << position.symbol << ", " << position.quantity << " remaining");
        return std::optional<Trade>();
    }
    return std::optional<Trade>(close_position(position, reason, cost_model));
}

Trade Portfolio::close_position(Position& position, ExitReason reason,
                                const cost::CostModel& cost_model) {
    const Execution& exit = *position.partial_exit;

    Trade trade;
    trade.symbol = position.symbol;
    trade.side = position.side;
    trade.quantity = position.entry.filled_quantity;
    trade.entry = position.entry;
    trade.exit = exit;
    trade.costs = cost_model.calculate_round_trip_cost(position.entry, exit);
    trade.total_cost = trade.costs.total;
    trade.pnl = side_sign(position.side) * (exit.reference_price - position.entry.reference_price) *
                    trade.quantity -
                trade.total_cost;
    trade.holding_period = exit.execution_timestamp - position.entry.execution_timestamp;
    trade.exit_reason = reason;

    realized_pnl_ += trade.pnl;
    trades_.push_back(trade);
    symbol_index_.erase(position.symbol);
    position.quantity = 0.0;

    DEBUG("Closed " << trade.symbol << " (" << exit_reason_to_string(reason) << ") pnl "
                    << trade.pnl << " after costs " << trade.total_cost);
    return trade;
}

void Portfolio::update_trailing_stop(PositionId id, const Bar& bar) {
    if (id >= arena_.size())
        return;
    Position& position = arena_[id];
    if (!position.trailing_stop_pct || position.quantity <= 0.0)
        return;

    double pct = *position.trailing_stop_pct;
    if (position.side == Side::BUY) {
        position.best_price = std::max(position.best_price, bar.high);
        Price level = position.best_price * (1.0 - pct);
        position.trailing_stop = std::max(position.trailing_stop.value_or(level), level);
    } else {
        position.best_price = std::min(position.best_price, bar.low);
        Price level = position.best_price * (1.0 + pct);
        position.trailing_stop = std::min(position.trailing_stop.value_or(level), level);
    }
}

void Portfolio::start(Timestamp timestamp) {
    equity_curve_.push_back({timestamp, initial_capital_});
}

const EquityPoint& Portfolio::mark_to_market(Timestamp timestamp,
                                             const std::map<std::string, Price>& marks) {
    double unrealized = 0.0;
    for (const auto& [symbol, id] : symbol_index_) {
        const Position& position = arena_[id];
        auto mark = marks.find(symbol);
        Price price = mark != marks.end() ? mark->second : position.entry.reference_price;
        unrealized += position.unrealized_pnl(price);
    }
    equity_curve_.push_back({timestamp, initial_capital_ + realized_pnl_ + unrealized});
    return equity_curve_.back();
}

double Portfolio::equity() const {
    return equity_curve_.empty() ? initial_capital_ : equity_curve_.back().equity;
}

std::vector<PositionId> Portfolio::open_position_ids() const {
    std::vector<PositionId> ids;
    ids.reserve(symbol_index_.size());
    for (const auto& [symbol, id] : symbol_index_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

}  // namespace backtest
}  // namespace trade_sim
