#pragma once

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "trade_sim/backtest/trade.hpp"
#include "trade_sim/core/error.hpp"
#include "trade_sim/core/types.hpp"
#include "trade_sim/cost/cost_model.hpp"

namespace trade_sim {
namespace backtest {

/**
 * @brief Trade ledger of one simulation run
 *
 * Positions live in an arena indexed by PositionId; a symbol index maps
 * each symbol to its one open position. Positions change only through
 * open_position() and apply_exit(). Closed trades and equity points are
 * append-only.
 *
 * Equity = initial capital + realized P&L + unrealized P&L, where every
 * cost is charged exactly once through the trade's round-trip breakdown.
 */
class Portfolio {
public:
    explicit Portfolio(double initial_capital);

    /**
     * @brief Open a position from a filled entry execution
     * @return Id of the new position, or an error if the symbol already has
     *         an open position or the execution carries no fill
     */
    Result<PositionId> open_position(const Execution& entry, const ProtectiveLevels& levels = {});

    /**
     * @brief Look up the open position of a symbol
     */
    std::optional<PositionId> find_open_position(const std::string& symbol) const;

    /**
     * @brief Access a position by id
     * @throws std::out_of_range for an unknown id
     */
    const Position& position(PositionId id) const;

    /**
     * @brief Apply a (possibly partial) exit fill to an open position
     *
     * Fills larger than the open quantity are clamped with a warning. When
     * the position is fully closed exactly one Trade is appended and returned.
     *
     * @return The closed trade, or std::nullopt while quantity remains open
     */
    Result<std::optional<Trade>> apply_exit(PositionId id, const Execution& exit,
                                            ExitReason reason, const cost::CostModel& cost_model);

    /**
     * @brief Move trailing stops with a new bar, only ever in the favourable direction
     */
    void update_trailing_stop(PositionId id, const Bar& bar);

    /**
     * @brief Record the equity before the first bar
     */
    void start(Timestamp timestamp);

    /**
     * @brief Value open positions at the given marks and append an equity point
     * @param marks Last known close per symbol
     */
    const EquityPoint& mark_to_market(Timestamp timestamp, const std::map<std::string, Price>& marks);

    double initial_capital() const {
        return initial_capital_;
    }
    double realized_pnl() const {
        return realized_pnl_;
    }

    /**
     * @brief Equity at the latest mark, initial capital before any mark
     */
    double equity() const;

    std::vector<PositionId> open_position_ids() const;

    size_t open_position_count() const {
        return symbol_index_.size();
    }

    const std::vector<Trade>& trades() const {
        return trades_;
    }
    const EquityCurve& equity_curve() const {
        return equity_curve_;
    }

private:
    Trade close_position(Position& position, ExitReason reason, const cost::CostModel& cost_model);

    double initial_capital_;
    double realized_pnl_{0.0};

    std::vector<Position> arena_;
    std::unordered_map<std::string, PositionId> symbol_index_;

    std::vector<Trade> trades_;
    EquityCurve equity_curve_;
};

}  // namespace backtest
}  // namespace trade_sim
