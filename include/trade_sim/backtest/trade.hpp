#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "trade_sim/core/types.hpp"
#include "trade_sim/cost/cost_model.hpp"

namespace trade_sim {
namespace backtest {

/**
 * @brief Why a position was closed
 */
enum class ExitReason {
    SIGNAL,
    STOP_LOSS,
    TAKE_PROFIT,
    TRAILING_STOP,
    END_OF_DATA
};

std::string exit_reason_to_string(ExitReason reason);

using PositionId = size_t;

/**
 * @brief Protective exit levels attached to a position when it opens
 */
struct ProtectiveLevels {
    std::optional<Price> stop_loss;
    std::optional<Price> take_profit;
    std::optional<double> trailing_stop_pct;
};

/**
 * @brief Open position, owned by the Portfolio
 *
 * side is BUY for a long and SELL for a short position.
 */
struct Position {
    PositionId id{0};
    std::string symbol;
    Side side{Side::NONE};
    Quantity quantity{0.0};
    Execution entry;
    Timestamp opened_at;

    std::optional<Price> stop_loss;
    std::optional<Price> take_profit;
    std::optional<double> trailing_stop_pct;
    std::optional<Price> trailing_stop;  // Current trailing level
    Price best_price{0.0};               // Highest high (long) or lowest low (short) since entry

    std::optional<Execution> partial_exit;  // Aggregated exit fills before the full close

    Price entry_price() const {
        return entry.reference_price;
    }

    /**
     * @brief Mark-to-market P&L net of costs paid so far, including
     * the part already closed by partial exits
     */
    double unrealized_pnl(Price mark) const {
        double s = side_sign(side);
        double pnl = s * (mark - entry.reference_price) * quantity - entry.total_cost();
        if (partial_exit) {
            pnl += s * (partial_exit->reference_price - entry.reference_price) *
                       partial_exit->filled_quantity -
                   partial_exit->total_cost();
        }
        return pnl;
    }
};

/**
 * @brief Closed round trip, immutable once recorded
 */
struct Trade {
    std::string symbol;
    Side side{Side::NONE};
    Quantity quantity{0.0};
    Execution entry;
    Execution exit;
    cost::CostBreakdown costs;
    double total_cost{0.0};
    double pnl{0.0};
    Timestamp::duration holding_period{};
    ExitReason exit_reason{ExitReason::SIGNAL};

    /**
     * @brief P&L relative to the entry notional
     */
    double return_pct() const {
        double notional = entry.reference_price * quantity;
        return notional > 0.0 ? pnl / notional : 0.0;
    }

    nlohmann::json to_json() const;
};

/**
 * @brief One point of the equity curve
 */
struct EquityPoint {
    Timestamp timestamp;
    double equity{0.0};
};

using EquityCurve = std::vector<EquityPoint>;

nlohmann::json execution_to_json(const Execution& exec);
nlohmann::json equity_curve_to_json(const EquityCurve& curve);

}  // namespace backtest
}  // namespace trade_sim
