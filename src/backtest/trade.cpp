#include "trade_sim/backtest/trade.hpp"

#include "trade_sim/core/time_utils.hpp"

namespace trade_sim {
namespace backtest {

std::string exit_reason_to_string(ExitReason reason) {
    switch (reason) {
        case ExitReason::SIGNAL:
            return "SIGNAL";
        case ExitReason::STOP_LOSS:
            return "STOP_LOSS";
        case ExitReason::TAKE_PROFIT:
            return "TAKE_PROFIT";
        case ExitReason::TRAILING_STOP:
            return "TRAILING_STOP";
        case ExitReason::END_OF_DATA:
            return "END_OF_DATA";
        default:
            return "UNKNOWN";
    }
}

nlohmann::json execution_to_json(const Execution& exec) {
    nlohmann::json j;
    j["order_id"] = exec.order_id;
    j["symbol"] = exec.symbol;
    j["side"] = side_to_string(exec.side);
    j["requested_quantity"] = exec.requested_quantity;
    j["filled_quantity"] = exec.filled_quantity;
    j["reference_price"] = exec.reference_price;
    j["average_price"] = exec.average_price;
    j["commission"] = exec.commission;
    j["slippage_amount"] = exec.slippage_amount;
    j["market_impact_amount"] = exec.market_impact_amount;
    j["opportunity_cost"] = exec.opportunity_cost;
    j["execution_timestamp"] = core::format_timestamp(exec.execution_timestamp);
    return j;
}

nlohmann::json Trade::to_json() const {
    nlohmann::json j;
    j["symbol"] = symbol;
    j["side"] = side == Side::BUY ? "LONG" : "SHORT";
    j["quantity"] = quantity;
    j["entry"] = execution_to_json(entry);
    j["exit"] = execution_to_json(exit);
    j["costs"] = costs.to_json();
    j["total_cost"] = total_cost;
    j["pnl"] = pnl;
    j["return_pct"] = return_pct();
    j["holding_period_seconds"] =
        std::chrono::duration_cast<std::chrono::seconds>(holding_period).count();
    j["exit_reason"] = exit_reason_to_string(exit_reason);
    return j;
}

nlohmann::json equity_curve_to_json(const EquityCurve& curve) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& point : curve) {
        j.push_back({{"timestamp", core::format_timestamp(point.timestamp)},
                     {"equity", point.equity}});
    }
    return j;
}

}  // namespace backtest
}  // namespace trade_sim
