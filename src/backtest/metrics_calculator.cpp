#include "trade_sim/backtest/metrics_calculator.hpp"

#include <algorithm>
#include <cmath>

#include "trade_sim/core/time_utils.hpp"
#include "trade_sim/statistics/statistics_tools.hpp"

namespace trade_sim {
namespace backtest {

namespace {

// Reported instead of infinity when a ratio has no downside
constexpr double kRatioCap = 999.0;

}  // namespace

nlohmann::json MetricsSnapshot::to_json() const {
    nlohmann::json j;
    j["total_return"] = total_return;
    j["annualized_return"] = annualized_return;
    j["volatility"] = volatility;
    j["sharpe_ratio"] = sharpe_ratio;
    j["sortino_ratio"] = sortino_ratio;
    j["calmar_ratio"] = calmar_ratio;
    j["max_drawdown"] = max_drawdown;
    j["var_95"] = var_95;
    j["cvar_95"] = cvar_95;
    j["total_trades"] = total_trades;
    j["winning_trades"] = winning_trades;
    j["losing_trades"] = losing_trades;
    j["win_rate"] = win_rate;
    j["profit_factor"] = profit_factor;
    j["expectancy"] = expectancy;
    j["average_win"] = average_win;
    j["average_loss"] = average_loss;
    j["max_win"] = max_win;
    j["max_loss"] = max_loss;
    j["average_holding_days"] = average_holding_days;
    j["kelly_fraction"] = kelly_fraction;
    j["risk_of_ruin"] = risk_of_ruin;
    j["sqn"] = sqn;
    j["total_costs"] = total_costs.to_json();
    j["symbol_pnl"] = symbol_pnl;
    j["exit_reason_counts"] = exit_reason_counts;
    return j;
}

MetricsCalculator::MetricsCalculator(double periods_per_year, double risk_free_rate)
    : periods_per_year_(periods_per_year), risk_free_rate_(risk_free_rate) {}

MetricsSnapshot MetricsCalculator::compute(const std::vector<Trade>& trades,
                                           const EquityCurve& equity_curve) const {
    MetricsSnapshot snapshot;

    if (!equity_curve.empty()) {
        double start = equity_curve.front().equity;
        double end = equity_curve.back().equity;
        std::vector<double> returns = calculate_returns_from_equity(equity_curve);

        snapshot.total_return = calculate_total_return(start, end);
        snapshot.annualized_return =
            calculate_annualized_return(snapshot.total_return, returns.size());
        snapshot.volatility = calculate_volatility(returns);
        snapshot.sharpe_ratio = calculate_sharpe_ratio(returns);
        snapshot.sortino_ratio = calculate_sortino_ratio(returns);
        snapshot.max_drawdown = calculate_max_drawdown(equity_curve);
        snapshot.calmar_ratio =
            calculate_calmar_ratio(snapshot.annualized_return, snapshot.max_drawdown);
        snapshot.var_95 = calculate_var_95(returns);
        snapshot.cvar_95 = calculate_cvar_95(returns);
    }

    TradeStatistics stats = calculate_trade_statistics(trades);
    snapshot.total_trades = stats.total_trades;
    snapshot.winning_trades = stats.winning_trades;
    snapshot.losing_trades = stats.losing_trades;
    snapshot.win_rate = stats.win_rate;
    snapshot.profit_factor = stats.profit_factor;
    snapshot.expectancy = stats.expectancy;
    snapshot.average_win = stats.avg_win;
    snapshot.average_loss = stats.avg_loss;
    snapshot.max_win = stats.max_win;
    snapshot.max_loss = stats.max_loss;
    snapshot.average_holding_days = stats.avg_holding_days;
    snapshot.kelly_fraction = calculate_kelly_fraction(stats);
    snapshot.risk_of_ruin = calculate_risk_of_ruin(
        stats, equity_curve.empty() ? 0.0 : equity_curve.front().equity);
    snapshot.sqn = calculate_sqn(trades);

    snapshot.total_costs = calculate_total_costs(trades);
    snapshot.symbol_pnl = calculate_symbol_pnl(trades);
    for (const auto& trade : trades) {
        snapshot.exit_reason_counts[exit_reason_to_string(trade.exit_reason)]++;
    }
    return snapshot;
}

// ========== Return Calculations ==========

double MetricsCalculator::calculate_total_return(double start_value, double end_value) const {
    if (start_value <= 0.0) {
        return 0.0;
    }
    return (end_value - start_value) / start_value;
}

double MetricsCalculator::calculate_annualized_return(double total_return, size_t periods) const {
    if (periods == 0) {
        return 0.0;
    }
    return total_return * periods_per_year_ / static_cast<double>(periods);
}

std::vector<double> MetricsCalculator::calculate_returns_from_equity(
    const EquityCurve& equity_curve) const {
    std::vector<double> returns;
    if (equity_curve.size() < 2) {
        return returns;
    }

    returns.reserve(equity_curve.size() - 1);
    for (size_t i = 1; i < equity_curve.size(); ++i) {
        double previous = equity_curve[i - 1].equity;
        if (previous > 0.0) {
            returns.push_back((equity_curve[i].equity - previous) / previous);
        }
    }
    return returns;
}

// ========== Risk-Adjusted Return Metrics ==========

double MetricsCalculator::calculate_sharpe_ratio(const std::vector<double>& returns) const {
    if (returns.empty()) {
        return 0.0;
    }
    double volatility = calculate_volatility(returns);
    if (volatility <= 0.0) {
        return 0.0;
    }
    double annualized_mean = statistics::mean(returns) * periods_per_year_;
    return (annualized_mean - risk_free_rate_) / volatility;
}

double MetricsCalculator::calculate_sortino_ratio(const std::vector<double>& returns,
                                                  double minimum_acceptable_return) const {
    if (returns.empty()) {
        return 0.0;
    }
    // minimum_acceptable_return is per period, like the returns
    double excess = (statistics::mean(returns) - minimum_acceptable_return) * periods_per_year_;
    double downside = calculate_downside_volatility(returns, minimum_acceptable_return);
    if (downside <= 0.0) {
        return excess > 0.0 ? kRatioCap : 0.0;
    }
    return excess / downside;
}

double MetricsCalculator::calculate_calmar_ratio(double annualized_return,
                                                 double max_drawdown) const {
    if (max_drawdown <= 0.0) {
        return annualized_return > 0.0 ? kRatioCap : 0.0;
    }
    return annualized_return / max_drawdown;
}

// ========== Volatility Metrics ==========

double MetricsCalculator::calculate_volatility(const std::vector<double>& returns) const {
    if (returns.empty()) {
        return 0.0;
    }
    return statistics::standard_deviation(returns) * std::sqrt(periods_per_year_);
}

double MetricsCalculator::calculate_downside_volatility(const std::vector<double>& returns,
                                                        double target) const {
    double downside_sum = 0.0;
    int downside_count = 0;
    for (double ret : returns) {
        if (ret < target) {
            double deviation = ret - target;
            downside_sum += deviation * deviation;
            downside_count++;
        }
    }
    if (downside_count == 0) {
        return 0.0;
    }
    return std::sqrt(downside_sum / downside_count) * std::sqrt(periods_per_year_);
}

// ========== Drawdown Metrics ==========

std::vector<double> MetricsCalculator::calculate_drawdowns(const std::vector<double>& equity) const {
    std::vector<double> drawdowns;
    drawdowns.reserve(equity.size());
    if (equity.empty()) {
        return drawdowns;
    }

    double peak = equity.front();
    for (double value : equity) {
        peak = std::max(peak, value);
        drawdowns.push_back(peak > 0.0 && value < peak ? (peak - value) / peak : 0.0);
    }
    return drawdowns;
}

double MetricsCalculator::calculate_max_drawdown(const std::vector<double>& equity) const {
    auto drawdowns = calculate_drawdowns(equity);
    if (drawdowns.empty()) {
        return 0.0;
    }
    return *std::max_element(drawdowns.begin(), drawdowns.end());
}

double MetricsCalculator::calculate_max_drawdown(const EquityCurve& equity_curve) const {
    std::vector<double> equity;
    equity.reserve(equity_curve.size());
    for (const auto& point : equity_curve) {
        equity.push_back(point.equity);
    }
    return calculate_max_drawdown(equity);
}

// ========== Risk Metrics ==========

double MetricsCalculator::calculate_var_95(const std::vector<double>& returns) const {
    if (returns.empty()) {
        return 0.0;
    }
    std::vector<double> sorted_returns = returns;
    std::sort(sorted_returns.begin(), sorted_returns.end());

    size_t var_index = static_cast<size_t>(returns.size() * 0.05);
    var_index = std::min(var_index, sorted_returns.size() - 1);
    return -sorted_returns[var_index];
}

double MetricsCalculator::calculate_cvar_95(const std::vector<double>& returns) const {
    if (returns.empty()) {
        return 0.0;
    }
    std::vector<double> sorted_returns = returns;
    std::sort(sorted_returns.begin(), sorted_returns.end());

    size_t tail = std::max<size_t>(1, static_cast<size_t>(returns.size() * 0.05));
    tail = std::min(tail, sorted_returns.size());
    std::vector<double> worst(sorted_returns.begin(), sorted_returns.begin() + tail);
    return -statistics::mean(worst);
}

// ========== Trade Statistics ==========

MetricsCalculator::TradeStatistics MetricsCalculator::calculate_trade_statistics(
    const std::vector<Trade>& trades) const {
    TradeStatistics stats;
    stats.total_trades = static_cast<int>(trades.size());
    if (trades.empty()) {
        return stats;
    }

    double total_pnl = 0.0;
    double total_days = 0.0;
    for (const auto& trade : trades) {
        total_pnl += trade.pnl;
        total_days += core::duration_in_days(trade.holding_period);
        if (trade.pnl > 0.0) {
            stats.winning_trades++;
            stats.gross_profit += trade.pnl;
            stats.max_win = std::max(stats.max_win, trade.pnl);
        } else if (trade.pnl < 0.0) {
            stats.losing_trades++;
            stats.gross_loss += -trade.pnl;
            stats.max_loss = std::max(stats.max_loss, -trade.pnl);
        }
    }

    stats.win_rate = static_cast<double>(stats.winning_trades) / stats.total_trades;
    stats.expectancy = total_pnl / stats.total_trades;
    stats.avg_holding_days = total_days / stats.total_trades;
    if (stats.winning_trades > 0)
        stats.avg_win = stats.gross_profit / stats.winning_trades;
    if (stats.losing_trades > 0)
        stats.avg_loss = stats.gross_loss / stats.losing_trades;

    if (stats.gross_loss > 0.0) {
        stats.profit_factor = stats.gross_profit / stats.gross_loss;
    } else {
        stats.profit_factor = stats.gross_profit > 0.0 ? kRatioCap : 0.0;
    }
    return stats;
}

double MetricsCalculator::calculate_kelly_fraction(const TradeStatistics& stats) const {
    if (stats.total_trades == 0) {
        return 0.0;
    }
    if (stats.avg_loss <= 0.0 || stats.avg_win <= 0.0) {
        return stats.win_rate;
    }
    double payoff = stats.avg_win / stats.avg_loss;
    return stats.win_rate - (1.0 - stats.win_rate) / payoff;
}

double MetricsCalculator::calculate_risk_of_ruin(const TradeStatistics& stats,
                                                 double capital) const {
    if (stats.total_trades == 0) {
        return 0.0;
    }
    if (stats.losing_trades == 0 || stats.avg_loss <= 0.0) {
        return 0.0;
    }

    double w = stats.win_rate;
    double gain = w * stats.avg_win;
    double loss = (1.0 - w) * stats.avg_loss;
    double edge = (gain - loss) / (gain + loss);
    if (edge <= 0.0) {
        return 1.0;
    }
    double units = capital > 0.0 ? capital / stats.avg_loss : 1.0;
    return std::pow((1.0 - edge) / (1.0 + edge), units);
}

double MetricsCalculator::calculate_sqn(const std::vector<Trade>& trades) const {
    if (trades.size() < 2) {
        return 0.0;
    }
    std::vector<double> pnls;
    pnls.reserve(trades.size());
    for (const auto& trade : trades) {
        pnls.push_back(trade.pnl);
    }
    double stdev = statistics::standard_deviation(pnls, statistics::Normalization::SAMPLE);
    if (stdev <= 0.0) {
        return 0.0;
    }
    return std::sqrt(static_cast<double>(pnls.size())) * statistics::mean(pnls) / stdev;
}

std::map<std::string, double> MetricsCalculator::calculate_symbol_pnl(
    const std::vector<Trade>& trades) const {
    std::map<std::string, double> symbol_pnl;
    for (const auto& trade : trades) {
        symbol_pnl[trade.symbol] += trade.pnl;
    }
    return symbol_pnl;
}

cost::CostBreakdown MetricsCalculator::calculate_total_costs(const std::vector<Trade>& trades) const {
    cost::CostBreakdown total;
    for (const auto& trade : trades) {
        total += trade.costs;
    }
    return total;
}

}  // namespace backtest
}  // namespace trade_sim
