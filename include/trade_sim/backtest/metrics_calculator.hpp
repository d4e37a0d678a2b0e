#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "trade_sim/backtest/trade.hpp"
#include "trade_sim/core/types.hpp"

namespace trade_sim {
namespace backtest {

/**
 * @brief Every performance and risk statistic of one run
 */
struct MetricsSnapshot {
    // Returns
    double total_return{0.0};
    double annualized_return{0.0};
    double volatility{0.0};
    double sharpe_ratio{0.0};
    double sortino_ratio{0.0};
    double calmar_ratio{0.0};
    double max_drawdown{0.0};
    double var_95{0.0};
    double cvar_95{0.0};

    // Trades
    int total_trades{0};
    int winning_trades{0};
    int losing_trades{0};
    double win_rate{0.0};
    double profit_factor{0.0};
    double expectancy{0.0};
    double average_win{0.0};
    double average_loss{0.0};
    double max_win{0.0};
    double max_loss{0.0};
    double average_holding_days{0.0};
    double kelly_fraction{0.0};
    double risk_of_ruin{0.0};
    double sqn{0.0};

    // Costs
    cost::CostBreakdown total_costs;
    std::map<std::string, double> symbol_pnl;
    std::map<std::string, int> exit_reason_counts;

    nlohmann::json to_json() const;
};

/**
 * @brief Pure stateless calculation component for backtest metrics
 *
 * All methods are const and depend only on their arguments and the
 * annualization settings, so identical inputs give identical outputs.
 */
class MetricsCalculator {
public:
    /**
     * @param periods_per_year Equity points per year (252 for daily bars)
     * @param risk_free_rate Annual risk-free rate for Sharpe
     */
    explicit MetricsCalculator(double periods_per_year = 252.0, double risk_free_rate = 0.0);

    /**
     * @brief Derive the full snapshot from the trade ledger and equity curve
     */
    MetricsSnapshot compute(const std::vector<Trade>& trades, const EquityCurve& equity_curve) const;

    // ========== Return Calculations ==========

    /**
     * @brief Calculate total return
     * @return Total return as decimal (0.10 = 10%)
     */
    double calculate_total_return(double start_value, double end_value) const;

    /**
     * @brief Scale a total return over n periods to one year
     */
    double calculate_annualized_return(double total_return, size_t periods) const;

    std::vector<double> calculate_returns_from_equity(const EquityCurve& equity_curve) const;

    // ========== Risk-Adjusted Return Metrics ==========

    double calculate_sharpe_ratio(const std::vector<double>& returns) const;

    /**
     * @brief Sortino ratio, capped when there is no downside
     */
    double calculate_sortino_ratio(const std::vector<double>& returns,
                                   double minimum_acceptable_return = 0.0) const;

    double calculate_calmar_ratio(double annualized_return, double max_drawdown) const;

    // ========== Volatility Metrics ==========

    /**
     * @brief Annualized standard deviation of period returns
     */
    double calculate_volatility(const std::vector<double>& returns) const;

    double calculate_downside_volatility(const std::vector<double>& returns,
                                         double target = 0.0) const;

    // ========== Drawdown Metrics ==========

    /**
     * @brief Drawdown from the running peak at every point, as decimals
     */
    std::vector<double> calculate_drawdowns(const std::vector<double>& equity) const;

    double calculate_max_drawdown(const std::vector<double>& equity) const;
    double calculate_max_drawdown(const EquityCurve& equity_curve) const;

    // ========== Risk Metrics ==========

    /**
     * @brief Historical VaR at 95% confidence, as a positive loss
     */
    double calculate_var_95(const std::vector<double>& returns) const;

    /**
     * @brief Mean loss beyond the 95% VaR, as a positive loss
     */
    double calculate_cvar_95(const std::vector<double>& returns) const;

    // ========== Trade Statistics ==========

    struct TradeStatistics {
        int total_trades = 0;
        int winning_trades = 0;
        int losing_trades = 0;
        double win_rate = 0.0;
        double profit_factor = 0.0;
        double gross_profit = 0.0;
        double gross_loss = 0.0;
        double avg_win = 0.0;
        double avg_loss = 0.0;  // Positive magnitude
        double max_win = 0.0;
        double max_loss = 0.0;  // Positive magnitude
        double expectancy = 0.0;
        double avg_holding_days = 0.0;
    };

    TradeStatistics calculate_trade_statistics(const std::vector<Trade>& trades) const;

    /**
     * @brief Kelly fraction W - (1 - W) / (avg_win / avg_loss)
     */
    double calculate_kelly_fraction(const TradeStatistics& stats) const;

    /**
     * @brief Probability of losing the whole capital at the observed edge
     *
     * A = (W * avg_win - (1 - W) * avg_loss) / (W * avg_win + (1 - W) * avg_loss),
     * units = capital / avg_loss, RoR = ((1 - A) / (1 + A))^units, 1 without an edge.
     */
    double calculate_risk_of_ruin(const TradeStatistics& stats, double capital) const;

    /**
     * @brief System quality number sqrt(N) * mean(pnl) / stdev(pnl)
     */
    double calculate_sqn(const std::vector<Trade>& trades) const;

    std::map<std::string, double> calculate_symbol_pnl(const std::vector<Trade>& trades) const;

    cost::CostBreakdown calculate_total_costs(const std::vector<Trade>& trades) const;

    double periods_per_year() const {
        return periods_per_year_;
    }

private:
    double periods_per_year_;
    double risk_free_rate_;
};

}  // namespace backtest
}  // namespace trade_sim
