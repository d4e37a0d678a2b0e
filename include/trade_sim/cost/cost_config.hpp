#pragma once

#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "trade_sim/core/config_base.hpp"

namespace trade_sim {
namespace cost {

enum class CommissionType {
    FIXED,       // Flat amount per order
    PERCENTAGE,  // Percent of order value
    TIERED       // Per-unit rate by quantity band
};

std::string commission_type_to_string(CommissionType type);
CommissionType commission_type_from_string(const std::string& type);

/**
 * @brief One quantity band of a tiered schedule
 *
 * The band covers quantity from the previous tier's upper bound up to
 * up_to_quantity. The last tier may be unbounded.
 */
struct CommissionTier {
    double up_to_quantity{std::numeric_limits<double>::infinity()};
    double rate_per_unit{0.0};
};

struct CommissionConfig {
    CommissionType type{CommissionType::PERCENTAGE};
    double fixed_amount{0.0};   // FIXED: currency per order
    double rate_percent{0.0};   // PERCENTAGE: 0.1 means 0.1% of order value
    std::vector<CommissionTier> tiers;  // TIERED: ascending bands
    std::optional<double> min_commission;
    std::optional<double> max_commission;
};

/**
 * @brief Slippage as a fraction of the reference price
 *
 *   slippage = (half_spread_bps / 1e4
 *               + volatility_coefficient * volatility * sqrt(participation)
 *               + noise_bps / 1e4 * noise_draw) * session_factor
 *   session_factor = 1 + session_edge_premium * (2 * session_progress - 1)^2
 */
struct SlippageConfig {
    double half_spread_bps{2.0};
    double volatility_coefficient{0.5};
    double session_edge_premium{0.25};  // Extra cost at the open and close
    double noise_bps{0.0};              // Scale of the caller-supplied normal draw
};

/**
 * @brief Market impact as a fraction of the reference price
 *
 *   impact = (temporary_impact_bps * sqrt(participation)
 *             + permanent_impact_bps * participation) / 1e4
 */
struct ImpactConfig {
    double temporary_impact_bps{50.0};
    double permanent_impact_bps{10.0};
    double max_impact_bps{200.0};
    double max_participation{1.0};  // Cap on quantity / average volume
    size_t volume_lookback{20};     // Bars in the rolling average volume
    size_t volatility_lookback{20};  // Bars in the rolling return volatility
};

struct OpportunityCostConfig {
    double execution_latency_seconds{0.0};
    double execution_delay_coefficient{1.0};
    bool include_timing_cost{true};  // Charge adverse deviation from the bar's VWAP proxy
};

/**
 * @brief Complete cost configuration, immutable for the duration of a run
 */
struct CostConfig : public ConfigBase {
    CommissionConfig commission;
    SlippageConfig slippage;
    ImpactConfig impact;
    OpportunityCostConfig opportunity;

    /**
     * @brief Append every violated constraint to violations
     */
    void validate(std::vector<std::string>& violations) const override;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    /**
     * @brief Configuration that charges nothing
     */
    static CostConfig zero_cost();
};

}  // namespace cost
}  // namespace trade_sim
