#include "trade_sim/cost/cost_config.hpp"

#include <cmath>
#include <stdexcept>

namespace trade_sim {
namespace cost {

std::string commission_type_to_string(CommissionType type) {
    switch (type) {
        case CommissionType::FIXED:
            return "FIXED";
        case CommissionType::PERCENTAGE:
            return "PERCENTAGE";
        case CommissionType::TIERED:
            return "TIERED";
        default:
            return "UNKNOWN";
    }
}

CommissionType commission_type_from_string(const std::string& type) {
    if (type == "FIXED")
        return CommissionType::FIXED;
    if (type == "TIERED")
        return CommissionType::TIERED;
    if (type == "PERCENTAGE")
        return CommissionType::PERCENTAGE;
    throw std::invalid_argument("Unknown commission type: " + type);
}

namespace {

void check_non_negative(double value, const std::string& name,
                        std::vector<std::string>& violations) {
    if (!std::isfinite(value) || value < 0.0) {
        violations.push_back(name + " must be a finite value >= 0 (got " +
                             std::to_string(value) + ")");
    }
}

}  // namespace

void CostConfig::validate(std::vector<std::string>& violations) const {
    switch (commission.type) {
        case CommissionType::FIXED:
            check_non_negative(commission.fixed_amount, "commission.fixed_amount", violations);
            break;
        case CommissionType::PERCENTAGE:
            if (!std::isfinite(commission.rate_percent) || commission.rate_percent < 0.0 ||
                commission.rate_percent > 100.0) {
                violations.push_back("commission.rate_percent must be within [0, 100] (got " +
                                     std::to_string(commission.rate_percent) + ")");
            }
            break;
        case CommissionType::TIERED: {
            if (commission.tiers.empty()) {
                violations.push_back("commission.tiers must not be empty for TIERED commission");
            }
            double previous = 0.0;
            for (size_t i = 0; i < commission.tiers.size(); ++i) {
                const auto& tier = commission.tiers[i];
                std::string name = "commission.tiers[" + std::to_string(i) + "]";
                check_non_negative(tier.rate_per_unit, name + ".rate_per_unit", violations);
                if (!(tier.up_to_quantity > previous)) {
                    violations.push_back(name + ".up_to_quantity must exceed the previous bound");
                }
                previous = tier.up_to_quantity;
            }
            break;
        }
    }

    if (commission.min_commission)
        check_non_negative(*commission.min_commission, "commission.min_commission", violations);
    if (commission.max_commission)
        check_non_negative(*commission.max_commission, "commission.max_commission", violations);
    if (commission.min_commission && commission.max_commission &&
        *commission.min_commission > *commission.max_commission) {
        violations.push_back("commission.min_commission must not exceed max_commission");
    }

    check_non_negative(slippage.half_spread_bps, "slippage.half_spread_bps", violations);
    check_non_negative(slippage.volatility_coefficient, "slippage.volatility_coefficient",
                       violations);
    check_non_negative(slippage.session_edge_premium, "slippage.session_edge_premium", violations);
    check_non_negative(slippage.noise_bps, "slippage.noise_bps", violations);

    check_non_negative(impact.temporary_impact_bps, "impact.temporary_impact_bps", violations);
    check_non_negative(impact.permanent_impact_bps, "impact.permanent_impact_bps", violations);
    check_non_negative(impact.max_impact_bps, "impact.max_impact_bps", violations);
    if (!(impact.max_participation > 0.0)) {
        violations.push_back("impact.max_participation must be > 0");
    }
    if (impact.volume_lookback == 0)
        violations.push_back("impact.volume_lookback must be >= 1");
    if (impact.volatility_lookback < 2)
        violations.push_back("impact.volatility_lookback must be >= 2");

    check_non_negative(opportunity.execution_latency_seconds,
                       "opportunity.execution_latency_seconds", violations);
    check_non_negative(opportunity.execution_delay_coefficient,
                       "opportunity.execution_delay_coefficient", violations);
}

nlohmann::json CostConfig::to_json() const {
    nlohmann::json j;

    nlohmann::json c;
    c["type"] = commission_type_to_string(commission.type);
    c["fixed_amount"] = commission.fixed_amount;
    c["rate_percent"] = commission.rate_percent;
    c["tiers"] = nlohmann::json::array();
    for (const auto& tier : commission.tiers) {
        nlohmann::json t;
        if (std::isfinite(tier.up_to_quantity))
            t["up_to_quantity"] = tier.up_to_quantity;
        else
            t["up_to_quantity"] = nullptr;
        t["rate_per_unit"] = tier.rate_per_unit;
        c["tiers"].push_back(t);
    }
    if (commission.min_commission)
        c["min_commission"] = *commission.min_commission;
    if (commission.max_commission)
        c["max_commission"] = *commission.max_commission;
    j["commission"] = c;

    j["slippage"] = {{"half_spread_bps", slippage.half_spread_bps},
                     {"volatility_coefficient", slippage.volatility_coefficient},
                     {"session_edge_premium", slippage.session_edge_premium},
                     {"noise_bps", slippage.noise_bps}};

    j["impact"] = {{"temporary_impact_bps", impact.temporary_impact_bps},
                   {"permanent_impact_bps", impact.permanent_impact_bps},
                   {"max_impact_bps", impact.max_impact_bps},
                   {"max_participation", impact.max_participation},
                   {"volume_lookback", impact.volume_lookback},
                   {"volatility_lookback", impact.volatility_lookback}};

    j["opportunity"] = {{"execution_latency_seconds", opportunity.execution_latency_seconds},
                        {"execution_delay_coefficient", opportunity.execution_delay_coefficient},
                        {"include_timing_cost", opportunity.include_timing_cost}};
    return j;
}

void CostConfig::from_json(const nlohmann::json& j) {
    if (j.contains("commission")) {
        const auto& c = j.at("commission");
        if (c.contains("type"))
            commission.type = commission_type_from_string(c.at("type").get<std::string>());
        if (c.contains("fixed_amount"))
            commission.fixed_amount = c.at("fixed_amount").get<double>();
        if (c.contains("rate_percent"))
            commission.rate_percent = c.at("rate_percent").get<double>();
        if (c.contains("tiers")) {
            commission.tiers.clear();
            for (const auto& t : c.at("tiers")) {
                CommissionTier tier;
                if (t.contains("up_to_quantity") && !t.at("up_to_quantity").is_null())
                    tier.up_to_quantity = t.at("up_to_quantity").get<double>();
                tier.rate_per_unit = t.at("rate_per_unit").get<double>();
                commission.tiers.push_back(tier);
            }
        }
        if (c.contains("min_commission"))
            commission.min_commission = c.at("min_commission").get<double>();
        if (c.contains("max_commission"))
            commission.max_commission = c.at("max_commission").get<double>();
    }

    if (j.contains("slippage")) {
        const auto& s = j.at("slippage");
        if (s.contains("half_spread_bps"))
            slippage.half_spread_bps = s.at("half_spread_bps").get<double>();
        if (s.contains("volatility_coefficient"))
            slippage.volatility_coefficient = s.at("volatility_coefficient").get<double>();
        if (s.contains("session_edge_premium"))
            slippage.session_edge_premium = s.at("session_edge_premium").get<double>();
        if (s.contains("noise_bps"))
            slippage.noise_bps = s.at("noise_bps").get<double>();
    }

    if (j.contains("impact")) {
        const auto& m = j.at("impact");
        if (m.contains("temporary_impact_bps"))
            impact.temporary_impact_bps = m.at("temporary_impact_bps").get<double>();
        if (m.contains("permanent_impact_bps"))
            impact.permanent_impact_bps = m.at("permanent_impact_bps").get<double>();
        if (m.contains("max_impact_bps"))
            impact.max_impact_bps = m.at("max_impact_bps").get<double>();
        if (m.contains("max_participation"))
            impact.max_participation = m.at("max_participation").get<double>();
        if (m.contains("volume_lookback"))
            impact.volume_lookback = m.at("volume_lookback").get<size_t>();
        if (m.contains("volatility_lookback"))
            impact.volatility_lookback = m.at("volatility_lookback").get<size_t>();
    }

    if (j.contains("opportunity")) {
        const auto& o = j.at("opportunity");
        if (o.contains("execution_latency_seconds"))
            opportunity.execution_latency_seconds =
                o.at("execution_latency_seconds").get<double>();
        if (o.contains("execution_delay_coefficient"))
            opportunity.execution_delay_coefficient =
                o.at("execution_delay_coefficient").get<double>();
        if (o.contains("include_timing_cost"))
            opportunity.include_timing_cost = o.at("include_timing_cost").get<bool>();
    }
}

CostConfig CostConfig::zero_cost() {
    CostConfig config;
    config.commission.type = CommissionType::PERCENTAGE;
    config.commission.rate_percent = 0.0;
    config.slippage.half_spread_bps = 0.0;
    config.slippage.volatility_coefficient = 0.0;
    config.slippage.session_edge_premium = 0.0;
    config.slippage.noise_bps = 0.0;
    config.impact.temporary_impact_bps = 0.0;
    config.impact.permanent_impact_bps = 0.0;
    config.opportunity.execution_delay_coefficient = 0.0;
    config.opportunity.include_timing_cost = false;
    return config;
}

}  // namespace cost
}  // namespace trade_sim
