#include "trade_sim/backtest/backtest_config.hpp"

#include <cmath>

namespace trade_sim {
namespace backtest {

void BacktestConfig::validate(std::vector<std::string>& violations) const {
    if (!std::isfinite(initial_capital) || initial_capital <= 0.0) {
        violations.push_back("initial_capital must be > 0 (got " +
                             std::to_string(initial_capital) + ")");
    }
    if (!(risk_per_trade > 0.0 && risk_per_trade <= 1.0)) {
        violations.push_back("risk_per_trade must be within (0, 1] (got " +
                             std::to_string(risk_per_trade) + ")");
    }
    if (!(min_stop_distance_pct > 0.0 && min_stop_distance_pct < 1.0)) {
        violations.push_back("min_stop_distance_pct must be within (0, 1)");
    }
    if (!(default_stop_loss_pct > 0.0 && default_stop_loss_pct < 1.0)) {
        violations.push_back("default_stop_loss_pct must be within (0, 1)");
    }
    if (max_position_size_percent &&
        !(*max_position_size_percent > 0.0 && *max_position_size_percent <= 100.0)) {
        violations.push_back("max_position_size_percent must be within (0, 100]");
    }
    if (trailing_stop_pct && !(*trailing_stop_pct > 0.0 && *trailing_stop_pct < 1.0)) {
        violations.push_back("trailing_stop_pct must be within (0, 1)");
    }
    if (!(min_confidence >= 0.0 && min_confidence <= 1.0)) {
        violations.push_back("min_confidence must be within [0, 1]");
    }
    if (!(periods_per_year > 0.0)) {
        violations.push_back("periods_per_year must be > 0");
    }

    cost_config.validate(violations);
    execution_config.validate(violations);
}

nlohmann::json BacktestConfig::to_json() const {
    nlohmann::json j;
    j["initial_capital"] = initial_capital;
    j["risk_per_trade"] = risk_per_trade;
    j["min_stop_distance_pct"] = min_stop_distance_pct;
    j["default_stop_loss_pct"] = default_stop_loss_pct;
    if (max_position_size_percent)
        j["max_position_size_percent"] = *max_position_size_percent;
    if (trailing_stop_pct)
        j["trailing_stop_pct"] = *trailing_stop_pct;
    j["allow_short"] = allow_short;
    j["min_confidence"] = min_confidence;
    j["periods_per_year"] = periods_per_year;
    j["risk_free_rate"] = risk_free_rate;
    j["random_seed"] = random_seed;
    j["cost_config"] = cost_config.to_json();
    j["execution_config"] = execution_config.to_json();
    return j;
}

void BacktestConfig::from_json(const nlohmann::json& j) {
    if (j.contains("initial_capital"))
        initial_capital = j.at("initial_capital").get<double>();
    if (j.contains("risk_per_trade"))
        risk_per_trade = j.at("risk_per_trade").get<double>();
    if (j.contains("min_stop_distance_pct"))
        min_stop_distance_pct = j.at("min_stop_distance_pct").get<double>();
    if (j.contains("default_stop_loss_pct"))
        default_stop_loss_pct = j.at("default_stop_loss_pct").get<double>();
    if (j.contains("max_position_size_percent"))
        max_position_size_percent = j.at("max_position_size_percent").get<double>();
    if (j.contains("trailing_stop_pct"))
        trailing_stop_pct = j.at("trailing_stop_pct").get<double>();
    if (j.contains("allow_short"))
        allow_short = j.at("allow_short").get<bool>();
    if (j.contains("min_confidence"))
        min_confidence = j.at("min_confidence").get<double>();
    if (j.contains("periods_per_year"))
        periods_per_year = j.at("periods_per_year").get<double>();
    if (j.contains("risk_free_rate"))
        risk_free_rate = j.at("risk_free_rate").get<double>();
    if (j.contains("random_seed"))
        random_seed = j.at("random_seed").get<uint64_t>();
    if (j.contains("cost_config"))
        cost_config.from_json(j.at("cost_config"));
    if (j.contains("execution_config"))
        execution_config.from_json(j.at("execution_config"));
}

}  // namespace backtest
}  // namespace trade_sim
