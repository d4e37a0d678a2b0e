#pragma once

#include <optional>
#include <string>
#include <vector>

#include "trade_sim/core/config_base.hpp"
#include "trade_sim/core/types.hpp"
#include "trade_sim/cost/cost_model.hpp"

namespace trade_sim {
namespace backtest {

/**
 * @brief Bar price a MARKET order fills at
 */
enum class FillPriceSource {
    OPEN,
    CLOSE
};

std::string fill_price_source_to_string(FillPriceSource source);

/**
 * @brief LIMIT fill ratio for orders up to a share of bar volume
 */
struct PartialFillBand {
    double max_participation{0.0};  // Upper bound of quantity / bar volume
    double fill_ratio{1.0};
};

struct ExecutionConfig : public ConfigBase {
    FillPriceSource fill_price_source{FillPriceSource::OPEN};
    bool allow_fractional_quantity{false};

    // < 1% -> 100%, 1-5% -> 90%, 5-10% -> 70%, beyond -> residual_fill_ratio
    std::vector<PartialFillBand> partial_fill_bands{{0.01, 1.0}, {0.05, 0.9}, {0.10, 0.7}};
    double residual_fill_ratio{0.5};

    void validate(std::vector<std::string>& violations) const override;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Market context of a fill that is not part of the bar
 */
struct FillContext {
    double average_volume{0.0};        // Rolling average bar volume
    double volatility{0.0};            // Rolling per-bar return volatility
    std::optional<double> noise_draw;  // Standard normal draw for the slippage noise term
    std::optional<FillPriceSource> price_source;  // Overrides the configured source
};

/**
 * @brief Fills one order intent against one bar
 *
 * Never fails: a missing bar, an invalid bar, a zero quantity or an
 * untriggered LIMIT/STOP order produce a zero-fill Execution.
 */
class ExecutionSimulator {
public:
    explicit ExecutionSimulator(ExecutionConfig config = ExecutionConfig());

    /**
     * @brief Simulate the execution of an order
     *
     * @param intent Order to fill
     * @param bar Bar the order executes on, nullptr if missing
     * @param cost_model Cost model pricing the fill
     * @param context Rolling market statistics at the fill
     * @return Execution with filled_quantity <= intent.quantity
     */
    Execution fill(const OrderIntent& intent, const Bar* bar, const cost::CostModel& cost_model,
                   const FillContext& context = FillContext()) const;

    /**
     * @brief Share of a LIMIT order that fills given its participation in bar volume
     */
    double partial_fill_ratio(Quantity quantity, double bar_volume) const;

    const ExecutionConfig& config() const {
        return config_;
    }

private:
    Quantity round_quantity(Quantity quantity) const;

    ExecutionConfig config_;
};

}  // namespace backtest
}  // namespace trade_sim
