#include <gtest/gtest.h>
#include <cmath>
#include <vector>
#include "../core/test_base.hpp"
#include "trade_sim/cost/cost_model.hpp"
#include "trade_sim/cost/market_state_tracker.hpp"

using namespace trade_sim;
using namespace trade_sim::cost;
using namespace trade_sim::testing;

class CostModelTest : public TestBase {
protected:
    static MarketState filled_state(Price reference, Quantity quantity) {
        MarketState state;
        state.reference_price = reference;
        state.decision_price = reference;
        state.mark_price = reference;
        state.order_quantity = quantity;
        state.filled_quantity = quantity;
        return state;
    }

    static CostConfig percentage_only(double rate_percent) {
        CostConfig config = CostConfig::zero_cost();
        config.commission.type = CommissionType::PERCENTAGE;
        config.commission.rate_percent = rate_percent;
        return config;
    }
};

TEST_F(CostModelTest, PercentageRoundTripCommission) {
    CostModel model(percentage_only(0.1));

    auto entry = model.calculate_entry_cost(5000.0, Side::BUY, filled_state(100.0, 50));
    auto exit = model.calculate_exit_cost(5000.0, Side::SELL, filled_state(100.0, 50));

    EXPECT_DOUBLE_EQ(entry.commission, 5.0);
    EXPECT_DOUBLE_EQ(exit.commission, 5.0);
    EXPECT_DOUBLE_EQ(entry.commission + exit.commission, 10.0);
    EXPECT_DOUBLE_EQ(entry.total, 5.0);
}

TEST_F(CostModelTest, RoundTripSumsExecutionCosts) {
    CostModel model(percentage_only(0.1));

    Execution entry;
    entry.commission = 5.0;
    entry.slippage_amount = 1.5;
    entry.market_impact_amount = 0.5;
    Execution exit;
    exit.commission = 5.0;
    exit.opportunity_cost = 2.0;

    CostBreakdown costs = model.calculate_round_trip_cost(entry, exit);
    EXPECT_DOUBLE_EQ(costs.commission, 10.0);
    EXPECT_DOUBLE_EQ(costs.slippage, 1.5);
    EXPECT_DOUBLE_EQ(costs.market_impact, 0.5);
    EXPECT_DOUBLE_EQ(costs.opportunity_cost, 2.0);
    EXPECT_DOUBLE_EQ(costs.total, 19.0);
}

TEST_F(CostModelTest, FixedCommissionPerOrder) {
    CostConfig config = CostConfig::zero_cost();
    config.commission.type = CommissionType::FIXED;
    config.commission.fixed_amount = 7.5;
    CostModel model(config);

    EXPECT_DOUBLE_EQ(model.calculate_commission(100.0, 1), 7.5);
    EXPECT_DOUBLE_EQ(model.calculate_commission(1e6, 10000), 7.5);
    EXPECT_DOUBLE_EQ(model.calculate_commission(0.0, 0), 0.0);
}

TEST_F(CostModelTest, TieredCommissionChargesEachBand) {
    CostConfig config = CostConfig::zero_cost();
    config.commission.type = CommissionType::TIERED;
    config.commission.tiers = {{100.0, 0.01}, {1000.0, 0.005}, {}};
    config.commission.tiers.back().rate_per_unit = 0.002;
    CostModel model(config);

    // 100 * 0.01 + 900 * 0.005 + 500 * 0.002
    EXPECT_NEAR(model.calculate_commission(0.0, 1500), 1.0 + 4.5 + 1.0, 1e-12);
    EXPECT_NEAR(model.calculate_commission(0.0, 50), 0.5, 1e-12);
}

TEST_F(CostModelTest, CommissionClampedToBounds) {
    CostConfig config = percentage_only(0.1);
    config.commission.min_commission = 1.0;
    config.commission.max_commission = 20.0;
    CostModel model(config);

    EXPECT_DOUBLE_EQ(model.calculate_commission(100.0, 1), 1.0);
    EXPECT_DOUBLE_EQ(model.calculate_commission(100000.0, 1000), 20.0);
    EXPECT_DOUBLE_EQ(model.calculate_commission(5000.0, 50), 5.0);
}

TEST_F(CostModelTest, SlippageFollowsFormula) {
    CostConfig config = CostConfig::zero_cost();
    config.slippage.half_spread_bps = 2.0;
    config.slippage.volatility_coefficient = 0.5;
    config.slippage.session_edge_premium = 0.25;
    CostModel model(config);

    MarketState state = filled_state(100.0, 2500);
    state.average_volume = 10000.0;  // participation 0.25
    state.volatility = 0.02;
    state.session_progress = 0.0;

    double expected = (2.0 / 1e4 + 0.5 * 0.02 * 0.5) * 1.25;
    EXPECT_NEAR(model.slippage_fraction(state), expected, 1e-15);

    state.session_progress = 0.5;
    EXPECT_NEAR(model.slippage_fraction(state), 2.0 / 1e4 + 0.5 * 0.02 * 0.5, 1e-15);
}

TEST_F(CostModelTest, SlippageUsesIntrabarVolatilityWithoutHistory) {
    CostConfig config = CostConfig::zero_cost();
    config.slippage.volatility_coefficient = 1.0;
    CostModel model(config);

    MarketState state = filled_state(100.0, 100);
    state.average_volume = 100.0;
    state.intrabar_volatility = 0.03;

    EXPECT_NEAR(model.slippage_fraction(state), 0.03, 1e-15);
}

TEST_F(CostModelTest, SlippageIsDeterministicAndNoiseIsExplicit) {
    CostConfig config = CostConfig::zero_cost();
    config.slippage.half_spread_bps = 5.0;
    config.slippage.noise_bps = 10.0;
    CostModel model(config);

    MarketState state = filled_state(50.0, 10);
    double first = model.slippage_fraction(state);
    double second = model.slippage_fraction(state);
    EXPECT_DOUBLE_EQ(first, second);
    EXPECT_NEAR(first, 5.0 / 1e4, 1e-15);

    state.noise_draw = 1.0;
    EXPECT_NEAR(model.slippage_fraction(state), 15.0 / 1e4, 1e-15);

    state.noise_draw = -10.0;
    EXPECT_DOUBLE_EQ(model.slippage_fraction(state), 0.0);  // Floored
}

TEST_F(CostModelTest, ImpactFollowsSquareRootLawAndCap) {
    CostConfig config = CostConfig::zero_cost();
    config.impact.temporary_impact_bps = 50.0;
    config.impact.permanent_impact_bps = 10.0;
    config.impact.max_impact_bps = 200.0;
    CostModel model(config);

    MarketState state = filled_state(100.0, 2500);
    state.average_volume = 10000.0;
    EXPECT_NEAR(model.impact_fraction(state), (50.0 * 0.5 + 10.0 * 0.25) / 1e4, 1e-15);

    config.impact.max_impact_bps = 20.0;
    CostModel capped(config);
    EXPECT_NEAR(capped.impact_fraction(state), 20.0 / 1e4, 1e-15);
}

TEST_F(CostModelTest, MissingVolumeUsesMaxParticipation) {
    CostConfig config = CostConfig::zero_cost();
    config.impact.max_participation = 0.1;
    CostModel model(config);

    MarketState state = filled_state(100.0, 500);
    state.average_volume = 0.0;
    EXPECT_DOUBLE_EQ(model.participation_rate(state), 0.1);

    state.average_volume = 100.0;
    EXPECT_DOUBLE_EQ(model.participation_rate(state), 0.1);  // Clamped
}

TEST_F(CostModelTest, AdjustedPriceMovesAgainstTheSide) {
    CostConfig config = CostConfig::zero_cost();
    config.slippage.half_spread_bps = 10.0;
    CostModel model(config);

    MarketState state = filled_state(100.0, 10);
    EXPECT_NEAR(model.adjusted_price(Side::BUY, state), 100.1, 1e-12);
    EXPECT_NEAR(model.adjusted_price(Side::SELL, state), 99.9, 1e-12);

    auto costs = model.calculate_entry_cost(10 * 100.1, Side::BUY, state);
    EXPECT_NEAR(costs.slippage, 100.0 * 0.001 * 10, 1e-12);
}

TEST_F(CostModelTest, LimitPriceCapsAdjustment) {
    CostConfig config = CostConfig::zero_cost();
    config.slippage.half_spread_bps = 30.0;
    config.impact.temporary_impact_bps = 10.0;
    CostModel model(config);

    MarketState state = filled_state(100.0, 10);
    state.average_volume = 10.0;
    state.limit_price = 100.2;

    EXPECT_NEAR(model.adjusted_price(Side::BUY, state), 100.2, 1e-12);
    PriceAdjustment adjustment = model.price_adjustment(Side::BUY, state);
    EXPECT_NEAR(adjustment.slippage_fraction / adjustment.impact_fraction, 3.0, 1e-9);
}

TEST_F(CostModelTest, OpportunityCostComponents) {
    CostConfig config = CostConfig::zero_cost();
    config.opportunity.execution_latency_seconds = 4.0;
    config.opportunity.execution_delay_coefficient = 0.5;
    config.opportunity.include_timing_cost = true;
    CostModel model(config);

    MarketState state;
    state.reference_price = 101.0;
    state.decision_price = 100.0;
    state.mark_price = 103.0;
    state.benchmark_price = 100.5;
    state.intrabar_volatility = 0.02;
    state.order_quantity = 100;
    state.filled_quantity = 60;

    double unfilled = 40 * 3.0;
    double delay = 0.5 * 2.0 * 0.02 * 101.0 * 60;
    double timing = 0.5 * 60;
    EXPECT_NEAR(model.calculate_opportunity_cost(Side::BUY, state), unfilled + delay + timing,
                1e-9);

    // Favourable deviation from the benchmark is not a credit
    EXPECT_NEAR(model.calculate_opportunity_cost(Side::SELL, state), unfilled + delay, 1e-9);
}

TEST_F(CostModelTest, ZeroFillPaysOnlyOpportunityCost) {
    CostModel model(percentage_only(0.1));

    MarketState state = filled_state(100.0, 50);
    state.filled_quantity = 0;
    state.mark_price = 102.0;

    auto costs = model.calculate_entry_cost(0.0, Side::BUY, state);
    EXPECT_DOUBLE_EQ(costs.commission, 0.0);
    EXPECT_DOUBLE_EQ(costs.slippage, 0.0);
    EXPECT_DOUBLE_EQ(costs.opportunity_cost, 100.0);
    EXPECT_DOUBLE_EQ(costs.total, 100.0);
}

TEST_F(CostModelTest, ConfigValidationCollectsEveryViolation) {
    CostConfig config;
    config.commission.rate_percent = -1.0;
    config.slippage.half_spread_bps = -2.0;
    config.commission.min_commission = 10.0;
    config.commission.max_commission = 5.0;

    std::vector<std::string> violations;
    config.validate(violations);
    EXPECT_GE(violations.size(), 3u);

    std::vector<std::string> none;
    CostConfig().validate(none);
    EXPECT_TRUE(none.empty());
}

TEST_F(CostModelTest, ConfigJsonKeepsCommissionSchedule) {
    CostConfig config = CostConfig::zero_cost();
    config.commission.type = CommissionType::TIERED;
    config.commission.tiers = {{100.0, 0.01}, {}};
    config.commission.max_commission = 50.0;

    CostConfig loaded;
    loaded.from_json(config.to_json());

    EXPECT_EQ(loaded.commission.type, CommissionType::TIERED);
    ASSERT_EQ(loaded.commission.tiers.size(), 2u);
    EXPECT_TRUE(std::isinf(loaded.commission.tiers[1].up_to_quantity));
    ASSERT_TRUE(loaded.commission.max_commission.has_value());
    EXPECT_DOUBLE_EQ(*loaded.commission.max_commission, 50.0);
    EXPECT_THROW(commission_type_from_string("FLAT"), std::invalid_argument);
}

// ============================================================================
// MarketStateTracker
// ============================================================================

TEST_F(CostModelTest, TrackerRollingVolumeAndVolatility) {
    MarketStateTracker tracker(2, 20);
    auto ts = std::chrono::system_clock::now();

    EXPECT_DOUBLE_EQ(tracker.average_volume("X"), 0.0);
    tracker.update(Bar(ts, 100, 101, 99, 100, 1000, "X"));
    tracker.update(Bar(ts, 100, 111, 99, 110, 2000, "X"));
    tracker.update(Bar(ts, 110, 111, 98, 99, 4000, "X"));

    EXPECT_DOUBLE_EQ(tracker.average_volume("X"), 3000.0);  // Last two bars

    std::vector<double> returns{std::log(1.1), std::log(0.9)};
    double mean = (returns[0] + returns[1]) / 2.0;
    double expected = std::sqrt(((returns[0] - mean) * (returns[0] - mean) +
                                 (returns[1] - mean) * (returns[1] - mean)) /
                                1.0);
    EXPECT_NEAR(tracker.volatility("X"), expected, 1e-12);
    EXPECT_DOUBLE_EQ(tracker.volatility("Y"), 0.0);

    tracker.clear();
    EXPECT_DOUBLE_EQ(tracker.average_volume("X"), 0.0);
}
