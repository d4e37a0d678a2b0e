#include "trade_sim/backtest/backtest_engine.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <random>

#include "trade_sim/backtest/portfolio.hpp"
#include "trade_sim/core/logger.hpp"
#include "trade_sim/cost/market_state_tracker.hpp"

namespace trade_sim {
namespace backtest {

std::string engine_phase_to_string(EnginePhase phase) {
    switch (phase) {
        case EnginePhase::INIT:
            return "INIT";
        case EnginePhase::DECIDE:
            return "DECIDE";
        case EnginePhase::SIZE:
            return "SIZE";
        case EnginePhase::EXECUTE:
            return "EXECUTE";
        case EnginePhase::UPDATE:
            return "UPDATE";
        case EnginePhase::FINALIZE:
            return "FINALIZE";
        default:
            return "UNKNOWN";
    }
}

nlohmann::json BacktestResult::to_json() const {
    nlohmann::json j;
    j["metrics"] = metrics.to_json();
    j["trades"] = nlohmann::json::array();
    for (const auto& trade : trades) {
        j["trades"].push_back(trade.to_json());
    }
    j["equity_curve"] = equity_curve_to_json(equity_curve);
    j["final_equity"] = final_equity();
    j["bars_processed"] = bars_processed;
    j["skipped_bars"] = skipped_bars;
    j["signals_received"] = signals_received;
    j["unfilled_orders"] = unfilled_orders;
    j["dropped_orders"] = dropped_orders;
    j["ignored_exit_signals"] = ignored_exit_signals;
    j["missed_opportunity_cost"] = missed_opportunity_cost;
    return j;
}

namespace {

/**
 * @brief Order waiting for the symbol's next bar
 */
struct PendingOrder {
    OrderIntent intent;
    ProtectiveLevels levels;
};

/**
 * @brief Mutable state of one run
 */
class SimulationRun {
public:
    SimulationRun(const BacktestConfig& config, const cost::CostModel& cost_model,
                  const ExecutionSimulator& simulator, SignalGenerator& generator)
        : config_(config),
          cost_model_(cost_model),
          simulator_(simulator),
          generator_(generator),
          portfolio_(config.initial_capital),
          tracker_(config.cost_config.impact.volume_lookback,
                   config.cost_config.impact.volatility_lookback),
          noise_rng_(config.random_seed) {}

    void execute(const std::map<Timestamp, std::vector<Bar>>& timeline) {
        portfolio_.start(timeline.begin()->first);

        for (auto it = timeline.begin(); it != timeline.end(); ++it) {
            for (const Bar& bar : it->second) {
                process_bar(bar);
            }
            if (std::next(it) == timeline.end()) {
                finalize();
            }
            portfolio_.mark_to_market(it->first, marks_);
        }
    }

    Portfolio& portfolio() {
        return portfolio_;
    }

    BacktestResult& result() {
        return result_;
    }

private:
    void process_bar(const Bar& bar) {
        if (!bar.is_valid()) {
            WARN("Skipping malformed bar for " << bar.symbol);
            result_.skipped_bars++;
            return;
        }
        auto& history = history_[bar.symbol];
        if (!history.empty() && bar.timestamp <= history.back().timestamp) {
            WARN("Skipping out-of-order bar for " << bar.symbol);
            result_.skipped_bars++;
            return;
        }
        history.push_back(bar);
        marks_[bar.symbol] = bar.close;
        result_.bars_processed++;

        phase_ = EnginePhase::EXECUTE;
        fill_pending_order(bar);

        phase_ = EnginePhase::UPDATE;
        check_protective_exits(bar);
        update_trailing_stop(bar);

        phase_ = EnginePhase::DECIDE;
        decide(bar);

        // Rolling statistics only ever cover bars already traded on
        tracker_.update(bar);
    }

    FillContext fill_context(const std::string& symbol) {
        FillContext context;
        context.average_volume = tracker_.average_volume(symbol);
        context.volatility = tracker_.volatility(symbol);
        if (config_.cost_config.slippage.noise_bps > 0.0) {
            context.noise_draw = noise_(noise_rng_);
        }
        return context;
    }

    std::string next_order_id() {
        return "BT-" + std::to_string(++order_counter_);
    }

    void fill_pending_order(const Bar& bar) {
        auto it = pending_.find(bar.symbol);
        if (it == pending_.end()) {
            return;
        }
        PendingOrder order = it->second;
        pending_.erase(it);
        submit(order.intent, bar, ExitReason::SIGNAL, order.levels);
    }

    void submit(const OrderIntent& intent, const Bar& bar, ExitReason reason,
                const ProtectiveLevels& levels, const FillContext* override_context = nullptr) {
        if (intent.purpose == OrderPurpose::EXIT) {
            auto position_id = portfolio_.find_open_position(intent.symbol);
            if (!position_id) {
                WARN("Exit order " << intent.order_id << " for " << intent.symbol
                                   << " has no open position, ignored");
                result_.ignored_exit_signals++;
                return;
            }

            FillContext context = override_context ? *override_context : fill_context(intent.symbol);
            Execution exec = simulator_.fill(intent, &bar, cost_model_, context);
            if (!record_fill(exec)) {
                return;
            }
            auto closed = portfolio_.apply_exit(*position_id, exec, reason, cost_model_);
            if (closed.is_error()) {
                ERROR("Failed to apply exit " << exec.order_id << ": " << closed.error()->what());
            }
            return;
        }

        if (portfolio_.find_open_position(intent.symbol)) {
            DEBUG("Entry " << intent.order_id << " skipped, " << intent.symbol
                           << " already has an open position");
            return;
        }
        Execution exec = simulator_.fill(intent, &bar, cost_model_, fill_context(intent.symbol));
        if (!record_fill(exec)) {
            return;
        }
        auto opened = portfolio_.open_position(exec, levels);
        if (opened.is_error()) {
            ERROR("Failed to open position from " << exec.order_id << ": "
                                                  << opened.error()->what());
        }
    }

    // Returns true when the execution carries a fill
    bool record_fill(const Execution& exec) {
        if (exec.is_filled()) {
            return true;
        }
        result_.unfilled_orders++;
        result_.missed_opportunity_cost += exec.opportunity_cost;
        return false;
    }

    void check_protective_exits(const Bar& bar) {
        auto position_id = portfolio_.find_open_position(bar.symbol);
        if (!position_id) {
            return;
        }
        const Position& position = portfolio_.position(*position_id);
        if (position.opened_at >= bar.timestamp) {
            return;
        }

        const bool is_long = position.side == Side::BUY;

        // The tighter of the fixed and the trailing stop protects the position
        std::optional<Price> stop = position.stop_loss;
        ExitReason stop_reason = ExitReason::STOP_LOSS;
        if (position.trailing_stop) {
            bool tighter = !stop || (is_long ? *position.trailing_stop > *stop
                                             : *position.trailing_stop < *stop);
            if (tighter) {
                stop = position.trailing_stop;
                stop_reason = ExitReason::TRAILING_STOP;
            }
        }

        OrderIntent intent;
        intent.symbol = position.symbol;
        intent.side = opposite(position.side);
        intent.quantity = position.quantity;
        intent.decision_timestamp = bar.timestamp;
        intent.purpose = OrderPurpose::EXIT;

        // Stop first when both levels fall inside the bar
        if (stop && (is_long ? bar.low <= *stop : bar.high >= *stop)) {
            intent.order_id = next_order_id();
            intent.order_type = OrderType::STOP;
            intent.limit_price = stop;
            intent.decision_price = *stop;
            submit(intent, bar, stop_reason, {});
            return;
        }
        if (position.take_profit &&
            (is_long ? bar.high >= *position.take_profit : bar.low <= *position.take_profit)) {
            intent.order_id = next_order_id();
            intent.order_type = OrderType::LIMIT;
            intent.limit_price = position.take_profit;
            intent.decision_price = *position.take_profit;
            submit(intent, bar, ExitReason::TAKE_PROFIT, {});
        }
    }

    void update_trailing_stop(const Bar& bar) {
        auto position_id = portfolio_.find_open_position(bar.symbol);
        if (position_id && portfolio_.position(*position_id).opened_at < bar.timestamp) {
            portfolio_.update_trailing_stop(*position_id, bar);
        }
    }

    std::optional<Signal> request_signal(const Bar& bar) {
        const auto& history = history_[bar.symbol];
        HistoricalWindow window(bar.symbol, history, history.size());
        try {
            Result<Signal> signal = generator_.generate_signal(window);
            if (signal.is_error()) {
                WARN(generator_.name() << " failed on " << bar.symbol << ": "
                                       << signal.error()->what() << ", treated as HOLD");
                return std::nullopt;
            }
            return signal.value();
        } catch (const std::exception& e) {
            ERROR(generator_.name() << " threw on " << bar.symbol << ": " << e.what()
                                    << ", treated as HOLD");
            return std::nullopt;
        }
    }

    void decide(const Bar& bar) {
        std::optional<Signal> signal = request_signal(bar);
        if (!signal || signal->action == SignalAction::HOLD) {
            return;
        }
        result_.signals_received++;

        if (signal->confidence < config_.min_confidence) {
            DEBUG("Signal on " << bar.symbol << " below min confidence (" << signal->confidence
                               << "), treated as HOLD");
            return;
        }
        if (pending_.count(bar.symbol) > 0) {
            DEBUG("Order already pending for " << bar.symbol << ", signal ignored");
            return;
        }

        const Side signal_side = signal->action == SignalAction::BUY ? Side::BUY : Side::SELL;
        auto position_id = portfolio_.find_open_position(bar.symbol);

        OrderIntent intent;
        intent.symbol = bar.symbol;
        intent.side = signal_side;
        intent.decision_timestamp = bar.timestamp;
        intent.decision_price = bar.close;
        intent.order_type = signal->order_type;
        intent.limit_price = signal->limit_price;
        if (intent.order_type != OrderType::MARKET && !intent.limit_price) {
            WARN(order_type_to_string(intent.order_type)
                 << " signal on " << bar.symbol << " without a price, sent as MARKET");
            intent.order_type = OrderType::MARKET;
        }

        ProtectiveLevels levels;
        if (position_id) {
            const Position& position = portfolio_.position(*position_id);
            if (position.side == signal_side) {
                DEBUG(bar.symbol << " already " << (signal_side == Side::BUY ? "long" : "short")
                                 << ", signal ignored");
                return;
            }
            intent.purpose = OrderPurpose::EXIT;
            intent.quantity = position.quantity;
        } else {
            if (signal_side == Side::SELL && !config_.allow_short) {
                WARN("SELL signal for " << bar.symbol << " with no open position, ignored");
                result_.ignored_exit_signals++;
                return;
            }
            phase_ = EnginePhase::SIZE;
            intent.purpose = OrderPurpose::ENTRY;
            intent.quantity = size_position(*signal, bar, signal_side, levels);
            if (intent.quantity <= 0.0) {
                DEBUG("Sizing for " << bar.symbol << " produced no quantity");
                return;
            }
        }
        intent.order_id = next_order_id();

        phase_ = EnginePhase::EXECUTE;
        bool fill_now = intent.order_type == OrderType::MARKET &&
                        simulator_.config().fill_price_source == FillPriceSource::CLOSE;
        if (fill_now) {
            submit(intent, bar, ExitReason::SIGNAL, levels);
        } else {
            pending_[bar.symbol] = PendingOrder{intent, levels};
        }
    }

    /**
     * @brief Risk-based sizing: equity * risk_per_trade / stop distance
     */
    Quantity size_position(const Signal& signal, const Bar& bar, Side side,
                           ProtectiveLevels& levels) {
        const Price price = bar.close;
        const double s = side_sign(side);
        const double equity = portfolio_.equity();
        if (equity <= 0.0) {
            WARN("Equity exhausted (" << equity << "), no new positions");
            return 0.0;
        }

        Price stop = signal.stop_loss.value_or(price * (1.0 - s * config_.default_stop_loss_pct));
        if (!std::isfinite(stop) || s * (price - stop) < 0.0) {
            WARN("Stop " << stop << " on the wrong side of " << price << " for " << bar.symbol
                         << ", dropped");
        } else {
            levels.stop_loss = stop;
        }
        if (signal.take_profit) {
            if (s * (*signal.take_profit - price) > 0.0) {
                levels.take_profit = signal.take_profit;
            } else {
                WARN("Take profit " << *signal.take_profit << " on the wrong side of " << price
                                    << " for " << bar.symbol << ", dropped");
            }
        }
        levels.trailing_stop_pct = config_.trailing_stop_pct;

        double distance = std::isfinite(stop) ? std::abs(price - stop) : 0.0;
        distance = std::max(distance, config_.min_stop_distance_pct * price);

        Quantity quantity = equity * config_.risk_per_trade / distance;
        if (config_.max_position_size_percent) {
            quantity = std::min(quantity, equity * *config_.max_position_size_percent / 100.0 / price);
        }
        if (!config_.execution_config.allow_fractional_quantity) {
            quantity = std::floor(quantity + 1e-9);
        }
        TRACE("Sized " << bar.symbol << " " << quantity << " @ " << price << " stop distance "
                       << distance);
        return quantity;
    }

    void finalize() {
        phase_ = EnginePhase::FINALIZE;

        if (!pending_.empty()) {
            INFO("Dropping " << pending_.size() << " order(s) pending at the end of the data");
            result_.dropped_orders += pending_.size();
            pending_.clear();
        }

        for (PositionId id : portfolio_.open_position_ids()) {
            const Position& position = portfolio_.position(id);
            const Bar& last_bar = history_[position.symbol].back();

            OrderIntent intent;
            intent.order_id = next_order_id();
            intent.symbol = position.symbol;
            intent.side = opposite(position.side);
            intent.quantity = position.quantity;
            intent.order_type = OrderType::MARKET;
            intent.decision_timestamp = last_bar.timestamp;
            intent.decision_price = last_bar.close;
            intent.purpose = OrderPurpose::EXIT;

            FillContext context = fill_context(position.symbol);
            context.price_source = FillPriceSource::CLOSE;
            submit(intent, last_bar, ExitReason::END_OF_DATA, {}, &context);
        }
    }

    const BacktestConfig& config_;
    const cost::CostModel& cost_model_;
    const ExecutionSimulator& simulator_;
    SignalGenerator& generator_;

    Portfolio portfolio_;
    cost::MarketStateTracker tracker_;
    std::map<std::string, std::vector<Bar>> history_;
    std::map<std::string, Price> marks_;
    std::map<std::string, PendingOrder> pending_;

    std::mt19937_64 noise_rng_;
    std::normal_distribution<double> noise_{0.0, 1.0};

    EnginePhase phase_{EnginePhase::INIT};
    uint64_t order_counter_{0};
    BacktestResult result_;
};

}  // namespace

BacktestEngine::BacktestEngine(BacktestConfig config)
    : config_(std::move(config)),
      cost_model_(config_.cost_config),
      simulator_(config_.execution_config),
      metrics_(config_.periods_per_year, config_.risk_free_rate) {}

Result<BacktestResult> BacktestEngine::run(const MarketData& data,
                                           SignalGenerator& generator) const {
    auto violations = config_.collect_violations();
    if (!violations.empty()) {
        ERROR("Backtest configuration rejected with " << violations.size() << " violation(s)");
        return make_validation_error<BacktestResult>(std::move(violations), "BacktestEngine");
    }

    // Merge every series onto one timeline; symbols keep map order within a timestamp
    std::map<Timestamp, std::vector<Bar>> timeline;
    for (const auto& [symbol, bars] : data) {
        for (const Bar& bar : bars) {
            Bar normalized = bar;
            normalized.symbol = symbol;
            timeline[bar.timestamp].push_back(std::move(normalized));
        }
    }
    if (timeline.empty()) {
        return make_error<BacktestResult>(ErrorCode::INVALID_DATA, "No market data to simulate",
                                          "BacktestEngine");
    }

    INFO("Running " << generator.name() << " over " << data.size() << " symbol(s), "
                    << timeline.size() << " timestamps");

    SimulationRun run(config_, cost_model_, simulator_, generator);
    run.execute(timeline);

    BacktestResult result = std::move(run.result());
    result.trades = run.portfolio().trades();
    result.equity_curve = run.portfolio().equity_curve();
    result.metrics = metrics_.compute(result.trades, result.equity_curve);

    INFO("Backtest finished: " << result.trades.size() << " trades, final equity "
                               << result.final_equity() << ", total return "
                               << result.metrics.total_return);
    return result;
}

}  // namespace backtest
}  // namespace trade_sim
