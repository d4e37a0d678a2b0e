// include/trade_sim/core/types.hpp

#pragma once

#include <chrono>
#include <cmath>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace trade_sim {

/**
 * @brief Timestamp type for consistent time representation
 * Uses std::chrono for type-safe time handling
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 * Used for all price-related calculations
 */
using Price = double;

/**
 * @brief Quantity type for order and position sizes
 * Double to support fractional quantities
 */
using Quantity = double;

/**
 * @brief Trading side enumeration
 */
enum class Side {
    BUY,
    SELL,
    NONE  // Used for invalid/undefined states
};

/**
 * @brief Order type enumeration
 */
enum class OrderType {
    MARKET,
    LIMIT,
    STOP
};

/**
 * @brief Market data bar structure
 * Represents OHLCV data for any timeframe
 */
struct Bar {
    Timestamp timestamp;
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    double volume{0.0};
    std::string symbol;

    Bar() = default;
    Bar(Timestamp ts, Price o, Price h, Price l, Price c, double v, std::string s)
        : timestamp(ts), open(o), high(h), low(l), close(c), volume(v), symbol(std::move(s)) {}

    /**
     * @brief A bar is usable when all prices are finite and positive,
     * the range is consistent and the volume is non-negative
     */
    bool is_valid() const {
        for (double p : {open, high, low, close}) {
            if (!std::isfinite(p) || p <= 0.0)
                return false;
        }
        if (high < low)
            return false;
        return std::isfinite(volume) && volume >= 0.0;
    }
};

/**
 * @brief Historical bars keyed by symbol, each series ordered by timestamp
 */
using MarketData = std::map<std::string, std::vector<Bar>>;

/**
 * @brief Action requested by a signal generator
 */
enum class SignalAction {
    BUY,
    SELL,
    HOLD
};

/**
 * @brief Trading signal produced by an external generator
 */
struct Signal {
    SignalAction action{SignalAction::HOLD};
    double confidence{1.0};
    std::optional<Price> stop_loss;
    std::optional<Price> take_profit;
    OrderType order_type{OrderType::MARKET};
    std::optional<Price> limit_price;  // Limit level for LIMIT, trigger level for STOP

    static Signal hold() {
        return Signal{};
    }
};

/**
 * @brief Whether an order opens or closes a position
 */
enum class OrderPurpose {
    ENTRY,
    EXIT
};

/**
 * @brief Order produced by sizing, consumed by the execution simulator
 */
struct OrderIntent {
    std::string order_id;
    std::string symbol;
    Side side{Side::NONE};
    Quantity quantity{0.0};
    OrderType order_type{OrderType::MARKET};
    std::optional<Price> limit_price;
    Timestamp decision_timestamp;
    Price decision_price{0.0};
    OrderPurpose purpose{OrderPurpose::ENTRY};
};

/**
 * @brief Result of simulating one order against one bar
 */
struct Execution {
    std::string order_id;
    std::string symbol;
    Side side{Side::NONE};
    Quantity requested_quantity{0.0};
    Quantity filled_quantity{0.0};
    Price reference_price{0.0};  // Fill level before slippage and impact
    Price average_price{0.0};    // Effective fill price
    double commission{0.0};
    double slippage_amount{0.0};
    double market_impact_amount{0.0};
    double opportunity_cost{0.0};
    Timestamp execution_timestamp;

    bool is_filled() const {
        return filled_quantity > 0.0;
    }
    bool is_partial() const {
        return filled_quantity > 0.0 && filled_quantity < requested_quantity;
    }
    double total_cost() const {
        return commission + slippage_amount + market_impact_amount + opportunity_cost;
    }
};

/**
 * @brief +1 for buys, -1 for sells
 */
inline double side_sign(Side side) {
    return side == Side::SELL ? -1.0 : 1.0;
}

inline Side opposite(Side side) {
    if (side == Side::BUY)
        return Side::SELL;
    if (side == Side::SELL)
        return Side::BUY;
    return Side::NONE;
}

inline std::string side_to_string(Side side) {
    switch (side) {
        case Side::BUY:
            return "BUY";
        case Side::SELL:
            return "SELL";
        default:
            return "NONE";
    }
}

inline std::string order_type_to_string(OrderType type) {
    switch (type) {
        case OrderType::MARKET:
            return "MARKET";
        case OrderType::LIMIT:
            return "LIMIT";
        case OrderType::STOP:
            return "STOP";
        default:
            return "UNKNOWN";
    }
}

inline std::string signal_action_to_string(SignalAction action) {
    switch (action) {
        case SignalAction::BUY:
            return "BUY";
        case SignalAction::SELL:
            return "SELL";
        default:
            return "HOLD";
    }
}

}  // namespace trade_sim
