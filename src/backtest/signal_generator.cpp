#include "trade_sim/backtest/signal_generator.hpp"

#include <sstream>

namespace trade_sim {
namespace backtest {

std::string parameters_to_string(const ParameterSet& parameters) {
    std::ostringstream ss;
    ss << "{";
    bool first = true;
    for (const auto& [name, value] : parameters) {
        if (!first)
            ss << ", ";
        ss << name << "=" << value;
        first = false;
    }
    ss << "}";
    return ss.str();
}

}  // namespace backtest
}  // namespace trade_sim
