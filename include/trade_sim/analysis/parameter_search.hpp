#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "trade_sim/backtest/signal_generator.hpp"

namespace trade_sim {
namespace analysis {

using backtest::ParameterSet;

/**
 * @brief Discrete values to try per parameter
 */
using ParameterSpace = std::map<std::string, std::vector<double>>;

/**
 * @brief Strategy for enumerating candidate parameter sets
 */
class ParameterSearch {
public:
    virtual ~ParameterSearch() = default;

    /**
     * @brief Candidates in evaluation order; ties on the objective go to the earliest
     */
    virtual std::vector<ParameterSet> candidates() const = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Exhaustive search over the cartesian product of a parameter space
 */
class GridSearch : public ParameterSearch {
public:
    explicit GridSearch(ParameterSpace space);

    /**
     * @brief Search an explicit list of parameter sets
     */
    explicit GridSearch(std::vector<ParameterSet> candidate_sets);

    std::vector<ParameterSet> candidates() const override {
        return candidates_;
    }

    std::string name() const override {
        return "GridSearch";
    }

private:
    std::vector<ParameterSet> candidates_;
};

/**
 * @brief Inclusive sampling range of one parameter
 */
struct ParameterRange {
    double min{0.0};
    double max{0.0};
    bool integer{false};  // Round samples to whole numbers
};

/**
 * @brief Seeded uniform sampling of a parameter box
 *
 * The same seed always yields the same candidate list.
 */
class RandomSearch : public ParameterSearch {
public:
    RandomSearch(std::map<std::string, ParameterRange> ranges, size_t samples, uint64_t seed);

    std::vector<ParameterSet> candidates() const override;

    std::string name() const override {
        return "RandomSearch";
    }

private:
    std::map<std::string, ParameterRange> ranges_;
    size_t samples_;
    uint64_t seed_;
};

}  // namespace analysis
}  // namespace trade_sim
