#include "trade_sim/analysis/parameter_search.hpp"

#include <algorithm>
#include <cmath>
#include <random>

namespace trade_sim {
namespace analysis {

GridSearch::GridSearch(ParameterSpace space) {
    // An axis without values leaves nothing to combine
    for (const auto& [name, values] : space) {
        if (values.empty()) {
            return;
        }
    }

    candidates_.push_back(ParameterSet{});
    for (const auto& [name, values] : space) {
        std::vector<ParameterSet> expanded;
        expanded.reserve(candidates_.size() * values.size());
        for (const auto& partial : candidates_) {
            for (double value : values) {
                ParameterSet next = partial;
                next[name] = value;
                expanded.push_back(std::move(next));
            }
        }
        candidates_ = std::move(expanded);
    }
}

GridSearch::GridSearch(std::vector<ParameterSet> candidate_sets)
    : candidates_(std::move(candidate_sets)) {}

RandomSearch::RandomSearch(std::map<std::string, ParameterRange> ranges, size_t samples,
                           uint64_t seed)
    : ranges_(std::move(ranges)), samples_(samples), seed_(seed) {}

std::vector<ParameterSet> RandomSearch::candidates() const {
    std::mt19937_64 rng(seed_);
    std::vector<ParameterSet> result;
    result.reserve(samples_);

    for (size_t i = 0; i < samples_; ++i) {
        ParameterSet params;
        for (const auto& [name, range] : ranges_) {
            double lo = std::min(range.min, range.max);
            double hi = std::max(range.min, range.max);
            double value = lo;
            if (hi > lo) {
                std::uniform_real_distribution<double> dist(lo, hi);
                value = dist(rng);
            }
            params[name] = range.integer ? std::round(value) : value;
        }
        result.push_back(std::move(params));
    }
    return result;
}

}  // namespace analysis
}  // namespace trade_sim
