#include "trade_sim/statistics/statistics_tools.hpp"
#include <algorithm>
#include <cmath>

namespace trade_sim {
namespace statistics {

namespace {

double interpolate_sorted(const std::vector<double>& sorted, double q) {
    if (sorted.empty())
        return 0.0;
    if (sorted.size() == 1)
        return sorted.front();

    double clamped = std::min(100.0, std::max(0.0, q));
    double rank = clamped / 100.0 * static_cast<double>(sorted.size() - 1);
    size_t lower = static_cast<size_t>(std::floor(rank));
    size_t upper = static_cast<size_t>(std::ceil(rank));
    double weight = rank - static_cast<double>(lower);
    return sorted[lower] + (sorted[upper] - sorted[lower]) * weight;
}

bool has_spread(const std::vector<double>& data) {
    if (data.empty())
        return false;
    auto v = as_vector(data);
    return v.maxCoeff() > v.minCoeff();
}

// Mean of ((x - mean) / sd)^order with the population deviation
double standardized_moment(const std::vector<double>& data, int order) {
    double sd = standard_deviation(data, Normalization::POPULATION);
    if (!has_spread(data) || !(sd > 0.0))
        return 0.0;
    auto v = as_vector(data);
    Eigen::ArrayXd z = (v.array() - v.mean()) / sd;
    return z.pow(static_cast<double>(order)).mean();
}

}  // namespace

double mean(const std::vector<double>& data) {
    if (data.empty())
        return 0.0;
    return as_vector(data).mean();
}

double variance(const std::vector<double>& data, Normalization normalization) {
    size_t min_size = normalization == Normalization::SAMPLE ? 2 : 1;
    if (data.size() < min_size)
        return 0.0;

    auto v = as_vector(data);
    double sum_sq = (v.array() - v.mean()).square().sum();
    double denom = normalization == Normalization::SAMPLE ? static_cast<double>(data.size() - 1)
                                                          : static_cast<double>(data.size());
    return sum_sq / denom;
}

double standard_deviation(const std::vector<double>& data, Normalization normalization) {
    return std::sqrt(variance(data, normalization));
}

double percentile(const std::vector<double>& data, double q) {
    std::vector<double> sorted(data);
    std::sort(sorted.begin(), sorted.end());
    return interpolate_sorted(sorted, q);
}

std::map<int, double> percentiles(const std::vector<double>& data, const std::vector<int>& qs) {
    std::vector<double> sorted(data);
    std::sort(sorted.begin(), sorted.end());

    std::map<int, double> result;
    for (int q : qs) {
        result[q] = interpolate_sorted(sorted, static_cast<double>(q));
    }
    return result;
}

double percentile_rank(const std::vector<double>& data, double value) {
    if (data.empty())
        return 0.0;
    auto below = std::count_if(data.begin(), data.end(), [&](double x) { return x < value; });
    return 100.0 * static_cast<double>(below) / static_cast<double>(data.size());
}

ConfidenceInterval confidence_interval(const std::vector<double>& data, double level) {
    std::vector<double> sorted(data);
    std::sort(sorted.begin(), sorted.end());

    double tail = (1.0 - std::min(1.0, std::max(0.0, level))) / 2.0 * 100.0;
    ConfidenceInterval interval;
    interval.lower = interpolate_sorted(sorted, tail);
    interval.upper = interpolate_sorted(sorted, 100.0 - tail);
    return interval;
}

double skewness(const std::vector<double>& data) {
    return standardized_moment(data, 3);
}

double excess_kurtosis(const std::vector<double>& data) {
    if (!has_spread(data))
        return 0.0;
    return standardized_moment(data, 4) - 3.0;
}

double correlation(const std::vector<double>& x, const std::vector<double>& y) {
    const size_t n = std::min(x.size(), y.size());
    if (n < 2)
        return 0.0;

    const auto size = static_cast<Eigen::Index>(n);
    Eigen::Map<const Eigen::VectorXd> xs(x.data(), size);
    Eigen::Map<const Eigen::VectorXd> ys(y.data(), size);
    Eigen::ArrayXd dx = xs.array() - xs.mean();
    Eigen::ArrayXd dy = ys.array() - ys.mean();
    double denom = std::sqrt(dx.square().sum() * dy.square().sum());
    if (!(denom > 0.0))
        return 0.0;
    return (dx * dy).sum() / denom;
}

SampleSummary summarize(const std::vector<double>& data) {
    SampleSummary summary;
    summary.count = data.size();
    if (data.empty())
        return summary;

    auto v = as_vector(data);
    summary.mean = v.mean();
    summary.standard_deviation = standard_deviation(data, Normalization::SAMPLE);
    summary.min = v.minCoeff();
    summary.max = v.maxCoeff();
    summary.skewness = skewness(data);
    summary.excess_kurtosis = excess_kurtosis(data);
    return summary;
}

}  // namespace statistics
}  // namespace trade_sim
