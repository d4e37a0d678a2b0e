#pragma once

#include <Eigen/Dense>
#include <map>
#include <vector>

namespace trade_sim {
namespace statistics {

// ============================================================================
// Descriptive statistics over return, P&L and drawdown samples
// ============================================================================

/**
 * @brief Variance normalization
 */
enum class Normalization {
    POPULATION,  // divide by n
    SAMPLE       // divide by n - 1
};

/**
 * @brief Arithmetic mean, 0 for an empty sample
 */
double mean(const std::vector<double>& data);

/**
 * @brief Variance, 0 when the sample is too small for the normalization
 */
double variance(const std::vector<double>& data,
                Normalization normalization = Normalization::POPULATION);

double standard_deviation(const std::vector<double>& data,
                          Normalization normalization = Normalization::POPULATION);

/**
 * @brief Percentile with linear interpolation between closest ranks
 * @param data Sample (need not be sorted)
 * @param q Percentile in [0, 100]
 * @return Interpolated value, 0 for an empty sample
 */
double percentile(const std::vector<double>& data, double q);

/**
 * @brief Several percentiles of one sample, sorting it once
 */
std::map<int, double> percentiles(const std::vector<double>& data, const std::vector<int>& qs);

/**
 * @brief Share of the sample strictly below value, in percent
 */
double percentile_rank(const std::vector<double>& data, double value);

/**
 * @brief Central interval holding `level` of the sample
 */
struct ConfidenceInterval {
    double lower{0.0};
    double upper{0.0};

    double width() const {
        return upper - lower;
    }
};

/**
 * @param level Coverage in (0, 1), e.g. 0.95 for the 2.5th to 97.5th percentile
 */
ConfidenceInterval confidence_interval(const std::vector<double>& data, double level);

/**
 * @brief Third standardized moment, 0 for a sample without spread
 */
double skewness(const std::vector<double>& data);

/**
 * @brief Fourth standardized moment minus 3, 0 for a sample without spread
 */
double excess_kurtosis(const std::vector<double>& data);

/**
 * @brief Pearson correlation of two paired samples
 *
 * Pairs beyond the shorter sample are ignored. 0 when either side has no
 * spread or fewer than two pairs.
 */
double correlation(const std::vector<double>& x, const std::vector<double>& y);

/**
 * @brief Summary of one sample
 */
struct SampleSummary {
    size_t count{0};
    double mean{0.0};
    double standard_deviation{0.0};
    double min{0.0};
    double max{0.0};
    double skewness{0.0};
    double excess_kurtosis{0.0};
};

SampleSummary summarize(const std::vector<double>& data);

/**
 * @brief View a std::vector as an Eigen vector without copying
 */
inline Eigen::Map<const Eigen::VectorXd> as_vector(const std::vector<double>& data) {
    return Eigen::Map<const Eigen::VectorXd>(data.data(), static_cast<Eigen::Index>(data.size()));
}

}  // namespace statistics
}  // namespace trade_sim
