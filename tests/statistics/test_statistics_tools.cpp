#include <gtest/gtest.h>
#include <Eigen/Dense>
#include <cmath>
#include <vector>
#include "trade_sim/statistics/statistics_tools.hpp"

using namespace trade_sim::statistics;

// ============================================================================
// Descriptive statistics
// ============================================================================

class StatisticsToolsTest : public ::testing::Test {
protected:
    std::vector<double> sample_{2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
};

TEST_F(StatisticsToolsTest, MeanAndVariance) {
    EXPECT_DOUBLE_EQ(mean(sample_), 5.0);
    EXPECT_DOUBLE_EQ(variance(sample_), 4.0);
    EXPECT_DOUBLE_EQ(standard_deviation(sample_), 2.0);
    EXPECT_DOUBLE_EQ(variance(sample_, Normalization::SAMPLE), 32.0 / 7.0);
}

TEST_F(StatisticsToolsTest, EmptyAndTinySamples) {
    std::vector<double> empty;
    std::vector<double> single{3.0};

    EXPECT_DOUBLE_EQ(mean(empty), 0.0);
    EXPECT_DOUBLE_EQ(variance(empty), 0.0);
    EXPECT_DOUBLE_EQ(variance(single), 0.0);
    EXPECT_DOUBLE_EQ(standard_deviation(single, Normalization::SAMPLE), 0.0);
    EXPECT_DOUBLE_EQ(percentile(empty, 50), 0.0);
    EXPECT_DOUBLE_EQ(percentile(single, 95), 3.0);
}

TEST_F(StatisticsToolsTest, PercentileInterpolatesLinearly) {
    std::vector<double> data{10.0, 40.0, 20.0, 30.0};  // Unsorted on purpose

    EXPECT_DOUBLE_EQ(percentile(data, 0), 10.0);
    EXPECT_DOUBLE_EQ(percentile(data, 100), 40.0);
    EXPECT_DOUBLE_EQ(percentile(data, 50), 25.0);
    EXPECT_DOUBLE_EQ(percentile(data, 25), 17.5);
    EXPECT_DOUBLE_EQ(percentile(data, 150), 40.0);  // Clamped
}

TEST_F(StatisticsToolsTest, PercentilesMatchSingleCalls) {
    auto result = percentiles(sample_, {5, 25, 50, 75, 95});

    ASSERT_EQ(result.size(), 5u);
    for (int q : {5, 25, 50, 75, 95}) {
        EXPECT_DOUBLE_EQ(result.at(q), percentile(sample_, q));
    }
}

TEST_F(StatisticsToolsTest, Summarize) {
    SampleSummary summary = summarize(sample_);

    EXPECT_EQ(summary.count, 8u);
    EXPECT_DOUBLE_EQ(summary.mean, 5.0);
    EXPECT_DOUBLE_EQ(summary.min, 2.0);
    EXPECT_DOUBLE_EQ(summary.max, 9.0);
    EXPECT_NEAR(summary.standard_deviation, std::sqrt(32.0 / 7.0), 1e-12);
    EXPECT_NEAR(summary.skewness, 0.65625, 1e-12);
    EXPECT_NEAR(summary.excess_kurtosis, -0.21875, 1e-12);
}

TEST_F(StatisticsToolsTest, ShapeOfSymmetricAndFlatSamples) {
    std::vector<double> symmetric{-2.0, -1.0, 0.0, 1.0, 2.0};
    EXPECT_NEAR(skewness(symmetric), 0.0, 1e-12);
    // Fourth moment 6.8 over variance 2 squared
    EXPECT_NEAR(excess_kurtosis(symmetric), 6.8 / 4.0 - 3.0, 1e-12);

    std::vector<double> flat{3.0, 3.0, 3.0};
    EXPECT_DOUBLE_EQ(skewness(flat), 0.0);
    EXPECT_DOUBLE_EQ(excess_kurtosis(flat), 0.0);
    EXPECT_DOUBLE_EQ(skewness({}), 0.0);
}

TEST_F(StatisticsToolsTest, CorrelationOfPairedSamples) {
    std::vector<double> x{1.0, 2.0, 3.0, 4.0};
    EXPECT_NEAR(correlation(x, {2.0, 4.0, 6.0, 8.0}), 1.0, 1e-12);
    EXPECT_NEAR(correlation(x, {8.0, 6.0, 4.0, 2.0}), -1.0, 1e-12);
    EXPECT_NEAR(correlation(x, {1.0, -1.0, -1.0, 1.0}), 0.0, 1e-12);

    // Extra pairs ignored, degenerate inputs give 0
    EXPECT_NEAR(correlation(x, {2.0, 4.0, 6.0, 8.0, -100.0}), 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(correlation(x, {5.0, 5.0, 5.0, 5.0}), 0.0);
    EXPECT_DOUBLE_EQ(correlation({1.0}, {2.0}), 0.0);
}

TEST_F(StatisticsToolsTest, RankAndConfidenceInterval) {
    std::vector<double> ramp;
    for (int i = 0; i <= 100; ++i) {
        ramp.push_back(static_cast<double>(i));
    }

    EXPECT_NEAR(percentile_rank(ramp, 50.0), 100.0 * 50.0 / 101.0, 1e-12);
    EXPECT_DOUBLE_EQ(percentile_rank(ramp, -1.0), 0.0);
    EXPECT_DOUBLE_EQ(percentile_rank(ramp, 1000.0), 100.0);
    EXPECT_DOUBLE_EQ(percentile_rank({}, 1.0), 0.0);

    ConfidenceInterval ci = confidence_interval(ramp, 0.90);
    EXPECT_NEAR(ci.lower, 5.0, 1e-9);
    EXPECT_NEAR(ci.upper, 95.0, 1e-9);
    EXPECT_NEAR(ci.width(), 90.0, 1e-9);

    ConfidenceInterval wide = confidence_interval(ramp, 0.99);
    EXPECT_LT(wide.lower, ci.lower);
    EXPECT_GT(wide.upper, ci.upper);
}

TEST_F(StatisticsToolsTest, AsVectorSharesStorage) {
    auto v = as_vector(sample_);

    EXPECT_EQ(v.size(), 8);
    EXPECT_EQ(v.data(), sample_.data());
    EXPECT_DOUBLE_EQ(v.sum(), 40.0);
}
