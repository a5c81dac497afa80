/**
 * @file test_rolling.cpp
 * @brief Unit tests for trailing-window drivers
 */

#include <gtest/gtest.h>
#include <cmath>
#include <vector>
#include "core/rolling.hpp"

namespace tsstat {
namespace {

class RollingTest : public ::testing::Test {
protected:
    void SetUp() override {
        increasing = {1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0, 8.0, 9.0, 10.0};
        decreasing.assign(increasing.rbegin(), increasing.rend());
        constant.assign(10, 2.5);
    }

    std::vector<double> increasing;
    std::vector<double> decreasing;
    std::vector<double> constant;
};

// ============== Ratio to trailing mean ==============

TEST_F(RollingTest, TrailingMeanExcludesCurrentSample) {
    std::vector<double> means = trailing_mean_exclusive({2.0, 4.0, 6.0, 8.0}, 2);
    ASSERT_EQ(means.size(), 4u);
    EXPECT_DOUBLE_EQ(means[0], 2.0);  // no past: the sample itself
    EXPECT_DOUBLE_EQ(means[1], 2.0);  // mean of {2}
    EXPECT_DOUBLE_EQ(means[2], 3.0);  // mean of {2, 4}
    EXPECT_DOUBLE_EQ(means[3], 5.0);  // mean of {4, 6}
}

TEST_F(RollingTest, TrailingMeanShortHistoryUsesAllPastSamples) {
    std::vector<double> means = trailing_mean_exclusive(increasing, 40);
    for (size_t i = 1; i < increasing.size(); ++i) {
        // mean of 1..i
        EXPECT_DOUBLE_EQ(means[i], (static_cast<double>(i) + 1.0) / 2.0) << "i=" << i;
    }
}

TEST_F(RollingTest, RatioToTrailingMean) {
    std::vector<double> ratio = ratio_to_trailing_mean({2.0, 4.0, 6.0, 8.0}, 2);
    ASSERT_EQ(ratio.size(), 4u);
    EXPECT_DOUBLE_EQ(ratio[0], 1.0);
    EXPECT_DOUBLE_EQ(ratio[1], 2.0);
    EXPECT_DOUBLE_EQ(ratio[2], 2.0);
    EXPECT_DOUBLE_EQ(ratio[3], 1.6);
}

TEST_F(RollingTest, DifferenceToTrailingMean) {
    std::vector<double> diff =
        ratio_to_trailing_mean({2.0, 4.0, 6.0, 8.0}, 2, RatioMode::Difference);
    EXPECT_DOUBLE_EQ(diff[0], 0.0);
    EXPECT_DOUBLE_EQ(diff[1], 2.0);
    EXPECT_DOUBLE_EQ(diff[2], 3.0);
    EXPECT_DOUBLE_EQ(diff[3], 3.0);
}

TEST_F(RollingTest, RatioConstantSeriesIsOne) {
    for (double r : ratio_to_trailing_mean(constant, 3)) {
        EXPECT_DOUBLE_EQ(r, 1.0);
    }
}

TEST_F(RollingTest, RatioZeroMeanUsesFallback) {
    std::vector<double> ratio = ratio_to_trailing_mean({0.0, 0.0, 5.0, 1.0}, 2);
    EXPECT_DOUBLE_EQ(ratio[0], 1.0);
    EXPECT_DOUBLE_EQ(ratio[1], 1.0);
    EXPECT_DOUBLE_EQ(ratio[2], 1.0);  // mean of {0, 0}
    EXPECT_DOUBLE_EQ(ratio[3], 0.4);  // 1 / mean of {0, 5}

    std::vector<double> custom =
        ratio_to_trailing_mean({0.0, 3.0}, 2, RatioMode::Ratio, -1.0);
    EXPECT_DOUBLE_EQ(custom[0], -1.0);
    EXPECT_DOUBLE_EQ(custom[1], -1.0);
    for (double r : custom) {
        EXPECT_FALSE(std::isnan(r));
    }
}

TEST_F(RollingTest, RatioCancellingWindowUsesFallback) {
    // Window {0.2, -0.2} at index 3 sums to zero; prefix sums leave ~1e-17
    std::vector<double> values = {0.1, 0.2, -0.2, 5.0};
    std::vector<double> means = trailing_mean_exclusive(values, 2);
    EXPECT_EQ(means[3], 0.0);

    std::vector<double> ratio = ratio_to_trailing_mean(values, 2);
    EXPECT_DOUBLE_EQ(ratio[3], 1.0);
}

TEST_F(RollingTest, RatioCancellingWindowAfterLargePrefix) {
    std::vector<double> values(100, 1.0e6);
    values.push_back(0.3);
    values.push_back(-0.3);
    values.push_back(0.7);
    std::vector<double> ratio = ratio_to_trailing_mean(values, 2, RatioMode::Ratio, -1.0);
    EXPECT_DOUBLE_EQ(ratio[102], -1.0);
}

TEST_F(RollingTest, TrailingMeanKeepsSmallNonzeroMean) {
    std::vector<double> means = trailing_mean_exclusive({1.0e-20, 3.0e-20, 5.0}, 2);
    EXPECT_DOUBLE_EQ(means[2], 2.0e-20);
}

TEST_F(RollingTest, RatioLongConstantSeriesIsExactlyOne) {
    std::vector<double> values(200, 0.1);
    for (int width : {1, 5, 40}) {
        std::vector<double> means = trailing_mean_exclusive(values, width);
        std::vector<double> ratio = ratio_to_trailing_mean(values, width);
        for (size_t i = 0; i < values.size(); ++i) {
            EXPECT_EQ(means[i], 0.1) << "width=" << width << " i=" << i;
            EXPECT_EQ(ratio[i], 1.0) << "width=" << width << " i=" << i;
        }
    }
}

TEST_F(RollingTest, RatioRejectsUnresolvedMode) {
    EXPECT_THROW(ratio_to_trailing_mean(increasing, 3, RatioMode::Auto), std::invalid_argument);
}

TEST_F(RollingTest, ResolveRatioMode) {
    EXPECT_EQ(resolve_ratio_mode(RatioMode::Auto, "autocorr"), RatioMode::Difference);
    EXPECT_EQ(resolve_ratio_mode(RatioMode::Auto, "autoco"), RatioMode::Difference);
    EXPECT_EQ(resolve_ratio_mode(RatioMode::Auto, "auto"), RatioMode::Ratio);
    EXPECT_EQ(resolve_ratio_mode(RatioMode::Auto, ""), RatioMode::Ratio);
    EXPECT_EQ(resolve_ratio_mode(RatioMode::Ratio, "autocorr"), RatioMode::Ratio);
}

TEST_F(RollingTest, InvalidWidthThrows) {
    EXPECT_THROW(trailing_mean_exclusive(increasing, 0), std::invalid_argument);
    EXPECT_THROW(rolling_variance(increasing, -1), std::invalid_argument);
}

// ============== Inclusive windows ==============

TEST_F(RollingTest, OutputLengthMatchesInput) {
    for (size_t n : {1u, 2u, 3u, 7u, 25u}) {
        std::vector<double> values(n);
        for (size_t i = 0; i < n; ++i) {
            values[i] = std::sin(static_cast<double>(i));
        }
        for (int width : {1, 3, 10, 40}) {
            EXPECT_EQ(ratio_to_trailing_mean(values, width).size(), n);
            EXPECT_EQ(rolling_variance(values, width).size(), n);
            EXPECT_EQ(rolling_skewness(values, width).size(), n);
            EXPECT_EQ(rolling_autocorrelation(values, width).size(), n);
            EXPECT_EQ(rolling_kendall_tau(values, width).size(), n);
        }
    }
}

TEST_F(RollingTest, EmptyInputGivesEmptyOutput) {
    std::vector<double> empty;
    EXPECT_TRUE(ratio_to_trailing_mean(empty, 3).empty());
    EXPECT_TRUE(rolling_variance(empty, 3).empty());
    EXPECT_TRUE(rolling_kendall_tau(empty, 3).empty());
}

TEST_F(RollingTest, RollingApplyWindowBounds) {
    // Window at i spans [max(0, i-2), i]: record (first value, size)
    std::vector<double> values = {10.0, 11.0, 12.0, 13.0, 14.0};
    std::vector<double> firsts = rolling_apply(values, 2, [](const double* data, size_t) {
        return data[0];
    });
    std::vector<double> sizes = rolling_apply(values, 2, [](const double*, size_t n) {
        return static_cast<double>(n);
    });
    std::vector<double> expected_firsts = {10.0, 10.0, 10.0, 11.0, 12.0};
    std::vector<double> expected_sizes = {1.0, 2.0, 3.0, 3.0, 3.0};
    EXPECT_EQ(firsts, expected_firsts);
    EXPECT_EQ(sizes, expected_sizes);
}

TEST_F(RollingTest, RollingVariance) {
    std::vector<double> var = rolling_variance({1.0, 2.0, 3.0, 4.0, 5.0}, 2);
    EXPECT_TRUE(std::isnan(var[0]));  // single sample
    EXPECT_DOUBLE_EQ(var[1], 0.5);
    EXPECT_DOUBLE_EQ(var[2], 1.0);
    EXPECT_DOUBLE_EQ(var[3], 1.0);
    EXPECT_DOUBLE_EQ(var[4], 1.0);
}

TEST_F(RollingTest, RollingVarianceConstantIsZero) {
    std::vector<double> var = rolling_variance(constant, 4);
    EXPECT_TRUE(std::isnan(var[0]));
    for (size_t i = 1; i < var.size(); ++i) {
        EXPECT_DOUBLE_EQ(var[i], 0.0);
    }
}

TEST_F(RollingTest, RollingSkewness) {
    std::vector<double> skew = rolling_skewness({1.0, 2.0, 3.0, 4.0, 10.0}, 2);
    EXPECT_TRUE(std::isnan(skew[0]));
    EXPECT_TRUE(std::isnan(skew[1]));
    EXPECT_NEAR(skew[2], 0.0, 1e-12);
    EXPECT_NEAR(skew[3], 0.0, 1e-12);
    EXPECT_GT(skew[4], 0.0);  // {3, 4, 10} has a right tail
}

TEST_F(RollingTest, RollingAutocorrelation) {
    std::vector<double> ac = rolling_autocorrelation(increasing, 3);
    EXPECT_TRUE(std::isnan(ac[0]));
    EXPECT_TRUE(std::isnan(ac[1]));
    for (size_t i = 2; i < ac.size(); ++i) {
        EXPECT_NEAR(ac[i], 1.0, 1e-12) << "i=" << i;
    }
}

TEST_F(RollingTest, RollingKendallTauIncreasing) {
    std::vector<double> tau = rolling_kendall_tau(increasing, 4);
    EXPECT_DOUBLE_EQ(tau[0], 0.0);  // single sample
    for (size_t i = 1; i < tau.size(); ++i) {
        EXPECT_NEAR(tau[i], 1.0, 1e-12) << "i=" << i;
    }
}

TEST_F(RollingTest, RollingKendallTauDecreasing) {
    std::vector<double> tau = rolling_kendall_tau(decreasing, 4);
    EXPECT_DOUBLE_EQ(tau[0], 0.0);
    for (size_t i = 1; i < tau.size(); ++i) {
        EXPECT_NEAR(tau[i], -1.0, 1e-12) << "i=" << i;
    }
}

TEST_F(RollingTest, RollingKendallTauConstantIsZero) {
    for (double t : rolling_kendall_tau(constant, 3)) {
        EXPECT_DOUBLE_EQ(t, 0.0);
    }
}

TEST_F(RollingTest, RollingKendallTauWindows) {
    std::vector<double> tau = rolling_kendall_tau({1.0, 3.0, 2.0, 4.0}, 3);
    EXPECT_DOUBLE_EQ(tau[0], 0.0);
    EXPECT_NEAR(tau[1], 1.0, 1e-12);
    EXPECT_NEAR(tau[2], 1.0 / 3.0, 1e-12);
    EXPECT_NEAR(tau[3], 2.0 / 3.0, 1e-12);
}

// ============== Time axis ==============

TEST_F(RollingTest, TimeAxisExactPoints) {
    std::vector<double> t = time_axis(0.0, 300.0, 5);
    std::vector<double> expected = {0.0, 300.0, 600.0, 900.0, 1200.0};
    EXPECT_EQ(t, expected);
}

TEST_F(RollingTest, TimeAxisNonIntegerSpacing) {
    // Accumulating 0.1 would drift; the count must stay exact
    std::vector<double> t = time_axis(1.0, 0.1, 1000);
    ASSERT_EQ(t.size(), 1000u);
    EXPECT_DOUBLE_EQ(t.front(), 1.0);
    EXPECT_NEAR(t.back(), 1.0 + 99.9, 1e-9);
    EXPECT_TRUE(time_axis(5.0, 1.0, 0).empty());
}

}  // namespace
}  // namespace tsstat
