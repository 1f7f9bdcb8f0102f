#include <gtest/gtest.h>
#include "scanner/indicators/numerical_toolkit.hpp"
#include <cmath>
#include <stdexcept>

using namespace SwingScanner::Core;

TEST(NumericalToolkitTest, QuadraticFitRecoversExactCoefficients) {
    std::vector<double> x_values{0.0, 1.0, 2.0, 3.0, 4.0, 5.0};
    std::vector<double> y_values;
    for (double x_value : x_values) {
        y_values.push_back(2.0 * x_value * x_value - 3.0 * x_value + 1.0);
    }

    QuadraticFit quadratic_fit = fit_quadratic(x_values, y_values);
    EXPECT_NEAR(quadratic_fit.a, 2.0, 1e-9);
    EXPECT_NEAR(quadratic_fit.b, -3.0, 1e-9);
    EXPECT_NEAR(quadratic_fit.c, 1.0, 1e-9);
    EXPECT_NEAR(quadratic_fit.vertex_x(), 0.75, 1e-9);
}

TEST(NumericalToolkitTest, QuadraticFitFailuresThrow) {
    EXPECT_THROW(fit_quadratic({0.0, 1.0}, {1.0, 2.0}), std::runtime_error);
    EXPECT_THROW(fit_quadratic({1.0, 1.0, 1.0, 1.0}, {1.0, 2.0, 3.0, 4.0}), std::runtime_error);
    EXPECT_THROW(fit_quadratic({0.0, 1.0, 2.0}, {1.0, 2.0}), std::runtime_error);
}

class GaussianKdeTest : public ::testing::Test {
protected:
    GaussianKde density{std::vector<double>{0.0, 1.0, 2.0, 3.0, 4.0}};
};

TEST_F(GaussianKdeTest, ScottsRuleBandwidth) {
    EXPECT_NEAR(density.get_bandwidth(), std::sqrt(2.5) * std::pow(5.0, -0.2), 1e-12);
}

TEST_F(GaussianKdeTest, SymmetricSampleGivesSymmetricDensity) {
    EXPECT_NEAR(density.evaluate(1.3), density.evaluate(2.7), 1e-12);
    EXPECT_GT(density.evaluate(2.0), density.evaluate(5.0));
}

TEST_F(GaussianKdeTest, DensityIntegratesToOne) {
    std::vector<double> grid = linspace(-20.0, 24.0, 4401);
    std::vector<double> density_values = density.evaluate(grid);
    double step = grid[1] - grid[0];
    double integral = 0.0;
    for (size_t grid_index = 1; grid_index < grid.size(); ++grid_index) {
        integral += 0.5 * (density_values[grid_index] + density_values[grid_index - 1]) * step;
    }
    EXPECT_NEAR(integral, 1.0, 1e-4);
}

TEST(NumericalToolkitTest, DegenerateKdeSamplesThrow) {
    EXPECT_THROW(GaussianKde(std::vector<double>{1.0}), std::runtime_error);
    EXPECT_THROW(GaussianKde(std::vector<double>{3.0, 3.0, 3.0}), std::runtime_error);
}

TEST(NumericalToolkitTest, SummaryStatistics) {
    std::vector<double> values{2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};

    EXPECT_NEAR(mean_value(values), 5.0, 1e-12);
    EXPECT_NEAR(population_std(values), 2.0, 1e-12);
    EXPECT_NEAR(sample_std(values), std::sqrt(32.0 / 7.0), 1e-12);
    EXPECT_EQ(sample_std({1.0}), 0.0);

    std::vector<double> grid = linspace(0.0, 1.0, 5);
    ASSERT_EQ(grid.size(), 5u);
    EXPECT_NEAR(grid[1], 0.25, 1e-12);
    EXPECT_EQ(grid.back(), 1.0);
}

TEST(NumericalToolkitTest, LinearPercentile) {
    std::vector<double> values{4.0, 1.0, 3.0, 2.0};

    EXPECT_NEAR(percentile_linear(values, 0.0), 1.0, 1e-12);
    EXPECT_NEAR(percentile_linear(values, 25.0), 1.75, 1e-12);
    EXPECT_NEAR(percentile_linear(values, 50.0), 2.5, 1e-12);
    EXPECT_NEAR(percentile_linear(values, 100.0), 4.0, 1e-12);
    EXPECT_THROW(percentile_linear({}, 50.0), std::runtime_error);
}

TEST(RelativeExtremaTest, StrictInteriorMaxima) {
    EXPECT_EQ(find_relative_maxima({1.0, 3.0, 2.0, 5.0, 4.0}, 1, true), (std::vector<int>{1, 3}));
}

TEST(RelativeExtremaTest, StrictComparisonRejectsEdgesAndPlateaus) {
    EXPECT_TRUE(find_relative_maxima({5.0, 1.0, 2.0}, 1, true).empty());
    EXPECT_TRUE(find_relative_maxima({1.0, 2.0, 2.0, 1.0}, 1, true).empty());
}

TEST(RelativeExtremaTest, NonStrictComparisonAcceptsEdgesAndPlateaus) {
    EXPECT_EQ(find_relative_maxima({5.0, 1.0, 2.0}, 1, false), (std::vector<int>{0, 2}));
    EXPECT_EQ(find_relative_maxima({1.0, 2.0, 2.0, 1.0}, 1, false), (std::vector<int>{1, 2}));
}

TEST(RelativeExtremaTest, MinimaWithWiderOrder) {
    EXPECT_EQ(find_relative_minima({3.0, 1.0, 2.0, 0.0, 4.0}, 1, true), (std::vector<int>{1, 3}));
    EXPECT_EQ(find_relative_minima({3.0, 1.0, 2.0, 0.0, 4.0}, 2, true), (std::vector<int>{3}));
}

class ProminentPeaksTest : public ::testing::Test {
protected:
    std::vector<double> values{0.0, 2.0, 0.0, 5.0, 0.0, 3.0, 0.0};
};

TEST_F(ProminentPeaksTest, ProminenceAgainstHigherSideMinimum) {
    std::vector<PeakCandidate> peaks = find_prominent_peaks(values, 1, 0.0);
    ASSERT_EQ(peaks.size(), 3u);
    EXPECT_EQ(peaks[0].index, 1);
    EXPECT_NEAR(peaks[0].prominence, 2.0, 1e-12);
    EXPECT_EQ(peaks[1].index, 3);
    EXPECT_NEAR(peaks[1].prominence, 5.0, 1e-12);
    EXPECT_NEAR(peaks[2].prominence, 3.0, 1e-12);
}

TEST_F(ProminentPeaksTest, DistanceFilterKeepsTallestPeak) {
    std::vector<PeakCandidate> peaks = find_prominent_peaks(values, 3, 0.0);
    ASSERT_EQ(peaks.size(), 1u);
    EXPECT_EQ(peaks[0].index, 3);
}

TEST_F(ProminentPeaksTest, ProminenceFilter) {
    std::vector<PeakCandidate> peaks = find_prominent_peaks(values, 1, 2.5);
    ASSERT_EQ(peaks.size(), 2u);
    EXPECT_EQ(peaks[0].index, 3);
    EXPECT_EQ(peaks[1].index, 5);
}

TEST(ProminentPeaksPlateauTest, PlateauResolvesToItsMiddle) {
    std::vector<PeakCandidate> peaks = find_prominent_peaks({0.0, 1.0, 1.0, 1.0, 0.0}, 1, 0.0);
    ASSERT_EQ(peaks.size(), 1u);
    EXPECT_EQ(peaks[0].index, 2);
}
