#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

#include "services/resampling/slice_axis_interpolator.hpp"

using namespace sweep_recon;
using namespace sweep_recon::services;

namespace {

std::vector<float> linearValues(const std::vector<double>& positions,
                                double slope = 10.0, double offset = 3.0) {
    std::vector<float> values;
    for (double p : positions) {
        values.push_back(static_cast<float>(slope * p + offset));
    }
    return values;
}

}  // anonymous namespace

// =============================================================================
// Fast linear interpolation
// =============================================================================

TEST(FastLinearInterpolatorTest, ExactOnLinearData) {
    std::vector<double> samples = {0.0, 1.0, 2.0, 4.0};
    std::vector<double> grid = {0.0, 0.5, 1.0, 2.5, 3.0, 4.0};

    FastLinearInterpolator interpolator;
    ASSERT_TRUE(interpolator.prepare(samples, grid).has_value());
    EXPECT_EQ(interpolator.distinctPositions(), 4u);

    auto values = linearValues(samples);
    std::vector<float> out(grid.size());
    ASSERT_TRUE(interpolator.interpolate(values, out));
    for (std::size_t k = 0; k < grid.size(); ++k) {
        EXPECT_NEAR(out[k], 10.0 * grid[k] + 3.0, 1e-4) << "grid " << grid[k];
    }
}

TEST(FastLinearInterpolatorTest, ReproducesSamplesAtTheirPositions) {
    std::vector<double> samples = {0.0, 0.7, 1.9, 3.2};
    std::vector<float> values = {5.0f, -2.0f, 8.5f, 1.25f};

    FastLinearInterpolator interpolator;
    ASSERT_TRUE(interpolator.prepare(samples, samples).has_value());
    std::vector<float> out(samples.size());
    ASSERT_TRUE(interpolator.interpolate(values, out));
    for (std::size_t i = 0; i < samples.size(); ++i) {
        EXPECT_FLOAT_EQ(out[i], values[i]);
    }
}

TEST(FastLinearInterpolatorTest, ClampsOutsideSampleRange) {
    std::vector<double> samples = {1.0, 2.0, 3.0};
    std::vector<double> grid = {-5.0, 0.0, 3.5, 10.0};
    std::vector<float> values = {4.0f, 6.0f, 9.0f};

    FastLinearInterpolator interpolator;
    ASSERT_TRUE(interpolator.prepare(samples, grid).has_value());
    std::vector<float> out(grid.size());
    ASSERT_TRUE(interpolator.interpolate(values, out));
    EXPECT_FLOAT_EQ(out[0], 4.0f);
    EXPECT_FLOAT_EQ(out[1], 4.0f);
    EXPECT_FLOAT_EQ(out[2], 9.0f);
    EXPECT_FLOAT_EQ(out[3], 9.0f);
}

TEST(FastLinearInterpolatorTest, DuplicatePositionsAveraged) {
    std::vector<double> samples = {0.0, 1.0, 1.0, 2.0};
    std::vector<double> grid = {0.5, 1.0, 1.5};
    std::vector<float> values = {0.0f, 4.0f, 6.0f, 10.0f};

    FastLinearInterpolator interpolator;
    ASSERT_TRUE(interpolator.prepare(samples, grid).has_value());
    EXPECT_EQ(interpolator.distinctPositions(), 3u);

    std::vector<float> out(grid.size());
    ASSERT_TRUE(interpolator.interpolate(values, out));
    EXPECT_FLOAT_EQ(out[0], 2.5f);
    EXPECT_FLOAT_EQ(out[1], 5.0f);
    EXPECT_FLOAT_EQ(out[2], 7.5f);
}

TEST(FastLinearInterpolatorTest, SinglePositionIsConstant) {
    FastLinearInterpolator interpolator;
    ASSERT_TRUE(interpolator.prepare({2.0, 2.0}, {0.0, 2.0, 4.0}).has_value());
    std::vector<float> out(3);
    ASSERT_TRUE(interpolator.interpolate(std::vector<float>{1.0f, 3.0f}, out));
    for (float v : out) {
        EXPECT_FLOAT_EQ(v, 2.0f);
    }
}

TEST(FastLinearInterpolatorTest, RejectsMismatchedBuffers) {
    FastLinearInterpolator interpolator;
    std::vector<float> out(2);
    EXPECT_FALSE(interpolator.interpolate(std::vector<float>{1.0f}, out));

    ASSERT_TRUE(interpolator.prepare({0.0, 1.0}, {0.0, 1.0}).has_value());
    EXPECT_FALSE(interpolator.interpolate(std::vector<float>{1.0f}, out));
    std::vector<float> wrongGrid(5);
    EXPECT_FALSE(interpolator.interpolate(std::vector<float>{1.0f, 2.0f}, wrongGrid));
}

TEST(FastLinearInterpolatorTest, InvalidPositionsRejected) {
    FastLinearInterpolator interpolator;

    auto empty = interpolator.prepare({}, {0.0});
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().code, ReconError::Code::InvalidInput);

    auto unsorted = interpolator.prepare({1.0, 0.0}, {0.0});
    ASSERT_FALSE(unsorted.has_value());
    EXPECT_EQ(unsorted.error().code, ReconError::Code::InvalidInput);

    double nan = std::numeric_limits<double>::quiet_NaN();
    auto notFinite = interpolator.prepare({0.0, nan}, {0.0});
    ASSERT_FALSE(notFinite.has_value());
    EXPECT_EQ(notFinite.error().code, ReconError::Code::InvalidInput);
}

// =============================================================================
// RBF interpolation
// =============================================================================

TEST(RbfInterpolatorTest, BasisFunctions) {
    EXPECT_DOUBLE_EQ(RbfInterpolator::basis(RbfKernel::Multiquadric, 0.0, 1.0), 1.0);
    EXPECT_DOUBLE_EQ(RbfInterpolator::basis(RbfKernel::Multiquadric, 2.0, 2.0),
                     std::sqrt(2.0));
    EXPECT_DOUBLE_EQ(RbfInterpolator::basis(RbfKernel::InverseMultiquadric, 0.0, 1.0), 1.0);
    EXPECT_DOUBLE_EQ(RbfInterpolator::basis(RbfKernel::Gaussian, 1.0, 1.0), std::exp(-1.0));
    EXPECT_DOUBLE_EQ(RbfInterpolator::basis(RbfKernel::Linear, 3.0, 1.0), 3.0);
    EXPECT_DOUBLE_EQ(RbfInterpolator::basis(RbfKernel::Cubic, 2.0, 5.0), 8.0);
    EXPECT_DOUBLE_EQ(RbfInterpolator::basis(RbfKernel::ThinPlate, 0.0, 1.0), 0.0);
    EXPECT_DOUBLE_EQ(RbfInterpolator::basis(RbfKernel::ThinPlate, std::exp(1.0), 1.0),
                     std::exp(2.0));
}

TEST(RbfInterpolatorTest, DefaultEpsilonIsMeanSpacing) {
    RbfInterpolator interpolator;
    ASSERT_TRUE(interpolator.prepare({0.0, 1.0, 2.0, 4.0}, {1.0}).has_value());
    EXPECT_DOUBLE_EQ(interpolator.epsilon(), 1.0);

    RbfParameters params;
    params.epsilon = 2.5;
    RbfInterpolator fixed(params);
    ASSERT_TRUE(fixed.prepare({0.0, 1.0, 2.0, 4.0}, {1.0}).has_value());
    EXPECT_DOUBLE_EQ(fixed.epsilon(), 2.5);
}

TEST(RbfInterpolatorTest, InterpolatesSamplesNearlyExactly) {
    std::vector<double> samples = {0.0, 1.0, 2.0, 3.0, 4.0};
    std::vector<float> values = {1.0f, 3.0f, 2.0f, 5.0f, 4.0f};

    RbfInterpolator interpolator;
    ASSERT_TRUE(interpolator.prepare(samples, samples).has_value());
    ASSERT_TRUE(interpolator.isSolvable());
    EXPECT_DOUBLE_EQ(interpolator.regularization(), 0.0);

    std::vector<float> out(samples.size());
    ASSERT_TRUE(interpolator.interpolate(values, out));
    for (std::size_t i = 0; i < samples.size(); ++i) {
        EXPECT_NEAR(out[i], values[i], 1e-3);
    }
}

TEST(RbfInterpolatorTest, SmoothBetweenSamples) {
    std::vector<double> samples = {0.0, 1.0, 2.0, 3.0, 4.0};
    std::vector<double> grid = {0.5, 1.5, 2.5, 3.5};

    RbfInterpolator interpolator;
    ASSERT_TRUE(interpolator.prepare(samples, grid).has_value());
    std::vector<float> out(grid.size());
    ASSERT_TRUE(interpolator.interpolate(linearValues(samples), out));
    for (std::size_t k = 0; k < grid.size(); ++k) {
        // Between the bracketing samples of a monotone ramp
        EXPECT_GT(out[k], 10.0 * (grid[k] - 0.5) + 3.0);
        EXPECT_LT(out[k], 10.0 * (grid[k] + 0.5) + 3.0);
    }
}

TEST(RbfInterpolatorTest, ClampsOutsideSampleRange) {
    std::vector<double> samples = {1.0, 2.0, 3.0};
    std::vector<float> values = {4.0f, 6.0f, 9.0f};

    RbfInterpolator interpolator;
    ASSERT_TRUE(interpolator.prepare(samples, {-3.0, 1.0, 3.0, 7.0}).has_value());
    std::vector<float> out(4);
    ASSERT_TRUE(interpolator.interpolate(values, out));
    EXPECT_FLOAT_EQ(out[0], out[1]);
    EXPECT_FLOAT_EQ(out[2], out[3]);
    EXPECT_NEAR(out[0], 4.0f, 1e-3);
    EXPECT_NEAR(out[3], 9.0f, 1e-3);
}

TEST(RbfInterpolatorTest, DuplicatePositionsAreRegularized) {
    std::vector<double> samples = {0.0, 1.0, 1.0, 2.0, 3.0};
    std::vector<float> values = {0.0f, 8.0f, 12.0f, 20.0f, 30.0f};

    RbfInterpolator interpolator;
    ASSERT_TRUE(interpolator.prepare(samples, {1.0}).has_value());
    ASSERT_TRUE(interpolator.isSolvable());
    EXPECT_GT(interpolator.regularization(), 0.0);

    std::vector<float> out(1);
    ASSERT_TRUE(interpolator.interpolate(values, out));
    EXPECT_TRUE(std::isfinite(out[0]));
    EXPECT_NEAR(out[0], 10.0f, 0.05);
}

TEST(RbfInterpolatorTest, UnsolvableWithoutRegularization) {
    RbfParameters params;
    params.maxRegularizationAttempts = 0;
    RbfInterpolator interpolator(params);

    // Preparing succeeds; the caller is expected to fall back
    ASSERT_TRUE(interpolator.prepare({0.0, 1.0, 1.0, 2.0}, {1.0}).has_value());
    EXPECT_FALSE(interpolator.isSolvable());

    std::vector<float> out(1);
    EXPECT_FALSE(interpolator.interpolate(std::vector<float>{1.0f, 2.0f, 3.0f, 4.0f}, out));
}

TEST(RbfInterpolatorTest, SinglePositionIsMean) {
    RbfInterpolator interpolator;
    ASSERT_TRUE(interpolator.prepare({5.0, 5.0, 5.0}, {0.0, 5.0}).has_value());
    ASSERT_TRUE(interpolator.isSolvable());
    std::vector<float> out(2);
    ASSERT_TRUE(interpolator.interpolate(std::vector<float>{1.0f, 2.0f, 6.0f}, out));
    EXPECT_FLOAT_EQ(out[0], 3.0f);
    EXPECT_FLOAT_EQ(out[1], 3.0f);
}

TEST(RbfInterpolatorTest, InvalidParametersRejected) {
    RbfParameters params;
    params.epsilon = -1.0;
    RbfInterpolator interpolator(params);
    auto result = interpolator.prepare({0.0, 1.0}, {0.5});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ReconError::Code::InvalidConfiguration);
}

// =============================================================================
// Factory and string conversion
// =============================================================================

TEST(SliceAxisInterpolatorFactoryTest, CreatesRequestedMethod) {
    auto linear = createSliceAxisInterpolator(InterpolationMethod::FastLinear);
    ASSERT_NE(linear, nullptr);
    EXPECT_EQ(linear->method(), InterpolationMethod::FastLinear);

    auto rbf = createSliceAxisInterpolator(InterpolationMethod::Rbf);
    ASSERT_NE(rbf, nullptr);
    EXPECT_EQ(rbf->method(), InterpolationMethod::Rbf);
}

TEST(SliceAxisInterpolatorFactoryTest, SolvabilityThroughInterface) {
    auto linear = createSliceAxisInterpolator(InterpolationMethod::FastLinear);
    ASSERT_TRUE(linear->prepare({0.0, 1.0, 1.0, 2.0}, {1.0}).has_value());
    EXPECT_TRUE(linear->isSolvable());
    EXPECT_DOUBLE_EQ(linear->regularization(), 0.0);

    RbfParameters strict;
    strict.maxRegularizationAttempts = 0;
    auto unsolvable = createSliceAxisInterpolator(InterpolationMethod::Rbf, strict);
    ASSERT_TRUE(unsolvable->prepare({0.0, 1.0, 1.0, 2.0}, {1.0}).has_value());
    EXPECT_FALSE(unsolvable->isSolvable());

    auto regularized = createSliceAxisInterpolator(InterpolationMethod::Rbf);
    ASSERT_TRUE(regularized->prepare({0.0, 1.0, 1.0, 2.0, 3.0}, {1.0}).has_value());
    EXPECT_TRUE(regularized->isSolvable());
    EXPECT_GT(regularized->regularization(), 0.0);
}

TEST(SliceAxisInterpolatorFactoryTest, MethodAndKernelNames) {
    EXPECT_EQ(methodToString(InterpolationMethod::FastLinear), "fast_linear");
    EXPECT_EQ(methodFromString("linear"), InterpolationMethod::FastLinear);
    EXPECT_EQ(methodFromString("rbf"), InterpolationMethod::Rbf);
    EXPECT_FALSE(methodFromString("cubic").has_value());

    for (auto kernel : {RbfKernel::Multiquadric, RbfKernel::InverseMultiquadric,
                        RbfKernel::Gaussian, RbfKernel::Linear,
                        RbfKernel::Cubic, RbfKernel::ThinPlate}) {
        EXPECT_EQ(kernelFromString(kernelToString(kernel)), kernel);
    }
    EXPECT_FALSE(kernelFromString("sinc").has_value());
}
