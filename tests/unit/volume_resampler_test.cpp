// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <vector>

#include "services/resampling/volume_resampler.hpp"

#include "../test_utils/sweep_phantom_generator.hpp"

using namespace sweep_recon;
using namespace sweep_recon::services;
namespace phantom = sweep_recon::test_utils;

namespace {

using VolumeType = VolumeResampler::VolumeType;

float voxel(const VolumeType::Pointer& volume, int x, int y, int k) {
    VolumeType::IndexType idx = {x, y, k};
    return volume->GetPixel(idx);
}

std::vector<float> buffer(const VolumeType::Pointer& volume) {
    auto count = volume->GetLargestPossibleRegion().GetNumberOfPixels();
    const float* data = volume->GetBufferPointer();
    return std::vector<float>(data, data + count);
}

}  // anonymous namespace

// =============================================================================
// Grid and worker helpers
// =============================================================================

TEST(VolumeResamplerGridTest, InclusiveWhenRangeDivides) {
    auto grid = VolumeResampler::buildGrid(0.0, 10.0, 2.5);
    std::vector<double> expected = {0.0, 2.5, 5.0, 7.5, 10.0};
    ASSERT_EQ(grid.size(), expected.size());
    for (std::size_t k = 0; k < grid.size(); ++k) {
        EXPECT_DOUBLE_EQ(grid[k], expected[k]);
    }
}

TEST(VolumeResamplerGridTest, StopsInsideRange) {
    auto grid = VolumeResampler::buildGrid(1.0, 10.0, 2.5);
    ASSERT_EQ(grid.size(), 4u);
    EXPECT_DOUBLE_EQ(grid.front(), 1.0);
    EXPECT_DOUBLE_EQ(grid.back(), 8.5);
}

TEST(VolumeResamplerGridTest, DegenerateRanges) {
    EXPECT_EQ(VolumeResampler::buildGrid(3.0, 3.0, 1.0).size(), 1u);
    EXPECT_TRUE(VolumeResampler::buildGrid(0.0, 5.0, 0.0).empty());
    EXPECT_TRUE(VolumeResampler::buildGrid(5.0, 0.0, 1.0).empty());
}

TEST(VolumeResamplerGridTest, WorkerCountResolution) {
    EXPECT_EQ(VolumeResampler::resolveWorkerCount(3), 3);
    EXPECT_GE(VolumeResampler::resolveWorkerCount(0), 1);
}

TEST(VolumeResamplerParametersTest, Validation) {
    VolumeResampler::Parameters params;
    EXPECT_TRUE(params.isValid());
    EXPECT_DOUBLE_EQ(params.thickness, 2.5);
    EXPECT_EQ(params.method, InterpolationMethod::FastLinear);

    params.thickness = 0.0;
    EXPECT_FALSE(params.isValid());

    params = {};
    params.workers = -1;
    EXPECT_FALSE(params.isValid());

    params = {};
    EXPECT_EQ(params.inPlaneInterpolation, IsotropicResampler::Interpolation::Linear);
    EXPECT_EQ(params.splineOrder, 3u);
    params.splineOrder = 6;
    EXPECT_FALSE(params.isValid());
}

// =============================================================================
// Resampling of a ramp phantom
// =============================================================================

class VolumeResamplerRampTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (int i = 0; i < 10; ++i) {
            positions_.push_back(static_cast<double>(i));
            states_.push_back(i % 2);
        }
        sequence_ = phantom::createRampSequence(positions_, kWidth, kHeight);
        assignment_ = phantom::makeAssignment(states_, 2);
        params_.thickness = 1.5;
        params_.isotropicInPlane = false;
        params_.workers = 2;
    }

    static constexpr int kWidth = 6;
    static constexpr int kHeight = 5;

    std::vector<double> positions_;
    std::vector<int> states_;
    core::SliceSequence sequence_;
    StateAssignment assignment_;
    VolumeResampler::Parameters params_;
    VolumeResampler resampler_;
};

TEST_F(VolumeResamplerRampTest, CommonGridForAllStates) {
    auto result = resampler_.resample(sequence_, assignment_, params_);
    ASSERT_TRUE(result.has_value()) << result.error().toString();
    EXPECT_TRUE(result->isComplete());

    ASSERT_EQ(result->gridPositions.size(), 7u);  // 0, 1.5, ..., 9
    ASSERT_EQ(result->states.size(), 2u);
    for (const auto& state : result->states) {
        auto size = state.volume->GetLargestPossibleRegion().GetSize();
        EXPECT_EQ(size[0], static_cast<unsigned>(kWidth));
        EXPECT_EQ(size[1], static_cast<unsigned>(kHeight));
        EXPECT_EQ(size[2], 7u);
        EXPECT_DOUBLE_EQ(state.volume->GetSpacing()[2], 1.5);
        EXPECT_EQ(state.sliceCount, 5u);
        EXPECT_EQ(state.distinctPositions, 5u);
        EXPECT_EQ(state.method, InterpolationMethod::FastLinear);
        EXPECT_EQ(state.fallbackPixels, 0u);
    }
}

TEST_F(VolumeResamplerRampTest, LinearExactInsideAndClampedOutside) {
    auto result = resampler_.resample(sequence_, assignment_, params_);
    ASSERT_TRUE(result.has_value());

    // State 0 covers positions 0..8, state 1 covers 1..9
    const auto& even = result->states[0].volume;
    const auto& odd = result->states[1].volume;
    for (std::size_t k = 0; k < result->gridPositions.size(); ++k) {
        double z = result->gridPositions[k];
        double zEven = std::min(z, 8.0);
        double zOdd = std::max(z, 1.0);
        for (int y = 0; y < kHeight; ++y) {
            for (int x = 0; x < kWidth; ++x) {
                EXPECT_NEAR(voxel(even, x, y, static_cast<int>(k)),
                            phantom::rampValue(zEven, x), 1e-4);
                EXPECT_NEAR(voxel(odd, x, y, static_cast<int>(k)),
                            phantom::rampValue(zOdd, x), 1e-4);
            }
        }
    }
}

TEST_F(VolumeResamplerRampTest, IndependentOfWorkerCount) {
    params_.workers = 1;
    auto single = resampler_.resample(sequence_, assignment_, params_);
    ASSERT_TRUE(single.has_value());

    for (int workers : {2, 3, 8}) {
        params_.workers = workers;
        auto parallel = resampler_.resample(sequence_, assignment_, params_);
        ASSERT_TRUE(parallel.has_value());
        for (std::size_t s = 0; s < single->states.size(); ++s) {
            EXPECT_EQ(buffer(single->states[s].volume), buffer(parallel->states[s].volume))
                << "workers=" << workers << " state=" << s;
        }
    }
}

TEST_F(VolumeResamplerRampTest, UnassignedSlicesExcludedFromGrid) {
    assignment_.stateOfSlice[9] = StateAssignment::kUnassigned;
    assignment_.retainedSlices.pop_back();

    auto result = resampler_.resample(sequence_, assignment_, params_);
    ASSERT_TRUE(result.has_value());
    EXPECT_DOUBLE_EQ(result->gridPositions.back(), 7.5);
    EXPECT_EQ(result->states[1].sliceCount, 4u);
}

TEST_F(VolumeResamplerRampTest, OriginFollowsGridStart) {
    for (auto& slice : sequence_.slices) {
        slice.position += 2.0;
    }
    sequence_.origin = {1.0, 2.0, 3.0};

    auto result = resampler_.resample(sequence_, assignment_, params_);
    ASSERT_TRUE(result.has_value());
    auto origin = result->states[0].volume->GetOrigin();
    EXPECT_DOUBLE_EQ(origin[0], 1.0);
    EXPECT_DOUBLE_EQ(origin[1], 2.0);
    EXPECT_DOUBLE_EQ(origin[2], 5.0);
}

TEST_F(VolumeResamplerRampTest, IsotropicInPlaneSpacing) {
    params_.thickness = 2.0;
    params_.isotropicInPlane = true;

    auto result = resampler_.resample(sequence_, assignment_, params_);
    ASSERT_TRUE(result.has_value());
    for (const auto& state : result->states) {
        auto spacing = state.volume->GetSpacing();
        EXPECT_DOUBLE_EQ(spacing[0], 2.0);
        EXPECT_DOUBLE_EQ(spacing[1], 2.0);
        EXPECT_DOUBLE_EQ(spacing[2], 2.0);
        auto size = state.volume->GetLargestPossibleRegion().GetSize();
        EXPECT_EQ(size[0], 3u);
        EXPECT_EQ(size[1], 3u);
        EXPECT_EQ(size[2], result->gridPositions.size());
    }
}

TEST_F(VolumeResamplerRampTest, ProgressReportedPerState) {
    std::vector<double> progress;
    resampler_.setProgressCallback([&progress](double p) { progress.push_back(p); });

    auto result = resampler_.resample(sequence_, assignment_, params_);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(progress.size(), 2u);
    EXPECT_DOUBLE_EQ(progress[0], 0.5);
    EXPECT_DOUBLE_EQ(progress[1], 1.0);
}

TEST_F(VolumeResamplerRampTest, ProgressCoversInPlaneStep) {
    params_.isotropicInPlane = true;  // 1.0 mm in-plane -> 1.5 mm
    std::vector<double> progress;
    resampler_.setProgressCallback([&progress](double p) { progress.push_back(p); });

    auto result = resampler_.resample(sequence_, assignment_, params_);
    ASSERT_TRUE(result.has_value());
    ASSERT_GT(progress.size(), 2u);
    EXPECT_TRUE(std::is_sorted(progress.begin(), progress.end()));
    EXPECT_GE(progress.front(), 0.0);
    EXPECT_DOUBLE_EQ(progress.back(), 1.0);
    EXPECT_NE(std::find(progress.begin(), progress.end(), 0.5), progress.end());
}

TEST_F(VolumeResamplerRampTest, InPlaneInterpolationSelectable) {
    params_.isotropicInPlane = true;  // output column 1 lies at x = 1.5 mm

    auto linear = resampler_.resample(sequence_, assignment_, params_);
    ASSERT_TRUE(linear.has_value());
    EXPECT_NEAR(voxel(linear->states[0].volume, 1, 1, 0), 1.5f, 1e-4);

    params_.inPlaneInterpolation = IsotropicResampler::Interpolation::NearestNeighbor;
    auto nearest = resampler_.resample(sequence_, assignment_, params_);
    ASSERT_TRUE(nearest.has_value());
    float v = voxel(nearest->states[0].volume, 1, 1, 0);
    EXPECT_NEAR(v, std::round(v), 1e-4);
    EXPECT_GE(v, 1.0f);
    EXPECT_LE(v, 2.0f);

    params_.inPlaneInterpolation = IsotropicResampler::Interpolation::BSpline;
    params_.splineOrder = 3;
    auto spline = resampler_.resample(sequence_, assignment_, params_);
    ASSERT_TRUE(spline.has_value());
    // Mirror boundary conditions bend the spline slightly near the border
    EXPECT_NEAR(voxel(spline->states[0].volume, 1, 1, 0), 1.5f, 0.5);
}

TEST_F(VolumeResamplerRampTest, RbfNearExactAtSamplePositions) {
    params_.method = InterpolationMethod::Rbf;
    params_.thickness = 2.0;  // grid 0, 2, ..., 8 hits every even position

    auto result = resampler_.resample(sequence_, assignment_, params_);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->method, InterpolationMethod::Rbf);

    const auto& even = result->states[0];
    EXPECT_EQ(even.method, InterpolationMethod::Rbf);
    EXPECT_EQ(even.fallbackPixels, 0u);
    for (std::size_t k = 0; k < result->gridPositions.size(); ++k) {
        for (int x = 0; x < kWidth; ++x) {
            EXPECT_NEAR(voxel(even.volume, x, 2, static_cast<int>(k)),
                        phantom::rampValue(result->gridPositions[k], x), 1e-2);
        }
    }
}

TEST_F(VolumeResamplerRampTest, UnsolvableRbfFallsBackToLinear) {
    // Two acquisitions of every position in one state make the system singular
    std::vector<double> positions;
    std::vector<int> states;
    for (int i = 0; i < 10; ++i) {
        positions.push_back(static_cast<double>(i / 2));
        states.push_back(0);
    }
    auto sequence = phantom::createRampSequence(positions, kWidth, kHeight);
    auto assignment = phantom::makeAssignment(states, 1);

    params_.method = InterpolationMethod::Rbf;
    params_.rbf.maxRegularizationAttempts = 0;
    params_.thickness = 1.0;

    auto result = resampler_.resample(sequence, assignment, params_);
    ASSERT_TRUE(result.has_value());
    const auto& state = result->states[0];
    EXPECT_EQ(state.fallbackPixels, static_cast<std::size_t>(kWidth * kHeight));
    EXPECT_EQ(state.distinctPositions, 5u);
    EXPECT_TRUE(state.isComplete());
    for (std::size_t k = 0; k < result->gridPositions.size(); ++k) {
        EXPECT_NEAR(voxel(state.volume, 1, 1, static_cast<int>(k)),
                    phantom::rampValue(result->gridPositions[k], 1), 1e-4);
    }
}

// =============================================================================
// Errors
// =============================================================================

TEST_F(VolumeResamplerRampTest, InvalidThicknessRejected) {
    params_.thickness = -1.0;
    auto result = resampler_.resample(sequence_, assignment_, params_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ReconError::Code::InvalidConfiguration);
}

TEST_F(VolumeResamplerRampTest, AssignmentSizeMismatchRejected) {
    assignment_.stateOfSlice.pop_back();
    auto result = resampler_.resample(sequence_, assignment_, params_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ReconError::Code::InvalidInput);
}

TEST_F(VolumeResamplerRampTest, EmptyStateRejected) {
    assignment_.nStates = 3;
    auto result = resampler_.resample(sequence_, assignment_, params_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ReconError::Code::ClassificationImbalance);
}

TEST_F(VolumeResamplerRampTest, NothingAssignedRejected) {
    auto none = phantom::makeAssignment(
        std::vector<int>(positions_.size(), StateAssignment::kUnassigned), 2);
    auto result = resampler_.resample(sequence_, none, params_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ReconError::Code::InvalidInput);
}

TEST_F(VolumeResamplerRampTest, StateOutOfRangeRejected) {
    auto grid = VolumeResampler::buildGrid(0.0, 9.0, 1.5);
    auto result = resampler_.resampleState(sequence_, assignment_, 5, grid, params_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ReconError::Code::InvalidInput);
}
