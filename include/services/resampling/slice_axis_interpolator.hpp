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

/**
 * @file slice_axis_interpolator.hpp
 * @brief Per-pixel scattered-data interpolation along the slice axis
 * @details Both strategies share one contract: irregular slice-axis samples
 *          of a single in-plane pixel in, values on the regular output grid
 *          out. Sample positions are the same for every pixel of a state, so
 *          each strategy does its position-only work once in prepare() and
 *          interpolate() stays cheap and safe to call from many threads.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <cstddef>
#include <expected>
#include <memory>
#include <span>
#include <vector>

#include "core/recon_error.hpp"
#include "services/resampling/resampling_types.hpp"

namespace sweep_recon::services {

/**
 * @brief Interface for slice-axis interpolation strategies
 *
 * Grid points outside the sample range take the value at the nearest end
 * of the range (clamp), for every strategy.
 */
class ISliceAxisInterpolator {
public:
    virtual ~ISliceAxisInterpolator() = default;

    /**
     * @brief Get the method this interpolator implements
     */
    [[nodiscard]] virtual InterpolationMethod method() const noexcept = 0;

    /**
     * @brief Precompute everything that depends on positions only
     *
     * @param samplePositions Sample positions in ascending order, duplicates
     *                        allowed
     * @param gridPositions Output grid positions
     * @return InvalidInput if there are no samples or positions are unsorted
     */
    [[nodiscard]] virtual std::expected<void, ReconError> prepare(
        const std::vector<double>& samplePositions,
        const std::vector<double>& gridPositions) = 0;

    /**
     * @brief Interpolate one pixel
     *
     * @param sampleValues One value per prepared sample position
     * @param gridValues Output, one value per prepared grid position
     * @return false if the pixel could not be solved and needs a fallback
     */
    [[nodiscard]] virtual bool interpolate(
        std::span<const float> sampleValues,
        std::span<float> gridValues) const = 0;

    /// Whether prepare() left every pixel solvable
    [[nodiscard]] virtual bool isSolvable() const noexcept { return true; }

    /// Regularization weight used by the last prepare() (0 = none)
    [[nodiscard]] virtual double regularization() const noexcept { return 0.0; }
};

/**
 * @brief Piecewise linear interpolation
 *
 * Samples sharing a position are averaged. Output at a grid point that
 * coincides with a sample position equals that sample exactly.
 */
class FastLinearInterpolator : public ISliceAxisInterpolator {
public:
    [[nodiscard]] InterpolationMethod method() const noexcept override {
        return InterpolationMethod::FastLinear;
    }

    [[nodiscard]] std::expected<void, ReconError> prepare(
        const std::vector<double>& samplePositions,
        const std::vector<double>& gridPositions) override;

    [[nodiscard]] bool interpolate(std::span<const float> sampleValues,
                                   std::span<float> gridValues) const override;

    /// Number of distinct sample positions after preparation
    [[nodiscard]] std::size_t distinctPositions() const noexcept {
        return groupStart_.empty() ? 0 : groupStart_.size() - 1;
    }

private:
    struct GridWeight {
        std::size_t lower = 0;
        std::size_t upper = 0;
        double weight = 0.0;  ///< Weight of the upper group
    };

    std::vector<std::size_t> groupStart_;  ///< Sample ranges of each position
    std::vector<GridWeight> weights_;
    std::size_t sampleCount_ = 0;
};

/**
 * @brief Radial basis function interpolation
 *
 * Fits sum_j w_j phi(|z - z_j|) through the samples. The N x N system is
 * factored once per state with an SVD; if it is ill-conditioned (for
 * example duplicate positions with conflicting values) Tikhonov
 * regularization Phi + lambda I is applied with lambda growing 100x per
 * attempt. If no attempt succeeds every pixel reports failure so the
 * caller can fall back to linear interpolation.
 *
 * Cost grows with N^3 for the factorization and N per grid point per
 * pixel, typically orders of magnitude above FastLinearInterpolator.
 */
class RbfInterpolator : public ISliceAxisInterpolator {
public:
    explicit RbfInterpolator(RbfParameters params = {});

    [[nodiscard]] InterpolationMethod method() const noexcept override {
        return InterpolationMethod::Rbf;
    }

    [[nodiscard]] std::expected<void, ReconError> prepare(
        const std::vector<double>& samplePositions,
        const std::vector<double>& gridPositions) override;

    [[nodiscard]] bool interpolate(std::span<const float> sampleValues,
                                   std::span<float> gridValues) const override;

    [[nodiscard]] bool isSolvable() const noexcept override { return solvable_; }

    [[nodiscard]] double regularization() const noexcept override { return lambda_; }

    /// Shape parameter used by the last prepare()
    [[nodiscard]] double epsilon() const noexcept { return epsilon_; }

    /// Basis function value at distance r
    [[nodiscard]] static double basis(RbfKernel kernel, double r, double epsilon);

private:
    RbfParameters params_;
    bool solvable_ = false;
    bool constant_ = false;  ///< Single distinct position: output is the mean
    double lambda_ = 0.0;
    double epsilon_ = 1.0;
    std::size_t sampleCount_ = 0;
    std::size_t gridCount_ = 0;

    /// Row-major gridCount x sampleCount operator E * Phi^-1
    std::vector<double> operator_;
};

/**
 * @brief Create the interpolator for a method
 */
[[nodiscard]] std::unique_ptr<ISliceAxisInterpolator>
createSliceAxisInterpolator(InterpolationMethod method,
                            const RbfParameters& rbfParams = {});

}  // namespace sweep_recon::services
