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
 * @file volume_resampler.hpp
 * @brief Reconstruction of one regular 3D volume per respiration state
 * @details Slices of a state sit at irregular, often duplicated slice-axis
 *          positions. Every in-plane pixel is interpolated along the slice
 *          axis onto a regular grid at the requested thickness. The grid is
 *          shared by all states of a run, so state volumes line up voxel for
 *          voxel and can be stacked into a 4D volume.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <expected>
#include <functional>
#include <memory>
#include <vector>

#include <itkImage.h>

#include "core/recon_error.hpp"
#include "core/slice_sequence.hpp"
#include "services/preprocessing/isotropic_resampler.hpp"
#include "services/resampling/resampling_types.hpp"
#include "services/respiration/respiration_types.hpp"

namespace sweep_recon::services {

/**
 * @brief Per-state slice-axis resampling
 *
 * Grid: z_k = zMin + k * thickness for k = 0..K-1, where [zMin, zMax] is the
 * position range of all retained slices and
 * K = floor((zMax - zMin) / thickness) + 1. Grid points outside a state's
 * own sample range take the value of the nearest end sample.
 *
 * Pixels are split into contiguous row bands, one std::async task per band.
 * Bands write disjoint parts of the output, so the result does not depend on
 * the worker count or on completion order. A band that throws is counted in
 * ResampledState::failedPartitions and left at zero.
 *
 * @example
 * @code
 * VolumeResampler resampler;
 * VolumeResampler::Parameters params;
 * params.thickness = 2.5;
 * params.method = InterpolationMethod::FastLinear;
 *
 * auto result = resampler.resample(sequence, assignment, params);
 * if (result) {
 *     for (const auto& state : result->states) {
 *         // state.volume spacing is 2.5 mm on every axis
 *     }
 * }
 * @endcode
 */
class VolumeResampler {
public:
    using VolumeType = ResampledState::VolumeType;

    /// Progress callback (0.0 to 1.0)
    using ProgressCallback = std::function<void(double progress)>;

    /**
     * @brief Parameters for volume resampling
     */
    struct Parameters {
        /// Output slice thickness (and isotropic spacing) in mm
        double thickness = 2.5;

        /// Slice-axis interpolation method
        InterpolationMethod method = InterpolationMethod::FastLinear;

        /// RBF settings (only used when method is Rbf)
        RbfParameters rbf;

        /// Worker tasks per state (0 = hardware concurrency - 1, at least 1)
        int workers = 0;

        /// Resample the in-plane axes to the thickness as well
        bool isotropicInPlane = true;

        /// Interpolation of the in-plane step
        IsotropicResampler::Interpolation inPlaneInterpolation =
            IsotropicResampler::Interpolation::Linear;

        /// B-spline order of the in-plane step, 2 to 5
        unsigned int splineOrder = 3;

        [[nodiscard]] bool isValid() const noexcept {
            if (!(thickness > 0.0)) {
                return false;
            }
            if (workers < 0) {
                return false;
            }
            if (splineOrder < 2 || splineOrder > 5) {
                return false;
            }
            return rbf.isValid();
        }
    };

    VolumeResampler();
    ~VolumeResampler();

    // Non-copyable, movable
    VolumeResampler(const VolumeResampler&) = delete;
    VolumeResampler& operator=(const VolumeResampler&) = delete;
    VolumeResampler(VolumeResampler&&) noexcept;
    VolumeResampler& operator=(VolumeResampler&&) noexcept;

    /**
     * @brief Set progress callback
     *
     * Invoked once per finished state, and during the in-plane step of each
     * state that needs one (covering the second half of that state's share).
     *
     * @param callback Callback function receiving progress (0.0 to 1.0)
     */
    void setProgressCallback(ProgressCallback callback);

    /**
     * @brief Reconstruct every state of an assignment
     *
     * @param sequence Sorted slice sequence
     * @param assignment State of every slice (kUnassigned slices are skipped)
     * @param params Resampling parameters
     * @return One volume per state on a common grid, or InvalidConfiguration /
     *         InvalidInput / ProcessingFailed
     */
    [[nodiscard]] std::expected<ResamplingResult, ReconError>
    resample(const core::SliceSequence& sequence,
             const StateAssignment& assignment,
             const Parameters& params) const;

    /**
     * @brief Reconstruct a single state on a given grid
     *
     * No in-plane resampling is applied.
     *
     * @param sequence Sorted slice sequence
     * @param assignment State of every slice
     * @param state State to reconstruct
     * @param gridPositions Slice-axis grid, mm from the sequence origin
     * @param params Resampling parameters
     */
    [[nodiscard]] std::expected<ResampledState, ReconError>
    resampleState(const core::SliceSequence& sequence,
                  const StateAssignment& assignment,
                  int state,
                  const std::vector<double>& gridPositions,
                  const Parameters& params) const;

    /**
     * @brief Regular grid from zMin with the given step, covering zMax
     *        up to rounding
     */
    [[nodiscard]] static std::vector<double> buildGrid(double zMin, double zMax,
                                                       double thickness);

    /**
     * @brief Effective number of worker tasks
     * @param requested Requested workers, 0 for the hardware default
     */
    [[nodiscard]] static int resolveWorkerCount(int requested) noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace sweep_recon::services
