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
 * @file slice_sequence.hpp
 * @brief Time-ordered stack of 2D slices produced by a sweep acquisition
 * @details A sweep acquisition steps the slice position linearly while
 *          imaging continuously. After sorting, every acquired frame becomes
 *          one Slice carrying its slice-axis position and its acquisition
 *          index. Later stages fill in the respiration surrogate and state.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <vector>

#include <itkImage.h>

namespace sweep_recon::core {

/**
 * @brief One acquired 2D frame
 *
 * Position and image are fixed once the slice is created. The surrogate
 * and state are written by the respiration estimator and the state
 * classifier respectively.
 */
struct Slice {
    using ImageType = itk::Image<float, 2>;

    double position = 0.0;            ///< Offset along the slice axis from the origin, mm
    int acquisitionIndex = 0;         ///< Position in acquisition order
    ImageType::Pointer image;
    std::optional<double> surrogate;  ///< Respiration surrogate
    std::optional<int> state;         ///< Respiration state index
};

/**
 * @brief Ordered slice stack with the source geometry
 */
struct SliceSequence {
    std::vector<Slice> slices;

    /// In-plane pixel spacing (x, y) in mm
    std::array<double, 2> pixelSpacing = {1.0, 1.0};

    /// Distance between nominal slice locations in mm
    double nominalSliceSpacing = 1.0;

    /// Number of dynamics acquired per nominal slice location
    int dynamicsPerPosition = 1;

    /// Time between consecutive acquisitions in seconds (0 = unknown)
    double frameInterval = 0.0;

    /// Origin of the source volume (x, y, z) in mm
    std::array<double, 3> origin = {0.0, 0.0, 0.0};

    /// Row-major 3x3 direction cosines of the source volume
    std::array<double, 9> direction = {1.0, 0.0, 0.0,
                                       0.0, 1.0, 0.0,
                                       0.0, 0.0, 1.0};

    [[nodiscard]] std::size_t size() const noexcept { return slices.size(); }
    [[nodiscard]] bool empty() const noexcept { return slices.empty(); }

    /// Acquisition frame rate in Hz, 0 if the frame interval is unknown
    [[nodiscard]] double samplingRateHz() const noexcept {
        return frameInterval > 0.0 ? 1.0 / frameInterval : 0.0;
    }

    /// In-plane image size (x, y) of the first slice, {0, 0} if empty
    [[nodiscard]] std::array<std::size_t, 2> imageSize() const {
        if (slices.empty() || !slices.front().image) {
            return {0, 0};
        }
        auto size = slices.front().image->GetLargestPossibleRegion().GetSize();
        return {size[0], size[1]};
    }
};

}  // namespace sweep_recon::core
