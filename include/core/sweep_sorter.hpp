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
 * @file sweep_sorter.hpp
 * @brief Conversion of raw 4D sweep data into a time-ordered slice sequence
 * @details The scanner stores a sweep as (x, y, slice, dynamic): the slice
 *          location advances slowly while D dynamics are acquired at each
 *          nominal location. Frames are acquired dynamic-fastest, so frame
 *          (s, d) has acquisition index s * D + d. Because the table moves
 *          continuously, the frame sits at s * dz + d * dz / D along the
 *          slice axis rather than at the nominal location s * dz.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <expected>

#include <itkImage.h>

#include "core/recon_error.hpp"
#include "core/slice_sequence.hpp"

namespace sweep_recon::core {

/**
 * @brief Sorting of sweep frames into acquisition order
 *
 * @example
 * @code
 * auto raw = VolumeIO::readVolume4D("IMG_4D.nii.gz");
 * if (raw) {
 *     auto sequence = SweepSorter::sort(raw.value());
 * }
 * @endcode
 */
class SweepSorter {
public:
    using Volume4DType = itk::Image<float, 4>;

    /**
     * @brief Parameters for sorting
     */
    struct Parameters {
        /// Distance between nominal slice locations in mm (0 = third axis spacing)
        double sliceSpacing = 0.0;

        /// Spread the dynamics of a location over the next slice interval
        bool continuousSweep = true;

        [[nodiscard]] bool isValid() const noexcept {
            return sliceSpacing >= 0.0;
        }
    };

    /**
     * @brief Split a 4D sweep into slices in acquisition order
     *
     * @param volume Raw (x, y, slice, dynamic) volume
     * @param params Sorting parameters
     * @return Sequence, or InvalidInput for a null or empty volume
     */
    [[nodiscard]] static std::expected<SliceSequence, ReconError>
    sort(const Volume4DType::Pointer& volume, const Parameters& params);

    [[nodiscard]] static std::expected<SliceSequence, ReconError>
    sort(const Volume4DType::Pointer& volume);

    /// Acquisition index of frame (slice, dynamic)
    [[nodiscard]] static int acquisitionIndex(int slice, int dynamic,
                                              int dynamicsPerPosition) noexcept {
        return slice * dynamicsPerPosition + dynamic;
    }
};

}  // namespace sweep_recon::core
