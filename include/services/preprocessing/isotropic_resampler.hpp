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

#pragma once

#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <itkImage.h>
#include <itkSmartPointer.h>

#include "core/recon_error.hpp"

namespace sweep_recon::services {

/**
 * @brief In-plane resampling of reconstructed state volumes
 *
 * The slice-axis interpolation already places samples at the requested
 * thickness. This filter brings the two in-plane axes to the same spacing
 * (e.g. 1.2x1.2x2.5 mm to 2.5x2.5x2.5 mm) so every state volume ends up
 * isotropic. The slice axis keeps its size and spacing.
 *
 * Uses ITK's ResampleImageFilter with an identity transform:
 * - Nearest Neighbor: preserves discrete values
 * - Linear: general purpose (default)
 * - B-Spline: smoother result at a higher cost
 *
 * @example
 * @code
 * IsotropicResampler resampler;
 *
 * IsotropicResampler::Parameters params;
 * params.targetSpacing = 2.5;
 * if (IsotropicResampler::needsResampling(volume, params.targetSpacing)) {
 *     auto result = resampler.resample(volume, params);
 *     if (result) {
 *         volume = result.value();
 *     }
 * }
 * @endcode
 */
class IsotropicResampler {
public:
    /// Input/Output volume type
    using VolumeType = itk::Image<float, 3>;

    /// Progress callback (0.0 to 1.0)
    using ProgressCallback = std::function<void(double progress)>;

    /**
     * @brief Interpolation method for resampling
     */
    enum class Interpolation {
        NearestNeighbor,  ///< Discrete values
        Linear,           ///< General purpose (default)
        BSpline           ///< Smoother, slower
    };

    /**
     * @brief Parameters for in-plane resampling
     */
    struct Parameters {
        /// Target in-plane spacing in mm
        double targetSpacing = 2.5;

        /// Interpolation method
        Interpolation interpolation = Interpolation::Linear;

        /// Default pixel value for out-of-bounds regions
        double defaultValue = 0.0;

        /// B-spline order (only used when interpolation is BSpline)
        /// Range: 2 to 5
        unsigned int splineOrder = 3;

        /**
         * @brief Validate parameters
         * @return true if parameters are valid
         */
        [[nodiscard]] bool isValid() const noexcept {
            if (!(targetSpacing > 0.0)) {
                return false;
            }
            if (splineOrder < 2 || splineOrder > 5) {
                return false;
            }
            return true;
        }
    };

    IsotropicResampler();
    ~IsotropicResampler();

    // Non-copyable, movable
    IsotropicResampler(const IsotropicResampler&) = delete;
    IsotropicResampler& operator=(const IsotropicResampler&) = delete;
    IsotropicResampler(IsotropicResampler&&) noexcept;
    IsotropicResampler& operator=(IsotropicResampler&&) noexcept;

    /**
     * @brief Set progress callback for long operations
     * @param callback Callback function receiving progress (0.0 to 1.0)
     */
    void setProgressCallback(ProgressCallback callback);

    /**
     * @brief Resample the in-plane axes to the target spacing
     *
     * Output in-plane size is ceil(size * spacing / targetSpacing), at least 1.
     * Origin, direction and the slice axis are copied from the input.
     *
     * @param input 3D volume, slice axis last
     * @param params Resampling parameters
     * @return Resampled volume on success, error on failure
     */
    [[nodiscard]] std::expected<VolumeType::Pointer, ReconError>
    resample(VolumeType::Pointer input, const Parameters& params) const;

    /**
     * @brief Check if a volume's in-plane spacing needs resampling
     *
     * Returns true if either in-plane spacing differs from the target by
     * more than 1%.
     *
     * @param input Volume to check
     * @param targetSpacing Target spacing in mm
     * @return true if resampling is recommended
     */
    [[nodiscard]] static bool needsResampling(VolumeType::Pointer input,
                                              double targetSpacing);

    /**
     * @brief Get string representation of interpolation method
     * @param interp Interpolation method
     * @return Human-readable string
     */
    [[nodiscard]] static std::string interpolationToString(Interpolation interp);

    /// Configuration name of an interpolation method ("nearest", "linear", "bspline")
    [[nodiscard]] static std::string interpolationName(Interpolation interp);

    /// Parse a configuration name, nullopt if unknown
    [[nodiscard]] static std::optional<Interpolation>
    interpolationFromName(const std::string& name);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace sweep_recon::services
