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
 * @file recon_config.hpp
 * @brief Run configuration for the reconstruction pipeline
 * @details Every option of a run, with JSON persistence. Command line flags
 *          are applied on top of a loaded file by the application.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <expected>
#include <filesystem>
#include <string>

#include "core/recon_error.hpp"
#include "services/preprocessing/isotropic_resampler.hpp"
#include "services/resampling/resampling_types.hpp"
#include "services/respiration/respiration_types.hpp"

namespace sweep_recon::core {

/**
 * @brief Reconstruction run configuration
 *
 * JSON keys use snake_case (e.g. "n_states", "disable_crop"). Missing keys
 * keep their defaults.
 */
struct ReconConfig {
    /// Output slice thickness and isotropic spacing in mm
    double thickness = 2.5;

    /// Number of respiration states
    int nStates = 4;

    /// Recompute the respiration signal even if a cached one exists
    bool redo = false;

    /// Keep slices outside the stable respiration range
    bool disableCrop = false;

    services::InterpolationMethod interpolation =
        services::InterpolationMethod::FastLinear;

    /// Worker tasks for resampling (0 = hardware concurrency - 1)
    int workers = 0;

    std::filesystem::path outputDirectory = ".";

    /// Frame rate in Hz (0 = unknown)
    double samplingRateHz = 0.0;

    services::SurrogateFeature feature = services::SurrogateFeature::BodyArea;
    services::RbfKernel rbfKernel = services::RbfKernel::Multiquadric;

    /// RBF shape parameter in mm (0 = mean sample spacing)
    double rbfEpsilon = 0.0;

    /// Surrogate smoothing sigma in samples
    double smoothingSigma = 1.0;

    /// Moving-average detrend window in samples
    /// (-1 = derived from the sampling rate, 0 = disabled)
    int trendWindow = services::respiration_constants::kAutoTrendWindow;

    int minVisitsPerPosition = 3;
    double cropMadFactor = 2.5;

    /// Bring in-plane spacing to the thickness as well
    bool isotropicInPlane = true;

    /// Interpolation of the in-plane resampling step
    services::IsotropicResampler::Interpolation inPlaneInterpolation =
        services::IsotropicResampler::Interpolation::Linear;

    /// B-spline order of the in-plane step, 2 to 5
    unsigned int splineOrder = 3;

    /// Write the cropped stack and body masks next to the sorted stack
    bool writeQcImages = true;

    /// trace, debug, info, warning, error, critical or off
    std::string logLevel = "info";

    /// Directory of the rotating log file (empty = console only)
    std::filesystem::path logDirectory;

    /**
     * @brief Check every option
     * @return InvalidConfiguration naming the first offending option
     */
    [[nodiscard]] std::expected<void, ReconError> validate() const;

    [[nodiscard]] bool isValid() const { return validate().has_value(); }

    /// Serialize to a pretty-printed JSON document
    [[nodiscard]] std::string toJsonString() const;

    /**
     * @brief Parse a JSON document
     * @return InvalidConfiguration on malformed JSON, unknown enum names or
     *         invalid values
     */
    [[nodiscard]] static std::expected<ReconConfig, ReconError>
    fromJsonString(const std::string& text);

    /**
     * @brief Load a configuration file
     * @return IoError if the file cannot be read
     */
    [[nodiscard]] static std::expected<ReconConfig, ReconError>
    load(const std::filesystem::path& filePath);

    /**
     * @brief Write the configuration to a file
     */
    [[nodiscard]] std::expected<void, ReconError>
    save(const std::filesystem::path& filePath) const;
};

}  // namespace sweep_recon::core
