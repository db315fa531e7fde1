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
 * @file respiration_estimator.hpp
 * @brief Image-based respiration surrogate estimation for sweep acquisitions
 * @details Derives one respiration surrogate per acquired slice from image
 *          content alone. Slices are grouped by slice-axis position so that
 *          anatomy changing along the sweep is removed before the per-slice
 *          feature trace is filtered and normalized.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <cstddef>
#include <expected>
#include <map>
#include <memory>
#include <vector>

#include "core/recon_error.hpp"
#include "core/slice_sequence.hpp"
#include "services/respiration/respiration_types.hpp"

namespace sweep_recon::services {

/**
 * @brief Mapping from slice-axis position bin to the slices acquired there
 *
 * Built once from a sorted sequence. Each bin lists sequence indices in
 * acquisition order.
 */
struct PositionIndex {
    double binWidth = 0.0;
    double originPosition = 0.0;
    std::map<long, std::vector<std::size_t>> bins;

    /// Bin key of one position
    [[nodiscard]] long keyOf(double position) const;

    /// Number of visits of a bin, 0 if the key is unknown
    [[nodiscard]] std::size_t visitsOf(long key) const;
};

/**
 * @brief Respiration surrogate estimation
 *
 * Processing chain:
 * 1. Respiratory ROI: column band with the highest energy in the
 *    0.15-0.4 Hz band (only when the sampling rate is known, either from
 *    the parameters or from the frame interval of the sequence)
 * 2. Feature per slice inside the ROI (body area by default)
 * 3. Per-position centering; positions visited fewer than
 *    minVisitsPerPosition times are filled from temporal neighbours
 * 4. Moving-average detrend removing drift slower than the respiratory band
 * 5. Bounded-lag Gaussian smoothing
 * 6. Normalization to [-1, 1]
 *
 * Image axis 1 is assumed to run anterior-posterior, so the body area
 * and centroid features follow chest wall and diaphragm motion.
 *
 * @example
 * @code
 * RespirationEstimator estimator;
 * RespirationEstimator::Parameters params;
 * params.samplingRateHz = 2.5;
 *
 * auto signal = estimator.estimate(sequence, params);
 * if (signal) {
 *     RespirationEstimator::annotate(sequence, signal.value());
 * }
 * @endcode
 */
class RespirationEstimator {
public:
    /**
     * @brief Parameters for respiration estimation
     */
    struct Parameters {
        /// Image feature used as surrogate
        SurrogateFeature feature = SurrogateFeature::BodyArea;

        /// Position bin width in mm (0 = nominal slice spacing of the sequence)
        double positionBinWidth = 0.0;

        /// Minimum visits for a position to form a usable local trace
        int minVisitsPerPosition = 3;

        /// Restrict the feature to the column band with respiratory content
        bool detectRespiratoryRoi = true;

        /// Frame rate of the acquisition in Hz (0 = take it from the sequence)
        double samplingRateHz = 0.0;

        /// Fraction of the image width kept by the ROI
        double roiFraction = respiration_constants::kRoiFraction;

        /// Median filter radius applied before body-area thresholding
        unsigned int medianRadius = 2;

        /// Moving-average detrend window in samples
        /// (kAutoTrendWindow = one period of the slowest respiratory rate,
        /// 0 = disabled)
        int trendWindow = respiration_constants::kAutoTrendWindow;

        /// Gaussian smoothing sigma in samples (0 = disabled)
        double smoothingSigma = 1.0;

        [[nodiscard]] bool isValid() const noexcept {
            if (positionBinWidth < 0.0 || minVisitsPerPosition < 1) {
                return false;
            }
            if (roiFraction <= 0.0 || roiFraction > 1.0) {
                return false;
            }
            if (samplingRateHz < 0.0 || smoothingSigma < 0.0) {
                return false;
            }
            if (trendWindow < respiration_constants::kAutoTrendWindow) {
                return false;
            }
            return medianRadius <= 10;
        }
    };

    RespirationEstimator();
    ~RespirationEstimator();

    // Non-copyable, movable
    RespirationEstimator(const RespirationEstimator&) = delete;
    RespirationEstimator& operator=(const RespirationEstimator&) = delete;
    RespirationEstimator(RespirationEstimator&&) noexcept;
    RespirationEstimator& operator=(RespirationEstimator&&) noexcept;

    /**
     * @brief Estimate the respiration surrogate of every slice
     *
     * @param sequence Time-sorted slice sequence
     * @param params Estimation parameters
     * @return Total signal (one value per slice) or InvalidInput /
     *         InvalidConfiguration / ProcessingFailed
     */
    [[nodiscard]] std::expected<RespirationSignal, ReconError>
    estimate(const core::SliceSequence& sequence, const Parameters& params) const;

    /**
     * @brief Estimate with default parameters
     */
    [[nodiscard]] std::expected<RespirationSignal, ReconError>
    estimate(const core::SliceSequence& sequence) const;

    /**
     * @brief Find the column band with the strongest respiratory content
     *
     * Falls back to the full image width when the sampling rate is unknown
     * or the sequence is too short for a spectral estimate.
     */
    [[nodiscard]] RespiratoryRoi detectRespiratoryRoi(
        const core::SliceSequence& sequence, const Parameters& params) const;

    /**
     * @brief Body mask of every slice as used by the body-area feature
     *
     * Background is the median-filtered region below the edge-row threshold
     * that is connected to the first or last image row; everything else is
     * body. Columns outside the ROI, less an edge margin on each side, are
     * zero. Mask pixels are 1 (body) or 0.
     *
     * @return One mask per slice, or InvalidInput / ProcessingFailed
     */
    [[nodiscard]] std::expected<std::vector<core::Slice::ImageType::Pointer>, ReconError>
    bodyMasks(const core::SliceSequence& sequence, const RespiratoryRoi& roi,
              const Parameters& params) const;

    /// Frame rate from the parameters, else from the sequence (0 = unknown)
    [[nodiscard]] static double effectiveSamplingRate(
        const core::SliceSequence& sequence, const Parameters& params) noexcept;

    /**
     * @brief Detrend window in samples for a given frame rate
     *
     * kAutoTrendWindow resolves to one period of the slowest respiratory
     * rate (at least 3 samples), or kDefaultTrendWindow when the rate is
     * unknown. Other values are returned as is.
     */
    [[nodiscard]] static int resolveTrendWindow(int trendWindow,
                                                double samplingRateHz) noexcept;

    /**
     * @brief Copy the surrogate of each sample into the matching slice
     */
    static void annotate(core::SliceSequence& sequence,
                         const RespirationSignal& signal);

    /**
     * @brief Group slices by position bin
     * @param binWidth Bin width in mm (must be > 0)
     */
    [[nodiscard]] static PositionIndex buildPositionIndex(
        const core::SliceSequence& sequence, double binWidth);

    /**
     * @brief Fill invalid entries by linear interpolation over the index
     *
     * Entries before the first or after the last valid entry take the
     * nearest valid value. Returns the input unchanged if nothing is valid.
     */
    [[nodiscard]] static std::vector<double> fillGaps(
        const std::vector<double>& values, const std::vector<bool>& valid);

    /// Subtract a centred moving average of the given window
    [[nodiscard]] static std::vector<double> removeTrend(
        const std::vector<double>& values, int window);

    /// Truncated Gaussian smoothing, radius ceil(3 sigma)
    [[nodiscard]] static std::vector<double> smooth(
        const std::vector<double>& values, double sigma);

    /// Linear map to [-1, 1]; a constant trace maps to 0
    [[nodiscard]] static std::vector<double> normalize(
        const std::vector<double>& values);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace sweep_recon::services
