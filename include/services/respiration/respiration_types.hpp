/**
 * @file respiration_types.hpp
 * @brief Respiration signal and state assignment types
 * @details Shared data types for the respiration estimator and the state
 *          classifier: the per-slice surrogate trace, the discrete state
 *          assignment and the optional slice-axis crop region.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sweep_recon::services {

/**
 * @brief Image feature used as respiration surrogate
 */
enum class SurrogateFeature {
    BodyArea,              ///< Pixels above the background threshold
    IntensityCentroid,     ///< Intensity-weighted centroid along image axis 1
    ReferenceCorrelation   ///< NCC against the first visit of the same position
};

/**
 * @brief One surrogate sample
 */
struct RespirationSample {
    int acquisitionIndex = 0;
    double surrogate = 0.0;
};

/**
 * @brief In-plane column band carrying the strongest respiratory content
 */
struct RespiratoryRoi {
    std::size_t startColumn = 0;
    std::size_t columnCount = 0;

    [[nodiscard]] std::size_t endColumn() const noexcept {
        return startColumn + columnCount;
    }
};

/**
 * @brief Respiration surrogate trace aligned 1:1 with a SliceSequence
 *
 * Samples are ordered by acquisition index. Every slice has a value;
 * slices whose position was visited too rarely carry an interpolated
 * value and are listed in gapFilledIndices.
 */
struct RespirationSignal {
    std::vector<RespirationSample> samples;

    /// Feature value per slice before centering, filtering and normalization
    std::vector<double> rawFeature;

    /// Acquisition indices whose surrogate was interpolated from neighbours
    std::vector<int> gapFilledIndices;

    /// Column band the feature was measured in
    RespiratoryRoi roi;

    /// Frame rate used for ROI detection and detrending (0 = unknown)
    double samplingRateHz = 0.0;

    /// Detrend window applied, in samples (0 = none)
    int trendWindow = 0;

    [[nodiscard]] std::size_t size() const noexcept { return samples.size(); }
    [[nodiscard]] bool empty() const noexcept { return samples.empty(); }

    /// Surrogate values in acquisition order
    [[nodiscard]] std::vector<double> values() const {
        std::vector<double> out;
        out.reserve(samples.size());
        for (const auto& s : samples) {
            out.push_back(s.surrogate);
        }
        return out;
    }
};

/**
 * @brief Contiguous range of slice-axis positions retained for processing
 */
struct CropRegion {
    double minPosition = 0.0;  ///< mm, inclusive
    double maxPosition = 0.0;  ///< mm, inclusive

    [[nodiscard]] bool contains(double position) const noexcept {
        return position >= minPosition && position <= maxPosition;
    }

    [[nodiscard]] bool isValid() const noexcept {
        return maxPosition >= minPosition;
    }
};

/**
 * @brief Assignment of slices to respiration states
 *
 * stateOfSlice is indexed like the SliceSequence. Slices removed by
 * cropping carry kUnassigned and are absent from retainedSlices.
 */
struct StateAssignment {
    static constexpr int kUnassigned = -1;

    int nStates = 0;
    std::vector<int> stateOfSlice;
    std::vector<std::size_t> retainedSlices;

    /// Lowest surrogate value of states 1..nStates-1
    std::vector<double> thresholds;

    /// Surrogate range kept by stable-range cropping
    std::pair<double, double> stableRange = {0.0, 0.0};
    bool cropApplied = false;

    [[nodiscard]] std::size_t retainedCount() const noexcept {
        return retainedSlices.size();
    }

    /// Sequence indices of the slices in one state, in sequence order
    [[nodiscard]] std::vector<std::size_t> slicesInState(int state) const {
        std::vector<std::size_t> out;
        for (std::size_t i : retainedSlices) {
            if (stateOfSlice[i] == state) {
                out.push_back(i);
            }
        }
        return out;
    }

    /// Number of slices per state
    [[nodiscard]] std::vector<std::size_t> occupancy() const {
        std::vector<std::size_t> counts(static_cast<std::size_t>(std::max(nStates, 0)), 0);
        for (std::size_t i : retainedSlices) {
            int s = stateOfSlice[i];
            if (s >= 0 && s < nStates) {
                ++counts[static_cast<std::size_t>(s)];
            }
        }
        return counts;
    }
};

/// Constants for respiration estimation
namespace respiration_constants {
    /// Respiratory frequency band in Hz
    inline constexpr double kRespirationBandMinHz = 0.15;
    inline constexpr double kRespirationBandMaxHz = 0.4;

    /// Fraction of the image width kept by the respiratory ROI
    inline constexpr double kRoiFraction = 0.4;

    /// Background threshold = mean + k * std of the edge rows
    inline constexpr double kBackgroundStdFactor = 0.5;

    /// Fraction of the ROI width dropped on each side of the body mask
    inline constexpr double kBodyEdgeCropFraction = 0.12;

    /// Detrend window marker: derive the window from the sampling rate
    inline constexpr int kAutoTrendWindow = -1;

    /// Detrend window in samples when the sampling rate is unknown
    inline constexpr int kDefaultTrendWindow = 21;

    /// Scale from MAD to standard deviation for normally distributed data
    inline constexpr double kMadToSigma = 1.4826;
}  // namespace respiration_constants

[[nodiscard]] inline std::string featureToString(SurrogateFeature feature) {
    switch (feature) {
        case SurrogateFeature::BodyArea: return "body_area";
        case SurrogateFeature::IntensityCentroid: return "intensity_centroid";
        case SurrogateFeature::ReferenceCorrelation: return "reference_correlation";
    }
    return "body_area";
}

[[nodiscard]] inline std::optional<SurrogateFeature>
featureFromString(const std::string& str) {
    if (str == "body_area") return SurrogateFeature::BodyArea;
    if (str == "intensity_centroid") return SurrogateFeature::IntensityCentroid;
    if (str == "reference_correlation") return SurrogateFeature::ReferenceCorrelation;
    return std::nullopt;
}

}  // namespace sweep_recon::services
