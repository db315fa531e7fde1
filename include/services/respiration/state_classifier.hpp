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
 * @file state_classifier.hpp
 * @brief Equal-occupancy quantization of a respiration signal into states
 * @details Converts the continuous respiration surrogate into n discrete
 *          respiration states with balanced slice counts. Thresholds follow
 *          the empirical distribution of the surrogate (histogram
 *          equalization) rather than equal amplitude steps, so extreme
 *          breathing phases that are visited less often still receive a
 *          full share of slices.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <expected>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "core/recon_error.hpp"
#include "core/slice_sequence.hpp"
#include "services/respiration/respiration_types.hpp"

namespace sweep_recon::services {

/**
 * @brief Respiration state classification
 *
 * Slices are ranked by (surrogate, acquisition index) with a stable sort;
 * the slice of rank r among N retained slices gets state
 * floor(r * nStates / N). State 0 holds the lowest surrogate values and
 * state counts differ by at most one.
 *
 * Before ranking, slices outside the optional position crop region are
 * removed, and (unless disabled) slices whose surrogate lies outside
 * median +/- k * 1.4826 * MAD are discarded as irregular breathing.
 *
 * @example
 * @code
 * StateClassifier classifier;
 * StateClassifier::Parameters params;
 * params.nStates = 4;
 *
 * auto assignment = classifier.classify(sequence, signal, params);
 * if (!assignment) {
 *     // ClassificationImbalance when nStates exceeds the retained slices
 * }
 * @endcode
 */
class StateClassifier {
public:
    /**
     * @brief Parameters for state classification
     */
    struct Parameters {
        /// Number of respiration states (>= 1)
        int nStates = 4;

        /// Discard slices outside the stable respiration range
        bool cropUnstable = true;

        /// Half-width of the stable range in robust standard deviations
        double cropMadFactor = 2.5;

        /// Optional slice-axis position range retained before classification
        std::optional<CropRegion> positionRange;

        [[nodiscard]] bool isValid() const noexcept {
            if (nStates < 1) {
                return false;
            }
            if (cropUnstable && cropMadFactor <= 0.0) {
                return false;
            }
            return !positionRange || positionRange->isValid();
        }
    };

    StateClassifier();
    ~StateClassifier();

    // Non-copyable, movable
    StateClassifier(const StateClassifier&) = delete;
    StateClassifier& operator=(const StateClassifier&) = delete;
    StateClassifier(StateClassifier&&) noexcept;
    StateClassifier& operator=(StateClassifier&&) noexcept;

    /**
     * @brief Classify every slice of a sequence
     *
     * @param sequence Slice sequence (positions used for the crop region)
     * @param signal Respiration signal aligned with the sequence
     * @param params Classification parameters
     * @return Assignment, or InvalidConfiguration / InvalidInput /
     *         ClassificationImbalance
     */
    [[nodiscard]] std::expected<StateAssignment, ReconError>
    classify(const core::SliceSequence& sequence,
             const RespirationSignal& signal,
             const Parameters& params) const;

    /**
     * @brief Classify a bare signal (no position cropping)
     */
    [[nodiscard]] std::expected<StateAssignment, ReconError>
    classify(const RespirationSignal& signal, const Parameters& params) const;

    /**
     * @brief Copy the state of each retained slice into the sequence
     *
     * Slices removed by cropping get no state.
     */
    static void annotate(core::SliceSequence& sequence,
                         const StateAssignment& assignment);

    /**
     * @brief Stable surrogate range median +/- k * 1.4826 * MAD
     *
     * Returns the full data range when MAD is zero.
     */
    [[nodiscard]] static std::pair<double, double> stableRange(
        const std::vector<double>& values, double madFactor);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace sweep_recon::services
