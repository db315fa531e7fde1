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
 * @file reconstruction_pipeline.hpp
 * @brief Stage sequencing, caching and output writing for a reconstruction run
 * @details Runs sort -> estimate -> classify -> resample on one sweep
 *          acquisition and writes every intermediate and final product into
 *          the output directory:
 *
 *          - IMG_3D_sorted.nii.gz            slices in acquisition order
 *          - IMG_3D_cropped.nii.gz           sorted slices inside the respiratory ROI
 *          - IMG_3D_body_mask.nii.gz         body masks of the body-area feature
 *          - respiration.json                signal and state assignment
 *          - exclude_lists/exclude_list_N.txt sorted-slice indices outside state N
 *          - volumes_<method>/state_NN.nii.gz one volume per state
 *          - IMG_4D_<method>.nii.gz          all states stacked
 *
 *          With rbf, the fast_linear volumes and stack are written as well
 *          for comparison. The two QC images are written only when the
 *          signal is freshly estimated.
 *
 *          respiration.json is also the estimation cache: unless redo is
 *          set, a report with the same slice count, acquisition indices and
 *          feature is reused.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <cstddef>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/recon_config.hpp"
#include "core/recon_error.hpp"
#include "core/slice_sequence.hpp"
#include "services/resampling/resampling_types.hpp"
#include "services/respiration/respiration_types.hpp"

namespace sweep_recon::services {

/**
 * @brief Outcome of a complete run
 */
struct RunSummary {
    std::size_t sliceCount = 0;
    std::size_t retainedCount = 0;
    std::vector<std::size_t> occupancy;

    /// Estimation was skipped because a cached signal matched
    bool signalFromCache = false;

    std::size_t gridSize = 0;
    std::size_t fallbackPixels = 0;
    std::size_t failedPartitions = 0;

    std::vector<std::filesystem::path> stateVolumes;
    std::filesystem::path stackedVolume;
    std::filesystem::path report;

    /// fast_linear volumes written next to rbf ones (empty for fast_linear runs)
    std::vector<std::filesystem::path> referenceVolumes;
    std::filesystem::path referenceStackedVolume;

    std::vector<std::filesystem::path> excludeLists;
};

/**
 * @brief Reconstruction run orchestration
 *
 * @example
 * @code
 * core::ReconConfig config;
 * config.outputDirectory = "out";
 * config.nStates = 4;
 *
 * ReconstructionPipeline pipeline(config);
 * auto summary = pipeline.run("IMG_4D.nii.gz");
 * if (!summary) {
 *     std::cerr << summary.error().toString() << std::endl;
 * }
 * @endcode
 */
class ReconstructionPipeline {
public:
    /// Progress callback (stage name, 0.0 to 1.0 within the stage)
    using ProgressCallback =
        std::function<void(const std::string& stage, double progress)>;

    explicit ReconstructionPipeline(core::ReconConfig config);
    ~ReconstructionPipeline();

    // Non-copyable, movable
    ReconstructionPipeline(const ReconstructionPipeline&) = delete;
    ReconstructionPipeline& operator=(const ReconstructionPipeline&) = delete;
    ReconstructionPipeline(ReconstructionPipeline&&) noexcept;
    ReconstructionPipeline& operator=(ReconstructionPipeline&&) noexcept;

    [[nodiscard]] const core::ReconConfig& config() const noexcept;

    void setProgressCallback(ProgressCallback callback);

    /**
     * @brief Read the raw 4D input, sort it and write IMG_3D_sorted
     */
    [[nodiscard]] std::expected<core::SliceSequence, ReconError>
    sortStage(const std::filesystem::path& inputPath) const;

    /**
     * @brief Respiration signal of a sequence, from cache or freshly estimated
     *
     * Annotates the sequence with the surrogate and writes the report.
     *
     * @param sequence Sorted sequence
     * @param fromCache Set to whether the cached signal was used
     */
    [[nodiscard]] std::expected<RespirationSignal, ReconError>
    estimateStage(core::SliceSequence& sequence, bool* fromCache = nullptr) const;

    /**
     * @brief Classify slices into states, add the assignment to the report
     *        and write one exclude list per state
     */
    [[nodiscard]] std::expected<StateAssignment, ReconError>
    classifyStage(core::SliceSequence& sequence,
                  const RespirationSignal& signal) const;

    /**
     * @brief Reconstruct and write one volume per state plus the 4D stack
     *
     * Runs with rbf also write the fast_linear reconstruction.
     */
    [[nodiscard]] std::expected<ResamplingResult, ReconError>
    resampleStage(const core::SliceSequence& sequence,
                  const StateAssignment& assignment) const;

    /**
     * @brief Load the cached signal of a sequence
     *
     * The report must cover the same slices (count and acquisition indices)
     * and have been estimated with the configured feature.
     *
     * @return IoError naming the mismatch if no matching report exists
     */
    [[nodiscard]] std::expected<RespirationSignal, ReconError>
    loadCachedSignal(const core::SliceSequence& sequence) const;

    /**
     * @brief Run every stage on one input
     */
    [[nodiscard]] std::expected<RunSummary, ReconError>
    run(const std::filesystem::path& inputPath) const;

    /// Output file names inside an output directory
    [[nodiscard]] static std::filesystem::path sortedVolumePath(
        const std::filesystem::path& outputDirectory);
    [[nodiscard]] static std::filesystem::path reportPath(
        const std::filesystem::path& outputDirectory);
    [[nodiscard]] static std::filesystem::path stateVolumePath(
        const std::filesystem::path& outputDirectory,
        InterpolationMethod method, int state);
    [[nodiscard]] static std::filesystem::path stackedVolumePath(
        const std::filesystem::path& outputDirectory,
        InterpolationMethod method);
    [[nodiscard]] static std::filesystem::path excludeListPath(
        const std::filesystem::path& outputDirectory, int state);
    [[nodiscard]] static std::filesystem::path croppedVolumePath(
        const std::filesystem::path& outputDirectory);
    [[nodiscard]] static std::filesystem::path bodyMaskVolumePath(
        const std::filesystem::path& outputDirectory);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace sweep_recon::services
