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

#include "services/pipeline/reconstruction_pipeline.hpp"

#include <cstdio>
#include <fstream>
#include <system_error>

#include <itkRegionOfInterestImageFilter.h>

#include "core/logging.hpp"
#include "core/report_serializer.hpp"
#include "core/sweep_sorter.hpp"
#include "core/volume_io.hpp"
#include "services/resampling/volume_resampler.hpp"
#include "services/respiration/respiration_estimator.hpp"
#include "services/respiration/state_classifier.hpp"

namespace sweep_recon::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("ReconstructionPipeline");
    return logger;
}

}  // anonymous namespace

/**
 * @brief PIMPL implementation for ReconstructionPipeline
 */
class ReconstructionPipeline::Impl {
public:
    explicit Impl(core::ReconConfig cfg) : config(std::move(cfg)) {}

    core::ReconConfig config;
    ProgressCallback progressCallback;

    void reportProgress(const std::string& stage, double progress) const {
        if (progressCallback) {
            progressCallback(stage, progress);
        }
    }

    [[nodiscard]] RespirationEstimator::Parameters estimatorParameters() const {
        RespirationEstimator::Parameters params;
        params.feature = config.feature;
        params.minVisitsPerPosition = config.minVisitsPerPosition;
        params.samplingRateHz = config.samplingRateHz;
        params.trendWindow = config.trendWindow;
        params.smoothingSigma = config.smoothingSigma;
        return params;
    }

    [[nodiscard]] StateClassifier::Parameters classifierParameters() const {
        StateClassifier::Parameters params;
        params.nStates = config.nStates;
        params.cropUnstable = !config.disableCrop;
        params.cropMadFactor = config.cropMadFactor;
        return params;
    }

    [[nodiscard]] VolumeResampler::Parameters resamplerParameters() const {
        VolumeResampler::Parameters params;
        params.thickness = config.thickness;
        params.method = config.interpolation;
        params.rbf.kernel = config.rbfKernel;
        params.rbf.epsilon = config.rbfEpsilon;
        params.workers = config.workers;
        params.isotropicInPlane = config.isotropicInPlane;
        params.inPlaneInterpolation = config.inPlaneInterpolation;
        params.splineOrder = config.splineOrder;
        return params;
    }

    /// Write every state volume of a result and their 4D stack
    [[nodiscard]] std::expected<void, ReconError> writeVolumes(
        const ResamplingResult& result, InterpolationMethod method) const;

    /// One text file per state listing the sorted-slice indices not in it
    [[nodiscard]] std::expected<void, ReconError> writeExcludeLists(
        const StateAssignment& assignment) const;

    /// Cropped stack and body masks of a fresh estimate
    [[nodiscard]] std::expected<void, ReconError> writeQcImages(
        const core::SliceSequence& sequence, const RespirationSignal& signal) const;

    [[nodiscard]] std::expected<void, ReconError> prepareOutputDirectory() const {
        std::error_code ec;
        std::filesystem::create_directories(config.outputDirectory, ec);
        if (ec) {
            getLogger()->error("Cannot create output directory {}: {}",
                               config.outputDirectory.string(), ec.message());
            return std::unexpected(ReconError{
                ReconError::Code::IoError,
                "Cannot create output directory " + config.outputDirectory.string()
                    + ": " + ec.message()
            });
        }
        return {};
    }
};

std::expected<void, ReconError> ReconstructionPipeline::Impl::writeVolumes(
    const ResamplingResult& result, InterpolationMethod method) const
{
    std::vector<core::VolumeIO::Volume3DType::Pointer> volumes;
    for (const auto& state : result.states) {
        auto path = stateVolumePath(config.outputDirectory, method, state.state);
        auto written = core::VolumeIO::writeVolume3D(state.volume, path);
        if (!written) {
            return std::unexpected(written.error());
        }
        volumes.push_back(state.volume);
    }

    auto stacked = core::VolumeIO::stackVolumes(volumes);
    if (!stacked) {
        return std::unexpected(stacked.error());
    }
    return core::VolumeIO::writeVolume4D(
        stacked.value(), stackedVolumePath(config.outputDirectory, method));
}

std::expected<void, ReconError> ReconstructionPipeline::Impl::writeExcludeLists(
    const StateAssignment& assignment) const
{
    auto directory = excludeListPath(config.outputDirectory, 0).parent_path();
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        return std::unexpected(ReconError{
            ReconError::Code::IoError,
            "Cannot create " + directory.string() + ": " + ec.message()
        });
    }

    for (int state = 0; state < assignment.nStates; ++state) {
        auto path = excludeListPath(config.outputDirectory, state);
        std::ofstream file(path);
        if (!file) {
            return std::unexpected(ReconError{
                ReconError::Code::IoError, "Cannot open " + path.string()
            });
        }
        for (std::size_t i = 0; i < assignment.stateOfSlice.size(); ++i) {
            if (assignment.stateOfSlice[i] != state) {
                file << i << '\n';
            }
        }
        if (!file) {
            return std::unexpected(ReconError{
                ReconError::Code::IoError, "Failed to write " + path.string()
            });
        }
    }
    getLogger()->debug("Wrote {} exclude lists to {}", assignment.nStates, directory.string());
    return {};
}

std::expected<void, ReconError> ReconstructionPipeline::Impl::writeQcImages(
    const core::SliceSequence& sequence, const RespirationSignal& signal) const
{
    using ImageType = core::Slice::ImageType;

    const auto cols = sequence.imageSize()[0];
    RespiratoryRoi roi = signal.roi;
    if (roi.columnCount == 0 || roi.endColumn() > cols) {
        roi = RespiratoryRoi{0, cols};
    }

    core::SliceSequence cropped = sequence;
    try {
        ImageType::RegionType region = sequence.slices.front().image->GetLargestPossibleRegion();
        region.SetIndex(0, static_cast<ImageType::IndexValueType>(roi.startColumn));
        region.SetSize(0, roi.columnCount);

        for (auto& slice : cropped.slices) {
            using FilterType = itk::RegionOfInterestImageFilter<ImageType, ImageType>;
            auto filter = FilterType::New();
            filter->SetInput(slice.image);
            filter->SetRegionOfInterest(region);
            filter->Update();
            slice.image = filter->GetOutput();
            slice.image->DisconnectPipeline();
        }
    }
    catch (const itk::ExceptionObject& e) {
        getLogger()->error("Cropping to the respiratory ROI failed: {}", e.GetDescription());
        return std::unexpected(ReconError{
            ReconError::Code::ProcessingFailed,
            std::string("ITK exception: ") + e.GetDescription()
        });
    }
    for (std::size_t r = 0; r < 3; ++r) {
        cropped.origin[r] += sequence.direction[r * 3] * sequence.pixelSpacing[0]
                             * static_cast<double>(roi.startColumn);
    }

    auto croppedVolume = core::VolumeIO::sequenceToVolume(cropped);
    if (!croppedVolume) {
        return std::unexpected(croppedVolume.error());
    }
    if (auto written = core::VolumeIO::writeVolume3D(
            croppedVolume.value(), croppedVolumePath(config.outputDirectory));
        !written) {
        return std::unexpected(written.error());
    }

    if (config.feature != SurrogateFeature::BodyArea) {
        return {};
    }

    RespirationEstimator estimator;
    auto masks = estimator.bodyMasks(sequence, roi, estimatorParameters());
    if (!masks) {
        return std::unexpected(masks.error());
    }
    core::SliceSequence maskSequence = sequence;
    for (std::size_t i = 0; i < maskSequence.size(); ++i) {
        maskSequence.slices[i].image = masks.value()[i];
    }
    auto maskVolume = core::VolumeIO::sequenceToVolume(maskSequence);
    if (!maskVolume) {
        return std::unexpected(maskVolume.error());
    }
    return core::VolumeIO::writeVolume3D(
        maskVolume.value(), bodyMaskVolumePath(config.outputDirectory));
}

ReconstructionPipeline::ReconstructionPipeline(core::ReconConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

ReconstructionPipeline::~ReconstructionPipeline() = default;

ReconstructionPipeline::ReconstructionPipeline(ReconstructionPipeline&&) noexcept = default;
ReconstructionPipeline& ReconstructionPipeline::operator=(ReconstructionPipeline&&) noexcept = default;

const core::ReconConfig& ReconstructionPipeline::config() const noexcept {
    return impl_->config;
}

void ReconstructionPipeline::setProgressCallback(ProgressCallback callback) {
    impl_->progressCallback = std::move(callback);
}

std::filesystem::path ReconstructionPipeline::sortedVolumePath(
    const std::filesystem::path& outputDirectory) {
    return outputDirectory / "IMG_3D_sorted.nii.gz";
}

std::filesystem::path ReconstructionPipeline::reportPath(
    const std::filesystem::path& outputDirectory) {
    return outputDirectory / "respiration.json";
}

std::filesystem::path ReconstructionPipeline::stateVolumePath(
    const std::filesystem::path& outputDirectory,
    InterpolationMethod method, int state) {
    char name[32];
    std::snprintf(name, sizeof(name), "state_%02d.nii.gz", state);
    return outputDirectory / ("volumes_" + methodToString(method)) / name;
}

std::filesystem::path ReconstructionPipeline::stackedVolumePath(
    const std::filesystem::path& outputDirectory,
    InterpolationMethod method) {
    return outputDirectory / ("IMG_4D_" + methodToString(method) + ".nii.gz");
}

std::filesystem::path ReconstructionPipeline::excludeListPath(
    const std::filesystem::path& outputDirectory, int state) {
    return outputDirectory / "exclude_lists"
           / ("exclude_list_" + std::to_string(state) + ".txt");
}

std::filesystem::path ReconstructionPipeline::croppedVolumePath(
    const std::filesystem::path& outputDirectory) {
    return outputDirectory / "IMG_3D_cropped.nii.gz";
}

std::filesystem::path ReconstructionPipeline::bodyMaskVolumePath(
    const std::filesystem::path& outputDirectory) {
    return outputDirectory / "IMG_3D_body_mask.nii.gz";
}

std::expected<core::SliceSequence, ReconError>
ReconstructionPipeline::sortStage(const std::filesystem::path& inputPath) const {
    if (auto valid = impl_->config.validate(); !valid) {
        getLogger()->error("{}", valid.error().toString());
        return std::unexpected(valid.error());
    }
    if (auto dir = impl_->prepareOutputDirectory(); !dir) {
        return std::unexpected(dir.error());
    }

    getLogger()->info("Sorting {}", inputPath.string());
    impl_->reportProgress("sort", 0.0);

    auto raw = core::VolumeIO::readVolume4D(inputPath);
    if (!raw) {
        return std::unexpected(raw.error());
    }

    auto sequence = core::SweepSorter::sort(raw.value());
    if (!sequence) {
        return std::unexpected(sequence.error());
    }

    auto stacked = core::VolumeIO::sequenceToVolume(sequence.value());
    if (!stacked) {
        return std::unexpected(stacked.error());
    }
    auto written = core::VolumeIO::writeVolume3D(
        stacked.value(), sortedVolumePath(impl_->config.outputDirectory));
    if (!written) {
        return std::unexpected(written.error());
    }

    impl_->reportProgress("sort", 1.0);
    return sequence;
}

std::expected<RespirationSignal, ReconError>
ReconstructionPipeline::loadCachedSignal(const core::SliceSequence& sequence) const {
    auto report = core::ReportSerializer::load(reportPath(impl_->config.outputDirectory));
    if (!report) {
        return std::unexpected(report.error());
    }
    if (report->sliceCount != sequence.size() || report->signal.size() != sequence.size()) {
        return std::unexpected(ReconError{
            ReconError::Code::IoError,
            "Cached signal covers " + std::to_string(report->signal.size())
                + " slices, sequence has " + std::to_string(sequence.size())
        });
    }
    if (report->feature != impl_->config.feature) {
        return std::unexpected(ReconError{
            ReconError::Code::IoError,
            "Cached signal was estimated from " + featureToString(report->feature)
                + ", configuration asks for " + featureToString(impl_->config.feature)
        });
    }
    for (std::size_t i = 0; i < sequence.size(); ++i) {
        if (report->signal.samples[i].acquisitionIndex
            != sequence.slices[i].acquisitionIndex) {
            return std::unexpected(ReconError{
                ReconError::Code::IoError,
                "Cached signal differs from the sequence at slice " + std::to_string(i)
                    + " (acquisition " + std::to_string(report->signal.samples[i].acquisitionIndex)
                    + " vs " + std::to_string(sequence.slices[i].acquisitionIndex) + ")"
            });
        }
    }
    return report->signal;
}

std::expected<RespirationSignal, ReconError>
ReconstructionPipeline::estimateStage(core::SliceSequence& sequence, bool* fromCache) const {
    const auto& config = impl_->config;
    if (fromCache) {
        *fromCache = false;
    }
    if (auto dir = impl_->prepareOutputDirectory(); !dir) {
        return std::unexpected(dir.error());
    }
    impl_->reportProgress("estimate", 0.0);

    if (!config.redo) {
        auto cached = loadCachedSignal(sequence);
        if (cached) {
            getLogger()->info("Using cached respiration signal from {}",
                              reportPath(config.outputDirectory).string());
            RespirationEstimator::annotate(sequence, cached.value());
            if (fromCache) {
                *fromCache = true;
            }
            impl_->reportProgress("estimate", 1.0);
            return cached;
        }
        if (std::filesystem::exists(reportPath(config.outputDirectory))) {
            getLogger()->info("Cached respiration signal rejected: {}",
                              cached.error().message);
        } else {
            getLogger()->debug("No cached respiration signal: {}",
                               cached.error().toString());
        }
    }

    RespirationEstimator estimator;
    auto signal = estimator.estimate(sequence, impl_->estimatorParameters());
    if (!signal) {
        getLogger()->error("Respiration estimation failed: {}", signal.error().toString());
        return std::unexpected(signal.error());
    }
    RespirationEstimator::annotate(sequence, signal.value());

    core::RespirationReport report;
    report.sliceCount = sequence.size();
    report.feature = config.feature;
    report.signal = signal.value();
    auto saved = core::ReportSerializer::save(report, reportPath(config.outputDirectory));
    if (!saved) {
        return std::unexpected(saved.error());
    }

    if (config.writeQcImages) {
        if (auto qc = impl_->writeQcImages(sequence, signal.value()); !qc) {
            return std::unexpected(qc.error());
        }
    }

    impl_->reportProgress("estimate", 1.0);
    return signal;
}

std::expected<StateAssignment, ReconError>
ReconstructionPipeline::classifyStage(core::SliceSequence& sequence,
                                      const RespirationSignal& signal) const {
    StateClassifier classifier;
    auto assignment = classifier.classify(sequence, signal, impl_->classifierParameters());
    if (!assignment) {
        return std::unexpected(assignment.error());
    }
    StateClassifier::annotate(sequence, assignment.value());

    core::RespirationReport report;
    report.sliceCount = sequence.size();
    report.feature = impl_->config.feature;
    report.signal = signal;
    report.assignment = assignment.value();
    auto saved = core::ReportSerializer::save(report, reportPath(impl_->config.outputDirectory));
    if (!saved) {
        return std::unexpected(saved.error());
    }
    if (auto lists = impl_->writeExcludeLists(assignment.value()); !lists) {
        return std::unexpected(lists.error());
    }
    return assignment;
}

std::expected<ResamplingResult, ReconError>
ReconstructionPipeline::resampleStage(const core::SliceSequence& sequence,
                                      const StateAssignment& assignment) const {
    const auto& config = impl_->config;

    VolumeResampler resampler;
    resampler.setProgressCallback([this](double progress) {
        impl_->reportProgress("resample", progress);
    });

    auto result = resampler.resample(sequence, assignment, impl_->resamplerParameters());
    if (!result) {
        return std::unexpected(result.error());
    }
    resampler.setProgressCallback(nullptr);

    if (auto written = impl_->writeVolumes(result.value(), config.interpolation); !written) {
        return std::unexpected(written.error());
    }

    if (config.interpolation != InterpolationMethod::FastLinear) {
        auto params = impl_->resamplerParameters();
        params.method = InterpolationMethod::FastLinear;
        auto reference = resampler.resample(sequence, assignment, params);
        if (!reference) {
            return std::unexpected(reference.error());
        }
        if (auto written = impl_->writeVolumes(reference.value(), InterpolationMethod::FastLinear);
            !written) {
            return std::unexpected(written.error());
        }
        getLogger()->info("Wrote fast_linear reference volumes");
    }

    getLogger()->info("Wrote {} state volumes to {}", result->states.size(),
                      config.outputDirectory.string());
    return result;
}

std::expected<RunSummary, ReconError>
ReconstructionPipeline::run(const std::filesystem::path& inputPath) const {
    getLogger()->info("Reconstruction: thickness={:.2f} mm, n_states={}, method={}, "
                      "crop={}, redo={}",
                      impl_->config.thickness, impl_->config.nStates,
                      methodToString(impl_->config.interpolation),
                      !impl_->config.disableCrop, impl_->config.redo);

    auto sequence = sortStage(inputPath);
    if (!sequence) {
        return std::unexpected(sequence.error());
    }

    RunSummary summary;
    summary.sliceCount = sequence->size();

    auto signal = estimateStage(sequence.value(), &summary.signalFromCache);
    if (!signal) {
        return std::unexpected(signal.error());
    }

    auto assignment = classifyStage(sequence.value(), signal.value());
    if (!assignment) {
        return std::unexpected(assignment.error());
    }
    summary.retainedCount = assignment->retainedCount();
    summary.occupancy = assignment->occupancy();

    auto result = resampleStage(sequence.value(), assignment.value());
    if (!result) {
        return std::unexpected(result.error());
    }

    const auto& outputDirectory = impl_->config.outputDirectory;
    summary.gridSize = result->gridPositions.size();
    for (const auto& state : result->states) {
        summary.fallbackPixels += state.fallbackPixels;
        summary.failedPartitions += state.failedPartitions;
        summary.stateVolumes.push_back(
            stateVolumePath(outputDirectory, impl_->config.interpolation, state.state));
    }
    summary.stackedVolume = stackedVolumePath(outputDirectory, impl_->config.interpolation);
    summary.report = reportPath(outputDirectory);
    if (impl_->config.interpolation != InterpolationMethod::FastLinear) {
        for (const auto& state : result->states) {
            summary.referenceVolumes.push_back(
                stateVolumePath(outputDirectory, InterpolationMethod::FastLinear, state.state));
        }
        summary.referenceStackedVolume =
            stackedVolumePath(outputDirectory, InterpolationMethod::FastLinear);
    }
    for (int state = 0; state < assignment->nStates; ++state) {
        summary.excludeLists.push_back(excludeListPath(outputDirectory, state));
    }

    if (summary.failedPartitions > 0) {
        getLogger()->warn("Reconstruction finished with {} failed partitions",
                          summary.failedPartitions);
    } else {
        getLogger()->info("Reconstruction finished: {} of {} slices in {} states",
                          summary.retainedCount, summary.sliceCount,
                          impl_->config.nStates);
    }
    return summary;
}

}  // namespace sweep_recon::services
