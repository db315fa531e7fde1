#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <numeric>
#include <set>
#include <string>
#include <vector>

#include "core/recon_config.hpp"
#include "core/report_serializer.hpp"
#include "core/volume_io.hpp"
#include "services/pipeline/reconstruction_pipeline.hpp"

#include "../test_utils/sweep_phantom_generator.hpp"

using namespace sweep_recon;
using namespace sweep_recon::services;
namespace phantom = sweep_recon::test_utils;

// =============================================================================
// Fixture: breathing sweep written to disk
// =============================================================================

class PipelineIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = std::filesystem::temp_directory_path() / "sweep_recon_pipeline_test";
        std::filesystem::remove_all(testDir_);
        std::filesystem::create_directories(testDir_);

        inputPath_ = testDir_ / "IMG_4D.nii.gz";
        auto volume = phantom::createBreathingSweepVolume(sweep_);
        auto written = core::VolumeIO::writeVolume4D(volume, inputPath_);
        ASSERT_TRUE(written.has_value()) << written.error().toString();

        config_.outputDirectory = testDir_ / "out";
        config_.thickness = sweep_.pixelSpacing;
        config_.nStates = 4;
        config_.workers = 2;
        config_.disableCrop = true;
    }

    void TearDown() override {
        std::filesystem::remove_all(testDir_);
    }

    std::size_t sliceCount() const {
        return static_cast<std::size_t>(sweep_.locations * sweep_.dynamics);
    }

    static std::vector<float> readBuffer(const std::filesystem::path& path) {
        auto volume = core::VolumeIO::readVolume3D(path);
        EXPECT_TRUE(volume.has_value()) << path.string();
        if (!volume) {
            return {};
        }
        auto count = volume.value()->GetLargestPossibleRegion().GetNumberOfPixels();
        const float* data = volume.value()->GetBufferPointer();
        return std::vector<float>(data, data + count);
    }

    static std::vector<std::size_t> readIndexList(const std::filesystem::path& path) {
        std::vector<std::size_t> indices;
        std::ifstream file(path);
        std::size_t index = 0;
        while (file >> index) {
            indices.push_back(index);
        }
        return indices;
    }

    phantom::BreathingSweepParameters sweep_;
    std::filesystem::path testDir_;
    std::filesystem::path inputPath_;
    core::ReconConfig config_;
};

// =============================================================================
// Full run
// =============================================================================

TEST_F(PipelineIntegrationTest, RunWritesAllOutputs) {
    ReconstructionPipeline pipeline(config_);
    auto summary = pipeline.run(inputPath_);
    ASSERT_TRUE(summary.has_value()) << summary.error().toString();

    const auto& out = config_.outputDirectory;
    EXPECT_TRUE(std::filesystem::exists(ReconstructionPipeline::sortedVolumePath(out)));
    EXPECT_TRUE(std::filesystem::exists(ReconstructionPipeline::reportPath(out)));
    EXPECT_EQ(summary->report, ReconstructionPipeline::reportPath(out));

    ASSERT_EQ(summary->stateVolumes.size(), 4u);
    for (int s = 0; s < 4; ++s) {
        auto path = ReconstructionPipeline::stateVolumePath(
            out, InterpolationMethod::FastLinear, s);
        EXPECT_EQ(summary->stateVolumes[static_cast<std::size_t>(s)], path);
        EXPECT_TRUE(std::filesystem::exists(path)) << path.string();
    }
    EXPECT_EQ(summary->stackedVolume.filename(), "IMG_4D_fast_linear.nii.gz");
    EXPECT_TRUE(std::filesystem::exists(summary->stackedVolume));
}

TEST_F(PipelineIntegrationTest, RunSummaryIsConsistent) {
    ReconstructionPipeline pipeline(config_);
    auto summary = pipeline.run(inputPath_);
    ASSERT_TRUE(summary.has_value());

    EXPECT_EQ(summary->sliceCount, sliceCount());
    EXPECT_LE(summary->retainedCount, summary->sliceCount);
    EXPECT_FALSE(summary->signalFromCache);
    EXPECT_EQ(summary->failedPartitions, 0u);
    EXPECT_EQ(summary->fallbackPixels, 0u);

    ASSERT_EQ(summary->occupancy.size(), 4u);
    auto [lo, hi] = std::minmax_element(summary->occupancy.begin(), summary->occupancy.end());
    EXPECT_GE(*lo, 1u);
    EXPECT_LE(*hi - *lo, 1u);

    // Positions span [0, 11.875] mm at 2 mm thickness
    EXPECT_EQ(summary->gridSize, 6u);
}

TEST_F(PipelineIntegrationTest, StableRangeCropKeepsBalance) {
    config_.disableCrop = false;
    ReconstructionPipeline pipeline(config_);
    auto summary = pipeline.run(inputPath_);
    ASSERT_TRUE(summary.has_value()) << summary.error().toString();

    EXPECT_GE(summary->retainedCount, static_cast<std::size_t>(config_.nStates));
    EXPECT_LE(summary->retainedCount, summary->sliceCount);
    auto [lo, hi] = std::minmax_element(summary->occupancy.begin(), summary->occupancy.end());
    EXPECT_LE(*hi - *lo, 1u);

    auto report = core::ReportSerializer::load(summary->report);
    ASSERT_TRUE(report.has_value());
    ASSERT_TRUE(report->assignment.has_value());
    EXPECT_TRUE(report->assignment->cropApplied);
}

TEST_F(PipelineIntegrationTest, OutputVolumesShareGeometry) {
    ReconstructionPipeline pipeline(config_);
    auto summary = pipeline.run(inputPath_);
    ASSERT_TRUE(summary.has_value());

    auto stacked = core::VolumeIO::readVolume4D(summary->stackedVolume);
    ASSERT_TRUE(stacked.has_value()) << stacked.error().toString();
    auto size4 = stacked.value()->GetLargestPossibleRegion().GetSize();
    EXPECT_EQ(size4[0], static_cast<unsigned>(sweep_.width));
    EXPECT_EQ(size4[1], static_cast<unsigned>(sweep_.height));
    EXPECT_EQ(size4[2], summary->gridSize);
    EXPECT_EQ(size4[3], 4u);

    for (const auto& path : summary->stateVolumes) {
        auto state = core::VolumeIO::readVolume3D(path);
        ASSERT_TRUE(state.has_value());
        auto size3 = state.value()->GetLargestPossibleRegion().GetSize();
        EXPECT_EQ(size3[2], summary->gridSize);
        EXPECT_NEAR(state.value()->GetSpacing()[2], config_.thickness, 1e-5);
    }
}

TEST_F(PipelineIntegrationTest, ReportHoldsSignalAndAssignment) {
    ReconstructionPipeline pipeline(config_);
    auto summary = pipeline.run(inputPath_);
    ASSERT_TRUE(summary.has_value());

    auto report = core::ReportSerializer::load(summary->report);
    ASSERT_TRUE(report.has_value()) << report.error().toString();
    EXPECT_EQ(report->sliceCount, sliceCount());
    EXPECT_EQ(report->signal.size(), sliceCount());
    ASSERT_TRUE(report->assignment.has_value());
    EXPECT_EQ(report->assignment->nStates, 4);
    EXPECT_EQ(report->assignment->occupancy(), summary->occupancy);
}

TEST_F(PipelineIntegrationTest, RespiratoryRoiFromInputTiming) {
    ASSERT_DOUBLE_EQ(config_.samplingRateHz, 0.0);
    ReconstructionPipeline pipeline(config_);
    auto summary = pipeline.run(inputPath_);
    ASSERT_TRUE(summary.has_value()) << summary.error().toString();

    auto report = core::ReportSerializer::load(summary->report);
    ASSERT_TRUE(report.has_value());
    const auto& roi = report->signal.roi;
    EXPECT_GT(roi.columnCount, 0u);
    EXPECT_LT(roi.columnCount, static_cast<std::size_t>(sweep_.width));
    EXPECT_NEAR(report->signal.samplingRateHz, 1.0 / sweep_.frameInterval, 1e-4);
    EXPECT_GT(report->signal.trendWindow, 1);
}

// =============================================================================
// Exclude lists and QC images
// =============================================================================

TEST_F(PipelineIntegrationTest, ExcludeListsComplementEachState) {
    ReconstructionPipeline pipeline(config_);
    auto summary = pipeline.run(inputPath_);
    ASSERT_TRUE(summary.has_value()) << summary.error().toString();

    auto report = core::ReportSerializer::load(summary->report);
    ASSERT_TRUE(report.has_value());
    ASSERT_TRUE(report->assignment.has_value());
    const auto& stateOfSlice = report->assignment->stateOfSlice;

    ASSERT_EQ(summary->excludeLists.size(), 4u);
    std::vector<int> listed(sliceCount(), 0);
    for (int state = 0; state < 4; ++state) {
        const auto& path = summary->excludeLists[static_cast<std::size_t>(state)];
        EXPECT_EQ(path, ReconstructionPipeline::excludeListPath(config_.outputDirectory, state));
        EXPECT_EQ(path.filename(), "exclude_list_" + std::to_string(state) + ".txt");
        ASSERT_TRUE(std::filesystem::exists(path)) << path.string();

        auto indices = readIndexList(path);
        EXPECT_EQ(indices.size(),
                  sliceCount() - summary->occupancy[static_cast<std::size_t>(state)]);
        EXPECT_TRUE(std::is_sorted(indices.begin(), indices.end()));
        for (std::size_t i : indices) {
            ASSERT_LT(i, sliceCount());
            EXPECT_NE(stateOfSlice[i], state);
            ++listed[i];
        }
    }
    // Every slice is in exactly one state, so it is excluded from the other three
    for (int count : listed) {
        EXPECT_EQ(count, 3);
    }
}

TEST_F(PipelineIntegrationTest, QcImagesMatchSortedStack) {
    ReconstructionPipeline pipeline(config_);
    auto summary = pipeline.run(inputPath_);
    ASSERT_TRUE(summary.has_value()) << summary.error().toString();

    const auto& out = config_.outputDirectory;
    auto report = core::ReportSerializer::load(summary->report);
    ASSERT_TRUE(report.has_value());

    auto cropped = core::VolumeIO::readVolume3D(ReconstructionPipeline::croppedVolumePath(out));
    ASSERT_TRUE(cropped.has_value()) << cropped.error().toString();
    auto croppedSize = cropped.value()->GetLargestPossibleRegion().GetSize();
    EXPECT_EQ(croppedSize[0], report->signal.roi.columnCount);
    EXPECT_EQ(croppedSize[1], static_cast<unsigned>(sweep_.height));
    EXPECT_EQ(croppedSize[2], sliceCount());

    auto sorted = readBuffer(ReconstructionPipeline::sortedVolumePath(out));
    auto mask = readBuffer(ReconstructionPipeline::bodyMaskVolumePath(out));
    ASSERT_EQ(mask.size(), sorted.size());
    std::size_t body = 0;
    for (float v : mask) {
        EXPECT_TRUE(v == 0.0f || v == 1.0f);
        body += v > 0.5f ? 1 : 0;
    }
    EXPECT_GT(body, 0u);
    EXPECT_LT(body, mask.size());
}

TEST_F(PipelineIntegrationTest, QcImagesCanBeDisabled) {
    config_.writeQcImages = false;
    ReconstructionPipeline pipeline(config_);
    ASSERT_TRUE(pipeline.run(inputPath_).has_value());

    const auto& out = config_.outputDirectory;
    EXPECT_FALSE(std::filesystem::exists(ReconstructionPipeline::croppedVolumePath(out)));
    EXPECT_FALSE(std::filesystem::exists(ReconstructionPipeline::bodyMaskVolumePath(out)));
}

TEST_F(PipelineIntegrationTest, ProgressCoversEveryStage) {
    ReconstructionPipeline pipeline(config_);
    std::set<std::string> stages;
    pipeline.setProgressCallback([&stages](const std::string& stage, double progress) {
        EXPECT_GE(progress, 0.0);
        EXPECT_LE(progress, 1.0);
        stages.insert(stage);
    });

    ASSERT_TRUE(pipeline.run(inputPath_).has_value());
    EXPECT_TRUE(stages.contains("sort"));
    EXPECT_TRUE(stages.contains("estimate"));
    EXPECT_TRUE(stages.contains("resample"));
}

TEST_F(PipelineIntegrationTest, RbfRunWritesMethodSpecificOutputs) {
    config_.interpolation = InterpolationMethod::Rbf;
    ReconstructionPipeline pipeline(config_);
    auto summary = pipeline.run(inputPath_);
    ASSERT_TRUE(summary.has_value()) << summary.error().toString();

    EXPECT_EQ(summary->stackedVolume.filename(), "IMG_4D_rbf.nii.gz");
    EXPECT_TRUE(std::filesystem::exists(summary->stackedVolume));
    EXPECT_TRUE(std::filesystem::exists(
        config_.outputDirectory / "volumes_rbf" / "state_03.nii.gz"));
    EXPECT_EQ(summary->failedPartitions, 0u);

    // fast_linear reconstruction written alongside for comparison
    ASSERT_EQ(summary->referenceVolumes.size(), 4u);
    for (const auto& path : summary->referenceVolumes) {
        EXPECT_EQ(path.parent_path().filename(), "volumes_fast_linear");
        EXPECT_TRUE(std::filesystem::exists(path)) << path.string();
    }
    EXPECT_EQ(summary->referenceStackedVolume.filename(), "IMG_4D_fast_linear.nii.gz");
    EXPECT_TRUE(std::filesystem::exists(summary->referenceStackedVolume));

    auto rbf = readBuffer(summary->stateVolumes[0]);
    auto linear = readBuffer(summary->referenceVolumes[0]);
    EXPECT_EQ(rbf.size(), linear.size());
}

TEST_F(PipelineIntegrationTest, FastLinearRunWritesNoReference) {
    ReconstructionPipeline pipeline(config_);
    auto summary = pipeline.run(inputPath_);
    ASSERT_TRUE(summary.has_value());
    EXPECT_TRUE(summary->referenceVolumes.empty());
    EXPECT_TRUE(summary->referenceStackedVolume.empty());
    EXPECT_FALSE(std::filesystem::exists(config_.outputDirectory / "volumes_rbf"));
}

// =============================================================================
// Determinism and cropping
// =============================================================================

TEST_F(PipelineIntegrationTest, RedoRunsAreBitIdentical) {
    config_.redo = true;

    ReconstructionPipeline first(config_);
    auto initial = first.run(inputPath_);
    ASSERT_TRUE(initial.has_value()) << initial.error().toString();
    std::vector<std::vector<float>> firstVolumes;
    for (const auto& path : initial->stateVolumes) {
        firstVolumes.push_back(readBuffer(path));
    }
    auto firstReport = core::ReportSerializer::load(initial->report);
    ASSERT_TRUE(firstReport.has_value());

    ReconstructionPipeline second(config_);
    auto repeated = second.run(inputPath_);
    ASSERT_TRUE(repeated.has_value());
    EXPECT_FALSE(repeated->signalFromCache);
    ASSERT_EQ(repeated->stateVolumes.size(), firstVolumes.size());
    for (std::size_t s = 0; s < firstVolumes.size(); ++s) {
        auto again = readBuffer(repeated->stateVolumes[s]);
        ASSERT_EQ(again.size(), firstVolumes[s].size());
        EXPECT_TRUE(std::equal(again.begin(), again.end(), firstVolumes[s].begin()))
            << "state " << s;
    }

    auto secondReport = core::ReportSerializer::load(repeated->report);
    ASSERT_TRUE(secondReport.has_value());
    EXPECT_EQ(secondReport->signal.values(), firstReport->signal.values());
    EXPECT_EQ(secondReport->assignment->stateOfSlice, firstReport->assignment->stateOfSlice);
}

TEST_F(PipelineIntegrationTest, CropDropsIrregularBreaths) {
    // Two deep breaths per location, far outside the regular excursion
    phantom::BreathingSweepParameters irregular;
    irregular.height = 40;
    irregular.amplitude = 2.0;
    irregular.outlierDynamics = {3, 11};
    irregular.outlierShift = 12.0;
    auto inputPath = testDir_ / "IMG_4D_irregular.nii.gz";
    ASSERT_TRUE(core::VolumeIO::writeVolume4D(
        phantom::createBreathingSweepVolume(irregular), inputPath).has_value());

    config_.smoothingSigma = 0.0;
    config_.trendWindow = 0;

    config_.outputDirectory = testDir_ / "crop_off";
    config_.disableCrop = true;
    auto off = ReconstructionPipeline(config_).run(inputPath);
    ASSERT_TRUE(off.has_value()) << off.error().toString();

    config_.outputDirectory = testDir_ / "crop_on";
    config_.disableCrop = false;
    auto on = ReconstructionPipeline(config_).run(inputPath);
    ASSERT_TRUE(on.has_value()) << on.error().toString();

    EXPECT_EQ(off->retainedCount, off->sliceCount);
    EXPECT_LT(on->retainedCount, off->retainedCount);

    for (const auto* summary : {&off.value(), &on.value()}) {
        auto total = std::accumulate(summary->occupancy.begin(), summary->occupancy.end(),
                                     std::size_t{0});
        EXPECT_EQ(total, summary->retainedCount);
        auto [lo, hi] = std::minmax_element(summary->occupancy.begin(),
                                            summary->occupancy.end());
        EXPECT_LE(*hi - *lo, 1u);

        auto report = core::ReportSerializer::load(summary->report);
        ASSERT_TRUE(report.has_value());
        ASSERT_TRUE(report->assignment.has_value());
        const auto& assignment = report->assignment.value();
        std::set<std::size_t> retained(assignment.retainedSlices.begin(),
                                       assignment.retainedSlices.end());
        for (std::size_t i = 0; i < assignment.stateOfSlice.size(); ++i) {
            EXPECT_EQ(assignment.stateOfSlice[i] != StateAssignment::kUnassigned,
                      retained.contains(i)) << "slice " << i;
        }
    }

    auto report = core::ReportSerializer::load(on->report);
    ASSERT_TRUE(report.has_value());
    for (std::size_t i = 0; i < report->assignment->stateOfSlice.size(); ++i) {
        int dynamic = static_cast<int>(i) % irregular.dynamics;
        if (dynamic == 3 || dynamic == 11) {
            EXPECT_EQ(report->assignment->stateOfSlice[i], StateAssignment::kUnassigned)
                << "slice " << i;
        }
    }
}

// =============================================================================
// Respiration cache
// =============================================================================

TEST_F(PipelineIntegrationTest, SecondRunReusesCachedSignal) {
    ReconstructionPipeline first(config_);
    auto initial = first.run(inputPath_);
    ASSERT_TRUE(initial.has_value());
    EXPECT_FALSE(initial->signalFromCache);

    ReconstructionPipeline second(config_);
    auto cached = second.run(inputPath_);
    ASSERT_TRUE(cached.has_value());
    EXPECT_TRUE(cached->signalFromCache);
    EXPECT_EQ(cached->occupancy, initial->occupancy);
}

TEST_F(PipelineIntegrationTest, RedoIgnoresCache) {
    ReconstructionPipeline first(config_);
    ASSERT_TRUE(first.run(inputPath_).has_value());

    config_.redo = true;
    ReconstructionPipeline second(config_);
    auto summary = second.run(inputPath_);
    ASSERT_TRUE(summary.has_value());
    EXPECT_FALSE(summary->signalFromCache);
}

TEST_F(PipelineIntegrationTest, StateCountChangeReclassifiesCachedSignal) {
    ReconstructionPipeline first(config_);
    ASSERT_TRUE(first.run(inputPath_).has_value());

    config_.nStates = 3;
    ReconstructionPipeline second(config_);
    auto summary = second.run(inputPath_);
    ASSERT_TRUE(summary.has_value());
    EXPECT_TRUE(summary->signalFromCache);
    EXPECT_EQ(summary->occupancy.size(), 3u);
    EXPECT_EQ(summary->stateVolumes.size(), 3u);
}

TEST_F(PipelineIntegrationTest, FeatureChangeInvalidatesCache) {
    ReconstructionPipeline first(config_);
    ASSERT_TRUE(first.run(inputPath_).has_value());

    config_.feature = SurrogateFeature::IntensityCentroid;
    ReconstructionPipeline second(config_);
    auto summary = second.run(inputPath_);
    ASSERT_TRUE(summary.has_value());
    EXPECT_FALSE(summary->signalFromCache);

    auto report = core::ReportSerializer::load(summary->report);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->feature, SurrogateFeature::IntensityCentroid);
}

TEST_F(PipelineIntegrationTest, ForeignAcquisitionOrderInvalidatesCache) {
    ReconstructionPipeline pipeline(config_);
    auto sequence = pipeline.sortStage(inputPath_);
    ASSERT_TRUE(sequence.has_value());
    ASSERT_TRUE(pipeline.estimateStage(sequence.value()).has_value());

    auto path = ReconstructionPipeline::reportPath(config_.outputDirectory);
    auto report = core::ReportSerializer::load(path);
    ASSERT_TRUE(report.has_value());
    report->signal.samples[5].acquisitionIndex += 1000;
    ASSERT_TRUE(core::ReportSerializer::save(report.value(), path).has_value());

    auto cached = pipeline.loadCachedSignal(sequence.value());
    ASSERT_FALSE(cached.has_value());
    EXPECT_EQ(cached.error().code, ReconError::Code::IoError);
    EXPECT_NE(cached.error().message.find("slice 5"), std::string::npos);

    bool fromCache = true;
    ASSERT_TRUE(pipeline.estimateStage(sequence.value(), &fromCache).has_value());
    EXPECT_FALSE(fromCache);
}

TEST_F(PipelineIntegrationTest, StagesComposeLikeRun) {
    ReconstructionPipeline pipeline(config_);

    auto sequence = pipeline.sortStage(inputPath_);
    ASSERT_TRUE(sequence.has_value());
    EXPECT_EQ(sequence->size(), sliceCount());

    auto missing = pipeline.loadCachedSignal(sequence.value());
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ReconError::Code::IoError);

    bool fromCache = true;
    auto signal = pipeline.estimateStage(sequence.value(), &fromCache);
    ASSERT_TRUE(signal.has_value());
    EXPECT_FALSE(fromCache);
    EXPECT_TRUE(sequence->slices.front().surrogate.has_value());

    auto cached = pipeline.loadCachedSignal(sequence.value());
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->values(), signal->values());

    auto assignment = pipeline.classifyStage(sequence.value(), cached.value());
    ASSERT_TRUE(assignment.has_value());

    auto result = pipeline.resampleStage(sequence.value(), assignment.value());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->states.size(), 4u);
    EXPECT_TRUE(result->isComplete());
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(PipelineIntegrationTest, MissingInputFails) {
    ReconstructionPipeline pipeline(config_);
    auto summary = pipeline.run(testDir_ / "missing.nii.gz");
    ASSERT_FALSE(summary.has_value());
    EXPECT_EQ(summary.error().code, ReconError::Code::InvalidInput);
}

TEST_F(PipelineIntegrationTest, InvalidConfigurationFails) {
    config_.thickness = 0.0;
    ReconstructionPipeline pipeline(config_);
    auto summary = pipeline.run(inputPath_);
    ASSERT_FALSE(summary.has_value());
    EXPECT_EQ(summary.error().code, ReconError::Code::InvalidConfiguration);
}

TEST_F(PipelineIntegrationTest, TooManyStatesFails) {
    config_.nStates = static_cast<int>(sliceCount()) + 1;
    ReconstructionPipeline pipeline(config_);
    auto summary = pipeline.run(inputPath_);
    ASSERT_FALSE(summary.has_value());
    EXPECT_EQ(summary.error().code, ReconError::Code::ClassificationImbalance);
}
