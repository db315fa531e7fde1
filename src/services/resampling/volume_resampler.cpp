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

#include "services/resampling/volume_resampler.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <thread>

#include "core/logging.hpp"
#include "services/preprocessing/isotropic_resampler.hpp"
#include "services/resampling/slice_axis_interpolator.hpp"

namespace {

auto& getLogger() {
    static auto logger =
        sweep_recon::logging::LoggerFactory::create("VolumeResampler");
    return logger;
}

/// Outcome of one row band
struct BandResult {
    std::size_t fallbackPixels = 0;
    bool failed = false;
};

}  // anonymous namespace

namespace sweep_recon::services {

/**
 * @brief PIMPL implementation for VolumeResampler
 */
class VolumeResampler::Impl {
public:
    ProgressCallback progressCallback;

    void reportProgress(double progress) const {
        if (progressCallback) {
            progressCallback(progress);
        }
    }

    static std::expected<void, ReconError> validate(
        const core::SliceSequence& sequence,
        const StateAssignment& assignment,
        const Parameters& params);

    /// Allocate a zeroed output volume with the run geometry
    static VolumeType::Pointer allocateVolume(const core::SliceSequence& sequence,
                                              const std::vector<double>& grid,
                                              double thickness);
};

std::expected<void, ReconError> VolumeResampler::Impl::validate(
    const core::SliceSequence& sequence,
    const StateAssignment& assignment,
    const Parameters& params)
{
    if (!params.isValid()) {
        getLogger()->error("Invalid resampling parameters: thickness={}, workers={}",
                           params.thickness, params.workers);
        return std::unexpected(ReconError{
            ReconError::Code::InvalidConfiguration,
            "Invalid resampling parameters: thickness must be > 0 and "
            "workers >= 0"
        });
    }
    if (sequence.empty()) {
        return std::unexpected(ReconError{
            ReconError::Code::InvalidInput, "Slice sequence is empty"
        });
    }
    if (assignment.stateOfSlice.size() != sequence.size()) {
        getLogger()->error("Assignment covers {} slices, sequence has {}",
                           assignment.stateOfSlice.size(), sequence.size());
        return std::unexpected(ReconError{
            ReconError::Code::InvalidInput,
            "State assignment does not match the slice sequence"
        });
    }
    if (assignment.nStates < 1) {
        return std::unexpected(ReconError{
            ReconError::Code::InvalidConfiguration,
            "State assignment has no states"
        });
    }

    auto size = sequence.imageSize();
    if (size[0] == 0 || size[1] == 0) {
        return std::unexpected(ReconError{
            ReconError::Code::InvalidInput, "Slices have no pixels"
        });
    }
    for (const auto& slice : sequence.slices) {
        if (!slice.image) {
            return std::unexpected(ReconError{
                ReconError::Code::InvalidInput, "Slice without image data"
            });
        }
        auto s = slice.image->GetLargestPossibleRegion().GetSize();
        if (s[0] != size[0] || s[1] != size[1]) {
            return std::unexpected(ReconError{
                ReconError::Code::InvalidInput,
                "Slices have different in-plane sizes"
            });
        }
    }
    return {};
}

VolumeResampler::VolumeType::Pointer VolumeResampler::Impl::allocateVolume(
    const core::SliceSequence& sequence,
    const std::vector<double>& grid,
    double thickness)
{
    auto inPlane = sequence.imageSize();

    VolumeType::SizeType size;
    size[0] = inPlane[0];
    size[1] = inPlane[1];
    size[2] = grid.size();

    VolumeType::IndexType start;
    start.Fill(0);

    VolumeType::RegionType region;
    region.SetSize(size);
    region.SetIndex(start);

    VolumeType::SpacingType spacing;
    spacing[0] = sequence.pixelSpacing[0];
    spacing[1] = sequence.pixelSpacing[1];
    spacing[2] = thickness;

    VolumeType::DirectionType direction;
    for (unsigned int r = 0; r < 3; ++r) {
        for (unsigned int c = 0; c < 3; ++c) {
            direction[r][c] = sequence.direction[r * 3 + c];
        }
    }

    // Slice-axis origin moves to the first grid position
    double zStart = grid.empty() ? 0.0 : grid.front();
    VolumeType::PointType origin;
    for (unsigned int r = 0; r < 3; ++r) {
        origin[r] = sequence.origin[r] + direction[r][2] * zStart;
    }

    auto volume = VolumeType::New();
    volume->SetRegions(region);
    volume->SetSpacing(spacing);
    volume->SetOrigin(origin);
    volume->SetDirection(direction);
    volume->Allocate(true);
    return volume;
}

VolumeResampler::VolumeResampler()
    : impl_(std::make_unique<Impl>()) {}

VolumeResampler::~VolumeResampler() = default;

VolumeResampler::VolumeResampler(VolumeResampler&&) noexcept = default;
VolumeResampler& VolumeResampler::operator=(VolumeResampler&&) noexcept = default;

void VolumeResampler::setProgressCallback(ProgressCallback callback) {
    impl_->progressCallback = std::move(callback);
}

std::vector<double> VolumeResampler::buildGrid(double zMin, double zMax, double thickness) {
    std::vector<double> grid;
    if (!(thickness > 0.0) || zMax < zMin) {
        return grid;
    }
    auto count = static_cast<std::size_t>(std::floor((zMax - zMin) / thickness + 1e-9)) + 1;
    grid.reserve(count);
    for (std::size_t k = 0; k < count; ++k) {
        grid.push_back(zMin + static_cast<double>(k) * thickness);
    }
    return grid;
}

int VolumeResampler::resolveWorkerCount(int requested) noexcept {
    if (requested > 0) {
        return requested;
    }
    auto hardware = static_cast<int>(std::thread::hardware_concurrency());
    return std::max(1, hardware - 1);
}

std::expected<ResampledState, ReconError> VolumeResampler::resampleState(
    const core::SliceSequence& sequence,
    const StateAssignment& assignment,
    int state,
    const std::vector<double>& gridPositions,
    const Parameters& params) const
{
    if (auto valid = Impl::validate(sequence, assignment, params); !valid) {
        return std::unexpected(valid.error());
    }
    if (state < 0 || state >= assignment.nStates) {
        return std::unexpected(ReconError{
            ReconError::Code::InvalidInput,
            "State " + std::to_string(state) + " is out of range"
        });
    }
    if (gridPositions.empty()) {
        return std::unexpected(ReconError{
            ReconError::Code::InvalidInput, "Resampling grid is empty"
        });
    }

    // Members of the state ordered by position, then acquisition
    std::vector<std::size_t> members;
    for (std::size_t i = 0; i < sequence.size(); ++i) {
        if (assignment.stateOfSlice[i] == state) {
            members.push_back(i);
        }
    }
    if (members.empty()) {
        getLogger()->error("State {} has no slices", state);
        return std::unexpected(ReconError{
            ReconError::Code::ClassificationImbalance,
            "State " + std::to_string(state) + " has no slices"
        });
    }
    std::stable_sort(members.begin(), members.end(),
                     [&sequence](std::size_t a, std::size_t b) {
                         const auto& sa = sequence.slices[a];
                         const auto& sb = sequence.slices[b];
                         if (sa.position != sb.position) {
                             return sa.position < sb.position;
                         }
                         return sa.acquisitionIndex < sb.acquisitionIndex;
                     });

    std::vector<double> positions;
    positions.reserve(members.size());
    for (std::size_t i : members) {
        positions.push_back(sequence.slices[i].position);
    }

    FastLinearInterpolator linear;
    if (auto prepared = linear.prepare(positions, gridPositions); !prepared) {
        return std::unexpected(prepared.error());
    }

    ResampledState result;
    result.state = state;
    result.sliceCount = members.size();
    result.distinctPositions = linear.distinctPositions();

    auto primary = createSliceAxisInterpolator(params.method, params.rbf);
    if (primary->method() != InterpolationMethod::FastLinear) {
        if (auto prepared = primary->prepare(positions, gridPositions); !prepared) {
            return std::unexpected(prepared.error());
        }
        result.regularization = primary->regularization();
        if (!primary->isSolvable()) {
            getLogger()->warn("State {}: {} system unsolvable, using fast_linear "
                              "for all pixels", state, methodToString(primary->method()));
        } else if (primary->regularization() > 0.0) {
            getLogger()->warn("State {}: {} system regularized with lambda={:.3e}",
                              state, methodToString(primary->method()),
                              primary->regularization());
        }
    }
    const ISliceAxisInterpolator& interpolator =
        primary->method() == InterpolationMethod::FastLinear
            ? static_cast<const ISliceAxisInterpolator&>(linear)
            : *primary;
    result.method = interpolator.method();

    result.volume = Impl::allocateVolume(sequence, gridPositions, params.thickness);

    const auto inPlane = sequence.imageSize();
    const std::size_t width = inPlane[0];
    const std::size_t height = inPlane[1];
    const std::size_t pixelsPerSlice = width * height;
    const std::size_t gridCount = gridPositions.size();

    std::vector<const float*> sources;
    sources.reserve(members.size());
    for (std::size_t i : members) {
        sources.push_back(sequence.slices[i].image->GetBufferPointer());
    }
    float* output = result.volume->GetBufferPointer();

    auto processBand = [&](std::size_t rowBegin, std::size_t rowEnd) {
        BandResult band;
        try {
            std::vector<float> samples(sources.size());
            std::vector<float> column(gridCount);
            for (std::size_t y = rowBegin; y < rowEnd; ++y) {
                for (std::size_t x = 0; x < width; ++x) {
                    const std::size_t pixel = y * width + x;
                    for (std::size_t j = 0; j < sources.size(); ++j) {
                        samples[j] = sources[j][pixel];
                    }
                    if (!interpolator.interpolate(samples, column)) {
                        if (!linear.interpolate(samples, column)) {
                            band.failed = true;
                            return band;
                        }
                        ++band.fallbackPixels;
                    }
                    for (std::size_t k = 0; k < gridCount; ++k) {
                        output[k * pixelsPerSlice + pixel] = column[k];
                    }
                }
            }
        } catch (const std::exception& e) {
            getLogger()->error("State {}: rows [{}, {}) failed: {}",
                               state, rowBegin, rowEnd, e.what());
            band.failed = true;
        }
        return band;
    };

    const auto workers = static_cast<std::size_t>(resolveWorkerCount(params.workers));
    const std::size_t bandCount = std::min(workers, height);
    const std::size_t rowsPerBand = (height + bandCount - 1) / bandCount;

    std::vector<std::future<BandResult>> futures;
    futures.reserve(bandCount);
    for (std::size_t b = 0; b < bandCount; ++b) {
        std::size_t rowBegin = b * rowsPerBand;
        std::size_t rowEnd = std::min(height, rowBegin + rowsPerBand);
        if (rowBegin >= rowEnd) {
            break;
        }
        futures.push_back(std::async(std::launch::async, processBand, rowBegin, rowEnd));
    }

    for (auto& future : futures) {
        BandResult band = future.get();
        result.fallbackPixels += band.fallbackPixels;
        if (band.failed) {
            ++result.failedPartitions;
        }
    }

    if (result.fallbackPixels > 0 && interpolator.isSolvable()) {
        getLogger()->warn("State {}: {} pixels fell back to fast_linear",
                          state, result.fallbackPixels);
    }
    if (result.failedPartitions > 0) {
        getLogger()->error("State {}: {} of {} partitions failed",
                           state, result.failedPartitions, futures.size());
    }
    getLogger()->debug("State {}: {} slices at {} positions -> {} grid points ({} tasks)",
                       state, result.sliceCount, result.distinctPositions,
                       gridCount, futures.size());

    return result;
}

std::expected<ResamplingResult, ReconError> VolumeResampler::resample(
    const core::SliceSequence& sequence,
    const StateAssignment& assignment,
    const Parameters& params) const
{
    if (auto valid = Impl::validate(sequence, assignment, params); !valid) {
        return std::unexpected(valid.error());
    }

    double zMin = 0.0;
    double zMax = 0.0;
    bool any = false;
    for (std::size_t i = 0; i < sequence.size(); ++i) {
        if (assignment.stateOfSlice[i] == StateAssignment::kUnassigned) {
            continue;
        }
        double z = sequence.slices[i].position;
        if (!any) {
            zMin = zMax = z;
            any = true;
        } else {
            zMin = std::min(zMin, z);
            zMax = std::max(zMax, z);
        }
    }
    if (!any) {
        return std::unexpected(ReconError{
            ReconError::Code::InvalidInput, "No slice is assigned to a state"
        });
    }

    ResamplingResult result;
    result.thickness = params.thickness;
    result.method = params.method;
    result.gridPositions = buildGrid(zMin, zMax, params.thickness);

    getLogger()->info("Resampling {} states with {} onto {} slices of {:.2f} mm "
                      "([{:.2f}, {:.2f}] mm, {} workers)",
                      assignment.nStates, methodToString(params.method),
                      result.gridPositions.size(), params.thickness, zMin, zMax,
                      resolveWorkerCount(params.workers));

    IsotropicResampler inPlane;
    IsotropicResampler::Parameters inPlaneParams;
    inPlaneParams.targetSpacing = params.thickness;
    inPlaneParams.interpolation = params.inPlaneInterpolation;
    inPlaneParams.splineOrder = params.splineOrder;

    const double stateShare = 1.0 / assignment.nStates;
    double stateStart = 0.0;
    if (impl_->progressCallback) {
        inPlane.setProgressCallback([this, &stateStart, stateShare](double p) {
            impl_->reportProgress(stateStart + stateShare * (0.5 + 0.5 * p));
        });
    }

    for (int s = 0; s < assignment.nStates; ++s) {
        stateStart = s * stateShare;
        auto state = resampleState(sequence, assignment, s, result.gridPositions, params);
        if (!state) {
            return std::unexpected(state.error());
        }

        if (params.isotropicInPlane
            && IsotropicResampler::needsResampling(state->volume, params.thickness)) {
            auto isotropic = inPlane.resample(state->volume, inPlaneParams);
            if (!isotropic) {
                getLogger()->error("State {}: in-plane resampling failed: {}",
                                   s, isotropic.error().toString());
                return std::unexpected(isotropic.error());
            }
            state->volume = isotropic.value();
        }

        result.states.push_back(std::move(state.value()));
        impl_->reportProgress(static_cast<double>(s + 1) / assignment.nStates);
    }

    std::size_t fallback = 0;
    std::size_t failed = 0;
    for (const auto& state : result.states) {
        fallback += state.fallbackPixels;
        failed += state.failedPartitions;
    }
    if (failed > 0) {
        getLogger()->warn("Resampling finished with {} failed partitions", failed);
    } else {
        getLogger()->info("Resampling finished ({} fallback pixels)", fallback);
    }

    return result;
}

}  // namespace sweep_recon::services
