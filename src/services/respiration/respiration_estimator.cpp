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

#include "services/respiration/respiration_estimator.hpp"

#include <algorithm>
#include <cmath>
#include <complex>
#include <numeric>

#include <itkBinaryThresholdImageFilter.h>
#include <itkConnectedComponentImageFilter.h>
#include <itkImageRegionConstIterator.h>
#include <itkImageRegionIterator.h>
#include <itkMedianImageFilter.h>
#include <itkNumericTraits.h>
#include <vnl/algo/vnl_fft_1d.h>

#include "core/logging.hpp"

namespace {

auto& getLogger() {
    static auto logger =
        sweep_recon::logging::LoggerFactory::create("RespirationEstimator");
    return logger;
}

using ImageType = sweep_recon::core::Slice::ImageType;
using MaskType = itk::Image<unsigned char, 2>;
using LabelType = itk::Image<unsigned int, 2>;

/// Pixel value at (x, y) of a 2D slice
float pixelAt(const ImageType* image, std::size_t x, std::size_t y) {
    ImageType::IndexType idx;
    idx[0] = static_cast<ImageType::IndexValueType>(x);
    idx[1] = static_cast<ImageType::IndexValueType>(y);
    return image->GetPixel(idx);
}

/// Median filter one slice, returns the input when radius is 0
ImageType::Pointer medianFiltered(ImageType::Pointer image, unsigned int radius) {
    if (radius == 0) {
        return image;
    }
    using FilterType = itk::MedianImageFilter<ImageType, ImageType>;
    auto filter = FilterType::New();
    FilterType::InputSizeType filterRadius;
    filterRadius.Fill(radius);
    filter->SetRadius(filterRadius);
    filter->SetInput(image);
    filter->Update();
    return filter->GetOutput();
}

/// Smallest length >= n with no prime factor other than 2, 3 and 5
std::size_t fftLength(std::size_t n) {
    for (std::size_t m = std::max<std::size_t>(n, 1);; ++m) {
        std::size_t r = m;
        for (std::size_t p : {std::size_t{2}, std::size_t{3}, std::size_t{5}}) {
            while (r % p == 0) {
                r /= p;
            }
        }
        if (r == 1) {
            return m;
        }
    }
}

/**
 * @brief Body mask of one median-filtered slice
 *
 * Pixels at or below the threshold form the background candidates. The
 * first and last rows are forced to background, and only candidates
 * 4-connected to either row stay background. The mask is 1 on body pixels
 * inside [firstColumn, endColumn) and 0 elsewhere.
 */
MaskType::Pointer bodyMaskOf(ImageType::Pointer filtered, double threshold,
                             std::size_t firstColumn, std::size_t endColumn)
{
    using ThresholdType = itk::BinaryThresholdImageFilter<ImageType, MaskType>;
    auto background = ThresholdType::New();
    background->SetInput(filtered);
    background->SetLowerThreshold(itk::NumericTraits<float>::NonpositiveMin());
    background->SetUpperThreshold(static_cast<float>(threshold));
    background->SetInsideValue(1);
    background->SetOutsideValue(0);
    background->Update();

    MaskType::Pointer candidates = background->GetOutput();
    candidates->DisconnectPipeline();

    const auto size = candidates->GetLargestPossibleRegion().GetSize();
    const auto lastRow = static_cast<MaskType::IndexValueType>(size[1] - 1);
    for (std::size_t x = 0; x < size[0]; ++x) {
        MaskType::IndexType top;
        top[0] = static_cast<MaskType::IndexValueType>(x);
        top[1] = 0;
        MaskType::IndexType bottom = top;
        bottom[1] = lastRow;
        candidates->SetPixel(top, 1);
        candidates->SetPixel(bottom, 1);
    }

    using ComponentType = itk::ConnectedComponentImageFilter<MaskType, LabelType>;
    auto components = ComponentType::New();
    components->SetInput(candidates);
    components->FullyConnectedOff();
    components->SetBackgroundValue(0);
    components->Update();
    LabelType::Pointer labels = components->GetOutput();

    MaskType::IndexType corner;
    corner[0] = 0;
    corner[1] = 0;
    const unsigned int topLabel = labels->GetPixel(corner);
    corner[1] = lastRow;
    const unsigned int bottomLabel = labels->GetPixel(corner);

    auto mask = MaskType::New();
    mask->SetRegions(candidates->GetLargestPossibleRegion());
    mask->CopyInformation(candidates);
    mask->Allocate();

    itk::ImageRegionConstIterator<LabelType> in(labels, labels->GetLargestPossibleRegion());
    itk::ImageRegionIterator<MaskType> out(mask, mask->GetLargestPossibleRegion());
    for (; !in.IsAtEnd(); ++in, ++out) {
        const auto x = static_cast<std::size_t>(out.GetIndex()[0]);
        const bool isBackground = in.Get() == topLabel || in.Get() == bottomLabel;
        out.Set(!isBackground && x >= firstColumn && x < endColumn ? 1 : 0);
    }
    return mask;
}

/// Normalized cross-correlation of two slices over a column band
double normalizedCrossCorrelation(const ImageType* a, const ImageType* b,
                                  const sweep_recon::services::RespiratoryRoi& roi,
                                  std::size_t rows) {
    double sumA = 0.0, sumB = 0.0;
    std::size_t n = 0;
    for (std::size_t y = 0; y < rows; ++y) {
        for (std::size_t x = roi.startColumn; x < roi.endColumn(); ++x) {
            sumA += pixelAt(a, x, y);
            sumB += pixelAt(b, x, y);
            ++n;
        }
    }
    if (n == 0) {
        return 0.0;
    }
    double meanA = sumA / static_cast<double>(n);
    double meanB = sumB / static_cast<double>(n);

    double cov = 0.0, varA = 0.0, varB = 0.0;
    for (std::size_t y = 0; y < rows; ++y) {
        for (std::size_t x = roi.startColumn; x < roi.endColumn(); ++x) {
            double da = pixelAt(a, x, y) - meanA;
            double db = pixelAt(b, x, y) - meanB;
            cov += da * db;
            varA += da * da;
            varB += db * db;
        }
    }
    if (varA <= 0.0 || varB <= 0.0) {
        return 0.0;
    }
    return cov / std::sqrt(varA * varB);
}

}  // anonymous namespace

namespace sweep_recon::services {

long PositionIndex::keyOf(double position) const {
    // Small epsilon keeps positions lying exactly on a bin edge in that bin
    return static_cast<long>(std::floor((position - originPosition) / binWidth + 1e-9));
}

std::size_t PositionIndex::visitsOf(long key) const {
    auto it = bins.find(key);
    return it == bins.end() ? 0 : it->second.size();
}

/**
 * @brief PIMPL implementation for RespirationEstimator
 */
class RespirationEstimator::Impl {
public:
    std::vector<MaskType::Pointer> bodyMasks(const core::SliceSequence& sequence,
                                             const RespiratoryRoi& roi,
                                             unsigned int medianRadius) const;

    std::vector<double> bodyArea(const core::SliceSequence& sequence,
                                 const RespiratoryRoi& roi,
                                 unsigned int medianRadius) const;

    std::vector<double> intensityCentroid(const core::SliceSequence& sequence,
                                          const RespiratoryRoi& roi) const;

    std::vector<double> referenceCorrelation(const core::SliceSequence& sequence,
                                             const RespiratoryRoi& roi,
                                             const PositionIndex& index) const;
};

std::vector<MaskType::Pointer> RespirationEstimator::Impl::bodyMasks(
    const core::SliceSequence& sequence,
    const RespiratoryRoi& roi,
    unsigned int medianRadius) const
{
    auto rows = sequence.imageSize()[1];

    std::vector<ImageType::Pointer> filtered;
    filtered.reserve(sequence.size());
    for (const auto& slice : sequence.slices) {
        filtered.push_back(medianFiltered(slice.image, medianRadius));
    }

    // Background statistics from the first and last rows of every slice
    double sum = 0.0, sumSq = 0.0;
    std::size_t n = 0;
    for (const auto& image : filtered) {
        for (std::size_t y : {std::size_t{0}, rows - 1}) {
            for (std::size_t x = roi.startColumn; x < roi.endColumn(); ++x) {
                double v = pixelAt(image.GetPointer(), x, y);
                sum += v;
                sumSq += v * v;
                ++n;
            }
        }
    }
    double mean = sum / static_cast<double>(n);
    double variance = std::max(0.0, sumSq / static_cast<double>(n) - mean * mean);
    double threshold = mean
        + respiration_constants::kBackgroundStdFactor * std::sqrt(variance);

    // Lateral edges of the band tend to cut through arms and coil signal
    const auto margin = static_cast<std::size_t>(
        respiration_constants::kBodyEdgeCropFraction
        * static_cast<double>(roi.columnCount));
    const std::size_t first = roi.startColumn + margin;
    const std::size_t end = roi.endColumn() > first + margin
        ? roi.endColumn() - margin
        : first;

    getLogger()->debug("Body mask background threshold {:.3f}, columns [{}, {})",
                       threshold, first, end);

    std::vector<MaskType::Pointer> masks;
    masks.reserve(filtered.size());
    for (const auto& image : filtered) {
        masks.push_back(bodyMaskOf(image, threshold, first, end));
    }
    return masks;
}

std::vector<double> RespirationEstimator::Impl::bodyArea(
    const core::SliceSequence& sequence,
    const RespiratoryRoi& roi,
    unsigned int medianRadius) const
{
    auto masks = bodyMasks(sequence, roi, medianRadius);

    std::vector<double> area(masks.size(), 0.0);
    for (std::size_t i = 0; i < masks.size(); ++i) {
        std::size_t count = 0;
        itk::ImageRegionConstIterator<MaskType> it(
            masks[i], masks[i]->GetLargestPossibleRegion());
        for (; !it.IsAtEnd(); ++it) {
            count += it.Get();
        }
        area[i] = static_cast<double>(count);
    }
    return area;
}

std::vector<double> RespirationEstimator::Impl::intensityCentroid(
    const core::SliceSequence& sequence,
    const RespiratoryRoi& roi) const
{
    auto rows = sequence.imageSize()[1];
    std::vector<double> centroid(sequence.size(), 0.0);

    for (std::size_t i = 0; i < sequence.size(); ++i) {
        const auto* image = sequence.slices[i].image.GetPointer();
        double weighted = 0.0, total = 0.0;
        for (std::size_t y = 0; y < rows; ++y) {
            for (std::size_t x = roi.startColumn; x < roi.endColumn(); ++x) {
                double v = std::max(0.0f, pixelAt(image, x, y));
                weighted += v * static_cast<double>(y);
                total += v;
            }
        }
        centroid[i] = total > 0.0
            ? weighted / total
            : 0.5 * static_cast<double>(rows - 1);
    }
    return centroid;
}

std::vector<double> RespirationEstimator::Impl::referenceCorrelation(
    const core::SliceSequence& sequence,
    const RespiratoryRoi& roi,
    const PositionIndex& index) const
{
    auto rows = sequence.imageSize()[1];
    std::vector<double> ncc(sequence.size(), 1.0);

    for (const auto& [key, members] : index.bins) {
        const auto* reference = sequence.slices[members.front()].image.GetPointer();
        for (std::size_t m = 1; m < members.size(); ++m) {
            ncc[members[m]] = normalizedCrossCorrelation(
                reference, sequence.slices[members[m]].image.GetPointer(), roi, rows);
        }
    }
    return ncc;
}

RespirationEstimator::RespirationEstimator()
    : impl_(std::make_unique<Impl>()) {}

RespirationEstimator::~RespirationEstimator() = default;

RespirationEstimator::RespirationEstimator(RespirationEstimator&&) noexcept = default;
RespirationEstimator& RespirationEstimator::operator=(RespirationEstimator&&) noexcept
    = default;

std::expected<RespirationSignal, ReconError>
RespirationEstimator::estimate(const core::SliceSequence& sequence) const {
    return estimate(sequence, Parameters{});
}

std::expected<RespirationSignal, ReconError>
RespirationEstimator::estimate(const core::SliceSequence& sequence,
                               const Parameters& params) const
{
    if (!params.isValid()) {
        getLogger()->error("Invalid respiration estimation parameters");
        return std::unexpected(ReconError{
            ReconError::Code::InvalidConfiguration,
            "Invalid respiration estimation parameters"
        });
    }

    if (sequence.empty()) {
        getLogger()->error("Slice sequence is empty");
        return std::unexpected(ReconError{
            ReconError::Code::InvalidInput, "Slice sequence is empty"
        });
    }

    auto [cols, rows] = sequence.imageSize();
    for (std::size_t i = 0; i < sequence.size(); ++i) {
        const auto& slice = sequence.slices[i];
        if (!slice.image) {
            return std::unexpected(ReconError{
                ReconError::Code::InvalidInput,
                "Slice " + std::to_string(i) + " has no image"
            });
        }
        auto size = slice.image->GetLargestPossibleRegion().GetSize();
        if (size[0] != cols || size[1] != rows) {
            return std::unexpected(ReconError{
                ReconError::Code::InvalidInput,
                "Slice " + std::to_string(i) + " differs in image size"
            });
        }
        if (i > 0 && slice.acquisitionIndex <= sequence.slices[i - 1].acquisitionIndex) {
            return std::unexpected(ReconError{
                ReconError::Code::InvalidInput,
                "Slices are not strictly ordered by acquisition index at slice "
                    + std::to_string(i)
            });
        }
    }
    if (cols == 0 || rows < 2) {
        return std::unexpected(ReconError{
            ReconError::Code::InvalidInput, "Slice images are too small"
        });
    }

    double binWidth = params.positionBinWidth > 0.0
        ? params.positionBinWidth
        : sequence.nominalSliceSpacing;
    if (binWidth <= 0.0) {
        return std::unexpected(ReconError{
            ReconError::Code::InvalidConfiguration,
            "Position bin width must be positive"
        });
    }

    getLogger()->info("Estimating respiration: {} slices, feature={}, bin width={:.3f} mm",
                      sequence.size(), featureToString(params.feature), binWidth);

    try {
        auto index = buildPositionIndex(sequence, binWidth);
        const double rate = effectiveSamplingRate(sequence, params);

        RespiratoryRoi roi{0, cols};
        if (params.detectRespiratoryRoi) {
            roi = detectRespiratoryRoi(sequence, params);
        }

        std::vector<double> raw;
        switch (params.feature) {
            case SurrogateFeature::BodyArea:
                raw = impl_->bodyArea(sequence, roi, params.medianRadius);
                break;
            case SurrogateFeature::IntensityCentroid:
                raw = impl_->intensityCentroid(sequence, roi);
                break;
            case SurrogateFeature::ReferenceCorrelation:
                raw = impl_->referenceCorrelation(sequence, roi, index);
                break;
        }

        // Remove per-position anatomy; rarely visited positions become gaps
        std::vector<double> centered(raw.size(), 0.0);
        std::vector<bool> valid(raw.size(), false);
        std::size_t gapPositions = 0;
        for (const auto& [key, members] : index.bins) {
            if (members.size() < static_cast<std::size_t>(params.minVisitsPerPosition)) {
                ++gapPositions;
                continue;
            }
            double mean = 0.0;
            for (std::size_t m : members) {
                mean += raw[m];
            }
            mean /= static_cast<double>(members.size());
            for (std::size_t m : members) {
                centered[m] = raw[m] - mean;
                valid[m] = true;
            }
        }

        if (std::none_of(valid.begin(), valid.end(), [](bool v) { return v; })) {
            getLogger()->error("No slice position visited at least {} times",
                               params.minVisitsPerPosition);
            return std::unexpected(ReconError{
                ReconError::Code::InvalidInput,
                "No slice position is visited often enough for a local trace"
            });
        }

        RespirationSignal signal;
        for (std::size_t i = 0; i < valid.size(); ++i) {
            if (!valid[i]) {
                signal.gapFilledIndices.push_back(sequence.slices[i].acquisitionIndex);
            }
        }
        if (gapPositions > 0) {
            getLogger()->warn("{} of {} positions visited fewer than {} times; "
                              "{} slices interpolated from neighbours",
                              gapPositions, index.bins.size(),
                              params.minVisitsPerPosition,
                              signal.gapFilledIndices.size());
        }

        const int trendWindow = resolveTrendWindow(params.trendWindow, rate);
        auto trace = fillGaps(centered, valid);
        trace = removeTrend(trace, trendWindow);
        trace = smooth(trace, params.smoothingSigma);
        trace = normalize(trace);

        signal.rawFeature = std::move(raw);
        signal.roi = roi;
        signal.samplingRateHz = rate;
        signal.trendWindow = trendWindow > 1 ? trendWindow : 0;
        signal.samples.reserve(trace.size());
        for (std::size_t i = 0; i < trace.size(); ++i) {
            signal.samples.push_back({sequence.slices[i].acquisitionIndex, trace[i]});
        }

        getLogger()->info("Respiration estimated: {} positions, ROI columns [{}, {}), "
                          "detrend window {} samples",
                          index.bins.size(), roi.startColumn, roi.endColumn(),
                          signal.trendWindow);
        return signal;
    }
    catch (const itk::ExceptionObject& e) {
        getLogger()->error("ITK exception: {}", e.GetDescription());
        return std::unexpected(ReconError{
            ReconError::Code::ProcessingFailed,
            std::string("ITK exception: ") + e.GetDescription()
        });
    }
}

RespiratoryRoi RespirationEstimator::detectRespiratoryRoi(
    const core::SliceSequence& sequence, const Parameters& params) const
{
    auto [cols, rows] = sequence.imageSize();
    RespiratoryRoi full{0, cols};

    const std::size_t frames = sequence.size();
    const double fs = effectiveSamplingRate(sequence, params);
    if (fs <= 0.0 || frames < 8 || cols == 0) {
        getLogger()->debug("Respiratory ROI disabled: sampling rate {:.2f} Hz, {} frames",
                           fs, frames);
        return full;
    }

    // Zero padded to a length the VNL FFT factorizes
    const std::size_t length = fftLength(frames);
    const double df = fs / static_cast<double>(length);
    auto kMin = static_cast<std::size_t>(
        std::ceil(respiration_constants::kRespirationBandMinHz / df));
    auto kMax = static_cast<std::size_t>(
        std::floor(respiration_constants::kRespirationBandMaxHz / df));
    kMin = std::max<std::size_t>(kMin, 1);
    kMax = std::min(kMax, length / 2);
    if (kMin > kMax) {
        getLogger()->debug("Respiratory band not resolved at {:.2f} Hz", fs);
        return full;
    }

    // Fraction of each column's temporal energy inside the respiratory band
    vnl_fft_1d<double> fft(static_cast<int>(length));
    std::vector<double> bandFraction(cols, 0.0);
    std::vector<double> series(frames);
    std::vector<std::complex<double>> spectrum(length);
    for (std::size_t x = 0; x < cols; ++x) {
        for (std::size_t t = 0; t < frames; ++t) {
            const auto* image = sequence.slices[t].image.GetPointer();
            double s = 0.0;
            for (std::size_t y = 0; y < rows; ++y) {
                s += pixelAt(image, x, y);
            }
            series[t] = s / static_cast<double>(rows);
        }
        double mean = std::accumulate(series.begin(), series.end(), 0.0)
                      / static_cast<double>(frames);
        double total = 0.0;
        std::fill(spectrum.begin(), spectrum.end(), std::complex<double>{});
        for (std::size_t t = 0; t < frames; ++t) {
            double v = series[t] - mean;
            spectrum[t] = v;
            total += v * v;
        }
        if (total <= 0.0) {
            continue;
        }

        fft.fwd_transform(spectrum);
        double band = 0.0;
        for (std::size_t k = kMin; k <= kMax; ++k) {
            band += std::norm(spectrum[k]);
        }
        // Parseval: sum over all bins of |X_k|^2 = N * sum |x_t|^2; one side only
        bandFraction[x] = 2.0 * band / (static_cast<double>(length) * total);
    }

    const auto window = std::max<std::size_t>(
        1, static_cast<std::size_t>(static_cast<double>(cols) * params.roiFraction * 1.2));
    const auto halfWidth = std::max<std::size_t>(
        1, static_cast<std::size_t>(static_cast<double>(cols) * params.roiFraction * 0.5));

    std::vector<double> windowed(cols, 0.0);
    for (std::size_t x = 0; x < cols; ++x) {
        std::size_t lo = x >= window / 2 ? x - window / 2 : 0;
        std::size_t hi = std::min(cols, lo + window);
        for (std::size_t j = lo; j < hi; ++j) {
            windowed[x] += bandFraction[j];
        }
    }

    // Centre of the plateau around the first maximum
    auto peak = static_cast<std::size_t>(
        std::max_element(windowed.begin(), windowed.end()) - windowed.begin());
    const double tolerance = 1e-9 * std::max(1.0, windowed[peak]);
    std::size_t plateauEnd = peak;
    while (plateauEnd + 1 < cols && windowed[plateauEnd + 1] >= windowed[peak] - tolerance) {
        ++plateauEnd;
    }
    std::size_t plateauStart = peak;
    while (plateauStart > 0 && windowed[plateauStart - 1] >= windowed[peak] - tolerance) {
        --plateauStart;
    }
    const std::size_t centre = (plateauStart + plateauEnd) / 2;

    std::size_t start = centre >= halfWidth ? centre - halfWidth : 0;
    std::size_t end = std::min(cols, centre + halfWidth);
    if (end <= start) {
        return full;
    }

    getLogger()->info("Respiratory ROI: columns [{}, {}) of {} ({:.2f} Hz, {}-point FFT)",
                      start, end, cols, fs, length);
    return RespiratoryRoi{start, end - start};
}

std::expected<std::vector<core::Slice::ImageType::Pointer>, ReconError>
RespirationEstimator::bodyMasks(const core::SliceSequence& sequence,
                                const RespiratoryRoi& roi,
                                const Parameters& params) const
{
    auto [cols, rows] = sequence.imageSize();
    if (sequence.empty() || cols == 0 || rows < 2) {
        return std::unexpected(ReconError{
            ReconError::Code::InvalidInput, "Slice sequence is empty"
        });
    }
    if (roi.columnCount == 0 || roi.endColumn() > cols) {
        return std::unexpected(ReconError{
            ReconError::Code::InvalidInput,
            "Respiratory ROI lies outside the image"
        });
    }

    try {
        auto masks = impl_->bodyMasks(sequence, roi, params.medianRadius);

        std::vector<ImageType::Pointer> images;
        images.reserve(masks.size());
        for (const auto& mask : masks) {
            auto image = ImageType::New();
            image->SetRegions(mask->GetLargestPossibleRegion());
            image->CopyInformation(mask);
            image->Allocate();
            itk::ImageRegionConstIterator<MaskType> in(mask, mask->GetLargestPossibleRegion());
            itk::ImageRegionIterator<ImageType> out(image, image->GetLargestPossibleRegion());
            for (; !in.IsAtEnd(); ++in, ++out) {
                out.Set(static_cast<float>(in.Get()));
            }
            images.push_back(image);
        }
        return images;
    }
    catch (const itk::ExceptionObject& e) {
        getLogger()->error("ITK exception: {}", e.GetDescription());
        return std::unexpected(ReconError{
            ReconError::Code::ProcessingFailed,
            std::string("ITK exception: ") + e.GetDescription()
        });
    }
}

double RespirationEstimator::effectiveSamplingRate(
    const core::SliceSequence& sequence, const Parameters& params) noexcept
{
    return params.samplingRateHz > 0.0 ? params.samplingRateHz
                                       : sequence.samplingRateHz();
}

int RespirationEstimator::resolveTrendWindow(int trendWindow,
                                             double samplingRateHz) noexcept
{
    if (trendWindow != respiration_constants::kAutoTrendWindow) {
        return trendWindow;
    }
    if (samplingRateHz <= 0.0) {
        return respiration_constants::kDefaultTrendWindow;
    }
    auto window = static_cast<int>(std::lround(
        samplingRateHz / respiration_constants::kRespirationBandMinHz));
    return std::max(3, window);
}

void RespirationEstimator::annotate(core::SliceSequence& sequence,
                                    const RespirationSignal& signal)
{
    std::size_t n = std::min(sequence.size(), signal.size());
    for (std::size_t i = 0; i < n; ++i) {
        sequence.slices[i].surrogate = signal.samples[i].surrogate;
    }
}

PositionIndex RespirationEstimator::buildPositionIndex(
    const core::SliceSequence& sequence, double binWidth)
{
    PositionIndex index;
    index.binWidth = binWidth;
    if (sequence.empty() || binWidth <= 0.0) {
        return index;
    }

    index.originPosition = std::min_element(
        sequence.slices.begin(), sequence.slices.end(),
        [](const core::Slice& a, const core::Slice& b) {
            return a.position < b.position;
        })->position;

    for (std::size_t i = 0; i < sequence.size(); ++i) {
        index.bins[index.keyOf(sequence.slices[i].position)].push_back(i);
    }

    for (auto& [key, members] : index.bins) {
        std::stable_sort(members.begin(), members.end(),
                         [&sequence](std::size_t a, std::size_t b) {
                             return sequence.slices[a].acquisitionIndex
                                    < sequence.slices[b].acquisitionIndex;
                         });
    }
    return index;
}

std::vector<double> RespirationEstimator::fillGaps(
    const std::vector<double>& values, const std::vector<bool>& valid)
{
    std::vector<double> out = values;
    const std::size_t n = values.size();

    std::vector<std::size_t> anchors;
    for (std::size_t i = 0; i < n && i < valid.size(); ++i) {
        if (valid[i]) {
            anchors.push_back(i);
        }
    }
    if (anchors.empty()) {
        return out;
    }

    for (std::size_t i = 0; i < anchors.front(); ++i) {
        out[i] = values[anchors.front()];
    }
    for (std::size_t i = anchors.back() + 1; i < n; ++i) {
        out[i] = values[anchors.back()];
    }
    for (std::size_t a = 0; a + 1 < anchors.size(); ++a) {
        std::size_t lo = anchors[a];
        std::size_t hi = anchors[a + 1];
        for (std::size_t i = lo + 1; i < hi; ++i) {
            double t = static_cast<double>(i - lo) / static_cast<double>(hi - lo);
            out[i] = values[lo] + t * (values[hi] - values[lo]);
        }
    }
    return out;
}

std::vector<double> RespirationEstimator::removeTrend(
    const std::vector<double>& values, int window)
{
    if (window <= 1 || values.empty()) {
        return values;
    }
    const auto n = static_cast<long>(values.size());
    const long half = window / 2;

    std::vector<double> prefix(values.size() + 1, 0.0);
    for (std::size_t i = 0; i < values.size(); ++i) {
        prefix[i + 1] = prefix[i] + values[i];
    }

    std::vector<double> out(values.size());
    for (long i = 0; i < n; ++i) {
        long lo = std::max(0L, i - half);
        long hi = std::min(n, i + half + 1);
        double trend = (prefix[static_cast<std::size_t>(hi)]
                        - prefix[static_cast<std::size_t>(lo)])
                       / static_cast<double>(hi - lo);
        out[static_cast<std::size_t>(i)] = values[static_cast<std::size_t>(i)] - trend;
    }
    return out;
}

std::vector<double> RespirationEstimator::smooth(
    const std::vector<double>& values, double sigma)
{
    if (sigma <= 0.0 || values.empty()) {
        return values;
    }
    const auto radius = static_cast<long>(std::ceil(3.0 * sigma));
    std::vector<double> kernel(static_cast<std::size_t>(2 * radius + 1));
    for (long k = -radius; k <= radius; ++k) {
        kernel[static_cast<std::size_t>(k + radius)] =
            std::exp(-0.5 * static_cast<double>(k * k) / (sigma * sigma));
    }

    const auto n = static_cast<long>(values.size());
    std::vector<double> out(values.size());
    for (long i = 0; i < n; ++i) {
        double acc = 0.0, weight = 0.0;
        for (long k = -radius; k <= radius; ++k) {
            long j = i + k;
            if (j < 0 || j >= n) {
                continue;
            }
            double w = kernel[static_cast<std::size_t>(k + radius)];
            acc += w * values[static_cast<std::size_t>(j)];
            weight += w;
        }
        out[static_cast<std::size_t>(i)] = acc / weight;
    }
    return out;
}

std::vector<double> RespirationEstimator::normalize(const std::vector<double>& values) {
    if (values.empty()) {
        return values;
    }
    auto [minIt, maxIt] = std::minmax_element(values.begin(), values.end());
    double lo = *minIt;
    double range = *maxIt - lo;

    std::vector<double> out(values.size(), 0.0);
    if (range <= 0.0) {
        return out;
    }
    for (std::size_t i = 0; i < values.size(); ++i) {
        out[i] = 2.0 * (values[i] - lo) / range - 1.0;
    }
    return out;
}

}  // namespace sweep_recon::services
