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

#include "services/preprocessing/isotropic_resampler.hpp"

#include <cmath>

#include <itkBSplineInterpolateImageFunction.h>
#include <itkCommand.h>
#include <itkIdentityTransform.h>
#include <itkLinearInterpolateImageFunction.h>
#include <itkNearestNeighborInterpolateImageFunction.h>
#include <itkResampleImageFilter.h>

#include "core/logging.hpp"

namespace sweep_recon::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("IsotropicResampler");
    return logger;
}

/**
 * @brief ITK progress observer for resampling callback integration
 */
class ResampleProgressObserver : public itk::Command {
public:
    using Self = ResampleProgressObserver;
    using Superclass = itk::Command;
    using Pointer = itk::SmartPointer<Self>;

    itkNewMacro(Self);

    void setCallback(IsotropicResampler::ProgressCallback callback) {
        callback_ = std::move(callback);
    }

    void Execute(itk::Object* caller, const itk::EventObject& event) override {
        Execute(static_cast<const itk::Object*>(caller), event);
    }

    void Execute(const itk::Object* caller, const itk::EventObject& event) override {
        if (!callback_) return;

        if (itk::ProgressEvent().CheckEvent(&event)) {
            const auto* process = dynamic_cast<const itk::ProcessObject*>(caller);
            if (process) {
                callback_(process->GetProgress());
            }
        }
    }

private:
    IsotropicResampler::ProgressCallback callback_;
};

/// In-plane output size; the slice axis is left untouched
IsotropicResampler::VolumeType::SizeType calculateOutputSize(
    IsotropicResampler::VolumeType::Pointer input,
    double targetSpacing
) {
    using SizeValueType = IsotropicResampler::VolumeType::SizeType::SizeValueType;
    auto inputSize = input->GetLargestPossibleRegion().GetSize();
    auto inputSpacing = input->GetSpacing();

    IsotropicResampler::VolumeType::SizeType outputSize = inputSize;
    for (unsigned int i = 0; i < 2; ++i) {
        outputSize[i] = static_cast<SizeValueType>(
            std::ceil(inputSize[i] * inputSpacing[i] / targetSpacing - 1e-9)
        );
        if (outputSize[i] < 1) {
            outputSize[i] = 1;
        }
    }
    return outputSize;
}

}  // anonymous namespace

/**
 * @brief PIMPL implementation for IsotropicResampler
 */
class IsotropicResampler::Impl {
public:
    ProgressCallback progressCallback;
};

IsotropicResampler::IsotropicResampler()
    : impl_(std::make_unique<Impl>()) {}

IsotropicResampler::~IsotropicResampler() = default;

IsotropicResampler::IsotropicResampler(IsotropicResampler&&) noexcept = default;

IsotropicResampler& IsotropicResampler::operator=(IsotropicResampler&&) noexcept = default;

void IsotropicResampler::setProgressCallback(ProgressCallback callback) {
    impl_->progressCallback = std::move(callback);
}

std::expected<IsotropicResampler::VolumeType::Pointer, ReconError>
IsotropicResampler::resample(
    VolumeType::Pointer input,
    const Parameters& params
) const {
    if (!input) {
        return std::unexpected(ReconError{
            ReconError::Code::InvalidInput,
            "Input volume is null"
        });
    }

    if (!params.isValid()) {
        return std::unexpected(ReconError{
            ReconError::Code::InvalidConfiguration,
            "Invalid resampling parameters: check targetSpacing (> 0) "
            "and splineOrder (2-5)"
        });
    }

    try {
        auto outputSize = calculateOutputSize(input, params.targetSpacing);

        VolumeType::SpacingType outputSpacing = input->GetSpacing();
        outputSpacing[0] = params.targetSpacing;
        outputSpacing[1] = params.targetSpacing;

        using TransformType = itk::IdentityTransform<double, 3>;
        using ResampleFilterType = itk::ResampleImageFilter<VolumeType, VolumeType>;

        auto resampleFilter = ResampleFilterType::New();
        resampleFilter->SetInput(input);
        resampleFilter->SetSize(outputSize);
        resampleFilter->SetOutputSpacing(outputSpacing);
        resampleFilter->SetOutputOrigin(input->GetOrigin());
        resampleFilter->SetOutputDirection(input->GetDirection());
        resampleFilter->SetTransform(TransformType::New());
        resampleFilter->SetDefaultPixelValue(static_cast<float>(params.defaultValue));

        switch (params.interpolation) {
            case Interpolation::NearestNeighbor: {
                using InterpolatorType =
                    itk::NearestNeighborInterpolateImageFunction<VolumeType, double>;
                resampleFilter->SetInterpolator(InterpolatorType::New());
                break;
            }
            case Interpolation::Linear: {
                using InterpolatorType =
                    itk::LinearInterpolateImageFunction<VolumeType, double>;
                resampleFilter->SetInterpolator(InterpolatorType::New());
                break;
            }
            case Interpolation::BSpline: {
                using InterpolatorType =
                    itk::BSplineInterpolateImageFunction<VolumeType, double>;
                auto interpolator = InterpolatorType::New();
                interpolator->SetSplineOrder(params.splineOrder);
                resampleFilter->SetInterpolator(interpolator);
                break;
            }
        }

        if (impl_->progressCallback) {
            auto observer = ResampleProgressObserver::New();
            observer->setCallback(impl_->progressCallback);
            resampleFilter->AddObserver(itk::ProgressEvent(), observer);
        }

        resampleFilter->Update();

        getLogger()->debug("In-plane resampling {}x{} -> {}x{} at {:.3f} mm ({})",
                           input->GetLargestPossibleRegion().GetSize()[0],
                           input->GetLargestPossibleRegion().GetSize()[1],
                           outputSize[0], outputSize[1], params.targetSpacing,
                           interpolationToString(params.interpolation));

        VolumeType::Pointer output = resampleFilter->GetOutput();
        output->DisconnectPipeline();
        return output;
    }
    catch (const itk::ExceptionObject& e) {
        getLogger()->error("In-plane resampling failed: {}", e.GetDescription());
        return std::unexpected(ReconError{
            ReconError::Code::ProcessingFailed,
            std::string("ITK exception: ") + e.GetDescription()
        });
    }
    catch (const std::exception& e) {
        return std::unexpected(ReconError{
            ReconError::Code::InternalError,
            std::string("Standard exception: ") + e.what()
        });
    }
}

bool IsotropicResampler::needsResampling(VolumeType::Pointer input, double targetSpacing) {
    if (!input || !(targetSpacing > 0.0)) {
        return false;
    }

    auto spacing = input->GetSpacing();

    constexpr double threshold = 0.01;
    for (unsigned int i = 0; i < 2; ++i) {
        double diff = std::abs(spacing[i] - targetSpacing) / targetSpacing;
        if (diff > threshold) {
            return true;
        }
    }

    return false;
}

std::string IsotropicResampler::interpolationToString(Interpolation interp) {
    switch (interp) {
        case Interpolation::NearestNeighbor:
            return "Nearest Neighbor";
        case Interpolation::Linear:
            return "Linear";
        case Interpolation::BSpline:
            return "B-Spline";
    }
    return "Unknown";
}

std::string IsotropicResampler::interpolationName(Interpolation interp) {
    switch (interp) {
        case Interpolation::NearestNeighbor: return "nearest";
        case Interpolation::Linear: return "linear";
        case Interpolation::BSpline: return "bspline";
    }
    return "linear";
}

std::optional<IsotropicResampler::Interpolation>
IsotropicResampler::interpolationFromName(const std::string& name) {
    if (name == "nearest") return Interpolation::NearestNeighbor;
    if (name == "linear") return Interpolation::Linear;
    if (name == "bspline") return Interpolation::BSpline;
    return std::nullopt;
}

}  // namespace sweep_recon::services
