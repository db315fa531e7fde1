/**
 * @file resampling_types.hpp
 * @brief Interpolation method selection and per-state resampling results
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <itkImage.h>

namespace sweep_recon::services {

/**
 * @brief Slice-axis interpolation method
 */
enum class InterpolationMethod {
    FastLinear,  ///< Piecewise linear between bracketing samples (default)
    Rbf          ///< Radial basis function interpolant, smoother and much slower
};

/**
 * @brief Radial basis function kernel, r = |z - z_j|, e = epsilon
 */
enum class RbfKernel {
    Multiquadric,         ///< sqrt((r/e)^2 + 1)
    InverseMultiquadric,  ///< 1 / sqrt((r/e)^2 + 1)
    Gaussian,             ///< exp(-(r/e)^2)
    Linear,               ///< r
    Cubic,                ///< r^3
    ThinPlate             ///< r^2 log(r)
};

/**
 * @brief Parameters of the RBF interpolant
 */
struct RbfParameters {
    RbfKernel kernel = RbfKernel::Multiquadric;

    /// Shape parameter in mm (0 = mean sample spacing)
    double epsilon = 0.0;

    /// Reciprocal condition number below which the system is regularized
    double conditionThreshold = 1e-12;

    /// Regularization attempts before falling back to linear interpolation
    int maxRegularizationAttempts = 6;

    [[nodiscard]] bool isValid() const noexcept {
        return epsilon >= 0.0 && conditionThreshold > 0.0
               && conditionThreshold < 1.0 && maxRegularizationAttempts >= 0;
    }
};

/**
 * @brief One reconstructed respiration state
 */
struct ResampledState {
    using VolumeType = itk::Image<float, 3>;

    int state = 0;
    VolumeType::Pointer volume;

    /// Slice-axis method that produced the volume
    InterpolationMethod method = InterpolationMethod::FastLinear;

    /// Slices that contributed to this state
    std::size_t sliceCount = 0;

    /// Distinct slice-axis positions among those slices
    std::size_t distinctPositions = 0;

    /// Pixels filled by linear interpolation after an unsolvable RBF system
    std::size_t fallbackPixels = 0;

    /// Regularization weight applied to the RBF system (0 = none)
    double regularization = 0.0;

    /// Worker partitions that failed and were left at zero
    std::size_t failedPartitions = 0;

    [[nodiscard]] bool isComplete() const noexcept {
        return volume && failedPartitions == 0;
    }
};

/**
 * @brief Result of resampling every state of a run
 */
struct ResamplingResult {
    std::vector<ResampledState> states;

    /// Slice-axis grid shared by all states, mm from the sequence origin
    std::vector<double> gridPositions;

    double thickness = 0.0;
    InterpolationMethod method = InterpolationMethod::FastLinear;

    [[nodiscard]] bool isComplete() const noexcept {
        for (const auto& s : states) {
            if (!s.isComplete()) {
                return false;
            }
        }
        return !states.empty();
    }
};

[[nodiscard]] inline std::string methodToString(InterpolationMethod method) {
    switch (method) {
        case InterpolationMethod::FastLinear: return "fast_linear";
        case InterpolationMethod::Rbf: return "rbf";
    }
    return "fast_linear";
}

[[nodiscard]] inline std::optional<InterpolationMethod>
methodFromString(const std::string& str) {
    if (str == "fast_linear" || str == "linear") return InterpolationMethod::FastLinear;
    if (str == "rbf") return InterpolationMethod::Rbf;
    return std::nullopt;
}

[[nodiscard]] inline std::string kernelToString(RbfKernel kernel) {
    switch (kernel) {
        case RbfKernel::Multiquadric: return "multiquadric";
        case RbfKernel::InverseMultiquadric: return "inverse_multiquadric";
        case RbfKernel::Gaussian: return "gaussian";
        case RbfKernel::Linear: return "linear";
        case RbfKernel::Cubic: return "cubic";
        case RbfKernel::ThinPlate: return "thin_plate";
    }
    return "multiquadric";
}

[[nodiscard]] inline std::optional<RbfKernel> kernelFromString(const std::string& str) {
    if (str == "multiquadric") return RbfKernel::Multiquadric;
    if (str == "inverse_multiquadric") return RbfKernel::InverseMultiquadric;
    if (str == "gaussian") return RbfKernel::Gaussian;
    if (str == "linear") return RbfKernel::Linear;
    if (str == "cubic") return RbfKernel::Cubic;
    if (str == "thin_plate") return RbfKernel::ThinPlate;
    return std::nullopt;
}

}  // namespace sweep_recon::services
