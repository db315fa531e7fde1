#include "services/resampling/slice_axis_interpolator.hpp"

#include <algorithm>
#include <cmath>

#include <vnl/algo/vnl_svd.h>
#include <vnl/vnl_matrix.h>

#include "core/logging.hpp"

namespace {

auto& getLogger() {
    static auto logger =
        sweep_recon::logging::LoggerFactory::create("SliceAxisInterpolator");
    return logger;
}

std::expected<void, sweep_recon::ReconError> validatePositions(
    const std::vector<double>& samplePositions)
{
    if (samplePositions.empty()) {
        return std::unexpected(sweep_recon::ReconError{
            sweep_recon::ReconError::Code::InvalidInput,
            "No samples to interpolate"
        });
    }
    if (!std::is_sorted(samplePositions.begin(), samplePositions.end())) {
        return std::unexpected(sweep_recon::ReconError{
            sweep_recon::ReconError::Code::InvalidInput,
            "Sample positions must be in ascending order"
        });
    }
    for (double p : samplePositions) {
        if (!std::isfinite(p)) {
            return std::unexpected(sweep_recon::ReconError{
                sweep_recon::ReconError::Code::InvalidInput,
                "Sample positions must be finite"
            });
        }
    }
    return {};
}

}  // anonymous namespace

namespace sweep_recon::services {

// =============================================================================
// FastLinearInterpolator
// =============================================================================

std::expected<void, ReconError> FastLinearInterpolator::prepare(
    const std::vector<double>& samplePositions,
    const std::vector<double>& gridPositions)
{
    if (auto valid = validatePositions(samplePositions); !valid) {
        return valid;
    }

    sampleCount_ = samplePositions.size();
    groupStart_.clear();
    std::vector<double> distinct;
    for (std::size_t i = 0; i < sampleCount_; ++i) {
        if (i == 0 || samplePositions[i] != samplePositions[i - 1]) {
            groupStart_.push_back(i);
            distinct.push_back(samplePositions[i]);
        }
    }
    groupStart_.push_back(sampleCount_);

    weights_.assign(gridPositions.size(), GridWeight{});
    const std::size_t last = distinct.size() - 1;
    for (std::size_t k = 0; k < gridPositions.size(); ++k) {
        double z = gridPositions[k];
        auto& w = weights_[k];
        if (z <= distinct.front()) {
            w = {0, 0, 0.0};
        } else if (z >= distinct.back()) {
            w = {last, last, 0.0};
        } else {
            auto upper = static_cast<std::size_t>(
                std::upper_bound(distinct.begin(), distinct.end(), z) - distinct.begin());
            std::size_t lower = upper - 1;
            w.lower = lower;
            w.upper = upper;
            w.weight = (z - distinct[lower]) / (distinct[upper] - distinct[lower]);
        }
    }
    return {};
}

bool FastLinearInterpolator::interpolate(std::span<const float> sampleValues,
                                         std::span<float> gridValues) const
{
    if (sampleValues.size() != sampleCount_ || gridValues.size() != weights_.size()
        || groupStart_.empty()) {
        return false;
    }

    const std::size_t groups = groupStart_.size() - 1;
    std::vector<double> means(groups, 0.0);
    for (std::size_t g = 0; g < groups; ++g) {
        double sum = 0.0;
        for (std::size_t i = groupStart_[g]; i < groupStart_[g + 1]; ++i) {
            sum += sampleValues[i];
        }
        means[g] = sum / static_cast<double>(groupStart_[g + 1] - groupStart_[g]);
    }

    for (std::size_t k = 0; k < weights_.size(); ++k) {
        const auto& w = weights_[k];
        if (w.weight == 0.0) {
            gridValues[k] = static_cast<float>(means[w.lower]);
        } else {
            gridValues[k] = static_cast<float>(
                (1.0 - w.weight) * means[w.lower] + w.weight * means[w.upper]);
        }
    }
    return true;
}

// =============================================================================
// RbfInterpolator
// =============================================================================

RbfInterpolator::RbfInterpolator(RbfParameters params)
    : params_(params) {}

double RbfInterpolator::basis(RbfKernel kernel, double r, double epsilon) {
    double scaled = r / epsilon;
    switch (kernel) {
        case RbfKernel::Multiquadric:
            return std::sqrt(scaled * scaled + 1.0);
        case RbfKernel::InverseMultiquadric:
            return 1.0 / std::sqrt(scaled * scaled + 1.0);
        case RbfKernel::Gaussian:
            return std::exp(-scaled * scaled);
        case RbfKernel::Linear:
            return r;
        case RbfKernel::Cubic:
            return r * r * r;
        case RbfKernel::ThinPlate:
            return r > 0.0 ? r * r * std::log(r) : 0.0;
    }
    return 0.0;
}

std::expected<void, ReconError> RbfInterpolator::prepare(
    const std::vector<double>& samplePositions,
    const std::vector<double>& gridPositions)
{
    if (!params_.isValid()) {
        return std::unexpected(ReconError{
            ReconError::Code::InvalidConfiguration,
            "Invalid RBF parameters"
        });
    }
    if (auto valid = validatePositions(samplePositions); !valid) {
        return valid;
    }

    const std::size_t n = samplePositions.size();
    sampleCount_ = n;
    gridCount_ = gridPositions.size();
    operator_.clear();
    solvable_ = false;
    constant_ = false;
    lambda_ = 0.0;

    const double zMin = samplePositions.front();
    const double zMax = samplePositions.back();
    if (zMax <= zMin) {
        constant_ = true;
        solvable_ = true;
        getLogger()->debug("Single distinct position at {:.3f} mm, output is constant", zMin);
        return {};
    }

    epsilon_ = params_.epsilon > 0.0 ? params_.epsilon
                                     : (zMax - zMin) / static_cast<double>(n);

    vnl_matrix<double> phi(static_cast<unsigned int>(n), static_cast<unsigned int>(n));
    double maxAbs = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = 0; j < n; ++j) {
            double v = basis(params_.kernel,
                             std::abs(samplePositions[i] - samplePositions[j]), epsilon_);
            phi(static_cast<unsigned int>(i), static_cast<unsigned int>(j)) = v;
            maxAbs = std::max(maxAbs, std::abs(v));
        }
    }

    auto svd = std::make_unique<vnl_svd<double>>(phi);
    double rcond = svd->well_condition();
    if (!(rcond >= params_.conditionThreshold)) {
        double lambda = 1e-10 * (maxAbs > 0.0 ? maxAbs : 1.0);
        for (int attempt = 0; attempt < params_.maxRegularizationAttempts; ++attempt) {
            vnl_matrix<double> regularized = phi;
            for (std::size_t i = 0; i < n; ++i) {
                regularized(static_cast<unsigned int>(i), static_cast<unsigned int>(i)) += lambda;
            }
            svd = std::make_unique<vnl_svd<double>>(regularized);
            rcond = svd->well_condition();
            getLogger()->debug("RBF regularization attempt {}: lambda={:.3e}, rcond={:.3e}",
                               attempt + 1, lambda, rcond);
            if (rcond >= params_.conditionThreshold) {
                lambda_ = lambda;
                break;
            }
            lambda *= 100.0;
        }
        if (!(rcond >= params_.conditionThreshold)) {
            getLogger()->warn("RBF system over {} samples is singular after {} "
                              "regularization attempts", n,
                              params_.maxRegularizationAttempts);
            return {};
        }
    }

    vnl_matrix<double> inverse = svd->pinverse();

    // Grid points are clamped into the sample range before evaluation
    operator_.assign(gridCount_ * n, 0.0);
    std::vector<double> row(n);
    for (std::size_t k = 0; k < gridCount_; ++k) {
        double z = std::clamp(gridPositions[k], zMin, zMax);
        for (std::size_t j = 0; j < n; ++j) {
            row[j] = basis(params_.kernel, std::abs(z - samplePositions[j]), epsilon_);
        }
        for (std::size_t i = 0; i < n; ++i) {
            double acc = 0.0;
            for (std::size_t j = 0; j < n; ++j) {
                acc += row[j] * inverse(static_cast<unsigned int>(j),
                                        static_cast<unsigned int>(i));
            }
            if (!std::isfinite(acc)) {
                operator_.clear();
                getLogger()->warn("RBF operator is not finite");
                return {};
            }
            operator_[k * n + i] = acc;
        }
    }

    solvable_ = true;
    getLogger()->debug("RBF system prepared: {} samples, {} grid points, "
                       "epsilon={:.3f}, rcond={:.3e}", n, gridCount_, epsilon_, rcond);
    return {};
}

bool RbfInterpolator::interpolate(std::span<const float> sampleValues,
                                  std::span<float> gridValues) const
{
    if (!solvable_ || sampleValues.size() != sampleCount_
        || gridValues.size() != gridCount_) {
        return false;
    }

    if (constant_) {
        double sum = 0.0;
        for (float v : sampleValues) {
            sum += v;
        }
        auto mean = static_cast<float>(sum / static_cast<double>(sampleCount_));
        std::fill(gridValues.begin(), gridValues.end(), mean);
        return true;
    }

    for (std::size_t k = 0; k < gridCount_; ++k) {
        const double* m = operator_.data() + k * sampleCount_;
        double acc = 0.0;
        for (std::size_t i = 0; i < sampleCount_; ++i) {
            acc += m[i] * sampleValues[i];
        }
        gridValues[k] = static_cast<float>(acc);
    }
    return true;
}

std::unique_ptr<ISliceAxisInterpolator>
createSliceAxisInterpolator(InterpolationMethod method, const RbfParameters& rbfParams)
{
    switch (method) {
        case InterpolationMethod::Rbf:
            return std::make_unique<RbfInterpolator>(rbfParams);
        case InterpolationMethod::FastLinear:
            break;
    }
    return std::make_unique<FastLinearInterpolator>();
}

}  // namespace sweep_recon::services
